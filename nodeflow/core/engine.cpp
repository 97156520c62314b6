#include "nodeflow/core/engine.hpp"

#include "nodeflow/core/logger.hpp"

#include <raylib.h>

#include <algorithm>
#include <stdexcept>

namespace nodeflow::core {

// ============================================================================
// RaylibCanvas
// ============================================================================

Rectangle RaylibCanvas::viewport() const {
    return Rectangle{0.0f, 0.0f, static_cast<float>(GetScreenWidth()),
                     static_cast<float>(GetScreenHeight())};
}

void RaylibCanvas::draw_rect_lines(Rectangle rect, Color color) {
    rect.x += offset_.x;
    rect.y += offset_.y;
    DrawRectangleLinesEx(rect, 1.0f, color);
}

void RaylibCanvas::draw_circle_lines(Vector2 center, float radius, Color color) {
    DrawCircleLines(static_cast<int>(center.x + offset_.x), static_cast<int>(center.y + offset_.y),
                    radius, color);
}

void RaylibCanvas::draw_gizmo(Vector2 at, float extent, Color color) {
    at.x += offset_.x;
    at.y += offset_.y;
    DrawLineV({at.x - extent, at.y}, {at.x + extent, at.y}, color);
    DrawLineV({at.x, at.y - extent}, {at.x, at.y + extent}, color);
}

// ============================================================================
// Lifecycle
// ============================================================================

Engine::Engine()
    : settings_()
{
}

Engine::Engine(const Settings& settings)
    : settings_(settings)
{
}

Engine::~Engine() {
    stop();
    Logger::instance().shutdown();
}

void Engine::run(IGame& game) {
    running_ = true;

    // Load config before the window so [window] applies.
    auto& config = Config::instance();
    const bool cfg_ok = config.load_from_file(settings_.configFile);
    Logger::instance().init(config.logging());
    log(LogLevel::Info, cfg_ok ? "Config loaded from " + settings_.configFile
                               : "Config not found, using defaults");

    init_window();

    world_ = std::make_unique<World>(config);
    world_->tree().set_screen_size(
        {static_cast<float>(GetScreenWidth()), static_cast<float>(GetScreenHeight())});

    game.on_init(*this, *world_);
    log(LogLevel::Info, "Engine started");

    main_loop(game);

    game.on_shutdown();
    world_.reset();
    close_window();

    log(LogLevel::Info, "Engine stopped");
}

void Engine::stop() {
    running_ = false;
}

World& Engine::world() {
    if (!world_) {
        throw std::runtime_error("World not initialized - call run() first");
    }
    return *world_;
}

float Engine::tick_dt() const {
    const int fps = Config::instance().engine().fixed_fps;
    return fps > 0 ? 1.0f / static_cast<float>(fps) : 1.0f / 60.0f;
}

// ============================================================================
// Logging
// ============================================================================

void Engine::log(LogLevel level, std::string_view msg) {
    if (!settings_.logging) return;

    int raylib_level = LOG_INFO;
    switch (level) {
        case LogLevel::Debug:   raylib_level = LOG_DEBUG; break;
        case LogLevel::Info:    raylib_level = LOG_INFO; break;
        case LogLevel::Warning: raylib_level = LOG_WARNING; break;
        case LogLevel::Error:   raylib_level = LOG_ERROR; break;
    }
    TraceLog(raylib_level, "[engine] %.*s", static_cast<int>(msg.size()), msg.data());
}

// ============================================================================
// Window management
// ============================================================================

void Engine::init_window() {
    const auto& window = Config::instance().window();

    unsigned int flags = FLAG_WINDOW_RESIZABLE;
    if (window.vsync) {
        flags |= FLAG_VSYNC_HINT;
    }
    SetConfigFlags(flags);

    InitWindow(window.width, window.height, window.title.c_str());
    SetExitKey(KEY_NULL);  // Games decide what ESC does

    if (window.target_fps > 0) {
        SetTargetFPS(window.target_fps);
    }
}

void Engine::close_window() {
    CloseWindow();
}

// ============================================================================
// Main loop
// ============================================================================

void Engine::poll_input() {
    auto& input = world_->input();

    for (const auto& [type, key] : input.bindings()) {
        bool fired = false;
        switch (type) {
            case scene::InputType::KeyPressed: fired = IsKeyPressed(key); break;
            case scene::InputType::KeyReleased: fired = IsKeyReleased(key); break;
            case scene::InputType::MouseButtonPressed: fired = IsMouseButtonPressed(key); break;
            case scene::InputType::MouseButtonReleased: fired = IsMouseButtonReleased(key); break;
        }
        if (fired) {
            input.push(type, key);
        }
    }
}

void Engine::main_loop(IGame& game) {
    while (running_ && !WindowShouldClose()) {
        // dt is capped at four fixed ticks.
        const float dt = std::min(GetFrameTime(), tick_dt() * 4.0f);

        poll_input();
        game.on_update(dt);

        BeginDrawing();
        ClearBackground(BLACK);

        world_->tick(dt, canvas_);

        EndDrawing();

        if (IsWindowResized()) {
            world_->tree().set_screen_size(
                {static_cast<float>(GetScreenWidth()), static_cast<float>(GetScreenHeight())});
        }
    }
}

} // namespace nodeflow::core
