#pragma once

#include "nodeflow/core/config.hpp"
#include "nodeflow/core/types.hpp"
#include "nodeflow/core/world.hpp"
#include "nodeflow/scene/canvas.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace nodeflow::core {

class Engine;

// ============================================================================
// IGame - game code driven by the Engine
// ============================================================================

class IGame {
public:
    virtual ~IGame() = default;

    /// Called once after the window and the world exist. Build the scene here.
    virtual void on_init(Engine& engine, World& world) = 0;

    /// Called every frame before the world ticks.
    virtual void on_update(float dt) { (void)dt; }

    virtual void on_shutdown() = 0;
};

// ============================================================================
// RaylibCanvas - ICanvas over the current raylib render target
// ============================================================================

class RaylibCanvas : public scene::ICanvas {
public:
    Rectangle viewport() const override;

    void draw_rect_lines(Rectangle rect, Color color) override;
    void draw_circle_lines(Vector2 center, float radius, Color color) override;
    void draw_gizmo(Vector2 at, float extent, Color color) override;
};

// ============================================================================
// Engine - raylib window plus the main loop around a World
// ============================================================================

class Engine {
public:
    struct Settings {
        std::string configFile = "nodeflow.conf";
        bool logging = true;
    };

    Engine();
    explicit Engine(const Settings& settings);
    ~Engine();

    /// Runs the frame loop on the current thread until the window closes or stop().
    void run(IGame& game);

    void stop();

    World& world();

    /// Fixed timestep reference from [engine] fixed_fps.
    float tick_dt() const;

    void log(LogLevel level, std::string_view msg);

private:
    void init_window();
    void close_window();
    void poll_input();
    void main_loop(IGame& game);

    Settings settings_;
    std::unique_ptr<World> world_;
    RaylibCanvas canvas_;
    bool running_{false};
};

} // namespace nodeflow::core
