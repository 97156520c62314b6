// nodeflow sandbox: a kinematic player dodging obstacles that scroll by.

#include "nodeflow/core/engine.hpp"
#include "nodeflow/physics/body.hpp"
#include "nodeflow/physics/shape.hpp"
#include "nodeflow/scene/behaviour.hpp"
#include "nodeflow/scene/camera.hpp"

#include <raylib.h>

#include <cstring>
#include <memory>
#include <string>

using namespace nodeflow;

namespace {

struct Args {
    std::string config = "nodeflow.conf";
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            args.config = argv[++i];
        }
    }

    return args;
}

constexpr float kPlayerSpeed = 220.0f;
constexpr float kObstacleSpeed = 160.0f;
constexpr float kSpawnInterval = 1.2f;
// The level is this many screens tall; the camera scrolls vertically.
constexpr int kLevelScreens = 2;
const std::string kObstacleGroup = "obstacles";

class PlayerControl : public scene::NodeBehaviour {
public:
    bool has_process_step() const override { return true; }

    void process(scene::Node self, float) override {
        Vector2 velocity{0.0f, 0.0f};
        if (IsKeyDown(KEY_UP)) velocity.y -= kPlayerSpeed;
        if (IsKeyDown(KEY_DOWN)) velocity.y += kPlayerSpeed;
        if (IsKeyDown(KEY_LEFT)) velocity.x -= kPlayerSpeed;
        if (IsKeyDown(KEY_RIGHT)) velocity.x += kPlayerSpeed;
        physics::Body(self).move_and_collide(velocity);
    }

    void input_event(scene::Node self, const scene::InputEvent& event) override {
        if (event.tag == "pause") {
            auto& tree = self.tree();
            tree.pause_tree(tree.is_paused() ? 0 : scene::PauseMode::TreePaused);
        } else if (event.tag == "debug") {
            self.tree().set_debug_draw(!self.tree().debug_draw());
        }
    }
};

class Scroller : public scene::NodeBehaviour {
public:
    bool has_process_step() const override { return true; }

    void process(scene::Node self, float dt) override {
        self.translate({-kObstacleSpeed * dt, 0.0f});
    }
};

class Spawner : public scene::NodeBehaviour {
public:
    explicit Spawner(physics::PhysicsServer& physics) : physics_(physics) {}

    bool has_process_step() const override { return true; }

    void process(scene::Node self, float dt) override {
        elapsed_ += dt;
        if (elapsed_ < kSpawnInterval) {
            return;
        }
        elapsed_ = 0.0f;

        auto& tree = self.tree();
        const float y = static_cast<float>(GetRandomValue(40, GetScreenHeight() * kLevelScreens - 40));
        const float x = static_cast<float>(GetScreenWidth() + 40);

        physics::Body obstacle = physics::Body::create(
            physics_, physics::BodyKind::Area, "Obstacle" + std::to_string(++spawned_), {x, y});
        obstacle.set_collision_layer(0b10);
        obstacle.set_collision_mask(0);
        obstacle.add_child(physics::Shape::create_rect(tree, "Hitbox", {48.0f, 48.0f}));
        obstacle.add_behaviour<Scroller>();

        auto notifier = physics::VisibilityNotifier::create(tree, "Visibility", {48.0f, 48.0f});
        obstacle.add_child(notifier);
        notifier.connect(notifier.screen_exited(), obstacle.id(),
                         [obstacle]() mutable { obstacle.free(); });

        self.add_child(obstacle);
        tree.add_to_group(obstacle, kObstacleGroup);
    }

private:
    physics::PhysicsServer& physics_;
    float elapsed_{0.0f};
    int spawned_{0};
};

class Sandbox : public core::IGame {
public:
    void on_init(core::Engine& engine, core::World& world) override {
        engine_ = &engine;
        auto& tree = world.tree();

        const float width = static_cast<float>(GetScreenWidth());
        const float height = static_cast<float>(GetScreenHeight() * kLevelScreens);

        scene::CanvasLayer layer = scene::CanvasLayer::create(tree, "LevelLayer");
        scene::Node level = tree.create_node("Level");

        player_ = physics::Body::create(world.physics(), physics::BodyKind::Kinematic, "Player",
                                        {120.0f, height * 0.5f});
        player_.set_collision_mask(0b10);
        player_.add_child(physics::Shape::create_circle(tree, "Hitbox", 18.0f));
        player_.add_behaviour<PlayerControl>();

        player_.connect(player_.body_entered(), player_.id(), [this](scene::NodeId other) {
            ++hits_;
            TraceLog(LOG_INFO, "[game] Hit by '%s' (%d hits)",
                     player_.tree().node(other).name().c_str(), hits_);
        });

        scene::Node spawner = tree.create_node("Spawner");
        spawner.add_behaviour<Spawner>(world.physics());

        level.add_child(spawner);
        level.add_child(player_);

        scene::Camera camera = scene::Camera::create(
            tree, std::make_unique<scene::FollowLimitScroll>(player_.id(), Rectangle{0.0f, 0.0f, width, height}));
        layer.add_child(level);
        layer.add_child(camera);
        layer.set_active_camera(camera);
        tree.set_current_scene(layer);

        world.input().register_event(player_, scene::InputType::KeyPressed, KEY_P, "pause");
        world.input().register_event(player_, scene::InputType::KeyPressed, KEY_F3, "debug");

        tree.pause_toggled().connect(tree.root().id(), player_.id(), [this](bool paused) {
            engine_->log(LogLevel::Info, paused ? "Paused" : "Resumed");
        });
    }

    void on_shutdown() override {
        TraceLog(LOG_INFO, "[game] Session over: %d hits", hits_);
    }

private:
    core::Engine* engine_{nullptr};
    physics::Body player_{};
    int hits_{0};
};

} // namespace

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    core::Engine::Settings settings;
    settings.configFile = args.config;

    core::Engine engine(settings);
    Sandbox game;
    engine.run(game);

    return 0;
}
