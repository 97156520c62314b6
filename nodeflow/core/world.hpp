#pragma once

#include "nodeflow/core/config.hpp"
#include "nodeflow/core/types.hpp"
#include "nodeflow/physics/physics_server.hpp"
#include "nodeflow/scene/canvas.hpp"
#include "nodeflow/scene/input_router.hpp"
#include "nodeflow/scene/scene_tree.hpp"

namespace nodeflow::core {

// ============================================================================
// World - one scene tree with its physics and input services
// ============================================================================
//
// A tick is: input dispatch, process pass, draw pass, collision pass.

class World {
public:
    World() = default;
    explicit World(const Config& config) { apply(config); }

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    /// Copies the runtime options (debug drawing, physics diagnostics).
    void apply(const Config& config);

    scene::SceneTree& tree() { return tree_; }
    physics::PhysicsServer& physics() { return physics_; }
    scene::InputRouter& input() { return input_; }

    void tick(float dt, scene::ICanvas& canvas);

    Tick current_tick() const { return tick_; }

private:
    // Declaration order matters: services refer to the tree.
    scene::SceneTree tree_;
    physics::PhysicsServer physics_{tree_};
    scene::InputRouter input_{tree_};

    Tick tick_{0};
};

} // namespace nodeflow::core
