#pragma once

// =============================================================================
// Body - node that takes part in collision detection
// =============================================================================
//
// collision_layer says what the body is, collision_mask what it looks for.
// The mask-side body of a confirmed contact records the layer-side one and
// emits body_entered once per contact; body_exited fires on the first tick
// the contact is gone (or when the partner leaves the server).
//

#include "nodeflow/physics/shape.hpp"
#include "nodeflow/scene/behaviour.hpp"
#include "nodeflow/scene/node.hpp"
#include "nodeflow/scene/signal.hpp"

#include <entt/entt.hpp>
#include <raylib.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nodeflow::physics {

class PhysicsServer;

enum class BodyKind : std::uint8_t {
    Area = 0,
    Static = 1,
    Kinematic = 2,
};

inline constexpr std::size_t kBodyKindCount = 3;

/// Width of collision_layer / collision_mask.
inline constexpr unsigned kCollisionBits = 32;

const char* body_kind_name(BodyKind kind);

struct BodyComponent {
    static constexpr auto in_place_delete = true;

    BodyComponent(entt::registry& registry, NodeId owner, BodyKind body_kind)
        : kind(body_kind),
          layer(body_kind == BodyKind::Static ? 0u : 1u),
          body_entered(registry, owner, "body_entered"),
          body_exited(registry, owner, "body_exited") {}

    BodyKind kind{BodyKind::Area};
    std::uint32_t layer{1};
    std::uint32_t mask{1};

    std::vector<NodeId> active_shapes;
    Rectangle cached_bounds{0.0f, 0.0f, 0.0f, 0.0f};
    bool bounds_dirty{true};

    std::vector<NodeId> colliding;
    std::vector<NodeId> last_colliding;

    PhysicsServer* server{nullptr};
    bool registered{false};

    scene::Signal<NodeId> body_entered;
    scene::Signal<NodeId> body_exited;
};

/// Queued motion of a kinematic body, applied by its physics step.
struct KinematicMotion {
    Vector2 velocity{0.0f, 0.0f};
    Vector2 last_motion{0.0f, 0.0f};
};

class Body : public scene::Node {
public:
    Body() = default;
    explicit Body(scene::Node node) : Node(node) {}

    static Body create(PhysicsServer& server, BodyKind kind, std::string name,
                       Vector2 position = kVectorZero);

    static bool is_body(const scene::Node& node);

    BodyKind kind() const;

    // --- Layers & masks ---

    std::uint32_t collision_layer() const;
    std::uint32_t collision_mask() const;
    void set_collision_layer(std::uint32_t layer);
    void set_collision_mask(std::uint32_t mask);
    void set_collision_layer_bit(unsigned bit, bool enabled);
    void set_collision_mask_bit(unsigned bit, bool enabled);

    // --- Shapes ---

    bool has_shape() const;
    std::vector<Shape> active_shapes() const;

    /// Union of the active shape rects, recomputed after any rect_changed.
    std::optional<Rectangle> bounds() const;

    /// Any pair of active shapes collides.
    bool is_colliding(const Body& other) const;

    // --- Contacts ---

    const std::vector<NodeId>& colliding_bodies() const;
    const std::vector<NodeId>& last_colliding_bodies() const;
    bool is_registered() const;

    /// Records a contact found this tick, emitting body_entered if it is new.
    void collide(const Body& other);

    /// Emits body_exited for vanished contacts and rotates the contact sets.
    void finish_tick();

    scene::Signal<NodeId>& body_entered() const;
    scene::Signal<NodeId>& body_exited() const;

    // --- Kinematic ---

    /// Queues a velocity; the next physics step moves by velocity * dt.
    void move_and_collide(Vector2 velocity);
    Vector2 last_motion() const;

    BodyComponent& component() const;
};

class BodyBehaviour : public scene::NodeBehaviour {
public:
    bool has_process_step() const override { return true; }

    void enter_tree(scene::Node self) override;
    void exit_tree(scene::Node self) override;
    void child_added(scene::Node self, scene::Node child) override;
    void child_removed(scene::Node self, scene::Node child) override;
    void predelete(scene::Node self) override;
    void process(scene::Node self, float dt) override;
};

} // namespace nodeflow::physics
