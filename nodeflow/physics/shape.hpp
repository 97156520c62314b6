#pragma once

// =============================================================================
// Shape - collision primitive attached under a body (or used as an area)
// =============================================================================
//
// rect size = base_size * global_scale, top-left = global_position - size * anchor.
// A circle of radius r uses base_size (2r, 2r); its centre is the rect centre.
// Every refresh emits rect_changed(shape id).
//

#include "nodeflow/scene/behaviour.hpp"
#include "nodeflow/scene/node.hpp"
#include "nodeflow/scene/signal.hpp"

#include <entt/entt.hpp>
#include <raylib.h>

#include <cstdint>
#include <optional>
#include <string>

namespace nodeflow::scene {
class SceneTree;
}

namespace nodeflow::physics {

using scene::NodeId;

enum class ShapeKind : std::uint8_t {
    Rectangle = 0,
    Circle = 1,
};

enum class CollisionType : std::uint8_t {
    Physics = 1,   // body vs body
    Area = 2,      // zones and visibility
};

struct ShapeComponent {
    static constexpr auto in_place_delete = true;

    ShapeComponent(entt::registry& registry, NodeId owner)
        : rect_changed(registry, owner, "rect_changed") {}

    ShapeKind kind{ShapeKind::Rectangle};
    CollisionType type{CollisionType::Physics};
    Vector2 base_size{0.0f, 0.0f};
    Rectangle rect{0.0f, 0.0f, 0.0f, 0.0f};

    scene::Signal<NodeId> rect_changed;
};

class Shape : public scene::Node {
public:
    Shape() = default;
    explicit Shape(scene::Node node) : Node(node) {}

    static Shape create_rect(scene::SceneTree& tree, std::string name, Vector2 size,
                             Vector2 position = kVectorZero,
                             CollisionType type = CollisionType::Physics);

    static Shape create_circle(scene::SceneTree& tree, std::string name, float radius,
                               Vector2 position = kVectorZero,
                               CollisionType type = CollisionType::Physics);

    static bool is_shape(const scene::Node& node);

    ShapeKind kind() const;
    CollisionType collision_type() const;

    Vector2 base_size() const;
    void set_base_size(Vector2 size);

    Rectangle rect() const;
    Vector2 center() const;
    /// Scaled radius for circles, half the rect width otherwise.
    float radius() const;

    scene::Signal<NodeId>& rect_changed() const;

    /// Recomputes rect from the current transform and emits rect_changed.
    void refresh_rect();

protected:
    ShapeComponent& component() const;
};

/// Keeps the rect in sync with the transform and draws debug outlines.
class ShapeBehaviour : public scene::NodeBehaviour {
public:
    bool has_draw_step() const override { return true; }

    void enter_tree(scene::Node self) override;
    void transform_changed(scene::Node self) override;
    void predelete(scene::Node self) override;
    void draw(scene::Node self, scene::ICanvas& canvas) override;
};

// ============================================================================
// VisibilityNotifier
// ============================================================================

struct VisibilityComponent {
    static constexpr auto in_place_delete = true;

    VisibilityComponent(entt::registry& registry, NodeId owner)
        : screen_entered(registry, owner, "screen_entered"),
          screen_exited(registry, owner, "screen_exited") {}

    scene::Signal<> screen_entered;
    scene::Signal<> screen_exited;
    std::optional<bool> on_screen;   // unset until the first draw
};

/// Area rectangle reporting when it starts or stops overlapping the viewport.
class VisibilityNotifier : public Shape {
public:
    VisibilityNotifier() = default;
    explicit VisibilityNotifier(scene::Node node) : Shape(node) {}

    static VisibilityNotifier create(scene::SceneTree& tree, std::string name, Vector2 size,
                                     Vector2 position = kVectorZero);

    scene::Signal<>& screen_entered() const;
    scene::Signal<>& screen_exited() const;
    std::optional<bool> is_on_screen() const;
};

class VisibilityBehaviour : public ShapeBehaviour {
public:
    void predelete(scene::Node self) override;
    void draw(scene::Node self, scene::ICanvas& canvas) override;
};

} // namespace nodeflow::physics
