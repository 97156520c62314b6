#include "nodeflow/physics/shape.hpp"

#include "nodeflow/core/errors.hpp"
#include "nodeflow/scene/scene_tree.hpp"

#include <utility>

namespace nodeflow::physics {

Shape Shape::create_rect(scene::SceneTree& tree, std::string name, Vector2 size,
                         Vector2 position, CollisionType type) {
    scene::Node node = tree.create_node(std::move(name), position);
    auto& registry = tree.registry();

    auto& shape = registry.emplace<ShapeComponent>(node.id(), registry, node.id());
    shape.kind = ShapeKind::Rectangle;
    shape.type = type;
    shape.base_size = size;

    node.add_behaviour<ShapeBehaviour>();

    Shape out(node);
    out.refresh_rect();
    return out;
}

Shape Shape::create_circle(scene::SceneTree& tree, std::string name, float radius,
                           Vector2 position, CollisionType type) {
    Shape out = create_rect(tree, std::move(name), {radius * 2.0f, radius * 2.0f}, position, type);
    out.component().kind = ShapeKind::Circle;
    return out;
}

bool Shape::is_shape(const scene::Node& node) {
    return node.valid() && node.tree().registry().all_of<ShapeComponent>(node.id());
}

ShapeComponent& Shape::component() const {
    if (!tree_ || !registry().valid(id_)) {
        throw Error("Stale shape handle");
    }
    return registry().get<ShapeComponent>(id_);
}

ShapeKind Shape::kind() const {
    return component().kind;
}

CollisionType Shape::collision_type() const {
    return component().type;
}

Vector2 Shape::base_size() const {
    return component().base_size;
}

void Shape::set_base_size(Vector2 size) {
    component().base_size = size;
    refresh_rect();
}

Rectangle Shape::rect() const {
    return component().rect;
}

Vector2 Shape::center() const {
    const Rectangle r = component().rect;
    return {r.x + r.width * 0.5f, r.y + r.height * 0.5f};
}

float Shape::radius() const {
    return component().rect.width * 0.5f;
}

scene::Signal<NodeId>& Shape::rect_changed() const {
    return component().rect_changed;
}

void Shape::refresh_rect() {
    auto& shape = component();
    const Vector2 scale = global_scale();
    const Vector2 origin = global_position();
    const Vector2 pivot = anchor();

    const float width = shape.base_size.x * scale.x;
    const float height = shape.base_size.y * scale.y;
    shape.rect = Rectangle{origin.x - width * pivot.x, origin.y - height * pivot.y, width, height};

    shape.rect_changed.emit(id_);
}

// ============================================================================
// ShapeBehaviour
// ============================================================================

void ShapeBehaviour::enter_tree(scene::Node self) {
    Shape(self).refresh_rect();
}

void ShapeBehaviour::transform_changed(scene::Node self) {
    Shape(self).refresh_rect();
}

void ShapeBehaviour::predelete(scene::Node self) {
    Shape shape(self);
    shape.rect_changed().disconnect_all(self.id());
}

void ShapeBehaviour::draw(scene::Node self, scene::ICanvas& canvas) {
    if (!self.tree().debug_draw()) {
        return;
    }

    Shape shape(self);
    if (shape.kind() == ShapeKind::Circle) {
        canvas.draw_circle_lines(shape.center(), shape.radius(), shape.color());
    } else {
        canvas.draw_rect_lines(shape.rect(), shape.color());
    }
}

// ============================================================================
// VisibilityNotifier
// ============================================================================

VisibilityNotifier VisibilityNotifier::create(scene::SceneTree& tree, std::string name,
                                              Vector2 size, Vector2 position) {
    scene::Node node = tree.create_node(std::move(name), position);
    auto& registry = tree.registry();

    auto& shape = registry.emplace<ShapeComponent>(node.id(), registry, node.id());
    shape.kind = ShapeKind::Rectangle;
    shape.type = CollisionType::Area;
    shape.base_size = size;
    registry.emplace<VisibilityComponent>(node.id(), registry, node.id());

    node.set_color(Color{118, 10, 201, 255});
    node.add_behaviour<VisibilityBehaviour>();

    VisibilityNotifier out(node);
    out.refresh_rect();
    return out;
}

scene::Signal<>& VisibilityNotifier::screen_entered() const {
    return registry().get<VisibilityComponent>(id_).screen_entered;
}

scene::Signal<>& VisibilityNotifier::screen_exited() const {
    return registry().get<VisibilityComponent>(id_).screen_exited;
}

std::optional<bool> VisibilityNotifier::is_on_screen() const {
    return registry().get<VisibilityComponent>(id_).on_screen;
}

void VisibilityBehaviour::predelete(scene::Node self) {
    ShapeBehaviour::predelete(self);

    auto& state = self.tree().registry().get<VisibilityComponent>(self.id());
    state.screen_entered.disconnect_all(self.id());
    state.screen_exited.disconnect_all(self.id());
}

void VisibilityBehaviour::draw(scene::Node self, scene::ICanvas& canvas) {
    ShapeBehaviour::draw(self, canvas);

    VisibilityNotifier notifier(self);
    Rectangle drawn = notifier.rect();
    drawn.x += canvas.offset().x;
    drawn.y += canvas.offset().y;
    const bool visible = CheckCollisionRecs(drawn, canvas.viewport());

    auto& state = self.tree().registry().get<VisibilityComponent>(self.id());
    if (!state.on_screen.has_value()) {
        // First observation only records the state.
        state.on_screen = visible;
        return;
    }
    if (*state.on_screen == visible) {
        return;
    }

    state.on_screen = visible;
    if (visible) {
        state.screen_entered.emit();
    } else {
        state.screen_exited.emit();
    }
}

} // namespace nodeflow::physics
