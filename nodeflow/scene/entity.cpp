#include "nodeflow/scene/entity.hpp"

#include "nodeflow/core/errors.hpp"
#include "nodeflow/scene/scene_tree.hpp"

namespace nodeflow::scene {

bool Entity::valid() const {
    return tree_ != nullptr && is_alive(tree_->registry(), id_);
}

entt::registry& Entity::registry() const {
    return tree_->registry();
}

Spatial& Entity::spatial() const {
    if (tree_ == nullptr || !tree_->registry().valid(id_)) {
        throw Error("Stale entity handle");
    }
    return tree_->registry().get<Spatial>(id_);
}

Vector2 Entity::position() const {
    return spatial().position;
}

void Entity::set_position(Vector2 value) {
    spatial().position = value;
    tree_->transform_changed_(id_);
}

void Entity::translate(Vector2 offset) {
    auto& s = spatial();
    s.position = {s.position.x + offset.x, s.position.y + offset.y};
    tree_->transform_changed_(id_);
}

Vector2 Entity::scale() const {
    return spatial().scale;
}

void Entity::set_scale(Vector2 value) {
    spatial().scale = value;
    tree_->transform_changed_(id_);
}

Vector2 Entity::anchor() const {
    return spatial().anchor;
}

void Entity::set_anchor(Vector2 value) {
    spatial().anchor = value;
    tree_->transform_changed_(id_);
}

Color Entity::color() const {
    return spatial().color;
}

void Entity::set_color(Color value) {
    spatial().color = value;
}

} // namespace nodeflow::scene
