#include "nodeflow/physics/body.hpp"

#include "nodeflow/core/errors.hpp"
#include "nodeflow/physics/narrow_phase.hpp"
#include "nodeflow/physics/physics_server.hpp"
#include "nodeflow/scene/scene_tree.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace nodeflow::physics {

namespace {

bool contains(const std::vector<NodeId>& ids, NodeId id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void check_bit(unsigned bit) {
    if (bit >= kCollisionBits) {
        throw Error("Collision bit " + std::to_string(bit) + " is out of range");
    }
}

} // namespace

const char* body_kind_name(BodyKind kind) {
    switch (kind) {
        case BodyKind::Area: return "Area";
        case BodyKind::Static: return "StaticBody";
        case BodyKind::Kinematic: return "KinematicBody";
    }
    return "Body";
}

Body Body::create(PhysicsServer& server, BodyKind kind, std::string name, Vector2 position) {
    scene::Node node = server.tree().create_node(std::move(name), position);
    auto& registry = server.tree().registry();

    auto& body = registry.emplace<BodyComponent>(node.id(), registry, node.id(), kind);
    body.server = &server;
    if (kind == BodyKind::Kinematic) {
        registry.emplace<KinematicMotion>(node.id());
    }

    node.set_color(Color{46, 10, 115, 255});
    node.add_behaviour<BodyBehaviour>();
    return Body(node);
}

bool Body::is_body(const scene::Node& node) {
    return node.valid() && node.tree().registry().all_of<BodyComponent>(node.id());
}

BodyComponent& Body::component() const {
    if (!tree_ || !registry().valid(id_)) {
        throw Error("Stale body handle");
    }
    return registry().get<BodyComponent>(id_);
}

BodyKind Body::kind() const {
    return component().kind;
}

// ============================================================================
// Layers & masks
// ============================================================================

std::uint32_t Body::collision_layer() const {
    return component().layer;
}

std::uint32_t Body::collision_mask() const {
    return component().mask;
}

void Body::set_collision_layer(std::uint32_t layer) {
    auto& body = component();
    body.layer = layer;
    if (body.registered && body.server) {
        body.server->insert_body(*this);
    }
}

void Body::set_collision_mask(std::uint32_t mask) {
    auto& body = component();
    body.mask = mask;
    if (body.registered && body.server) {
        body.server->insert_body(*this);
    }
}

void Body::set_collision_layer_bit(unsigned bit, bool enabled) {
    check_bit(bit);
    const std::uint32_t flag = 1u << bit;
    const std::uint32_t layer = collision_layer();
    set_collision_layer(enabled ? (layer | flag) : (layer & ~flag));
}

void Body::set_collision_mask_bit(unsigned bit, bool enabled) {
    check_bit(bit);
    const std::uint32_t flag = 1u << bit;
    const std::uint32_t mask = collision_mask();
    set_collision_mask(enabled ? (mask | flag) : (mask & ~flag));
}

// ============================================================================
// Shapes
// ============================================================================

bool Body::has_shape() const {
    return !component().active_shapes.empty();
}

std::vector<Shape> Body::active_shapes() const {
    std::vector<Shape> out;
    for (NodeId id : component().active_shapes) {
        if (scene::is_alive(registry(), id)) {
            out.emplace_back(tree_->node(id));
        }
    }
    return out;
}

std::optional<Rectangle> Body::bounds() const {
    auto& body = component();
    const auto shapes = active_shapes();
    if (shapes.empty()) {
        return std::nullopt;
    }

    if (body.bounds_dirty) {
        Rectangle merged = shapes.front().rect();
        for (std::size_t i = 1; i < shapes.size(); ++i) {
            merged = rect_union(merged, shapes[i].rect());
        }
        body.cached_bounds = merged;
        body.bounds_dirty = false;
    }
    return body.cached_bounds;
}

bool Body::is_colliding(const Body& other) const {
    const auto mine = active_shapes();
    const auto theirs = other.active_shapes();

    for (const Shape& a : mine) {
        for (const Shape& b : theirs) {
            if (shapes_collide(a, b)) {
                return true;
            }
        }
    }
    return false;
}

// ============================================================================
// Contacts
// ============================================================================

const std::vector<NodeId>& Body::colliding_bodies() const {
    return component().colliding;
}

const std::vector<NodeId>& Body::last_colliding_bodies() const {
    return component().last_colliding;
}

bool Body::is_registered() const {
    return valid() && component().registered;
}

void Body::collide(const Body& other) {
    auto& body = component();
    if (contains(body.colliding, other.id())) {
        return;
    }

    body.colliding.push_back(other.id());
    if (!contains(body.last_colliding, other.id())) {
        body.body_entered.emit(other.id());
    }
}

void Body::finish_tick() {
    auto& body = component();

    std::vector<NodeId> ended;
    for (NodeId id : body.last_colliding) {
        if (!contains(body.colliding, id)) {
            ended.push_back(id);
        }
    }

    // Rotate before emitting: a handler that removes a partner must not see it as a live contact.
    body.last_colliding.swap(body.colliding);
    body.colliding.clear();

    for (NodeId id : ended) {
        if (!is_registered()) {
            return;
        }
        component().body_exited.emit(id);
    }
}

scene::Signal<NodeId>& Body::body_entered() const {
    return component().body_entered;
}

scene::Signal<NodeId>& Body::body_exited() const {
    return component().body_exited;
}

// ============================================================================
// Kinematic
// ============================================================================

void Body::move_and_collide(Vector2 velocity) {
    auto* motion = registry().try_get<KinematicMotion>(id_);
    if (!motion) {
        throw Error("move_and_collide: '" + name() + "' is not a kinematic body");
    }
    motion->velocity = {motion->velocity.x + velocity.x, motion->velocity.y + velocity.y};
}

Vector2 Body::last_motion() const {
    if (const auto* motion = registry().try_get<KinematicMotion>(id_)) {
        return motion->last_motion;
    }
    return kVectorZero;
}

// ============================================================================
// BodyBehaviour
// ============================================================================

void BodyBehaviour::enter_tree(scene::Node self) {
    Body body(self);
    auto& component = body.component();
    if (!component.server) {
        return;
    }

    if (!body.has_shape() && component.server->warn_missing_shape()) {
        TraceLog(LOG_WARNING, "[physics] %s '%s' entered the tree without a Shape child",
                 body_kind_name(component.kind), body.name().c_str());
    }
    component.server->insert_body(body);
}

void BodyBehaviour::exit_tree(scene::Node self) {
    Body body(self);
    if (auto* server = body.component().server) {
        server->remove_body(body);
    }
}

void BodyBehaviour::child_added(scene::Node self, scene::Node child) {
    if (!Shape::is_shape(child)) {
        return;
    }
    Shape shape(child);
    if (shape.collision_type() != CollisionType::Physics) {
        return;
    }

    Body body(self);
    auto& component = body.component();
    component.active_shapes.push_back(shape.id());
    component.bounds_dirty = true;

    entt::registry* registry = &self.tree().registry();
    const NodeId body_id = self.id();
    shape.connect(shape.rect_changed(), body_id, [registry, body_id](NodeId) {
        if (auto* owner = registry->try_get<BodyComponent>(body_id)) {
            owner->bounds_dirty = true;
        }
    });
}

void BodyBehaviour::child_removed(scene::Node self, scene::Node child) {
    Body body(self);
    auto& shapes = body.component().active_shapes;
    auto it = std::find(shapes.begin(), shapes.end(), child.id());
    if (it == shapes.end()) {
        return;
    }

    shapes.erase(it);
    body.component().bounds_dirty = true;

    Shape shape(child);
    if (shape.rect_changed().is_connected(self.id())) {
        shape.disconnect(shape.rect_changed(), self.id());
    }
}

void BodyBehaviour::predelete(scene::Node self) {
    Body body(self);
    body.body_entered().disconnect_all(self.id());
    body.body_exited().disconnect_all(self.id());
}

void BodyBehaviour::process(scene::Node self, float dt) {
    auto* motion = self.tree().registry().try_get<KinematicMotion>(self.id());
    if (!motion) {
        return;
    }

    const Vector2 step{motion->velocity.x * dt, motion->velocity.y * dt};
    motion->last_motion = step;
    motion->velocity = kVectorZero;

    if (step.x != 0.0f || step.y != 0.0f) {
        self.translate(step);
    }
}

} // namespace nodeflow::physics
