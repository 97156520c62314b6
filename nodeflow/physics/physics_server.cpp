#include "nodeflow/physics/physics_server.hpp"

#include "nodeflow/core/errors.hpp"
#include "nodeflow/physics/narrow_phase.hpp"
#include "nodeflow/scene/scene_tree.hpp"

#include <raylib.h>

#include <algorithm>
#include <set>
#include <utility>

namespace nodeflow::physics {

namespace {

void erase_id(std::vector<NodeId>& ids, NodeId id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

bool contains(const std::vector<NodeId>& ids, NodeId id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

PhysicsServer::PhysicsServer(scene::SceneTree& tree)
    : tree_(tree), identity_(tree.create_service()) {}

PhysicsServer::~PhysicsServer() {
    // Bodies may outlive us inside the tree; stop them from calling back.
    auto& registry = tree_.registry();
    for (NodeId id : bodies_) {
        if (!registry.valid(id)) {
            continue;
        }
        if (auto* body = registry.try_get<BodyComponent>(id)) {
            body->registered = false;
            body->server = nullptr;
        }
        if (auto* signals = registry.try_get<scene::NodeSignals>(id)) {
            if (signals->freed.is_connected(identity_)) {
                signals->freed.disconnect(id, identity_);
            }
        }
    }
}

bool PhysicsServer::is_registered(NodeId id) const {
    const auto& registry = tree_.registry();
    if (!scene::is_alive(registry, id)) {
        return false;
    }
    const auto* body = registry.try_get<BodyComponent>(id);
    return body != nullptr && body->registered;
}

const Space* PhysicsServer::space(BodyKind kind, unsigned bit) const {
    const auto& buckets = spaces_[static_cast<std::size_t>(kind)];
    auto it = buckets.find(bit);
    return it == buckets.end() ? nullptr : &it->second;
}

// ============================================================================
// Registration
// ============================================================================

void PhysicsServer::index_(NodeId id, const BodyComponent& body) {
    auto& buckets = spaces_[static_cast<std::size_t>(body.kind)];
    for (unsigned bit = 0; bit < kCollisionBits; ++bit) {
        const std::uint32_t flag = 1u << bit;
        if (body.layer & flag) {
            buckets[bit].layers.push_back(id);
        }
        if (body.mask & flag) {
            buckets[bit].masks.push_back(id);
        }
    }
}

void PhysicsServer::unindex_(NodeId id) {
    // Empty buckets stay: a running pass may be iterating the map.
    for (auto& buckets : spaces_) {
        for (auto& [bit, space] : buckets) {
            erase_id(space.layers, id);
            erase_id(space.masks, id);
        }
    }
}

void PhysicsServer::insert_body(Body body) {
    if (!body.valid() || !Body::is_body(body)) {
        throw InvalidChild("Only live bodies can be registered for collisions");
    }

    auto& component = body.component();
    if (component.registered) {
        unindex_(body.id());
    } else {
        bodies_.push_back(body.id());
        body.connect(body.freed(), identity_, [this](NodeId freed) {
            remove_body(Body(tree_.node(freed)));
        });
    }

    component.registered = true;
    component.server = this;
    index_(body.id(), component);

    if (collision_debug_) {
        TraceLog(LOG_DEBUG, "[physics] Registered %s '%s' layer=0x%X mask=0x%X",
                 body_kind_name(component.kind), body.name().c_str(),
                 static_cast<unsigned>(component.layer), static_cast<unsigned>(component.mask));
    }
}

void PhysicsServer::remove_body(Body body) {
    auto& registry = tree_.registry();
    const NodeId id = body.id();
    if (!registry.valid(id) || !registry.all_of<BodyComponent>(id)) {
        return;
    }

    auto& component = registry.get<BodyComponent>(id);
    if (!component.registered) {
        return;
    }

    component.registered = false;
    unindex_(id);
    erase_id(bodies_, id);
    component.colliding.clear();
    component.last_colliding.clear();

    if (body.freed().is_connected(identity_)) {
        body.disconnect(body.freed(), identity_);
    }

    // Partners that still see this body get their exit edge now.
    const auto partners = bodies_;
    for (NodeId partner_id : partners) {
        if (!is_registered(partner_id)) {
            continue;
        }
        auto& partner = registry.get<BodyComponent>(partner_id);
        const bool in_contact = contains(partner.colliding, id) || contains(partner.last_colliding, id);
        if (!in_contact) {
            continue;
        }

        erase_id(partner.colliding, id);
        erase_id(partner.last_colliding, id);
        partner.body_exited.emit(id);
    }

    if (collision_debug_) {
        TraceLog(LOG_DEBUG, "[physics] Removed '%s'", body.name().c_str());
    }
}

// ============================================================================
// Collision pass
// ============================================================================

void PhysicsServer::process_collisions() {
    scene::SceneTree::TraversalScope scope(tree_);

    std::set<std::pair<NodeId, NodeId>> tested;
    last_narrow_tests_ = 0;

    for (std::size_t mask_kind = 0; mask_kind < kBodyKindCount; ++mask_kind) {
        for (std::size_t layer_kind = 0; layer_kind < kBodyKindCount; ++layer_kind) {
            const auto statics = static_cast<std::size_t>(BodyKind::Static);
            if (mask_kind == statics && layer_kind == statics) {
                continue;
            }

            auto& layer_buckets = spaces_[layer_kind];
            for (auto& [bit, mask_space] : spaces_[mask_kind]) {
                auto match = layer_buckets.find(bit);
                if (match == layer_buckets.end()) {
                    continue;
                }

                // Callbacks may register or remove bodies; walk snapshots.
                const auto masks = mask_space.masks;
                const auto layers = match->second.layers;

                for (NodeId m : masks) {
                    for (NodeId l : layers) {
                        if (m == l || !tested.emplace(m, l).second) {
                            continue;
                        }
                        if (!is_registered(m) || !is_registered(l)) {
                            continue;
                        }

                        Body seeker(tree_.node(m));
                        Body target(tree_.node(l));

                        const auto a = seeker.bounds();
                        const auto b = target.bounds();
                        if (!a || !b || !rects_overlap(*a, *b)) {
                            continue;
                        }

                        ++last_narrow_tests_;
                        if (!seeker.is_colliding(target)) {
                            continue;
                        }

                        if (collision_debug_) {
                            TraceLog(LOG_INFO, "[physics] '%s' detected '%s' on bit %u",
                                     seeker.name().c_str(), target.name().c_str(), bit);
                        }
                        seeker.collide(target);
                    }
                }
            }
        }
    }

    const auto bodies = bodies_;
    for (NodeId id : bodies) {
        if (is_registered(id)) {
            Body(tree_.node(id)).finish_tick();
        }
    }
}

} // namespace nodeflow::physics
