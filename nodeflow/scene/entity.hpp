#pragma once

#include "nodeflow/core/types.hpp"
#include "nodeflow/scene/types.hpp"

#include <entt/entt.hpp>
#include <raylib.h>

#include <utility>

namespace nodeflow::scene {

class SceneTree;

/// Spatial data shared by every entity. Global values are caches, valid while on tree.
struct Spatial {
    Vector2 position{kVectorZero};
    Vector2 scale{kVectorOne};
    Vector2 anchor{kAnchorCenter};   // fraction of the cell the origin sits at
    Color color{0, 185, 225, 125};

    Vector2 global_position{kVectorZero};
    Vector2 global_scale{kVectorOne};
};

// ============================================================================
// Entity - handle to a spatial unit in a SceneTree arena (no tree membership)
// ============================================================================

class Entity {
public:
    Entity() = default;
    Entity(SceneTree& tree, NodeId id) : tree_(&tree), id_(id) {}

    NodeId id() const { return id_; }
    SceneTree& tree() const { return *tree_; }

    /// False for null handles and for nodes that have been freed.
    bool valid() const;
    explicit operator bool() const { return valid(); }

    Vector2 position() const;
    void set_position(Vector2 value);
    void translate(Vector2 offset);

    Vector2 scale() const;
    void set_scale(Vector2 value);

    Vector2 anchor() const;
    void set_anchor(Vector2 value);

    Color color() const;
    void set_color(Color value);

    // --- Signal helpers (this entity is the owner) ---

    template <typename SignalT, typename Fn, typename... Bound>
    void connect(SignalT& signal, NodeId observer, Fn&& fn, Bound&&... bound) const {
        signal.connect(id_, observer, std::forward<Fn>(fn), std::forward<Bound>(bound)...);
    }

    template <typename SignalT>
    void disconnect(SignalT& signal, NodeId observer) const {
        signal.disconnect(id_, observer);
    }

    friend bool operator==(const Entity& a, const Entity& b) {
        return a.tree_ == b.tree_ && a.id_ == b.id_;
    }
    friend bool operator!=(const Entity& a, const Entity& b) { return !(a == b); }

protected:
    entt::registry& registry() const;
    Spatial& spatial() const;

    SceneTree* tree_{nullptr};
    NodeId id_{kNullNode};
};

} // namespace nodeflow::scene
