#pragma once

#include "nodeflow/scene/entity.hpp"
#include "nodeflow/scene/signal.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nodeflow::scene {

class NodeBehaviour;

// ============================================================================
// Node - tree-capable entity handle
// ============================================================================
//
// Nodes are owned by the SceneTree arena; a Node value is only a handle.
// Children are ordered (insertion order is the process/draw order) and
// unique by name among siblings.

class Node : public Entity {
public:
    using Entity::Entity;

    const std::string& name() const;

    // --- Structure ---

    Node get_parent() const;
    /// Null handle when no child has that name.
    Node get_child(std::string_view name) const;
    /// Negative indices count from the end. Throws std::out_of_range.
    Node get_child(int at = -1) const;
    std::vector<Node> children() const;
    std::size_t child_count() const;

    void add_child(Node child, int at = -1);
    Node remove_child(Node child);
    /// Null handle when there are no children.
    Node remove_child(int at = -1);

    /// Detaches, frees the subtree depth-first and emits `freed`.
    void free();

    bool is_on_tree() const;
    Vector2 global_position() const;
    Vector2 global_scale() const;

    // --- Pause ---

    std::uint8_t pause_mode() const;
    void set_pause_mode(std::uint8_t mode);
    void pause(bool do_pause);
    void toggle_process();

    // --- Signals ---

    Signal<NodeId>& freed() const;

    // --- Behaviours ---

    NodeBehaviour& add_behaviour(std::unique_ptr<NodeBehaviour> behaviour);

    template <typename T, typename... Args>
    T& add_behaviour(Args&&... args) {
        return static_cast<T&>(add_behaviour(std::make_unique<T>(std::forward<Args>(args)...)));
    }

    template <typename T>
    T* behaviour() const {
        for (NodeBehaviour* b : behaviours()) {
            if (auto* typed = dynamic_cast<T*>(b)) {
                return typed;
            }
        }
        return nullptr;
    }

    std::vector<NodeBehaviour*> behaviours() const;
};

} // namespace nodeflow::scene
