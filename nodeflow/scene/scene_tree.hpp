#pragma once

// =============================================================================
// SceneTree - node arena and tree algorithms
// =============================================================================
//
// Owns the EnTT registry every node, signal and body of a world lives in.
// Node and Entity are thin handles over it; the structural work (attach,
// detach, free, enter/exit propagation, process and draw passes) is here.
//
// Freed nodes keep their arena slot until the outermost traversal scope or
// signal emission ends, so handles taken during a pass stay safe to query.
//

#include "nodeflow/core/types.hpp"
#include "nodeflow/scene/canvas.hpp"
#include "nodeflow/scene/components.hpp"
#include "nodeflow/scene/node.hpp"
#include "nodeflow/scene/signal.hpp"
#include "nodeflow/scene/types.hpp"

#include <entt/entt.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nodeflow::scene {

class SceneTree {
public:
    SceneTree();
    ~SceneTree();

    SceneTree(const SceneTree&) = delete;
    SceneTree& operator=(const SceneTree&) = delete;

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    Node root() { return Node(*this, root_); }

    /// Spatial entity without tree membership.
    Entity create_entity(Vector2 position = kVectorZero);

    /// Detached node. Throws EmptyName.
    Node create_node(std::string name, Vector2 position = kVectorZero);

    /// Observer identity for engine services that connect to signals.
    NodeId create_service();

    Node node(NodeId id) { return Node(*this, id); }

    // --- Frame passes ---

    /// Post-order process pass honouring pause modes.
    void propagate(float dt);

    /// Pre-order draw pass.
    void draw(ICanvas& canvas);

    // --- Pause ---

    void pause_tree(std::uint8_t flags = PauseMode::TreePaused);
    std::uint8_t tree_pause() const { return tree_pause_; }
    bool is_paused() const { return (tree_pause_ & PauseMode::TreePaused) != 0; }

    /// Emitted by the root with the new paused state.
    Signal<bool>& pause_toggled();

    // --- Groups ---

    void add_to_group(Node node, const std::string& group);
    void remove_from_group(Node node, const std::string& group);
    bool is_on_group(Node node, const std::string& group) const;
    std::vector<Node> group_nodes(const std::string& group);

    /// Calls `fn(Node)` on every live member. Returns the number of calls.
    template <typename Fn>
    std::size_t call_group(const std::string& group, Fn&& fn) {
        TraversalScope scope(*this);
        std::size_t calls = 0;
        for (Node member : group_nodes(group)) {
            if (member.valid()) {
                fn(member);
                ++calls;
            }
        }
        return calls;
    }

    // --- Current scene ---

    void set_current_scene(Node scene);
    Node current_scene() { return Node(*this, current_scene_); }

    // --- Screen ---

    /// Size of the drawn view; cameras scroll against it.
    void set_screen_size(Vector2 size) { screen_size_ = size; }
    Vector2 screen_size() const { return screen_size_; }

    // --- Debug ---

    void set_debug_draw(bool enabled) { debug_draw_ = enabled; }
    bool debug_draw() const { return debug_draw_; }

    // Keeps freed slots alive while a pass is running.
    class TraversalScope {
    public:
        explicit TraversalScope(SceneTree& tree);
        ~TraversalScope();

        TraversalScope(const TraversalScope&) = delete;
        TraversalScope& operator=(const TraversalScope&) = delete;

    private:
        SceneTree& tree_;
    };

private:
    friend class Entity;
    friend class Node;

    // --- Structure ---
    void add_child_(NodeId parent, NodeId child, int at);
    NodeId remove_child_(NodeId parent, NodeId child);
    NodeId remove_child_at_(NodeId parent, int at);
    void free_(NodeId id);

    // --- Lifecycle ---
    void enter_tree_(NodeId id);
    void exit_tree_(NodeId id);

    // --- Transforms ---
    void transform_changed_(NodeId id);
    void refresh_global_(NodeId id);
    Vector2 global_position_(NodeId id) const;
    Vector2 global_scale_(NodeId id) const;

    // --- Passes ---
    void propagate_(NodeId id, float dt, std::uint8_t inherited);
    void draw_(NodeId id, ICanvas& canvas);
    void draw_subtree_(NodeId id, ICanvas& canvas);

    NodeBehaviour& add_behaviour_(NodeId id, std::unique_ptr<NodeBehaviour> behaviour);
    std::vector<NodeBehaviour*> behaviours_(NodeId id) const;

    bool is_ancestor_(NodeId candidate, NodeId of) const;
    Hierarchy& hierarchy_(NodeId id);
    const Hierarchy& hierarchy_(NodeId id) const;
    ArenaState& arena_();

    // Re-reads the list on every step: hooks may attach behaviours or free the node.
    template <typename Fn>
    void for_each_behaviour_(NodeId id, Fn&& fn) {
        for (std::size_t i = 0;; ++i) {
            if (!is_alive(registry_, id)) {
                return;
            }
            auto* attached = registry_.try_get<Behaviours>(id);
            if (!attached || i >= attached->list.size()) {
                return;
            }
            fn(*attached->list[i]);
        }
    }

    entt::registry registry_;
    NodeId root_{kNullNode};
    NodeId current_scene_{kNullNode};
    std::uint8_t tree_pause_{0};
    bool debug_draw_{false};
    Vector2 screen_size_{0.0f, 0.0f};

    std::unordered_map<std::string, std::vector<NodeId>> groups_;
};

} // namespace nodeflow::scene
