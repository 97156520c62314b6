#pragma once

#include <entt/entt.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nodeflow::scene {

/// Stable arena handle of a node, entity or engine service.
using NodeId = entt::entity;

inline constexpr NodeId kNullNode{entt::null};

/// Bit flags deciding whether a paused tree still ticks a node.
struct PauseMode {
    static constexpr std::uint8_t TreePaused = 1;
    static constexpr std::uint8_t Stop = 2;      // suppresses the node and its subtree
    static constexpr std::uint8_t Continue = 4;  // keeps running while the tree is paused
    static constexpr std::uint8_t Ignore = 8;
};

/// Marks a node that went through free() but whose arena slot is not reclaimed yet.
struct FreedTag {};

/// Registry-context bookkeeping shared by the tree and every signal of a world.
/// Arena slots are only reclaimed when no traversal and no emission is running.
struct ArenaState {
    int traversal_depth{0};
    int emission_depth{0};
    std::vector<NodeId> pending_destroy;
};

inline bool is_alive(const entt::registry& registry, NodeId id) {
    return id != kNullNode && registry.valid(id) && !registry.all_of<FreedTag>(id);
}

/// Destroys queued entities once the arena is quiet. Returns the number released.
inline std::size_t release_pending(entt::registry& registry) {
    auto* state = registry.ctx().find<ArenaState>();
    if (!state || state->traversal_depth > 0 || state->emission_depth > 0) {
        return 0;
    }

    std::size_t released = 0;
    // Destroying can run component destructors only; nothing re-queues while we drain.
    while (!state->pending_destroy.empty()) {
        const NodeId id = state->pending_destroy.back();
        state->pending_destroy.pop_back();
        if (registry.valid(id)) {
            registry.destroy(id);
            ++released;
        }
    }
    return released;
}

} // namespace nodeflow::scene
