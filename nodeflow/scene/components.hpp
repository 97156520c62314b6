#pragma once

// =============================================================================
// Scene components stored in the SceneTree arena
// =============================================================================
//
// Components holding signals opt into in-place deletion so a signal never
// moves in memory while it may be emitting.

#include "nodeflow/scene/behaviour.hpp"
#include "nodeflow/scene/entity.hpp"
#include "nodeflow/scene/signal.hpp"

#include <entt/entt.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace nodeflow::scene {

struct Hierarchy {
    std::string name;
    NodeId parent{kNullNode};
    std::vector<NodeId> children;
    std::unordered_map<std::string, NodeId> children_by_name;   // mirrors `children`
    std::uint8_t pause_mode{PauseMode::Ignore};
    bool on_tree{false};
    bool freeing{false};
    std::vector<std::string> groups;
};

struct NodeSignals {
    static constexpr auto in_place_delete = true;

    NodeSignals(entt::registry& registry, NodeId owner)
        : freed(registry, owner, "freed") {}

    Signal<NodeId> freed;
};

/// Lives on the root only.
struct TreeSignals {
    static constexpr auto in_place_delete = true;

    TreeSignals(entt::registry& registry, NodeId owner)
        : pause_toggled(registry, owner, "pause_toggled") {}

    Signal<bool> pause_toggled;
};

struct Behaviours {
    std::vector<std::unique_ptr<NodeBehaviour>> list;
};

/// Marks ids created for engine services (observer identities, not nodes).
struct ServiceTag {};

} // namespace nodeflow::scene
