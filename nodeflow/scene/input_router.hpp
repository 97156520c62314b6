#pragma once

// =============================================================================
// InputRouter - routes raw input occurrences to registered nodes
// =============================================================================
//
// Nodes register interest in (type, key). Occurrences are pushed by the
// engine shell (or a test), and dispatch() delivers each one to every live
// registered node through NodeBehaviour::input_event, in registration order.
//

#include "nodeflow/scene/input_event.hpp"
#include "nodeflow/scene/node.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace nodeflow::scene {

class SceneTree;

class InputRouter {
public:
    using Binding = std::pair<InputType, int>;

    explicit InputRouter(SceneTree& tree) : tree_(tree) {}

    /// Throws InvalidChild when `target` is not a live node.
    void register_event(Node target, InputType type, int key, std::string tag = {});

    /// Drops every registration of `target`.
    void unregister(NodeId target);

    void push(InputType type, int key);

    /// Delivers queued occurrences. Returns how many events reached a node.
    std::size_t dispatch();

    /// Distinct (type, key) pairs someone listens to; the shell polls these.
    std::vector<Binding> bindings() const;

    std::size_t pending() const { return queue_.size(); }

private:
    SceneTree& tree_;
    std::map<Binding, std::vector<InputEvent>> events_;
    std::vector<Binding> queue_;
};

} // namespace nodeflow::scene
