#include "nodeflow/scene/input_router.hpp"

#include "nodeflow/core/errors.hpp"
#include "nodeflow/scene/behaviour.hpp"
#include "nodeflow/scene/scene_tree.hpp"

#include <raylib.h>

#include <algorithm>
#include <iterator>

namespace nodeflow::scene {

void InputRouter::register_event(Node target, InputType type, int key, std::string tag) {
    if (!target.valid() || !tree_.registry().all_of<Hierarchy>(target.id())) {
        throw InvalidChild("Input events can only target live nodes");
    }

    events_[Binding{type, key}].push_back(InputEvent{type, key, std::move(tag), target.id()});
}

void InputRouter::unregister(NodeId target) {
    for (auto it = events_.begin(); it != events_.end();) {
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [target](const InputEvent& e) { return e.target == target; }),
                   list.end());
        it = list.empty() ? events_.erase(it) : std::next(it);
    }
}

void InputRouter::push(InputType type, int key) {
    queue_.emplace_back(type, key);
}

std::size_t InputRouter::dispatch() {
    if (queue_.empty()) {
        return 0;
    }

    SceneTree::TraversalScope scope(tree_);

    std::vector<Binding> queue;
    queue.swap(queue_);

    std::size_t delivered = 0;
    bool saw_dead = false;

    for (const Binding& occurrence : queue) {
        auto it = events_.find(occurrence);
        if (it == events_.end()) {
            continue;
        }

        // Handlers may register new events; iterate a snapshot.
        const std::vector<InputEvent> targets = it->second;
        for (const InputEvent& event : targets) {
            Node node = tree_.node(event.target);
            if (!node.valid()) {
                saw_dead = true;
                continue;
            }

            for (NodeBehaviour* b : node.behaviours()) {
                if (!node.valid()) {
                    break;
                }
                b->input_event(node, event);
            }
            ++delivered;
        }
    }

    if (saw_dead) {
        for (auto it = events_.begin(); it != events_.end();) {
            auto& list = it->second;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [this](const InputEvent& e) {
                                          return !is_alive(tree_.registry(), e.target);
                                      }),
                       list.end());
            it = list.empty() ? events_.erase(it) : std::next(it);
        }
        TraceLog(LOG_DEBUG, "[input] Pruned bindings of freed nodes");
    }

    return delivered;
}

std::vector<InputRouter::Binding> InputRouter::bindings() const {
    std::vector<Binding> out;
    out.reserve(events_.size());
    for (const auto& [binding, list] : events_) {
        if (!list.empty()) {
            out.push_back(binding);
        }
    }
    return out;
}

} // namespace nodeflow::scene
