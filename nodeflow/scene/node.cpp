#include "nodeflow/scene/node.hpp"

#include "nodeflow/core/errors.hpp"
#include "nodeflow/scene/scene_tree.hpp"

#include <stdexcept>

namespace nodeflow::scene {

namespace {

const Hierarchy& hierarchy_of(const SceneTree* tree, NodeId id) {
    if (tree == nullptr || !tree->registry().valid(id) || !tree->registry().all_of<Hierarchy>(id)) {
        throw Error("Stale node handle");
    }
    return tree->registry().get<Hierarchy>(id);
}

} // namespace

const std::string& Node::name() const {
    return hierarchy_of(tree_, id_).name;
}

// ============================================================================
// Structure
// ============================================================================

Node Node::get_parent() const {
    return Node(*tree_, hierarchy_of(tree_, id_).parent);
}

Node Node::get_child(std::string_view name) const {
    const auto& by_name = hierarchy_of(tree_, id_).children_by_name;
    auto it = by_name.find(std::string(name));
    if (it == by_name.end()) {
        return Node(*tree_, kNullNode);
    }
    return Node(*tree_, it->second);
}

Node Node::get_child(int at) const {
    const auto& children = hierarchy_of(tree_, id_).children;
    const int size = static_cast<int>(children.size());
    const int index = at < 0 ? size + at : at;
    if (index < 0 || index >= size) {
        throw std::out_of_range("get_child: index " + std::to_string(at) + " out of range");
    }
    return Node(*tree_, children[static_cast<std::size_t>(index)]);
}

std::vector<Node> Node::children() const {
    std::vector<Node> out;
    if (tree_ == nullptr || !tree_->registry().valid(id_)) {
        return out;
    }
    for (NodeId child : hierarchy_of(tree_, id_).children) {
        out.emplace_back(*tree_, child);
    }
    return out;
}

std::size_t Node::child_count() const {
    if (tree_ == nullptr || !tree_->registry().valid(id_)) {
        return 0;
    }
    return hierarchy_of(tree_, id_).children.size();
}

void Node::add_child(Node child, int at) {
    tree_->add_child_(id_, child.id(), at);
}

Node Node::remove_child(Node child) {
    return Node(*tree_, tree_->remove_child_(id_, child.id()));
}

Node Node::remove_child(int at) {
    return Node(*tree_, tree_->remove_child_at_(id_, at));
}

void Node::free() {
    tree_->free_(id_);
}

bool Node::is_on_tree() const {
    if (tree_ == nullptr || !tree_->registry().valid(id_)) {
        return false;
    }
    return hierarchy_of(tree_, id_).on_tree;
}

Vector2 Node::global_position() const {
    hierarchy_of(tree_, id_);
    return tree_->global_position_(id_);
}

Vector2 Node::global_scale() const {
    hierarchy_of(tree_, id_);
    return tree_->global_scale_(id_);
}

// ============================================================================
// Pause
// ============================================================================

std::uint8_t Node::pause_mode() const {
    return hierarchy_of(tree_, id_).pause_mode;
}

void Node::set_pause_mode(std::uint8_t mode) {
    hierarchy_of(tree_, id_);
    tree_->hierarchy_(id_).pause_mode = mode;
}

void Node::pause(bool do_pause) {
    const std::uint8_t mode = pause_mode();
    set_pause_mode(do_pause ? static_cast<std::uint8_t>(mode | PauseMode::TreePaused)
                            : static_cast<std::uint8_t>(mode & ~PauseMode::TreePaused));
}

void Node::toggle_process() {
    set_pause_mode(static_cast<std::uint8_t>(pause_mode() ^ PauseMode::TreePaused));
}

// ============================================================================
// Signals & behaviours
// ============================================================================

Signal<NodeId>& Node::freed() const {
    hierarchy_of(tree_, id_);
    return tree_->registry().get<NodeSignals>(id_).freed;
}

NodeBehaviour& Node::add_behaviour(std::unique_ptr<NodeBehaviour> behaviour) {
    return tree_->add_behaviour_(id_, std::move(behaviour));
}

std::vector<NodeBehaviour*> Node::behaviours() const {
    if (tree_ == nullptr) {
        return {};
    }
    return tree_->behaviours_(id_);
}

} // namespace nodeflow::scene
