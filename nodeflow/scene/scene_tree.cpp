#include "nodeflow/scene/scene_tree.hpp"

#include "nodeflow/core/errors.hpp"
#include "nodeflow/scene/camera.hpp"

#include <raylib.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace nodeflow::scene {

// ============================================================================
// Construction
// ============================================================================

SceneTree::SceneTree() {
    registry_.ctx().emplace<ArenaState>();

    root_ = registry_.create();
    registry_.emplace<Spatial>(root_);
    auto& h = registry_.emplace<Hierarchy>(root_);
    h.name = "root";
    h.on_tree = true;
    registry_.emplace<NodeSignals>(root_, registry_, root_);
    registry_.emplace<TreeSignals>(root_, registry_, root_);
}

SceneTree::~SceneTree() = default;

Entity SceneTree::create_entity(Vector2 position) {
    const NodeId id = registry_.create();
    auto& spatial = registry_.emplace<Spatial>(id);
    spatial.position = position;
    spatial.global_position = position;
    return Entity(*this, id);
}

Node SceneTree::create_node(std::string name, Vector2 position) {
    if (name.empty()) {
        throw EmptyName();
    }

    const NodeId id = registry_.create();
    auto& spatial = registry_.emplace<Spatial>(id);
    spatial.position = position;
    spatial.global_position = position;

    auto& h = registry_.emplace<Hierarchy>(id);
    h.name = std::move(name);

    registry_.emplace<NodeSignals>(id, registry_, id);
    return Node(*this, id);
}

NodeId SceneTree::create_service() {
    const NodeId id = registry_.create();
    registry_.emplace<ServiceTag>(id);
    return id;
}

// ============================================================================
// Traversal scope
// ============================================================================

SceneTree::TraversalScope::TraversalScope(SceneTree& tree) : tree_(tree) {
    ++tree_.arena_().traversal_depth;
}

SceneTree::TraversalScope::~TraversalScope() {
    if (--tree_.arena_().traversal_depth == 0) {
        release_pending(tree_.registry_);
    }
}

ArenaState& SceneTree::arena_() {
    return registry_.ctx().get<ArenaState>();
}

Hierarchy& SceneTree::hierarchy_(NodeId id) {
    return registry_.get<Hierarchy>(id);
}

const Hierarchy& SceneTree::hierarchy_(NodeId id) const {
    return registry_.get<Hierarchy>(id);
}

bool SceneTree::is_ancestor_(NodeId candidate, NodeId of) const {
    for (NodeId cur = hierarchy_(of).parent; cur != kNullNode; cur = hierarchy_(cur).parent) {
        if (cur == candidate) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Structure
// ============================================================================

void SceneTree::add_child_(NodeId parent, NodeId child, int at) {
    if (!is_alive(registry_, parent) || !is_alive(registry_, child)) {
        throw InvalidChild("Cannot attach: node has been freed");
    }
    if (!registry_.all_of<Hierarchy>(parent) || !registry_.all_of<Hierarchy>(child)) {
        throw InvalidChild("Cannot attach: entity is not a node");
    }

    TraversalScope scope(*this);

    const auto& ch = hierarchy_(child);
    if (child == parent) {
        throw InvalidChild("Node '" + ch.name + "' cannot be its own child");
    }
    if (child == root_) {
        throw InvalidChild("The root node cannot be a child");
    }
    if (ch.parent != kNullNode) {
        throw InvalidChild("Node '" + ch.name + "' already has a parent");
    }
    if (is_ancestor_(child, parent)) {
        throw InvalidChild("Node '" + ch.name + "' is an ancestor of '" + hierarchy_(parent).name + "'");
    }

    auto& ph = hierarchy_(parent);
    if (ph.children_by_name.count(ch.name) != 0) {
        throw DuplicatedChild("'" + ph.name + "' already has a child named '" + ch.name + "'");
    }

    // -1 appends; other negative positions count from the end, before that child.
    const int size = static_cast<int>(ph.children.size());
    const int index = at == -1 ? size : (at < 0 ? size + at : at);
    if (index < 0 || index > size) {
        throw std::out_of_range("add_child: position " + std::to_string(at) + " out of range");
    }
    ph.children.insert(ph.children.begin() + index, child);
    ph.children_by_name.emplace(ch.name, child);
    hierarchy_(child).parent = parent;

    // The child's global transform changed either way.
    if (ph.on_tree) {
        enter_tree_(child);
    } else {
        transform_changed_(child);
    }

    for_each_behaviour_(parent, [&](NodeBehaviour& b) {
        b.child_added(Node(*this, parent), Node(*this, child));
    });
}

NodeId SceneTree::remove_child_(NodeId parent, NodeId child) {
    if (!registry_.valid(parent) || !registry_.all_of<Hierarchy>(parent)) {
        throw InvalidChild("Cannot detach from a stale node");
    }

    auto& ph = hierarchy_(parent);
    auto it = std::find(ph.children.begin(), ph.children.end(), child);
    if (child == kNullNode || it == ph.children.end()) {
        throw InvalidChild("Node is not a child of '" + ph.name + "'");
    }

    TraversalScope scope(*this);

    ph.children.erase(it);
    auto& ch = hierarchy_(child);
    ph.children_by_name.erase(ch.name);
    ch.parent = kNullNode;

    if (ch.on_tree) {
        exit_tree_(child);
    }

    for_each_behaviour_(parent, [&](NodeBehaviour& b) {
        b.child_removed(Node(*this, parent), Node(*this, child));
    });

    if (is_alive(registry_, child)) {
        transform_changed_(child);
    }
    return child;
}

NodeId SceneTree::remove_child_at_(NodeId parent, int at) {
    const auto& children = hierarchy_(parent).children;
    if (children.empty()) {
        return kNullNode;
    }

    const int size = static_cast<int>(children.size());
    const int index = at < 0 ? size + at : at;
    if (index < 0 || index >= size) {
        throw std::out_of_range("remove_child: index " + std::to_string(at) + " out of range");
    }
    return remove_child_(parent, children[static_cast<std::size_t>(index)]);
}

void SceneTree::free_(NodeId id) {
    if (id == root_) {
        throw InvalidChild("The root node cannot be freed");
    }
    if (!is_alive(registry_, id) || !registry_.all_of<Hierarchy>(id) || hierarchy_(id).freeing) {
        return;
    }

    TraversalScope scope(*this);
    hierarchy_(id).freeing = true;

    if (const NodeId parent = hierarchy_(id).parent; parent != kNullNode) {
        remove_child_(parent, id);
    }

    // Each child detaches itself from us while being freed.
    const auto children = hierarchy_(id).children;
    for (NodeId child : children) {
        free_(child);
    }

    auto& freed = registry_.get<NodeSignals>(id).freed;
    freed.emit(id);
    freed.disconnect_all(id);
    for_each_behaviour_(id, [&](NodeBehaviour& b) { b.predelete(Node(*this, id)); });

    const auto groups = hierarchy_(id).groups;
    for (const auto& group : groups) {
        remove_from_group(Node(*this, id), group);
    }
    if (current_scene_ == id) {
        current_scene_ = kNullNode;
    }

    TraceLog(LOG_DEBUG, "[scene] Freed node '%s'", hierarchy_(id).name.c_str());

    registry_.emplace<FreedTag>(id);
    arena_().pending_destroy.push_back(id);
}

// ============================================================================
// Lifecycle
// ============================================================================

void SceneTree::enter_tree_(NodeId id) {
    hierarchy_(id).on_tree = true;
    refresh_global_(id);

    // Caches top-down, hooks bottom-up: a parent sees its children ready.
    const auto children = hierarchy_(id).children;
    for (NodeId child : children) {
        if (is_alive(registry_, child) && hierarchy_(child).parent == id) {
            enter_tree_(child);
        }
    }

    for_each_behaviour_(id, [&](NodeBehaviour& b) { b.enter_tree(Node(*this, id)); });
}

void SceneTree::exit_tree_(NodeId id) {
    for_each_behaviour_(id, [&](NodeBehaviour& b) { b.exit_tree(Node(*this, id)); });
    hierarchy_(id).on_tree = false;

    const auto children = hierarchy_(id).children;
    for (NodeId child : children) {
        if (registry_.valid(child) && hierarchy_(child).parent == id && hierarchy_(child).on_tree) {
            exit_tree_(child);
        }
    }
}

// ============================================================================
// Transforms
// ============================================================================

void SceneTree::refresh_global_(NodeId id) {
    auto& spatial = registry_.get<Spatial>(id);
    const NodeId parent = hierarchy_(id).parent;

    if (parent == kNullNode) {
        spatial.global_position = spatial.position;
        spatial.global_scale = spatial.scale;
        return;
    }

    const auto& ps = registry_.get<Spatial>(parent);
    spatial.global_position = {ps.global_position.x + spatial.position.x,
                               ps.global_position.y + spatial.position.y};
    spatial.global_scale = {ps.global_scale.x * spatial.scale.x,
                            ps.global_scale.y * spatial.scale.y};
}

void SceneTree::transform_changed_(NodeId id) {
    if (!registry_.all_of<Hierarchy>(id)) {
        auto& spatial = registry_.get<Spatial>(id);
        spatial.global_position = spatial.position;
        spatial.global_scale = spatial.scale;
        return;
    }

    TraversalScope scope(*this);

    if (hierarchy_(id).on_tree) {
        refresh_global_(id);
    }

    for_each_behaviour_(id, [&](NodeBehaviour& b) { b.transform_changed(Node(*this, id)); });

    const auto children = hierarchy_(id).children;
    for (NodeId child : children) {
        if (is_alive(registry_, child) && hierarchy_(child).parent == id) {
            transform_changed_(child);
        }
    }
}

Vector2 SceneTree::global_position_(NodeId id) const {
    const auto& spatial = registry_.get<Spatial>(id);
    const auto* h = registry_.try_get<Hierarchy>(id);
    if (!h) {
        return spatial.position;
    }
    if (h->on_tree) {
        return spatial.global_position;
    }
    if (h->parent == kNullNode) {
        return spatial.position;
    }

    const Vector2 base = global_position_(h->parent);
    return {base.x + spatial.position.x, base.y + spatial.position.y};
}

Vector2 SceneTree::global_scale_(NodeId id) const {
    const auto& spatial = registry_.get<Spatial>(id);
    const auto* h = registry_.try_get<Hierarchy>(id);
    if (!h) {
        return spatial.scale;
    }
    if (h->on_tree) {
        return spatial.global_scale;
    }
    if (h->parent == kNullNode) {
        return spatial.scale;
    }

    const Vector2 base = global_scale_(h->parent);
    return {base.x * spatial.scale.x, base.y * spatial.scale.y};
}

// ============================================================================
// Passes
// ============================================================================

void SceneTree::propagate(float dt) {
    TraversalScope scope(*this);
    propagate_(root_, dt, 0);
}

void SceneTree::propagate_(NodeId id, float dt, std::uint8_t inherited) {
    const std::uint8_t mode = hierarchy_(id).pause_mode;
    const std::uint8_t pause = static_cast<std::uint8_t>(inherited | tree_pause_ | mode);

    const auto children = hierarchy_(id).children;
    for (NodeId child : children) {
        if (is_alive(registry_, child) && hierarchy_(child).parent == id) {
            propagate_(child, dt, pause);
        }
    }

    const bool blocked = (pause & PauseMode::Stop) != 0 ||
                         ((pause & PauseMode::TreePaused) != 0 && (mode & PauseMode::Continue) == 0);
    if (blocked) {
        return;
    }

    for_each_behaviour_(id, [&](NodeBehaviour& b) {
        if (b.has_process_step()) {
            b.process(Node(*this, id), dt);
        }
    });
}

void SceneTree::draw(ICanvas& canvas) {
    TraversalScope scope(*this);
    draw_(root_, canvas);
}

void SceneTree::draw_(NodeId id, ICanvas& canvas) {
    // A canvas layer shifts itself and its subtree; the outer offset comes back afterwards.
    if (registry_.all_of<CanvasLayerComponent>(id)) {
        const Vector2 outer = canvas.offset();
        canvas.set_offset(CanvasLayer(Node(*this, id)).draw_offset());
        draw_subtree_(id, canvas);
        canvas.set_offset(outer);
        return;
    }
    draw_subtree_(id, canvas);
}

void SceneTree::draw_subtree_(NodeId id, ICanvas& canvas) {
    for_each_behaviour_(id, [&](NodeBehaviour& b) {
        if (b.has_draw_step()) {
            b.draw(Node(*this, id), canvas);
        }
    });

    if (debug_draw_ && id != root_ && is_alive(registry_, id)) {
        const auto& spatial = registry_.get<Spatial>(id);
        canvas.draw_gizmo(spatial.global_position, 4.0f, spatial.color);
    }

    if (!is_alive(registry_, id)) {
        return;
    }

    const auto children = hierarchy_(id).children;
    for (NodeId child : children) {
        if (is_alive(registry_, child) && hierarchy_(child).parent == id) {
            draw_(child, canvas);
        }
    }
}

// ============================================================================
// Behaviours
// ============================================================================

NodeBehaviour& SceneTree::add_behaviour_(NodeId id, std::unique_ptr<NodeBehaviour> behaviour) {
    if (!is_alive(registry_, id)) {
        throw InvalidChild("Cannot attach a behaviour to a freed node");
    }
    auto& attached = registry_.get_or_emplace<Behaviours>(id);
    attached.list.push_back(std::move(behaviour));
    return *attached.list.back();
}

std::vector<NodeBehaviour*> SceneTree::behaviours_(NodeId id) const {
    std::vector<NodeBehaviour*> out;
    if (!registry_.valid(id)) {
        return out;
    }
    if (const auto* attached = registry_.try_get<Behaviours>(id)) {
        out.reserve(attached->list.size());
        for (const auto& b : attached->list) {
            out.push_back(b.get());
        }
    }
    return out;
}

// ============================================================================
// Pause
// ============================================================================

Signal<bool>& SceneTree::pause_toggled() {
    return registry_.get<TreeSignals>(root_).pause_toggled;
}

void SceneTree::pause_tree(std::uint8_t flags) {
    tree_pause_ = flags;
    TraceLog(LOG_INFO, "[scene] Tree pause flags set to %u", static_cast<unsigned>(flags));
    pause_toggled().emit(is_paused());
}

// ============================================================================
// Groups
// ============================================================================

void SceneTree::add_to_group(Node node, const std::string& group) {
    if (!node.valid() || !registry_.all_of<Hierarchy>(node.id())) {
        throw InvalidChild("Only live nodes can join a group");
    }

    auto& h = hierarchy_(node.id());
    if (std::find(h.groups.begin(), h.groups.end(), group) != h.groups.end()) {
        throw AlreadyInGroup("Node '" + h.name + "' is already in group '" + group + "'");
    }

    h.groups.push_back(group);
    groups_[group].push_back(node.id());
}

void SceneTree::remove_from_group(Node node, const std::string& group) {
    if (!registry_.valid(node.id()) || !registry_.all_of<Hierarchy>(node.id())) {
        return;
    }

    auto& h = hierarchy_(node.id());
    auto it = std::find(h.groups.begin(), h.groups.end(), group);
    if (it == h.groups.end()) {
        return;
    }
    h.groups.erase(it);

    auto members = groups_.find(group);
    if (members == groups_.end()) {
        return;
    }
    auto& ids = members->second;
    ids.erase(std::remove(ids.begin(), ids.end(), node.id()), ids.end());
    if (ids.empty()) {
        groups_.erase(members);
    }
}

bool SceneTree::is_on_group(Node node, const std::string& group) const {
    auto members = groups_.find(group);
    if (members == groups_.end()) {
        return false;
    }
    const auto& ids = members->second;
    return std::find(ids.begin(), ids.end(), node.id()) != ids.end();
}

std::vector<Node> SceneTree::group_nodes(const std::string& group) {
    std::vector<Node> out;
    auto members = groups_.find(group);
    if (members == groups_.end()) {
        return out;
    }

    out.reserve(members->second.size());
    for (NodeId id : members->second) {
        out.emplace_back(*this, id);
    }
    return out;
}

// ============================================================================
// Current scene
// ============================================================================

void SceneTree::set_current_scene(Node scene) {
    TraversalScope scope(*this);

    if (is_alive(registry_, current_scene_) && hierarchy_(current_scene_).parent == root_) {
        remove_child_(root_, current_scene_);
    }

    add_child_(root_, scene.id(), -1);
    current_scene_ = scene.id();

    TraceLog(LOG_INFO, "[scene] Current scene: '%s'", hierarchy_(current_scene_).name.c_str());
}

} // namespace nodeflow::scene
