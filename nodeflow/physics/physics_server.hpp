#pragma once

// =============================================================================
// PhysicsServer - collision spaces and the per-tick collision pass
// =============================================================================
//
// Bodies are bucketed per kind by each bit of their layer and mask. A pass
// walks every (mask kind, layer kind) pairing except static vs static, and for
// every bit present on both sides tests mask members against layer members:
// broad phase on cached bounds, then the exact shape tests.
//

#include "nodeflow/physics/body.hpp"
#include "nodeflow/scene/types.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <vector>

namespace nodeflow::scene {
class SceneTree;
}

namespace nodeflow::physics {

struct Space {
    std::vector<NodeId> layers;
    std::vector<NodeId> masks;
};

class PhysicsServer {
public:
    explicit PhysicsServer(scene::SceneTree& tree);
    ~PhysicsServer();

    PhysicsServer(const PhysicsServer&) = delete;
    PhysicsServer& operator=(const PhysicsServer&) = delete;

    scene::SceneTree& tree() { return tree_; }

    /// Indexes the body by its layer and mask bits; re-indexes a registered body.
    void insert_body(Body body);

    /// Unindexes the body and ends its contacts, emitting body_exited on partners.
    void remove_body(Body body);

    void process_collisions();

    /// Bucket for `bit` of `kind`, or null when no body uses that bit.
    const Space* space(BodyKind kind, unsigned bit) const;

    std::size_t body_count() const { return bodies_.size(); }
    bool is_registered(NodeId id) const;

    // --- Options ---

    void set_collision_debug(bool enabled) { collision_debug_ = enabled; }
    bool collision_debug() const { return collision_debug_; }

    void set_warn_missing_shape(bool enabled) { warn_missing_shape_ = enabled; }
    bool warn_missing_shape() const { return warn_missing_shape_; }

    /// Pairs that reached the narrow phase during the last pass.
    std::size_t last_narrow_tests() const { return last_narrow_tests_; }

private:
    void unindex_(NodeId id);
    void index_(NodeId id, const BodyComponent& body);

    scene::SceneTree& tree_;
    NodeId identity_;

    std::array<std::map<unsigned, Space>, kBodyKindCount> spaces_;
    std::vector<NodeId> bodies_;

    bool collision_debug_{false};
    bool warn_missing_shape_{true};
    std::size_t last_narrow_tests_{0};
};

} // namespace nodeflow::physics
