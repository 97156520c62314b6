#pragma once

// =============================================================================
// NodeBehaviour - per-kind capabilities attached to a node
// =============================================================================
//
// Nodes stay homogeneous in the arena; what a node does each frame comes from
// the behaviours attached to it (engine ones such as bodies and shapes, plus
// game ones). Behaviours on a node run in attach order.
//
// Usage:
//   struct Spinner : NodeBehaviour {
//       bool has_process_step() const override { return true; }
//       void process(Node self, float dt) override { self.translate({dt, 0.0f}); }
//   };
//   node.add_behaviour<Spinner>();
//

#include "nodeflow/scene/canvas.hpp"
#include "nodeflow/scene/input_event.hpp"
#include "nodeflow/scene/node.hpp"

namespace nodeflow::scene {

class NodeBehaviour {
public:
    virtual ~NodeBehaviour() = default;

    // --- Capabilities ---

    virtual bool has_process_step() const { return false; }
    virtual bool has_draw_step() const { return false; }

    // --- Lifecycle hooks ---

    /// After the node and its whole subtree are on tree (children first).
    virtual void enter_tree(Node) {}
    virtual void exit_tree(Node) {}

    virtual void child_added(Node, Node) {}
    virtual void child_removed(Node, Node) {}

    /// Global position or scale of the node changed while on tree.
    virtual void transform_changed(Node) {}

    /// free() after `freed` was emitted: drop connections on signals the node owns.
    virtual void predelete(Node) {}

    // --- Frame steps ---

    virtual void process(Node, float) {}
    virtual void draw(Node, ICanvas&) {}
    virtual void input_event(Node, const InputEvent&) {}
};

} // namespace nodeflow::scene
