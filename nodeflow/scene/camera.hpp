#pragma once

// =============================================================================
// Camera / CanvasLayer - scrolling the drawn scene
// =============================================================================
//
// A Camera computes an offset every process step through its scroll
// strategy. A CanvasLayer with an active camera draws its whole subtree
// shifted by the negated camera offset; nested layers replace the offset of
// the outer one.
//
// Usage:
//   auto layer = CanvasLayer::create(tree, "LevelLayer");
//   auto camera = Camera::create(tree, std::make_unique<FollowLimitScroll>(
//       player.id(), Rectangle{0, 0, map_w, map_h}));
//   layer.add_child(camera);
//   layer.set_active_camera(camera);
//

#include "nodeflow/core/types.hpp"
#include "nodeflow/scene/behaviour.hpp"
#include "nodeflow/scene/node.hpp"
#include "nodeflow/scene/types.hpp"

#include <raylib.h>

#include <memory>
#include <string>

namespace nodeflow::scene {

class Camera;
class SceneTree;

// ============================================================================
// Scroll strategies
// ============================================================================

class CameraScroll {
public:
    virtual ~CameraScroll() = default;

    /// New offset for `camera`.
    virtual Vector2 scroll(const Camera& camera, float dt) = 0;
};

/// Keeps the target at the camera anchor of the view. Stops when the target is freed.
class FollowScroll : public CameraScroll {
public:
    explicit FollowScroll(NodeId target) : target_(target) {}

    NodeId target() const { return target_; }

    Vector2 scroll(const Camera& camera, float dt) override;

private:
    NodeId target_;
};

/// Follow, clamped so the view never leaves `limit` (world rectangle).
class FollowLimitScroll : public FollowScroll {
public:
    FollowLimitScroll(NodeId target, Rectangle limit) : FollowScroll(target), limit_(limit) {}

    Rectangle limit() const { return limit_; }

    Vector2 scroll(const Camera& camera, float dt) override;

private:
    Rectangle limit_;
};

// ============================================================================
// Camera
// ============================================================================

struct CameraComponent {
    Vector2 offset{0.0f, 0.0f};
    std::unique_ptr<CameraScroll> scroll;
};

class Camera : public Node {
public:
    Camera() = default;
    explicit Camera(Node node) : Node(node) {}

    /// Throws Error when `scroll` is null. The offset starts at `position`.
    static Camera create(SceneTree& tree, std::unique_ptr<CameraScroll> scroll,
                         std::string name = "Camera", Vector2 position = kVectorZero);

    static bool is_camera(const Node& node);

    Vector2 offset() const;
    void set_offset(Vector2 offset);

    /// Screen size of the tree scaled by the camera's global scale.
    Vector2 view_size() const;

    CameraScroll& scroll_strategy() const;

    /// Runs the scroll strategy once.
    void scroll(float dt);

private:
    CameraComponent& component() const;
};

class CameraBehaviour : public NodeBehaviour {
public:
    bool has_process_step() const override { return true; }

    void process(Node self, float dt) override;
};

// ============================================================================
// CanvasLayer
// ============================================================================

struct CanvasLayerComponent {
    NodeId active_camera{kNullNode};
};

class CanvasLayer : public Node {
public:
    CanvasLayer() = default;
    explicit CanvasLayer(Node node) : Node(node) {}

    static CanvasLayer create(SceneTree& tree, std::string name = "CanvasLayer",
                              Vector2 position = kVectorZero);

    static bool is_canvas_layer(const Node& node);

    /// Null handle when no camera is set or it was freed.
    Camera active_camera() const;

    /// A null handle clears the camera.
    void set_active_camera(Camera camera);

    /// Negated camera offset, zero without a camera.
    Vector2 draw_offset() const;
};

} // namespace nodeflow::scene
