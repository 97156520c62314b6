#include "nodeflow/scene/camera.hpp"

#include "nodeflow/core/errors.hpp"
#include "nodeflow/scene/scene_tree.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace nodeflow::scene {

namespace {

float clamp_axis(float value, float low, float extent, float view) {
    // A world narrower than the view pins the offset to its origin.
    const float high = std::max(low, low + extent - view);
    return std::clamp(value, low, high);
}

} // namespace

// ============================================================================
// Scroll strategies
// ============================================================================

Vector2 FollowScroll::scroll(const Camera& camera, float) {
    Node target = camera.tree().node(target_);
    if (!target.valid()) {
        return camera.offset();
    }

    const Vector2 at = target.global_position();
    const Vector2 view = camera.view_size();
    const Vector2 pivot = camera.anchor();

    // Offsets are whole pixels.
    return {std::trunc(at.x - view.x * pivot.x), std::trunc(at.y - view.y * pivot.y)};
}

Vector2 FollowLimitScroll::scroll(const Camera& camera, float dt) {
    const Vector2 followed = FollowScroll::scroll(camera, dt);
    const Vector2 view = camera.view_size();

    return {clamp_axis(followed.x, limit_.x, limit_.width, view.x),
            clamp_axis(followed.y, limit_.y, limit_.height, view.y)};
}

// ============================================================================
// Camera
// ============================================================================

Camera Camera::create(SceneTree& tree, std::unique_ptr<CameraScroll> scroll, std::string name,
                      Vector2 position) {
    if (!scroll) {
        throw Error("Camera '" + name + "' needs a scroll strategy");
    }

    Node node = tree.create_node(std::move(name), position);
    auto& camera = tree.registry().emplace<CameraComponent>(node.id());
    camera.offset = position;
    camera.scroll = std::move(scroll);

    node.add_behaviour<CameraBehaviour>();
    return Camera(node);
}

bool Camera::is_camera(const Node& node) {
    return node.valid() && node.tree().registry().all_of<CameraComponent>(node.id());
}

CameraComponent& Camera::component() const {
    if (!tree_ || !registry().valid(id_)) {
        throw Error("Stale camera handle");
    }
    return registry().get<CameraComponent>(id_);
}

Vector2 Camera::offset() const {
    return component().offset;
}

void Camera::set_offset(Vector2 offset) {
    component().offset = offset;
}

Vector2 Camera::view_size() const {
    const Vector2 screen = tree().screen_size();
    const Vector2 scale = global_scale();
    return {screen.x * scale.x, screen.y * scale.y};
}

CameraScroll& Camera::scroll_strategy() const {
    return *component().scroll;
}

void Camera::scroll(float dt) {
    auto& camera = component();
    camera.offset = camera.scroll->scroll(*this, dt);
}

void CameraBehaviour::process(Node self, float dt) {
    Camera(self).scroll(dt);
}

// ============================================================================
// CanvasLayer
// ============================================================================

CanvasLayer CanvasLayer::create(SceneTree& tree, std::string name, Vector2 position) {
    Node node = tree.create_node(std::move(name), position);
    tree.registry().emplace<CanvasLayerComponent>(node.id());
    return CanvasLayer(node);
}

bool CanvasLayer::is_canvas_layer(const Node& node) {
    return node.valid() && node.tree().registry().all_of<CanvasLayerComponent>(node.id());
}

Camera CanvasLayer::active_camera() const {
    const NodeId id = registry().get<CanvasLayerComponent>(id_).active_camera;
    if (!is_alive(registry(), id)) {
        return Camera();
    }
    return Camera(tree().node(id));
}

void CanvasLayer::set_active_camera(Camera camera) {
    if (camera.valid() && !Camera::is_camera(camera)) {
        throw InvalidChild("'" + camera.name() + "' is not a camera");
    }
    registry().get<CanvasLayerComponent>(id_).active_camera = camera.valid() ? camera.id() : kNullNode;
}

Vector2 CanvasLayer::draw_offset() const {
    const Camera camera = active_camera();
    if (!camera.valid()) {
        return kVectorZero;
    }
    const Vector2 offset = camera.offset();
    return {-offset.x, -offset.y};
}

} // namespace nodeflow::scene
