#include "nodeflow/physics/narrow_phase.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

namespace nodeflow::physics {

namespace {

struct ShapeView {
    Rectangle rect;
    Vector2 center;
    float radius;
};

using PairTest = bool (*)(const ShapeView&, const ShapeView&);

bool rect_rect(const ShapeView& a, const ShapeView& b) {
    return CheckCollisionRecs(a.rect, b.rect);
}

bool circle_circle(const ShapeView& a, const ShapeView& b) {
    return CheckCollisionCircles(a.center, a.radius, b.center, b.radius);
}

bool circle_rect(const ShapeView& circle, const ShapeView& rect) {
    return CheckCollisionCircleRec(circle.center, circle.radius, rect.rect);
}

bool rect_circle(const ShapeView& rect, const ShapeView& circle) {
    return circle_rect(circle, rect);
}

// Indexed by [ShapeKind a][ShapeKind b].
constexpr std::array<std::array<PairTest, 2>, 2> kPairTests{{
    {{&rect_rect, &rect_circle}},
    {{&circle_rect, &circle_circle}},
}};

ShapeView view_of(const Shape& shape) {
    return ShapeView{shape.rect(), shape.center(), shape.radius()};
}

} // namespace

bool shapes_collide(const Shape& a, const Shape& b) {
    const auto ka = static_cast<std::size_t>(a.kind());
    const auto kb = static_cast<std::size_t>(b.kind());
    return kPairTests[ka][kb](view_of(a), view_of(b));
}

bool rects_overlap(Rectangle a, Rectangle b) {
    return a.x <= b.x + b.width && b.x <= a.x + a.width &&
           a.y <= b.y + b.height && b.y <= a.y + a.height;
}

Rectangle rect_union(Rectangle a, Rectangle b) {
    const float left = std::min(a.x, b.x);
    const float top = std::min(a.y, b.y);
    const float right = std::max(a.x + a.width, b.x + b.width);
    const float bottom = std::max(a.y + a.height, b.y + b.height);
    return Rectangle{left, top, right - left, bottom - top};
}

} // namespace nodeflow::physics
