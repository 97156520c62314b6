#pragma once

#include "nodeflow/physics/shape.hpp"

#include <raylib.h>

namespace nodeflow::physics {

/// Exact test between two shapes, dispatched on (kind, kind).
bool shapes_collide(const Shape& a, const Shape& b);

/// Inclusive AABB overlap: touching edges count. Used by the broad phase.
bool rects_overlap(Rectangle a, Rectangle b);

Rectangle rect_union(Rectangle a, Rectangle b);

} // namespace nodeflow::physics
