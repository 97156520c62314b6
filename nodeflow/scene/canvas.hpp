#pragma once

#include <raylib.h>

namespace nodeflow::scene {

// ============================================================================
// ICanvas - rendering collaborator used by the draw pass
// ============================================================================
//
// The engine shell implements this on top of raylib; tests use a recording
// canvas. Coordinates are world pixels; implementations add offset() to
// everything they draw (canvas layers set it during the draw pass).

class ICanvas {
public:
    virtual ~ICanvas() = default;

    /// Visible area, used by visibility notifiers.
    virtual Rectangle viewport() const = 0;

    virtual void draw_rect_lines(Rectangle rect, Color color) = 0;
    virtual void draw_circle_lines(Vector2 center, float radius, Color color) = 0;

    /// Cross marker at a node origin.
    virtual void draw_gizmo(Vector2 at, float extent, Color color) = 0;

    Vector2 offset() const { return offset_; }
    void set_offset(Vector2 offset) { offset_ = offset; }

protected:
    Vector2 offset_{0.0f, 0.0f};
};

} // namespace nodeflow::scene
