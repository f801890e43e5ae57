#pragma once

#include "graphview/core/Types.h"

namespace graphview {

/// Diagonal used by fitToScreen when the graph has no extent (0 or 1 node)
constexpr Point DEFAULT_FIT_DIAGONAL{1.0f, 100.0f};

/// Pan/zoom state of one drawing surface.
///
/// Screen coordinates are absolute surface coordinates, so canvasRect may
/// have a non-zero origin. Zoom is always > 0.
struct Viewport {
    float zoom = 1.0f;
    Point pan = {0, 0};        ///< Screen-space offset of the canvas origin
    Rect canvasRect;           ///< Draw area of the current frame
    bool firstFrame = true;

    Point screenToCanvas(const Point& screen) const {
        return (screen - pan) / zoom;
    }

    Point canvasToScreen(const Point& canvas) const {
        return canvas * zoom + pan;
    }

    float canvasToScreen(float length) const {
        return length * zoom;
    }

    /// Scale by (1 + delta) keeping the canvas point under anchor fixed on screen.
    /// Returns false and changes nothing if the resulting zoom would not be
    /// a finite positive number.
    bool zoomAt(float delta, const Point& anchor);

    /// Choose zoom and pan so bounds, enlarged by padding, fill canvas.
    /// Does not touch firstFrame.
    void fitToScreen(const Bounds& bounds, const Rect& canvas, float padding);

    /// Back to zoom 1, pan 0, first frame pending
    void reset();

    bool operator==(const Viewport& o) const {
        return zoom == o.zoom && pan == o.pan && canvasRect == o.canvasRect &&
               firstFrame == o.firstFrame;
    }
    bool operator!=(const Viewport& o) const { return !(*this == o); }
};

}  // namespace graphview
