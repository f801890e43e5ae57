#pragma once

#include "graphview/core/Types.h"

#include <optional>

namespace graphview {

/// Pointer state of one frame, filled by the hosting toolkit
struct FrameInput {
    Rect canvasRect;                    ///< Area allocated to the graph this frame
    std::optional<Point> pointerPos;    ///< Absent when the pointer is outside

    bool dragStarted = false;           ///< Primary button went down and started a drag
    bool dragging = false;              ///< Drag in progress (including the start frame)
    Point dragDelta;                    ///< Pointer movement since last frame while dragging
    bool dragReleased = false;

    bool clicked = false;
    bool doubleClicked = false;

    /// Relative scale gesture (pinch or ctrl+wheel); 1 means no zoom
    float zoomDelta = 1.0f;
};

}  // namespace graphview
