#pragma once

#include "graphview/interaction/ClickFilter.h"
#include "graphview/interaction/FrameInput.h"

namespace graphview {

/// Builds a FrameInput from ImGui's IO state for the last submitted item.
///
/// Call capture() right after the item that covers the canvas, e.g.
/// @code
///   ImGui::InvisibleButton("graph", size);
///   FrameInput input = imguiInput.capture();
/// @endcode
/// One instance per canvas: drag start, release and the release closing a
/// double click are detected against earlier frames.
class ImGuiInput {
public:
    /// Scale gesture per wheel notch
    explicit ImGuiInput(float wheelZoomStep = 0.1f) : wheelZoomStep_(wheelZoomStep) {}

    FrameInput capture();

    bool isDragging() const { return dragging_; }

private:
    float wheelZoomStep_;
    bool dragging_ = false;
    ClickFilter clickFilter_;
};

}  // namespace graphview
