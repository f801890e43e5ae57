#include "graphview/backends/imgui/ImGuiInput.h"

#include <imgui.h>

namespace graphview {

FrameInput ImGuiInput::capture() {
    const ImGuiIO& io = ImGui::GetIO();
    FrameInput input;

    ImVec2 min = ImGui::GetItemRectMin();
    ImVec2 size = ImGui::GetItemRectSize();
    input.canvasRect = Rect(min.x, min.y, size.x, size.y);

    bool hovered = ImGui::IsItemHovered();
    bool active = ImGui::IsItemActive();
    if (hovered || active) {
        input.pointerPos = Point{io.MousePos.x, io.MousePos.y};
    }

    bool dragging = active && ImGui::IsMouseDragging(ImGuiMouseButton_Left);
    input.dragging = dragging;
    input.dragStarted = dragging && !dragging_;
    input.dragReleased = dragging_ && !dragging;
    if (dragging) {
        input.dragDelta = {io.MouseDelta.x, io.MouseDelta.y};
    }

    // The drag threshold has already moved the pointer; hit-test where the press happened
    if (input.dragStarted) {
        const ImVec2& pressed = io.MouseClickedPos[ImGuiMouseButton_Left];
        input.pointerPos = Point{pressed.x, pressed.y};
    }

    // A release that ends a drag is not a click
    bool released = ImGui::IsMouseReleased(ImGuiMouseButton_Left);
    input.clicked = hovered && !dragging_ && released;
    input.doubleClicked = hovered && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left);
    clickFilter_.apply(input, released);

    if (hovered && io.MouseWheel != 0.0f) {
        input.zoomDelta = 1.0f + io.MouseWheel * wheelZoomStep_;
    }

    dragging_ = dragging;
    return input;
}

}  // namespace graphview
