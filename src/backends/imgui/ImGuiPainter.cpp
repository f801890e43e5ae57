#include "graphview/backends/imgui/ImGuiPainter.h"

namespace graphview {

void ImGuiPainter::drawCircle(const Point& center, float radius, Color color, bool filled) {
    if (filled) {
        drawList_->AddCircleFilled(toImVec(center), radius, toImColor(color));
    } else {
        drawList_->AddCircle(toImVec(center), radius, toImColor(color));
    }
}

void ImGuiPainter::drawLine(const Point& from, const Point& to, float width, Color color) {
    drawList_->AddLine(toImVec(from), toImVec(to), toImColor(color), width);
}

void ImGuiPainter::drawQuadraticBezier(const Point& from, const Point& control, const Point& to,
                                       float width, Color color) {
    drawList_->AddBezierQuadratic(toImVec(from), toImVec(control), toImVec(to),
                                  toImColor(color), width);
}

void ImGuiPainter::drawCubicBezier(const Point& from, const Point& c1, const Point& c2,
                                   const Point& to, float width, Color color) {
    drawList_->AddBezierCubic(toImVec(from), toImVec(c1), toImVec(c2), toImVec(to),
                              toImColor(color), width);
}

void ImGuiPainter::drawText(const Point& anchor, const std::string& text, Color color) {
    drawList_->AddText(toImVec(anchor), toImColor(color), text.c_str());
}

}  // namespace graphview
