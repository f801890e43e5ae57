#pragma once

#include "graphview/render/IPainter.h"

#include <imgui.h>

namespace graphview {

/// Paints shapes into an ImGui draw list
class ImGuiPainter : public IPainter {
public:
    explicit ImGuiPainter(ImDrawList* drawList) : drawList_(drawList) {}

    void drawCircle(const Point& center, float radius, Color color, bool filled) override;
    void drawLine(const Point& from, const Point& to, float width, Color color) override;
    void drawQuadraticBezier(const Point& from, const Point& control, const Point& to,
                             float width, Color color) override;
    void drawCubicBezier(const Point& from, const Point& c1, const Point& c2,
                         const Point& to, float width, Color color) override;
    void drawText(const Point& anchor, const std::string& text, Color color) override;

    static ImU32 toImColor(Color color) {
        return IM_COL32(color.r, color.g, color.b, color.a);
    }

    static ImVec2 toImVec(const Point& p) { return {p.x, p.y}; }

private:
    ImDrawList* drawList_;
};

}  // namespace graphview
