#pragma once

#include "graphview/config/Settings.h"
#include "graphview/core/Types.h"
#include "graphview/view/Viewport.h"

#include <cstdint>
#include <string>
#include <vector>

namespace graphview {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
        : r(r_), g(g_), b(b_), a(a_) {}

    constexpr bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }
};

/// Palette used by the default node and edge shapes
namespace Colors {
    // Node colors
    constexpr Color NODE = Color(140, 140, 140);
    constexpr Color NODE_SELECTED = Color(100, 180, 255);
    constexpr Color NODE_DRAGGED = Color(255, 180, 80);

    // Edge colors
    constexpr Color EDGE = Color(120, 120, 120);
    constexpr Color EDGE_SELECTED = Color(100, 180, 255);

    // Text
    constexpr Color LABEL = Color(220, 220, 220);
}

enum class ShapeKind {
    Circle,           ///< points[0] = center, radius
    Line,             ///< points[0..1]
    QuadraticBezier,  ///< points[0..2]: start, control, end
    CubicBezier,      ///< points[0..3]: start, control, control, end
    Text              ///< points[0] = anchor (top-left), text
};

/// Screen-space drawing primitive
struct Shape {
    ShapeKind kind = ShapeKind::Line;
    std::vector<Point> points;
    float radius = 0.0f;
    Color color;
    float strokeWidth = 1.0f;
    bool filled = false;
    std::string text;

    static Shape circle(Point center, float radius, Color color, bool filled = true);
    static Shape line(Point from, Point to, float width, Color color);
    static Shape quadratic(Point from, Point control, Point to, float width, Color color);
    static Shape cubic(Point from, Point c1, Point c2, Point to, float width, Color color);
    static Shape label(Point anchor, std::string text, Color color);
};

/// Everything a shape strategy may need besides the element itself
struct ShapeContext {
    const Viewport& viewport;
    const SettingsStyle& style;
    bool directed = true;
};

}  // namespace graphview
