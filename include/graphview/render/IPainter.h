#pragma once

#include "Shape.h"

namespace graphview {

/// Drawing backend for screen-space primitives
class IPainter {
public:
    virtual ~IPainter() = default;

    virtual void drawCircle(const Point& center, float radius, Color color, bool filled) = 0;
    virtual void drawLine(const Point& from, const Point& to, float width, Color color) = 0;
    virtual void drawQuadraticBezier(const Point& from, const Point& control, const Point& to,
                                     float width, Color color) = 0;
    virtual void drawCubicBezier(const Point& from, const Point& c1, const Point& c2,
                                 const Point& to, float width, Color color) = 0;
    virtual void drawText(const Point& anchor, const std::string& text, Color color) = 0;

    /// Dispatch a shape to the matching primitive
    void paint(const Shape& shape);
};

}  // namespace graphview
