#include "graphview/render/Shape.h"
#include "graphview/render/IPainter.h"
#include "graphview/common/Logger.h"

namespace graphview {

Shape Shape::circle(Point center, float radius, Color color, bool filled) {
    Shape s;
    s.kind = ShapeKind::Circle;
    s.points = {center};
    s.radius = radius;
    s.color = color;
    s.filled = filled;
    return s;
}

Shape Shape::line(Point from, Point to, float width, Color color) {
    Shape s;
    s.kind = ShapeKind::Line;
    s.points = {from, to};
    s.strokeWidth = width;
    s.color = color;
    return s;
}

Shape Shape::quadratic(Point from, Point control, Point to, float width, Color color) {
    Shape s;
    s.kind = ShapeKind::QuadraticBezier;
    s.points = {from, control, to};
    s.strokeWidth = width;
    s.color = color;
    return s;
}

Shape Shape::cubic(Point from, Point c1, Point c2, Point to, float width, Color color) {
    Shape s;
    s.kind = ShapeKind::CubicBezier;
    s.points = {from, c1, c2, to};
    s.strokeWidth = width;
    s.color = color;
    return s;
}

Shape Shape::label(Point anchor, std::string text, Color color) {
    Shape s;
    s.kind = ShapeKind::Text;
    s.points = {anchor};
    s.text = std::move(text);
    s.color = color;
    return s;
}

void IPainter::paint(const Shape& shape) {
    const auto& p = shape.points;
    switch (shape.kind) {
        case ShapeKind::Circle:
            if (p.size() >= 1) {
                drawCircle(p[0], shape.radius, shape.color, shape.filled);
                return;
            }
            break;
        case ShapeKind::Line:
            if (p.size() >= 2) {
                drawLine(p[0], p[1], shape.strokeWidth, shape.color);
                return;
            }
            break;
        case ShapeKind::QuadraticBezier:
            if (p.size() >= 3) {
                drawQuadraticBezier(p[0], p[1], p[2], shape.strokeWidth, shape.color);
                return;
            }
            break;
        case ShapeKind::CubicBezier:
            if (p.size() >= 4) {
                drawCubicBezier(p[0], p[1], p[2], p[3], shape.strokeWidth, shape.color);
                return;
            }
            break;
        case ShapeKind::Text:
            if (p.size() >= 1) {
                drawText(p[0], shape.text, shape.color);
                return;
            }
            break;
    }
    LOG_WARN("Skipping shape with {} points", p.size());
}

}  // namespace graphview
