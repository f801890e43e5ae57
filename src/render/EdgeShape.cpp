#include "graphview/render/EdgeShape.h"

namespace graphview {

EdgeGeometry DefaultEdgeShape::computeGeometry(const EdgeRenderInput& input, const ShapeContext& ctx) const {
    return geometry::computeEdgeGeometry(input.from, input.to, input.edge, input.siblingCount,
                                         ctx.viewport.zoom, ctx.directed);
}

std::vector<Shape> DefaultEdgeShape::produceShapes(const EdgeRenderInput& input,
                                                   const ShapeContext& ctx) const {
    std::vector<Shape> shapes;
    EdgeGeometry geom = computeGeometry(input, ctx);
    if (!geom.isValid()) {
        return shapes;
    }

    Color color = input.edge.selected ? Colors::EDGE_SELECTED : Colors::EDGE;

    switch (geom.kind) {
        case CurveKind::Line:
            shapes.push_back(Shape::line(geom.start, geom.end, geom.width, color));
            break;
        case CurveKind::Quadratic:
            shapes.push_back(Shape::quadratic(geom.start, geom.control1, geom.end, geom.width, color));
            break;
        case CurveKind::SelfLoop:
            shapes.push_back(Shape::cubic(geom.start, geom.control1, geom.control2, geom.end,
                                          geom.width, color));
            break;
        case CurveKind::None:
            break;
    }

    if (geom.hasArrow) {
        shapes.push_back(Shape::line(geom.arrowTip, geom.arrowLeft, geom.width, color));
        shapes.push_back(Shape::line(geom.arrowTip, geom.arrowRight, geom.width, color));
    }

    bool showLabel = ctx.style.labelsAlways || input.edge.selected;
    if (showLabel && !input.edge.label.empty()) {
        shapes.push_back(Shape::label(geom.pointAt(0.5f), input.edge.label, Colors::LABEL));
    }
    return shapes;
}

bool DefaultEdgeShape::containsPoint(const EdgeRenderInput& input, const Point& screenPoint,
                                     const ShapeContext& ctx) const {
    EdgeGeometry geom = computeGeometry(input, ctx);
    if (!geom.isValid()) {
        return false;
    }
    return geom.distanceTo(screenPoint) <= geom.width / 2.0f + hitTolerance_;
}

}  // namespace graphview
