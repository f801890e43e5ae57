#include "graphview/render/EdgeGeometry.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace graphview {

namespace geometry {

Point quadraticPoint(const Point& p0, const Point& p1, const Point& p2, float t) {
    float u = 1.0f - t;
    return p0 * (u * u) + p1 * (2.0f * u * t) + p2 * (t * t);
}

Point cubicPoint(const Point& p0, const Point& p1, const Point& p2, const Point& p3, float t) {
    float u = 1.0f - t;
    return p0 * (u * u * u) + p1 * (3.0f * u * u * t) + p2 * (3.0f * u * t * t) + p3 * (t * t * t);
}

float pointToSegmentDistance(const Point& p, const Point& a, const Point& b) {
    Point ab = b - a;
    float lenSq = ab.lengthSquared();
    if (lenSq == 0.0f) {
        return p.distanceTo(a);
    }
    float t = std::clamp((p - a).dot(ab) / lenSq, 0.0f, 1.0f);
    return p.distanceTo(a + ab * t);
}

namespace {

void placeArrow(EdgeGeometry& geom, const Point& tip, const Point& dir,
                float tipSize, float tipAngle) {
    geom.hasArrow = true;
    geom.arrowTip = tip;
    geom.arrowLeft = tip - dir.rotated(tipAngle) * tipSize;
    geom.arrowRight = tip - dir.rotated(-tipAngle) * tipSize;
}

EdgeGeometry selfLoop(const NodeData& node, const EdgeData& edge, float zoom) {
    EdgeGeometry geom;
    Point center = node.screenLocation;
    float size = node.screenRadius * (4.0f + static_cast<float>(edge.order));
    if (!center.isFinite() || !std::isfinite(size) || size <= 0.0f) {
        return geom;
    }

    geom.kind = CurveKind::SelfLoop;
    geom.start = center;
    geom.control1 = center + Point{size, -size};
    geom.control2 = center + Point{-size, -size};
    geom.end = center;
    geom.width = edge.width * zoom;
    return geom;
}

}  // namespace

EdgeGeometry computeEdgeGeometry(
    const NodeData& from,
    const NodeData& to,
    const EdgeData& edge,
    size_t siblingCount,
    float zoom,
    bool directed) {

    if (edge.isSelfLoop()) {
        return selfLoop(from, edge, zoom);
    }

    EdgeGeometry geom;
    Point src = from.screenLocation;
    Point dst = to.screenLocation;
    Point delta = dst - src;
    float length = delta.length();
    if (!src.isFinite() || !dst.isFinite() || !std::isfinite(length) || length == 0.0f) {
        return geom;
    }

    Point dir = delta / length;
    float tipSize = edge.tipSize * zoom;

    geom.width = edge.width * zoom;
    geom.start = src + dir * from.screenRadius;
    Point tip = dst - dir * to.screenRadius;

    if (siblingCount <= 1) {
        geom.kind = CurveKind::Line;
        if (directed) {
            geom.end = tip - dir * tipSize;
            placeArrow(geom, tip, dir, tipSize, edge.tipAngle);
        } else {
            geom.end = tip;
        }
        return geom;
    }

    // Each rank bows one curve size further out than the previous one
    Point mid = (geom.start + tip) / 2.0f;
    float offset = edge.curveSize * zoom * static_cast<float>(edge.order + 1);
    geom.kind = CurveKind::Quadratic;
    geom.control1 = mid + dir.perpendicular() * offset;

    if (directed) {
        Point tangent = (tip - geom.control1).normalized();
        if (tangent.isZero()) {
            tangent = dir;
        }
        geom.end = tip - tangent * tipSize;
        placeArrow(geom, tip, tangent, tipSize, edge.tipAngle);
    } else {
        geom.end = tip;
    }
    return geom;
}

}  // namespace geometry

Point EdgeGeometry::pointAt(float t) const {
    switch (kind) {
        case CurveKind::Line:
            return start + (end - start) * t;
        case CurveKind::Quadratic:
            return geometry::quadraticPoint(start, control1, end, t);
        case CurveKind::SelfLoop:
            return geometry::cubicPoint(start, control1, control2, end, t);
        case CurveKind::None:
            break;
    }
    return start;
}

std::vector<Point> EdgeGeometry::polyline(int segments) const {
    std::vector<Point> points;
    if (!isValid()) {
        return points;
    }
    if (kind == CurveKind::Line) {
        return {start, end};
    }

    segments = std::max(segments, 1);
    points.reserve(static_cast<size_t>(segments) + 1);
    for (int i = 0; i <= segments; ++i) {
        points.push_back(pointAt(static_cast<float>(i) / static_cast<float>(segments)));
    }
    return points;
}

float EdgeGeometry::distanceTo(const Point& p) const {
    float best = std::numeric_limits<float>::max();
    auto points = polyline();
    for (size_t i = 1; i < points.size(); ++i) {
        best = std::min(best, geometry::pointToSegmentDistance(p, points[i - 1], points[i]));
    }
    if (hasArrow) {
        best = std::min(best, geometry::pointToSegmentDistance(p, end, arrowTip));
        best = std::min(best, geometry::pointToSegmentDistance(p, arrowLeft, arrowTip));
        best = std::min(best, geometry::pointToSegmentDistance(p, arrowRight, arrowTip));
    }
    return best;
}

}  // namespace graphview
