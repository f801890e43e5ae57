#pragma once

#include "graphview/core/Graph.h"

#include <vector>

namespace graphview {

enum class CurveKind {
    None,        ///< Degenerate, nothing to draw
    Line,
    Quadratic,   ///< Parallel edge bowed away from its siblings
    SelfLoop     ///< Closed cubic through the node center
};

/// Screen-space layout of one edge
struct EdgeGeometry {
    CurveKind kind = CurveKind::None;

    Point start;
    Point control1;   ///< Quadratic control, or first cubic control
    Point control2;   ///< Second cubic control (self-loops)
    Point end;        ///< Where the body stops; the arrow base for directed edges

    bool hasArrow = false;
    Point arrowTip;   ///< On the target boundary
    Point arrowLeft;
    Point arrowRight;

    float width = 0.0f;

    bool isValid() const { return kind != CurveKind::None; }

    /// Point on the body at t in [0, 1]
    Point pointAt(float t) const;

    /// Body flattened to segments + 1 points
    std::vector<Point> polyline(int segments = 16) const;

    /// Shortest distance from p to the body or the arrowhead
    float distanceTo(const Point& p) const;
};

namespace geometry {

Point quadraticPoint(const Point& p0, const Point& p1, const Point& p2, float t);
Point cubicPoint(const Point& p0, const Point& p1, const Point& p2, const Point& p3, float t);

float pointToSegmentDistance(const Point& p, const Point& a, const Point& b);

/// Lay out an edge between two nodes whose screen location and radius
/// are current.
/// @param siblingCount Edges sharing the unordered endpoint pair (including this one)
/// @param zoom Scale for width, curve size and tip size
/// @param directed Arrowheads are drawn only for directed graphs
EdgeGeometry computeEdgeGeometry(
    const NodeData& from,
    const NodeData& to,
    const EdgeData& edge,
    size_t siblingCount,
    float zoom,
    bool directed);

}  // namespace geometry

}  // namespace graphview
