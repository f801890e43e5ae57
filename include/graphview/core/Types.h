#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace graphview {

using NodeId = uint32_t;
using EdgeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr EdgeId INVALID_EDGE = UINT32_MAX;

/// 2D point or vector. Used for canvas and screen coordinates alike.
struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator-() const { return {-x, -y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    constexpr Point& operator+=(const Point& o) { x += o.x; y += o.y; return *this; }
    constexpr Point& operator-=(const Point& o) { x -= o.x; y -= o.y; return *this; }

    constexpr float dot(const Point& o) const { return x * o.x + y * o.y; }
    float length() const { return std::sqrt(x * x + y * y); }
    constexpr float lengthSquared() const { return x * x + y * y; }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    Point normalized() const {
        float len = length();
        return len > 0.0f ? *this / len : Point{0.0f, 0.0f};
    }

    /// Counter-clockwise perpendicular (in a y-down screen this points "left")
    constexpr Point perpendicular() const { return {-y, x}; }

    Point rotated(float radians) const {
        float c = std::cos(radians);
        float s = std::sin(radians);
        return {x * c - y * s, x * s + y * c};
    }

    bool isFinite() const { return std::isfinite(x) && std::isfinite(y); }
    constexpr bool isZero() const { return x == 0.0f && y == 0.0f; }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

constexpr Point operator*(float s, const Point& p) { return p * s; }

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

/// Axis-aligned rectangle given by its top-left corner and size
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    constexpr Point position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    constexpr bool isEmpty() const { return width <= 0.0f || height <= 0.0f; }

    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

/// Min/max box accumulated over points. Starts inverted so the first
/// include() sets both corners.
struct Bounds {
    Point min{std::numeric_limits<float>::max(), std::numeric_limits<float>::max()};
    Point max{std::numeric_limits<float>::lowest(), std::numeric_limits<float>::lowest()};

    constexpr Bounds() = default;
    constexpr Bounds(Point mn, Point mx) : min(mn), max(mx) {}

    constexpr bool isValid() const { return min.x <= max.x && min.y <= max.y; }

    void include(const Point& p) {
        min.x = std::min(min.x, p.x);
        min.y = std::min(min.y, p.y);
        max.x = std::max(max.x, p.x);
        max.y = std::max(max.y, p.y);
    }

    constexpr Point diagonal() const { return max - min; }
    constexpr Point center() const { return (min + max) / 2.0f; }

    constexpr bool operator==(const Bounds& o) const { return min == o.min && max == o.max; }
    constexpr bool operator!=(const Bounds& o) const { return !(*this == o); }
};

}  // namespace graphview
