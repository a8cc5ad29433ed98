#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace nodeweave {

using NodeId = uint32_t;
using EdgeId = uint32_t;
using TagId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr EdgeId INVALID_EDGE = UINT32_MAX;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }
    constexpr Point operator-() const { return {-x, -y}; }

    Point& operator+=(const Point& o) { x += o.x; y += o.y; return *this; }
    Point& operator-=(const Point& o) { x -= o.x; y -= o.y; return *this; }
    Point& operator*=(float s) { x *= s; y *= s; return *this; }

    constexpr float lengthSquared() const { return x * x + y * y; }
    float length() const { return std::sqrt(lengthSquared()); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    Point normalized() const {
        float len = length();
        return len > 0.0f ? *this / len : Point{0.0f, 0.0f};
    }

    bool isFinite() const { return std::isfinite(x) && std::isfinite(y); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

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

/// Axis-aligned rectangle stored as a min/max corner pair.
/// Y grows downward, so min is the top-left corner.
struct Rect {
    Point min;
    Point max;

    constexpr Rect() = default;
    constexpr Rect(Point minCorner, Point maxCorner) : min(minCorner), max(maxCorner) {}
    constexpr Rect(float minX, float minY, float maxX, float maxY)
        : min(minX, minY), max(maxX, maxY) {}

    static constexpr Rect fromMinMax(Point minCorner, Point maxCorner) {
        return {minCorner, maxCorner};
    }

    static constexpr Rect fromCenterSize(Point center, Size size) {
        return {Point{center.x - size.width / 2, center.y - size.height / 2},
                Point{center.x + size.width / 2, center.y + size.height / 2}};
    }

    /// Inverted rectangle that any extend() call replaces.
    static constexpr Rect nothing() {
        return {Point{std::numeric_limits<float>::max(), std::numeric_limits<float>::max()},
                Point{std::numeric_limits<float>::lowest(), std::numeric_limits<float>::lowest()}};
    }

    constexpr float left() const { return min.x; }
    constexpr float right() const { return max.x; }
    constexpr float top() const { return min.y; }
    constexpr float bottom() const { return max.y; }
    constexpr float width() const { return max.x - min.x; }
    constexpr float height() const { return max.y - min.y; }
    constexpr Size size() const { return {width(), height()}; }
    constexpr Point center() const { return {(min.x + max.x) / 2, (min.y + max.y) / 2}; }

    constexpr bool isValid() const { return min.x <= max.x && min.y <= max.y; }

    constexpr bool contains(const Point& p) const {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }

    /// Inclusive: touching rectangles intersect.
    constexpr bool intersects(const Rect& o) const {
        return min.x <= o.max.x && o.min.x <= max.x && min.y <= o.max.y && o.min.y <= max.y;
    }

    /// Strict overlap of interiors.
    constexpr bool overlaps(const Rect& o) const {
        return min.x < o.max.x && o.min.x < max.x && min.y < o.max.y && o.min.y < max.y;
    }

    Rect intersection(const Rect& o) const {
        return {Point{std::max(min.x, o.min.x), std::max(min.y, o.min.y)},
                Point{std::min(max.x, o.max.x), std::min(max.y, o.max.y)}};
    }

    Rect united(const Rect& o) const {
        return {Point{std::min(min.x, o.min.x), std::min(min.y, o.min.y)},
                Point{std::max(max.x, o.max.x), std::max(max.y, o.max.y)}};
    }

    void extend(const Point& p) {
        min.x = std::min(min.x, p.x);
        min.y = std::min(min.y, p.y);
        max.x = std::max(max.x, p.x);
        max.y = std::max(max.y, p.y);
    }

    constexpr Rect expanded(float padding) const {
        return {Point{min.x - padding, min.y - padding}, Point{max.x + padding, max.y + padding}};
    }

    constexpr Rect translated(const Point& delta) const {
        return {min + delta, max + delta};
    }

    constexpr bool operator==(const Rect& o) const { return min == o.min && max == o.max; }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

}  // namespace nodeweave
