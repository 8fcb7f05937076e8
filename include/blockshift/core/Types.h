#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace blockshift {

using NodeId = uint32_t;
using ConnectionId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr ConnectionId INVALID_CONNECTION = UINT32_MAX;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

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

    /// Rect of the given size centered on a point
    static constexpr Rect centeredOn(Point c, Size size) {
        return {c.x - size.width / 2, c.y - size.height / 2, size.width, size.height};
    }

    constexpr Point position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    Rect expanded(float padding) const {
        return {x - padding, y - padding, width + 2 * padding, height + 2 * padding};
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

/// Pan/zoom state of the editing surface, supplied by the host.
/// Maps canvas space to device space as: screen = canvas * scale + pan
struct Viewport {
    Point pan{0.0f, 0.0f};
    float scale = 1.0f;

    constexpr Viewport() = default;
    constexpr Viewport(Point p, float s) : pan(p), scale(s) {}

    /// A viewport is usable when scale is a positive finite number and pan is finite
    bool isValid() const {
        return std::isfinite(scale) && scale > 0.0f && pan.isFinite();
    }

    constexpr bool operator==(const Viewport& o) const {
        return pan == o.pan && scale == o.scale;
    }
    constexpr bool operator!=(const Viewport& o) const { return !(*this == o); }
};

}  // namespace blockshift
