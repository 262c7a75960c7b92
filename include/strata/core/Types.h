#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace strata {

/// 2D coordinate in layout space.
/// Doubles throughout: output is compared against a reference layout bit-for-bit.
struct Point {
    double x = 0.0;
    double y = 0.0;

    constexpr Point() = default;
    constexpr Point(double x_, double y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(double s) const { return {x * s, y * s}; }
    constexpr Point operator/(double s) const { return {x / s, y / s}; }

    double length() const { return std::sqrt(x * x + y * y); }
    double distanceTo(const Point& o) const { return (*this - o).length(); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Size {
    double width = 0.0;
    double height = 0.0;

    constexpr Size() = default;
    constexpr Size(double w, double h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

/// Axis-aligned rectangle, (x, y) is the top-left corner.
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    constexpr Rect() = default;
    constexpr Rect(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    /// Layout labels store node centres; this builds the box around one.
    static constexpr Rect fromCenter(Point c, Size s) {
        return {c.x - s.width / 2, c.y - s.height / 2, s.width, s.height};
    }

    constexpr Point position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr double left() const { return x; }
    constexpr double top() const { return y; }
    constexpr double right() const { return x + width; }
    constexpr double bottom() const { return y + height; }

    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    Rect united(const Rect& other) const {
        double minX = std::min(x, other.x);
        double minY = std::min(y, other.y);
        double maxX = std::max(right(), other.right());
        double maxY = std::max(bottom(), other.bottom());
        return {minX, minY, maxX - minX, maxY - minY};
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

/// Ordered sequence of ranks, each an ordered sequence of node ids.
using Layering = std::vector<std::vector<std::string>>;

}  // namespace strata
