#pragma once

#include <cmath>
#include <string>

namespace sankeyedit {

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }

    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Node override, relative to the node's last computed base position
struct Offset {
    float dx = 0.0f;
    float dy = 0.0f;

    constexpr Offset() = default;
    constexpr Offset(float dx_, float dy_) : dx(dx_), dy(dy_) {}

    constexpr Offset operator+(const Offset& o) const { return {dx + o.dx, dy + o.dy}; }

    constexpr bool operator==(const Offset& o) const { return dx == o.dx && dy == o.dy; }
    constexpr bool operator!=(const Offset& o) const { return !(*this == o); }
};

constexpr Point operator+(const Point& p, const Offset& o) { return {p.x + o.dx, p.y + o.dy}; }

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

/// Draggable element categories
enum class ElementKind {
    Node,
    Label
};

inline const char* toString(ElementKind kind) {
    switch (kind) {
        case ElementKind::Node: return "node";
        case ElementKind::Label: return "label";
    }
    return "node";
}

/// Position emitted by the automatic layout pass; never persisted
struct BasePosition {
    std::string id;
    float x = 0.0f;
    float y = 0.0f;
    ElementKind kind = ElementKind::Node;

    constexpr Point point() const { return {x, y}; }
};

inline bool isFinite(float v) { return std::isfinite(v); }

}  // namespace sankeyedit
