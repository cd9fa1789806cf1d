#ifndef VELLUM_GEOMETRY_HPP
#define VELLUM_GEOMETRY_HPP

#include <algorithm>
#include <cmath>

namespace vellum {

constexpr float kPi = 3.14159265358979323846f;

inline float degrees_to_radians(float degrees) { return degrees * kPi / 180.0f; }

// -----------------------------------------------------------------------------
// Vec2: used both as a point in a coordinate space and as a displacement.
// -----------------------------------------------------------------------------
struct Vec2 {
    float x{0.0f};
    float y{0.0f};

    bool operator==(const Vec2&) const = default;
};

using Point = Vec2;
using Vector2 = Vec2;

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator-(Vec2 v) { return {-v.x, -v.y}; }
inline Vec2 operator*(Vec2 v, float s) { return {v.x * s, v.y * s}; }
inline Vec2 operator*(float s, Vec2 v) { return {v.x * s, v.y * s}; }
inline Vec2 operator/(Vec2 v, float s) { return {v.x / s, v.y / s}; }

inline Vec2& operator+=(Vec2& a, Vec2 b) {
    a.x += b.x;
    a.y += b.y;
    return a;
}

inline Vec2& operator-=(Vec2& a, Vec2 b) {
    a.x -= b.x;
    a.y -= b.y;
    return a;
}

inline float dot(Vec2 a, Vec2 b) { return a.x * b.x + a.y * b.y; }
inline float length(Vec2 v) { return std::sqrt(v.x * v.x + v.y * v.y); }
inline float distance(Point a, Point b) { return length(b - a); }

// Zero vector stays zero.
inline Vec2 normalized(Vec2 v) {
    float len = length(v);
    if (len <= 0.0f) return {};
    return v / len;
}

inline Vec2 lerp(Vec2 a, Vec2 b, float t) { return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t}; }

// Angle of the vector in radians, counter-clockwise from +x.
inline float angle_of(Vec2 v) { return std::atan2(v.y, v.x); }

struct Vec3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};

    bool operator==(const Vec3&) const = default;
};

struct Vec4 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
    float w{0.0f};

    bool operator==(const Vec4&) const = default;
};

struct Size {
    float width{0.0f};
    float height{0.0f};

    bool operator==(const Size&) const = default;
};

inline Size operator*(Size s, float k) { return {s.width * k, s.height * k}; }
inline Size scaled(Size s, Vec2 factor) { return {s.width * factor.x, s.height * factor.y}; }

// Axis-aligned rectangle, origin at the minimum corner.
struct Rect {
    Point origin{};
    Size size{};

    bool operator==(const Rect&) const = default;

    float min_x() const { return std::min(origin.x, origin.x + size.width); }
    float max_x() const { return std::max(origin.x, origin.x + size.width); }
    float min_y() const { return std::min(origin.y, origin.y + size.height); }
    float max_y() const { return std::max(origin.y, origin.y + size.height); }
    float mid_x() const { return origin.x + size.width * 0.5f; }
    float mid_y() const { return origin.y + size.height * 0.5f; }
    Point center() const { return {mid_x(), mid_y()}; }

    bool contains(Point p) const {
        return p.x >= min_x() && p.x <= max_x() && p.y >= min_y() && p.y <= max_y();
    }

    bool intersects(const Rect& other) const {
        return min_x() <= other.max_x() && other.min_x() <= max_x() && min_y() <= other.max_y() &&
               other.min_y() <= max_y();
    }

    Rect united(const Rect& other) const {
        float x0 = std::min(min_x(), other.min_x());
        float y0 = std::min(min_y(), other.min_y());
        float x1 = std::max(max_x(), other.max_x());
        float y1 = std::max(max_y(), other.max_y());
        return {{x0, y0}, {x1 - x0, y1 - y0}};
    }

    Rect inset(float dx, float dy) const {
        return {{origin.x + dx, origin.y + dy}, {size.width - 2.0f * dx, size.height - 2.0f * dy}};
    }

    // Unit rect (0,0,1,1): full texture / no nine-slice.
    static constexpr Rect unit() { return {{0.0f, 0.0f}, {1.0f, 1.0f}}; }
};

struct Color {
    float r{1.0f};
    float g{1.0f};
    float b{1.0f};
    float a{1.0f};

    bool operator==(const Color&) const = default;

    static constexpr Color white() { return {1.0f, 1.0f, 1.0f, 1.0f}; }
    static constexpr Color black() { return {0.0f, 0.0f, 0.0f, 1.0f}; }
    static constexpr Color clear() { return {0.0f, 0.0f, 0.0f, 0.0f}; }
};

inline Color lerp(const Color& a, const Color& b, float t) {
    return {a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t,
            a.a + (b.a - a.a) * t};
}

}  // namespace vellum

#endif  // VELLUM_GEOMETRY_HPP
