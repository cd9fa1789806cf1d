#ifndef VELLUM_AFFINE_TRANSFORM_HPP
#define VELLUM_AFFINE_TRANSFORM_HPP

#include <cmath>

#include "geometry/Geometry.hpp"

namespace vellum {

/**
 * @brief 2x3 affine matrix using column vectors.
 *
 *   | a  c  tx |   | x |
 *   | b  d  ty | * | y |
 *                  | 1 |
 *
 * `concatenated(child)` yields `this * child`: the child is applied first.
 */
struct AffineTransform {
    float a{1.0f};
    float b{0.0f};
    float c{0.0f};
    float d{1.0f};
    float tx{0.0f};
    float ty{0.0f};

    bool operator==(const AffineTransform&) const = default;

    static constexpr AffineTransform identity() { return {}; }

    static constexpr AffineTransform translation(float x, float y) {
        return {1.0f, 0.0f, 0.0f, 1.0f, x, y};
    }

    static AffineTransform rotation(float radians) {
        float cs = std::cos(radians);
        float sn = std::sin(radians);
        return {cs, sn, -sn, cs, 0.0f, 0.0f};
    }

    static constexpr AffineTransform scale(float sx, float sy) {
        return {sx, 0.0f, 0.0f, sy, 0.0f, 0.0f};
    }

    // Translate * Rotate * Scale, the order a node's local transform is built in.
    static AffineTransform trs(Point position, float radians, Vec2 scale_factor) {
        float cs = std::cos(radians);
        float sn = std::sin(radians);
        return {cs * scale_factor.x,  sn * scale_factor.x, -sn * scale_factor.y,
                cs * scale_factor.y, position.x,          position.y};
    }

    AffineTransform concatenated(const AffineTransform& child) const {
        return {a * child.a + c * child.b,       b * child.a + d * child.b,
                a * child.c + c * child.d,       b * child.c + d * child.d,
                a * child.tx + c * child.ty + tx, b * child.tx + d * child.ty + ty};
    }

    Point apply(Point p) const { return {a * p.x + c * p.y + tx, b * p.x + d * p.y + ty}; }

    Vec2 apply_to_vector(Vec2 v) const { return {a * v.x + c * v.y, b * v.x + d * v.y}; }

    float determinant() const { return a * d - b * c; }

    // Singular matrices invert to identity.
    AffineTransform inverted() const {
        float det = determinant();
        if (det == 0.0f) return identity();
        float inv = 1.0f / det;
        return {d * inv,
                -b * inv,
                -c * inv,
                a * inv,
                (c * ty - d * tx) * inv,
                (b * tx - a * ty) * inv};
    }
};

}  // namespace vellum

#endif  // VELLUM_AFFINE_TRANSFORM_HPP
