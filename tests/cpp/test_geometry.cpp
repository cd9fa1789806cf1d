#include <gtest/gtest.h>

#include <cmath>

#include "InputState.hpp"
#include "geometry/AffineTransform.hpp"
#include "geometry/Geometry.hpp"
#include "geometry/Range.hpp"

using namespace vellum;

namespace {

constexpr float kEps = 1e-5f;

void expect_point_near(Point actual, Point expected, float eps = kEps) {
    EXPECT_NEAR(actual.x, expected.x, eps);
    EXPECT_NEAR(actual.y, expected.y, eps);
}

}  // namespace

TEST(RangeTest, ReversedLimitsAreSwapped) {
    Range r(5.0f, -5.0f);
    EXPECT_FLOAT_EQ(r.lower(), -5.0f);
    EXPECT_FLOAT_EQ(r.upper(), 5.0f);
}

TEST(RangeTest, ClampRespectsOpenSides) {
    EXPECT_FLOAT_EQ(Range::lower_only(2.0f).clamp(-10.0f), 2.0f);
    EXPECT_FLOAT_EQ(Range::lower_only(2.0f).clamp(1e9f), 1e9f);
    EXPECT_FLOAT_EQ(Range::upper_only(2.0f).clamp(10.0f), 2.0f);
    EXPECT_FLOAT_EQ(Range::no_limits().clamp(-123.0f), -123.0f);
    EXPECT_FLOAT_EQ(Range::constant(3.0f).clamp(-1.0f), 3.0f);
}

TEST(RangeTest, WithVarianceIsSymmetric) {
    Range r = Range::with_variance(10.0f, -2.0f);
    EXPECT_FLOAT_EQ(r.lower(), 8.0f);
    EXPECT_FLOAT_EQ(r.upper(), 12.0f);
    EXPECT_TRUE(r.contains(12.0f));
    EXPECT_FALSE(r.contains(12.5f));
}

TEST(GeometryTest, NormalizedZeroStaysZero) {
    EXPECT_EQ(normalized(Vec2{}), Vec2{});
    expect_point_near(normalized(Vec2{3.0f, 4.0f}), {0.6f, 0.8f});
}

TEST(GeometryTest, RectHandlesNegativeSize) {
    Rect r{{10.0f, 10.0f}, {-4.0f, -6.0f}};
    EXPECT_FLOAT_EQ(r.min_x(), 6.0f);
    EXPECT_FLOAT_EQ(r.max_y(), 10.0f);
    EXPECT_TRUE(r.contains({8.0f, 5.0f}));
}

TEST(GeometryTest, RectUnionCoversBoth) {
    Rect a{{0.0f, 0.0f}, {1.0f, 1.0f}};
    Rect b{{2.0f, -1.0f}, {1.0f, 1.0f}};
    Rect u = a.united(b);
    EXPECT_EQ(u, (Rect{{0.0f, -1.0f}, {3.0f, 2.0f}}));
    EXPECT_FALSE(a.intersects(b));
    EXPECT_TRUE(u.intersects(a));
}

TEST(AffineTransformTest, TrsAppliesScaleThenRotationThenTranslation) {
    auto m = AffineTransform::trs({10.0f, 0.0f}, kPi / 2.0f, {2.0f, 1.0f});
    // (1, 0) -> scaled (2, 0) -> rotated (0, 2) -> translated (10, 2)
    expect_point_near(m.apply({1.0f, 0.0f}), {10.0f, 2.0f});
}

TEST(AffineTransformTest, ConcatenationMatchesSequentialApplication) {
    auto parent = AffineTransform::trs({5.0f, 5.0f}, 0.3f, {2.0f, 2.0f});
    auto child = AffineTransform::trs({1.0f, -1.0f}, -0.7f, {0.5f, 1.5f});
    Point p{0.25f, 4.0f};
    expect_point_near(parent.concatenated(child).apply(p), parent.apply(child.apply(p)), 1e-4f);
}

TEST(AffineTransformTest, InverseUndoes) {
    auto m = AffineTransform::trs({3.0f, -2.0f}, 1.1f, {2.0f, 0.5f});
    Point p{7.0f, 9.0f};
    expect_point_near(m.inverted().apply(m.apply(p)), p, 1e-4f);
    EXPECT_EQ(AffineTransform::scale(0.0f, 1.0f).inverted(), AffineTransform::identity());
}

TEST(InputStateTest, DirectionIsUnitLengthAndUpIsPositive) {
    InputState input;
    input.up = true;
    input.right = true;
    Vec2 dir = input.direction();
    EXPECT_NEAR(length(dir), 1.0f, kEps);
    EXPECT_GT(dir.y, 0.0f);

    input.left = true;
    expect_point_near(input.direction(), {0.0f, 1.0f});
}

TEST(InputStateTest, EdgeDetection) {
    InputState input;
    input.pointer_down = true;
    input.update_edge_detection(false);
    EXPECT_TRUE(input.pointer_just_pressed);
    EXPECT_FALSE(input.pointer_just_released);

    input.update_edge_detection(true);
    EXPECT_FALSE(input.pointer_just_pressed);

    input.pointer_down = false;
    input.update_edge_detection(true);
    EXPECT_TRUE(input.pointer_just_released);
    EXPECT_FALSE(input.has_any_input());
}
