#include <gtest/gtest.h>

#include <cmath>

#include "constraints/Constraint.hpp"
#include "scene/Scene.hpp"

using namespace vellum;

namespace {

constexpr float kEps = 1e-4f;

class ConstraintTest : public ::testing::Test {
   protected:
    Scene scene;

    NodeId add_node(NodeId parent, Point position) {
        NodeId node = scene.create_node();
        scene.add_child(parent, node);
        scene.transform(node).position = position;
        return node;
    }
};

}  // namespace

TEST_F(ConstraintTest, PositionRangesClampEachAxis) {
    NodeId node = add_node(scene.root(), {50.0f, -50.0f});
    scene.add_constraint(node, Constraint::position_x(Range(0.0f, 10.0f)));
    scene.add_constraint(node, Constraint::position_y(Range::lower_only(-5.0f)));

    scene.apply_constraints();
    EXPECT_FLOAT_EQ(scene.transform(node).position.x, 10.0f);
    EXPECT_FLOAT_EQ(scene.transform(node).position.y, -5.0f);

    // Already satisfied: a second pass changes nothing.
    scene.apply_constraints();
    EXPECT_FLOAT_EQ(scene.transform(node).position.x, 10.0f);
    EXPECT_FLOAT_EQ(scene.transform(node).position.y, -5.0f);
}

TEST_F(ConstraintTest, PositionInRectClampsIntoRect) {
    NodeId node = add_node(scene.root(), {-3.0f, 40.0f});
    scene.add_constraint(node, Constraint::position_in_rect(Rect{{0.0f, 0.0f}, {20.0f, 30.0f}}));

    scene.apply_constraints();
    EXPECT_EQ(scene.transform(node).position, (Point{0.0f, 30.0f}));
}

TEST_F(ConstraintTest, RotationClamp) {
    NodeId node = add_node(scene.root(), {});
    scene.transform(node).rotation = 3.0f;
    scene.add_constraint(node, Constraint::rotation_degrees(Range(-90.0f, 90.0f)));

    scene.apply_constraints();
    EXPECT_NEAR(scene.transform(node).rotation, kPi / 2.0f, kEps);
}

TEST_F(ConstraintTest, DistanceIsMeasuredInWorldSpace) {
    NodeId target = add_node(scene.root(), {0.0f, 0.0f});
    NodeId parent = add_node(scene.root(), {100.0f, 0.0f});
    NodeId node = add_node(parent, {10.0f, 0.0f});
    scene.add_constraint(node, Constraint::distance(Range(0.0f, 60.0f), target));

    scene.apply_constraints();
    EXPECT_NEAR(scene.world_position(node).x, 60.0f, kEps);
    EXPECT_NEAR(scene.world_position(node).y, 0.0f, kEps);
    EXPECT_NEAR(scene.transform(node).position.x, -40.0f, kEps);
}

TEST_F(ConstraintTest, DistancePushesOutToMinimum) {
    NodeId target = add_node(scene.root(), {10.0f, 10.0f});
    NodeId node = add_node(scene.root(), {10.0f, 12.0f});
    scene.add_constraint(node, Constraint::distance(Range::lower_only(5.0f), target));

    scene.apply_constraints();
    EXPECT_NEAR(scene.transform(node).position.x, 10.0f, kEps);
    EXPECT_NEAR(scene.transform(node).position.y, 15.0f, kEps);
}

TEST_F(ConstraintTest, DistanceWithCoincidentNodesDoesNothing) {
    NodeId target = add_node(scene.root(), {4.0f, 4.0f});
    NodeId node = add_node(scene.root(), {4.0f, 4.0f});
    scene.add_constraint(node, Constraint::distance(Range(10.0f, 20.0f), target));

    scene.apply_constraints();
    EXPECT_EQ(scene.transform(node).position, (Point{4.0f, 4.0f}));
}

TEST_F(ConstraintTest, DestroyedTargetMakesConstraintInert) {
    NodeId target = add_node(scene.root(), {0.0f, 0.0f});
    NodeId node = add_node(scene.root(), {100.0f, 0.0f});
    scene.add_constraint(node, Constraint::distance(Range(0.0f, 10.0f), target));
    scene.add_constraint(node, Constraint::orient_to_node(target));
    scene.transform(node).rotation = 0.5f;

    scene.destroy_node(target);
    EXPECT_FALSE(scene.contains(target));

    scene.apply_constraints();
    EXPECT_EQ(scene.transform(node).position, (Point{100.0f, 0.0f}));
    EXPECT_FLOAT_EQ(scene.transform(node).rotation, 0.5f);

    // A fresh node must not be mistaken for the destroyed one.
    NodeId other = add_node(scene.root(), {0.0f, 0.0f});
    EXPECT_NE(other, target);
    scene.apply_constraints();
    EXPECT_EQ(scene.transform(node).position, (Point{100.0f, 0.0f}));
}

TEST_F(ConstraintTest, RecycledSlotNeverRevivesDestroyedTarget) {
    NodeId target = add_node(scene.root(), {0.0f, 0.0f});
    NodeId node = add_node(scene.root(), {100.0f, 0.0f});
    scene.add_constraint(node, Constraint::distance(Range(0.0f, 10.0f), target));
    scene.destroy_node(target);

    // The freed slot is handed out again on every create; churn it past the
    // point where a 12-bit version would have wrapped.
    for (int i = 0; i < 5000; ++i) {
        NodeId spawned = add_node(scene.root(), {0.0f, 0.0f});
        ASSERT_NE(spawned, target);
        ASSERT_FALSE(scene.contains(target));
        scene.destroy_node(spawned);
    }

    NodeId last = add_node(scene.root(), {0.0f, 0.0f});
    EXPECT_NE(last, target);
    scene.apply_constraints();
    EXPECT_EQ(scene.transform(node).position, (Point{100.0f, 0.0f}));
}

TEST_F(ConstraintTest, OrientToPointWithOffset) {
    NodeId node = add_node(scene.root(), {0.0f, 0.0f});
    scene.add_constraint(node, Constraint::orient_to_point({0.0f, -5.0f}, 0.25f));

    scene.apply_constraints();
    EXPECT_NEAR(scene.transform(node).rotation, -kPi / 2.0f + 0.25f, kEps);
}

TEST_F(ConstraintTest, OrientWritesWorldBearingIntoLocalRotation) {
    NodeId parent = add_node(scene.root(), {0.0f, 0.0f});
    scene.transform(parent).rotation = kPi / 2.0f;
    NodeId node = add_node(parent, {10.0f, 0.0f});  // world (0, 10)
    NodeId target = add_node(scene.root(), {0.0f, 20.0f});
    scene.add_constraint(node, Constraint::orient_to_node(target));

    scene.apply_constraints();
    // Bearing from (0, 10) to (0, 20) is pi/2; the parent's rotation is not
    // subtracted, so the node ends up turned by pi in world space.
    EXPECT_NEAR(scene.transform(node).rotation, kPi / 2.0f, kEps);
    EXPECT_NEAR(scene.world_rotation(node), kPi, kEps);
}

TEST_F(ConstraintTest, DisabledConstraintIsSkipped) {
    NodeId node = add_node(scene.root(), {50.0f, 0.0f});
    Constraint c = Constraint::position_x(Range(0.0f, 1.0f));
    c.set_enabled(false);
    scene.add_constraint(node, c);

    scene.apply_constraints();
    EXPECT_FLOAT_EQ(scene.transform(node).position.x, 50.0f);

    scene.constraints(node)[0].set_enabled(true);
    scene.apply_constraints();
    EXPECT_FLOAT_EQ(scene.transform(node).position.x, 1.0f);
}

TEST_F(ConstraintTest, ListOrderDecidesConflicts) {
    NodeId a = add_node(scene.root(), {20.0f, 0.0f});
    scene.add_constraint(a, Constraint::position_x(Range(0.0f, 5.0f)));
    scene.add_constraint(a, Constraint::position_x(Range(8.0f, 10.0f)));

    NodeId b = add_node(scene.root(), {20.0f, 0.0f});
    scene.add_constraint(b, Constraint::position_x(Range(8.0f, 10.0f)));
    scene.add_constraint(b, Constraint::position_x(Range(0.0f, 5.0f)));

    scene.apply_constraints();
    EXPECT_FLOAT_EQ(scene.transform(a).position.x, 8.0f);
    EXPECT_FLOAT_EQ(scene.transform(b).position.x, 5.0f);
}

TEST_F(ConstraintTest, DetachedNodesAreNotConstrained) {
    NodeId node = scene.create_node();
    scene.transform(node).position = {50.0f, 0.0f};
    scene.add_constraint(node, Constraint::position_x(Range(0.0f, 1.0f)));

    scene.apply_constraints();
    EXPECT_FLOAT_EQ(scene.transform(node).position.x, 50.0f);
}

TEST_F(ConstraintTest, ConstraintsRunDuringProcessFrame) {
    NodeId node = add_node(scene.root(), {0.0f, 0.0f});
    scene.add_constraint(node, Constraint::position_x(Range(0.0f, 10.0f)));
    scene.set_update_callback([node](Scene& s, float) { s.transform(node).position.x += 7.0f; });

    scene.process_frame(1.0f / 60.0f);
    scene.process_frame(1.0f / 60.0f);
    EXPECT_FLOAT_EQ(scene.transform(node).position.x, 10.0f);
}
