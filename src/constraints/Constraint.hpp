#ifndef VELLUM_CONSTRAINT_HPP
#define VELLUM_CONSTRAINT_HPP

#include <utility>
#include <variant>
#include <vector>

#include "components/NodeComponents.hpp"
#include "geometry/Geometry.hpp"
#include "geometry/Range.hpp"

namespace vellum {

struct PositionXConstraint {
    Range range;
};

struct PositionYConstraint {
    Range range;
};

struct PositionInRectConstraint {
    Rect rect;
};

// World-space distance to 'target'. The target is not owned.
struct DistanceConstraint {
    Range range;
    NodeId target{kNullNode};
};

struct RotationConstraint {
    Range range;  // radians
};

struct OrientToNodeConstraint {
    NodeId target{kNullNode};
    float offset{0.0f};  // radians added to the bearing
};

// 'point' is in scene (world) coordinates.
struct OrientToPointConstraint {
    Point point{};
    float offset{0.0f};
};

using ConstraintKind =
    std::variant<PositionXConstraint, PositionYConstraint, PositionInRectConstraint,
                 DistanceConstraint, RotationConstraint, OrientToNodeConstraint,
                 OrientToPointConstraint>;

/**
 * @brief A declarative limit on a node's local transform.
 *
 * Built through the named factories. Disabled constraints stay in the list
 * and are skipped when applied.
 */
class Constraint {
   public:
    static Constraint position_x(const Range& range) { return Constraint(PositionXConstraint{range}); }

    static Constraint position_y(const Range& range) { return Constraint(PositionYConstraint{range}); }

    static Constraint position_in_rect(const Rect& rect) {
        return Constraint(PositionInRectConstraint{rect});
    }

    static Constraint distance(const Range& range, NodeId target) {
        return Constraint(DistanceConstraint{range, target});
    }

    static Constraint rotation(const Range& range) { return Constraint(RotationConstraint{range}); }

    // Same as rotation() with the limits given in degrees.
    static Constraint rotation_degrees(const Range& degrees) {
        return rotation(Range(degrees_to_radians(degrees.lower()), degrees_to_radians(degrees.upper())));
    }

    static Constraint orient_to_node(NodeId target, float offset = 0.0f) {
        return Constraint(OrientToNodeConstraint{target, offset});
    }

    static Constraint orient_to_point(Point point, float offset = 0.0f) {
        return Constraint(OrientToPointConstraint{point, offset});
    }

    const ConstraintKind& kind() const { return kind_; }

    bool enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }

   private:
    explicit Constraint(ConstraintKind kind) : kind_(std::move(kind)) {}

    ConstraintKind kind_;
    bool enabled_{true};
};

// Ordered constraint list attached to a node.
struct Constraints {
    std::vector<Constraint> list;
};

}  // namespace vellum

#endif  // VELLUM_CONSTRAINT_HPP
