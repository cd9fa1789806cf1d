#ifndef VELLUM_CONSTRAINT_SYSTEM_HPP
#define VELLUM_CONSTRAINT_SYSTEM_HPP

#include <entt/entt.hpp>

#include "constraints/Constraint.hpp"
#include "scene/SceneGraph.hpp"
#include "scene/TransformSystem.hpp"

namespace vellum {

class ConstraintSystem {
   public:
    ConstraintSystem(Registry& registry, const SceneGraph& graph)
        : registry_(registry), graph_(graph), transforms_(registry, graph) {}

    // Applies the node's constraint list in order. Each constraint sees the
    // transform left by the previous one; there is no iteration to a fixed point.
    void apply(NodeId node);

    // apply() on every node under 'root', parents before children.
    void apply_tree(NodeId root);

    // A single constraint against 'node'. Returns false when it was skipped
    // (disabled, or its target is gone).
    bool apply_one(const Constraint& constraint, NodeId node);

   private:
    Registry& registry_;
    const SceneGraph& graph_;
    TransformSystem transforms_;

    bool target_alive_(NodeId target) const;
};

}  // namespace vellum

#endif  // VELLUM_CONSTRAINT_SYSTEM_HPP
