#include "constraints/ConstraintSystem.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include "Logger.hpp"

namespace vellum {

void ConstraintSystem::apply(NodeId node) {
    auto* constraints = registry_.try_get<Constraints>(node);
    if (constraints == nullptr || !registry_.all_of<Transform>(node)) {
        return;
    }
    for (const Constraint& constraint : constraints->list) {
        apply_one(constraint, node);
    }
}

void ConstraintSystem::apply_tree(NodeId root) {
    graph_.for_each_descendant_preorder(root, [this](NodeId node) { apply(node); });
}

bool ConstraintSystem::target_alive_(NodeId target) const {
    return graph_.contains(target) && registry_.all_of<Transform>(target);
}

bool ConstraintSystem::apply_one(const Constraint& constraint, NodeId node) {
    if (!constraint.enabled()) {
        return false;
    }
    auto* local = registry_.try_get<Transform>(node);
    if (local == nullptr) {
        return false;
    }

    return std::visit(
        [&](const auto& c) -> bool {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, PositionXConstraint>) {
                local->position.x = c.range.clamp(local->position.x);
            } else if constexpr (std::is_same_v<T, PositionYConstraint>) {
                local->position.y = c.range.clamp(local->position.y);
            } else if constexpr (std::is_same_v<T, PositionInRectConstraint>) {
                local->position.x = std::clamp(local->position.x, c.rect.min_x(), c.rect.max_x());
                local->position.y = std::clamp(local->position.y, c.rect.min_y(), c.rect.max_y());
            } else if constexpr (std::is_same_v<T, RotationConstraint>) {
                local->rotation = c.range.clamp(local->rotation);
            } else if constexpr (std::is_same_v<T, DistanceConstraint>) {
                if (!target_alive_(c.target)) {
                    Logger::getLogger()->trace("Distance constraint target is gone, skipping");
                    return false;
                }
                Point node_world = transforms_.resolve(node).position;
                Point target_world = transforms_.resolve(c.target).position;
                Vec2 offset = node_world - target_world;
                float current = length(offset);
                if (current == 0.0f) {
                    // No direction to move along.
                    return true;
                }
                float clamped = c.range.clamp(current);
                if (clamped == current) {
                    return true;
                }
                Point wanted = target_world + offset * (clamped / current);
                local->position += wanted - node_world;
            } else if constexpr (std::is_same_v<T, OrientToNodeConstraint>) {
                if (!target_alive_(c.target)) {
                    Logger::getLogger()->trace("Orient constraint target is gone, skipping");
                    return false;
                }
                // Bearing is taken in world space and written to the local
                // rotation as is; ancestor rotation is not subtracted.
                Point node_world = transforms_.resolve(node).position;
                Point target_world = transforms_.resolve(c.target).position;
                local->rotation = angle_of(target_world - node_world) + c.offset;
            } else if constexpr (std::is_same_v<T, OrientToPointConstraint>) {
                Point node_world = transforms_.resolve(node).position;
                local->rotation = angle_of(c.point - node_world) + c.offset;
            }
            return true;
        },
        constraint.kind());
}

}  // namespace vellum
