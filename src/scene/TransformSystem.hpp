#ifndef VELLUM_TRANSFORM_SYSTEM_HPP
#define VELLUM_TRANSFORM_SYSTEM_HPP

#include <entt/entt.hpp>

#include "components/NodeComponents.hpp"
#include "scene/SceneGraph.hpp"

namespace vellum {

/**
 * @brief Resolves local transforms into world space.
 *
 * Composition rules: world position is the parent's world matrix applied to
 * the local position, world rotation is the sum of ancestor rotations, world
 * scale and world alpha are products.
 */
class TransformSystem {
   public:
    TransformSystem(Registry& registry, const SceneGraph& graph)
        : registry_(registry), graph_(graph) {}

    // Child of 'parent' with local transform 'local'.
    static WorldTransform combine(const WorldTransform& parent, const Transform& local);

    // Walks the ancestor chain; reflects every edit made so far this frame.
    static WorldTransform resolve(const Registry& registry, const SceneGraph& graph,
                                  NodeId node);
    WorldTransform resolve(NodeId node) const { return resolve(registry_, graph_, node); }

    // Rewrites WorldTransform for every node under 'root' (inclusive), top-down.
    void compose(NodeId root);

   private:
    Registry& registry_;
    const SceneGraph& graph_;
};

}  // namespace vellum

#endif  // VELLUM_TRANSFORM_SYSTEM_HPP
