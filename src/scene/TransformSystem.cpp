#include "scene/TransformSystem.hpp"

#include <utility>
#include <vector>

namespace vellum {

WorldTransform TransformSystem::combine(const WorldTransform& parent, const Transform& local) {
    WorldTransform world;
    world.position = parent.matrix.apply(local.position);
    world.rotation = parent.rotation + local.rotation;
    world.scale = {parent.scale.x * local.scale.x, parent.scale.y * local.scale.y};
    world.alpha = parent.alpha * local.alpha;
    world.matrix =
        parent.matrix.concatenated(AffineTransform::trs(local.position, local.rotation, local.scale));
    return world;
}

WorldTransform TransformSystem::resolve(const Registry& registry, const SceneGraph& graph,
                                        NodeId node) {
    std::vector<NodeId> chain;
    for (NodeId cur = node; cur != entt::null; cur = graph.parent(cur)) {
        chain.push_back(cur);
    }

    WorldTransform world;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (const auto* local = registry.try_get<Transform>(*it)) {
            world = combine(world, *local);
        }
    }
    return world;
}

void TransformSystem::compose(NodeId root) {
    if (!graph_.contains(root)) return;

    // The root itself is composed against its own ancestors.
    std::vector<std::pair<NodeId, WorldTransform>> stack;
    stack.emplace_back(root, resolve(root));

    std::vector<NodeId> children;
    while (!stack.empty()) {
        auto [node, world] = stack.back();
        stack.pop_back();
        registry_.emplace_or_replace<WorldTransform>(node, world);

        children.clear();
        graph_.for_each_child(node, [&children](NodeId c) { children.push_back(c); });
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            const auto* local = registry_.try_get<Transform>(*it);
            stack.emplace_back(*it, local ? combine(world, *local) : world);
        }
    }
}

}  // namespace vellum
