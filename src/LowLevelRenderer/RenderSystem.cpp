#include "LowLevelRenderer/RenderSystem.hpp"

#include <algorithm>
#include <vector>

#include "SimulationManager.hpp"
#include "components/SpriteComponent.hpp"
#include "scene/TransformSystem.hpp"
#include "warp/WarpComponents.hpp"
#include "warp/WarpSystem.hpp"

namespace vellum {

void RenderSystem::collect(NodeId root, RenderQueue& queue) {
    queue.clear();
    if (!graph_.contains(root)) {
        return;
    }

    TransformSystem(registry_, graph_).compose(root);
    const int max_levels = SimulationManager::Instance()->getMaxSubdivisionLevels();

    std::vector<NodeId> stack{root};
    std::vector<NodeId> children;
    while (!stack.empty()) {
        NodeId node = stack.back();
        stack.pop_back();

        const auto* local = registry_.try_get<Transform>(node);
        const auto& world = registry_.get<WorldTransform>(node);
        if ((local != nullptr && local->hidden) || world.alpha <= 0.0f) {
            continue;
        }

        if (const auto* sprite = registry_.try_get<Sprite>(node)) {
            DrawCommand cmd;
            cmd.world_position = world.position;
            cmd.world_rotation = world.rotation;
            cmd.world_scale = world.scale;
            cmd.size = sprite->size;
            cmd.anchor_point = sprite->anchor_point;
            cmd.texture_id = sprite->texture_id;
            cmd.texture_rect = sprite->texture_rect;
            cmd.filtering_mode = sprite->filtering_mode;
            cmd.uses_mipmaps = sprite->uses_mipmaps;
            cmd.color = effective_color(*sprite);
            cmd.alpha = world.alpha;
            cmd.z_position = local != nullptr ? local->z_position : 0.0f;
            cmd.blend_mode = sprite->blend_mode;
            cmd.center_rect = sprite->center_rect;

            if (const auto* warp = registry_.try_get<Warp>(node)) {
                int levels = std::min(warp->subdivision_levels, max_levels);
                cmd.warp_mesh = queue.add_warp_mesh(WarpSystem::build_mesh(warp->grid, levels));
            }
            queue.add(cmd);
        }

        children.clear();
        graph_.for_each_child(node, [&children](NodeId c) { children.push_back(c); });
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }

    queue.sort_by_z();
}

}  // namespace vellum
