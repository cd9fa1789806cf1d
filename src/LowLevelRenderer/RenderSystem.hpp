#ifndef VELLUM_RENDER_SYSTEM_HPP
#define VELLUM_RENDER_SYSTEM_HPP

#include <entt/entt.hpp>

#include "LowLevelRenderer/RenderQueue.hpp"
#include "scene/SceneGraph.hpp"

namespace vellum {

class RenderSystem {
   public:
    RenderSystem(Registry& registry, const SceneGraph& graph)
        : registry_(registry), graph_(graph) {}

    // Refills 'queue' from the subtree at 'root'.
    //  - World transforms are composed first, so the output reflects every edit.
    //  - Depth-first in child order; hidden or fully transparent subtrees are skipped.
    //  - One command per node carrying a Sprite, then a stable sort on z.
    void collect(NodeId root, RenderQueue& queue);

   private:
    Registry& registry_;
    const SceneGraph& graph_;
};

}  // namespace vellum

#endif  // VELLUM_RENDER_SYSTEM_HPP
