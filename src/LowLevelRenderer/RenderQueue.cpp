#include "LowLevelRenderer/RenderQueue.hpp"

#include <algorithm>
#include <utility>

namespace vellum {

void RenderQueue::clear() {
    commands_.clear();
    warp_meshes_.clear();
}

std::int32_t RenderQueue::add_warp_mesh(WarpMesh mesh) {
    warp_meshes_.push_back(std::move(mesh));
    return static_cast<std::int32_t>(warp_meshes_.size() - 1);
}

void RenderQueue::sort_by_z() {
    std::stable_sort(commands_.begin(), commands_.end(),
                     [](const DrawCommand& a, const DrawCommand& b) {
                         return a.z_position < b.z_position;
                     });
}

}  // namespace vellum
