#ifndef VELLUM_RENDERQUEUE_HPP
#define VELLUM_RENDERQUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "LowLevelRenderer/DrawCommand.hpp"

namespace vellum {

// Frame-scoped buffer of draw commands and the warp meshes they reference.
class RenderQueue {
   public:
    void clear();

    void add(const DrawCommand& command) { commands_.push_back(command); }

    // Stores the mesh and returns the index to put in DrawCommand::warp_mesh.
    std::int32_t add_warp_mesh(WarpMesh mesh);

    // Stable: equal z keeps submission order.
    void sort_by_z();

    const std::vector<DrawCommand>& commands() const { return commands_; }
    const std::vector<WarpMesh>& warp_meshes() const { return warp_meshes_; }

    std::size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

   private:
    std::vector<DrawCommand> commands_;
    std::vector<WarpMesh> warp_meshes_;
};

}  // namespace vellum

#endif  // VELLUM_RENDERQUEUE_HPP
