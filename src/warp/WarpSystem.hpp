#ifndef VELLUM_WARP_SYSTEM_HPP
#define VELLUM_WARP_SYSTEM_HPP

#include <cstddef>
#include <entt/entt.hpp>
#include <vector>

#include "LowLevelRenderer/DrawCommand.hpp"
#include "components/NodeComponents.hpp"
#include "warp/WarpComponents.hpp"

namespace vellum {

class WarpSystem {
   public:
    explicit WarpSystem(Registry& registry) : registry_(registry) {}

    // Advances every WarpTransition and WarpSequence by dt and writes the
    // resulting grid to the node's Warp. Finished animations are removed and
    // leave their final grid in place.
    void update(float dt);

    // Index of the grid shown 'elapsed' seconds into a sequence.
    static std::size_t sequence_index(const WarpSequence& sequence, float elapsed);

    // Renderer-ready mesh: each cell split into 2^levels x 2^levels cells,
    // new vertices bilinearly interpolated from the grid's destinations.
    static WarpMesh build_mesh(const WarpGeometryGrid& grid, int subdivision_levels);

   private:
    Registry& registry_;

    void update_transitions_(float dt);
    void update_sequences_(float dt);
};

}  // namespace vellum

#endif  // VELLUM_WARP_SYSTEM_HPP
