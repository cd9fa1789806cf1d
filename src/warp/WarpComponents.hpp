#ifndef VELLUM_WARP_COMPONENTS_HPP
#define VELLUM_WARP_COMPONENTS_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "warp/WarpGeometryGrid.hpp"

namespace vellum {

// Mesh deformation of a sprite. subdivision_levels is in [0, 3].
struct Warp {
    WarpGeometryGrid grid;
    int subdivision_levels{0};
};

// Blend from the node's warp at the first step to 'target' over 'duration'.
// 'start' is captured once, so each step reads the start grid, never its own
// previous output.
struct WarpTransition {
    WarpGeometryGrid target;
    float duration{0.0f};
    float elapsed{0.0f};
    std::optional<WarpGeometryGrid> start;
};

// Steps through 'grids'; grid i is shown for times[i] seconds.
struct WarpSequence {
    std::vector<WarpGeometryGrid> grids;
    std::vector<float> times;
    float elapsed{0.0f};
    std::optional<std::size_t> current;
};

}  // namespace vellum

#endif  // VELLUM_WARP_COMPONENTS_HPP
