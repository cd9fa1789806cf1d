#include "warp/WarpSystem.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include "SimulationManager.hpp"

namespace vellum {

void WarpSystem::update(float dt) {
    update_transitions_(dt);
    update_sequences_(dt);
}

void WarpSystem::update_transitions_(float dt) {
    std::vector<NodeId> finished;

    auto view = registry_.view<WarpTransition>();
    for (auto entity : view) {
        auto& transition = view.get<WarpTransition>(entity);
        const WarpGeometryGrid& target = transition.target;

        auto& warp = registry_.get_or_emplace<Warp>(
            entity, Warp{WarpGeometryGrid(target.columns(), target.rows()), 0});

        if (!transition.start) {
            // A start grid of another shape cannot be blended; begin from identity.
            transition.start = warp.grid.same_shape(target)
                                   ? warp.grid
                                   : WarpGeometryGrid(target.columns(), target.rows());
        }

        transition.elapsed += dt;
        float progress =
            transition.duration > 0.0f ? transition.elapsed / transition.duration : 1.0f;

        if (progress >= 1.0f) {
            warp.grid = target;
            finished.push_back(entity);
        } else if (auto blended = WarpGeometryGrid::interpolate(*transition.start, target, progress)) {
            warp.grid = std::move(*blended);
        }
    }

    registry_.remove<WarpTransition>(finished.begin(), finished.end());
}

std::size_t WarpSystem::sequence_index(const WarpSequence& sequence, float elapsed) {
    if (sequence.grids.empty()) return 0;
    const std::size_t last = sequence.grids.size() - 1;

    float accumulated = 0.0f;
    for (std::size_t i = 0; i < sequence.times.size(); ++i) {
        accumulated += sequence.times[i];
        if (elapsed < accumulated) {
            return std::min(i, last);
        }
    }
    return last;
}

void WarpSystem::update_sequences_(float dt) {
    std::vector<NodeId> finished;

    auto view = registry_.view<WarpSequence>();
    for (auto entity : view) {
        auto& sequence = view.get<WarpSequence>(entity);
        if (sequence.grids.empty()) {
            finished.push_back(entity);
            continue;
        }

        sequence.elapsed += dt;
        std::size_t index = sequence_index(sequence, sequence.elapsed);
        if (!sequence.current || *sequence.current != index) {
            sequence.current = index;
            auto& warp = registry_.get_or_emplace<Warp>(entity);
            warp.grid = sequence.grids[index];
        }

        float total = std::accumulate(sequence.times.begin(), sequence.times.end(), 0.0f);
        if (sequence.elapsed >= total) {
            finished.push_back(entity);
        }
    }

    registry_.remove<WarpSequence>(finished.begin(), finished.end());
}

WarpMesh WarpSystem::build_mesh(const WarpGeometryGrid& grid, int subdivision_levels) {
    const int levels = std::clamp(subdivision_levels, 0, SimulationManager::kMaxSubdivisionLevels);
    const int factor = 1 << levels;
    const int columns = grid.columns();
    const int rows = grid.rows();

    WarpMesh mesh;
    mesh.columns = columns * factor;
    mesh.rows = rows * factor;
    const auto count = static_cast<std::size_t>((mesh.columns + 1) * (mesh.rows + 1));
    mesh.uvs.reserve(count);
    mesh.positions.reserve(count);

    const auto& sources = grid.source_positions();
    const auto& destinations = grid.destination_positions();
    auto at = [columns](const std::vector<Point>& points, int col, int row) {
        return points[static_cast<std::size_t>(row * (columns + 1) + col)];
    };

    for (int fine_row = 0; fine_row <= mesh.rows; ++fine_row) {
        int row = std::min(fine_row / factor, rows - 1);
        float fv = static_cast<float>(fine_row - row * factor) / static_cast<float>(factor);

        for (int fine_col = 0; fine_col <= mesh.columns; ++fine_col) {
            int col = std::min(fine_col / factor, columns - 1);
            float fu = static_cast<float>(fine_col - col * factor) / static_cast<float>(factor);

            auto bilinear = [&](const std::vector<Point>& points) {
                Point top = lerp(at(points, col, row), at(points, col + 1, row), fu);
                Point bottom = lerp(at(points, col, row + 1), at(points, col + 1, row + 1), fu);
                return lerp(top, bottom, fv);
            };
            mesh.uvs.push_back(bilinear(sources));
            mesh.positions.push_back(bilinear(destinations));
        }
    }
    return mesh;
}

}  // namespace vellum
