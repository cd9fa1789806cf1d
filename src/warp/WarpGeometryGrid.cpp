#include "warp/WarpGeometryGrid.hpp"

#include <algorithm>
#include <cmath>

#include "Logger.hpp"

namespace vellum {

WarpGeometryGrid::WarpGeometryGrid(int columns, int rows)
    : columns_(std::clamp(columns, 1, kMaxDivisions)),
      rows_(std::clamp(rows, 1, kMaxDivisions)),
      sources_(regular_positions_(columns_, rows_)),
      destinations_(sources_) {}

WarpGeometryGrid::WarpGeometryGrid(int columns, int rows, const std::vector<Point>& sources,
                                   const std::vector<Point>& destinations)
    : WarpGeometryGrid(columns, rows) {
    const auto expected = static_cast<std::size_t>(vertex_count());
    if (sources.size() == expected) {
        sources_ = sources;
    }
    if (destinations.size() == expected) {
        destinations_ = destinations;
    } else {
        destinations_ = sources_;
    }
}

std::vector<Point> WarpGeometryGrid::regular_positions_(int columns, int rows) {
    std::vector<Point> positions;
    positions.reserve(static_cast<std::size_t>(columns + 1) * static_cast<std::size_t>(rows + 1));
    for (int row = 0; row <= rows; ++row) {
        for (int col = 0; col <= columns; ++col) {
            positions.push_back({static_cast<float>(col) / static_cast<float>(columns),
                                 static_cast<float>(row) / static_cast<float>(rows)});
        }
    }
    return positions;
}

std::optional<int> WarpGeometryGrid::vertex_index(int column, int row) const {
    if (column < 0 || column > columns_ || row < 0 || row > rows_) {
        return std::nullopt;
    }
    return row * (columns_ + 1) + column;
}

Point WarpGeometryGrid::source_position(int index) const {
    if (index < 0 || index >= vertex_count()) return {};
    return sources_[static_cast<std::size_t>(index)];
}

Point WarpGeometryGrid::destination_position(int index) const {
    if (index < 0 || index >= vertex_count()) return {};
    return destinations_[static_cast<std::size_t>(index)];
}

std::optional<Point> WarpGeometryGrid::source_position(int column, int row) const {
    auto index = vertex_index(column, row);
    if (!index) return std::nullopt;
    return sources_[static_cast<std::size_t>(*index)];
}

std::optional<Point> WarpGeometryGrid::destination_position(int column, int row) const {
    auto index = vertex_index(column, row);
    if (!index) return std::nullopt;
    return destinations_[static_cast<std::size_t>(*index)];
}

void WarpGeometryGrid::set_destination_position(int index, Point position) {
    if (index < 0 || index >= vertex_count()) return;
    destinations_[static_cast<std::size_t>(index)] = position;
}

void WarpGeometryGrid::set_destination_position(int column, int row, Point position) {
    if (auto index = vertex_index(column, row)) {
        destinations_[static_cast<std::size_t>(*index)] = position;
    }
}

bool WarpGeometryGrid::set_all_destination_positions(const std::vector<Point>& positions) {
    if (positions.size() != destinations_.size()) {
        Logger::getLogger()->debug("Rejected warp destinations: got {} points, grid has {}",
                                   positions.size(), destinations_.size());
        return false;
    }
    destinations_ = positions;
    return true;
}

void WarpGeometryGrid::reset_destinations() { destinations_ = sources_; }

std::optional<WarpGeometryGrid> WarpGeometryGrid::interpolate(const WarpGeometryGrid& from,
                                                              const WarpGeometryGrid& to,
                                                              float progress) {
    if (!from.same_shape(to)) {
        return std::nullopt;
    }
    float t = std::isnan(progress) ? 1.0f : std::clamp(progress, 0.0f, 1.0f);

    WarpGeometryGrid result(from);
    for (std::size_t i = 0; i < result.destinations_.size(); ++i) {
        result.destinations_[i] = lerp(from.destinations_[i], to.destinations_[i], t);
    }
    return result;
}

// --- Presets ----------------------------------------------------------------

WarpGeometryGrid WarpGeometryGrid::wave(int columns, int rows, float amplitude, float frequency,
                                        float phase, bool horizontal) {
    WarpGeometryGrid grid(columns, rows);
    for (std::size_t i = 0; i < grid.sources_.size(); ++i) {
        const Point& src = grid.sources_[i];
        Point& dst = grid.destinations_[i];
        if (horizontal) {
            dst.x = src.x + std::sin(src.y * frequency * kPi * 2.0f + phase) * amplitude;
        } else {
            dst.y = src.y + std::sin(src.x * frequency * kPi * 2.0f + phase) * amplitude;
        }
    }
    return grid;
}

WarpGeometryGrid WarpGeometryGrid::bulge(int columns, int rows, Point center, float radius,
                                         float strength) {
    WarpGeometryGrid grid(columns, rows);
    for (std::size_t i = 0; i < grid.sources_.size(); ++i) {
        Vec2 offset = grid.sources_[i] - center;
        float dist = length(offset);
        // The center itself has no direction to move in.
        if (dist <= 0.0f || dist >= radius) continue;
        float factor = 1.0f - dist / radius;
        float scale = 1.0f + factor * factor * strength;
        grid.destinations_[i] = center + offset * scale;
    }
    return grid;
}

WarpGeometryGrid WarpGeometryGrid::twist(int columns, int rows, Point center, float radius,
                                         float angle) {
    WarpGeometryGrid grid(columns, rows);
    for (std::size_t i = 0; i < grid.sources_.size(); ++i) {
        Vec2 offset = grid.sources_[i] - center;
        float dist = length(offset);
        if (dist >= radius) continue;
        float factor = 1.0f - dist / radius;
        float rotation = factor * factor * angle;
        float cs = std::cos(rotation);
        float sn = std::sin(rotation);
        grid.destinations_[i] = {center.x + offset.x * cs - offset.y * sn,
                                 center.y + offset.x * sn + offset.y * cs};
    }
    return grid;
}

}  // namespace vellum
