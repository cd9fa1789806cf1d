#ifndef VELLUM_WARP_GEOMETRY_GRID_HPP
#define VELLUM_WARP_GEOMETRY_GRID_HPP

#include <optional>
#include <vector>

#include "geometry/Geometry.hpp"

namespace vellum {

/**
 * @brief Deformable (columns+1) x (rows+1) vertex grid over the unit square.
 *
 * Source positions are the regular grid and never change after construction.
 * Destination positions start equal to the sources and may be edited. Both
 * arrays always hold vertex_count() points, row-major:
 * index = row * (columns + 1) + column.
 *
 * Out-of-range reads return (0, 0) or an empty optional; out-of-range and
 * wrongly sized writes are ignored.
 */
class WarpGeometryGrid {
   public:
    // Single cell, identity warp.
    WarpGeometryGrid() : WarpGeometryGrid(1, 1) {}

    static constexpr int kMaxDivisions = 1024;

    // Column and row counts are clamped to [1, kMaxDivisions].
    WarpGeometryGrid(int columns, int rows);

    // Either array with the wrong vertex count falls back to the regular grid.
    WarpGeometryGrid(int columns, int rows, const std::vector<Point>& sources,
                     const std::vector<Point>& destinations);

    int columns() const { return columns_; }
    int rows() const { return rows_; }
    int vertex_count() const { return (columns_ + 1) * (rows_ + 1); }

    bool same_shape(const WarpGeometryGrid& other) const {
        return columns_ == other.columns_ && rows_ == other.rows_;
    }

    std::optional<int> vertex_index(int column, int row) const;

    Point source_position(int index) const;
    Point destination_position(int index) const;
    std::optional<Point> source_position(int column, int row) const;
    std::optional<Point> destination_position(int column, int row) const;

    void set_destination_position(int index, Point position);
    void set_destination_position(int column, int row, Point position);

    const std::vector<Point>& source_positions() const { return sources_; }
    const std::vector<Point>& destination_positions() const { return destinations_; }

    // All or nothing: returns false and leaves the grid untouched on a count mismatch.
    bool set_all_destination_positions(const std::vector<Point>& positions);

    void reset_destinations();

    bool is_identity() const { return destinations_ == sources_; }

    // Blends destinations of two grids of the same shape; progress is clamped
    // to [0, 1] and NaN counts as 1. The result takes the sources of 'from'.
    static std::optional<WarpGeometryGrid> interpolate(const WarpGeometryGrid& from,
                                                       const WarpGeometryGrid& to, float progress);

    // --- Presets --------------------------------------------------------------

    // Horizontal: x += sin(y * frequency * 2pi + phase) * amplitude.
    // Vertical:   y += sin(x * frequency * 2pi + phase) * amplitude.
    static WarpGeometryGrid wave(int columns, int rows, float amplitude, float frequency,
                                 float phase = 0.0f, bool horizontal = true);

    // Radial push away from 'center' (pinch with negative strength).
    static WarpGeometryGrid bulge(int columns, int rows, Point center = {0.5f, 0.5f},
                                  float radius = 0.5f, float strength = 0.3f);

    // Rotation about 'center' fading to zero at 'radius'.
    static WarpGeometryGrid twist(int columns, int rows, Point center = {0.5f, 0.5f},
                                  float radius = 0.5f, float angle = kPi / 4.0f);

    bool operator==(const WarpGeometryGrid&) const = default;

   private:
    int columns_;
    int rows_;
    std::vector<Point> sources_;
    std::vector<Point> destinations_;

    static std::vector<Point> regular_positions_(int columns, int rows);
};

}  // namespace vellum

#endif  // VELLUM_WARP_GEOMETRY_GRID_HPP
