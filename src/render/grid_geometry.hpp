#pragma once

#include <optional>
#include <vector>

#include "../grid/cell_store.hpp"
#include "../grid/coord.hpp"
#include "../grid/grid_config.hpp"

/**
 * @brief Straight segment in grid-local pixel space.
 */
struct Segment {
    float x0, y0;
    float x1, y1;
};

/**
 * @brief Outline segments around the active cells.
 *
 * For each active cell with its outline flag set, emits one segment per side
 * (top, right, bottom, left) whose neighbour is inactive. Positions are offset
 * by half of @p stroke_width so the outer grid border is not clipped.
 */
std::vector<Segment> outline_edges(const grid::CellStore &store,
                                   float cell_size, float stroke_width);

/**
 * @brief Vertical then horizontal grid lines covering the whole grid.
 */
std::vector<Segment> grid_lines(const grid::GridConfig &config);

/**
 * @brief Map a point relative to the grid origin to a cell.
 * @return The cell under the point, or nothing when outside the grid.
 */
std::optional<grid::Coord> cell_at(float x, float y,
                                   const grid::GridConfig &config);
