#pragma once

#include <vector>

#include "cell_store.hpp"

namespace grid {

/**
 * @brief One maximal 4-connected group of inactive cells that cannot reach
 * the grid boundary. Cells are sorted row-major.
 */
using Region = std::vector<Coord>;

/**
 * @brief Classify inactive cells and return the enclosed regions.
 *
 * @details
 * Every unclassified inactive cell seeds a traversal over its 4-neighbours
 * (no diagonals) driven by an explicit stack, so region size is bounded by
 * rows*cols rather than by call depth. Active cells stop a branch. Stepping
 * outside [0,rows) x [0,cols) marks the region open. Open or not, every cell
 * the traversal visited is recorded as classified and never seeds again.
 *
 * Regions are returned in row-major order of their first cell. The result
 * depends only on the store contents and the bounds, not on map iteration
 * order. Records outside the bounds are ignored.
 */
std::vector<Region> find_enclosed_regions(const CellStore &store, int rows,
                                          int cols);

/**
 * @brief Mark every enclosed region active with @p paint.
 *
 * Runs find_enclosed_regions() and then writes the regions into a copy of
 * @p store. Applying it to its own output returns the same store.
 */
CellStore fill_enclosed(const CellStore &store, int rows, int cols,
                        const CellRecord &paint);

} // namespace grid
