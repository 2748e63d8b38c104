#pragma once

#include <cstddef>

#include "cell_store.hpp"

namespace grid {

/**
 * @brief Drop every record outside [0,rows) x [0,cols).
 *
 * Pure and idempotent; the caller decides whether the result is committed.
 */
CellStore clamp(const CellStore &store, int rows, int cols);

/**
 * @brief Number of records that clamp() would drop for the given bounds.
 */
size_t count_out_of_bounds(const CellStore &store, int rows, int cols);

} // namespace grid
