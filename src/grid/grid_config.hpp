#pragma once

#include <algorithm>

namespace grid {

/**
 * @brief Dimensions of the editable grid.
 *
 * The slider ranges mirror what the editor offers; the engine itself only
 * needs rows and cols to be positive.
 */
struct GridConfig {
    static constexpr int MIN_COUNT = 1;
    static constexpr int MAX_COUNT = 20;
    static constexpr int MIN_CELL_SIZE = 10;
    static constexpr int MAX_CELL_SIZE = 100;
    /** @brief Largest rows/cols a project file or resize may ask for */
    static constexpr int MAX_DIMENSION = 512;

    int rows = 10;
    int cols = 10;
    /** @brief Cell edge length in pixels, rendering only */
    int cell_size = 30;

    int width_px() const { return cols * cell_size; }
    int height_px() const { return rows * cell_size; }

    static int clamp_cell_size(int px) {
        return std::clamp(px, MIN_CELL_SIZE, MAX_CELL_SIZE);
    }
    static int clamp_dimension(int n) { return std::clamp(n, 1, MAX_DIMENSION); }

    bool operator==(const GridConfig &) const = default;
};

} // namespace grid
