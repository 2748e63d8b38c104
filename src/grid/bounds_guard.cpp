#include "bounds_guard.hpp"

namespace grid {

CellStore clamp(const CellStore &store, int rows, int cols) {
    CellStore out;
    store.for_each([&](const Coord &c, const CellRecord &rec) {
        if (in_bounds(c, rows, cols))
            out.set(c, rec);
    });
    return out;
}

size_t count_out_of_bounds(const CellStore &store, int rows, int cols) {
    size_t n = 0;
    store.for_each([&](const Coord &c, const CellRecord &) {
        if (!in_bounds(c, rows, cols))
            ++n;
    });
    return n;
}

} // namespace grid
