#include "flood_fill.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace grid {

std::vector<Region> find_enclosed_regions(const CellStore &store, int rows,
                                          int cols) {
    std::vector<Region> regions;
    if (rows <= 0 || cols <= 0)
        return regions;

    const size_t n = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    auto index = [cols](const Coord &c) {
        return static_cast<size_t>(c.row) * static_cast<size_t>(cols) +
               static_cast<size_t>(c.col);
    };

    // Dense snapshot of the store so the scan never hashes.
    std::vector<std::uint8_t> active(n, 0);
    store.for_each([&](const Coord &c, const CellRecord &) {
        if (in_bounds(c, rows, cols))
            active[index(c)] = 1;
    });

    std::vector<std::uint8_t> classified(n, 0);
    std::vector<Coord> stack;
    stack.reserve(std::min<size_t>(n, 4096));

    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            const Coord seed{row, col};
            const size_t si = index(seed);
            if (active[si] || classified[si])
                continue;

            Region visited;
            bool open = false;

            classified[si] = 1;
            stack.push_back(seed);

            while (!stack.empty()) {
                const Coord p = stack.back();
                stack.pop_back();
                visited.push_back(p);

                const Coord next[4] = {p.up(), p.down(), p.left(), p.right()};
                for (const Coord &q : next) {
                    if (!in_bounds(q, rows, cols)) {
                        // Keep draining so the whole region is classified.
                        open = true;
                        continue;
                    }
                    const size_t qi = index(q);
                    if (active[qi] || classified[qi])
                        continue;
                    classified[qi] = 1;
                    stack.push_back(q);
                }
            }

            if (!open) {
                std::sort(visited.begin(), visited.end());
                regions.push_back(std::move(visited));
            }
        }
    }

    return regions;
}

CellStore fill_enclosed(const CellStore &store, int rows, int cols,
                        const CellRecord &paint) {
    CellStore out = store;
    for (const Region &region : find_enclosed_regions(store, rows, cols)) {
        for (const Coord &c : region)
            out.set(c, paint);
    }
    return out;
}

} // namespace grid
