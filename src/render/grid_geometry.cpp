#include "grid_geometry.hpp"

#include <cmath>

std::vector<Segment> outline_edges(const grid::CellStore &store,
                                   float cell_size, float stroke_width) {
    std::vector<Segment> out;
    const float half = stroke_width / 2.0f;

    for (const auto &[c, rec] : store.cells()) {
        if (!rec.outline)
            continue;

        const float x = half + static_cast<float>(c.col) * cell_size;
        const float y = half + static_cast<float>(c.row) * cell_size;

        if (!store.contains(c.up()))
            out.push_back({x, y, x + cell_size, y});
        if (!store.contains(c.right()))
            out.push_back({x + cell_size, y, x + cell_size, y + cell_size});
        if (!store.contains(c.down()))
            out.push_back({x, y + cell_size, x + cell_size, y + cell_size});
        if (!store.contains(c.left()))
            out.push_back({x, y, x, y + cell_size});
    }
    return out;
}

std::vector<Segment> grid_lines(const grid::GridConfig &config) {
    std::vector<Segment> out;
    const auto size = static_cast<float>(config.cell_size);
    const auto width = static_cast<float>(config.width_px());
    const auto height = static_cast<float>(config.height_px());

    out.reserve(static_cast<size_t>(config.rows + config.cols + 2));
    for (int i = 0; i <= config.cols; ++i) {
        const float x = static_cast<float>(i) * size;
        out.push_back({x, 0.0f, x, height});
    }
    for (int i = 0; i <= config.rows; ++i) {
        const float y = static_cast<float>(i) * size;
        out.push_back({0.0f, y, width, y});
    }
    return out;
}

std::optional<grid::Coord> cell_at(float x, float y,
                                   const grid::GridConfig &config) {
    if (config.cell_size <= 0 || !std::isfinite(x) || !std::isfinite(y))
        return std::nullopt;
    if (x < 0.0f || y < 0.0f)
        return std::nullopt;

    const auto size = static_cast<float>(config.cell_size);
    const grid::Coord c{static_cast<int>(std::floor(y / size)),
                        static_cast<int>(std::floor(x / size))};
    if (!grid::in_bounds(c, config.rows, config.cols))
        return std::nullopt;
    return c;
}
