#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

#include "render/grid_geometry.hpp"

using grid::CellRecord;
using grid::CellStore;
using grid::Coord;

TEST_CASE("GridGeometry - Outline edges", "[grid_geometry]") {
    SECTION("A lone cell has four edges") {
        CellStore store;
        store.set({1, 2}, {});
        auto edges = outline_edges(store, 10.0f, 2.0f);
        REQUIRE(edges.size() == 4);

        // top edge, offset by half the stroke
        REQUIRE(edges[0].x0 == 21.0f);
        REQUIRE(edges[0].y0 == 11.0f);
        REQUIRE(edges[0].x1 == 31.0f);
        REQUIRE(edges[0].y1 == 11.0f);
    }

    SECTION("Shared sides are not outlined") {
        CellStore store;
        store.set({0, 0}, {});
        store.set({0, 1}, {});
        REQUIRE(outline_edges(store, 10.0f, 0.0f).size() == 6);

        store.set({1, 0}, {});
        store.set({1, 1}, {});
        REQUIRE(outline_edges(store, 10.0f, 0.0f).size() == 8);
    }

    SECTION("Cells without the outline flag emit nothing") {
        CellRecord plain;
        plain.outline = false;
        CellStore store;
        store.set({0, 0}, plain);
        store.set({0, 1}, {});
        REQUIRE(outline_edges(store, 10.0f, 0.0f).size() == 3);
    }
}

TEST_CASE("GridGeometry - Grid lines", "[grid_geometry]") {
    grid::GridConfig config{2, 3, 10};
    auto lines = grid_lines(config);
    REQUIRE(lines.size() == 7);

    // last vertical line sits on the right border
    REQUIRE(lines[3].x0 == 30.0f);
    REQUIRE(lines[3].y1 == 20.0f);
    // last horizontal line sits on the bottom border
    REQUIRE(lines[6].y0 == 20.0f);
    REQUIRE(lines[6].x1 == 30.0f);
}

TEST_CASE("GridGeometry - Picking cells", "[grid_geometry]") {
    grid::GridConfig config{4, 5, 20};

    REQUIRE(cell_at(0.0f, 0.0f, config) == Coord{0, 0});
    REQUIRE(cell_at(45.0f, 79.9f, config) == Coord{3, 2});
    REQUIRE(cell_at(99.9f, 10.0f, config) == Coord{0, 4});

    REQUIRE_FALSE(cell_at(100.0f, 10.0f, config).has_value());
    REQUIRE_FALSE(cell_at(10.0f, 80.0f, config).has_value());
    REQUIRE_FALSE(cell_at(-0.5f, 10.0f, config).has_value());
    REQUIRE_FALSE(
        cell_at(std::numeric_limits<float>::quiet_NaN(), 1.0f, config)
            .has_value());
}
