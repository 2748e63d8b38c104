#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include "grid/cell_store.hpp"

using grid::CellRecord;
using grid::CellStore;
using grid::Coord;

TEST_CASE("CellStore - Toggle", "[cell_store]") {
    CellStore store;
    const CellRecord yellow{};
    const CellRecord red{true, {255, 0, 0, 255}, true, {}};

    SECTION("Toggle on an empty cell activates it") {
        REQUIRE(store.toggle({1, 2}, yellow));
        REQUIRE(store.contains({1, 2}));
        REQUIRE(store.size() == 1);
        REQUIRE(*store.get({1, 2}) == yellow);
    }

    SECTION("Toggling twice with the same attributes restores the store") {
        store.set({0, 0}, red);
        const CellStore before = store;

        store.toggle({3, 3}, yellow);
        REQUIRE_FALSE(store.toggle({3, 3}, yellow));
        REQUIRE(store == before);
    }

    SECTION("Toggling with different attributes repaints") {
        store.toggle({0, 0}, yellow);
        REQUIRE(store.toggle({0, 0}, red));
        REQUIRE(store.get({0, 0})->color == red.color);
        REQUIRE(store.size() == 1);
    }

    SECTION("Tags take part in equality") {
        CellRecord tagged = yellow;
        tagged.tags["note"] = "door";
        store.toggle({0, 0}, tagged);
        REQUIRE(store.toggle({0, 0}, yellow));
        REQUIRE(store.get({0, 0})->tags.empty());
    }
}

TEST_CASE("CellStore - Lookup and listing", "[cell_store]") {
    CellStore store;
    store.set({2, 0}, {});
    store.set({0, 5}, {});
    store.set({0, 1}, {});

    SECTION("Missing cells are absent") {
        REQUIRE(store.get({9, 9}) == nullptr);
        REQUIRE_FALSE(store.contains({-1, 0}));
    }

    SECTION("cells() is row-major") {
        auto cells = store.cells();
        REQUIRE(cells.size() == 3);
        REQUIRE(cells[0].first == Coord{0, 1});
        REQUIRE(cells[1].first == Coord{0, 5});
        REQUIRE(cells[2].first == Coord{2, 0});
    }

    SECTION("Erase and clear") {
        REQUIRE(store.erase({0, 5}));
        REQUIRE_FALSE(store.erase({0, 5}));
        REQUIRE(store.size() == 2);

        store.clear();
        REQUIRE(store.empty());
    }

    SECTION("Copies are independent") {
        CellStore copy = store;
        copy.erase({2, 0});
        REQUIRE(store.contains({2, 0}));
        REQUIRE_FALSE(copy == store);
    }
}

TEST_CASE("Coord - Formatting and hashing", "[cell_store]") {
    REQUIRE(fmt::format("{}", Coord{3, 4}) == "(3, 4)");
    REQUIRE(grid::CoordHash{}({3, 4}) != grid::CoordHash{}({4, 3}));
    REQUIRE(grid::in_bounds({0, 0}, 1, 1));
    REQUIRE_FALSE(grid::in_bounds({0, 1}, 1, 1));
    REQUIRE_FALSE(grid::in_bounds({-1, 0}, 5, 5));
}
