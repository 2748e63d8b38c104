#include <catch2/catch_test_macros.hpp>

#include "editor/grid_editor.hpp"

using grid::CellRecord;
using grid::Coord;

TEST_CASE("GridEditor - Toggle", "[grid_editor]") {
    SECTION("Undo and redo a single toggle on a 1x1 grid") {
        GridEditor editor({1, 1, 30});

        REQUIRE(editor.toggle_cell({0, 0}, CellRecord{}));
        REQUIRE(editor.is_active({0, 0}));

        REQUIRE(editor.undo());
        REQUIRE(editor.current().empty());

        REQUIRE(editor.redo());
        REQUIRE(editor.is_active({0, 0}));
        REQUIRE(editor.query_active({0, 0})->active);
    }

    SECTION("Toggling twice restores the store and records both steps") {
        GridEditor editor;
        editor.toggle_cell({2, 3});
        const auto before = editor.current();

        editor.toggle_cell({4, 4});
        editor.toggle_cell({4, 4});

        REQUIRE(editor.current() == before);
        REQUIRE(editor.history().size() == 4);
        REQUIRE(editor.current_label() == "Erase (4, 4)");
    }

    SECTION("Labels describe the edit") {
        GridEditor editor;
        editor.toggle_cell({1, 2});
        REQUIRE(editor.current_label() == "Toggle (1, 2)");

        CellRecord red;
        red.color = {255, 0, 0, 255};
        editor.toggle_cell({1, 2}, red);
        REQUIRE(editor.current_label() == "Paint (1, 2)");
        REQUIRE(editor.query_active({1, 2})->color == red.color);
    }

    SECTION("Out-of-range toggles are ignored") {
        GridEditor editor({3, 3, 30});
        REQUIRE_FALSE(editor.toggle_cell({3, 0}));
        REQUIRE_FALSE(editor.toggle_cell({0, -1}));
        REQUIRE(editor.current().empty());
        REQUIRE(editor.history().size() == 1);
    }

    SECTION("Current paint is used by default") {
        GridEditor editor;
        CellRecord paint;
        paint.outline = false;
        paint.tags["kind"] = "wall";
        editor.set_paint(paint);

        editor.toggle_cell({0, 0});
        REQUIRE(*editor.query_active({0, 0}) == paint);
    }
}

TEST_CASE("GridEditor - Clear all", "[grid_editor]") {
    GridEditor editor;

    SECTION("Clearing an empty grid does nothing") {
        REQUIRE_FALSE(editor.clear_all());
        REQUIRE(editor.history().size() == 1);
    }

    SECTION("Clear is one undo step and one redo step") {
        editor.toggle_cell({0, 0});
        editor.toggle_cell({0, 1});
        editor.toggle_cell({0, 2});

        REQUIRE(editor.clear_all());
        REQUIRE(editor.current().empty());
        REQUIRE(editor.current_label() == "Clear all: 3 cells removed");

        REQUIRE(editor.undo());
        REQUIRE(editor.current().size() == 3);

        REQUIRE(editor.redo());
        REQUIRE(editor.current().empty());
    }

    SECTION("History list reports what a clear removed") {
        editor.toggle_cell({0, 0});
        editor.toggle_cell({4, 7});
        editor.clear_all();

        auto items = editor.history_list();
        REQUIRE(items.back().current);
        REQUIRE(items.back().size == 0);
        REQUIRE(items.back().removed == 2);
        REQUIRE(items[1].removed == 0);
    }

    SECTION("Empty snapshots around a clear do not merge steps") {
        editor.toggle_cell({5, 5});
        editor.clear_all();
        editor.toggle_cell({5, 5});
        editor.toggle_cell({5, 5});
        REQUIRE(editor.current().empty());

        REQUIRE(editor.undo());
        REQUIRE(editor.is_active({5, 5}));
        REQUIRE(editor.undo());
        REQUIRE(editor.current().empty());
        REQUIRE(editor.current_label() == "Clear all: 1 cells removed");
        REQUIRE(editor.undo());
        REQUIRE(editor.is_active({5, 5}));
    }
}

TEST_CASE("GridEditor - Fill enclosed", "[grid_editor]") {
    GridEditor editor({3, 3, 30});
    for (int row = 0; row < 3; ++row)
        for (int col = 0; col < 3; ++col)
            if (row != 1 || col != 1)
                editor.toggle_cell({row, col});

    SECTION("Closed ring fills the center in one step") {
        const auto entries = editor.history().size();
        REQUIRE(editor.fill_enclosed());
        REQUIRE(editor.is_active({1, 1}));
        REQUIRE(editor.current_label() == "Fill enclosed: 1 cells");
        REQUIRE(editor.history().size() == entries + 1);

        REQUIRE_FALSE(editor.fill_enclosed());
    }

    SECTION("Open ring fills nothing") {
        editor.toggle_cell({2, 1});
        REQUIRE_FALSE(editor.fill_enclosed());
        REQUIRE_FALSE(editor.is_active({1, 1}));
    }
}

TEST_CASE("GridEditor - Resize and clamp", "[grid_editor]") {
    GridEditor editor;
    for (int col = 0; col < 10; ++col)
        editor.toggle_cell({col, col});

    SECTION("Shrinking columns removes the cells that fall outside") {
        REQUIRE(editor.resize(10, 5));
        REQUIRE(editor.config().cols == 5);
        REQUIRE(editor.current().size() == 5);
        REQUIRE(editor.current_label() == "Clamp to 10x5: 5 cells removed");

        REQUIRE_FALSE(editor.clamp_to_bounds(10, 5));
    }

    SECTION("Growing commits nothing") {
        const auto entries = editor.history().size();
        REQUIRE_FALSE(editor.resize(15, 15));
        REQUIRE(editor.history().size() == entries);
    }

    SECTION("The clamp can be undone") {
        editor.resize(3, 3);
        REQUIRE(editor.current().size() == 3);
        REQUIRE(editor.undo());
        REQUIRE(editor.current().size() == 10);
    }

    SECTION("Dimensions are capped") {
        REQUIRE_FALSE(editor.resize(100000, 20));
        REQUIRE(editor.config().rows == grid::GridConfig::MAX_DIMENSION);
        REQUIRE(editor.config().cols == 20);
    }

    SECTION("Non-positive dimensions become 1") {
        editor.resize(0, -4);
        REQUIRE(editor.config().rows == 1);
        REQUIRE(editor.config().cols == 1);
        REQUIRE(editor.current().size() == 1);
    }
}

TEST_CASE("GridEditor - History list and jump", "[grid_editor]") {
    GridEditor editor;
    editor.toggle_cell({0, 0});
    editor.toggle_cell({0, 1});
    editor.undo();

    auto items = editor.history_list();
    REQUIRE(items.size() == 3);
    REQUIRE(items[0].label == "Initial");
    REQUIRE(items[1].size == 1);
    REQUIRE(items[1].current);
    REQUIRE(items[2].size == 2);
    REQUIRE_FALSE(items[2].current);

    REQUIRE(editor.jump_to(2));
    REQUIRE(editor.current().size() == 2);
    REQUIRE_FALSE(editor.jump_to(10));
    REQUIRE(editor.current().size() == 2);
}

TEST_CASE("GridEditor - Load and reset", "[grid_editor]") {
    GridEditor editor;
    editor.toggle_cell({0, 0});

    grid::CellStore cells;
    cells.set({1, 1}, {});
    editor.load({4, 6, 500}, cells, "Open demo.json");

    REQUIRE(editor.config().rows == 4);
    REQUIRE(editor.config().cols == 6);
    REQUIRE(editor.config().cell_size == grid::GridConfig::MAX_CELL_SIZE);
    REQUIRE(editor.history().size() == 1);
    REQUIRE(editor.is_active({1, 1}));
    REQUIRE_FALSE(editor.history().can_undo());
    REQUIRE(editor.current_label() == "Open demo.json");

    editor.reset();
    REQUIRE(editor.current().empty());
    REQUIRE(editor.config().rows == 4);
    REQUIRE(editor.current_label() == "Initial");
}
