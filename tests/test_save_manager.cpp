#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <algorithm>
#include <fstream>
#include <string>

#include "save_manager.hpp"
#include "utility/exceptions.hpp"

namespace {

/**
 * @brief Scratch directory removed when the test ends.
 */
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string &name)
        : path(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string &name) const {
        return (path / name).string();
    }
};

void write_file(const std::string &path, const std::string &text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

TEST_CASE("SaveManager - Basic functionality", "[save_manager]") {
    TempDir dir("gridpaint_test_basic");
    SaveManager manager(dir.file("config"));

    SECTION("New project creation") {
        SaveManager::ProjectData data;
        data.cells.set({1, 1}, {});
        REQUIRE_NOTHROW(manager.new_project(data));

        REQUIRE(data.grid.rows == 10);
        REQUIRE(data.grid.cols == 10);
        REQUIRE(data.grid.cell_size == 30);
        REQUIRE(data.paint.color == grid::Rgba{255, 255, 0, 255});
        REQUIRE(data.paint.outline);
        REQUIRE(data.cells.empty());
    }

    SECTION("Save and load project") {
        const std::string test_file = dir.file("project.json");

        SaveManager::ProjectData original;
        manager.new_project(original);
        original.grid.rows = 6;
        original.grid.cols = 8;
        original.grid.cell_size = 40;
        original.paint.color = {0, 128, 255, 200};
        original.paint.tags["layer"] = "walls";

        grid::CellRecord plain;
        grid::CellRecord tagged;
        tagged.outline = false;
        tagged.color = {10, 20, 30, 255};
        tagged.tags["kind"] = "door";
        original.cells.set({0, 0}, plain);
        original.cells.set({5, 7}, tagged);

        REQUIRE_NOTHROW(manager.save_project(test_file, original));
        REQUIRE(std::filesystem::exists(test_file));

        SaveManager::ProjectData loaded;
        REQUIRE_NOTHROW(manager.load_project(test_file, loaded));

        REQUIRE(loaded.grid == original.grid);
        REQUIRE(loaded.paint == original.paint);
        REQUIRE(loaded.cells == original.cells);
    }

    SECTION("Load non-existent file") {
        SaveManager::ProjectData data;
        REQUIRE_THROWS_AS(manager.load_project(dir.file("missing.json"), data),
                          gridpaint::IOError);
    }
}

TEST_CASE("SaveManager - Malformed projects are rejected whole",
          "[save_manager]") {
    TempDir dir("gridpaint_test_malformed");
    SaveManager manager(dir.file("config"));

    SaveManager::ProjectData data;
    manager.new_project(data);
    data.cells.set({2, 2}, {});
    const auto before_cells = data.cells;
    const auto before_grid = data.grid;

    auto expect_rejected = [&](const std::string &text) {
        const std::string path = dir.file("bad.json");
        write_file(path, text);
        REQUIRE_THROWS_AS(manager.load_project(path, data), gridpaint::IOError);
        REQUIRE(data.cells == before_cells);
        REQUIRE(data.grid == before_grid);
    };

    SECTION("Not JSON") { expect_rejected("{ not json"); }

    SECTION("Missing cells array") {
        expect_rejected(R"({"grid": {"rows": 3, "cols": 3}})");
    }

    SECTION("Non-positive dimensions") {
        expect_rejected(R"({"grid": {"rows": 0, "cols": 3}, "cells": []})");
    }

    SECTION("Cell outside the grid after valid cells") {
        expect_rejected(R"({"grid": {"rows": 3, "cols": 3}, "cells": [
            {"row": 0, "col": 0},
            {"row": 1, "col": 1},
            {"row": 3, "col": 0}
        ]})");
    }

    SECTION("Duplicate cell") {
        expect_rejected(R"({"grid": {"rows": 3, "cols": 3}, "cells": [
            {"row": 1, "col": 1}, {"row": 1, "col": 1}
        ]})");
    }

    SECTION("Colour channel out of range") {
        expect_rejected(R"({"grid": {"rows": 3, "cols": 3}, "cells": [
            {"row": 1, "col": 1, "color": {"r": 300, "g": 0, "b": 0}}
        ]})");
    }

    SECTION("Coordinate that only fits after 64-bit narrowing") {
        expect_rejected(R"({"grid": {"rows": 3, "cols": 3}, "cells": [
            {"row": 4294967296, "col": 0}
        ]})");
    }

    SECTION("Negative 64-bit coordinate") {
        expect_rejected(R"({"grid": {"rows": 3, "cols": 3}, "cells": [
            {"row": 0, "col": -4294967295}
        ]})");
    }

    SECTION("Dimension that only fits after 64-bit narrowing") {
        expect_rejected(
            R"({"grid": {"rows": 4294967306, "cols": 3}, "cells": []})");
    }

    SECTION("Dimension above the size limit") {
        expect_rejected(
            R"({"grid": {"rows": 100000, "cols": 100000}, "cells": []})");
    }

    SECTION("Colour channel beyond 64 bits signed") {
        expect_rejected(R"({"grid": {"rows": 3, "cols": 3}, "cells": [
            {"row": 1, "col": 1, "color": {"r": 18446744073709551615}}
        ]})");
    }

    SECTION("Non-string tag") {
        expect_rejected(R"({"grid": {"rows": 3, "cols": 3}, "cells": [
            {"row": 1, "col": 1, "tags": {"n": 4}}
        ]})");
    }
}

TEST_CASE("SaveManager - Minimal project uses defaults", "[save_manager]") {
    TempDir dir("gridpaint_test_minimal");
    SaveManager manager(dir.file("config"));
    const std::string path = dir.file("minimal.json");
    write_file(path, R"({"grid": {"rows": 2, "cols": 4, "cell_size": 1},
                         "cells": [{"row": 1, "col": 3}]})");

    SaveManager::ProjectData data;
    REQUIRE_NOTHROW(manager.load_project(path, data));
    REQUIRE(data.grid.rows == 2);
    REQUIRE(data.grid.cols == 4);
    REQUIRE(data.grid.cell_size == grid::GridConfig::MIN_CELL_SIZE);
    REQUIRE(data.cells.size() == 1);
    REQUIRE(*data.cells.get({1, 3}) == grid::CellRecord{});
}

TEST_CASE("SaveManager - Largest allowed grid loads", "[save_manager]") {
    TempDir dir("gridpaint_test_largest");
    SaveManager manager(dir.file("config"));
    const std::string path = dir.file("largest.json");
    write_file(path, R"({"grid": {"rows": 512, "cols": 512},
                         "cells": [{"row": 511, "col": 511}]})");

    SaveManager::ProjectData data;
    REQUIRE_NOTHROW(manager.load_project(path, data));
    REQUIRE(data.grid.rows == grid::GridConfig::MAX_DIMENSION);
    REQUIRE(data.cells.contains({511, 511}));
}

TEST_CASE("SaveManager - Recent files and config", "[save_manager]") {
    TempDir dir("gridpaint_test_recent");
    const std::string config_dir = dir.file("config");

    {
        SaveManager manager(config_dir);
        manager.clear_recent_files();

        for (int i = 0; i < 12; ++i)
            manager.add_to_recent("file" + std::to_string(i) + ".json");
        manager.add_to_recent("file5.json");
        manager.set_last_opened_file("file5.json");

        auto recent = manager.get_recent_files();
        REQUIRE(recent.size() == 10);
        REQUIRE(recent.front() == "file5.json");
        REQUIRE(std::count(recent.begin(), recent.end(), "file5.json") == 1);

        SaveManager::WindowState state;
        state.width = 1280;
        state.height = 720;
        state.x = 15;
        state.y = 30;
        manager.save_window_state(state);
    }

    SECTION("Config survives a restart") {
        SaveManager manager(config_dir);
        REQUIRE(manager.get_last_opened_file() == "file5.json");
        REQUIRE(manager.get_recent_files().size() == 10);

        auto state = manager.load_window_state();
        REQUIRE(state.width == 1280);
        REQUIRE(state.height == 720);
        REQUIRE(state.x == 15);
        REQUIRE(state.y == 30);
    }

    SECTION("Clearing recent files persists") {
        {
            SaveManager manager(config_dir);
            manager.clear_recent_files();
        }
        SaveManager manager(config_dir);
        REQUIRE(manager.get_recent_files().empty());
    }
}

TEST_CASE("SaveManager - File operation version", "[save_manager]") {
    TempDir dir("gridpaint_test_version");
    SaveManager manager(dir.file("config"));
    SaveManager::ProjectData data;

    const auto v0 = manager.get_file_operation_version();
    manager.new_project(data);
    REQUIRE(manager.get_file_operation_version() == v0 + 1);

    manager.save_project(dir.file("v.json"), data);
    REQUIRE(manager.get_file_operation_version() == v0 + 2);

    write_file(dir.file("broken.json"), "[]");
    REQUIRE_THROWS_AS(manager.load_project(dir.file("broken.json"), data),
                      gridpaint::IOError);
    REQUIRE(manager.get_file_operation_version() == v0 + 2);
}
