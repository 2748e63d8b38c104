#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <set>

#ifndef _WIN32
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include <fmt/format.h>

#include "save_manager.hpp"
#include "utility/logger.hpp"

static std::string get_home_directory() {
#if defined(_WIN32)
    const char *home = getenv("USERPROFILE");
    if (home && *home) {
        return std::string(home);
    }
    const char *drive = getenv("HOMEDRIVE");
    const char *path = getenv("HOMEPATH");
    if (drive && path) {
        return std::string(drive) + std::string(path);
    }
    return std::string(".");
#else
    const char *home = getenv("HOME");
    if (home && *home) {
        return std::string(home);
    }
    struct passwd *pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
    return std::string(".");
#endif
}

// JSON integer within [lo, hi], without narrowing 64-bit values first.
static std::optional<int> checked_int(const json &v, std::int64_t lo,
                                      std::int64_t hi) {
    if (!v.is_number_integer()) {
        return std::nullopt;
    }
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (hi < 0 || u > static_cast<std::uint64_t>(hi) ||
            static_cast<std::int64_t>(u) < lo) {
            return std::nullopt;
        }
        return static_cast<int>(u);
    }
    const auto i = v.get<std::int64_t>();
    if (i < lo || i > hi) {
        return std::nullopt;
    }
    return static_cast<int>(i);
}

SaveManager::SaveManager(std::string config_dir)
    : m_config_dir(std::move(config_dir)) {
    if (m_config_dir.empty()) {
        m_config_dir = get_home_directory() + "/.gridpaint";
    }
    load_config();
}

void SaveManager::save_project(const std::string &filepath,
                               const ProjectData &data) {
    LOG_INFO("Saving project to: " + filepath);

    try {
        json j = project_to_json(data);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            throw gridpaint::IOError("Failed to open file for writing: " +
                                     filepath);
        }

        file << j.dump(2);
        file.close();
        if (file.fail()) {
            throw gridpaint::IOError("Failed to write file: " + filepath);
        }

        add_to_recent(filepath);
        set_last_opened_file(filepath);
        ++m_file_operation_version;

        LOG_INFO("Project saved successfully");
    } catch (const gridpaint::IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON serialization error: " + std::string(e.what()));
        throw gridpaint::IOError("JSON serialization failed: " +
                                 std::string(e.what()));
    }
}

void SaveManager::load_project(const std::string &filepath, ProjectData &data) {
    LOG_INFO("Loading project from: " + filepath);

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw gridpaint::IOError("Failed to open file for reading: " +
                                     filepath);
        }

        json j;
        file >> j;
        file.close();

        // Only hand the result over once the whole file validated
        ProjectData loaded = json_to_project(j);
        data = std::move(loaded);

        add_to_recent(filepath);
        set_last_opened_file(filepath);
        ++m_file_operation_version;

        LOG_INFO(fmt::format("Project loaded successfully: {}x{}, {} cells",
                             data.grid.rows, data.grid.cols,
                             data.cells.size()));
    } catch (const gridpaint::IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: " + std::string(e.what()));
        throw gridpaint::IOError("JSON parsing failed: " +
                                 std::string(e.what()));
    }
}

void SaveManager::new_project(ProjectData &data) {
    LOG_INFO("Creating new project");
    data.grid = {};
    data.grid.rows = 10;
    data.grid.cols = 10;
    data.grid.cell_size = 30;

    data.paint = {};
    data.paint.color = {255, 255, 0, 255};
    data.paint.outline = true;

    data.cells.clear();
    ++m_file_operation_version;

    LOG_INFO("New project created successfully");
}

json SaveManager::project_to_json(const ProjectData &data) const {
    json j;
    j["grid"] = grid_config_to_json(data.grid);
    j["paint"] = {{"color", color_to_json(data.paint.color)},
                  {"outline", data.paint.outline}};
    if (!data.paint.tags.empty()) {
        j["paint"]["tags"] = data.paint.tags;
    }

    j["cells"] = json::array();
    for (const auto &[c, rec] : data.cells.cells()) {
        j["cells"].push_back(cell_to_json(c, rec));
    }
    return j;
}

SaveManager::ProjectData SaveManager::json_to_project(const json &j) const {
    if (!j.is_object()) {
        throw gridpaint::IOError("project root is not an object");
    }
    if (!j.contains("grid")) {
        throw gridpaint::IOError("project has no \"grid\" section");
    }
    if (!j.contains("cells") || !j["cells"].is_array()) {
        throw gridpaint::IOError("project has no \"cells\" array");
    }

    ProjectData data;
    try {
        data.grid = json_to_grid_config(j["grid"]);
    } catch (const gridpaint::ConfigError &e) {
        throw gridpaint::IOError(e.what());
    }

    if (j.contains("paint")) {
        data.paint = json_to_record(j["paint"], "paint");
    }

    std::set<grid::Coord> seen;
    size_t index = 0;
    for (const auto &cell : j["cells"]) {
        const std::string where = fmt::format("cells[{}]", index++);
        if (!cell.is_object() || !cell.contains("row") ||
            !cell.contains("col") || !cell["row"].is_number_integer() ||
            !cell["col"].is_number_integer()) {
            throw gridpaint::IOError(where + " needs integer row and col");
        }

        const auto row = checked_int(cell["row"], 0, data.grid.rows - 1);
        const auto col = checked_int(cell["col"], 0, data.grid.cols - 1);
        if (!row || !col) {
            throw gridpaint::IOError(fmt::format(
                "{} at ({}, {}) is outside the {}x{} grid", where,
                cell["row"].dump(), cell["col"].dump(), data.grid.rows,
                data.grid.cols));
        }

        const grid::Coord c{*row, *col};
        if (!seen.insert(c).second) {
            throw gridpaint::IOError(
                fmt::format("{} duplicates cell {}", where, c));
        }

        data.cells.set(c, json_to_record(cell, where));
    }

    return data;
}

json SaveManager::color_to_json(const grid::Rgba &color) const {
    return json{{"r", color.r}, {"g", color.g}, {"b", color.b}, {"a", color.a}};
}

grid::Rgba SaveManager::json_to_color(const json &j,
                                      const std::string &where) const {
    if (!j.is_object()) {
        throw gridpaint::IOError(where + ".color is not an object");
    }

    auto channel = [&](const char *key, int fallback) -> std::uint8_t {
        if (!j.contains(key)) {
            return static_cast<std::uint8_t>(fallback);
        }
        const auto v = checked_int(j[key], 0, 255);
        if (!v) {
            throw gridpaint::IOError(
                fmt::format("{}.color.{} must be an integer 0..255", where, key));
        }
        return static_cast<std::uint8_t>(*v);
    };

    return grid::Rgba{channel("r", 0), channel("g", 0), channel("b", 0),
                      channel("a", 255)};
}

json SaveManager::cell_to_json(const grid::Coord &c,
                               const grid::CellRecord &rec) const {
    json cell;
    cell["row"] = c.row;
    cell["col"] = c.col;
    cell["color"] = color_to_json(rec.color);
    cell["outline"] = rec.outline;
    if (!rec.tags.empty()) {
        cell["tags"] = rec.tags;
    }
    return cell;
}

grid::CellRecord SaveManager::json_to_record(const json &j,
                                             const std::string &where) const {
    if (!j.is_object()) {
        throw gridpaint::IOError(where + " is not an object");
    }

    grid::CellRecord rec;
    if (j.contains("color")) {
        rec.color = json_to_color(j["color"], where);
    }
    if (j.contains("outline")) {
        if (!j["outline"].is_boolean()) {
            throw gridpaint::IOError(where + ".outline must be a boolean");
        }
        rec.outline = j["outline"].get<bool>();
    }
    if (j.contains("tags")) {
        const json &tags = j["tags"];
        if (!tags.is_object()) {
            throw gridpaint::IOError(where + ".tags must be an object");
        }
        for (auto it = tags.begin(); it != tags.end(); ++it) {
            if (!it.value().is_string()) {
                throw gridpaint::IOError(fmt::format(
                    "{}.tags.{} must be a string", where, it.key()));
            }
            rec.tags[it.key()] = it.value().get<std::string>();
        }
    }
    return rec;
}

json SaveManager::grid_config_to_json(const grid::GridConfig &config) const {
    return json{{"rows", config.rows},
                {"cols", config.cols},
                {"cell_size", config.cell_size}};
}

grid::GridConfig SaveManager::json_to_grid_config(const json &j) const {
    if (!j.is_object()) {
        throw gridpaint::ConfigError("grid is not an object");
    }

    auto dimension = [&](const char *key) {
        if (!j.contains(key) || !j[key].is_number_integer()) {
            throw gridpaint::ConfigError(
                fmt::format("grid.{} must be an integer", key));
        }
        const auto v =
            checked_int(j[key], 1, grid::GridConfig::MAX_DIMENSION);
        if (!v) {
            throw gridpaint::ConfigError(
                fmt::format("grid.{} must be in 1..{}, got {}", key,
                            grid::GridConfig::MAX_DIMENSION, j[key].dump()));
        }
        return *v;
    };

    grid::GridConfig config;
    config.rows = dimension("rows");
    config.cols = dimension("cols");
    if (j.contains("cell_size")) {
        const auto size = checked_int(j["cell_size"], 0, 1 << 16);
        if (!size) {
            throw gridpaint::ConfigError(
                "grid.cell_size must be an integer 0..65536");
        }
        config.cell_size = grid::GridConfig::clamp_cell_size(*size);
    }
    return config;
}

void SaveManager::add_to_recent(const std::string &filepath) {
    auto it = std::find(m_recent_files.begin(), m_recent_files.end(), filepath);
    if (it != m_recent_files.end()) {
        m_recent_files.erase(it);
    }

    m_recent_files.insert(m_recent_files.begin(), filepath);

    if (m_recent_files.size() > MAX_RECENT_FILES) {
        m_recent_files.resize(MAX_RECENT_FILES);
    }

    save_config();
}

std::vector<std::string> SaveManager::get_recent_files() const {
    return m_recent_files;
}

void SaveManager::clear_recent_files() {
    m_recent_files.clear();
    save_config();
}

std::string SaveManager::get_last_opened_file() const { return m_last_file; }

void SaveManager::set_last_opened_file(const std::string &filepath) {
    m_last_file = filepath;
    save_config();
}

std::string SaveManager::get_config_path() const {
    return m_config_dir + "/" + CONFIG_FILE;
}

json SaveManager::read_config_json() const {
    std::ifstream file(get_config_path());
    if (!file.is_open()) {
        return json::object();
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("Ignoring unreadable config " + get_config_path());
        return json::object();
    }
    return j;
}

void SaveManager::update_config(const char *key, json value) {
    try {
        json j = read_config_json();
        j[key] = std::move(value);

        const std::filesystem::path config_path(get_config_path());
        std::filesystem::create_directories(config_path.parent_path());

        std::ofstream out_file(config_path);
        if (!out_file.is_open()) {
            throw gridpaint::IOError("cannot write " + config_path.string());
        }
        out_file << j.dump(2);
    } catch (const std::exception &e) {
        std::cerr << "Error saving config: " << e.what() << std::endl;
    }
}

void SaveManager::save_config() {
    update_config(RECENT_FILES_KEY, m_recent_files);
    update_config(LAST_FILE_KEY, m_last_file);
}

void SaveManager::save_window_state(const WindowState &state) {
    update_config(WINDOW_STATE_KEY, json{{"width", state.width},
                                         {"height", state.height},
                                         {"x", state.x},
                                         {"y", state.y}});
}

SaveManager::WindowState SaveManager::load_window_state() const {
    WindowState state;
    const json j = read_config_json();
    const auto it = j.find(WINDOW_STATE_KEY);
    if (it == j.end() || !it->is_object()) {
        return state;
    }

    try {
        state.width = it->value("width", state.width);
        state.height = it->value("height", state.height);
        state.x = it->value("x", state.x);
        state.y = it->value("y", state.y);
    } catch (const json::exception &e) {
        std::cerr << "Error loading window state: " << e.what() << std::endl;
        return WindowState{};
    }
    return state;
}

void SaveManager::load_config() {
    LOG_INFO("Loading config from " + get_config_path());
    const json j = read_config_json();

    try {
        if (j.contains(RECENT_FILES_KEY)) {
            m_recent_files =
                j[RECENT_FILES_KEY].get<std::vector<std::string>>();
        }
        if (j.contains(LAST_FILE_KEY)) {
            m_last_file = j[LAST_FILE_KEY].get<std::string>();
        }
    } catch (const json::exception &e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
    }
}
