#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "grid/cell_record.hpp"
#include "grid/cell_store.hpp"
#include "grid/grid_config.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

using json = nlohmann::json;

/**
 * @brief Manages saving and loading of grid projects and application
 * configuration.
 *
 * A project file holds the grid dimensions, the paint in use and the active
 * cells. The application config keeps recent files, the last opened file and
 * the window state.
 */
class SaveManager {
  public:
    /**
     * @brief Complete project data: everything needed to restore a session.
     */
    struct ProjectData {
        /** @brief Grid dimensions and cell size */
        grid::GridConfig grid;

        /** @brief Attributes applied by toggles and fills */
        grid::CellRecord paint;

        /** @brief Active cells */
        grid::CellStore cells;
    };

    /**
     * @brief Window state for persistence across application sessions.
     */
    struct WindowState {
        /** @brief Window width in pixels */
        int width = 1080;
        /** @brief Window height in pixels */
        int height = 800;
        /** @brief Window X position in pixels */
        int x = 0;
        /** @brief Window Y position in pixels */
        int y = 0;
    };

    /**
     * @brief Create a manager and load the application config.
     * @param config_dir Directory holding the config file; empty selects
     * ~/.gridpaint
     */
    explicit SaveManager(std::string config_dir = "");
    ~SaveManager() = default;

    // Delete copy and move semantics
    SaveManager(const SaveManager &) = delete;
    SaveManager &operator=(const SaveManager &) = delete;
    SaveManager(SaveManager &&) = delete;
    SaveManager &operator=(SaveManager &&) = delete;

    /**
     * @brief Save project data to specified file path.
     * @param filepath Path where to save the project file
     * @param data Project data to serialize and save
     * @throws gridpaint::IOError if file operations fail
     */
    void save_project(const std::string &filepath, const ProjectData &data);

    /**
     * @brief Load project data from specified file path.
     *
     * The file is parsed and validated completely before @p data is touched;
     * on any error @p data is left unchanged.
     * @param filepath Path to the project file to load
     * @param data Project data structure to populate with loaded data
     * @throws gridpaint::IOError if the file cannot be read or is malformed
     */
    void load_project(const std::string &filepath, ProjectData &data);

    /**
     * @brief Initialize new project with default values.
     * @param data Project data structure to initialize with defaults
     */
    void new_project(ProjectData &data);

    /**
     * @brief Serialize a project to JSON.
     */
    json project_to_json(const ProjectData &data) const;

    /**
     * @brief Build a project from JSON, rejecting anything malformed.
     * @throws gridpaint::IOError describing the first problem found
     */
    ProjectData json_to_project(const json &j) const;

    /**
     * @brief Add file path to recent files list.
     * @param filepath Path to add to recent files
     */
    void add_to_recent(const std::string &filepath);

    /**
     * @brief Get list of recently opened files.
     * @return Vector of recent file paths
     */
    std::vector<std::string> get_recent_files() const;

    /**
     * @brief Clear all recent files from the list.
     */
    void clear_recent_files();

    /**
     * @brief Get the last opened file path.
     * @return Path to the last opened file, empty if none
     */
    std::string get_last_opened_file() const;

    /**
     * @brief Set the last opened file path.
     * @param filepath Path to set as last opened file
     */
    void set_last_opened_file(const std::string &filepath);

    /**
     * @brief Save window state for persistence.
     * @param state Window state to save
     */
    void save_window_state(const WindowState &state);

    /**
     * @brief Load previously saved window state.
     * @return Window state loaded from configuration
     */
    WindowState load_window_state() const;

    /**
     * @brief Counter bumped by every successful new, save and load.
     */
    unsigned long long get_file_operation_version() const {
        return m_file_operation_version;
    }

    /**
     * @brief Get path to configuration file.
     * @return Full path to the configuration file
     */
    std::string get_config_path() const;

  private:
    json color_to_json(const grid::Rgba &color) const;
    grid::Rgba json_to_color(const json &j, const std::string &where) const;

    json cell_to_json(const grid::Coord &c, const grid::CellRecord &rec) const;
    grid::CellRecord json_to_record(const json &j,
                                    const std::string &where) const;

    json grid_config_to_json(const grid::GridConfig &config) const;

    /**
     * @throws gridpaint::ConfigError on missing or non-positive dimensions
     */
    grid::GridConfig json_to_grid_config(const json &j) const;

    /**
     * @brief Parsed config file, an empty object if missing or unreadable.
     */
    json read_config_json() const;

    /**
     * @brief Replace one top-level key of the config file, keeping the rest.
     */
    void update_config(const char *key, json value);

    /**
     * @brief Save recent files and the last opened file.
     */
    void save_config();

    /**
     * @brief Load configuration from file.
     */
    void load_config();

    /** @brief Directory holding the configuration file */
    std::string m_config_dir;

    /** @brief List of recently opened file paths */
    std::vector<std::string> m_recent_files;

    /** @brief Path to the last opened file */
    std::string m_last_file;

    unsigned long long m_file_operation_version = 0;

    /** @brief Maximum number of recent files to keep */
    static constexpr size_t MAX_RECENT_FILES = 10;

    /** @brief JSON key for recent files array */
    static constexpr const char *RECENT_FILES_KEY = "recent_files";

    /** @brief JSON key for last opened file */
    static constexpr const char *LAST_FILE_KEY = "last_file";

    /** @brief JSON key for window state */
    static constexpr const char *WINDOW_STATE_KEY = "window_state";

    /** @brief Configuration file name */
    static constexpr const char *CONFIG_FILE = "gridpaint_config.json";
};
