#pragma once

#include <array>
#include <string>

#include <imgui.h>

#include "../../save_manager.hpp"
#include "../irenderer.hpp"

/**
 * @brief Main menu bar: project files, edit commands and window toggles
 */
class MenuBarUI : public IRenderer {
  public:
    MenuBarUI() = default;
    ~MenuBarUI() override = default;
    MenuBarUI(const MenuBarUI &) = delete;
    MenuBarUI &operator=(const MenuBarUI &) = delete;
    MenuBarUI(MenuBarUI &&) = delete;
    MenuBarUI &operator=(MenuBarUI &&) = delete;

    /**
     * @brief Render the menu bar UI
     * @param ctx The rendering context containing editor and UI state
     */
    void render(Context &ctx) override;

    /**
     * @brief Set the current file path for the project
     * @param filepath The path to the current project file
     */
    void set_current_filepath(const std::string &filepath);

    /**
     * @brief Trigger new project creation
     * @param ctx The rendering context
     */
    void trigger_new_project(Context &ctx);

    /**
     * @brief Trigger open project prompt
     * @param ctx The rendering context
     */
    void trigger_open_project(Context &ctx);

    /**
     * @brief Trigger save project
     * @param ctx The rendering context
     */
    void trigger_save_project(Context &ctx);

    /**
     * @brief Trigger save as project prompt
     * @param ctx The rendering context
     */
    void trigger_save_as_project(Context &ctx);

    /**
     * @brief Open a project file directly, replacing the session on success
     * @param ctx The rendering context
     * @param filepath The path to the file to open
     * @return True if the file was loaded; on failure the session is kept
     */
    bool open_file(Context &ctx, const std::string &filepath);

    /**
     * @brief Remember the current history/file versions as "saved"
     */
    void capture_saved_state(const Context &ctx);

    /**
     * @brief Whether the session changed since the last new/open/save
     */
    bool has_unsaved_changes(const Context &ctx) const;

  private:
    void render_ui(Context &ctx);
    void render_project_indicator(Context &ctx);
    void render_file_menu(Context &ctx);
    void render_edit_menu(Context &ctx);
    void render_windows_menu(Context &ctx);

    /**
     * @brief Render the path prompt used by Open and Save As
     */
    void render_path_prompt(Context &ctx);

    /**
     * @brief Render the error popup if an operation failed
     */
    void render_error_popup();

    void handle_new_project(Context &ctx);
    void handle_save_project(Context &ctx);

    /**
     * @brief Save the session to @p filepath and make it the current file
     *
     * On failure the error is shown in a popup and the current file stays.
     */
    void save_to(Context &ctx, const std::string &filepath);
    void open_path_prompt(const std::string &initial);

    /**
     * @brief Collect the session into project data
     */
    SaveManager::ProjectData collect_project(const Context &ctx) const;

    /** @brief Enumeration of pending file operations */
    enum class PendingAction { None, Open, SaveAs };

    /** @brief Currently pending file operation */
    PendingAction m_pending_action = PendingAction::None;

    /** @brief Current project file path */
    std::string m_current_filepath;

    /** @brief Path typed into the prompt */
    std::array<char, 1024> m_path_buffer{};

    bool m_prompt_requested = false;

    /** @brief Last file error shown to the user, empty when none */
    std::string m_error_message;

    unsigned long long m_saved_history_version = 0;
    unsigned long long m_saved_file_version = 0;
};
