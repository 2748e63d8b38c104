#include "menu_bar_ui.hpp"

#include <algorithm>
#include <cstring>

#include <fmt/format.h>

#include "../../utility/exceptions.hpp"
#include "../../utility/logger.hpp"

void MenuBarUI::render(Context &ctx) {
    if (!ctx.rcfg.show_ui)
        return;
    render_ui(ctx);
}

void MenuBarUI::set_current_filepath(const std::string &filepath) {
    m_current_filepath = filepath;
}

void MenuBarUI::trigger_new_project(Context &ctx) { handle_new_project(ctx); }

void MenuBarUI::trigger_open_project(Context &ctx) {
    (void)ctx;
    m_pending_action = PendingAction::Open;
    open_path_prompt(m_current_filepath);
}

void MenuBarUI::trigger_save_project(Context &ctx) { handle_save_project(ctx); }

void MenuBarUI::trigger_save_as_project(Context &ctx) {
    (void)ctx;
    m_pending_action = PendingAction::SaveAs;
    open_path_prompt(m_current_filepath.empty() ? "grid.json"
                                                : m_current_filepath);
}

void MenuBarUI::capture_saved_state(const Context &ctx) {
    m_saved_history_version = ctx.editor.history().get_state_version();
    m_saved_file_version = ctx.save.get_file_operation_version();
}

bool MenuBarUI::has_unsaved_changes(const Context &ctx) const {
    if (ctx.save.get_file_operation_version() != m_saved_file_version) {
        return true;
    }
    return ctx.editor.history().get_state_version() != m_saved_history_version;
}

void MenuBarUI::render_ui(Context &ctx) {
    if (ImGui::BeginMainMenuBar()) {
        render_project_indicator(ctx);
        render_file_menu(ctx);
        render_edit_menu(ctx);
        render_windows_menu(ctx);
        ImGui::EndMainMenuBar();
    }

    render_path_prompt(ctx);
    render_error_popup();
}

void MenuBarUI::render_project_indicator(Context &ctx) {
    std::string name;
    if (m_current_filepath.empty()) {
        name = "<unsaved>";
    } else {
        size_t pos = m_current_filepath.find_last_of('/');
        if (pos == std::string::npos || pos + 1 >= m_current_filepath.size())
            name = m_current_filepath;
        else
            name = m_current_filepath.substr(pos + 1);
    }

    if (has_unsaved_changes(ctx)) {
        name = "*" + name;
    }

    std::string btn = "Project: " + name;
    if (ImGui::SmallButton(btn.c_str())) {
        trigger_open_project(ctx);
    }
    if (!m_current_filepath.empty() && ImGui::IsItemHovered()) {
        ImGui::SetTooltip("%s", m_current_filepath.c_str());
    }
    ImGui::SameLine();
}

void MenuBarUI::render_file_menu(Context &ctx) {
    if (ImGui::BeginMenu("File")) {
        if (ImGui::MenuItem("New", "Ctrl+N")) {
            handle_new_project(ctx);
        }
        if (ImGui::MenuItem("Open", "Ctrl+O")) {
            trigger_open_project(ctx);
        }
        if (ImGui::MenuItem("Save", "Ctrl+S")) {
            handle_save_project(ctx);
        }
        if (ImGui::MenuItem("Save As...", "Ctrl+Shift+S")) {
            trigger_save_as_project(ctx);
        }
        ImGui::Separator();

        auto recent_files = ctx.save.get_recent_files();
        if (!recent_files.empty()) {
            for (const auto &file : recent_files) {
                if (ImGui::MenuItem(file.c_str())) {
                    open_file(ctx, file);
                }
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Clear Recent Files")) {
                ctx.save.clear_recent_files();
            }
        }

        if (ImGui::MenuItem("Exit", "ESC")) {
            ctx.should_exit = true;
        }

        ImGui::EndMenu();
    }
}

void MenuBarUI::render_edit_menu(Context &ctx) {
    if (ImGui::BeginMenu("Edit")) {
        auto &editor = ctx.editor;
        if (ImGui::MenuItem("Undo", "Ctrl+Z", false,
                            editor.history().can_undo())) {
            editor.undo();
        }
        if (ImGui::MenuItem("Redo", "Ctrl+Y", false,
                            editor.history().can_redo())) {
            editor.redo();
        }
        ImGui::Separator();
        if (ImGui::MenuItem("Fill Enclosed Areas", "F")) {
            editor.fill_enclosed();
        }
        if (ImGui::MenuItem("Clear All", "Delete", false,
                            !editor.current().empty())) {
            editor.clear_all();
        }
        if (ImGui::MenuItem("Clear Out-of-Bounds Cells")) {
            editor.clamp_to_bounds(editor.config().rows, editor.config().cols);
        }
        ImGui::EndMenu();
    }
}

void MenuBarUI::render_windows_menu(Context &ctx) {
    if (ImGui::BeginMenu("Windows")) {
        if (ImGui::MenuItem("Toggle UI", "Tab")) {
            ctx.rcfg.show_ui = !ctx.rcfg.show_ui;
        }
        ImGui::Separator();
        ImGui::MenuItem("Grid", "1", &ctx.rcfg.show_controls);
        ImGui::MenuItem("Undo History", "2", &ctx.rcfg.show_history_ui);
        ImGui::MenuItem("Selected Cells", "3", &ctx.rcfg.show_cells_list);
        ImGui::Separator();
        ImGui::MenuItem("Grid Lines", "G", &ctx.rcfg.show_grid_lines);
        ImGui::EndMenu();
    }
}

void MenuBarUI::open_path_prompt(const std::string &initial) {
    m_path_buffer.fill('\0');
    const size_t n = std::min(initial.size(), m_path_buffer.size() - 1);
    std::memcpy(m_path_buffer.data(), initial.data(), n);
    m_prompt_requested = true;
}

void MenuBarUI::render_path_prompt(Context &ctx) {
    if (m_prompt_requested) {
        ImGui::OpenPopup("Project Path");
        m_prompt_requested = false;
    }

    if (!ImGui::BeginPopupModal("Project Path", nullptr,
                                ImGuiWindowFlags_AlwaysAutoResize)) {
        return;
    }

    const bool saving = m_pending_action == PendingAction::SaveAs;
    ImGui::TextUnformatted(saving ? "Save project as:" : "Open project:");
    ImGui::SetNextItemWidth(420.0f);
    const bool submitted =
        ImGui::InputText("##path", m_path_buffer.data(), m_path_buffer.size(),
                         ImGuiInputTextFlags_EnterReturnsTrue);

    bool close = false;
    if (ImGui::Button(saving ? "Save" : "Open") || submitted) {
        const std::string path(m_path_buffer.data());
        if (!path.empty()) {
            if (saving) {
                save_to(ctx, path);
            } else {
                open_file(ctx, path);
            }
            close = true;
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Cancel")) {
        close = true;
    }

    if (close) {
        m_pending_action = PendingAction::None;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void MenuBarUI::render_error_popup() {
    if (m_error_message.empty()) {
        return;
    }
    ImGui::OpenPopup("File Error");
    if (ImGui::BeginPopupModal("File Error", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::TextUnformatted(m_error_message.c_str());
        if (ImGui::Button("OK")) {
            m_error_message.clear();
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

SaveManager::ProjectData MenuBarUI::collect_project(const Context &ctx) const {
    SaveManager::ProjectData data;
    data.grid = ctx.editor.config();
    data.paint = ctx.editor.paint();
    data.cells = ctx.editor.current();
    return data;
}

void MenuBarUI::handle_new_project(Context &ctx) {
    SaveManager::ProjectData data;
    ctx.save.new_project(data);

    ctx.editor.load(data.grid, std::move(data.cells), "New project");
    ctx.editor.set_paint(data.paint);

    m_current_filepath.clear();
    capture_saved_state(ctx);
}

void MenuBarUI::handle_save_project(Context &ctx) {
    if (m_current_filepath.empty()) {
        trigger_save_as_project(ctx);
        return;
    }
    save_to(ctx, m_current_filepath);
}

void MenuBarUI::save_to(Context &ctx, const std::string &filepath) {
    try {
        ctx.save.save_project(filepath, collect_project(ctx));
    } catch (const gridpaint::IOError &e) {
        LOG_ERROR("Failed to save project: " + std::string(e.what()));
        m_error_message = fmt::format("Failed to save project to '{}':\n{}",
                                      filepath, e.what());
        return;
    }

    m_current_filepath = filepath;
    capture_saved_state(ctx);
    LOG_INFO("Project saved successfully to: " + filepath);
}

bool MenuBarUI::open_file(Context &ctx, const std::string &filepath) {
    SaveManager::ProjectData data;
    try {
        ctx.save.load_project(filepath, data);
    } catch (const gridpaint::IOError &e) {
        // Session stays as it was
        LOG_ERROR("Failed to load project: " + std::string(e.what()));
        m_error_message = fmt::format("Failed to load project from '{}':\n{}",
                                      filepath, e.what());
        return false;
    }

    std::string name = filepath;
    size_t pos = filepath.find_last_of('/');
    if (pos != std::string::npos && pos + 1 < filepath.size())
        name = filepath.substr(pos + 1);

    ctx.editor.load(data.grid, std::move(data.cells), "Open " + name);
    ctx.editor.set_paint(data.paint);

    m_current_filepath = filepath;
    capture_saved_state(ctx);
    LOG_INFO("Project loaded successfully from: " + filepath);
    return true;
}
