#include <iostream>
#include <string>

#include <fmt/format.h>
#include <imgui.h>
#include <raylib.h>
#include <rlImGui.h>

#include "editor/grid_editor.hpp"
#include "input/key_manager.hpp"
#include "input/keys.hpp"
#include "render/manager.hpp"
#include "render/types/config.hpp"
#include "render/types/context.hpp"
#include "render/types/window.hpp"
#include "save_manager.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

void run() {
    LOG_INFO("Starting gridpaint application");
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);

    SaveManager save_manager;
    auto window_state = save_manager.load_window_state();
    std::string last_file = save_manager.get_last_opened_file();

    InitWindow(window_state.width, window_state.height, "Gridpaint");
    if (!IsWindowReady()) {
        throw gridpaint::RenderError("failed to create window");
    }

    WindowConfig wcfg = {GetScreenWidth(), GetScreenHeight()};
    if (window_state.width != 0 || window_state.height != 0) {
        wcfg.screen_width = window_state.width;
        wcfg.screen_height = window_state.height;
    }

    if (window_state.x != 0 || window_state.y != 0) {
        SetWindowPosition(window_state.x, window_state.y);
    }

    SetWindowSize(wcfg.screen_width, wcfg.screen_height);
    SetTargetFPS(60);
    rlImGuiSetup(true);

    ImGui::GetIO().IniFilename = nullptr;

    GridEditor editor;
    Config rcfg;
    Context ctx(editor, rcfg, wcfg, save_manager);
    RenderManager rman;
    auto &menu_bar = rman.get_menu_bar();

    // Reopen the last project, otherwise start a blank one
    if (last_file.empty() || !menu_bar.open_file(ctx, last_file)) {
        if (!last_file.empty()) {
            LOG_WARN("Could not reopen " + last_file);
        }
        menu_bar.trigger_new_project(ctx);
    }

    KeyManager key_manager;
    setup_keys(key_manager, ctx, menu_bar);

    while (!WindowShouldClose()) {
        if (IsWindowResized()) {
            wcfg.screen_width = GetScreenWidth();
            wcfg.screen_height = GetScreenHeight();
            LOG_INFO(fmt::format("Window resized to {}x{}", wcfg.screen_width,
                                 wcfg.screen_height));
        }

        if (rman.draw_frame(ctx))
            break;

        // Check ImGui capture state
        bool imgui_mouse_captured = false;
        bool imgui_keyboard_captured = false;
        if (rcfg.show_ui) {
            ImGuiIO &io = ImGui::GetIO();
            imgui_mouse_captured = io.WantCaptureMouse;
            imgui_keyboard_captured = io.WantCaptureKeyboard;
        }

        key_manager.process(imgui_keyboard_captured);
        if (ctx.should_exit)
            break;

        // Click toggles the cell under the cursor
        if (!imgui_mouse_captured && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
            if (auto cell = rman.get_grid().pick(ctx, GetMousePosition())) {
                editor.toggle_cell(*cell);
            }
        }
    }

    SaveManager::WindowState current_state;
    current_state.width = GetScreenWidth();
    current_state.height = GetScreenHeight();
    current_state.x = static_cast<int>(GetWindowPosition().x);
    current_state.y = static_cast<int>(GetWindowPosition().y);
    save_manager.save_window_state(current_state);

    rlImGuiShutdown();
    CloseWindow();
}

int main() {
    try {
        run();
        LOG_INFO("Application shutting down normally");
        return 0;
    } catch (const gridpaint::GridpaintException &e) {
        LOG_ERROR("Gridpaint error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: " + std::string(e.what()));
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
