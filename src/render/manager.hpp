#pragma once

#include <imgui.h>
#include <raylib.h>
#include <rlImGui.h>

#include "grid_renderer.hpp"
#include "types/context.hpp"
#include "ui/cells_list_ui.hpp"
#include "ui/grid_controls_ui.hpp"
#include "ui/history_ui.hpp"
#include "ui/menu_bar_ui.hpp"

// Frame orchestration: grid first, ImGui windows on top.
class RenderManager {
  public:
    RenderManager() = default;
    RenderManager(const RenderManager &) = delete;
    RenderManager &operator=(const RenderManager &) = delete;

    bool draw_frame(Context &ctx) {
        BeginDrawing();
        ClearBackground(ctx.rcfg.background_color);

        m_grid.render(ctx);

        rlImGuiBegin();
        {
            m_menu_bar.render(ctx);
            m_controls.render(ctx);
            m_history.render(ctx);
            m_cells.render(ctx);
        }
        rlImGuiEnd();

        EndDrawing();

        return ctx.should_exit;
    }

    GridRenderer &get_grid() { return m_grid; }
    MenuBarUI &get_menu_bar() { return m_menu_bar; }

  private:
    GridRenderer m_grid;
    MenuBarUI m_menu_bar;
    GridControlsUI m_controls;
    HistoryUI m_history;
    CellsListUI m_cells;
};
