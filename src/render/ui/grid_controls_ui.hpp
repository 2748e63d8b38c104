#pragma once

#include <array>

#include <imgui.h>

#include "../../grid/cell_record.hpp"
#include "../irenderer.hpp"

/**
 * @brief Grid dimensions, paint selection and the bulk edit buttons.
 */
class GridControlsUI : public IRenderer {
  public:
    GridControlsUI() = default;
    ~GridControlsUI() override = default;
    GridControlsUI(const GridControlsUI &) = delete;
    GridControlsUI &operator=(const GridControlsUI &) = delete;
    GridControlsUI(GridControlsUI &&) = delete;
    GridControlsUI &operator=(GridControlsUI &&) = delete;

    void render(Context &ctx) override {
        if (!ctx.rcfg.show_ui || !ctx.rcfg.show_controls)
            return;
        render_ui(ctx);
    }

  private:
    void render_ui(Context &ctx);
    void render_dimensions_section(Context &ctx);
    void render_paint_section(Context &ctx);
    void render_actions_section(Context &ctx);

    static constexpr std::array<grid::Rgba, 8> PALETTE = {{
        {255, 255, 0, 255},   // yellow
        {230, 41, 55, 255},   // red
        {255, 161, 0, 255},   // orange
        {0, 228, 48, 255},    // green
        {0, 121, 241, 255},   // blue
        {200, 122, 255, 255}, // purple
        {80, 80, 80, 255},    // dark grey
        {0, 0, 0, 255},       // black
    }};
};
