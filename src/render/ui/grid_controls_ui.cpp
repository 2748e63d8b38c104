#include "grid_controls_ui.hpp"

#include <fmt/format.h>

#include "../../grid/bounds_guard.hpp"
#include "../color_convert.hpp"

void GridControlsUI::render_ui(Context &ctx) {
    ImGui::Begin("[1] Grid", &ctx.rcfg.show_controls);
    ImGui::SetWindowSize(ImVec2{320, 420}, ImGuiCond_FirstUseEver);
    ImGui::SetWindowPos(ImVec2{680, 460}, ImGuiCond_FirstUseEver);

    render_dimensions_section(ctx);
    render_paint_section(ctx);
    render_actions_section(ctx);

    ImGui::End();
}

void GridControlsUI::render_dimensions_section(Context &ctx) {
    auto &editor = ctx.editor;
    const auto &cfg = editor.config();

    ImGui::SeparatorText("Dimensions");

    int cell_size = cfg.cell_size;
    if (ImGui::SliderInt("Cell Size", &cell_size,
                         grid::GridConfig::MIN_CELL_SIZE,
                         grid::GridConfig::MAX_CELL_SIZE, "%dpx")) {
        editor.set_cell_size(cell_size);
    }

    int rows = cfg.rows;
    int cols = cfg.cols;
    bool changed = false;
    changed |= ImGui::SliderInt("Row Count", &rows, grid::GridConfig::MIN_COUNT,
                                grid::GridConfig::MAX_COUNT);
    changed |= ImGui::SliderInt("Column Count", &cols,
                                grid::GridConfig::MIN_COUNT,
                                grid::GridConfig::MAX_COUNT);
    if (changed) {
        editor.resize(rows, cols);
    }
}

void GridControlsUI::render_paint_section(Context &ctx) {
    auto &editor = ctx.editor;
    grid::CellRecord paint = editor.paint();
    bool changed = false;

    ImGui::SeparatorText("Paint");

    for (size_t i = 0; i < PALETTE.size(); ++i) {
        if (i > 0)
            ImGui::SameLine();
        const bool selected = PALETTE[i] == paint.color;
        if (selected) {
            ImGui::PushStyleVar(ImGuiStyleVar_FrameBorderSize, 2.0f);
        }
        if (ImGui::ColorButton(fmt::format("##palette{}", i).c_str(),
                               to_imvec4(PALETTE[i]), 0, ImVec2(24, 24))) {
            paint.color = PALETTE[i];
            changed = true;
        }
        if (selected) {
            ImGui::PopStyleVar();
        }
    }

    ImVec4 custom = to_imvec4(paint.color);
    if (ImGui::ColorEdit4("Custom", (float *)&custom,
                          ImGuiColorEditFlags_NoAlpha)) {
        paint.color = to_rgba(custom);
        changed = true;
    }

    changed |= ImGui::Checkbox("Outline", &paint.outline);

    if (changed) {
        editor.set_paint(paint);
    }
}

void GridControlsUI::render_actions_section(Context &ctx) {
    auto &editor = ctx.editor;
    const auto &cfg = editor.config();

    ImGui::SeparatorText("Actions");

    if (ImGui::Button("Fill Enclosed Areas")) {
        editor.fill_enclosed();
    }

    const bool has_cells = !editor.current().empty();
    if (!has_cells)
        ImGui::BeginDisabled();
    if (ImGui::Button("Clear All")) {
        editor.clear_all();
    }
    if (!has_cells)
        ImGui::EndDisabled();

    const size_t outside =
        grid::count_out_of_bounds(editor.current(), cfg.rows, cfg.cols);
    if (outside == 0)
        ImGui::BeginDisabled();
    if (ImGui::Button("Clear Out-of-Bounds Cells")) {
        editor.clamp_to_bounds(cfg.rows, cfg.cols);
    }
    if (outside == 0)
        ImGui::EndDisabled();

    ImGui::Separator();
    ImGui::Text("%zu active cells", editor.current().size());
}
