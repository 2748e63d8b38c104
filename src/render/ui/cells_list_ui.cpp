#include "cells_list_ui.hpp"

#include <fmt/format.h>

#include "../color_convert.hpp"

void CellsListUI::render(Context &ctx) {
    if (!ctx.rcfg.show_ui || !ctx.rcfg.show_cells_list)
        return;

    ImGui::Begin("[3] Selected cells", &ctx.rcfg.show_cells_list);
    ImGui::SetWindowSize(ImVec2{260, 400}, ImGuiCond_FirstUseEver);

    const auto cells = ctx.editor.enumerate_active();
    ImGui::Text("%zu active", cells.size());
    ImGui::Separator();

    for (const auto &[c, rec] : cells) {
        ImGui::ColorButton(fmt::format("##swatch{}_{}", c.row, c.col).c_str(),
                           to_imvec4(rec.color),
                           ImGuiColorEditFlags_NoTooltip, ImVec2(12, 12));
        ImGui::SameLine();
        ImGui::Text("[row: %d, col: %d]", c.row, c.col);
    }

    ImGui::End();
}
