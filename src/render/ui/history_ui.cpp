#include "history_ui.hpp"

#include <fmt/format.h>

void HistoryUI::render(Context &ctx) {
    if (!ctx.rcfg.show_ui || !ctx.rcfg.show_history_ui) {
        return;
    }
    render_ui(ctx);
}

void HistoryUI::render_ui(Context &ctx) {
    ImGui::Begin("[2] Undo History", &ctx.rcfg.show_history_ui);
    ImGui::SetWindowSize(ImVec2{360, 400}, ImGuiCond_FirstUseEver);
    ImGui::SetWindowPos(ImVec2{680, 50}, ImGuiCond_FirstUseEver);

    auto &editor = ctx.editor;
    const auto &log = editor.history();

    if (!log.can_undo())
        ImGui::BeginDisabled();
    if (ImGui::Button("Undo"))
        editor.undo();
    if (!log.can_undo())
        ImGui::EndDisabled();
    ImGui::SameLine();
    if (!log.can_redo())
        ImGui::BeginDisabled();
    if (ImGui::Button("Redo"))
        editor.redo();
    if (!log.can_redo())
        ImGui::EndDisabled();

    ImGui::BeginChild("HistoryList",
                      ImVec2(0, -ImGui::GetFrameHeightWithSpacing()), false,
                      ImGuiWindowFlags_HorizontalScrollbar);

    // Copy: a click below may jump and the list must stay stable this frame
    const auto entries = log.entries();
    const size_t pointer = log.pointer();
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto &entry = entries[i];
        const bool is_current = i == pointer;
        const bool is_future = i > pointer;

        if (is_current) {
            ImGui::PushStyleColor(ImGuiCol_Text,
                                  ImVec4(0.0f, 1.0f, 0.0f, 1.0f));
        } else if (is_future) {
            ImGui::PushStyleColor(ImGuiCol_Text,
                                  ImGui::GetStyleColorVec4(ImGuiCol_TextDisabled));
        }

        std::string line =
            fmt::format("[{}] {} ({} cells)##{}",
                        format_timestamp(entry.timestamp), entry.label,
                        entry.size(), i);
        if (ImGui::Selectable(line.c_str(), is_current)) {
            editor.jump_to(i);
        }
        if (ImGui::IsItemHovered()) {
            if (entry.kind == HistoryLog::Kind::ClearAll && entry.cleared_from) {
                render_entry_cells("Removed", *entry.cleared_from);
            } else if (entry.state && !entry.state->empty()) {
                render_entry_cells("Active", *entry.state);
            }
        }

        if (is_current || is_future) {
            ImGui::PopStyleColor();
        }
    }

    ImGui::EndChild();

    ImGui::Separator();
    ImGui::Text("Entry: %zu / %zu", pointer + 1, entries.size());

    ImGui::End();
}

void HistoryUI::render_entry_cells(const char *title,
                                   const grid::CellStore &store) const {
    ImGui::BeginTooltip();
    ImGui::Text("%s: %zu cells", title, store.size());
    ImGui::Separator();
    size_t shown = 0;
    for (const auto &[c, rec] : store.cells()) {
        if (shown++ == MAX_TOOLTIP_CELLS) {
            ImGui::TextDisabled("... %zu more", store.size() - MAX_TOOLTIP_CELLS);
            break;
        }
        ImGui::Text("[row: %d, col: %d]", c.row, c.col);
    }
    ImGui::EndTooltip();
}

std::string HistoryUI::format_timestamp(
    const std::chrono::time_point<HistoryLog::Clock> &timestamp) const {
    auto now = HistoryLog::Clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::seconds>(now - timestamp);

    if (duration.count() < 60) {
        return fmt::format("{}s ago", duration.count());
    } else if (duration.count() < 3600) {
        return fmt::format("{}m ago", duration.count() / 60);
    } else {
        return fmt::format("{}h ago", duration.count() / 3600);
    }
}
