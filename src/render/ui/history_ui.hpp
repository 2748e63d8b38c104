#pragma once

#include <chrono>
#include <string>

#include <imgui.h>

#include "../../undo/history_log.hpp"
#include "../irenderer.hpp"

/**
 * @brief UI component for displaying undo/redo history.
 *
 * Lists every entry of the history log oldest first with its label and active
 * cell count. The current entry is highlighted in green; entries after it are
 * the redo branch and are dimmed. Clicking an entry jumps to it; hovering
 * lists its cells, or for a clear, the cells it removed.
 */
class HistoryUI : public IRenderer {
  public:
    HistoryUI() = default;
    ~HistoryUI() override = default;
    HistoryUI(const HistoryUI &) = delete;
    HistoryUI &operator=(const HistoryUI &) = delete;
    HistoryUI(HistoryUI &&) = delete;
    HistoryUI &operator=(HistoryUI &&) = delete;

    /**
     * @brief Renders the history UI if enabled
     * @param ctx Rendering context containing configuration and editor
     */
    void render(Context &ctx) override;

  private:
    /**
     * @brief Renders the main history window
     * @param ctx Rendering context
     */
    void render_ui(Context &ctx);

    /**
     * @brief Tooltip listing the cells of one entry
     *
     * Clear entries list the cells they removed.
     */
    void render_entry_cells(const char *title,
                            const grid::CellStore &store) const;

    static constexpr size_t MAX_TOOLTIP_CELLS = 24;

    /**
     * @brief Formats a timestamp for display
     * @param timestamp The timestamp to format
     * @return Formatted time string
     */
    std::string format_timestamp(
        const std::chrono::time_point<HistoryLog::Clock> &timestamp) const;
};
