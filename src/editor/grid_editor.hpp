#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../grid/cell_record.hpp"
#include "../grid/cell_store.hpp"
#include "../grid/coord.hpp"
#include "../grid/grid_config.hpp"
#include "../undo/history_log.hpp"

/**
 * @brief One editing session over a grid.
 *
 * Every state change goes through the history log: the editor copies the
 * current snapshot, edits the copy and commits it. Reads always come from the
 * history's current snapshot. Operations never throw; invalid requests are
 * no-ops and return false.
 */
class GridEditor {
  public:
    /**
     * @brief Row of the undo/redo list shown to the user.
     */
    struct HistoryItem {
        std::string label;
        /** @brief Active cells in that snapshot */
        size_t size = 0;
        /** @brief Clear entries: cells the clear removed */
        size_t removed = 0;
        bool current = false;
    };

    explicit GridEditor(grid::GridConfig config = {});

    const grid::GridConfig &config() const { return m_config; }

    /** @brief Attributes used by toggle_cell(coord) and fill_enclosed(). */
    const grid::CellRecord &paint() const { return m_paint; }
    void set_paint(const grid::CellRecord &paint) { m_paint = paint; }

    // Queries

    /**
     * @brief Record at @p c in the current snapshot, nullptr when inactive.
     */
    const grid::CellRecord *query_active(const grid::Coord &c) const {
        return current().get(c);
    }

    bool is_active(const grid::Coord &c) const { return current().contains(c); }

    /** @brief Active cells of the current snapshot, row-major. */
    std::vector<grid::CellStore::Entry> enumerate_active() const {
        return current().cells();
    }

    const grid::CellStore &current() const { return m_history.current(); }
    const std::string &current_label() const {
        return m_history.current_label();
    }
    std::vector<HistoryItem> history_list() const;
    const HistoryLog &history() const { return m_history; }

    // Mutations, each commits at most one history entry

    /**
     * @brief Toggle @p c with @p attrs and commit.
     * @return False (nothing committed) if @p c is outside the grid.
     */
    bool toggle_cell(const grid::Coord &c, const grid::CellRecord &attrs);
    bool toggle_cell(const grid::Coord &c) { return toggle_cell(c, m_paint); }

    /**
     * @brief Remove every active cell as one undoable step.
     * @return False if the grid was already empty.
     */
    bool clear_all();

    /**
     * @brief Commit the current snapshot clamped to @p rows x @p cols.
     * @return False if no cell lies outside those bounds.
     */
    bool clamp_to_bounds(int rows, int cols);

    /**
     * @brief Fill every enclosed region with @p paint and commit.
     * @return False if there was nothing enclosed.
     */
    bool fill_enclosed(const grid::CellRecord &paint);
    bool fill_enclosed() { return fill_enclosed(m_paint); }

    bool undo() { return m_history.undo(); }
    bool redo() { return m_history.redo(); }
    bool jump_to(size_t index) { return m_history.jump_to(index); }

    /**
     * @brief Change grid dimensions, clamping the cells when they shrink.
     *
     * Values are clamped to [1, GridConfig::MAX_DIMENSION]. Dimensions are not part of history; the
     * clamp is.
     * @return True if a clamp entry was committed.
     */
    bool resize(int rows, int cols);

    void set_cell_size(int px) {
        m_config.cell_size = grid::GridConfig::clamp_cell_size(px);
    }

    /**
     * @brief Replace the session with a loaded grid; history restarts.
     */
    void load(const grid::GridConfig &config, grid::CellStore cells,
              std::string label);

    /**
     * @brief Start an empty session keeping the current dimensions.
     */
    void reset();

  private:
    grid::GridConfig m_config;
    grid::CellRecord m_paint;
    HistoryLog m_history;
};
