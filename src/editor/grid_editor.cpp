#include "grid_editor.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "../grid/bounds_guard.hpp"
#include "../grid/flood_fill.hpp"
#include "../utility/logger.hpp"

GridEditor::GridEditor(grid::GridConfig config) : m_config(config) {
    m_config.rows = grid::GridConfig::clamp_dimension(m_config.rows);
    m_config.cols = grid::GridConfig::clamp_dimension(m_config.cols);
    m_config.cell_size = grid::GridConfig::clamp_cell_size(m_config.cell_size);
}

std::vector<GridEditor::HistoryItem> GridEditor::history_list() const {
    std::vector<HistoryItem> items;
    const auto &entries = m_history.entries();
    items.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto &entry = entries[i];
        const size_t removed =
            entry.cleared_from ? entry.cleared_from->size() : 0;
        items.push_back(
            {entry.label, entry.size(), removed, i == m_history.pointer()});
    }
    return items;
}

bool GridEditor::toggle_cell(const grid::Coord &c,
                             const grid::CellRecord &attrs) {
    if (!grid::in_bounds(c, m_config.rows, m_config.cols)) {
        LOG_DEBUG(fmt::format("Ignoring toggle outside grid at {}", c));
        return false;
    }

    grid::CellStore next = current();
    const bool existed = next.contains(c);
    const bool active = next.toggle(c, attrs);

    std::string label;
    if (!active)
        label = fmt::format("Erase {}", c);
    else if (existed)
        label = fmt::format("Paint {}", c);
    else
        label = fmt::format("Toggle {}", c);

    m_history.commit(std::move(label), std::move(next));
    return true;
}

bool GridEditor::clear_all() {
    const size_t removed = current().size();
    if (removed == 0)
        return false;
    m_history.commit_clear(fmt::format("Clear all: {} cells removed", removed));
    LOG_INFO(fmt::format("Cleared {} cells", removed));
    return true;
}

bool GridEditor::clamp_to_bounds(int rows, int cols) {
    rows = std::max(rows, 1);
    cols = std::max(cols, 1);
    const size_t dropped = grid::count_out_of_bounds(current(), rows, cols);
    if (dropped == 0)
        return false;
    m_history.commit(
        fmt::format("Clamp to {}x{}: {} cells removed", rows, cols, dropped),
        grid::clamp(current(), rows, cols));
    return true;
}

bool GridEditor::fill_enclosed(const grid::CellRecord &paint) {
    const grid::CellStore &before = current();
    grid::CellStore next =
        grid::fill_enclosed(before, m_config.rows, m_config.cols, paint);
    const size_t added = next.size() - before.size();
    if (added == 0)
        return false;
    m_history.commit(fmt::format("Fill enclosed: {} cells", added),
                     std::move(next));
    LOG_INFO(fmt::format("Filled {} enclosed cells", added));
    return true;
}

bool GridEditor::resize(int rows, int cols) {
    rows = grid::GridConfig::clamp_dimension(rows);
    cols = grid::GridConfig::clamp_dimension(cols);
    const bool shrinks = rows < m_config.rows || cols < m_config.cols;
    m_config.rows = rows;
    m_config.cols = cols;
    if (!shrinks)
        return false;
    return clamp_to_bounds(rows, cols);
}

void GridEditor::load(const grid::GridConfig &config, grid::CellStore cells,
                      std::string label) {
    m_config = config;
    m_config.rows = grid::GridConfig::clamp_dimension(m_config.rows);
    m_config.cols = grid::GridConfig::clamp_dimension(m_config.cols);
    m_config.cell_size = grid::GridConfig::clamp_cell_size(m_config.cell_size);
    m_history.reset(std::move(cells), std::move(label));
}

void GridEditor::reset() { m_history.reset({}, "Initial"); }
