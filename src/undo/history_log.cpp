#include "history_log.hpp"

#include <fmt/format.h>

#include "../utility/logger.hpp"

HistoryLog::HistoryLog(grid::CellStore initial, std::string label) {
    reset(std::move(initial), std::move(label));
}

void HistoryLog::reset(grid::CellStore initial, std::string label) {
    m_entries.clear();
    m_entries.push_back(
        {Kind::Initial, std::move(label),
         std::make_shared<const grid::CellStore>(std::move(initial)), nullptr,
         Clock::now()});
    m_pointer = 0;
    ++m_state_version;
}

void HistoryLog::commit(std::string label, grid::CellStore store) {
    push({Kind::Edit, std::move(label),
          std::make_shared<const grid::CellStore>(std::move(store)), nullptr,
          Clock::now()});
}

void HistoryLog::commit_clear(std::string label) {
    Snapshot previous = current_entry().state;
    push({Kind::ClearAll, std::move(label),
          std::make_shared<const grid::CellStore>(), std::move(previous),
          Clock::now()});
}

bool HistoryLog::undo() {
    if (!can_undo())
        return false;
    --m_pointer;
    ++m_state_version;
    return true;
}

bool HistoryLog::redo() {
    if (!can_redo())
        return false;
    ++m_pointer;
    ++m_state_version;
    return true;
}

bool HistoryLog::jump_to(size_t index) {
    if (index >= m_entries.size())
        return false;
    if (index != m_pointer) {
        m_pointer = index;
        ++m_state_version;
    }
    return true;
}

void HistoryLog::push(Entry entry) {
    // Anything after the pointer is an abandoned redo branch
    const auto keep = static_cast<std::ptrdiff_t>(m_pointer) + 1;
    const size_t dropped = m_entries.size() - m_pointer - 1;
    if (dropped > 0) {
        LOG_DEBUG(fmt::format("Discarding {} redo entries", dropped));
    }
    m_entries.erase(m_entries.begin() + keep, m_entries.end());
    m_entries.push_back(std::move(entry));
    m_pointer = m_entries.size() - 1;
    ++m_state_version;
}
