#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../grid/cell_store.hpp"

/**
 * @brief Linear undo/redo history over immutable cell-store snapshots.
 *
 * Holds an ordered list of entries and a pointer to the one currently shown.
 * There is always at least one entry and the pointer always addresses a valid
 * entry. Committing while the pointer is not on the last entry discards every
 * entry after it (the redo branch) before appending; that, and reset(), are
 * the only ways the log shrinks.
 *
 * Clearing the grid is recorded as a single composite entry that keeps the
 * pre-clear snapshot alongside the cleared one, so clear-all takes exactly one
 * undo step and one redo step like any other action.
 */
class HistoryLog {
  public:
    using Snapshot = std::shared_ptr<const grid::CellStore>;
    using Clock = std::chrono::steady_clock;

    /**
     * @brief What produced an entry.
     */
    enum class Kind {
        Initial,  ///< First entry of a session or loaded project
        Edit,     ///< Ordinary commit (toggle, fill, clamp, ...)
        ClearAll, ///< Composite clear: previous state plus cleared state
    };

    struct Entry {
        Kind kind = Kind::Edit;
        std::string label;
        /** @brief State shown when the pointer is on this entry */
        Snapshot state;
        /**
         * @brief ClearAll only: the state that was cleared. Undo does not need
         * it (the previous entry holds the same snapshot); the history panel
         * reads it to show what a clear removed.
         */
        Snapshot cleared_from;
        std::chrono::time_point<Clock> timestamp;

        /** @brief Number of active cells in this entry's state */
        size_t size() const { return state ? state->size() : 0; }
    };

    explicit HistoryLog(grid::CellStore initial = {},
                        std::string label = "Initial");

    /**
     * @brief Drop all history and start over from @p initial.
     */
    void reset(grid::CellStore initial, std::string label = "Initial");

    /**
     * @brief Record a new state.
     *
     * Truncates the log after the pointer, appends, and moves the pointer to
     * the new entry.
     */
    void commit(std::string label, grid::CellStore store);

    /**
     * @brief Record a clear-all as one composite entry.
     *
     * The entry's state is empty; the state current at the time of the call
     * is kept in Entry::cleared_from.
     */
    void commit_clear(std::string label);

    bool can_undo() const { return m_pointer > 0; }
    bool can_redo() const { return m_pointer + 1 < m_entries.size(); }

    /**
     * @brief Step back one entry. No-op on the first entry.
     * @return True if the pointer moved.
     */
    bool undo();

    /**
     * @brief Step forward one entry. No-op on the last entry.
     * @return True if the pointer moved.
     */
    bool redo();

    /**
     * @brief Move the pointer straight to @p index.
     * @return True if @p index was valid; otherwise nothing changes.
     */
    bool jump_to(size_t index);

    const grid::CellStore &current() const { return *current_entry().state; }
    const Entry &current_entry() const { return m_entries[m_pointer]; }
    const std::string &current_label() const { return current_entry().label; }

    const std::vector<Entry> &entries() const { return m_entries; }
    size_t pointer() const { return m_pointer; }
    size_t size() const { return m_entries.size(); }

    /**
     * @brief Get the current state version number.
     *
     * Bumped by every commit, undo, redo, jump and reset that changes what is
     * shown.
     * @return Current state version
     */
    unsigned long long get_state_version() const { return m_state_version; }

  private:
    void push(Entry entry);

  private:
    std::vector<Entry> m_entries;
    size_t m_pointer = 0;
    unsigned long long m_state_version = 0;
};
