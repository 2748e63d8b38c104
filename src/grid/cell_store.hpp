#pragma once

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cell_record.hpp"
#include "coord.hpp"

namespace grid {

/**
 * @brief Sparse map from grid coordinate to cell record.
 *
 * Holds the state of the grid at one point in time. Value type: copies are
 * independent, so a store taken from history can be edited freely and
 * committed back as a new snapshot.
 */
class CellStore {
  public:
    using Entry = std::pair<Coord, CellRecord>;

    CellStore() = default;

    /**
     * @brief Toggle a cell.
     *
     * Removes the record when the stored attributes equal @p attrs, otherwise
     * inserts or overwrites it. Repainting with a different colour therefore
     * keeps the cell active.
     * @return True if the cell is active afterwards.
     */
    bool toggle(const Coord &c, const CellRecord &attrs);

    /** @brief Insert or overwrite a record. */
    void set(const Coord &c, const CellRecord &attrs) { m_cells[c] = attrs; }

    /** @brief Remove a record. @return True if one was removed. */
    bool erase(const Coord &c) { return m_cells.erase(c) > 0; }

    bool contains(const Coord &c) const { return m_cells.count(c) > 0; }

    /**
     * @brief Look up a record.
     * @return Pointer to the record, or nullptr when the cell is inactive.
     */
    const CellRecord *get(const Coord &c) const;

    void clear() { m_cells.clear(); }

    size_t size() const { return m_cells.size(); }
    bool empty() const { return m_cells.empty(); }

    /**
     * @brief All records sorted row-major.
     *
     * Sorted so listings and serialization do not depend on hash order.
     */
    std::vector<Entry> cells() const;

    /** @brief Visit records in unspecified order. */
    template <typename F>
    void for_each(F &&f) const {
        for (const auto &[c, rec] : m_cells)
            f(c, rec);
    }

    bool operator==(const CellStore &other) const {
        return m_cells == other.m_cells;
    }

  private:
    std::unordered_map<Coord, CellRecord, CoordHash> m_cells;
};

} // namespace grid
