#include "cell_store.hpp"

#include <algorithm>

namespace grid {

bool CellStore::toggle(const Coord &c, const CellRecord &attrs) {
    auto it = m_cells.find(c);
    if (it != m_cells.end() && it->second == attrs) {
        m_cells.erase(it);
        return false;
    }
    m_cells[c] = attrs;
    return true;
}

const CellRecord *CellStore::get(const Coord &c) const {
    auto it = m_cells.find(c);
    return it == m_cells.end() ? nullptr : &it->second;
}

std::vector<CellStore::Entry> CellStore::cells() const {
    std::vector<Entry> out(m_cells.begin(), m_cells.end());
    std::sort(out.begin(), out.end(), [](const Entry &a, const Entry &b) {
        return a.first < b.first;
    });
    return out;
}

} // namespace grid
