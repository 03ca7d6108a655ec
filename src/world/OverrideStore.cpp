#include "gt/world/OverrideStore.hpp"

#include <algorithm>

namespace gt::world {

void OverrideStore::Save(const CellCoordinate& coord, const Cell& cell) {
    m_entries.insert_or_assign(coord, cell);
}

std::optional<Cell> OverrideStore::Lookup(const CellCoordinate& coord) const {
    auto it = m_entries.find(coord);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool OverrideStore::Contains(const CellCoordinate& coord) const {
    return m_entries.find(coord) != m_entries.end();
}

void OverrideStore::Clear() {
    m_entries.clear();
}

OverrideList OverrideStore::Serialize() const {
    OverrideList entries(m_entries.begin(), m_entries.end());
    std::sort(entries.begin(), entries.end(),
              [](const OverrideEntry& a, const OverrideEntry& b) { return a.first < b.first; });
    return entries;
}

void OverrideStore::Restore(const OverrideList& entries) {
    std::unordered_map<CellCoordinate, Cell, CellCoordinateHash> restored;
    restored.reserve(entries.size());
    for (const auto& [coord, cell] : entries) {
        restored.insert_or_assign(coord, cell);
    }
    m_entries = std::move(restored);
}

} // namespace gt::world
