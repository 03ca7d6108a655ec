#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gt/world/CellTypes.hpp"

namespace gt::world {

using OverrideEntry = std::pair<CellCoordinate, Cell>;
using OverrideList = std::vector<OverrideEntry>;

/**
 * @brief Sparse table of cells whose truth no longer matches the generator.
 *
 * Written only by mutating gameplay actions; cleared only by a new game.
 */
class OverrideStore {
public:
    void Save(const CellCoordinate& coord, const Cell& cell);
    std::optional<Cell> Lookup(const CellCoordinate& coord) const;
    bool Contains(const CellCoordinate& coord) const;
    void Clear();

    /// Entries sorted by coordinate.
    OverrideList Serialize() const;

    /// Replaces the current contents; a later duplicate coordinate wins.
    void Restore(const OverrideList& entries);

    std::size_t Size() const { return m_entries.size(); }
    bool Empty() const { return m_entries.empty(); }

private:
    std::unordered_map<CellCoordinate, Cell, CellCoordinateHash> m_entries;
};

} // namespace gt::world
