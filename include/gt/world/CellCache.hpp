#pragma once

#include <cstddef>
#include <unordered_map>

#include "gt/world/CellRenderer.hpp"
#include "gt/world/CellResolver.hpp"
#include "gt/world/CellTypes.hpp"
#include "gt/world/CoordinateMapper.hpp"

namespace gt::world {

struct ResidentCell {
    Cell cell;
    CellRenderHandles handles;
};

struct SyncResult {
    std::size_t materialized = 0;
    std::size_t evicted = 0;
};

/**
 * @brief Holds exactly the cells inside the last synced viewport.
 *
 * Sync recomputes the difference between the resident set and the new range
 * from scratch each call, so it is safe to call on every viewport change.
 * After Sync the resident set equals the viewport's cell range. Evicting a
 * cell loses nothing: mutated cells already live in the OverrideStore.
 */
class CellCache {
public:
    explicit CellCache(const CoordinateMapper& mapper);

    CellCache(const CellCache&) = delete;
    CellCache& operator=(const CellCache&) = delete;

    SyncResult Sync(const Viewport& viewport, const CellResolverFn& resolve, ICellRenderer& renderer);

    /// Evicts every resident cell and forgets the last range.
    std::size_t EvictAll(ICellRenderer& renderer);

    const ResidentCell* Find(const CellCoordinate& coord) const;
    ResidentCell* Find(const CellCoordinate& coord);
    bool IsResident(const CellCoordinate& coord) const { return Find(coord) != nullptr; }

    std::size_t Size() const { return m_resident.size(); }
    const CellRange& CurrentRange() const { return m_range; }
    const std::unordered_map<CellCoordinate, ResidentCell, CellCoordinateHash>& Resident() const {
        return m_resident;
    }

private:
    const CoordinateMapper& m_mapper;
    std::unordered_map<CellCoordinate, ResidentCell, CellCoordinateHash> m_resident;
    CellRange m_range = CellRange::Empty();
};

} // namespace gt::world
