#include "gt/world/CellCache.hpp"

#include <cstdint>

#include "gt/core/Logger.hpp"

namespace gt::world {

CellCache::CellCache(const CoordinateMapper& mapper)
    : m_mapper(mapper) {}

SyncResult CellCache::Sync(const Viewport& viewport, const CellResolverFn& resolve, ICellRenderer& renderer) {
    SyncResult result;
    const CellRange range = m_mapper.ToCellRange(viewport);

    if (range == m_range && m_resident.size() == range.CellCount()) {
        return result;
    }

    // Evict first so the cache never holds the union of the old and new ranges.
    for (auto it = m_resident.begin(); it != m_resident.end();) {
        if (range.Contains(it->first)) {
            ++it;
            continue;
        }
        renderer.Evict(it->first, it->second.handles);
        it = m_resident.erase(it);
        ++result.evicted;
    }

    if (!range.IsEmpty()) {
        m_resident.reserve(range.CellCount());
        // 64-bit counters so a range ending at INT_MAX terminates.
        for (std::int64_t i = range.minI; i <= range.maxI; ++i) {
            for (std::int64_t j = range.minJ; j <= range.maxJ; ++j) {
                const CellCoordinate coord{static_cast<int>(i), static_cast<int>(j)};
                if (m_resident.find(coord) != m_resident.end()) {
                    continue;
                }
                ResidentCell resident;
                resident.cell = resolve(coord);
                resident.handles = renderer.Materialize(coord, resident.cell);
                m_resident.emplace(coord, resident);
                ++result.materialized;
            }
        }
    }

    m_range = range;

    if (result.materialized > 0 || result.evicted > 0) {
        gt::core::Logger::Debug("[CellCache] Synced to i[{}..{}] j[{}..{}]: +{} -{} ({} resident)",
                                range.minI, range.maxI, range.minJ, range.maxJ,
                                result.materialized, result.evicted, m_resident.size());
    }
    return result;
}

std::size_t CellCache::EvictAll(ICellRenderer& renderer) {
    const std::size_t count = m_resident.size();
    for (const auto& [coord, resident] : m_resident) {
        renderer.Evict(coord, resident.handles);
    }
    m_resident.clear();
    m_range = CellRange::Empty();
    return count;
}

const ResidentCell* CellCache::Find(const CellCoordinate& coord) const {
    auto it = m_resident.find(coord);
    return it != m_resident.end() ? &it->second : nullptr;
}

ResidentCell* CellCache::Find(const CellCoordinate& coord) {
    auto it = m_resident.find(coord);
    return it != m_resident.end() ? &it->second : nullptr;
}

} // namespace gt::world
