#include "gt/world/CoordinateMapper.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

#include <fmt/format.h>
#include <glm/geometric.hpp>

#include "gt/core/Error.hpp"

namespace gt::world {

namespace {
constexpr double kMinIndex = static_cast<double>(std::numeric_limits<int>::min());
constexpr double kMaxIndex = static_cast<double>(std::numeric_limits<int>::max());

// Saturates at the edge of the grid instead of wrapping.
int OffsetIndex(int index, int offset) {
    const std::int64_t shifted = static_cast<std::int64_t>(index) + offset;
    return static_cast<int>(std::clamp<std::int64_t>(shifted,
                                                     std::numeric_limits<int>::min(),
                                                     std::numeric_limits<int>::max()));
}
}

CoordinateMapper::CoordinateMapper(double cellDegrees)
    : m_cellDegrees(cellDegrees) {
    if (!std::isfinite(cellDegrees) || cellDegrees <= 0.0) {
        throw core::ConfigError("world.cellDegrees",
                                fmt::format("cell size must be positive, got {}", cellDegrees));
    }
}

int CoordinateMapper::ToCellIndex(double coordinate) const {
    const double index = std::floor(coordinate / m_cellDegrees);
    if (std::isnan(index)) {
        return 0;
    }
    return static_cast<int>(std::clamp(index, kMinIndex, kMaxIndex));
}

CellCoordinate CoordinateMapper::ToCell(const WorldPosition& position) const {
    return CellCoordinate{ToCellIndex(position.x), ToCellIndex(position.y)};
}

WorldPosition CoordinateMapper::CellCenter(const CellCoordinate& coord) const {
    return WorldPosition((static_cast<double>(coord.i) + 0.5) * m_cellDegrees,
                         (static_cast<double>(coord.j) + 0.5) * m_cellDegrees);
}

Viewport CoordinateMapper::CellBounds(const CellCoordinate& coord) const {
    Viewport bounds;
    bounds.southWest = WorldPosition(static_cast<double>(coord.i) * m_cellDegrees,
                                     static_cast<double>(coord.j) * m_cellDegrees);
    bounds.northEast = WorldPosition(static_cast<double>(coord.i + 1) * m_cellDegrees,
                                     static_cast<double>(coord.j + 1) * m_cellDegrees);
    return bounds;
}

CellRange CoordinateMapper::ToCellRange(const Viewport& viewport) const {
    if (viewport.IsDegenerate()) {
        return CellRange::Empty();
    }
    const CellCoordinate minCell = ToCell(viewport.southWest);
    const CellCoordinate maxCell = ToCell(viewport.northEast);
    return CellRange{minCell.i, maxCell.i, minCell.j, maxCell.j};
}

Viewport CoordinateMapper::ViewportAround(const WorldPosition& position, int halfExtentCells) const {
    const CellCoordinate center = ToCell(position);
    const int extent = std::max(0, halfExtentCells);
    const CellCoordinate southWest{OffsetIndex(center.i, -extent), OffsetIndex(center.j, -extent)};
    const CellCoordinate northEast{OffsetIndex(center.i, extent), OffsetIndex(center.j, extent)};

    Viewport viewport;
    // Corners sit a quarter cell inside the outer cells so floating-point error at cell edges
    // cannot widen the range.
    const WorldPosition inset(0.25 * m_cellDegrees);
    viewport.southWest = CellCenter(southWest) - inset;
    viewport.northEast = CellCenter(northEast) + inset;
    return viewport;
}

double CoordinateMapper::DistanceToCellCenter(const WorldPosition& position,
                                              const CellCoordinate& coord) const {
    return glm::distance(position, CellCenter(coord));
}

} // namespace gt::world
