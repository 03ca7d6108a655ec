#pragma once

#include "gt/world/CellTypes.hpp"

namespace gt::world {

/**
 * @brief Maps continuous world positions onto the integer cell grid.
 *
 * Cells are anchored at (0, 0) degrees and are cellDegrees wide on both axes.
 * ToCell floors toward negative infinity so neighbouring cells never overlap
 * and never leave a gap, including across the equator and prime meridian.
 */
class CoordinateMapper {
public:
    /// Throws core::ConfigError when cellDegrees is not a positive finite number.
    explicit CoordinateMapper(double cellDegrees);

    double CellDegrees() const { return m_cellDegrees; }

    CellCoordinate ToCell(const WorldPosition& position) const;
    WorldPosition CellCenter(const CellCoordinate& coord) const;
    Viewport CellBounds(const CellCoordinate& coord) const;

    /// Inclusive range of cells touched by the viewport; empty for a degenerate viewport.
    CellRange ToCellRange(const Viewport& viewport) const;

    /// Viewport covering (2 * halfExtentCells + 1) cells per side centred on the cell holding position.
    Viewport ViewportAround(const WorldPosition& position, int halfExtentCells) const;

    double DistanceToCellCenter(const WorldPosition& position, const CellCoordinate& coord) const;

private:
    int ToCellIndex(double coordinate) const;

    double m_cellDegrees;
};

} // namespace gt::world
