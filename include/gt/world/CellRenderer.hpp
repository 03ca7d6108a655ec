#pragma once

#include <cstdint>

#include "gt/world/CellTypes.hpp"

namespace gt::world {

using RenderHandle = std::uint64_t;
constexpr RenderHandle kInvalidRenderHandle = 0;

/// Handles a renderer hands back for one resident cell.
struct CellRenderHandles {
    RenderHandle boundary = kInvalidRenderHandle;
    RenderHandle tokenMarker = kInvalidRenderHandle;

    bool HasTokenMarker() const { return tokenMarker != kInvalidRenderHandle; }
};

/**
 * @brief Interface implemented by the presentation layer that draws cells.
 *
 * The core only writes to it; cell truth is never read back from a renderer.
 */
class ICellRenderer {
public:
    virtual ~ICellRenderer() = default;

    /// Draw the cell boundary and, when the cell holds a token, a labelled marker.
    virtual CellRenderHandles Materialize(const CellCoordinate& coord, const Cell& cell) = 0;

    /// Release every handle of a cell leaving the view.
    virtual void Evict(const CellCoordinate& coord, const CellRenderHandles& handles) = 0;

    /// Replace, create or drop the token marker after a mutation.
    virtual CellRenderHandles UpdateToken(const CellCoordinate& coord,
                                          const Cell& cell,
                                          const CellRenderHandles& handles) = 0;
};

} // namespace gt::world
