#pragma once

#include <cstddef>

#include "gt/world/CellRenderer.hpp"

/**
 * @brief Stand-in presentation layer for the console front end.
 *
 * Hands out increasing handle ids and tracks how many are alive; the map
 * itself is drawn from the session's resident cells.
 */
class ConsoleCellRenderer : public gt::world::ICellRenderer {
public:
    gt::world::CellRenderHandles Materialize(const gt::world::CellCoordinate& coord,
                                             const gt::world::Cell& cell) override;
    void Evict(const gt::world::CellCoordinate& coord,
               const gt::world::CellRenderHandles& handles) override;
    gt::world::CellRenderHandles UpdateToken(const gt::world::CellCoordinate& coord,
                                             const gt::world::Cell& cell,
                                             const gt::world::CellRenderHandles& handles) override;

    std::size_t LiveHandleCount() const { return m_liveHandles; }

private:
    gt::world::RenderHandle Acquire();
    void Release(gt::world::RenderHandle handle);

    gt::world::RenderHandle m_nextHandle = 1;
    std::size_t m_liveHandles = 0;
};
