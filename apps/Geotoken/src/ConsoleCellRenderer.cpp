#include "ConsoleCellRenderer.hpp"

#include "gt/core/Logger.hpp"

using gt::world::Cell;
using gt::world::CellCoordinate;
using gt::world::CellRenderHandles;
using gt::world::RenderHandle;

RenderHandle ConsoleCellRenderer::Acquire() {
    ++m_liveHandles;
    return m_nextHandle++;
}

void ConsoleCellRenderer::Release(RenderHandle handle) {
    if (handle != gt::world::kInvalidRenderHandle && m_liveHandles > 0) {
        --m_liveHandles;
    }
}

CellRenderHandles ConsoleCellRenderer::Materialize(const CellCoordinate& coord, const Cell& cell) {
    CellRenderHandles handles;
    handles.boundary = Acquire();
    if (cell.hasToken) {
        handles.tokenMarker = Acquire();
    }
    gt::core::Logger::Debug("[ConsoleRenderer] + ({}, {}) {}", coord.i, coord.j, gt::world::DescribeCell(cell));
    return handles;
}

void ConsoleCellRenderer::Evict(const CellCoordinate& coord, const CellRenderHandles& handles) {
    Release(handles.boundary);
    Release(handles.tokenMarker);
    gt::core::Logger::Debug("[ConsoleRenderer] - ({}, {})", coord.i, coord.j);
}

CellRenderHandles ConsoleCellRenderer::UpdateToken(const CellCoordinate& coord,
                                                   const Cell& cell,
                                                   const CellRenderHandles& handles) {
    CellRenderHandles updated = handles;
    Release(updated.tokenMarker);
    updated.tokenMarker = cell.hasToken ? Acquire() : gt::world::kInvalidRenderHandle;
    gt::core::Logger::Debug("[ConsoleRenderer] ~ ({}, {}) {}", coord.i, coord.j, gt::world::DescribeCell(cell));
    return updated;
}
