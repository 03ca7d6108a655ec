#pragma once

#include <functional>

#include "gt/world/CellTypes.hpp"

namespace gt::world {

class OverrideStore;
class ProceduralGenerator;

using CellResolverFn = std::function<Cell(const CellCoordinate&)>;

/// A saved override wins; otherwise the generator's baseline is the truth.
Cell ResolveCell(const OverrideStore& overrides,
                 const ProceduralGenerator& generator,
                 const CellCoordinate& coord);

/// Binds ResolveCell to a store and generator for CellCache::Sync. Both must outlive the result.
CellResolverFn MakeCellResolver(const OverrideStore& overrides, const ProceduralGenerator& generator);

} // namespace gt::world
