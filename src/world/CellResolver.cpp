#include "gt/world/CellResolver.hpp"

#include "gt/world/OverrideStore.hpp"
#include "gt/world/ProceduralGenerator.hpp"

namespace gt::world {

Cell ResolveCell(const OverrideStore& overrides,
                 const ProceduralGenerator& generator,
                 const CellCoordinate& coord) {
    if (auto overridden = overrides.Lookup(coord)) {
        return *overridden;
    }
    return generator.Generate(coord);
}

CellResolverFn MakeCellResolver(const OverrideStore& overrides, const ProceduralGenerator& generator) {
    return [&overrides, &generator](const CellCoordinate& coord) {
        return ResolveCell(overrides, generator, coord);
    };
}

} // namespace gt::world
