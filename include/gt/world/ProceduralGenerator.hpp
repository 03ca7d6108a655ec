#pragma once

#include <string>

#include "gt/world/CellTypes.hpp"

namespace gt::world {

struct GeneratorSettings {
    std::string seed;
    double spawnProbability = 0.15;
    int baseTokenValue = 2;
};

/**
 * @brief Baseline cell content as a pure function of the coordinate.
 *
 * The generator holds no history and never looks at overrides; the same seed
 * and coordinate give the same cell in every process.
 */
class ProceduralGenerator {
public:
    explicit ProceduralGenerator(GeneratorSettings settings);

    const GeneratorSettings& Settings() const { return m_settings; }

    Cell Generate(const CellCoordinate& coord) const;

    /// Reproducible value in [0, 1) derived from the seed and the "i,j" key.
    double Luck(const CellCoordinate& coord) const;

private:
    GeneratorSettings m_settings;
};

} // namespace gt::world
