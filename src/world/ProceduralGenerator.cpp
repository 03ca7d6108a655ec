#include "gt/world/ProceduralGenerator.hpp"

#include <cmath>
#include <cstdint>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "gt/core/Error.hpp"

namespace gt::world {

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ull;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ull;

std::uint64_t Fnv1a(std::uint64_t hash, std::string_view bytes) {
    for (const char c : bytes) {
        hash ^= static_cast<std::uint8_t>(c);
        hash *= kFnvPrime;
    }
    return hash;
}

// SplitMix64 finalizer; spreads the FNV state over all 64 bits.
std::uint64_t Mix(std::uint64_t x) {
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}

} // namespace

ProceduralGenerator::ProceduralGenerator(GeneratorSettings settings)
    : m_settings(std::move(settings)) {
    if (!std::isfinite(m_settings.spawnProbability) ||
        m_settings.spawnProbability < 0.0 || m_settings.spawnProbability > 1.0) {
        throw core::ConfigError("world.spawnProbability",
                                fmt::format("must be within [0, 1], got {}", m_settings.spawnProbability));
    }
    if (m_settings.baseTokenValue <= 0 ||
        (m_settings.baseTokenValue & (m_settings.baseTokenValue - 1)) != 0) {
        throw core::ConfigError("world.baseTokenValue",
                                fmt::format("must be a positive power of two, got {}", m_settings.baseTokenValue));
    }
}

double ProceduralGenerator::Luck(const CellCoordinate& coord) const {
    std::uint64_t hash = Fnv1a(kFnvOffset, m_settings.seed);
    hash = Fnv1a(hash, "|");
    hash = Fnv1a(hash, FormatCoordinateKey(coord));
    // Top 53 bits fill a double mantissa exactly.
    return static_cast<double>(Mix(hash) >> 11) * 0x1.0p-53;
}

Cell ProceduralGenerator::Generate(const CellCoordinate& coord) const {
    if (Luck(coord) < m_settings.spawnProbability) {
        return Cell::WithToken(m_settings.baseTokenValue);
    }
    return Cell::Empty();
}

} // namespace gt::world
