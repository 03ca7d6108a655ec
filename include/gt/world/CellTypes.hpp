#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <glm/vec2.hpp>

namespace gt::world {

/// Continuous world position: x = latitude, y = longitude (degrees).
using WorldPosition = glm::dvec2;

struct CellCoordinate {
    int i = 0;
    int j = 0;

    bool operator==(const CellCoordinate&) const = default;
    bool operator!=(const CellCoordinate&) const = default;

    // Only used to give serialized output a stable order.
    bool operator<(const CellCoordinate& other) const {
        return i != other.i ? i < other.i : j < other.j;
    }
};

struct CellCoordinateHash {
    std::size_t operator()(const CellCoordinate& coord) const noexcept {
        const auto packed = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(coord.i)) << 32) |
                            static_cast<std::uint32_t>(coord.j);
        return std::hash<std::uint64_t>{}(packed);
    }
};

/**
 * @brief Logical content of one grid cell.
 *
 * tokenValue is present exactly when hasToken is set.
 */
struct Cell {
    bool hasToken = false;
    std::optional<int> tokenValue;

    bool operator==(const Cell&) const = default;

    static Cell Empty() { return Cell{}; }
    static Cell WithToken(int value) { return Cell{true, value}; }
};

/// Axis-aligned rectangle in world coordinates.
struct Viewport {
    WorldPosition southWest{0.0};
    WorldPosition northEast{0.0};

    bool IsDegenerate() const {
        return !(northEast.x > southWest.x) || !(northEast.y > southWest.y);
    }
};

/// Inclusive range of cell coordinates. Empty when min exceeds max on either axis.
struct CellRange {
    int minI = 0;
    int maxI = -1;
    int minJ = 0;
    int maxJ = -1;

    bool operator==(const CellRange&) const = default;

    bool IsEmpty() const { return minI > maxI || minJ > maxJ; }
    bool Contains(const CellCoordinate& coord) const {
        return coord.i >= minI && coord.i <= maxI && coord.j >= minJ && coord.j <= maxJ;
    }
    std::size_t CellCount() const {
        if (IsEmpty()) {
            return 0;
        }
        const std::int64_t rows = static_cast<std::int64_t>(maxI) - minI + 1;
        const std::int64_t cols = static_cast<std::int64_t>(maxJ) - minJ + 1;
        return static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);
    }

    static CellRange Empty() { return CellRange{}; }
};

/// True when value is baseValue doubled zero or more times.
bool IsReachableTokenValue(int value, int baseValue);

/// Checks the hasToken/tokenValue pairing and the value domain.
bool IsValidCell(const Cell& cell, int baseValue);

/// "i,j"
std::string FormatCoordinateKey(const CellCoordinate& coord);

/// Strict inverse of FormatCoordinateKey; anything else yields nullopt.
std::optional<CellCoordinate> ParseCoordinateKey(std::string_view key);

std::string DescribeCell(const Cell& cell);

} // namespace gt::world
