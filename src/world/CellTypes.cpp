#include "gt/world/CellTypes.hpp"

#include <charconv>
#include <limits>

#include <fmt/format.h>

namespace gt::world {

namespace {

std::optional<int> ParseInt(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+', which keeps keys canonical.
    int value = 0;
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

bool IsReachableTokenValue(int value, int baseValue) {
    if (baseValue <= 0 || value < baseValue) {
        return false;
    }
    while (value > baseValue) {
        if (value % 2 != 0) {
            return false;
        }
        value /= 2;
    }
    return value == baseValue;
}

bool IsValidCell(const Cell& cell, int baseValue) {
    if (cell.hasToken != cell.tokenValue.has_value()) {
        return false;
    }
    return !cell.hasToken || IsReachableTokenValue(*cell.tokenValue, baseValue);
}

std::string FormatCoordinateKey(const CellCoordinate& coord) {
    return fmt::format("{},{}", coord.i, coord.j);
}

std::optional<CellCoordinate> ParseCoordinateKey(std::string_view key) {
    const auto comma = key.find(',');
    if (comma == std::string_view::npos || key.find(',', comma + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    const auto i = ParseInt(key.substr(0, comma));
    const auto j = ParseInt(key.substr(comma + 1));
    if (!i || !j) {
        return std::nullopt;
    }
    return CellCoordinate{*i, *j};
}

std::string DescribeCell(const Cell& cell) {
    if (!cell.hasToken || !cell.tokenValue) {
        return "Empty cell";
    }
    return fmt::format("Token of value {}", *cell.tokenValue);
}

} // namespace gt::world
