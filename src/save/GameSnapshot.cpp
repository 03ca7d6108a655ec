#include "gt/save/GameSnapshot.hpp"

#include <cmath>
#include <limits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace gt::save {

namespace {

std::optional<int> ReadInt(const nlohmann::json& value) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    const auto wide = value.get<long long>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(wide);
}

std::optional<world::WorldPosition> ReadPosition(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    const auto lat = json.find("lat");
    const auto lng = json.find("lng");
    if (lat == json.end() || lng == json.end() || !lat->is_number() || !lng->is_number()) {
        return std::nullopt;
    }
    const world::WorldPosition position(lat->get<double>(), lng->get<double>());
    if (!std::isfinite(position.x) || !std::isfinite(position.y) ||
        std::abs(position.x) > 90.0 || std::abs(position.y) > 180.0) {
        return std::nullopt;
    }
    return position;
}

} // namespace

nlohmann::json CellToJson(const world::Cell& cell) {
    nlohmann::json json;
    json["hasToken"] = cell.hasToken;
    json["tokenValue"] = cell.tokenValue ? nlohmann::json(*cell.tokenValue) : nlohmann::json(nullptr);
    return json;
}

std::optional<world::Cell> CellFromJson(const nlohmann::json& json, int baseTokenValue) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    const auto hasToken = json.find("hasToken");
    if (hasToken == json.end() || !hasToken->is_boolean()) {
        return std::nullopt;
    }

    world::Cell cell;
    cell.hasToken = hasToken->get<bool>();
    const auto tokenValue = json.find("tokenValue");
    if (tokenValue != json.end() && !tokenValue->is_null()) {
        cell.tokenValue = ReadInt(*tokenValue);
        if (!cell.tokenValue) {
            return std::nullopt;
        }
    }

    if (!world::IsValidCell(cell, baseTokenValue)) {
        return std::nullopt;
    }
    return cell;
}

nlohmann::json SnapshotToJson(const GameSnapshot& snapshot) {
    nlohmann::json overrides = nlohmann::json::array();
    for (const auto& [coord, cell] : snapshot.overrides) {
        overrides.push_back(nlohmann::json::array({world::FormatCoordinateKey(coord), CellToJson(cell)}));
    }

    return nlohmann::json{
        {"version", SnapshotVersionToJson(snapshot.version)},
        {"playerPosition", {
            {"lat", snapshot.playerPosition.x},
            {"lng", snapshot.playerPosition.y}
        }},
        {"inventory", snapshot.inventory ? nlohmann::json(*snapshot.inventory) : nlohmann::json(nullptr)},
        {"overrides", std::move(overrides)},
        {"victoryFlag", snapshot.victoryFlag}
    };
}

std::optional<GameSnapshot> SnapshotFromJson(const nlohmann::json& json,
                                             int baseTokenValue,
                                             SnapshotParseReport& report,
                                             std::string& outError) {
    if (!json.is_object()) {
        outError = "snapshot is not a JSON object";
        return std::nullopt;
    }

    GameSnapshot snapshot;
    if (json.contains("version")) {
        snapshot.version = ParseSnapshotVersion(json["version"]);
    } else {
        report.warnings.push_back("snapshot has no version; assuming current");
    }
    if (!snapshot.version.IsCompatibleWith(SnapshotVersion::Current())) {
        outError = fmt::format("snapshot version {} is not compatible with {}",
                               snapshot.version.ToString(), SnapshotVersion::Current().ToString());
        return std::nullopt;
    }
    snapshot.version = SnapshotVersion::Current();

    const auto position = json.contains("playerPosition") ? ReadPosition(json["playerPosition"]) : std::nullopt;
    if (!position) {
        outError = "snapshot has no valid playerPosition";
        return std::nullopt;
    }
    snapshot.playerPosition = *position;

    if (json.contains("inventory") && !json["inventory"].is_null()) {
        const auto inventory = ReadInt(json["inventory"]);
        if (inventory && world::IsReachableTokenValue(*inventory, baseTokenValue)) {
            snapshot.inventory = inventory;
        } else {
            report.warnings.push_back(fmt::format("discarding invalid inventory {}", json["inventory"].dump()));
        }
    }

    if (json.contains("victoryFlag")) {
        const auto& flag = json["victoryFlag"];
        if (flag.is_boolean()) {
            snapshot.victoryFlag = flag.get<bool>();
        } else {
            report.warnings.push_back("victoryFlag is not a boolean; assuming false");
        }
    }

    if (json.contains("overrides")) {
        const auto& overrides = json["overrides"];
        if (!overrides.is_array()) {
            report.warnings.push_back("overrides is not an array; restoring none");
            return snapshot;
        }
        snapshot.overrides.reserve(overrides.size());
        for (std::size_t index = 0; index < overrides.size(); ++index) {
            const auto& entry = overrides[index];
            std::optional<world::CellCoordinate> coord;
            std::optional<world::Cell> cell;
            if (entry.is_array() && entry.size() == 2 && entry[0].is_string()) {
                coord = world::ParseCoordinateKey(entry[0].get_ref<const nlohmann::json::string_t&>());
                cell = CellFromJson(entry[1], baseTokenValue);
            }
            if (!coord || !cell) {
                ++report.skippedOverrides;
                report.warnings.push_back(fmt::format("skipping malformed override #{}: {}", index, entry.dump()));
                continue;
            }
            snapshot.overrides.emplace_back(*coord, *cell);
        }
    }

    return snapshot;
}

} // namespace gt::save
