#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "gt/save/SnapshotVersion.hpp"
#include "gt/world/CellTypes.hpp"
#include "gt/world/OverrideStore.hpp"

namespace gt::save {

/// The whole durable state of a session.
struct GameSnapshot {
    SnapshotVersion version = SnapshotVersion::Current();
    world::WorldPosition playerPosition{0.0};
    std::optional<int> inventory;
    world::OverrideList overrides;
    bool victoryFlag = false;
};

struct SnapshotParseReport {
    std::size_t skippedOverrides = 0;
    std::vector<std::string> warnings;
};

nlohmann::json CellToJson(const world::Cell& cell);

/// nullopt unless the JSON is a well-formed cell inside the token value domain.
std::optional<world::Cell> CellFromJson(const nlohmann::json& json, int baseTokenValue);

nlohmann::json SnapshotToJson(const GameSnapshot& snapshot);

/**
 * @brief Rebuilds a snapshot, recovering as much as possible.
 *
 * Returns nullopt (with outError set) when the document as a whole is unusable:
 * not an object, an incompatible version, or no player position inside
 * [-90, 90] x [-180, 180]. Individual override entries that are malformed are
 * skipped and counted in the report; an overrides field that is not an array
 * restores no overrides, and an out-of-domain inventory restores as empty.
 */
std::optional<GameSnapshot> SnapshotFromJson(const nlohmann::json& json,
                                             int baseTokenValue,
                                             SnapshotParseReport& report,
                                             std::string& outError);

} // namespace gt::save
