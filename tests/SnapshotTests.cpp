#include "gt/save/GameSnapshot.hpp"
#include "gt/save/SaveSnapshotHelpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using gt::save::GameSnapshot;
using gt::save::SnapshotParseReport;
using gt::world::Cell;
using gt::world::CellCoordinate;
using json = nlohmann::json;

namespace {

std::optional<GameSnapshot> Parse(const json& document, SnapshotParseReport& report, std::string& error) {
    return gt::save::SnapshotFromJson(document, 2, report, error);
}

json MinimalDocument() {
    return json{
        {"version", {{"major", 1}, {"minor", 0}}},
        {"playerPosition", {{"lat", 36.9979}, {"lng", -122.057}}},
        {"inventory", nullptr},
        {"overrides", json::array()},
        {"victoryFlag", false}
    };
}

} // namespace

TEST_CASE("Snapshot JSON carries every session field", "[save][snapshot]") {
    gt::gameplay::SessionState state;
    state.player.position = gt::world::WorldPosition(36.5, -122.25);
    state.player.inventory = 8;
    state.player.victory = true;
    state.overrides.Save(CellCoordinate{-1, 4}, Cell::Empty());
    state.overrides.Save(CellCoordinate{2, 2}, Cell::WithToken(16));

    const json document = gt::save::SnapshotToJson(gt::save::SaveSnapshotHelpers::CaptureSnapshot(state));
    REQUIRE(document["version"]["major"] == 1);
    REQUIRE(document["playerPosition"]["lat"].get<double>() == Catch::Approx(36.5));
    REQUIRE(document["inventory"] == 8);
    REQUIRE(document["victoryFlag"] == true);
    REQUIRE(document["overrides"].size() == 2);
    REQUIRE(document["overrides"][0][0] == "-1,4");
    REQUIRE(document["overrides"][0][1]["hasToken"] == false);
    REQUIRE(document["overrides"][0][1]["tokenValue"].is_null());

    SnapshotParseReport report;
    std::string error;
    const auto restored = Parse(document, report, error);
    REQUIRE(restored.has_value());
    REQUIRE(report.warnings.empty());

    const auto reloaded = gt::save::SaveSnapshotHelpers::ApplySnapshot(*restored);
    REQUIRE(reloaded.player.position == state.player.position);
    REQUIRE(reloaded.player.inventory == 8);
    REQUIRE(reloaded.player.victory);
    REQUIRE(reloaded.overrides.Serialize() == state.overrides.Serialize());
}

TEST_CASE("Snapshot parsing skips malformed override entries", "[save][snapshot]") {
    json document = MinimalDocument();
    document["overrides"] = json::array({
        json::array({"0,0", {{"hasToken", true}, {"tokenValue", 4}}}),
        json::array({"bad-key", {{"hasToken", false}, {"tokenValue", nullptr}}}),
        json::array({"1,1", {{"hasToken", true}, {"tokenValue", 6}}}),
        json::array({"2,2", {{"hasToken", true}, {"tokenValue", nullptr}}}),
        json::array({"3,3", {{"hasToken", false}, {"tokenValue", 2}}}),
        "not-an-entry",
        json::array({"4,4", {{"hasToken", false}, {"tokenValue", nullptr}}})
    });

    SnapshotParseReport report;
    std::string error;
    const auto snapshot = Parse(document, report, error);
    REQUIRE(snapshot.has_value());
    REQUIRE(report.skippedOverrides == 5);
    REQUIRE(snapshot->overrides.size() == 2);
    REQUIRE(snapshot->overrides[0].first == CellCoordinate{0, 0});
    REQUIRE(snapshot->overrides[0].second == Cell::WithToken(4));
    REQUIRE(snapshot->overrides[1].first == CellCoordinate{4, 4});
}

TEST_CASE("Snapshot parsing rejects unusable documents", "[save][snapshot]") {
    SnapshotParseReport report;
    std::string error;

    SECTION("Not an object") {
        REQUIRE_FALSE(Parse(json::array(), report, error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Newer major version") {
        json document = MinimalDocument();
        document["version"] = {{"major", 2}, {"minor", 0}};
        REQUIRE_FALSE(Parse(document, report, error).has_value());
        REQUIRE(error.find("not compatible") != std::string::npos);
    }

    SECTION("Missing player position") {
        json document = MinimalDocument();
        document.erase("playerPosition");
        REQUIRE_FALSE(Parse(document, report, error).has_value());
    }

    SECTION("Latitude beyond the pole") {
        json document = MinimalDocument();
        document["playerPosition"] = {{"lat", 214748.3647}, {"lng", 0.0}};
        REQUIRE_FALSE(Parse(document, report, error).has_value());
        REQUIRE(error == "snapshot has no valid playerPosition");
    }

    SECTION("Longitude beyond the antimeridian") {
        json document = MinimalDocument();
        document["playerPosition"] = {{"lat", 0.0}, {"lng", -180.5}};
        REQUIRE_FALSE(Parse(document, report, error).has_value());
    }
}

TEST_CASE("Snapshot parsing accepts positions on the edge of the world", "[save][snapshot]") {
    json document = MinimalDocument();
    document["playerPosition"] = {{"lat", -90.0}, {"lng", 180.0}};

    SnapshotParseReport report;
    std::string error;
    const auto snapshot = Parse(document, report, error);
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->playerPosition.x == Catch::Approx(-90.0));
    REQUIRE(snapshot->playerPosition.y == Catch::Approx(180.0));
}

TEST_CASE("Snapshot parsing keeps the player when overrides has the wrong shape", "[save][snapshot]") {
    json document = MinimalDocument();
    document["inventory"] = 4;
    document["victoryFlag"] = true;
    document["overrides"] = {{"0,0", "token"}};

    SnapshotParseReport report;
    std::string error;
    const auto snapshot = Parse(document, report, error);
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->overrides.empty());
    REQUIRE(snapshot->inventory == 4);
    REQUIRE(snapshot->victoryFlag);
    REQUIRE(snapshot->playerPosition.x == Catch::Approx(36.9979));
    REQUIRE(report.skippedOverrides == 0);
    REQUIRE(report.warnings.size() == 1);
    REQUIRE(report.warnings[0] == "overrides is not an array; restoring none");
}

TEST_CASE("Snapshot parsing recovers from bad scalar fields", "[save][snapshot]") {
    json document = MinimalDocument();
    document.erase("version");
    document["inventory"] = 3;
    document["victoryFlag"] = "yes";

    SnapshotParseReport report;
    std::string error;
    const auto snapshot = Parse(document, report, error);
    REQUIRE(snapshot.has_value());
    REQUIRE_FALSE(snapshot->inventory.has_value());
    REQUIRE_FALSE(snapshot->victoryFlag);
    REQUIRE(snapshot->version == gt::save::SnapshotVersion::Current());
    REQUIRE(report.warnings.size() == 3);
}

TEST_CASE("Snapshot versions parse and compare", "[save][snapshot]") {
    using gt::save::SnapshotVersion;
    REQUIRE(gt::save::ParseSnapshotVersion(std::string_view("1.0")) == SnapshotVersion(1, 0));
    REQUIRE(gt::save::ParseSnapshotVersion(json("1.0")) == SnapshotVersion(1, 0));
    REQUIRE(SnapshotVersion(1, 0).IsCompatibleWith(SnapshotVersion(1, 2)));
    REQUIRE_FALSE(SnapshotVersion(1, 3).IsCompatibleWith(SnapshotVersion(1, 2)));
    REQUIRE_FALSE(SnapshotVersion(0, 9).IsCompatibleWith(SnapshotVersion(1, 0)));
    REQUIRE(SnapshotVersion::Current().ToString() == "1.0");
}
