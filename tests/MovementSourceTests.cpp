#include "gt/movement/MovementSources.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <vector>

using gt::movement::ButtonMovementSource;
using gt::movement::GeolocationMovementSource;
using gt::movement::MoveDirection;
using gt::world::WorldPosition;

TEST_CASE("ButtonMovementSource steps from the provided position", "[movement]") {
    ButtonMovementSource buttons(1e-4);
    WorldPosition current(36.0, -122.0);
    std::vector<WorldPosition> emitted;

    REQUIRE_FALSE(buttons.Step(MoveDirection::North));

    buttons.SetPositionProvider([&current]() { return current; });
    buttons.Connect([&](const WorldPosition& position) {
        emitted.push_back(position);
        current = position;
    });

    REQUIRE(buttons.Step(MoveDirection::North));
    REQUIRE(buttons.Step(MoveDirection::East));
    REQUIRE(buttons.Step(MoveDirection::South));
    REQUIRE(buttons.Step(MoveDirection::West));

    REQUIRE(emitted.size() == 4);
    REQUIRE(emitted[0].x == Catch::Approx(36.0001));
    REQUIRE(emitted[0].y == Catch::Approx(-122.0));
    REQUIRE(emitted[1].y == Catch::Approx(-121.9999));
    REQUIRE(emitted[3].x == Catch::Approx(36.0));
    REQUIRE(emitted[3].y == Catch::Approx(-122.0));
}

TEST_CASE("GeolocationMovementSource forwards fixes only while enabled", "[movement]") {
    GeolocationMovementSource gps;
    std::vector<WorldPosition> emitted;
    gps.Connect([&emitted](const WorldPosition& position) { emitted.push_back(position); });

    REQUIRE_FALSE(gps.IsEnabled());
    REQUIRE_FALSE(gps.OnFix(1.0, 2.0));

    gps.SetEnabled(true);
    REQUIRE(gps.OnFix(1.0, 2.0));
    REQUIRE_FALSE(gps.OnFix(91.0, 0.0));
    REQUIRE_FALSE(gps.OnFix(0.0, std::numeric_limits<double>::infinity()));

    gps.SetEnabled(false);
    REQUIRE_FALSE(gps.OnFix(3.0, 4.0));

    REQUIRE(emitted.size() == 1);
    REQUIRE(emitted[0] == WorldPosition(1.0, 2.0));
}

TEST_CASE("ConnectPositionSources routes every source into one handler", "[movement]") {
    ButtonMovementSource buttons(0.5);
    GeolocationMovementSource gps;
    WorldPosition current(0.0, 0.0);
    int updates = 0;

    buttons.SetPositionProvider([&current]() { return current; });
    gt::movement::ConnectPositionSources(
        [&](const WorldPosition& position) {
            current = position;
            ++updates;
        },
        buttons, gps);

    gps.SetEnabled(true);
    REQUIRE(gps.OnFix(10.0, 10.0));
    REQUIRE(buttons.Step(MoveDirection::North));

    REQUIRE(updates == 2);
    REQUIRE(current.x == Catch::Approx(10.5));
    REQUIRE(current.y == Catch::Approx(10.0));
}
