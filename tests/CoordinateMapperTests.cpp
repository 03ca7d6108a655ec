#include "gt/core/Error.hpp"
#include "gt/world/CoordinateMapper.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>

using gt::world::CellCoordinate;
using gt::world::CoordinateMapper;
using gt::world::WorldPosition;

TEST_CASE("CoordinateMapper floors positions into cells", "[world][mapper]") {
    CoordinateMapper mapper(1e-4);

    SECTION("Positive coordinates") {
        const auto cell = mapper.ToCell(WorldPosition(36.997936938057016, 122.05703507501151));
        REQUIRE(cell.i == 369979);
        REQUIRE(cell.j == 1220570);
    }

    SECTION("Negative coordinates round toward negative infinity") {
        const auto cell = mapper.ToCell(WorldPosition(-0.00005, -122.05703507501151));
        REQUIRE(cell.i == -1);
        REQUIRE(cell.j == -1220571);
    }

    SECTION("Null island is cell (0, 0)") {
        REQUIRE(mapper.ToCell(WorldPosition(0.0, 0.0)) == CellCoordinate{0, 0});
    }
}

TEST_CASE("CoordinateMapper cell centres map back to their cell", "[world][mapper]") {
    CoordinateMapper mapper(1e-4);
    const CellCoordinate coords[] = {{0, 0}, {-1, -1}, {369979, -1220571}, {-900000, 1800000}};
    for (const auto& coord : coords) {
        REQUIRE(mapper.ToCell(mapper.CellCenter(coord)) == coord);

        const auto bounds = mapper.CellBounds(coord);
        REQUIRE(bounds.northEast.x - bounds.southWest.x == Catch::Approx(1e-4));
        REQUIRE(bounds.northEast.y - bounds.southWest.y == Catch::Approx(1e-4));
    }
}

TEST_CASE("CoordinateMapper converts viewports into inclusive cell ranges", "[world][mapper]") {
    CoordinateMapper mapper(1.0);

    gt::world::Viewport viewport;
    viewport.southWest = WorldPosition(-1.5, 2.2);
    viewport.northEast = WorldPosition(1.5, 4.9);

    const auto range = mapper.ToCellRange(viewport);
    REQUIRE(range.minI == -2);
    REQUIRE(range.maxI == 1);
    REQUIRE(range.minJ == 2);
    REQUIRE(range.maxJ == 4);
    REQUIRE(range.CellCount() == 12);
    REQUIRE(range.Contains(CellCoordinate{-2, 4}));
    REQUIRE_FALSE(range.Contains(CellCoordinate{2, 4}));
}

TEST_CASE("CoordinateMapper treats degenerate viewports as empty", "[world][mapper]") {
    CoordinateMapper mapper(1.0);

    gt::world::Viewport point;
    point.southWest = WorldPosition(3.5, 3.5);
    point.northEast = WorldPosition(3.5, 3.5);
    REQUIRE(mapper.ToCellRange(point).IsEmpty());

    gt::world::Viewport inverted;
    inverted.southWest = WorldPosition(4.0, 4.0);
    inverted.northEast = WorldPosition(2.0, 6.0);
    REQUIRE(mapper.ToCellRange(inverted).IsEmpty());
    REQUIRE(mapper.ToCellRange(inverted).CellCount() == 0);
}

TEST_CASE("CoordinateMapper builds a square viewport around a position", "[world][mapper]") {
    CoordinateMapper mapper(1e-4);
    const WorldPosition start(36.997936938057016, -122.05703507501151);
    const auto center = mapper.ToCell(start);

    const auto range = mapper.ToCellRange(mapper.ViewportAround(start, 8));
    REQUIRE(range.minI == center.i - 8);
    REQUIRE(range.maxI == center.i + 8);
    REQUIRE(range.minJ == center.j - 8);
    REQUIRE(range.maxJ == center.j + 8);
    REQUIRE(range.CellCount() == 17 * 17);

    const auto single = mapper.ToCellRange(mapper.ViewportAround(start, 0));
    REQUIRE(single.CellCount() == 1);
    REQUIRE(single.Contains(center));
}

TEST_CASE("CoordinateMapper saturates viewports at the edge of the grid", "[world][mapper]") {
    CoordinateMapper mapper(1.0);
    constexpr int kMax = std::numeric_limits<int>::max();
    constexpr int kMin = std::numeric_limits<int>::min();

    const auto north = mapper.ToCellRange(mapper.ViewportAround(WorldPosition(1e12, 0.5), 2));
    REQUIRE(north.maxI == kMax);
    REQUIRE(north.minI == kMax - 2);
    REQUIRE(north.CellCount() == 3 * 5);

    const auto south = mapper.ToCellRange(mapper.ViewportAround(WorldPosition(-1e12, -1e12), 1));
    REQUIRE(south.minI == kMin);
    REQUIRE(south.minJ == kMin);
    REQUIRE(south.CellCount() == 2 * 2);
}

TEST_CASE("CellRange counts cells across the whole index span", "[world][types]") {
    gt::world::CellRange wide;
    wide.minI = std::numeric_limits<int>::min();
    wide.maxI = std::numeric_limits<int>::max();
    wide.minJ = 0;
    wide.maxJ = 0;
    REQUIRE(wide.CellCount() == std::size_t{1} << 32);
}

TEST_CASE("CoordinateMapper measures distance to cell centres", "[world][mapper]") {
    CoordinateMapper mapper(1.0);
    REQUIRE(mapper.DistanceToCellCenter(WorldPosition(0.5, 0.5), CellCoordinate{0, 0}) == Catch::Approx(0.0));
    REQUIRE(mapper.DistanceToCellCenter(WorldPosition(0.5, 0.5), CellCoordinate{3, 4}) == Catch::Approx(5.0));
}

TEST_CASE("CoordinateMapper rejects unusable cell sizes", "[world][mapper]") {
    REQUIRE_THROWS_AS(CoordinateMapper(0.0), gt::core::ConfigError);
    REQUIRE_THROWS_AS(CoordinateMapper(-1e-4), gt::core::ConfigError);
    REQUIRE_THROWS_AS(CoordinateMapper(std::numeric_limits<double>::quiet_NaN()), gt::core::ConfigError);
}

TEST_CASE("Coordinate keys parse strictly", "[world][types]") {
    REQUIRE(gt::world::FormatCoordinateKey(CellCoordinate{-3, 17}) == "-3,17");
    REQUIRE(gt::world::ParseCoordinateKey("-3,17") == CellCoordinate{-3, 17});

    REQUIRE_FALSE(gt::world::ParseCoordinateKey("").has_value());
    REQUIRE_FALSE(gt::world::ParseCoordinateKey("3").has_value());
    REQUIRE_FALSE(gt::world::ParseCoordinateKey("1,2,3").has_value());
    REQUIRE_FALSE(gt::world::ParseCoordinateKey("a,2").has_value());
    REQUIRE_FALSE(gt::world::ParseCoordinateKey("1, 2").has_value());
    REQUIRE_FALSE(gt::world::ParseCoordinateKey("+1,2").has_value());
    REQUIRE_FALSE(gt::world::ParseCoordinateKey("99999999999,0").has_value());
}

TEST_CASE("Token values must be the base doubled", "[world][types]") {
    REQUIRE(gt::world::IsReachableTokenValue(2, 2));
    REQUIRE(gt::world::IsReachableTokenValue(64, 2));
    REQUIRE_FALSE(gt::world::IsReachableTokenValue(6, 2));
    REQUIRE_FALSE(gt::world::IsReachableTokenValue(1, 2));
    REQUIRE_FALSE(gt::world::IsReachableTokenValue(2, 4));

    REQUIRE(gt::world::IsValidCell(gt::world::Cell::Empty(), 2));
    REQUIRE(gt::world::IsValidCell(gt::world::Cell::WithToken(8), 2));
    REQUIRE_FALSE(gt::world::IsValidCell(gt::world::Cell{true, std::nullopt}, 2));
    REQUIRE_FALSE(gt::world::IsValidCell(gt::world::Cell{false, 4}, 2));
}
