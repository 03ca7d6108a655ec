#include "TestHelpers.hpp"

#include "ConsoleCellRenderer.hpp"
#include "ConsoleFrontend.hpp"

#include "gt/save/KeyValueStorage.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

namespace {

struct FrontendFixture {
    explicit FrontendFixture(double spawnProbability = 1.0, bool autosave = true)
        : session(gt::test::MakeTestSettings(spawnProbability), renderer)
        , saveManager(storage, "slot", 2)
        , frontend(session, saveManager, FrontendSettings{2, 1, autosave}) {
        frontend.Start();
    }

    std::string Run(const std::string& line) {
        std::ostringstream out;
        REQUIRE(frontend.Execute(line, out));
        return out.str();
    }

    ConsoleCellRenderer renderer;
    gt::save::MemoryKeyValueStorage storage;
    gt::gameplay::GameSession session;
    gt::save::SaveManager saveManager;
    ConsoleFrontend frontend;
};

bool Contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("ConsoleFrontend shows the cells around the player", "[frontend]") {
    FrontendFixture f;
    REQUIRE(f.session.Cache().Size() == 25);
    REQUIRE(f.renderer.LiveHandleCount() > 0);

    const auto map = f.Run("map");
    REQUIRE(Contains(map, "@2"));
    REQUIRE(Contains(map, "Cell (0, 0) | Empty hands"));
}

TEST_CASE("ConsoleFrontend moves the player with direction commands", "[frontend]") {
    FrontendFixture f;
    f.Run("n");
    f.Run("e");
    REQUIRE(f.session.Mapper().ToCell(f.session.State().player.position) == gt::world::CellCoordinate{1, 1});
    REQUIRE(f.session.Cache().CurrentRange().minI == -1);
    REQUIRE(f.session.Cache().CurrentRange().maxJ == 3);
}

TEST_CASE("ConsoleFrontend interacts with cells and autosaves", "[frontend]") {
    FrontendFixture f;

    REQUIRE(Contains(f.Run("click 0 0"), "You picked up a token of value 2"));
    REQUIRE(f.storage.Get("slot").has_value());

    REQUIRE(Contains(f.Run("look 0 0"), "Empty cell (in reach)"));
    REQUIRE(Contains(f.Run("craft 1 0"), "You crafted a token of value 4"));
    REQUIRE(Contains(f.Run("put 0 0"), "You are not carrying a token"));
    REQUIRE(Contains(f.Run("take 2 2"), "Holding 2"));
    REQUIRE(Contains(f.Run("look 9 9"), "That cell is not on screen"));
    REQUIRE(Contains(f.Run("click x"), "Usage: click <north> <east>"));

    gt::save::SaveManager reader(f.storage, "slot", 2);
    const auto loaded = reader.Load(gt::world::WorldPosition(0.0));
    REQUIRE(loaded.state.player.inventory == 2);
    REQUIRE(loaded.state.overrides.Size() == 3);
}

TEST_CASE("ConsoleFrontend leaves storage alone when autosave is off", "[frontend]") {
    FrontendFixture f(1.0, false);
    f.Run("click 0 0");
    REQUIRE_FALSE(f.storage.Get("slot").has_value());

    REQUIRE(f.Run("save") == "Saved\n");
    REQUIRE(f.storage.Get("slot").has_value());
}

TEST_CASE("ConsoleFrontend follows location fixes only while tracking", "[frontend]") {
    FrontendFixture f(0.0);

    REQUIRE(Contains(f.Run("fix 5.5 5.5"), "Location fix ignored"));
    REQUIRE(f.Run("gps on") == "Location tracking on\n");
    f.Run("fix 5.5 5.5");
    REQUIRE(f.session.Mapper().ToCell(f.session.State().player.position) == gt::world::CellCoordinate{5, 5});
    REQUIRE(f.session.Cache().Find(gt::world::CellCoordinate{7, 7}) != nullptr);
    REQUIRE(f.session.Cache().Find(gt::world::CellCoordinate{0, 0}) == nullptr);
    REQUIRE(Contains(f.Run("gps maybe"), "Usage: gps on|off"));
}

TEST_CASE("ConsoleFrontend reset starts a new game", "[frontend]") {
    FrontendFixture f;
    f.Run("click 0 0");
    REQUIRE(f.storage.Get("slot").has_value());

    const auto output = f.Run("reset");
    REQUIRE(Contains(output, "New game started"));
    REQUIRE(f.session.State().overrides.Empty());
    REQUIRE_FALSE(f.session.State().player.inventory.has_value());
    REQUIRE_FALSE(f.storage.Get("slot").has_value());
    REQUIRE(f.session.Cache().Find(gt::world::CellCoordinate{0, 0})->cell == gt::world::Cell::WithToken(2));
}

TEST_CASE("ConsoleFrontend handles quit and unknown commands", "[frontend]") {
    FrontendFixture f;
    std::ostringstream out;
    REQUIRE_FALSE(f.frontend.Execute("quit", out));
    REQUIRE(f.frontend.Execute("", out));
    REQUIRE(Contains(f.Run("dance"), "Unknown command 'dance'"));
    REQUIRE(Contains(f.Run("help"), "Commands:"));
}
