#include "ConsoleFrontend.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <sstream>

#include <fmt/format.h>

#include "gt/core/Logger.hpp"

using gt::gameplay::InteractionResult;
using gt::world::CellCoordinate;
using gt::world::WorldPosition;

ConsoleFrontend::ConsoleFrontend(gt::gameplay::GameSession& session,
                                 gt::save::SaveManager& saveManager,
                                 FrontendSettings settings)
    : m_session(session)
    , m_saveManager(saveManager)
    , m_settings(settings)
    , m_buttons(session.Mapper().CellDegrees() * settings.movementStepCells) {
    m_buttons.SetPositionProvider([this]() { return m_session.State().player.position; });
    gt::movement::ConnectPositionSources([this](const WorldPosition& position) { HandlePositionChange(position); },
                                         m_buttons, m_geolocation);

    m_session.SetMutationCallback([this](const InteractionResult&) {
        if (!m_settings.autosave) {
            return;
        }
        const auto saved = SaveNow();
        if (!saved.success) {
            gt::core::Logger::Warning("[ConsoleFrontend] Autosave failed: {}", saved.message);
        }
    });
    m_session.SetVictoryCallback([](const InteractionResult& result) {
        gt::core::Logger::Info("[ConsoleFrontend] *** Victory! Token of value {} crafted ***",
                               result.cell.tokenValue.value_or(0));
    });
}

void ConsoleFrontend::Start() {
    SyncView();
}

void ConsoleFrontend::HandlePositionChange(const WorldPosition& position) {
    m_session.OnPositionChange(position);
    SyncView();
}

void ConsoleFrontend::SyncView() {
    const auto& mapper = m_session.Mapper();
    m_session.SyncViewport(mapper.ViewportAround(m_session.State().player.position, m_settings.halfExtentCells));
}

gt::save::SaveLoadResult ConsoleFrontend::SaveNow() {
    return m_saveManager.Save(m_session.State());
}

std::optional<CellCoordinate> ConsoleFrontend::ParseOffset(std::istream& args) const {
    int north = 0;
    int east = 0;
    if (!(args >> north >> east)) {
        return std::nullopt;
    }
    const auto origin = m_session.Mapper().ToCell(m_session.State().player.position);
    return CellCoordinate{origin.i + north, origin.j + east};
}

void ConsoleFrontend::Report(const InteractionResult& result, std::ostream& out) const {
    out << result.message << '\n';
    out << m_session.DescribeStatus() << '\n';
}

void ConsoleFrontend::PrintHelp(std::ostream& out) const {
    out << "Commands:\n"
        << "  n | s | e | w            move one step\n"
        << "  gps on|off               toggle location tracking\n"
        << "  fix <lat> <lng>          feed a location fix\n"
        << "  click <north> <east>     interact with a cell (offset from you)\n"
        << "  take|put|craft <n> <e>   a specific action on a cell\n"
        << "  look <north> <east>      describe a cell\n"
        << "  map | status | save | reset | help | quit\n";
}

bool ConsoleFrontend::Execute(const std::string& line, std::ostream& out) {
    std::istringstream args(line);
    std::string command;
    if (!(args >> command)) {
        return true;
    }

    if (command == "quit" || command == "q") {
        return false;
    }
    if (command == "help" || command == "?") {
        PrintHelp(out);
        return true;
    }
    if (command == "n" || command == "s" || command == "e" || command == "w") {
        using gt::movement::MoveDirection;
        const MoveDirection direction = command == "n" ? MoveDirection::North
                                      : command == "s" ? MoveDirection::South
                                      : command == "e" ? MoveDirection::East
                                                       : MoveDirection::West;
        m_buttons.Step(direction);
        RenderMap(out);
        return true;
    }
    if (command == "gps") {
        std::string toggle;
        args >> toggle;
        if (toggle != "on" && toggle != "off") {
            out << "Usage: gps on|off\n";
            return true;
        }
        m_geolocation.SetEnabled(toggle == "on");
        out << "Location tracking " << (m_geolocation.IsEnabled() ? "on" : "off") << '\n';
        return true;
    }
    if (command == "fix") {
        double latitude = 0.0;
        double longitude = 0.0;
        if (!(args >> latitude >> longitude)) {
            out << "Usage: fix <lat> <lng>\n";
            return true;
        }
        if (!m_geolocation.OnFix(latitude, longitude)) {
            out << "Location fix ignored (tracking off or invalid fix)\n";
            return true;
        }
        RenderMap(out);
        return true;
    }
    if (command == "click" || command == "take" || command == "put" || command == "craft") {
        const auto coord = ParseOffset(args);
        if (!coord) {
            out << "Usage: " << command << " <north> <east>\n";
            return true;
        }
        const InteractionResult result = command == "click" ? m_session.Interact(*coord)
                                       : command == "take"  ? m_session.AttemptPickUp(*coord)
                                       : command == "put"   ? m_session.AttemptPlace(*coord)
                                                            : m_session.AttemptCraft(*coord);
        Report(result, out);
        return true;
    }
    if (command == "look") {
        const auto coord = ParseOffset(args);
        if (!coord) {
            out << "Usage: look <north> <east>\n";
            return true;
        }
        const auto* resident = m_session.Cache().Find(*coord);
        if (!resident) {
            out << "That cell is not on screen\n";
            return true;
        }
        out << gt::world::DescribeCell(resident->cell)
            << (m_session.IsWithinInteractionRange(*coord) ? " (in reach)" : " (out of reach)") << '\n';
        return true;
    }
    if (command == "map") {
        RenderMap(out);
        return true;
    }
    if (command == "status") {
        out << m_session.DescribeStatus() << '\n';
        return true;
    }
    if (command == "save") {
        const auto result = SaveNow();
        out << (result.success ? "Saved" : "Save failed: " + result.message) << '\n';
        return true;
    }
    if (command == "reset") {
        m_session.ResetWorld();
        const auto erased = m_saveManager.Erase();
        if (!erased.success) {
            out << "Could not erase the old save: " << erased.message << '\n';
        }
        SyncView();
        out << "New game started\n";
        RenderMap(out);
        return true;
    }

    out << "Unknown command '" << command << "' (try 'help')\n";
    return true;
}

void ConsoleFrontend::RenderMap(std::ostream& out) const {
    const auto& cache = m_session.Cache();
    const auto& range = cache.CurrentRange();
    if (range.IsEmpty()) {
        out << "(nothing in view)\n";
        return;
    }

    const auto player = m_session.Mapper().ToCell(m_session.State().player.position);
    for (std::int64_t i = range.maxI; i >= range.minI; --i) {
        std::string row;
        for (std::int64_t j = range.minJ; j <= range.maxJ; ++j) {
            const CellCoordinate coord{static_cast<int>(i), static_cast<int>(j)};
            const auto* resident = cache.Find(coord);
            std::string glyph = ".";
            if (resident && resident->cell.hasToken) {
                glyph = std::to_string(resident->cell.tokenValue.value_or(0));
            }
            if (coord == player) {
                glyph = "@" + (glyph == "." ? std::string() : glyph);
            }
            row += fmt::format("{:>5}", glyph);
        }
        out << row << '\n';
    }
    out << m_session.DescribeStatus() << '\n';
}
