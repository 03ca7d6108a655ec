#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "gt/gameplay/GameSession.hpp"
#include "gt/movement/MovementSources.hpp"
#include "gt/save/SaveManager.hpp"

struct FrontendSettings {
    int halfExtentCells = 8;
    int movementStepCells = 1;
    bool autosave = true;
};

/**
 * @brief Line-oriented stand-in for the map, buttons and popups.
 *
 * Cell arguments are offsets from the player's cell: first north, then east.
 */
class ConsoleFrontend {
public:
    ConsoleFrontend(gt::gameplay::GameSession& session,
                    gt::save::SaveManager& saveManager,
                    FrontendSettings settings);

    /// Syncs the view around the player; call once the session state is loaded.
    void Start();

    /// Returns false once the player asked to quit.
    bool Execute(const std::string& line, std::ostream& out);

    void RenderMap(std::ostream& out) const;

    /// Session end checkpoint.
    gt::save::SaveLoadResult SaveNow();

    gt::movement::GeolocationMovementSource& Geolocation() { return m_geolocation; }

private:
    void HandlePositionChange(const gt::world::WorldPosition& position);
    void SyncView();
    std::optional<gt::world::CellCoordinate> ParseOffset(std::istream& args) const;
    void Report(const gt::gameplay::InteractionResult& result, std::ostream& out) const;
    void PrintHelp(std::ostream& out) const;

    gt::gameplay::GameSession& m_session;
    gt::save::SaveManager& m_saveManager;
    FrontendSettings m_settings;
    gt::movement::ButtonMovementSource m_buttons;
    gt::movement::GeolocationMovementSource m_geolocation;
};
