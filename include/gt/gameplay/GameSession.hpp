#pragma once

#include <functional>
#include <optional>
#include <string>

#include "gt/gameplay/CellActions.hpp"
#include "gt/gameplay/SessionState.hpp"
#include "gt/world/CellCache.hpp"
#include "gt/world/CellRenderer.hpp"
#include "gt/world/CoordinateMapper.hpp"
#include "gt/world/ProceduralGenerator.hpp"

namespace gt::gameplay {

struct SessionSettings {
    double cellDegrees = 1e-4;
    world::GeneratorSettings generator;
    double interactionRadiusCells = 3.0;
    int victoryThreshold = 32;
    world::WorldPosition startPosition{36.997936938057016, -122.05703507501151};
};

/**
 * @brief Owns one play session: its state, the grid and the resident cells.
 *
 * Every mutating action writes the OverrideStore before the resident copy and
 * the renderer are touched, so the visible grid can never run ahead of what a
 * snapshot would capture.
 */
class GameSession {
public:
    using ResultCallback = std::function<void(const InteractionResult&)>;

    /// Throws core::ConfigError for an unusable cell size or generator setting.
    GameSession(SessionSettings settings, world::ICellRenderer& renderer);
    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    world::SyncResult SyncViewport(const world::Viewport& viewport);

    /// Non-finite positions are ignored.
    void OnPositionChange(const world::WorldPosition& position);

    InteractionResult AttemptPickUp(const world::CellCoordinate& coord);
    InteractionResult AttemptPlace(const world::CellCoordinate& coord);
    InteractionResult AttemptCraft(const world::CellCoordinate& coord);

    /// Single-click entry point: picks up, places, crafts or reports why not.
    InteractionResult Interact(const world::CellCoordinate& coord);

    bool IsWithinInteractionRange(const world::CellCoordinate& coord) const;

    world::Cell ResolveCell(const world::CellCoordinate& coord) const;

    /// Replaces the whole session state and re-resolves the resident cells.
    void LoadState(SessionState state);

    /// New game: forgets every override, the inventory and the victory.
    void ResetWorld();

    const SessionState& State() const { return m_state; }
    const SessionSettings& Settings() const { return m_settings; }
    const world::CoordinateMapper& Mapper() const { return m_mapper; }
    const world::ProceduralGenerator& Generator() const { return m_generator; }
    const world::CellCache& Cache() const { return m_cache; }

    /// Fired once, by the craft that first reaches the victory threshold.
    void SetVictoryCallback(ResultCallback callback) { m_onVictory = std::move(callback); }
    /// Fired after every committed pick-up, place or craft.
    void SetMutationCallback(ResultCallback callback) { m_onMutation = std::move(callback); }

    std::string DescribeStatus() const;

private:
    using ActionFn = std::function<InteractionResult(SessionState&, const world::CellCoordinate&, world::Cell&)>;

    InteractionResult RunAction(const world::CellCoordinate& coord, const ActionFn& action);
    void ResyncResidentCells();

    SessionSettings m_settings;
    world::ICellRenderer& m_renderer;
    world::CoordinateMapper m_mapper;
    world::ProceduralGenerator m_generator;
    world::CellCache m_cache;
    SessionState m_state;
    std::optional<world::Viewport> m_lastViewport;
    ResultCallback m_onVictory;
    ResultCallback m_onMutation;
};

} // namespace gt::gameplay
