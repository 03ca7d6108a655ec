#include "gt/gameplay/GameSession.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "gt/core/Logger.hpp"
#include "gt/world/CellResolver.hpp"

namespace gt::gameplay {

namespace {
// Absorbs rounding when a cell centre sits exactly on the radius.
constexpr double kRangeEpsilonCells = 1e-9;
}

GameSession::GameSession(SessionSettings settings, world::ICellRenderer& renderer)
    : m_settings(std::move(settings))
    , m_renderer(renderer)
    , m_mapper(m_settings.cellDegrees)
    , m_generator(m_settings.generator)
    , m_cache(m_mapper) {
    m_state.player.position = m_settings.startPosition;
}

GameSession::~GameSession() {
    m_cache.EvictAll(m_renderer);
}

world::SyncResult GameSession::SyncViewport(const world::Viewport& viewport) {
    m_lastViewport = viewport;
    return m_cache.Sync(viewport, world::MakeCellResolver(m_state.overrides, m_generator), m_renderer);
}

void GameSession::OnPositionChange(const world::WorldPosition& position) {
    if (!std::isfinite(position.x) || !std::isfinite(position.y)) {
        gt::core::Logger::Warning("[GameSession] Ignoring non-finite position update");
        return;
    }
    m_state.player.position = position;
    const auto cell = m_mapper.ToCell(position);
    gt::core::Logger::Debug("[GameSession] Player moved to ({:.6f}, {:.6f}) in cell ({}, {})",
                            position.x, position.y, cell.i, cell.j);
}

bool GameSession::IsWithinInteractionRange(const world::CellCoordinate& coord) const {
    const double radius = (m_settings.interactionRadiusCells + kRangeEpsilonCells) * m_mapper.CellDegrees();
    return m_mapper.DistanceToCellCenter(m_state.player.position, coord) <= radius;
}

world::Cell GameSession::ResolveCell(const world::CellCoordinate& coord) const {
    return world::ResolveCell(m_state.overrides, m_generator, coord);
}

InteractionResult GameSession::RunAction(const world::CellCoordinate& coord, const ActionFn& action) {
    world::ResidentCell* resident = m_cache.Find(coord);
    if (!resident) {
        return MakeRejection(m_state, coord, ResolveCell(coord), InteractionOutcome::NotResident);
    }
    if (!IsWithinInteractionRange(coord)) {
        return MakeRejection(m_state, coord, resident->cell, InteractionOutcome::OutOfRange);
    }

    InteractionResult result = action(m_state, coord, resident->cell);
    if (!result.Committed()) {
        return result;
    }

    // The override is already saved; only now does the presentation follow.
    resident->handles = m_renderer.UpdateToken(coord, resident->cell, resident->handles);

    if (result.victoryTriggered) {
        gt::core::Logger::Info("[GameSession] Victory reached with a token of value {}",
                               result.cell.tokenValue.value_or(0));
        if (m_onVictory) {
            m_onVictory(result);
        }
    }
    if (m_onMutation) {
        m_onMutation(result);
    }
    return result;
}

InteractionResult GameSession::AttemptPickUp(const world::CellCoordinate& coord) {
    return RunAction(coord, [](SessionState& state, const world::CellCoordinate& c, world::Cell& cell) {
        return PickUp(state, c, cell);
    });
}

InteractionResult GameSession::AttemptPlace(const world::CellCoordinate& coord) {
    return RunAction(coord, [](SessionState& state, const world::CellCoordinate& c, world::Cell& cell) {
        return Place(state, c, cell);
    });
}

InteractionResult GameSession::AttemptCraft(const world::CellCoordinate& coord) {
    const int threshold = m_settings.victoryThreshold;
    return RunAction(coord, [threshold](SessionState& state, const world::CellCoordinate& c, world::Cell& cell) {
        return Craft(state, c, cell, threshold);
    });
}

InteractionResult GameSession::Interact(const world::CellCoordinate& coord) {
    const int threshold = m_settings.victoryThreshold;
    return RunAction(coord, [threshold](SessionState& state, const world::CellCoordinate& c, world::Cell& cell) {
        switch (ClassifyInteraction(cell, state.player.inventory)) {
            case InteractionOutcome::PickedUp: return PickUp(state, c, cell);
            case InteractionOutcome::Placed:   return Place(state, c, cell);
            case InteractionOutcome::Crafted:  return Craft(state, c, cell, threshold);
            case InteractionOutcome::Mismatch: return MakeRejection(state, c, cell, InteractionOutcome::Mismatch);
            default:                           return MakeRejection(state, c, cell, InteractionOutcome::NothingToDo);
        }
    });
}

void GameSession::ResyncResidentCells() {
    m_cache.EvictAll(m_renderer);
    if (m_lastViewport) {
        m_cache.Sync(*m_lastViewport, world::MakeCellResolver(m_state.overrides, m_generator), m_renderer);
    }
}

void GameSession::LoadState(SessionState state) {
    m_state = std::move(state);
    ResyncResidentCells();
    gt::core::Logger::Info("[GameSession] Loaded session with {} overrides", m_state.overrides.Size());
}

void GameSession::ResetWorld() {
    m_state.overrides.Clear();
    m_state.player = PlayerState{};
    m_state.player.position = m_settings.startPosition;
    ResyncResidentCells();
    gt::core::Logger::Info("[GameSession] World reset");
}

std::string GameSession::DescribeStatus() const {
    const auto& player = m_state.player;
    const auto cell = m_mapper.ToCell(player.position);
    std::string status = fmt::format("Cell ({}, {}) | ", cell.i, cell.j);
    status += player.inventory ? fmt::format("Holding {}", *player.inventory) : std::string("Empty hands");
    if (player.victory) {
        status += fmt::format(" | Victory ({}+ crafted)", m_settings.victoryThreshold);
    }
    return status;
}

} // namespace gt::gameplay
