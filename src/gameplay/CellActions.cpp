#include "gt/gameplay/CellActions.hpp"

#include <limits>

#include <fmt/format.h>

#include "gt/core/Logger.hpp"

namespace gt::gameplay {

namespace {

std::string RejectionMessage(InteractionOutcome outcome,
                             const world::Cell& cell,
                             const std::optional<int>& inventory) {
    switch (outcome) {
        case InteractionOutcome::Mismatch:
            return fmt::format("Cannot combine: you hold {} but this cell holds {}",
                               inventory.value_or(0), cell.tokenValue.value_or(0));
        case InteractionOutcome::NothingToDo:
            return "Empty cell, and you are not carrying a token";
        case InteractionOutcome::InventoryFull:
            return fmt::format("Your hands are full: place or combine your {} first", inventory.value_or(0));
        case InteractionOutcome::CellOccupied:
            return fmt::format("This cell already holds a token of value {}", cell.tokenValue.value_or(0));
        case InteractionOutcome::NoToken:
            return "There is no token in this cell";
        case InteractionOutcome::InventoryEmpty:
            return "You are not carrying a token";
        case InteractionOutcome::OutOfRange:
            return "That cell is out of range";
        case InteractionOutcome::NotResident:
            return "That cell is not on screen";
        default:
            return {};
    }
}

InteractionResult MakeCommitted(const SessionState& state,
                                const world::CellCoordinate& coord,
                                const world::Cell& cell,
                                InteractionOutcome outcome,
                                std::string message) {
    InteractionResult result;
    result.outcome = outcome;
    result.coord = coord;
    result.cell = cell;
    result.inventory = state.player.inventory;
    result.message = std::move(message);
    return result;
}

} // namespace

const char* ToString(InteractionOutcome outcome) {
    switch (outcome) {
        case InteractionOutcome::PickedUp:      return "PickedUp";
        case InteractionOutcome::Placed:        return "Placed";
        case InteractionOutcome::Crafted:       return "Crafted";
        case InteractionOutcome::Mismatch:      return "Mismatch";
        case InteractionOutcome::NothingToDo:   return "NothingToDo";
        case InteractionOutcome::InventoryFull: return "InventoryFull";
        case InteractionOutcome::CellOccupied:  return "CellOccupied";
        case InteractionOutcome::NoToken:       return "NoToken";
        case InteractionOutcome::InventoryEmpty: return "InventoryEmpty";
        case InteractionOutcome::OutOfRange:    return "OutOfRange";
        case InteractionOutcome::NotResident:   return "NotResident";
    }
    return "Unknown";
}

InteractionOutcome ClassifyInteraction(const world::Cell& cell, const std::optional<int>& inventory) {
    if (cell.hasToken) {
        if (!inventory) {
            return InteractionOutcome::PickedUp;
        }
        return *inventory == cell.tokenValue ? InteractionOutcome::Crafted : InteractionOutcome::Mismatch;
    }
    return inventory ? InteractionOutcome::Placed : InteractionOutcome::NothingToDo;
}

InteractionResult MakeRejection(const SessionState& state,
                                const world::CellCoordinate& coord,
                                const world::Cell& cell,
                                InteractionOutcome outcome) {
    InteractionResult result;
    result.outcome = outcome;
    result.coord = coord;
    result.cell = cell;
    result.inventory = state.player.inventory;
    result.message = RejectionMessage(outcome, cell, state.player.inventory);
    return result;
}

InteractionResult PickUp(SessionState& state, const world::CellCoordinate& coord, world::Cell& cell) {
    if (!cell.hasToken) {
        return MakeRejection(state, coord, cell, InteractionOutcome::NoToken);
    }
    if (state.player.inventory) {
        return MakeRejection(state, coord, cell, InteractionOutcome::InventoryFull);
    }

    const int value = *cell.tokenValue;
    const world::Cell updated = world::Cell::Empty();
    state.overrides.Save(coord, updated);
    cell = updated;
    state.player.inventory = value;

    gt::core::Logger::Debug("[CellActions] Picked up {} at ({}, {})", value, coord.i, coord.j);
    return MakeCommitted(state, coord, cell, InteractionOutcome::PickedUp,
                         fmt::format("You picked up a token of value {}", value));
}

InteractionResult Place(SessionState& state, const world::CellCoordinate& coord, world::Cell& cell) {
    if (!state.player.inventory) {
        return MakeRejection(state, coord, cell, InteractionOutcome::InventoryEmpty);
    }
    if (cell.hasToken) {
        return MakeRejection(state, coord, cell, InteractionOutcome::CellOccupied);
    }

    const int value = *state.player.inventory;
    const world::Cell updated = world::Cell::WithToken(value);
    state.overrides.Save(coord, updated);
    cell = updated;
    state.player.inventory.reset();

    gt::core::Logger::Debug("[CellActions] Placed {} at ({}, {})", value, coord.i, coord.j);
    return MakeCommitted(state, coord, cell, InteractionOutcome::Placed,
                         fmt::format("You placed a token of value {}", value));
}

InteractionResult Craft(SessionState& state,
                        const world::CellCoordinate& coord,
                        world::Cell& cell,
                        int victoryThreshold) {
    if (!cell.hasToken) {
        return MakeRejection(state, coord, cell, InteractionOutcome::NoToken);
    }
    if (!state.player.inventory) {
        return MakeRejection(state, coord, cell, InteractionOutcome::InventoryEmpty);
    }
    if (*state.player.inventory != *cell.tokenValue ||
        *cell.tokenValue > std::numeric_limits<int>::max() / 2) {
        return MakeRejection(state, coord, cell, InteractionOutcome::Mismatch);
    }

    const int value = *cell.tokenValue + *state.player.inventory;
    const world::Cell updated = world::Cell::WithToken(value);
    state.overrides.Save(coord, updated);
    cell = updated;
    state.player.inventory.reset();

    InteractionResult result = MakeCommitted(state, coord, cell, InteractionOutcome::Crafted,
                                             fmt::format("You crafted a token of value {}", value));
    if (value >= victoryThreshold && !state.player.victory) {
        state.player.victory = true;
        result.victoryTriggered = true;
        result.message += fmt::format(". Victory: you reached {}!", victoryThreshold);
    }

    gt::core::Logger::Debug("[CellActions] Crafted {} at ({}, {})", value, coord.i, coord.j);
    return result;
}

} // namespace gt::gameplay
