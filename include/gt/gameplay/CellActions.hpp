#pragma once

#include <optional>
#include <string>

#include "gt/gameplay/SessionState.hpp"
#include "gt/world/CellTypes.hpp"

namespace gt::gameplay {

enum class InteractionOutcome {
    PickedUp,
    Placed,
    Crafted,
    Mismatch,       // token and inventory differ in value
    NothingToDo,    // empty cell, empty inventory
    InventoryFull,  // pick-up while already holding a token
    CellOccupied,   // place onto a cell that holds a token
    NoToken,        // pick-up or craft on an empty cell
    InventoryEmpty, // place or craft with nothing in hand
    OutOfRange,
    NotResident
};

const char* ToString(InteractionOutcome outcome);

struct InteractionResult {
    InteractionOutcome outcome = InteractionOutcome::NothingToDo;
    world::CellCoordinate coord;
    world::Cell cell;
    std::optional<int> inventory;
    bool victoryTriggered = false;
    std::string message;

    bool Committed() const {
        return outcome == InteractionOutcome::PickedUp ||
               outcome == InteractionOutcome::Placed ||
               outcome == InteractionOutcome::Crafted;
    }
};

/// Which branch a single click on this cell would take.
InteractionOutcome ClassifyInteraction(const world::Cell& cell, const std::optional<int>& inventory);

// Each action checks its own preconditions. On success the override is saved
// before `cell` (the resident copy) and the inventory are updated; on
// rejection nothing changes.
InteractionResult PickUp(SessionState& state, const world::CellCoordinate& coord, world::Cell& cell);
InteractionResult Place(SessionState& state, const world::CellCoordinate& coord, world::Cell& cell);
InteractionResult Craft(SessionState& state,
                        const world::CellCoordinate& coord,
                        world::Cell& cell,
                        int victoryThreshold);

InteractionResult MakeRejection(const SessionState& state,
                                const world::CellCoordinate& coord,
                                const world::Cell& cell,
                                InteractionOutcome outcome);

} // namespace gt::gameplay
