#pragma once

#include "gt/gameplay/SessionState.hpp"
#include "gt/save/GameSnapshot.hpp"

namespace gt::save {

/**
 * Conversions between the live session state and its durable snapshot.
 * Restoring only fills the OverrideStore; cells are still resolved through
 * the usual override-then-generate rule afterwards.
 */
struct SaveSnapshotHelpers {
    static GameSnapshot CaptureSnapshot(const gameplay::SessionState& state);

    static gameplay::SessionState ApplySnapshot(const GameSnapshot& snapshot);
};

} // namespace gt::save
