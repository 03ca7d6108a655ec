#include "gt/save/SaveSnapshotHelpers.hpp"

namespace gt::save {

GameSnapshot SaveSnapshotHelpers::CaptureSnapshot(const gameplay::SessionState& state) {
    GameSnapshot snapshot;
    snapshot.playerPosition = state.player.position;
    snapshot.inventory = state.player.inventory;
    snapshot.overrides = state.overrides.Serialize();
    snapshot.victoryFlag = state.player.victory;
    return snapshot;
}

gameplay::SessionState SaveSnapshotHelpers::ApplySnapshot(const GameSnapshot& snapshot) {
    gameplay::SessionState state;
    state.player.position = snapshot.playerPosition;
    state.player.inventory = snapshot.inventory;
    state.player.victory = snapshot.victoryFlag;
    state.overrides.Restore(snapshot.overrides);
    return state;
}

} // namespace gt::save
