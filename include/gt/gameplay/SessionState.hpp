#pragma once

#include <optional>

#include "gt/world/CellTypes.hpp"
#include "gt/world/OverrideStore.hpp"

namespace gt::gameplay {

struct PlayerState {
    world::WorldPosition position{0.0};
    std::optional<int> inventory;
    bool victory = false;
};

/**
 * @brief Everything a session must remember: the player and every override.
 *
 * Owned by GameSession and handed explicitly to each action.
 */
struct SessionState {
    PlayerState player;
    world::OverrideStore overrides;
};

} // namespace gt::gameplay
