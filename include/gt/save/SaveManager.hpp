#pragma once

#include <cstddef>
#include <string>

#include "gt/gameplay/SessionState.hpp"
#include "gt/save/KeyValueStorage.hpp"
#include "gt/world/CellTypes.hpp"

namespace gt::save {

struct SaveLoadResult {
    bool success = false;
    std::string message;
};

struct SessionLoadResult {
    gameplay::SessionState state;
    bool restoredFromStorage = false;
    std::size_t skippedOverrides = 0;
    std::string message;
};

/**
 * @brief Persists whole sessions under one storage key.
 *
 * Loading never fails outright: a missing, unreadable or incompatible
 * snapshot yields a fresh session at the default position.
 */
class SaveManager {
public:
    SaveManager(IKeyValueStorage& storage, std::string storageKey, int baseTokenValue);

    const std::string& StorageKey() const { return m_storageKey; }

    SaveLoadResult Save(const gameplay::SessionState& state);
    SessionLoadResult Load(const world::WorldPosition& defaultPosition) const;
    SaveLoadResult Erase();

private:
    IKeyValueStorage& m_storage;
    std::string m_storageKey;
    int m_baseTokenValue;
};

} // namespace gt::save
