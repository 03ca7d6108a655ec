#include "gt/save/SaveManager.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "gt/core/Logger.hpp"
#include "gt/save/GameSnapshot.hpp"
#include "gt/save/SaveSnapshotHelpers.hpp"

namespace gt::save {

namespace {

SessionLoadResult FreshSession(const world::WorldPosition& defaultPosition, std::string message) {
    SessionLoadResult result;
    result.state.player.position = defaultPosition;
    result.message = std::move(message);
    return result;
}

} // namespace

SaveManager::SaveManager(IKeyValueStorage& storage, std::string storageKey, int baseTokenValue)
    : m_storage(storage)
    , m_storageKey(std::move(storageKey))
    , m_baseTokenValue(baseTokenValue) {}

SaveLoadResult SaveManager::Save(const gameplay::SessionState& state) {
    SaveLoadResult result;

    const GameSnapshot snapshot = SaveSnapshotHelpers::CaptureSnapshot(state);
    std::string payload;
    try {
        payload = SnapshotToJson(snapshot).dump(2);
    } catch (const nlohmann::json::exception& ex) {
        result.message = std::string("Failed to encode snapshot: ") + ex.what();
        gt::core::Logger::Error("[SaveManager] {}", result.message);
        return result;
    }

    if (!m_storage.Set(m_storageKey, payload)) {
        result.message = "Storage rejected the snapshot";
        gt::core::Logger::Error("[SaveManager] Failed to save session under '{}'", m_storageKey);
        return result;
    }

    gt::core::Logger::Info("[SaveManager] Saved session '{}' ({} overrides)",
                           m_storageKey, snapshot.overrides.size());
    result.success = true;
    return result;
}

SessionLoadResult SaveManager::Load(const world::WorldPosition& defaultPosition) const {
    const auto payload = m_storage.Get(m_storageKey);
    if (!payload) {
        gt::core::Logger::Info("[SaveManager] No saved session '{}'; starting fresh", m_storageKey);
        return FreshSession(defaultPosition, "No saved session");
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(*payload);
    } catch (const nlohmann::json::exception& ex) {
        gt::core::Logger::Warning("[SaveManager] Failed to parse session '{}': {}; starting fresh",
                                  m_storageKey, ex.what());
        return FreshSession(defaultPosition, std::string("Failed to parse save: ") + ex.what());
    }

    SnapshotParseReport report;
    std::string error;
    auto snapshot = SnapshotFromJson(json, m_baseTokenValue, report, error);
    if (!snapshot) {
        gt::core::Logger::Warning("[SaveManager] Invalid session '{}': {}; starting fresh", m_storageKey, error);
        return FreshSession(defaultPosition, "Invalid save data: " + error);
    }

    for (const auto& warning : report.warnings) {
        gt::core::Logger::Warning("[SaveManager] {}", warning);
    }

    SessionLoadResult result;
    result.state = SaveSnapshotHelpers::ApplySnapshot(*snapshot);
    result.restoredFromStorage = true;
    result.skippedOverrides = report.skippedOverrides;
    result.message = report.skippedOverrides == 0
        ? std::string("Session restored")
        : "Session restored; skipped " + std::to_string(report.skippedOverrides) + " malformed overrides";
    gt::core::Logger::Info("[SaveManager] Restored session '{}' ({} overrides, {} skipped)",
                           m_storageKey, result.state.overrides.Size(), report.skippedOverrides);
    return result;
}

SaveLoadResult SaveManager::Erase() {
    SaveLoadResult result;
    // Remove reports false for a key that was never saved, which is not a failure.
    const bool removed = m_storage.Remove(m_storageKey);
    if (!removed && m_storage.Get(m_storageKey)) {
        result.message = "Saved session could not be removed";
        gt::core::Logger::Error("[SaveManager] Failed to erase session '{}'", m_storageKey);
        return result;
    }
    gt::core::Logger::Info("[SaveManager] Erased session '{}'", m_storageKey);
    result.success = true;
    return result;
}

} // namespace gt::save
