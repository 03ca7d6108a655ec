#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace gt::save {

/**
 * @brief Schema version embedded in every session snapshot.
 *
 * A snapshot loads when its major version matches the runtime and its minor
 * version is not newer.
 */
struct SnapshotVersion {
    int major = 0;
    int minor = 0;

    constexpr SnapshotVersion() = default;
    constexpr SnapshotVersion(int maj, int min) : major(maj), minor(min) {}

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] bool operator==(const SnapshotVersion&) const = default;
    [[nodiscard]] bool operator!=(const SnapshotVersion&) const = default;

    [[nodiscard]] bool IsCompatibleWith(const SnapshotVersion& runtime) const;

    static constexpr SnapshotVersion Current() {
        return SnapshotVersion(1, 0);
    }
};

SnapshotVersion ParseSnapshotVersion(const nlohmann::json& json);
SnapshotVersion ParseSnapshotVersion(std::string_view versionString);
nlohmann::json SnapshotVersionToJson(const SnapshotVersion& version);

} // namespace gt::save
