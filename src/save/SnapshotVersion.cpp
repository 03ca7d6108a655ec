#include "gt/save/SnapshotVersion.hpp"

#include <charconv>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "gt/core/Logger.hpp"

namespace gt::save {

namespace {

int ParseComponent(std::string_view str, const char* label) {
    int value = 0;
    auto result = std::from_chars(str.data(), str.data() + str.size(), value);
    if (result.ec != std::errc{} || result.ptr != str.data() + str.size()) {
        gt::core::Logger::Warning("[SnapshotVersion] Failed to parse {} component '{}'", label, str);
        return 0;
    }
    return value;
}

} // namespace

std::string SnapshotVersion::ToString() const {
    return fmt::format("{}.{}", major, minor);
}

bool SnapshotVersion::IsCompatibleWith(const SnapshotVersion& runtime) const {
    return major == runtime.major && minor <= runtime.minor;
}

SnapshotVersion ParseSnapshotVersion(const nlohmann::json& json) {
    if (json.is_object()) {
        SnapshotVersion version;
        const auto major = json.find("major");
        const auto minor = json.find("minor");
        if (major != json.end() && major->is_number_integer()) {
            version.major = major->get<int>();
        }
        if (minor != json.end() && minor->is_number_integer()) {
            version.minor = minor->get<int>();
        }
        return version;
    }
    if (json.is_string()) {
        return ParseSnapshotVersion(std::string_view(json.get_ref<const nlohmann::json::string_t&>()));
    }
    return SnapshotVersion{};
}

SnapshotVersion ParseSnapshotVersion(std::string_view versionString) {
    SnapshotVersion version;
    if (versionString.empty()) {
        return version;
    }
    const auto dot = versionString.find('.');
    version.major = ParseComponent(versionString.substr(0, dot), "major");
    if (dot != std::string_view::npos) {
        version.minor = ParseComponent(versionString.substr(dot + 1), "minor");
    }
    return version;
}

nlohmann::json SnapshotVersionToJson(const SnapshotVersion& version) {
    return nlohmann::json{
        {"major", version.major},
        {"minor", version.minor}
    };
}

} // namespace gt::save
