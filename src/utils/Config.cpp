#include "gt/utils/Config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "gt/save/KeyValueStorage.hpp"

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace gt::utils {

namespace {

constexpr double kMinCellDegrees = 1e-7;
constexpr double kMaxCellDegrees = 1.0;
constexpr double kMaxInteractionRadiusCells = 100.0;
constexpr int kMaxMovementStepCells = 100;
// Keeps the resident cell count bounded: (2 * 64 + 1)^2 cells at most.
constexpr int kMaxHalfExtentCells = 64;

std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path, ec);
    }
    return normalized.lexically_normal();
}

std::filesystem::path ResolvePath(const std::filesystem::path& baseDir, const std::string& value) {
    if (value.empty()) {
        return NormalizePath(baseDir);
    }
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

template <typename T>
T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        gt::core::Logger::Warning("[ConfigLoader] Failed to parse key '{}': {}", key, e.what());
        return fallback;
    }
}

nlohmann::json Section(const nlohmann::json& json, const char* name) {
    auto it = json.find(name);
    if (it == json.end() || !it->is_object()) {
        return nlohmann::json::object();
    }
    return *it;
}

bool IsPowerOfTwo(int value) {
    return value > 0 && (value & (value - 1)) == 0;
}

} // namespace

std::filesystem::path ConfigLoader::GetUserDocumentsPath() {
#ifdef _WIN32
    wchar_t* documentsPath = nullptr;
    if (SHGetKnownFolderPath(FOLDERID_Documents, 0, nullptr, &documentsPath) == S_OK) {
        std::filesystem::path path(documentsPath);
        CoTaskMemFree(documentsPath);
        return path / "Geotoken";
    }
#else
    if (const char* homeDir = std::getenv("HOME")) {
        return std::filesystem::path(homeDir) / "Documents" / "Geotoken";
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir) / "Documents" / "Geotoken";
    }
#endif
    return std::filesystem::path();
}

AppConfig ConfigLoader::CreateDefault(const std::filesystem::path& baseDir) {
    AppConfig config{};
    config.configDirectory = baseDir;

    std::filesystem::path userDocsPath = GetUserDocumentsPath();
    if (!userDocsPath.empty()) {
        config.paths.saves = NormalizePath(userDocsPath / "saves");
    } else {
        config.paths.saves = NormalizePath(baseDir / "saves");
    }
    return config;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() ? std::filesystem::current_path()
                                                       : path.parent_path();

    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        gt::core::Logger::Warning("[ConfigLoader] Config file '{}' not found, using defaults",
                                  path.empty() ? "<none>" : path.string());
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        gt::core::Logger::Error("[ConfigLoader] Failed to open config file '{}'", path.string());
        return result;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        gt::core::Logger::Error("[ConfigLoader] Failed to parse JSON '{}': {}", path.string(), e.what());
        return result;
    }
    if (!json.is_object()) {
        gt::core::Logger::Error("[ConfigLoader] Config '{}' is not a JSON object, using defaults", path.string());
        return result;
    }

    auto& config = result.config;

    const auto worldObj = Section(json, "world");
    config.world.cellDegrees = GetOrDefault<double>(worldObj, "cellDegrees", config.world.cellDegrees);
    config.world.seed = GetOrDefault<std::string>(worldObj, "seed", config.world.seed);
    config.world.spawnProbability = GetOrDefault<double>(worldObj, "spawnProbability", config.world.spawnProbability);
    config.world.baseTokenValue = GetOrDefault<int>(worldObj, "baseTokenValue", config.world.baseTokenValue);

    const auto gameplayObj = Section(json, "gameplay");
    config.gameplay.interactionRadiusCells =
        GetOrDefault<double>(gameplayObj, "interactionRadiusCells", config.gameplay.interactionRadiusCells);
    config.gameplay.victoryThreshold = GetOrDefault<int>(gameplayObj, "victoryThreshold", config.gameplay.victoryThreshold);
    config.gameplay.startLatitude = GetOrDefault<double>(gameplayObj, "startLatitude", config.gameplay.startLatitude);
    config.gameplay.startLongitude = GetOrDefault<double>(gameplayObj, "startLongitude", config.gameplay.startLongitude);
    config.gameplay.movementStepCells =
        GetOrDefault<int>(gameplayObj, "movementStepCells", config.gameplay.movementStepCells);

    const auto viewObj = Section(json, "view");
    config.view.halfExtentCells = GetOrDefault<int>(viewObj, "halfExtentCells", config.view.halfExtentCells);

    const auto pathsObj = Section(json, "paths");
    if (pathsObj.contains("saves") && pathsObj["saves"].is_string()) {
        config.paths.saves = ResolvePath(baseDir, pathsObj["saves"].get<std::string>());
    }

    const auto persistenceObj = Section(json, "persistence");
    config.persistence.storageKey =
        GetOrDefault<std::string>(persistenceObj, "storageKey", config.persistence.storageKey);
    config.persistence.autosave = GetOrDefault<bool>(persistenceObj, "autosave", config.persistence.autosave);

    const auto loggingObj = Section(json, "logging");
    if (loggingObj.contains("file") && loggingObj["file"].is_string()) {
        config.logging.file = ResolvePath(baseDir, loggingObj["file"].get<std::string>());
    }
    if (loggingObj.contains("level") && loggingObj["level"].is_string()) {
        const auto levelName = loggingObj["level"].get<std::string>();
        config.logging.level = core::ParseLogLevel(levelName);
        if (!config.logging.level) {
            result.warnings.push_back(fmt::format("Unknown logging.level '{}', keeping the default", levelName));
        }
    }

    config.configDirectory = baseDir;
    result.loadedFromFile = true;

    ValidateConfig(config, result);

    for (const auto& warning : result.warnings) {
        gt::core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        gt::core::Logger::Error("[ConfigLoader] {}", error);
    }

    gt::core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    return result;
}

void ConfigLoader::ValidateConfig(AppConfig& config, ConfigLoadResult& result) {
    ValidateWorldConfig(config.world, result);
    ValidateGameplayConfig(config.gameplay, config.world, result);
    ValidateViewConfig(config.view, result);

    if (!gt::save::IsSafeStorageKey(config.persistence.storageKey)) {
        result.errors.push_back(fmt::format("persistence.storageKey '{}' may only use letters, digits, '_', '-' and '.'",
                                            config.persistence.storageKey));
        config.persistence.storageKey = PersistenceConfig{}.storageKey;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.paths.saves, ec);
    if (ec) {
        result.errors.push_back(
            fmt::format("Cannot create saves directory '{}': {}", config.paths.saves.string(), ec.message()));
    }
}

void ConfigLoader::ValidateWorldConfig(WorldConfig& world, ConfigLoadResult& result) {
    if (!std::isfinite(world.cellDegrees) || world.cellDegrees < kMinCellDegrees ||
        world.cellDegrees > kMaxCellDegrees) {
        result.errors.push_back(fmt::format("world.cellDegrees ({}) must be between {} and {}",
                                            world.cellDegrees, kMinCellDegrees, kMaxCellDegrees));
        world.cellDegrees = std::isfinite(world.cellDegrees)
            ? std::clamp(world.cellDegrees, kMinCellDegrees, kMaxCellDegrees)
            : WorldConfig{}.cellDegrees;
    }

    if (!std::isfinite(world.spawnProbability) || world.spawnProbability < 0.0 || world.spawnProbability > 1.0) {
        result.warnings.push_back(
            fmt::format("world.spawnProbability ({:.3f}) should be between 0 and 1, clamping", world.spawnProbability));
        world.spawnProbability = std::isfinite(world.spawnProbability)
            ? std::clamp(world.spawnProbability, 0.0, 1.0)
            : WorldConfig{}.spawnProbability;
    }

    if (!IsPowerOfTwo(world.baseTokenValue)) {
        result.errors.push_back(
            fmt::format("world.baseTokenValue ({}) must be a positive power of two", world.baseTokenValue));
        world.baseTokenValue = WorldConfig{}.baseTokenValue;
    }
}

void ConfigLoader::ValidateGameplayConfig(GameplayConfig& gameplay, const WorldConfig& world, ConfigLoadResult& result) {
    if (!std::isfinite(gameplay.interactionRadiusCells) || gameplay.interactionRadiusCells < 0.0 ||
        gameplay.interactionRadiusCells > kMaxInteractionRadiusCells) {
        result.warnings.push_back(fmt::format("gameplay.interactionRadiusCells ({:.2f}) should be between 0 and {:.0f}, clamping",
                                              gameplay.interactionRadiusCells, kMaxInteractionRadiusCells));
        gameplay.interactionRadiusCells = std::isfinite(gameplay.interactionRadiusCells)
            ? std::clamp(gameplay.interactionRadiusCells, 0.0, kMaxInteractionRadiusCells)
            : GameplayConfig{}.interactionRadiusCells;
    }

    if (gameplay.victoryThreshold <= 0) {
        result.errors.push_back(
            fmt::format("gameplay.victoryThreshold ({}) must be positive", gameplay.victoryThreshold));
        gameplay.victoryThreshold = GameplayConfig{}.victoryThreshold;
    } else if (gameplay.victoryThreshold <= world.baseTokenValue) {
        result.warnings.push_back(fmt::format("gameplay.victoryThreshold ({}) is reached by the first craft",
                                              gameplay.victoryThreshold));
    }

    if (!std::isfinite(gameplay.startLatitude) || std::abs(gameplay.startLatitude) > 90.0) {
        result.errors.push_back(fmt::format("gameplay.startLatitude ({}) must be within [-90, 90]", gameplay.startLatitude));
        gameplay.startLatitude = GameplayConfig{}.startLatitude;
    }
    if (!std::isfinite(gameplay.startLongitude) || std::abs(gameplay.startLongitude) > 180.0) {
        result.errors.push_back(
            fmt::format("gameplay.startLongitude ({}) must be within [-180, 180]", gameplay.startLongitude));
        gameplay.startLongitude = GameplayConfig{}.startLongitude;
    }

    if (gameplay.movementStepCells < 1 || gameplay.movementStepCells > kMaxMovementStepCells) {
        result.warnings.push_back(fmt::format("gameplay.movementStepCells ({}) should be between 1 and {}, clamping",
                                              gameplay.movementStepCells, kMaxMovementStepCells));
        gameplay.movementStepCells = std::clamp(gameplay.movementStepCells, 1, kMaxMovementStepCells);
    }
}

void ConfigLoader::ValidateViewConfig(ViewConfig& view, ConfigLoadResult& result) {
    if (view.halfExtentCells < 0 || view.halfExtentCells > kMaxHalfExtentCells) {
        result.warnings.push_back(fmt::format("view.halfExtentCells ({}) should be between 0 and {}, clamping",
                                              view.halfExtentCells, kMaxHalfExtentCells));
        view.halfExtentCells = std::clamp(view.halfExtentCells, 0, kMaxHalfExtentCells);
    }
}

} // namespace gt::utils
