#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gt/core/Logger.hpp"

namespace gt::utils {

struct WorldConfig {
    double cellDegrees = 1e-4;
    std::string seed;
    double spawnProbability = 0.15;
    int baseTokenValue = 2;
};

struct GameplayConfig {
    double interactionRadiusCells = 3.0;
    int victoryThreshold = 32;
    double startLatitude = 36.997936938057016;
    double startLongitude = -122.05703507501151;
    int movementStepCells = 1;
};

struct ViewConfig {
    int halfExtentCells = 8;
};

struct PathsConfig {
    std::filesystem::path saves;
};

struct PersistenceConfig {
    std::string storageKey = "geotoken.session";
    bool autosave = true;
};

struct LoggingConfig {
    std::filesystem::path file;
    std::optional<core::LogLevel> level;
};

struct AppConfig {
    WorldConfig world;
    GameplayConfig gameplay;
    ViewConfig view;
    PathsConfig paths;
    PersistenceConfig persistence;
    LoggingConfig logging;
    std::filesystem::path configDirectory;
};

struct ConfigLoadResult {
    AppConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Critical errors that should prevent startup
    std::vector<std::string> warnings;    // Non-critical issues that should be logged

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);

    /**
     * @brief Default per-user directory for saves.
     * @return Path to <documents>/Geotoken, or an empty path if unavailable
     */
    static std::filesystem::path GetUserDocumentsPath();

private:
    static AppConfig CreateDefault(const std::filesystem::path& baseDir);
    static void ValidateConfig(AppConfig& config, ConfigLoadResult& result);
    static void ValidateWorldConfig(WorldConfig& world, ConfigLoadResult& result);
    static void ValidateGameplayConfig(GameplayConfig& gameplay, const WorldConfig& world, ConfigLoadResult& result);
    static void ValidateViewConfig(ViewConfig& view, ConfigLoadResult& result);
};

} // namespace gt::utils
