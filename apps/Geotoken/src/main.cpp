#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "ConsoleCellRenderer.hpp"
#include "ConsoleFrontend.hpp"
#include "gt/core/Logger.hpp"
#include "gt/gameplay/GameSession.hpp"
#include "gt/save/KeyValueStorage.hpp"
#include "gt/save/SaveManager.hpp"
#include "gt/utils/Config.hpp"

namespace {

gt::gameplay::SessionSettings MakeSessionSettings(const gt::utils::AppConfig& config) {
    gt::gameplay::SessionSettings settings;
    settings.cellDegrees = config.world.cellDegrees;
    settings.generator.seed = config.world.seed;
    settings.generator.spawnProbability = config.world.spawnProbability;
    settings.generator.baseTokenValue = config.world.baseTokenValue;
    settings.interactionRadiusCells = config.gameplay.interactionRadiusCells;
    settings.victoryThreshold = config.gameplay.victoryThreshold;
    settings.startPosition = gt::world::WorldPosition(config.gameplay.startLatitude, config.gameplay.startLongitude);
    return settings;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        gt::core::Logger::ConfigureFromEnvironment();

        const std::filesystem::path configPath = argc > 1 ? std::filesystem::path(argv[1])
                                                          : std::filesystem::path(GT_CONFIG_PATH);
        auto configResult = gt::utils::ConfigLoader::Load(configPath);
        if (configResult.HasErrors()) {
            gt::core::Logger::Error("[main] Configuration errors detected. Please fix the following:");
            for (const auto& error : configResult.errors) {
                gt::core::Logger::Error("[main]   - {}", error);
            }
            return 1;
        }
        const gt::utils::AppConfig& config = configResult.config;

        if (config.logging.level) {
            gt::core::Logger::SetMinimumLevel(*config.logging.level);
        }
        if (!config.logging.file.empty()) {
            gt::core::Logger::SetLogFile(config.logging.file);
        }

        gt::save::FileKeyValueStorage storage(config.paths.saves);
        gt::save::SaveManager saveManager(storage, config.persistence.storageKey, config.world.baseTokenValue);

        ConsoleCellRenderer renderer;
        gt::gameplay::GameSession session(MakeSessionSettings(config), renderer);

        // Overrides must be in place before the first viewport sync resolves any cell.
        auto loaded = saveManager.Load(session.Settings().startPosition);
        session.LoadState(std::move(loaded.state));

        FrontendSettings frontendSettings;
        frontendSettings.halfExtentCells = config.view.halfExtentCells;
        frontendSettings.movementStepCells = config.gameplay.movementStepCells;
        frontendSettings.autosave = config.persistence.autosave;

        ConsoleFrontend frontend(session, saveManager, frontendSettings);
        frontend.Start();

        std::cout << loaded.message << "\n";
        frontend.RenderMap(std::cout);
        std::cout << "Type 'help' for commands.\n";

        std::string line;
        while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
            if (!frontend.Execute(line, std::cout)) {
                break;
            }
        }

        const auto saved = frontend.SaveNow();
        if (!saved.success) {
            gt::core::Logger::Error("[main] Failed to save session on exit: {}", saved.message);
            return 1;
        }
        return 0;
    } catch (const std::exception& ex) {
        gt::core::Logger::Error("[main] Fatal exception: {}", ex.what());
        return 1;
    }
}
