#include "config/ConfigManager.hpp"
#include "config/ServerSettings.hpp"
#include "game/DungeonRules.hpp"
#include "logging/Logger.hpp"
#include "network/GameServer.hpp"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string configPath = "config/server_config.json";
    if (argc > 1) {
        configPath = argv[1];
    }

    // Load configuration
    auto& config = ConfigManager::GetInstance();
    if (!config.LoadConfig(configPath)) {
        std::cerr << "Failed to load configuration from " << configPath << std::endl;
        return 1;
    }

    // Initialize logging
    Logger::Initialize();

    Logger::Info("Starting Dungeon Server v1.0.0");
    config.DumpConfig();

    ServerSettings settings = ServerSettings::FromConfig(config);

    int exitCode = 0;
    {
        GameServer server(settings, MakeDungeonRules());

        if (server.Initialize()) {
            server.Run();
        } else {
            Logger::Critical("Failed to initialize server");
            exitCode = 1;
        }
    }

    Logger::Info("Dungeon Server shutdown complete");
    Logger::Shutdown();
    return exitCode;
}
