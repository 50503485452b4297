#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

class ConfigManager;

// Typed view of the configuration, passed to components at construction.
struct ServerSettings {
    std::string host = "0.0.0.0";
    uint16_t port = 8765;
    int maxConnections = 100;

    size_t maxPlayersPerSession = 4;
    uint32_t maxActionsPerRound = 4;
    std::chrono::seconds disconnectDeadline{120};
    std::chrono::seconds sessionGracePeriod{60};
    size_t chatLogSize = 50;
    uint32_t worldSeed = 0;

    std::chrono::seconds authTimeout{30};
    size_t outboundQueueSize = 256;
    size_t outboundHardLimit = 1024;
    size_t maxMessageSize = 1024 * 1024;
    std::chrono::milliseconds sweepInterval{1000};

    std::chrono::seconds tokenExpiry{86400};

    static ServerSettings FromConfig(const ConfigManager& config);
};
