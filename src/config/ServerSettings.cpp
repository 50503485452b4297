#include "config/ServerSettings.hpp"
#include "config/ConfigManager.hpp"
#include <algorithm>

ServerSettings ServerSettings::FromConfig(const ConfigManager& config) {
    ServerSettings settings;
    settings.host = config.GetServerHost();
    settings.port = config.GetServerPort();
    settings.maxConnections = config.GetMaxConnections();

    settings.maxPlayersPerSession = static_cast<size_t>(std::max(1, config.GetMaxPlayersPerSession()));
    settings.maxActionsPerRound = static_cast<uint32_t>(std::max(1, config.GetMaxActionsPerRound()));
    settings.disconnectDeadline = std::chrono::seconds(std::max(0, config.GetDisconnectDeadlineSeconds()));
    settings.sessionGracePeriod = std::chrono::seconds(std::max(0, config.GetSessionGracePeriodSeconds()));
    settings.chatLogSize = static_cast<size_t>(std::max(1, config.GetChatLogSize()));
    settings.worldSeed = config.GetWorldSeed();

    settings.authTimeout = std::chrono::seconds(std::max(1, config.GetAuthTimeoutSeconds()));
    settings.outboundQueueSize = static_cast<size_t>(std::max(1, config.GetOutboundQueueSize()));
    settings.outboundHardLimit = std::max(settings.outboundQueueSize,
                                          static_cast<size_t>(std::max(1, config.GetOutboundHardLimit())));
    settings.maxMessageSize = static_cast<size_t>(std::max(1024, config.GetMaxMessageSize()));
    settings.sweepInterval = std::chrono::milliseconds(std::max(50, config.GetSweepIntervalMs()));

    settings.tokenExpiry = std::chrono::seconds(std::max(1, config.GetTokenExpirySeconds()));
    return settings;
}
