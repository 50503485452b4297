#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

class ConfigManager {
public:
    static ConfigManager& GetInstance();

    bool LoadConfig(const std::string& configPath);
    bool LoadFromJson(const nlohmann::json& config);
    bool ValidateConfig() const;

    // Server configuration
    std::string GetServerHost() const;
    uint16_t GetServerPort() const;
    int GetMaxConnections() const;

    // Game configuration
    int GetMaxPlayersPerSession() const;
    int GetMaxActionsPerRound() const;
    int GetDisconnectDeadlineSeconds() const;
    int GetSessionGracePeriodSeconds() const;
    int GetChatLogSize() const;
    uint32_t GetWorldSeed() const;

    // Network configuration
    int GetAuthTimeoutSeconds() const;
    int GetOutboundQueueSize() const;
    int GetOutboundHardLimit() const;
    int GetMaxMessageSize() const;
    int GetSweepIntervalMs() const;

    // Auth configuration
    int GetTokenExpirySeconds() const;

    // Logging configuration
    std::string GetLogLevel() const;
    std::string GetLogFilePath() const;
    int GetMaxLogFileSize() const;
    int GetMaxLogFiles() const;
    bool GetConsoleOutput() const;

    // Generic config accessors, keys are dotted paths ("game.world_seed")
    int GetInt(const std::string& key, int defaultValue = 0) const;
    bool GetBool(const std::string& key, bool defaultValue = false) const;
    std::string GetString(const std::string& key, const std::string& defaultValue = "") const;
    bool HasKey(const std::string& key) const;

    void DumpConfig() const;

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    static nlohmann::json::json_pointer ToPointer(const std::string& key);
    int GetIntOr(const std::string& key, int defaultValue, const char* label) const;

    nlohmann::json config_;
    std::string configPath_;
};
