#include "config/ConfigManager.hpp"
#include "logging/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

ConfigManager& ConfigManager::GetInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::LoadConfig(const std::string& configPath) {
    configPath_ = configPath;

    try {
        std::ifstream configFile(configPath);
        if (!configFile.is_open()) {
            Logger::Error("Failed to open config file: {}", configPath);
            return false;
        }

        std::stringstream buffer;
        buffer << configFile.rdbuf();
        config_ = nlohmann::json::parse(buffer.str());

        Logger::Info("Configuration loaded successfully from: {}", configPath);

        return ValidateConfig();

    } catch (const nlohmann::json::parse_error& e) {
        Logger::Critical("JSON parse error in config file: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        Logger::Critical("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::LoadFromJson(const nlohmann::json& config) {
    config_ = config;
    configPath_.clear();
    return ValidateConfig();
}

bool ConfigManager::ValidateConfig() const {
    try {
        if (!config_.is_object()) {
            throw std::runtime_error("Configuration root must be an object");
        }

        // Validate server section
        if (!config_.contains("server")) {
            throw std::runtime_error("Missing 'server' section");
        }

        const auto& server = config_["server"];
        if (!server.contains("host") || !server["host"].is_string()) {
            throw std::runtime_error("Invalid or missing 'server.host'");
        }
        if (!server.contains("port") || !server["port"].is_number_unsigned()) {
            throw std::runtime_error("Invalid or missing 'server.port'");
        }
        if (server["port"].get<uint32_t>() == 0 || server["port"].get<uint32_t>() > 65535) {
            throw std::runtime_error("Invalid server port");
        }

        // Validate game section
        if (!config_.contains("game")) {
            throw std::runtime_error("Missing 'game' section");
        }

        const auto& game = config_["game"];
        if (!game.contains("max_players_per_session") ||
            !game["max_players_per_session"].is_number_unsigned() ||
            game["max_players_per_session"].get<int>() < 1) {
            throw std::runtime_error("Invalid or missing 'game.max_players_per_session'");
        }
        if (!game.contains("max_actions_per_round") ||
            !game["max_actions_per_round"].is_number_unsigned() ||
            game["max_actions_per_round"].get<int>() < 1) {
            throw std::runtime_error("Invalid or missing 'game.max_actions_per_round'");
        }
        for (const char* key : {"disconnect_deadline_seconds", "session_grace_period_seconds"}) {
            if (game.contains(key) && !game[key].is_number_unsigned()) {
                throw std::runtime_error(std::string("Invalid 'game.") + key + "'");
            }
        }

        // Validate logging section
        if (!config_.contains("logging")) {
            throw std::runtime_error("Missing 'logging' section");
        }

        const auto& logging = config_["logging"];
        if (!logging.contains("level") || !logging["level"].is_string()) {
            throw std::runtime_error("Invalid or missing 'logging.level'");
        }

        const std::string logLevel = logging["level"];
        const std::vector<std::string> validLevels = {
            "trace", "debug", "info", "warn", "error", "critical", "off"
        };

        if (std::find(validLevels.begin(), validLevels.end(), logLevel) == validLevels.end()) {
            throw std::runtime_error("Invalid log level: " + logLevel);
        }

        Logger::Debug("Configuration validation passed");
        return true;

    } catch (const std::exception& e) {
        Logger::Critical("Configuration validation failed: {}", e.what());
        return false;
    }
}

// Server configuration getters
std::string ConfigManager::GetServerHost() const {
    try {
        return config_.at("server").at("host").get<std::string>();
    } catch (const std::exception& e) {
        Logger::Warn("Failed to get server host, using default: 0.0.0.0");
        return "0.0.0.0";
    }
}

uint16_t ConfigManager::GetServerPort() const {
    try {
        return config_.at("server").at("port").get<uint16_t>();
    } catch (const std::exception& e) {
        Logger::Warn("Failed to get server port, using default: 8765");
        return 8765;
    }
}

int ConfigManager::GetMaxConnections() const {
    return GetIntOr("server.max_connections", 100, "max connections");
}

// Game configuration getters
int ConfigManager::GetMaxPlayersPerSession() const {
    return GetIntOr("game.max_players_per_session", 4, "max players per session");
}

int ConfigManager::GetMaxActionsPerRound() const {
    return GetIntOr("game.max_actions_per_round", 4, "max actions per round");
}

int ConfigManager::GetDisconnectDeadlineSeconds() const {
    return GetIntOr("game.disconnect_deadline_seconds", 120, "disconnect deadline");
}

int ConfigManager::GetSessionGracePeriodSeconds() const {
    return GetIntOr("game.session_grace_period_seconds", 60, "session grace period");
}

int ConfigManager::GetChatLogSize() const {
    return GetIntOr("game.chat_log_size", 50, "chat log size");
}

uint32_t ConfigManager::GetWorldSeed() const {
    try {
        return config_.at(ToPointer("game.world_seed")).get<uint32_t>();
    } catch (const std::exception&) {
        return 0;
    }
}

// Network configuration getters
int ConfigManager::GetAuthTimeoutSeconds() const {
    return GetIntOr("network.auth_timeout_seconds", 30, "auth timeout");
}

int ConfigManager::GetOutboundQueueSize() const {
    return GetIntOr("network.outbound_queue_size", 256, "outbound queue size");
}

int ConfigManager::GetOutboundHardLimit() const {
    return GetIntOr("network.outbound_hard_limit", 1024, "outbound hard limit");
}

int ConfigManager::GetMaxMessageSize() const {
    return GetIntOr("network.max_message_size", 1024 * 1024, "max message size");
}

int ConfigManager::GetSweepIntervalMs() const {
    return GetIntOr("network.sweep_interval_ms", 1000, "sweep interval");
}

int ConfigManager::GetTokenExpirySeconds() const {
    return GetIntOr("auth.token_expiry_seconds", 86400, "token expiry");
}

// Logging configuration getters
std::string ConfigManager::GetLogLevel() const {
    try {
        return config_.at("logging").at("level").get<std::string>();
    } catch (const std::exception& e) {
        return "info";
    }
}

std::string ConfigManager::GetLogFilePath() const {
    try {
        return config_.at("logging").at("file_path").get<std::string>();
    } catch (const std::exception& e) {
        return "";
    }
}

int ConfigManager::GetMaxLogFileSize() const {
    try {
        return config_.at("logging").at("max_file_size_mb").get<int>();
    } catch (const std::exception& e) {
        return 100;
    }
}

int ConfigManager::GetMaxLogFiles() const {
    try {
        return config_.at("logging").at("max_files").get<int>();
    } catch (const std::exception& e) {
        return 10;
    }
}

bool ConfigManager::GetConsoleOutput() const {
    return GetBool("logging.console_output", true);
}

nlohmann::json::json_pointer ConfigManager::ToPointer(const std::string& key) {
    std::string path = "/" + key;
    std::replace(path.begin(), path.end(), '.', '/');
    return nlohmann::json::json_pointer(path);
}

int ConfigManager::GetIntOr(const std::string& key, int defaultValue, const char* label) const {
    try {
        return config_.at(ToPointer(key)).get<int>();
    } catch (const std::exception& e) {
        Logger::Debug("Failed to get {}, using default: {}", label, defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::HasKey(const std::string& key) const {
    try {
        return config_.contains(ToPointer(key));
    } catch (const std::exception& e) {
        return false;
    }
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue) const {
    try {
        return config_.at(ToPointer(key)).get<std::string>();
    } catch (const std::exception& e) {
        return defaultValue;
    }
}

int ConfigManager::GetInt(const std::string& key, int defaultValue) const {
    try {
        return config_.at(ToPointer(key)).get<int>();
    } catch (const std::exception& e) {
        return defaultValue;
    }
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    try {
        return config_.at(ToPointer(key)).get<bool>();
    } catch (const std::exception& e) {
        return defaultValue;
    }
}

void ConfigManager::DumpConfig() const {
    Logger::Info("=== Configuration Dump ===");
    Logger::Info("Source: {}", configPath_.empty() ? std::string("<inline json>") : configPath_);
    Logger::Info("Server Configuration:");
    Logger::Info("  Host: {}", GetServerHost());
    Logger::Info("  Port: {}", GetServerPort());
    Logger::Info("  Max Connections: {}", GetMaxConnections());

    Logger::Info("Game Configuration:");
    Logger::Info("  Max Players Per Session: {}", GetMaxPlayersPerSession());
    Logger::Info("  Max Actions Per Round: {}", GetMaxActionsPerRound());
    Logger::Info("  Disconnect Deadline: {}s", GetDisconnectDeadlineSeconds());
    Logger::Info("  Session Grace Period: {}s", GetSessionGracePeriodSeconds());
    Logger::Info("  Chat Log Size: {}", GetChatLogSize());

    Logger::Info("Network Configuration:");
    Logger::Info("  Auth Timeout: {}s", GetAuthTimeoutSeconds());
    Logger::Info("  Outbound Queue: {} (hard limit {})", GetOutboundQueueSize(), GetOutboundHardLimit());
    Logger::Info("  Max Message Size: {}", GetMaxMessageSize());

    Logger::Info("Logging Configuration:");
    Logger::Info("  Level: {}", GetLogLevel());
    Logger::Info("  File Path: {}", GetLogFilePath());
    Logger::Info("=== End Configuration ===");
}
