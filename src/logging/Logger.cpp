#include "logging/Logger.hpp"
#include "config/ConfigManager.hpp"
#include <vector>

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::Initialize() {
    auto& config = ConfigManager::GetInstance();

    LoggingSettings settings;
    settings.level = config.GetLogLevel();
    settings.filePath = config.GetLogFilePath();
    settings.maxFileSizeMb = config.GetMaxLogFileSize();
    settings.maxFiles = config.GetMaxLogFiles();
    settings.consoleOutput = config.GetConsoleOutput();

    Initialize(settings);
}

void Logger::Initialize(const LoggingSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    const auto level = spdlog::level::from_str(settings.level);

    if (settings.consoleOutput) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);
    }

    if (!settings.filePath.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.filePath,
            static_cast<size_t>(settings.maxFileSizeMb) * 1024 * 1024,
            static_cast<size_t>(settings.maxFiles));
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    if (logger_) {
        spdlog::drop(logger_->name());
    }

    logger_ = std::make_shared<spdlog::logger>("DungeonServer", sinks.begin(), sinks.end());
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::err);

    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);
}

void Logger::Shutdown() {
    if (logger_) {
        logger_->flush();
    }
    spdlog::shutdown();
    logger_.reset();
}

std::shared_ptr<spdlog::logger> Logger::GetLogger(const std::string& name) {
    if (!logger_) {
        logger_ = CreateDefaultLogger();
    }
    if (name == "DungeonServer") {
        return logger_;
    }
    auto named = spdlog::get(name);
    return named ? named : logger_;
}

// Used until Initialize() runs, so early config errors still reach the console.
std::shared_ptr<spdlog::logger> Logger::CreateDefaultLogger() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("DungeonServer", console_sink);
    logger->set_level(spdlog::level::info);
    return logger;
}
