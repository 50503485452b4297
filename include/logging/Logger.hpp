#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>
#include <utility>

struct LoggingSettings {
    std::string level = "info";
    std::string filePath;
    int maxFileSizeMb = 100;
    int maxFiles = 10;
    bool consoleOutput = true;
};

class Logger {
public:
    // Builds sinks from the loaded ConfigManager.
    static void Initialize();
    static void Initialize(const LoggingSettings& settings);
    static void Shutdown();

    static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "DungeonServer");

    template<typename... Args>
    static void Trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        GetLogger()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        GetLogger()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        GetLogger()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        GetLogger()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        GetLogger()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        GetLogger()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> CreateDefaultLogger();

    static std::shared_ptr<spdlog::logger> logger_;
};
