#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <vector>

namespace EigenPlayer {

std::shared_ptr<spdlog::logger> Logger::s_playerLogger =
    std::make_shared<spdlog::logger>("PLAYER", std::make_shared<spdlog::sinks::null_sink_mt>());
std::shared_ptr<spdlog::logger> Logger::s_appLogger =
    std::make_shared<spdlog::logger>("APP", std::make_shared<spdlog::sinks::null_sink_mt>());
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    s_playerLogger = std::make_shared<spdlog::logger>("PLAYER", sinks.begin(), sinks.end());
    s_playerLogger->set_level(spdlog::level::info);
    s_playerLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_playerLogger);

    s_appLogger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_appLogger->set_level(spdlog::level::info);
    s_appLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_appLogger);

    spdlog::set_default_logger(s_playerLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_playerLogger->flush();
    s_appLogger->flush();

    spdlog::drop_all();

    // Keep the macros usable after shutdown
    s_playerLogger = std::make_shared<spdlog::logger>(
        "PLAYER", std::make_shared<spdlog::sinks::null_sink_mt>());
    s_appLogger = std::make_shared<spdlog::logger>(
        "APP", std::make_shared<spdlog::sinks::null_sink_mt>());
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (s_playerLogger) {
        s_playerLogger->set_level(level);
    }
    if (s_appLogger) {
        s_appLogger->set_level(level);
    }
}

bool Logger::SetLevel(const std::string& levelName) {
    auto level = spdlog::level::from_str(levelName);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && levelName != "off") {
        return false;
    }
    SetLevel(level);
    return true;
}

} // namespace EigenPlayer
