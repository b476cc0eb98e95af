#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>

namespace EigenPlayer {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two loggers share the same sinks: "PLAYER" for the audio/core internals
 * and "APP" for user facing output of the REPL and the application.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for a rotating log file
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Set the minimum log level from its name ("info", "warn", ...)
     * @return false if the name is not a known level
     */
    static bool SetLevel(const std::string& levelName);

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

    static std::shared_ptr<spdlog::logger>& GetPlayerLogger() {
        return s_playerLogger;
    }

    static std::shared_ptr<spdlog::logger>& GetAppLogger() {
        return s_appLogger;
    }

private:
    static std::shared_ptr<spdlog::logger> s_playerLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
};

} // namespace EigenPlayer

// Convenience macros for player internals
#define EIGENPLAYER_LOG_TRACE(...)    ::EigenPlayer::Logger::GetPlayerLogger()->trace(__VA_ARGS__)
#define EIGENPLAYER_LOG_DEBUG(...)    ::EigenPlayer::Logger::GetPlayerLogger()->debug(__VA_ARGS__)
#define EIGENPLAYER_LOG_INFO(...)     ::EigenPlayer::Logger::GetPlayerLogger()->info(__VA_ARGS__)
#define EIGENPLAYER_LOG_WARN(...)     ::EigenPlayer::Logger::GetPlayerLogger()->warn(__VA_ARGS__)
#define EIGENPLAYER_LOG_ERROR(...)    ::EigenPlayer::Logger::GetPlayerLogger()->error(__VA_ARGS__)
#define EIGENPLAYER_LOG_CRITICAL(...) ::EigenPlayer::Logger::GetPlayerLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::EigenPlayer::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::EigenPlayer::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::EigenPlayer::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::EigenPlayer::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::EigenPlayer::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::EigenPlayer::Logger::GetAppLogger()->critical(__VA_ARGS__)
