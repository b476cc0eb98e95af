#pragma once

#include "config/Config.hpp"
#include "core/Core.hpp"
#include <iosfwd>
#include <memory>
#include <string>

namespace EigenPlayer {

class AudioBackend;
class Database;
class ScriptEngine;

/**
 * @brief Startup options of the player
 */
struct ApplicationParams {
    std::string configPath = "config.json";
    std::string scriptPath;
    bool enableAudio = true;
};

/**
 * @brief Keep the audio backend in step with the playback properties
 *
 * current_track loads (or stops) the track, playing starts and pauses,
 * volume, enable_eq and eq_bands are forwarded as they change.
 */
void ConnectAudioBackend(Core& core, AudioBackend& backend);

/**
 * @brief Record every newly selected track in the play history
 */
void ConnectPlayHistory(Core& core, Database& db);

/**
 * @brief Owns the player subsystems and runs the REPL
 */
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Load configuration and start every subsystem
     * @return false if the configuration is invalid
     */
    bool Initialize(const ApplicationParams& params);

    /**
     * @brief Run the REPL until quit or end of input
     */
    void Run(std::istream& in, std::ostream& out);

    void Shutdown();

    [[nodiscard]] Core& GetCore() { return m_core; }
    [[nodiscard]] Database* GetDatabase() { return m_database.get(); }
    [[nodiscard]] AudioBackend* GetAudioBackend() { return m_audio.get(); }

private:
    void LoadConfig(const std::string& path);
    void ConfigureLogging();
    void CreateAudioBackend(const AudioConfig& audio);
    void StartScripting(const std::string& scriptPath);

    Config m_config;
    Core m_core;
    std::unique_ptr<Database> m_database;
    std::unique_ptr<AudioBackend> m_audio;
#ifdef EIGENPLAYER_SCRIPTING_ENABLED
    std::unique_ptr<ScriptEngine> m_scripting;
#endif
    bool m_initialized = false;
};

} // namespace EigenPlayer
