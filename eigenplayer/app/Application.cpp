#include "app/Application.hpp"
#include "audio/AudioBackend.hpp"
#include "audio/AudioOutput.hpp"
#include "core/Commands.hpp"
#include "core/Logger.hpp"
#include "core/Properties.hpp"
#include "persistence/Database.hpp"
#include "repl/Repl.hpp"

#ifdef EIGENPLAYER_SCRIPTING_ENABLED
#include "scripting/ScriptEngine.hpp"
#endif

namespace EigenPlayer {

void ConnectAudioBackend(Core& core, AudioBackend& backend) {
    core.SubscribeProperty("current_track", [&backend](const PropertyValue& value, const Core&) {
        const auto* track = std::get_if<std::string>(&value);
        if (!track || *track == "none") {
            backend.Stop();
            return;
        }
        if (auto result = backend.LoadTrack(*track); !result) {
            APP_LOG_ERROR("Cannot play '{}': {}", *track, AudioErrorToString(result.error()));
        }
    });

    core.SubscribeProperty("playing", [&backend](const PropertyValue& value, const Core&) {
        if (const auto* playing = std::get_if<bool>(&value)) {
            *playing ? backend.Play() : backend.Pause();
        }
    });

    core.SubscribeProperty("volume", [&backend](const PropertyValue& value, const Core&) {
        if (const auto* volume = std::get_if<float>(&value)) {
            backend.SetVolume(*volume);
        }
    });

    core.SubscribeProperty("enable_eq", [&backend](const PropertyValue& value, const Core&) {
        if (const auto* enabled = std::get_if<bool>(&value)) {
            backend.SetEqEnabled(*enabled);
        }
    });

    core.SubscribeProperty("eq_bands", [&backend](const PropertyValue& value, const Core&) {
        if (const auto* bands = std::get_if<EqBandList>(&value)) {
            backend.SetEqBands(*bands);
        }
    });
}

void ConnectPlayHistory(Core& core, Database& db) {
    core.SubscribeProperty("current_track", [&db](const PropertyValue& value, const Core&) {
        const auto* track = std::get_if<std::string>(&value);
        if (!track || *track == "none") {
            return;
        }
        if (auto result = db.LogPlayback(*track); !result) {
            APP_LOG_WARN("Failed to record playback of '{}': {}", *track, result.error().message);
        }
    });
}

Application::Application() = default;

Application::~Application() {
    Shutdown();
}

bool Application::Initialize(const ApplicationParams& params) {
    if (m_initialized) {
        return true;
    }

    LoadConfig(params.configPath);
    ConfigureLogging();

    auto audio = m_config.GetAudioConfig();
    if (!audio) {
        APP_LOG_CRITICAL("Invalid configuration ({}): {}",
                         ConfigErrorToString(audio.error()), m_config.LastErrorDetail());
        return false;
    }

    RegisterProperties(m_core, *audio);
    RegisterCommands(m_core);

    m_core.SubscribeEvent([](const Event& event, const Core&) {
        if (event.type == EventType::PropertyChanged) {
            APP_LOG_DEBUG("Property '{}' changed", event.name);
        } else {
            APP_LOG_DEBUG("Command '{}' executed", event.name);
        }
    });

    const auto dbPath = m_config.Get<std::string>("database.path", "eigenplayer.db");
    if (auto db = Database::Open(dbPath)) {
        m_database = std::move(*db);
        ConnectPlayHistory(m_core, *m_database);
    } else {
        APP_LOG_WARN("Running without persistence: {}", db.error().message);
    }

    if (params.enableAudio) {
        CreateAudioBackend(*audio);
    } else {
        APP_LOG_INFO("Audio output disabled");
    }

    StartScripting(params.scriptPath);

    m_initialized = true;
    APP_LOG_INFO("EigenPlayer started");
    return true;
}

void Application::Run(std::istream& in, std::ostream& out) {
    Repl repl(m_core, m_database.get(), in, out);
    repl.Run();
}

void Application::Shutdown() {
    if (!m_initialized) {
        return;
    }

#ifdef EIGENPLAYER_SCRIPTING_ENABLED
    m_scripting.reset();
#endif
    m_audio.reset();
    m_database.reset();

    m_initialized = false;
    APP_LOG_INFO("EigenPlayer stopped");
}

void Application::LoadConfig(const std::string& path) {
    if (auto result = m_config.Load(path); !result) {
        APP_LOG_WARN("Could not load '{}' ({}), using defaults",
                     path, ConfigErrorToString(result.error()));
        if (auto defaults = m_config.LoadFromString(Config::DefaultJson().dump()); !defaults) {
            APP_LOG_ERROR("Failed to load default configuration");
        }
        return;
    }
    APP_LOG_INFO("Loaded configuration from '{}'", path);
}

void Application::ConfigureLogging() {
    const auto logFile = m_config.Get<std::string>("logging.file", "");
    if (!logFile.empty()) {
        // Reopen the sinks with the configured file
        Logger::Shutdown();
        Logger::Initialize(logFile);
    }

    const auto level = m_config.Get<std::string>("logging.level", "info");
    if (!Logger::SetLevel(level)) {
        APP_LOG_WARN("Unknown log level '{}'", level);
    }
}

void Application::CreateAudioBackend(const AudioConfig& audio) {
    if (!PulseAudioOutput::IsAvailable()) {
        APP_LOG_WARN("No audio output available, running without sound");
        return;
    }

    m_audio = std::make_unique<AudioBackend>(audio, std::make_unique<PulseAudioOutput>());
    ConnectAudioBackend(m_core, *m_audio);
}

void Application::StartScripting(const std::string& scriptPath) {
    auto path = scriptPath;
    if (path.empty()) {
        path = m_config.Get<std::string>("scripting.startup_script", "");
    }

#ifdef EIGENPLAYER_SCRIPTING_ENABLED
    m_scripting = std::make_unique<ScriptEngine>(m_core);
    if (!m_scripting->Initialize()) {
        APP_LOG_WARN("Scripting unavailable: {}", m_scripting->GetLastError());
        m_scripting.reset();
        return;
    }
    if (!path.empty()) {
        if (auto result = m_scripting->RunFile(path); !result) {
            APP_LOG_ERROR("Startup script failed: {}", result.errorMessage);
        }
    }
#else
    if (!path.empty()) {
        APP_LOG_WARN("Built without scripting, ignoring '{}'", path);
    }
#endif
}

} // namespace EigenPlayer
