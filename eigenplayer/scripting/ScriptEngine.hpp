#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace pybind11 {
    class dict;
}

namespace EigenPlayer {

class Core;

/**
 * @brief Result of running a script
 */
struct ScriptResult {
    bool success = false;
    std::string errorMessage;

    operator bool() const { return success; }
};

/**
 * @brief Embedded Python interpreter bound to the player core
 *
 * Scripts see a module "eigenplayer" and a global "core":
 * @code
 * core.execute_command("add", ["song.flac"])
 * core.set_property("volume", 0.3)
 * print(core.get_property("playlist"))
 * @endcode
 *
 * The interpreter is process wide. An engine that starts it also finalizes
 * it on Shutdown(); if Python was already running it is left alone.
 */
class ScriptEngine {
public:
    explicit ScriptEngine(Core& core);
    ~ScriptEngine();

    ScriptEngine(const ScriptEngine&) = delete;
    ScriptEngine& operator=(const ScriptEngine&) = delete;

    /**
     * @brief Start the interpreter and publish the core
     * @return false on failure, see GetLastError()
     */
    bool Initialize();
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const { return m_initialized; }

    /**
     * @brief Execute Python source in the engine's global namespace
     */
    ScriptResult RunScript(const std::string& source);

    /**
     * @brief Execute a Python file in the engine's global namespace
     */
    ScriptResult RunFile(const std::filesystem::path& path);

    [[nodiscard]] const std::string& GetLastError() const { return m_lastError; }

private:
    ScriptResult Fail(std::string message);

    Core& m_core;
    bool m_initialized = false;
    bool m_ownsInterpreter = false;
    std::string m_lastError;

    std::shared_ptr<pybind11::dict> m_globals;
};

} // namespace EigenPlayer
