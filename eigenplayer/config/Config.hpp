#pragma once

#include "dsp/EqBand.hpp"
#include <expected>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace EigenPlayer {

/**
 * @brief Failure categories of configuration loading and validation
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError,
    TypeMismatch,
    InvalidValue
};

inline const char* ConfigErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError: return "parse error";
        case ConfigError::WriteError: return "write error";
        case ConfigError::TypeMismatch: return "type mismatch";
        case ConfigError::InvalidValue: return "invalid value";
        default: return "unknown";
    }
}

/**
 * @brief Audio section of the configuration
 */
struct AudioConfig {
    int ringBufferSize = 88200;     // Samples, shared by all channels
    float defaultVolume = 0.5f;     // Linear gain, 0.0 to 1.0
    bool enableEq = false;
    EqBandList eqBands;
    int producerSleepUs = 100;      // Decoder back-off while the ring is full

    bool operator==(const AudioConfig& other) const = default;
};

/**
 * @brief JSON-based configuration for the player
 *
 * Values are addressed by dot-separated key paths ("audio.enable_eq").
 * Missing keys fall back to defaults; keys that are present with the wrong
 * type or out of range are reported as errors by the typed section getters.
 */
class Config {
public:
    Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Load configuration from a JSON document in memory
     */
    std::expected<void, ConfigError> LoadFromString(std::string_view text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "audio.default_volume")
     * @param defaultValue Value to return if key not found or of another type
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    bool Has(std::string_view key) const;

    /**
     * @brief Read and validate the "audio" section
     *
     * On error LastErrorDetail() names the offending key.
     */
    std::expected<AudioConfig, ConfigError> GetAudioConfig() const;

    /**
     * @brief Write the "audio" section, bands in array form
     */
    void SetAudioConfig(const AudioConfig& audio);

    [[nodiscard]] std::string LastErrorDetail() const;

    [[nodiscard]] nlohmann::json GetJson() const;

    /**
     * @brief Default configuration document
     */
    static nlohmann::json DefaultJson();

    /**
     * @brief Create default configuration file
     */
    static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);

    /**
     * @brief Parse one band from "[f, q, gain_db, type]" or
     *        {"frequency", "q", "gain_db", "type"}
     */
    static std::expected<EqBand, ConfigError> ParseBand(const nlohmann::json& node);
    static nlohmann::json BandToJson(const EqBand& band);

private:
    std::expected<void, ConfigError> Fail(ConfigError error, std::string detail) const;
    void SetErrorDetail(std::string detail) const;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;
    mutable std::mutex m_errorMutex;
    mutable std::string m_lastErrorDetail;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    auto* node = NavigateToKey(key, true);
    if (node) {
        *node = value;
    }
}

} // namespace EigenPlayer
