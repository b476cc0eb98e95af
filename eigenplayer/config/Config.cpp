#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <iomanip>
#include <vector>

namespace EigenPlayer {

namespace {

// Finite and representable as float without overflowing to inf
bool FitsFloat(const nlohmann::json& value) {
    const double v = value.get<double>();
    return std::isfinite(v) && std::fabs(v) <= static_cast<double>(std::numeric_limits<float>::max());
}

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

bool IsIntegral(const nlohmann::json& node) {
    return node.is_number_integer() || node.is_number_unsigned();
}

} // namespace

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        EIGENPLAYER_LOG_WARN("Config file not found: {}", filepath.string());
        SetErrorDetail(filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    try {
        m_data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        EIGENPLAYER_LOG_ERROR("Failed to parse config file {}: {}", filepath.string(), e.what());
        SetErrorDetail(e.what());
        return std::unexpected(ConfigError::ParseError);
    }

    if (!m_data.is_object()) {
        EIGENPLAYER_LOG_ERROR("Config file {} does not contain a JSON object", filepath.string());
        m_data = nlohmann::json::object();
        SetErrorDetail("root");
        return std::unexpected(ConfigError::ParseError);
    }

    EIGENPLAYER_LOG_INFO("Loaded configuration from: {}", filepath.string());
    return {};
}

std::expected<void, ConfigError> Config::LoadFromString(std::string_view text) {
    std::unique_lock lock(m_mutex);
    try {
        auto parsed = nlohmann::json::parse(text);
        if (!parsed.is_object()) {
            SetErrorDetail("root");
            return std::unexpected(ConfigError::ParseError);
        }
        m_data = std::move(parsed);
    } catch (const nlohmann::json::parse_error& e) {
        EIGENPLAYER_LOG_ERROR("Failed to parse config: {}", e.what());
        SetErrorDetail(e.what());
        return std::unexpected(ConfigError::ParseError);
    }
    return {};
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            EIGENPLAYER_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << m_data << std::endl;
        EIGENPLAYER_LOG_INFO("Saved configuration to: {}", path.string());
        return {};
    } catch (const std::filesystem::filesystem_error& e) {
        EIGENPLAYER_LOG_ERROR("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

std::expected<void, ConfigError> Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }
    if (path.empty()) {
        EIGENPLAYER_LOG_WARN("No config file path set, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(path);
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

std::string Config::LastErrorDetail() const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    return m_lastErrorDetail;
}

void Config::SetErrorDetail(std::string detail) const {
    std::lock_guard<std::mutex> lock(m_errorMutex);
    m_lastErrorDetail = std::move(detail);
}

nlohmann::json Config::GetJson() const {
    std::shared_lock lock(m_mutex);
    return m_data;
}

std::expected<void, ConfigError> Config::Fail(ConfigError error, std::string detail) const {
    EIGENPLAYER_LOG_ERROR("Invalid configuration value '{}': {}", detail, ConfigErrorToString(error));
    SetErrorDetail(std::move(detail));
    return std::unexpected(error);
}

std::expected<EqBand, ConfigError> Config::ParseBand(const nlohmann::json& node) {
    const nlohmann::json* freq = nullptr;
    const nlohmann::json* q = nullptr;
    const nlohmann::json* gain = nullptr;
    const nlohmann::json* type = nullptr;

    if (node.is_array()) {
        if (node.size() != 4) {
            return std::unexpected(ConfigError::InvalidValue);
        }
        freq = &node[0];
        q = &node[1];
        gain = &node[2];
        type = &node[3];
    } else if (node.is_object()) {
        if (!node.contains("frequency") || !node.contains("q") ||
            !node.contains("gain_db") || !node.contains("type")) {
            return std::unexpected(ConfigError::InvalidValue);
        }
        freq = &node["frequency"];
        q = &node["q"];
        gain = &node["gain_db"];
        type = &node["type"];
    } else {
        return std::unexpected(ConfigError::TypeMismatch);
    }

    if (!freq->is_number() || !q->is_number() || !gain->is_number()) {
        return std::unexpected(ConfigError::TypeMismatch);
    }
    // Integral floats such as 1.0 are accepted for the type column
    if (!type->is_number() || (!IsIntegral(*type) &&
        std::floor(type->get<double>()) != type->get<double>())) {
        return std::unexpected(ConfigError::TypeMismatch);
    }

    const double typeValue = type->get<double>();
    if (typeValue < static_cast<double>(std::numeric_limits<int>::min()) ||
        typeValue > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (!FitsFloat(*freq) || !FitsFloat(*q) || !FitsFloat(*gain)) {
        return std::unexpected(ConfigError::InvalidValue);
    }

    EqBand band;
    band.frequency = freq->get<float>();
    band.q = q->get<float>();
    band.gainDb = gain->get<float>();
    band.type = static_cast<int>(typeValue);

    if (band.frequency <= 0.0f || band.q <= 0.0f) {
        return std::unexpected(ConfigError::InvalidValue);
    }
    return band;
}

nlohmann::json Config::BandToJson(const EqBand& band) {
    return nlohmann::json::array({band.frequency, band.q, band.gainDb, band.type});
}

std::expected<AudioConfig, ConfigError> Config::GetAudioConfig() const {
    std::shared_lock lock(m_mutex);
    AudioConfig audio;

    const auto* section = NavigateToKey("audio");
    if (!section) {
        return audio;
    }
    if (!section->is_object()) {
        return std::unexpected(Fail(ConfigError::TypeMismatch, "audio").error());
    }

    if (auto it = section->find("ring_buffer_size"); it != section->end()) {
        if (!IsIntegral(*it)) {
            return std::unexpected(Fail(ConfigError::TypeMismatch, "audio.ring_buffer_size").error());
        }
        const auto size = it->get<int64_t>();
        if (size <= 0 || size > std::numeric_limits<int>::max()) {
            return std::unexpected(Fail(ConfigError::InvalidValue, "audio.ring_buffer_size").error());
        }
        audio.ringBufferSize = static_cast<int>(size);
    }

    if (auto it = section->find("default_volume"); it != section->end()) {
        if (!it->is_number()) {
            return std::unexpected(Fail(ConfigError::TypeMismatch, "audio.default_volume").error());
        }
        const auto volume = it->get<double>();
        if (volume < 0.0 || volume > 1.0) {
            return std::unexpected(Fail(ConfigError::InvalidValue, "audio.default_volume").error());
        }
        audio.defaultVolume = static_cast<float>(volume);
    }

    if (auto it = section->find("enable_eq"); it != section->end()) {
        if (!it->is_boolean()) {
            return std::unexpected(Fail(ConfigError::TypeMismatch, "audio.enable_eq").error());
        }
        audio.enableEq = it->get<bool>();
    }

    if (auto it = section->find("eq_bands"); it != section->end()) {
        if (!it->is_array()) {
            return std::unexpected(Fail(ConfigError::TypeMismatch, "audio.eq_bands").error());
        }
        for (size_t i = 0; i < it->size(); ++i) {
            auto band = ParseBand((*it)[i]);
            if (!band) {
                return std::unexpected(
                    Fail(band.error(), "audio.eq_bands[" + std::to_string(i) + "]").error());
            }
            audio.eqBands.push_back(*band);
        }
    }

    if (auto it = section->find("producer_sleep_us"); it != section->end()) {
        if (!IsIntegral(*it)) {
            return std::unexpected(Fail(ConfigError::TypeMismatch, "audio.producer_sleep_us").error());
        }
        const auto sleepUs = it->get<int64_t>();
        if (sleepUs < 0 || sleepUs > std::numeric_limits<int>::max()) {
            return std::unexpected(Fail(ConfigError::InvalidValue, "audio.producer_sleep_us").error());
        }
        audio.producerSleepUs = static_cast<int>(sleepUs);
    }

    return audio;
}

void Config::SetAudioConfig(const AudioConfig& audio) {
    std::unique_lock lock(m_mutex);
    auto* section = NavigateToKey("audio", true);

    nlohmann::json bands = nlohmann::json::array();
    for (const auto& band : audio.eqBands) {
        bands.push_back(BandToJson(band));
    }

    (*section)["ring_buffer_size"] = audio.ringBufferSize;
    (*section)["default_volume"] = audio.defaultVolume;
    (*section)["enable_eq"] = audio.enableEq;
    (*section)["eq_bands"] = std::move(bands);
    (*section)["producer_sleep_us"] = audio.producerSleepUs;
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (create) {
            if (!current->is_object()) {
                *current = nlohmann::json::object();
            }
            if (!current->contains(p)) {
                (*current)[p] = nlohmann::json::object();
            }
            current = &(*current)[p];
        } else {
            if (!current->is_object() || !current->contains(p)) {
                return nullptr;
            }
            current = &(*current)[p];
        }
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(p);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

nlohmann::json Config::DefaultJson() {
    nlohmann::json config;

    // Audio settings
    config["audio"]["ring_buffer_size"] = 88200;
    config["audio"]["default_volume"] = 0.5;
    config["audio"]["enable_eq"] = false;
    config["audio"]["eq_bands"] = nlohmann::json::array();
    config["audio"]["producer_sleep_us"] = 100;

    // Persistence
    config["database"]["path"] = "eigenplayer.db";

    // Logging
    config["logging"]["file"] = "";
    config["logging"]["level"] = "info";

    // Scripting
    config["scripting"]["startup_script"] = "";

    return config;
}

std::expected<void, ConfigError> Config::CreateDefault(const std::filesystem::path& filepath) {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        EIGENPLAYER_LOG_ERROR("Failed to create config directory: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        EIGENPLAYER_LOG_ERROR("Failed to create default config file: {}", filepath.string());
        return std::unexpected(ConfigError::WriteError);
    }
    file << std::setw(4) << DefaultJson() << std::endl;
    EIGENPLAYER_LOG_INFO("Created default configuration file: {}", filepath.string());
    return {};
}

} // namespace EigenPlayer
