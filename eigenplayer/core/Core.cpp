#include "core/Core.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <sstream>

namespace EigenPlayer {

namespace {

template<class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

} // namespace

const char* PropertyTypeName(const PropertyValue& value) {
    return std::visit(Overloaded{
        [](const std::string&) { return "string"; },
        [](bool) { return "bool"; },
        [](float) { return "float"; },
        [](int) { return "int"; },
        [](const StringList&) { return "string_list"; },
        [](const EqBandList&) { return "eq_band_list"; },
    }, value);
}

std::string PropertyValueToString(const PropertyValue& value) {
    std::ostringstream out;
    std::visit(Overloaded{
        [&out](const std::string& s) { out << s; },
        [&out](bool b) { out << (b ? "true" : "false"); },
        [&out](float f) { out << f; },
        [&out](int i) { out << i; },
        [&out](const StringList& list) {
            out << "[";
            for (size_t i = 0; i < list.size(); ++i) {
                out << (i ? ", " : "") << list[i];
            }
            out << "]";
        },
        [&out](const EqBandList& bands) {
            out << "[";
            for (size_t i = 0; i < bands.size(); ++i) {
                const auto& b = bands[i];
                out << (i ? ", " : "") << "{" << b.frequency << " Hz, Q " << b.q
                    << ", " << b.gainDb << " dB, " << FilterTypeToString(b.type) << "}";
            }
            out << "]";
        },
    }, value);
    return out.str();
}

void Core::AddProperty(const std::string& name, PropertyValue value) {
    m_properties[name] = Property{std::move(value), {}};
}

bool Core::SetProperty(const std::string& name, PropertyValue value) {
    auto it = m_properties.find(name);
    if (it == m_properties.end()) {
        EIGENPLAYER_LOG_DEBUG("Ignoring set of unknown property '{}'", name);
        return false;
    }

    it->second.value = value;

    // Subscribers may register further callbacks, iterate over a copy
    const auto callbacks = it->second.callbacks;
    for (const auto& cb : callbacks) {
        cb(value, *this);
    }

    Emit(Event{EventType::PropertyChanged, name});
    return true;
}

bool Core::HasProperty(const std::string& name) const {
    return m_properties.contains(name);
}

std::optional<PropertyValue> Core::GetProperty(const std::string& name) const {
    auto it = m_properties.find(name);
    if (it == m_properties.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::optional<std::string> Core::GetString(const std::string& name) const {
    return GetAs<std::string>(name);
}

std::optional<bool> Core::GetBool(const std::string& name) const {
    return GetAs<bool>(name);
}

std::optional<float> Core::GetFloat(const std::string& name) const {
    return GetAs<float>(name);
}

std::optional<int> Core::GetInt(const std::string& name) const {
    return GetAs<int>(name);
}

std::optional<StringList> Core::GetStringList(const std::string& name) const {
    return GetAs<StringList>(name);
}

std::optional<EqBandList> Core::GetEqBands(const std::string& name) const {
    return GetAs<EqBandList>(name);
}

std::vector<std::string> Core::GetPropertyNames() const {
    std::vector<std::string> names;
    names.reserve(m_properties.size());
    for (const auto& [name, prop] : m_properties) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool Core::SubscribeProperty(const std::string& name, PropertyCallback callback) {
    auto it = m_properties.find(name);
    if (it == m_properties.end()) {
        EIGENPLAYER_LOG_WARN("Cannot subscribe to unknown property '{}'", name);
        return false;
    }
    it->second.callbacks.push_back(std::move(callback));
    return true;
}

void Core::AddCommand(const std::string& name, Command command) {
    m_commands[name] = std::move(command);
}

void Core::AddCommand(const std::string& name, CommandCallback callback) {
    m_commands[name] = Command{std::move(callback), ""};
}

bool Core::ExecuteCommand(const std::string& name, const std::vector<std::string>& params) {
    bool found = false;
    if (auto it = m_commands.find(name); it != m_commands.end()) {
        // Copy so the command may re-register itself while running
        const CommandCallback execute = it->second.execute;
        execute(params, *this);
        found = true;
    } else {
        EIGENPLAYER_LOG_DEBUG("Unknown command '{}'", name);
    }

    Emit(Event{EventType::CommandExecuted, name});
    return found;
}

bool Core::HasCommand(const std::string& name) const {
    return m_commands.contains(name);
}

std::vector<std::string> Core::GetCommandNames() const {
    std::vector<std::string> names;
    names.reserve(m_commands.size());
    for (const auto& [name, cmd] : m_commands) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void Core::SubscribeEvent(EventCallback callback) {
    m_eventCallbacks.push_back(std::move(callback));
}

void Core::Emit(const Event& event) const {
    const auto callbacks = m_eventCallbacks;
    for (const auto& cb : callbacks) {
        cb(event, *this);
    }
}

} // namespace EigenPlayer
