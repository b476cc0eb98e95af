#pragma once

#include "dsp/EqBand.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace EigenPlayer {

using StringList = std::vector<std::string>;

/**
 * @brief Value held by a player property
 */
using PropertyValue = std::variant<
    std::string,
    bool,
    float,
    int,
    StringList,
    EqBandList
>;

/**
 * @brief Human readable name of the type held by a property value
 */
const char* PropertyTypeName(const PropertyValue& value);

/**
 * @brief Render a property value for display
 */
std::string PropertyValueToString(const PropertyValue& value);

class Core;

using PropertyCallback = std::function<void(const PropertyValue& value, const Core& core)>;
using CommandCallback = std::function<void(const std::vector<std::string>& params, Core& core)>;

enum class EventType {
    PropertyChanged,
    CommandExecuted
};

struct Event {
    EventType type;
    std::string name;
};

using EventCallback = std::function<void(const Event& event, const Core& core)>;

/**
 * @brief Named property with its change subscribers
 */
struct Property {
    PropertyValue value;
    std::vector<PropertyCallback> callbacks;
};

/**
 * @brief Named action operating on the core
 */
struct Command {
    CommandCallback execute;
    std::string usage;
};

/**
 * @brief Property and command hub of the player
 *
 * Every player state lives in a named property. Front ends (REPL, scripts)
 * change state by running commands; back ends (audio, database) react by
 * subscribing to properties.
 */
class Core {
public:
    Core() = default;

    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    // =========== Properties ===========

    /**
     * @brief Register a property, replacing any previous value
     */
    void AddProperty(const std::string& name, PropertyValue value);

    /**
     * @brief Update an existing property and notify subscribers
     *
     * Property subscribers run first, then global event subscribers.
     * @return false if no property with that name exists
     */
    bool SetProperty(const std::string& name, PropertyValue value);

    [[nodiscard]] bool HasProperty(const std::string& name) const;
    [[nodiscard]] std::optional<PropertyValue> GetProperty(const std::string& name) const;

    [[nodiscard]] std::optional<std::string> GetString(const std::string& name) const;
    [[nodiscard]] std::optional<bool> GetBool(const std::string& name) const;
    [[nodiscard]] std::optional<float> GetFloat(const std::string& name) const;
    [[nodiscard]] std::optional<int> GetInt(const std::string& name) const;
    [[nodiscard]] std::optional<StringList> GetStringList(const std::string& name) const;
    [[nodiscard]] std::optional<EqBandList> GetEqBands(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> GetPropertyNames() const;

    /**
     * @brief Subscribe to changes of one property
     * @return false if the property does not exist
     */
    bool SubscribeProperty(const std::string& name, PropertyCallback callback);

    // =========== Commands ===========

    void AddCommand(const std::string& name, Command command);
    void AddCommand(const std::string& name, CommandCallback callback);

    /**
     * @brief Run a command if registered, then emit CommandExecuted
     * @return false if the command is unknown
     */
    bool ExecuteCommand(const std::string& name, const std::vector<std::string>& params = {});

    [[nodiscard]] bool HasCommand(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> GetCommandNames() const;

    // =========== Events ===========

    void SubscribeEvent(EventCallback callback);

private:
    template<typename T>
    std::optional<T> GetAs(const std::string& name) const {
        auto it = m_properties.find(name);
        if (it == m_properties.end()) {
            return std::nullopt;
        }
        if (const auto* value = std::get_if<T>(&it->second.value)) {
            return *value;
        }
        return std::nullopt;
    }

    void Emit(const Event& event) const;

    std::unordered_map<std::string, Property> m_properties;
    std::unordered_map<std::string, Command> m_commands;
    std::vector<EventCallback> m_eventCallbacks;
};

} // namespace EigenPlayer
