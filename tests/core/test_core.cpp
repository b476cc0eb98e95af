/**
 * @file test_core.cpp
 * @brief Unit tests for the property and command core
 */

#include <gtest/gtest.h>

#include "core/Core.hpp"

using namespace EigenPlayer;

// =============================================================================
// Property Tests
// =============================================================================

TEST(CorePropertyTest, AddAndGet) {
    Core core;
    core.AddProperty("title", std::string("intro"));
    core.AddProperty("count", 3);

    EXPECT_TRUE(core.HasProperty("title"));
    EXPECT_EQ("intro", core.GetString("title").value_or(""));
    EXPECT_EQ(3, core.GetInt("count").value_or(0));
    EXPECT_FALSE(core.GetProperty("missing").has_value());
}

TEST(CorePropertyTest, TypedGetterRejectsOtherTypes) {
    Core core;
    core.AddProperty("volume", 0.5f);

    EXPECT_FALSE(core.GetString("volume").has_value());
    EXPECT_FALSE(core.GetInt("volume").has_value());
    EXPECT_FALSE(core.GetBool("volume").has_value());
    EXPECT_FLOAT_EQ(0.5f, core.GetFloat("volume").value_or(0.0f));
}

TEST(CorePropertyTest, SetUnknownPropertyIsIgnored) {
    Core core;
    int events = 0;
    core.SubscribeEvent([&events](const Event&, const Core&) { ++events; });

    EXPECT_FALSE(core.SetProperty("ghost", true));
    EXPECT_FALSE(core.HasProperty("ghost"));
    EXPECT_EQ(0, events);
}

TEST(CorePropertyTest, SubscribersSeeNewValue) {
    Core core;
    core.AddProperty("current_track", std::string("none"));

    std::vector<std::string> seen;
    core.SubscribeProperty("current_track", [&seen](const PropertyValue& value, const Core& c) {
        seen.push_back(std::get<std::string>(value));
        // The stored value is already updated when subscribers run
        EXPECT_EQ(std::get<std::string>(value), c.GetString("current_track").value_or(""));
    });

    core.SetProperty("current_track", std::string("a.flac"));
    core.SetProperty("current_track", std::string("b.flac"));
    EXPECT_EQ((std::vector<std::string>{"a.flac", "b.flac"}), seen);
}

TEST(CorePropertyTest, PropertySubscribersRunBeforeEventSubscribers) {
    Core core;
    core.AddProperty("playing", false);

    std::vector<std::string> order;
    core.SubscribeEvent([&order](const Event& event, const Core&) {
        EXPECT_EQ(EventType::PropertyChanged, event.type);
        EXPECT_EQ("playing", event.name);
        order.push_back("event");
    });
    core.SubscribeProperty("playing", [&order](const PropertyValue&, const Core&) {
        order.push_back("property");
    });

    core.SetProperty("playing", true);
    EXPECT_EQ((std::vector<std::string>{"property", "event"}), order);
}

TEST(CorePropertyTest, SubscribeToUnknownPropertyFails) {
    Core core;
    EXPECT_FALSE(core.SubscribeProperty("nope", [](const PropertyValue&, const Core&) {}));
}

TEST(CorePropertyTest, SubscriberMayRegisterAnotherSubscriber) {
    Core core;
    core.AddProperty("playing", false);

    int late = 0;
    core.SubscribeEvent([&core, &late](const Event&, const Core&) {
        core.SubscribeEvent([&late](const Event&, const Core&) { ++late; });
    });

    core.SetProperty("playing", true);
    EXPECT_EQ(0, late);
    core.SetProperty("playing", false);
    EXPECT_EQ(1, late);
}

TEST(CorePropertyTest, NamesAreSorted) {
    Core core;
    core.AddProperty("volume", 1.0f);
    core.AddProperty("playing", false);
    core.AddProperty("eq_bands", EqBandList{});

    EXPECT_EQ((std::vector<std::string>{"eq_bands", "playing", "volume"}), core.GetPropertyNames());
}

// =============================================================================
// Command Tests
// =============================================================================

TEST(CoreCommandTest, ExecuteRunsCommandWithParams) {
    Core core;
    core.AddProperty("last", std::string());
    core.AddCommand("echo", [](const std::vector<std::string>& params, Core& c) {
        c.SetProperty("last", params.empty() ? std::string() : params[0]);
    });

    EXPECT_TRUE(core.ExecuteCommand("echo", {"hello"}));
    EXPECT_EQ("hello", core.GetString("last").value_or(""));
}

TEST(CoreCommandTest, ExecuteAlwaysEmitsEvent) {
    Core core;
    std::vector<std::string> commands;
    core.SubscribeEvent([&commands](const Event& event, const Core&) {
        if (event.type == EventType::CommandExecuted) {
            commands.push_back(event.name);
        }
    });
    core.AddCommand("noop", [](const std::vector<std::string>&, Core&) {});

    EXPECT_TRUE(core.ExecuteCommand("noop"));
    EXPECT_FALSE(core.ExecuteCommand("unknown"));
    EXPECT_EQ((std::vector<std::string>{"noop", "unknown"}), commands);
}

TEST(CoreCommandTest, CommandEventFollowsItsPropertyEvents) {
    Core core;
    core.AddProperty("playing", false);
    core.AddCommand("start", [](const std::vector<std::string>&, Core& c) {
        c.SetProperty("playing", true);
    });

    std::vector<std::string> names;
    core.SubscribeEvent([&names](const Event& event, const Core&) { names.push_back(event.name); });

    core.ExecuteCommand("start");
    EXPECT_EQ((std::vector<std::string>{"playing", "start"}), names);
}

TEST(CoreCommandTest, AddCommandReplacesExisting) {
    Core core;
    int first = 0;
    int second = 0;
    core.AddCommand("go", [&first](const std::vector<std::string>&, Core&) { ++first; });
    core.AddCommand("go", [&second](const std::vector<std::string>&, Core&) { ++second; });

    core.ExecuteCommand("go");
    EXPECT_EQ(0, first);
    EXPECT_EQ(1, second);
    EXPECT_TRUE(core.HasCommand("go"));
}

// =============================================================================
// Value Formatting Tests
// =============================================================================

TEST(PropertyValueTest, TypeNames) {
    EXPECT_STREQ("string", PropertyTypeName(PropertyValue(std::string("x"))));
    EXPECT_STREQ("bool", PropertyTypeName(PropertyValue(true)));
    EXPECT_STREQ("float", PropertyTypeName(PropertyValue(0.5f)));
    EXPECT_STREQ("int", PropertyTypeName(PropertyValue(1)));
    EXPECT_STREQ("string_list", PropertyTypeName(PropertyValue(StringList{})));
    EXPECT_STREQ("eq_band_list", PropertyTypeName(PropertyValue(EqBandList{})));
}

TEST(PropertyValueTest, ToString) {
    EXPECT_EQ("true", PropertyValueToString(true));
    EXPECT_EQ("42", PropertyValueToString(42));
    EXPECT_EQ("[a, b]", PropertyValueToString(StringList{"a", "b"}));
    EXPECT_EQ("[]", PropertyValueToString(EqBandList{}));
}
