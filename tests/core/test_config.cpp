/// @file tests/core/test_config.cpp
/// @brief Settings::from_lookup defaults, overrides and rejected values.

#include "adsim/config.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <string_view>

using namespace adsim;
using namespace adsim::config;

namespace {

Settings::Lookup lookup_from(std::map<std::string, std::string> env) {
    return [env = std::move(env)](const char* name) -> std::optional<std::string> {
        const auto it = env.find(name);
        if (it == env.end()) return std::nullopt;
        return it->second;
    };
}

}  // namespace

TEST(Settings, Defaults) {
    const auto s = Settings::from_lookup(lookup_from({}));
    EXPECT_EQ(s.db_path, "./ads.db");
    EXPECT_EQ(s.log_level, log::Level::Info);
    EXPECT_TRUE(s.persist_derived);
    EXPECT_EQ(s.busy_timeout_ms, 5000);
    EXPECT_DOUBLE_EQ(s.generator.asset_seconds, 30.0);
    EXPECT_FALSE(s.generator.verbose);
}

TEST(Settings, Overrides) {
    const auto s = Settings::from_lookup(lookup_from({
        {"ADSIM_DB_PATH", "/tmp/x.db"},
        {"ADSIM_LOG_LEVEL", "DEBUG"},
        {"ADSIM_PERSIST_DERIVED", "off"},
        {"ADSIM_BUSY_TIMEOUT_MS", "250"},
        {"ADSIM_ASSET_SECONDS", "15.5"},
    }));
    EXPECT_EQ(s.db_path, "/tmp/x.db");
    EXPECT_EQ(s.log_level, log::Level::Debug);
    EXPECT_FALSE(s.persist_derived);
    EXPECT_EQ(s.busy_timeout_ms, 250);
    EXPECT_DOUBLE_EQ(s.generator.asset_seconds, 15.5);
    EXPECT_TRUE(s.generator.verbose);
}

TEST(Settings, InvalidValuesKeepDefaults) {
    log::set_level(log::Level::Off);
    const auto s = Settings::from_lookup(lookup_from({
        {"ADSIM_DB_PATH", ""},
        {"ADSIM_LOG_LEVEL", "loud"},
        {"ADSIM_PERSIST_DERIVED", "maybe"},
        {"ADSIM_BUSY_TIMEOUT_MS", "-3"},
        {"ADSIM_ASSET_SECONDS", "abc"},
    }));
    log::set_level(log::Level::Info);

    EXPECT_EQ(s.db_path, "./ads.db");
    EXPECT_EQ(s.log_level, log::Level::Info);
    EXPECT_TRUE(s.persist_derived);
    EXPECT_EQ(s.busy_timeout_ms, 5000);
    EXPECT_DOUBLE_EQ(s.generator.asset_seconds, 30.0);
}

TEST(Settings, NonPositiveAssetLengthRejected) {
    log::set_level(log::Level::Off);
    const auto s = Settings::from_lookup(lookup_from({{"ADSIM_ASSET_SECONDS", "0"}}));
    log::set_level(log::Level::Info);
    EXPECT_DOUBLE_EQ(s.generator.asset_seconds, 30.0);
}

TEST(ParseBool, AcceptedSpellings) {
    for (const char* t : {"1", "true", "TRUE", "yes", "On"}) {
        EXPECT_EQ(parse_bool(t), std::optional<bool>{true}) << t;
    }
    for (const char* f : {"0", "false", "No", "OFF"}) {
        EXPECT_EQ(parse_bool(f), std::optional<bool>{false}) << f;
    }
    EXPECT_FALSE(parse_bool("2").has_value());
    EXPECT_FALSE(parse_bool("").has_value());
}

TEST(ParseBool, RejectsPrefixesAndExtensions) {
    static_assert(noexcept(parse_bool(std::string_view{})));
    for (const char* t : {"tru", "truee", "y", "o", "offf", " 1", "1 "}) {
        EXPECT_FALSE(parse_bool(t).has_value()) << t;
    }
    EXPECT_EQ(parse_bool("YeS"), std::optional<bool>{true});
    EXPECT_EQ(parse_bool("fAlSe"), std::optional<bool>{false});
}
