#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "ConfigManager.hpp"

using namespace venue_guard;

namespace {

std::string write_temp(const std::string& name, const std::string& content) {
    std::ofstream out(name, std::ios::trunc);
    out << content;
    return name;
}

}

TEST(ConfigTest, defaults) {
    CheckerConfig c;
    EXPECT_EQ("info", c.log_level);
    EXPECT_EQ("[%H:%M:%S] [%^%l%$] %v", c.log_pattern);
    EXPECT_FALSE(c.require_map_point);
    EXPECT_FALSE(c.pretty);
}

TEST(ConfigTest, from_json_overrides_present_keys_only) {
    auto c = CheckerConfig::from_json({{"log_level", "debug"}, {"require_map_point", true}});
    EXPECT_EQ("debug", c.log_level);
    EXPECT_TRUE(c.require_map_point);
    EXPECT_FALSE(c.pretty);
    EXPECT_EQ(CheckerConfig{}.log_pattern, c.log_pattern);
}

TEST(ConfigTest, loads_explicit_file) {
    auto path = write_temp("venue_guard_test_config.json", R"({"pretty": true, "log_level": "warn"})");
    auto c = ConfigManager::load(path);
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(c->pretty);
    EXPECT_EQ("warn", c->log_level);
    std::remove(path.c_str());
}

TEST(ConfigTest, missing_explicit_file_is_an_error) {
    EXPECT_FALSE(ConfigManager::load("does/not/exist/venue_check.json").has_value());
}

TEST(ConfigTest, broken_file_falls_back_to_defaults) {
    auto path = write_temp("venue_guard_broken_config.json", "{ not json");
    auto c = ConfigManager::load(path);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ("info", c->log_level);
    std::remove(path.c_str());

    path = write_temp("venue_guard_badtype_config.json", R"({"require_map_point": "yes"})");
    c = ConfigManager::load(path);
    ASSERT_TRUE(c.has_value());
    EXPECT_FALSE(c->require_map_point);
    std::remove(path.c_str());

    path = write_temp("venue_guard_array_config.json", "[]");
    c = ConfigManager::load(path);
    ASSERT_TRUE(c.has_value());
    EXPECT_FALSE(c->pretty);
    std::remove(path.c_str());
}
