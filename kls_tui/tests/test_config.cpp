#include "config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace kls::tui;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() /
                ("kls_test_" + std::to_string(::getpid()) + "_" + name);
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsDescribeTheFourPanelCascade) {
    auto config = Config::defaults();

    ASSERT_EQ(config.panels.size(), static_cast<size_t>(PANEL_COUNT));
    EXPECT_EQ(config.panels[CONTEXTS].title, "Contexts");
    EXPECT_EQ(config.panels[RESOURCES].width, 45);
    EXPECT_EQ(config.refresh_interval_ms, 2000);
    EXPECT_EQ(config.kubectl, "kubectl");
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    auto config = Config::from_json(json::parse(R"({"refresh_interval_ms": 500, "log_level": "DEBUG"})"));

    EXPECT_EQ(config.refresh_interval_ms, 500);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_EQ(config.panels.size(), static_cast<size_t>(PANEL_COUNT));
    EXPECT_FALSE(config.key_bindings.empty());
}

TEST(ConfigTest, KeyBindingsReplaceDefaults) {
    auto config = Config::from_json(json::parse(R"({
        "key_bindings": [
            {"key": "F5", "description": "Top", "command": "kubectl top {api_resource}", "kind": "pods"},
            {"key": "Delete", "description": "Delete", "command": "kubectl delete {api_resource} {resource}", "confirm": true}
        ]
    })"));

    ASSERT_EQ(config.key_bindings.all().size(), 2u);
    const auto* top = config.key_bindings.find("F5");
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->kind, "pods");
    EXPECT_FALSE(top->confirm);
    EXPECT_TRUE(config.key_bindings.find("Delete")->confirm);
    EXPECT_EQ(config.key_bindings.find("^Y"), nullptr);
}

TEST(ConfigTest, InvalidValuesThrowConfigError) {
    EXPECT_THROW(Config::from_json(json::parse(R"([])")), ConfigError);
    EXPECT_THROW(Config::from_json(json::parse(R"({"refresh_interval_ms": 0})")), ConfigError);
    EXPECT_THROW(Config::from_json(json::parse(R"({"refresh_interval_ms": "fast"})")), ConfigError);
    EXPECT_THROW(Config::from_json(json::parse(R"({"log_level": "chatty"})")), ConfigError);
    EXPECT_THROW(Config::from_json(json::parse(R"({"panels": [{"title": "One", "width": 10}]})")), ConfigError);
    EXPECT_THROW(Config::from_json(json::parse(R"({"panels": [
        {"title": "A", "width": 10}, {"title": "B", "width": 0},
        {"title": "C", "width": 10}, {"title": "D", "width": 10}]})")), ConfigError);
    EXPECT_THROW(Config::from_json(json::parse(R"({"key_bindings": [{"key": "^R", "command": "x"}]})")), ConfigError);
    EXPECT_THROW(Config::from_json(json::parse(R"({"key_bindings": [{"key": "F1"}]})")), ConfigError);
}

TEST(ConfigTest, LoadReadsFileAndFallsBackToDefaults) {
    auto path = write_temp("config.json", R"({"kubectl": "/opt/bin/kubectl", "input_timeout_ms": 20})");
    auto config = Config::load(path.string());
    EXPECT_EQ(config.kubectl, "/opt/bin/kubectl");
    EXPECT_EQ(config.input_timeout_ms, 20);
    std::filesystem::remove(path);

    auto missing = Config::load((std::filesystem::temp_directory_path() / "kls_no_such_config.json").string());
    EXPECT_EQ(missing.panels.size(), static_cast<size_t>(PANEL_COUNT));
}

TEST(ConfigTest, LoadRejectsMalformedJson) {
    auto path = write_temp("broken.json", "{\"kubectl\": ");
    EXPECT_THROW(Config::load(path.string()), ConfigError);
    std::filesystem::remove(path);
}

TEST(ConfigTest, ExpandHomeOnlyTouchesLeadingTilde) {
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(Config::expand_home("~/kls.log"), "/home/tester/kls.log");
    EXPECT_EQ(Config::expand_home("/var/log/kls.log"), "/var/log/kls.log");
    EXPECT_EQ(Config::expand_home("logs/~/kls.log"), "logs/~/kls.log");
}

TEST(ConfigTest, DefaultPathPrefersExplicitVariable) {
    ::setenv("KLS_CONFIG", "/tmp/custom.json", 1);
    EXPECT_EQ(Config::default_path(), "/tmp/custom.json");

    ::unsetenv("KLS_CONFIG");
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(Config::default_path(), "/tmp/xdg/kls/config.json");

    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(Config::default_path(), "/home/tester/.config/kls/config.json");
}
