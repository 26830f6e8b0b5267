// =============================================================================
// Unit tests for fleet_config.hpp
// Tests: defaults, file loading, partial files, malformed input
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <cstdio>
#include "fleet_config.hpp"

using namespace fleet::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// FleetConfig defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    FleetConfig cfg;
    EXPECT_EQ(cfg.bridge.path,                        "");
    EXPECT_EQ(cfg.bridge.control_timeout_sec,         30);
    EXPECT_EQ(cfg.bridge.install_attempt_timeout_sec, 30);
    EXPECT_EQ(cfg.identity.mapping_path,              "config/devices.txt");
    EXPECT_EQ(cfg.identity.scan_command,              "arp -a");
    EXPECT_EQ(cfg.identity.scan_timeout_sec,          30);
    EXPECT_EQ(cfg.connect.default_port,               5555);
    EXPECT_EQ(cfg.connect.lan_prefix,                 "");
    EXPECT_EQ(cfg.log.log_path,                       "adbfleet.log");
    EXPECT_EQ(cfg.log.level,                          "info");
}

// ---------------------------------------------------------------------------
// Missing file returns all defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    FleetConfig cfg = loadConfig("__nonexistent_config_xyz.json", true);
    EXPECT_EQ(cfg.identity.scan_command, "arp -a");
    EXPECT_EQ(cfg.log.log_path,          "adbfleet.log");
    EXPECT_EQ(cfg.connect.default_port,  5555);
}

// ---------------------------------------------------------------------------
// Full file overrides every key
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigFullFile) {
    const char* path = "__test_fleet_config_full.json";
    writeTmpJson(path, R"({
        "bridge":   {"path": "/opt/adb/adb", "control_timeout_sec": 10,
                     "install_attempt_timeout_sec": 45},
        "identity": {"mapping_path": "/etc/adbfleet/devices.txt",
                     "scan_command": "ip neigh", "scan_timeout_sec": 5},
        "connect":  {"default_port": 5556, "lan_prefix": "192.168."},
        "log":      {"log_path": "/tmp/fleet.log", "level": "debug"}
    })");

    FleetConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.bridge.path,                        "/opt/adb/adb");
    EXPECT_EQ(cfg.bridge.control_timeout_sec,         10);
    EXPECT_EQ(cfg.bridge.install_attempt_timeout_sec, 45);
    EXPECT_EQ(cfg.identity.mapping_path,              "/etc/adbfleet/devices.txt");
    EXPECT_EQ(cfg.identity.scan_command,              "ip neigh");
    EXPECT_EQ(cfg.identity.scan_timeout_sec,          5);
    EXPECT_EQ(cfg.connect.default_port,               5556);
    EXPECT_EQ(cfg.connect.lan_prefix,                 "192.168.");
    EXPECT_EQ(cfg.log.log_path,                       "/tmp/fleet.log");
    EXPECT_EQ(cfg.log.level,                          "debug");
    std::remove(path);
}

// ---------------------------------------------------------------------------
// Partial file keeps defaults for absent keys
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigPartialFile) {
    const char* path = "__test_fleet_config_partial.json";
    writeTmpJson(path, R"({"identity": {"mapping_path": "lan.txt"}})");

    FleetConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.identity.mapping_path, "lan.txt");
    EXPECT_EQ(cfg.identity.scan_command, "arp -a");
    EXPECT_EQ(cfg.bridge.control_timeout_sec, 30);
    std::remove(path);
}

// ---------------------------------------------------------------------------
// Wrong types and out-of-range values fall back per key
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigBadValuesUseDefaults) {
    const char* path = "__test_fleet_config_bad.json";
    writeTmpJson(path, R"({
        "bridge":  {"control_timeout_sec": "fast", "install_attempt_timeout_sec": -3},
        "connect": {"default_port": 70000},
        "log":     "not-an-object"
    })");

    FleetConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.bridge.control_timeout_sec,         30);
    EXPECT_EQ(cfg.bridge.install_attempt_timeout_sec, 30);
    EXPECT_EQ(cfg.connect.default_port,               5555);
    EXPECT_EQ(cfg.log.log_path,                       "adbfleet.log");
    std::remove(path);
}

// ---------------------------------------------------------------------------
// Malformed JSON returns defaults instead of throwing
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigMalformedJson) {
    const char* path = "__test_fleet_config_broken.json";
    writeTmpJson(path, R"({"bridge": {"path": "/opt/adb/adb",)");

    FleetConfig cfg;
    EXPECT_NO_THROW(cfg = loadConfig(path, true));
    EXPECT_EQ(cfg.bridge.path, "");
    std::remove(path);
}

// ---------------------------------------------------------------------------
// jsonGet accessor
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, JsonGetAccessor) {
    auto j = nlohmann::json::parse(R"({"a": {"n": 3, "s": "x"}})");
    EXPECT_EQ(jsonGet<int>(j, "a", "n", 0), 3);
    EXPECT_EQ(jsonGet<std::string>(j, "a", "s", "d"), "x");
    EXPECT_EQ(jsonGet<int>(j, "a", "missing", 7), 7);
    EXPECT_EQ(jsonGet<int>(j, "b", "n", 9), 9);
    EXPECT_EQ(jsonGet<int>(j, "a", "s", 5), 5);
}
