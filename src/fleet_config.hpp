#pragma once
// =============================================================================
// AdbFleet Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json
// =============================================================================

#include <string>
#include <fstream>
#include "nlohmann/json.hpp"
#include "fleet_log.hpp"

namespace fleet {
namespace config {

struct BridgeConfig {
    std::string path;                      // empty: <exe dir>/adb/adb
    int control_timeout_sec = 30;
    int install_attempt_timeout_sec = 30;
};

struct IdentityConfig {
    std::string mapping_path = "config/devices.txt";
    std::string scan_command = "arp -a";
    int scan_timeout_sec = 30;
};

struct ConnectConfig {
    int default_port = 5555;
    std::string lan_prefix;                // "192.168." lets users type "1.50"
};

struct LogConfig {
    std::string log_path = "adbfleet.log";
    std::string level = "info";
};

struct FleetConfig {
    BridgeConfig bridge;
    IdentityConfig identity;
    ConnectConfig connect;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].is_object() && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        FLOG_WARN("config", "%s.%s: %s (using default)", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// Non-positive timeouts and out-of-range ports fall back to the default
inline int positiveOr(int value, int def) { return value > 0 ? value : def; }

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline FleetConfig loadConfig(const std::string& configPath = "config.json",
                              bool strict = false) {
    FleetConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("config/config.json");
        if (!file.is_open()) {
            file.open("../config.json");
        }
    }
    if (!file.is_open()) {
        FLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        const FleetConfig def;

        config.bridge.path = jsonGet<std::string>(j, "bridge", "path", def.bridge.path);
        config.bridge.control_timeout_sec = positiveOr(
            jsonGet<int>(j, "bridge", "control_timeout_sec", def.bridge.control_timeout_sec),
            def.bridge.control_timeout_sec);
        config.bridge.install_attempt_timeout_sec = positiveOr(
            jsonGet<int>(j, "bridge", "install_attempt_timeout_sec", def.bridge.install_attempt_timeout_sec),
            def.bridge.install_attempt_timeout_sec);

        config.identity.mapping_path = jsonGet<std::string>(j, "identity", "mapping_path", def.identity.mapping_path);
        config.identity.scan_command = jsonGet<std::string>(j, "identity", "scan_command", def.identity.scan_command);
        config.identity.scan_timeout_sec = positiveOr(
            jsonGet<int>(j, "identity", "scan_timeout_sec", def.identity.scan_timeout_sec),
            def.identity.scan_timeout_sec);

        int port = jsonGet<int>(j, "connect", "default_port", def.connect.default_port);
        config.connect.default_port = (port > 0 && port <= 65535) ? port : def.connect.default_port;
        config.connect.lan_prefix = jsonGet<std::string>(j, "connect", "lan_prefix", def.connect.lan_prefix);

        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", def.log.log_path);
        config.log.level = jsonGet<std::string>(j, "log", "level", def.log.level);

    } catch (const nlohmann::json::exception& e) {
        FLOG_ERROR("config", "JSON parse error: %s", e.what());
        return FleetConfig{};
    }

    FLOG_INFO("config", "Loaded: bridge=%s, mapping=%s, default_port=%d",
              config.bridge.path.empty() ? "(local lookup)" : config.bridge.path.c_str(),
              config.identity.mapping_path.c_str(),
              config.connect.default_port);

    return config;
}

} // namespace config
} // namespace fleet
