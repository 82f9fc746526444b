#pragma once
// =============================================================================
// DroidPilot - Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json. Every key is optional;
// a missing or mistyped key keeps its default.
// =============================================================================

#include <fstream>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "droidpilot_log.hpp"

namespace droidpilot {
namespace config {

struct RemoteConfig {
    std::string host = "127.0.0.1";
    int port = 8986;
    int connect_timeout_ms = 5000;
    int screenshot_timeout_ms = 3000;
};

struct DisplayConfig {
    int width = 1080;
    int height = 2400;
    int dpi = 420;
    int bitrate_kbps = 3000;
};

struct AgentConfig {
    int max_steps = 30;
    int step_delay_ms = 500;
    int screenshot_attempts = 2;
    int screenshot_backoff_ms = 500;
    bool use_remote = true;
    bool normalize_coordinates = true;
    bool unknown_action_fatal = false;
    std::string screenshot_dir = "/tmp";
};

struct DispatchConfig {
    int wait_tick_ms = 100;
    int takeover_tick_ms = 200;
    int takeover_ceiling_ms = 30000;
    int type_settle_before_ms = 500;
    int type_settle_after_ms = 300;
    int double_tap_gap_ms = 100;
    int long_press_ms = 1000;
    int default_swipe_ms = 300;
};

struct DecoderConfig {
    int pending_limit = 100;
    int capture_timeout_ms = 1000;
};

struct AdbConfig {
    std::string serial;
    int forward_port = 8986;
};

struct ModelConfig {
    std::string base_url = "https://open.bigmodel.cn/api/paas/v4";
    std::string api_key;   // the CLI prefers DROIDPILOT_API_KEY when set
    std::string model = "autoglm-phone";
    int connect_timeout_s = 60;
    int read_timeout_s = 120;
};

struct LogConfig {
    std::string level = "info";
    std::string log_path = "droidpilot.log";
};

struct AppConfig {
    RemoteConfig remote;
    DisplayConfig display;
    AgentConfig agent;
    DispatchConfig dispatch;
    DecoderConfig decoder;
    AdbConfig adb;
    ModelConfig model;
    std::map<std::string, std::string> apps;  // display name -> package
    LogConfig log;
};

// section.key as T, or `def` when absent or of the wrong type
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.is_object() || !j.contains(section) || !j[section].is_object()) return def;
    const nlohmann::json& sec = j[section];
    if (!sec.contains(key)) return def;
    try {
        return sec[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        DPLOG_WARN("config", "%s.%s: %s (keeping default)", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// Fills `config` from an already parsed document
inline void applyJson(const nlohmann::json& j, AppConfig& config) {
    const AppConfig d;

    config.remote.host = jsonGet<std::string>(j, "remote", "host", d.remote.host);
    config.remote.port = jsonGet<int>(j, "remote", "port", d.remote.port);
    config.remote.connect_timeout_ms = jsonGet<int>(j, "remote", "connect_timeout_ms", d.remote.connect_timeout_ms);
    config.remote.screenshot_timeout_ms = jsonGet<int>(j, "remote", "screenshot_timeout_ms", d.remote.screenshot_timeout_ms);

    config.display.width = jsonGet<int>(j, "display", "width", d.display.width);
    config.display.height = jsonGet<int>(j, "display", "height", d.display.height);
    config.display.dpi = jsonGet<int>(j, "display", "dpi", d.display.dpi);
    config.display.bitrate_kbps = jsonGet<int>(j, "display", "bitrate_kbps", d.display.bitrate_kbps);

    config.agent.max_steps = jsonGet<int>(j, "agent", "max_steps", d.agent.max_steps);
    config.agent.step_delay_ms = jsonGet<int>(j, "agent", "step_delay_ms", d.agent.step_delay_ms);
    config.agent.screenshot_attempts = jsonGet<int>(j, "agent", "screenshot_attempts", d.agent.screenshot_attempts);
    config.agent.screenshot_backoff_ms = jsonGet<int>(j, "agent", "screenshot_backoff_ms", d.agent.screenshot_backoff_ms);
    config.agent.use_remote = jsonGet<bool>(j, "agent", "use_remote", d.agent.use_remote);
    config.agent.normalize_coordinates = jsonGet<bool>(j, "agent", "normalize_coordinates", d.agent.normalize_coordinates);
    config.agent.unknown_action_fatal = jsonGet<bool>(j, "agent", "unknown_action_fatal", d.agent.unknown_action_fatal);
    config.agent.screenshot_dir = jsonGet<std::string>(j, "agent", "screenshot_dir", d.agent.screenshot_dir);

    config.dispatch.wait_tick_ms = jsonGet<int>(j, "dispatch", "wait_tick_ms", d.dispatch.wait_tick_ms);
    config.dispatch.takeover_tick_ms = jsonGet<int>(j, "dispatch", "takeover_tick_ms", d.dispatch.takeover_tick_ms);
    config.dispatch.takeover_ceiling_ms = jsonGet<int>(j, "dispatch", "takeover_ceiling_ms", d.dispatch.takeover_ceiling_ms);
    config.dispatch.type_settle_before_ms = jsonGet<int>(j, "dispatch", "type_settle_before_ms", d.dispatch.type_settle_before_ms);
    config.dispatch.type_settle_after_ms = jsonGet<int>(j, "dispatch", "type_settle_after_ms", d.dispatch.type_settle_after_ms);
    config.dispatch.double_tap_gap_ms = jsonGet<int>(j, "dispatch", "double_tap_gap_ms", d.dispatch.double_tap_gap_ms);
    config.dispatch.long_press_ms = jsonGet<int>(j, "dispatch", "long_press_ms", d.dispatch.long_press_ms);
    config.dispatch.default_swipe_ms = jsonGet<int>(j, "dispatch", "default_swipe_ms", d.dispatch.default_swipe_ms);

    config.decoder.pending_limit = jsonGet<int>(j, "decoder", "pending_limit", d.decoder.pending_limit);
    config.decoder.capture_timeout_ms = jsonGet<int>(j, "decoder", "capture_timeout_ms", d.decoder.capture_timeout_ms);

    config.adb.serial = jsonGet<std::string>(j, "adb", "serial", d.adb.serial);
    config.adb.forward_port = jsonGet<int>(j, "adb", "forward_port", d.adb.forward_port);

    config.model.base_url = jsonGet<std::string>(j, "model", "base_url", d.model.base_url);
    config.model.api_key = jsonGet<std::string>(j, "model", "api_key", d.model.api_key);
    config.model.model = jsonGet<std::string>(j, "model", "model", d.model.model);
    config.model.connect_timeout_s = jsonGet<int>(j, "model", "connect_timeout_s", d.model.connect_timeout_s);
    config.model.read_timeout_s = jsonGet<int>(j, "model", "read_timeout_s", d.model.read_timeout_s);

    if (j.contains("apps") && j["apps"].is_object()) {
        for (const auto& item : j["apps"].items()) {
            if (item.value().is_string()) {
                config.apps[item.key()] = item.value().get<std::string>();
            } else {
                DPLOG_WARN("config", "apps.%s is not a string, ignored", item.key().c_str());
            }
        }
    }

    config.log.level = jsonGet<std::string>(j, "log", "level", d.log.level);
    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", d.log.log_path);
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "config.json",
                            bool strict = false) {
    AppConfig config;

    std::string used = configPath;
    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        for (const char* candidate : {"config.json", "../config.json"}) {
            file.clear();
            file.open(candidate);
            if (file.is_open()) {
                used = candidate;
                break;
            }
        }
    }
    if (!file.is_open()) {
        DPLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        DPLOG_ERROR("config", "JSON parse error in %s: %s", used.c_str(), e.what());
        return config;
    }
    applyJson(j, config);

    DPLOG_INFO("config", "Loaded %s: remote=%s:%d display=%dx%d@%d max_steps=%d",
               used.c_str(), config.remote.host.c_str(), config.remote.port,
               config.display.width, config.display.height, config.display.dpi,
               config.agent.max_steps);
    return config;
}

} // namespace config
} // namespace droidpilot
