// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, file loading, partial / mistyped keys, app catalogue
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <cstdio>
#include "config_loader.hpp"

using namespace droidpilot::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static std::string writeTmpJson(const char* name, const char* content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream f(path);
    f << content;
    return path;
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.remote.host,                     "127.0.0.1");
    EXPECT_EQ(cfg.remote.port,                     8986);
    EXPECT_EQ(cfg.display.width,                   1080);
    EXPECT_EQ(cfg.display.height,                  2400);
    EXPECT_EQ(cfg.display.dpi,                     420);
    EXPECT_EQ(cfg.agent.max_steps,                 30);
    EXPECT_TRUE(cfg.agent.use_remote);
    EXPECT_FALSE(cfg.agent.unknown_action_fatal);
    EXPECT_EQ(cfg.dispatch.wait_tick_ms,           100);
    EXPECT_EQ(cfg.dispatch.takeover_ceiling_ms,    30000);
    EXPECT_EQ(cfg.decoder.pending_limit,           100);
    EXPECT_EQ(cfg.adb.forward_port,                8986);
    EXPECT_TRUE(cfg.apps.empty());
    EXPECT_EQ(cfg.log.level,                       "info");
    EXPECT_EQ(cfg.log.log_path,                    "droidpilot.log");
}

TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("__nonexistent_config_xyz.json", true);
    EXPECT_EQ(cfg.remote.host, "127.0.0.1");
    EXPECT_EQ(cfg.log.log_path, "droidpilot.log");
}

// ---------------------------------------------------------------------------
// File loading
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadFullFile) {
    std::string path = writeTmpJson("dp_config_full.json", R"({
        "remote":   {"host": "10.0.0.2", "port": 9000, "screenshot_timeout_ms": 1500},
        "display":  {"width": 720, "height": 1600, "dpi": 320, "bitrate_kbps": 4000},
        "agent":    {"max_steps": 12, "use_remote": false, "unknown_action_fatal": true},
        "dispatch": {"long_press_ms": 1500},
        "decoder":  {"pending_limit": 40},
        "adb":      {"serial": "emulator-5554", "forward_port": 18986},
        "apps":     {"Notes": "com.example.notes"},
        "log":      {"level": "debug", "log_path": ""}
    })");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.remote.host, "10.0.0.2");
    EXPECT_EQ(cfg.remote.port, 9000);
    EXPECT_EQ(cfg.remote.screenshot_timeout_ms, 1500);
    EXPECT_EQ(cfg.remote.connect_timeout_ms, 5000);
    EXPECT_EQ(cfg.display.width, 720);
    EXPECT_EQ(cfg.display.bitrate_kbps, 4000);
    EXPECT_EQ(cfg.agent.max_steps, 12);
    EXPECT_FALSE(cfg.agent.use_remote);
    EXPECT_TRUE(cfg.agent.unknown_action_fatal);
    EXPECT_EQ(cfg.dispatch.long_press_ms, 1500);
    EXPECT_EQ(cfg.dispatch.wait_tick_ms, 100);
    EXPECT_EQ(cfg.decoder.pending_limit, 40);
    EXPECT_EQ(cfg.adb.serial, "emulator-5554");
    EXPECT_EQ(cfg.adb.forward_port, 18986);
    ASSERT_EQ(cfg.apps.size(), 1u);
    EXPECT_EQ(cfg.apps.at("Notes"), "com.example.notes");
    EXPECT_EQ(cfg.log.level, "debug");
    EXPECT_EQ(cfg.log.log_path, "");

    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, MistypedKeysKeepDefaults) {
    std::string path = writeTmpJson("dp_config_types.json", R"({
        "remote":  {"port": "not a number"},
        "display": "should be an object",
        "agent":   {"max_steps": 5, "use_remote": "yes"},
        "apps":    {"Good": "com.good.app", "Bad": 42}
    })");

    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.remote.port, 8986);
    EXPECT_EQ(cfg.display.width, 1080);
    EXPECT_EQ(cfg.agent.max_steps, 5);
    EXPECT_TRUE(cfg.agent.use_remote);
    EXPECT_EQ(cfg.apps.size(), 1u);
    EXPECT_EQ(cfg.apps.count("Bad"), 0u);

    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, InvalidJsonReturnsDefaults) {
    std::string path = writeTmpJson("dp_config_broken.json", "{ \"remote\": { \"port\": 1 ");
    AppConfig cfg = loadConfig(path, true);
    EXPECT_EQ(cfg.remote.port, 8986);
    std::remove(path.c_str());
}

// ---------------------------------------------------------------------------
// applyJson / jsonGet
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ApplyJsonPartial) {
    AppConfig cfg;
    applyJson(nlohmann::json::parse(R"({"display": {"dpi": 480}})"), cfg);
    EXPECT_EQ(cfg.display.dpi, 480);
    EXPECT_EQ(cfg.display.width, 1080);
}

TEST(ConfigLoaderTest, JsonGetFallbacks) {
    auto j = nlohmann::json::parse(R"({"a": {"n": 3, "s": "x"}, "b": 7})");
    EXPECT_EQ(jsonGet<int>(j, "a", "n", 0), 3);
    EXPECT_EQ(jsonGet<int>(j, "a", "missing", 9), 9);
    EXPECT_EQ(jsonGet<int>(j, "b", "n", 9), 9);
    EXPECT_EQ(jsonGet<int>(j, "a", "s", 9), 9);
    EXPECT_EQ(jsonGet<std::string>(j, "a", "s", ""), "x");
}

TEST(ConfigLoaderTest, ModelSection) {
    AppConfig cfg;
    EXPECT_EQ(cfg.model.base_url, "https://open.bigmodel.cn/api/paas/v4");
    EXPECT_EQ(cfg.model.model, "autoglm-phone");
    EXPECT_TRUE(cfg.model.api_key.empty());

    applyJson(nlohmann::json::parse(R"({"model": {
        "base_url": "http://127.0.0.1:8000/v1", "api_key": "sk-test",
        "model": "local-vlm", "read_timeout_s": "slow"}})"), cfg);
    EXPECT_EQ(cfg.model.base_url, "http://127.0.0.1:8000/v1");
    EXPECT_EQ(cfg.model.api_key, "sk-test");
    EXPECT_EQ(cfg.model.model, "local-vlm");
    EXPECT_EQ(cfg.model.read_timeout_s, 120);
    EXPECT_EQ(cfg.model.connect_timeout_s, 60);
}
