#include <gtest/gtest.h>

#include "bootstrap_config.hpp"
#include "commands/action_registry.hpp"
#include "error_manager.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using nlohmann::json;
using namespace bootstrap_config;

// ------------------------------------------------------------
// mergeDefaults
// ------------------------------------------------------------
TEST(MergeDefaults, AddsMissingKeysRecursively) {
    json defs = { {"a", 1}, {"nested", { {"x", "y"}, {"z", true} }} };
    json cfg  = { {"nested", { {"x", "custom"} }} };

    int patched = 0;
    EXPECT_TRUE(mergeDefaults(cfg, defs, &patched));
    EXPECT_EQ(patched, 2);
    EXPECT_EQ(cfg["a"], 1);
    EXPECT_EQ(cfg["nested"]["x"], "custom");
    EXPECT_EQ(cfg["nested"]["z"], true);
}

TEST(MergeDefaults, ResetsWrongTypes) {
    json defs = { {"timeout", 5000}, {"name", "philips"} };
    json cfg  = { {"timeout", "soon"}, {"name", "jarvis"} };

    EXPECT_TRUE(mergeDefaults(cfg, defs));
    EXPECT_EQ(cfg["timeout"], 5000);
    EXPECT_EQ(cfg["name"], "jarvis");
}

TEST(MergeDefaults, NumbersOfAnyKindAreCompatible) {
    json defs = { {"threshold", 0.7}, {"count", 5} };
    json cfg  = { {"threshold", 1}, {"count", 2.5} };

    EXPECT_FALSE(mergeDefaults(cfg, defs));
    EXPECT_EQ(cfg["threshold"], 1);
}

// ------------------------------------------------------------
// buildAppConfig
// ------------------------------------------------------------
TEST(BuildAppConfig, DefaultsMatchBuiltInValues) {
    AppConfig c = buildAppConfig(defaultConfig());

    EXPECT_EQ(c.capture.commandTimeoutMs, 5000);
    EXPECT_EQ(c.capture.activationWindowMs, 10000);
    EXPECT_EQ(c.capture.cooldownMs, 5000);
    EXPECT_EQ(c.recognition.backend, "whisper_local");
    EXPECT_FLOAT_EQ(c.recognition.confidenceThreshold, 0.7f);
    EXPECT_EQ(c.recognition.debounceWindow, 5);
    EXPECT_EQ(c.wake.keyword, "philips");
    EXPECT_EQ(c.wake.fallbackKeywords.size(), 3u);
    EXPECT_EQ(c.dispatch.maxStateHistory, 5);
    EXPECT_EQ(c.dispatch.maxCommandHistory, 10);
    EXPECT_EQ(c.dispatch.fuzzyThreshold, 70);
    EXPECT_EQ(c.dispatch.deltas.small, 25);
    EXPECT_EQ(c.dispatch.deltas.normal, 64);
    EXPECT_EQ(c.dispatch.deltas.large, 100);
    EXPECT_EQ(c.supervisor.maxErrors, 5);
    EXPECT_FALSE(c.debugMode);
}

TEST(BuildAppConfig, DefaultAliasesRoundTrip) {
    AppConfig c = buildAppConfig(defaultConfig());
    auto builtIn = ActionRegistry::defaultAliases();

    ASSERT_EQ(c.dispatch.aliases.size(), builtIn.size());
    for (std::size_t i = 0; i < builtIn.size(); i++) {
        EXPECT_EQ(c.dispatch.aliases[i].action, builtIn[i].action);
        EXPECT_EQ(c.dispatch.aliases[i].phrases, builtIn[i].phrases);
    }

    ActionRegistry registry(c.dispatch.aliases);
    auto match = registry.matchExact("lights on please");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->entry->action, "turn on");
}

TEST(BuildAppConfig, ClampsOutOfRangeValues) {
    json cfg = defaultConfig();
    cfg["recognition"]["confidence_threshold"] = 1.5;
    cfg["recognition"]["debounce_window"] = 0;
    cfg["wake"]["sensitivity"] = -0.2;
    cfg["dispatch"]["max_state_history"] = 0;
    cfg["dispatch"]["fuzzy_threshold"] = 140;
    cfg["supervisor"]["max_errors"] = -3;
    cfg["supervisor"]["poll_interval_ms"] = 1;

    AppConfig c = buildAppConfig(cfg);
    EXPECT_FLOAT_EQ(c.recognition.confidenceThreshold, 1.0f);
    EXPECT_EQ(c.recognition.debounceWindow, 1);
    EXPECT_FLOAT_EQ(c.wake.sensitivity, 0.0f);
    EXPECT_EQ(c.dispatch.maxStateHistory, 1);
    EXPECT_EQ(c.dispatch.fuzzyThreshold, 100);
    EXPECT_EQ(c.supervisor.maxErrors, 1);
    EXPECT_EQ(c.supervisor.pollIntervalMs, 10);
}

TEST(BuildAppConfig, RejectsInvalidValues) {
    json badBackend = defaultConfig();
    badBackend["recognition"]["backend"] = "cloud";
    try {
        buildAppConfig(badBackend);
        FAIL() << "expected FatalError";
    } catch (const FatalError& e) {
        EXPECT_EQ(e.code(), "ERR_CONFIG_INVALID");
    }

    json badRate = defaultConfig();
    badRate["capture"]["sample_rate"] = 0;
    EXPECT_THROW(buildAppConfig(badRate), FatalError);

    json missingSection = defaultConfig();
    missingSection.erase("supervisor");
    EXPECT_THROW(buildAppConfig(missingSection), FatalError);

    json wrongType = defaultConfig();
    wrongType["capture"]["cooldown_ms"] = "five seconds";
    EXPECT_THROW(buildAppConfig(wrongType), FatalError);
}

TEST(BuildAppConfig, CustomAliasesReplaceTable) {
    json cfg = defaultConfig();
    cfg["dispatch"]["aliases"] = json::array({
        { {"action", "turn off"}, {"phrases", {"lights out", "goodnight"}} },
        { {"action", ""}, {"phrases", json::array({"ignored"})} }
    });

    AppConfig c = buildAppConfig(cfg);
    ASSERT_EQ(c.dispatch.aliases.size(), 1u);
    EXPECT_EQ(c.dispatch.aliases[0].phrases[1], "goodnight");
}

// ------------------------------------------------------------
// Environment and CLI
// ------------------------------------------------------------
TEST(Environment, OverridesBridgeAndWakeSettings) {
    setenv("HUE_BRIDGE_IP", "192.168.1.40", 1);
    setenv("WAKE_WORD_SENSITIVITY", "0.65", 1);
    setenv("PICOVOICE_ACCESS_KEY", "secret", 1);

    AppConfig c;
    applyEnvironment(c);
    EXPECT_EQ(c.bridge.address, "192.168.1.40");
    EXPECT_FLOAT_EQ(c.wake.sensitivity, 0.65f);
    EXPECT_EQ(c.wake.accessKey, "secret");

    setenv("WAKE_WORD_SENSITIVITY", "loud", 1);
    AppConfig d;
    applyEnvironment(d);
    EXPECT_FLOAT_EQ(d.wake.sensitivity, 0.5f);

    for (const char* bad : { "nan", "NAN", "inf", "-infinity" }) {
        setenv("WAKE_WORD_SENSITIVITY", bad, 1);
        AppConfig e;
        applyEnvironment(e);
        EXPECT_FLOAT_EQ(e.wake.sensitivity, 0.5f) << bad;
    }

    unsetenv("HUE_BRIDGE_IP");
    unsetenv("WAKE_WORD_SENSITIVITY");
    unsetenv("PICOVOICE_ACCESS_KEY");
}

TEST(Cli, ParsesFlags) {
    const char* argv[] = { "lumen", "--debug", "--fallback" };
    CliOptions opts = parseArgs(3, argv);
    EXPECT_TRUE(opts.debug);
    EXPECT_TRUE(opts.fallback);
    EXPECT_FALSE(opts.help);
    EXPECT_TRUE(opts.unknown.empty());

    const char* help[] = { "lumen", "-h", "--verbose", "--nope" };
    opts = parseArgs(4, help);
    EXPECT_TRUE(opts.help);
    EXPECT_EQ(opts.unknown, "--verbose");
}

TEST(Cli, UsageNamesEveryFlag) {
    std::string text = usage("lumen");
    EXPECT_NE(text.find("Usage: lumen"), std::string::npos);
    EXPECT_NE(text.find("--fallback"), std::string::npos);
    EXPECT_NE(text.find("--debug"), std::string::npos);
    EXPECT_NE(text.find("--help"), std::string::npos);
}

// ------------------------------------------------------------
// Files
// ------------------------------------------------------------
class ConfigFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("lumen_cfg_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

TEST_F(ConfigFilesTest, BridgeConfigRoundTrip) {
    fs::path path = dir / "bridge_config.json";
    EXPECT_TRUE(loadBridgeConfig(path).address.empty());

    ASSERT_TRUE(saveBridgeConfig(path, BridgeConfig{ "10.0.0.2", "abc123" }));
    BridgeConfig loaded = loadBridgeConfig(path);
    EXPECT_EQ(loaded.address, "10.0.0.2");
    EXPECT_EQ(loaded.authToken, "abc123");
}

TEST_F(ConfigFilesTest, CorruptBridgeConfigIsIgnored) {
    fs::path path = dir / "bridge_config.json";
    std::ofstream(path) << "{ not json";
    BridgeConfig loaded = loadBridgeConfig(path);
    EXPECT_TRUE(loaded.address.empty());
    EXPECT_TRUE(loaded.authToken.empty());
}

TEST_F(ConfigFilesTest, LoadConfigCreatesAndPatches) {
    fs::path path = dir / "lumen_config.json";
    json out;
    EXPECT_TRUE(loadConfig(path, defaultConfig(), out, "Lumen config"));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(out, defaultConfig());

    std::ofstream(path) << R"({"capture": {"cooldown_ms": 2000}})";
    EXPECT_TRUE(loadConfig(path, defaultConfig(), out, "Lumen config"));
    EXPECT_EQ(out["capture"]["cooldown_ms"], 2000);
    EXPECT_EQ(out["capture"]["sample_rate"], 16000);
    EXPECT_EQ(buildAppConfig(out).capture.cooldownMs, 2000);
}

TEST_F(ConfigFilesTest, InvalidJsonFallsBackToDefaults) {
    fs::path path = dir / "lumen_config.json";
    std::ofstream(path) << "{ \"capture\": ";
    json out;
    EXPECT_FALSE(loadConfig(path, defaultConfig(), out, "Lumen config"));
    EXPECT_EQ(out, defaultConfig());
}
