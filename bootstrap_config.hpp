#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

#include "app_config.hpp"

// Centralized config bootstrap for Lumen
namespace bootstrap_config {

    inline constexpr const char* kConfigFile = "lumen_config.json";
    inline constexpr const char* kBridgeFile = "bridge_config.json";

    // Load lumen_config.json, errors.json and bridge_config.json,
    // apply environment overrides, return the immutable config
    AppConfig initAll();

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Adds missing keys, resets keys whose type differs. Returns true if patched.
    bool mergeDefaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultConfig();
    nlohmann::json defaultErrors();

    // JSON → AppConfig; throws FatalError(ERR_CONFIG_INVALID) on bad values
    AppConfig buildAppConfig(const nlohmann::json& cfg);

    // HUE_BRIDGE_IP, WAKE_WORD_SENSITIVITY, PICOVOICE_ACCESS_KEY
    void applyEnvironment(AppConfig& config);

    // bridge_config.json {bridge_address, auth_token}
    BridgeConfig loadBridgeConfig(const std::filesystem::path& path);
    bool saveBridgeConfig(const std::filesystem::path& path, const BridgeConfig& bridge);

    // lumen [--fallback] [--debug] [--help]
    struct CliOptions {
        bool fallback = false;
        bool debug = false;
        bool help = false;
        std::string unknown;   // first unrecognized argument
    };

    CliOptions parseArgs(int argc, const char* const* argv);
    std::string usage(const std::string& program);
}
