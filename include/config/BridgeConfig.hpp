#pragma once
#include "dispatch/DispatchLoop.hpp"
#include "facade/RequestFacade.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Startup configuration: JSON file, then environment overrides.
struct BridgeConfig {
    std::string serverHost   = "127.0.0.1";
    int         serverPort   = 31174;
    std::string renderHost   = "terminal";          // terminal | headless
    std::string settingsPath = "uibridge_settings.json";
    std::string logFile      = "uibridge.log";
    std::string logLevel     = "info";
    std::string toolVersion  = "0.1.0";

    DispatchConfig dispatch;
    FacadeConfig   facade;

    // Missing keys keep their defaults
    static BridgeConfig fromJson(const nlohmann::json& j);

    // Returns nothing (and logs) if the file is missing or malformed
    static std::optional<BridgeConfig> load(const std::string& path);

    // UIBRIDGE_LOG_LEVEL, UIBRIDGE_PORT, UIBRIDGE_RENDER_HOST,
    // UIBRIDGE_SETTINGS_PATH
    void applyEnvironment();

    bool headless() const { return renderHost == "headless"; }
};

std::string getEnv(const std::string& key, const std::string& defaultVal = "");

// KEY=VALUE lines, '#' comments, surrounding quotes stripped.
// Variables already set in the environment win.
void loadDotEnv(const std::string& path);
