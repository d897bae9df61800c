#include "config/BridgeConfig.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

std::string getEnv(const std::string& key, const std::string& defaultVal) {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') ||
             (val.front() == '\'' && val.back() == '\'')))
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);
    }
}

BridgeConfig BridgeConfig::fromJson(const nlohmann::json& j) {
    BridgeConfig c;
    c.serverHost   = j.value("server_host", c.serverHost);
    c.serverPort   = j.value("server_port", c.serverPort);
    c.renderHost   = j.value("render_host", c.renderHost);
    c.settingsPath = j.value("settings_path", c.settingsPath);
    c.logFile      = j.value("log_file", c.logFile);
    c.logLevel     = j.value("log_level", c.logLevel);
    c.toolVersion  = j.value("tool_version", c.toolVersion);

    auto& d = c.dispatch;
    d.chrome.width       = j.value("chrome_width", d.chrome.width);
    d.chrome.height      = j.value("chrome_height", d.chrome.height);
    d.measurementPadding = j.value("measurement_padding", d.measurementPadding);
    d.idleWait           = std::chrono::milliseconds(
        j.value("idle_wait_ms", static_cast<int>(d.idleWait.count())));
    d.pumpInterval       = std::chrono::milliseconds(
        j.value("pump_interval_ms", static_cast<int>(d.pumpInterval.count())));
    d.messageHistory     = j.value("message_history", d.messageHistory);

    auto secs = [&j](const char* key, std::chrono::seconds def) {
        return std::chrono::seconds(j.value(key, static_cast<int>(def.count())));
    };
    auto& f = c.facade;
    f.replyGrace       = secs("reply_grace_s", f.replyGrace);
    f.probeTimeout     = secs("probe_timeout_s", f.probeTimeout);
    f.messagingTimeout = secs("messaging_timeout_s", f.messagingTimeout);
    f.collectorTimeout = secs("collector_timeout_s", f.collectorTimeout);
    f.defaultTimeout   = secs("default_timeout_s", f.defaultTimeout);

    return c;
}

std::optional<BridgeConfig> BridgeConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::error("Cannot open config file: {}", path);
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            spdlog::error("Config {} must contain a JSON object", path);
            return std::nullopt;
        }
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Config {} is invalid: {}", path, e.what());
        return std::nullopt;
    }
}

void BridgeConfig::applyEnvironment() {
    logLevel     = getEnv("UIBRIDGE_LOG_LEVEL", logLevel);
    renderHost   = getEnv("UIBRIDGE_RENDER_HOST", renderHost);
    settingsPath = getEnv("UIBRIDGE_SETTINGS_PATH", settingsPath);

    std::string port = getEnv("UIBRIDGE_PORT");
    if (!port.empty()) {
        try {
            serverPort = std::stoi(port);
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring UIBRIDGE_PORT='{}': {}", port, e.what());
        }
    }
}
