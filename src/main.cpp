#include "app/BridgeService.hpp"
#include "config/BridgeConfig.hpp"
#include "render/NullRenderHost.hpp"
#include "render/TerminalRenderHost.hpp"
#include "settings/JsonSettingsStore.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <vector>
#include <csignal>

static std::unique_ptr<BridgeService> g_service;

static void signalHandler(int) {
    if (g_service) g_service->requestStop();
}

static void setupLogging(const BridgeConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // The terminal host owns stdout; log lines there would tear the UI
    if (config.headless())
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.logFile, 1048576 * 5, 3));  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "uibridge", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    const auto& level = config.logLevel;
    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");

    std::string configPath = "config/uibridge.json";
    if (argc > 1) configPath = argv[1];

    auto loaded = BridgeConfig::load(configPath);
    if (!loaded) {
        spdlog::error("Cannot start without a valid config ({})", configPath);
        return 1;
    }
    BridgeConfig config = *loaded;
    config.applyEnvironment();

    if (config.renderHost != "terminal" && config.renderHost != "headless") {
        spdlog::error("Unknown render_host '{}' (terminal|headless)",
                      config.renderHost);
        return 1;
    }

    setupLogging(config);
    spdlog::info("uibridge v{} starting", config.toolVersion);
    spdlog::info("Loaded config: {}", configPath);

    std::unique_ptr<JsonSettingsStore> settings;
    try {
        settings = std::make_unique<JsonSettingsStore>(config.settingsPath);
        settings->installationId();
    } catch (const std::exception& e) {
        spdlog::error("Settings store unavailable: {}", e.what());
        return 1;
    }

    std::unique_ptr<IRenderHost> host;
    if (config.headless()) {
        host = std::make_unique<NullRenderHost>();
    } else {
        auto terminal = std::make_unique<TerminalRenderHost>();
        terminal->onQuit = [] {
            spdlog::info("UI exited — stopping bridge");
            if (g_service) g_service->stop();
        };
        host = std::move(terminal);
    }

    g_service = std::make_unique<BridgeService>(config, std::move(host), *settings);

    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (!g_service->start()) {
        spdlog::error("Failed to start bridge");
        g_service.reset();
        return 1;
    }

    // This thread is the UI thread from here on
    g_service->run();

    g_service.reset();
    spdlog::info("uibridge exited cleanly");
    return 0;
}
