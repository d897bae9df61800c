#pragma once
#include "IRenderHost.hpp"
#include <spdlog/spdlog.h>

// Headless render host, used when no display is available.
// Windows cannot be shown; toasts and dashboard messages only reach the log.
class NullRenderHost : public IRenderHost {
public:
    bool start() override { return true; }
    void stop() override {}

    bool openWindow(const WindowSpec& spec, std::string& error) override {
        error = "No render host available (headless mode) - cannot show '" +
                spec.title + "'";
        return false;
    }
    void closeWindow(WindowId) override {}
    void requestMeasurement(WindowId, int) override {}
    void resizeWindow(WindowId, Size) override {}
    void centerWindow(WindowId) override {}
    ForegroundResult bringToFront(WindowId) override {
        return ForegroundResult::Unsupported;
    }

    void showToast(const std::string& text, const std::string& level) override {
        spdlog::info("Toast [{}]: {}", level, text);
    }
    void setDashboardVisible(bool) override {}
    void postDashboardMessage(const nlohmann::json& message) override {
        spdlog::info("Dashboard: {}", message.value("content", ""));
    }

    void processEvents(std::chrono::milliseconds) override {}
    std::string backendName() const override { return "headless"; }
};
