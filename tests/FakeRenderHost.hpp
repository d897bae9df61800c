#pragma once
#include "render/IRenderHost.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Scripted render host for tests. Records every call; events posted from
// any thread are delivered on the next processEvents().
class FakeRenderHost : public IRenderHost {
public:
    // Answer requestMeasurement() with this size when set
    std::optional<Size> autoMeasure;

    bool start() override { return true; }
    void stop() override {}

    bool openWindow(const WindowSpec& spec, std::string& error) override {
        std::lock_guard lock(mtx_);
        if (throwOnNextOpen_) {
            throwOnNextOpen_ = false;
            throw std::runtime_error("render host crashed");
        }
        if (failOpen_) {
            error = "cannot open";
            return false;
        }
        opened_.push_back(spec);
        cv_.notify_all();
        return true;
    }

    void closeWindow(WindowId id) override {
        std::lock_guard lock(mtx_);
        closed_.push_back(id);
    }

    void requestMeasurement(WindowId id, int padding) override {
        std::lock_guard lock(mtx_);
        measureRequests_.push_back({id, padding});
        if (autoMeasure) {
            HostEvent e{HostEvent::Type::ContentMeasured};
            e.window   = id;
            e.measured = *autoMeasure;
            pending_.push_back(e);
        }
    }

    void resizeWindow(WindowId id, Size outer) override {
        std::lock_guard lock(mtx_);
        resizes_.push_back({id, outer});
    }

    void centerWindow(WindowId id) override {
        std::lock_guard lock(mtx_);
        centered_.push_back(id);
    }

    ForegroundResult bringToFront(WindowId) override {
        return ForegroundResult::Requested;
    }

    void showToast(const std::string& text, const std::string& level) override {
        std::lock_guard lock(mtx_);
        toasts_.push_back({text, level});
    }

    void setDashboardVisible(bool visible) override {
        std::lock_guard lock(mtx_);
        dashboardVisible_ = visible;
    }

    void postDashboardMessage(const nlohmann::json& message) override {
        std::lock_guard lock(mtx_);
        dashboard_.push_back(message);
    }

    void processEvents(std::chrono::milliseconds) override {
        std::deque<HostEvent> batch;
        {
            std::lock_guard lock(mtx_);
            batch.swap(pending_);
        }
        for (auto& e : batch)
            if (onEvent) onEvent(e);
    }

    std::string backendName() const override { return "fake"; }

    // ── Scripting ────────────────────────────────────────────────────

    void post(HostEvent e) {
        std::lock_guard lock(mtx_);
        pending_.push_back(std::move(e));
    }

    void userCloses(WindowId id, std::optional<nlohmann::json> response = std::nullopt) {
        HostEvent e{HostEvent::Type::WindowClosed};
        e.window       = id;
        e.userResponse = std::move(response);
        post(std::move(e));
    }

    void userTypes(const std::string& content) {
        HostEvent e{HostEvent::Type::UserMessage};
        e.message = {{"content", content}, {"type", "response"}};
        post(std::move(e));
    }

    void throwOnNextOpen() {
        std::lock_guard lock(mtx_);
        throwOnNextOpen_ = true;
    }

    void failOpens(bool fail) {
        std::lock_guard lock(mtx_);
        failOpen_ = fail;
    }

    bool waitForOpened(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx_);
        return cv_.wait_for(lock, timeout, [&] { return opened_.size() >= count; });
    }

    // ── Recorded calls ───────────────────────────────────────────────

    struct Resize  { WindowId id; Size outer; };
    struct Measure { WindowId id; int padding; };
    struct Toast   { std::string text; std::string level; };

    std::vector<WindowSpec> opened() const   { std::lock_guard l(mtx_); return opened_; }
    std::vector<WindowId>   closed() const   { std::lock_guard l(mtx_); return closed_; }
    std::vector<Resize>     resizes() const  { std::lock_guard l(mtx_); return resizes_; }
    std::vector<WindowId>   centered() const { std::lock_guard l(mtx_); return centered_; }
    std::vector<Measure>    measureRequests() const { std::lock_guard l(mtx_); return measureRequests_; }
    std::vector<Toast>      toasts() const   { std::lock_guard l(mtx_); return toasts_; }
    std::vector<nlohmann::json> dashboard() const { std::lock_guard l(mtx_); return dashboard_; }
    bool dashboardVisible() const { std::lock_guard l(mtx_); return dashboardVisible_; }

private:
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::deque<HostEvent>   pending_;

    bool throwOnNextOpen_ = false;
    bool failOpen_        = false;
    bool dashboardVisible_ = false;

    std::vector<WindowSpec>     opened_;
    std::vector<WindowId>       closed_;
    std::vector<Resize>         resizes_;
    std::vector<WindowId>       centered_;
    std::vector<Measure>        measureRequests_;
    std::vector<Toast>          toasts_;
    std::vector<nlohmann::json> dashboard_;
};
