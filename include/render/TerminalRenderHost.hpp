#pragma once
#include "IRenderHost.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Render host for a text terminal (ftxui).
//
// Each window is a framed pane holding its markup reduced to text. The
// <input>/<textarea> fields found in the markup can be filled in:
//   Tab / Shift+Tab  move between fields
//   Enter            submit: {"status":"success","data":{field: value...}}
//   Esc              close without a response (reported as cancelled)
// With no window open, '/' types into the message dashboard and 'q' quits.
//
// Not thread-safe: every call, including processEvents, comes from the
// dispatch loop thread.
class TerminalRenderHost : public IRenderHost {
public:
    // Terminal cell size used to express measurements in pixels
    static constexpr int cellWidthPx  = 8;
    static constexpr int cellHeightPx = 16;

    struct InputField {
        std::string id;
        std::string label;
        std::string value;
        bool        secret = false;
    };

    struct MarkupView {
        std::vector<std::string> lines;
        std::vector<InputField>  fields;
    };

    TerminalRenderHost();
    ~TerminalRenderHost() override;

    bool start() override;
    void stop() override;

    bool openWindow(const WindowSpec& spec, std::string& error) override;
    void closeWindow(WindowId id) override;
    void requestMeasurement(WindowId id, int padding) override;
    void resizeWindow(WindowId id, Size outer) override;
    void centerWindow(WindowId id) override;
    ForegroundResult bringToFront(WindowId id) override;

    void showToast(const std::string& text, const std::string& level) override;
    void setDashboardVisible(bool visible) override;
    void postDashboardMessage(const nlohmann::json& message) override;

    void processEvents(std::chrono::milliseconds maxWait) override;
    std::string backendName() const override { return "terminal"; }

    // Called when the user quits from the terminal
    std::function<void()> onQuit;

    // HTML -> display lines plus editable fields
    static MarkupView reduceMarkup(const std::string& html);

    // Rendered size of a view in pixels, padding included
    static Size measure(const MarkupView& view, int padding);

    size_t windowCount() const { return panes_.size(); }

private:
    struct Pane {
        WindowSpec  spec;
        Size        outer;
        MarkupView  view;
        size_t      focus    = 0;
        bool        centered = false;
    };

    struct LogLine {
        std::string text;
        std::string level;
    };

    ftxui::Component buildComponent();
    ftxui::Element   renderPane(const Pane& pane) const;
    ftxui::Element   renderDashboard() const;
    bool             handleKey(const ftxui::Event& event);

    Pane* topPane();
    Pane* findPane(WindowId id);
    void  submitTop();
    void  dismissTop();
    void  addLog(const std::string& text, const std::string& level = "info");
    void  emit(HostEvent event);
    void  redraw();

    ftxui::ScreenInteractive     screen_;
    ftxui::Component             component_;
    std::unique_ptr<ftxui::Loop> loop_;

    std::vector<Pane>       panes_;       // back() has focus
    std::deque<HostEvent>   outbox_;      // flushed after each RunOnce
    std::vector<LogLine>    logs_;
    static constexpr size_t maxLogs_ = 50;

    std::vector<nlohmann::json> dashboard_;
    static constexpr size_t maxDashboard_ = 100;
    bool dashboardVisible_ = false;

    std::string toastText_;
    std::string toastLevel_;
    std::chrono::steady_clock::time_point toastUntil_;

    enum class Mode { Windows, Chat };
    Mode        mode_ = Mode::Windows;
    std::string chatInput_;
};
