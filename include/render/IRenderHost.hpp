#pragma once
#include "bridge/UIRequest.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

using WindowId = uint64_t;

struct Size {
    int width  = 0;
    int height = 0;

    bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    bool operator!=(const Size& o) const { return !(*this == o); }
};

// What the dispatch loop asks the host to materialise
struct WindowSpec {
    WindowId      id = 0;
    std::string   title;
    ContentSource content;
    Size          contentSize;      // content area; host adds its own chrome
    bool          modal          = true;
    bool          resizable      = false;
    bool          alwaysOnTop    = true;
    bool          centerOnScreen = true;
};

// Messages from the host back to the dispatch loop
struct HostEvent {
    enum class Type {
        ContentMeasured,   // reply to requestMeasurement()
        WindowClosed,      // user or content closed the window
        HostError,         // window failed after opening
        UserMessage        // dashboard message typed by the user
    } type;

    WindowId window = 0;
    Size     measured;                            // ContentMeasured
    std::optional<nlohmann::json> userResponse;   // WindowClosed: window.userResponse
    std::string detail;                           // HostError
    nlohmann::json message;                       // UserMessage: {content, type}
};

// Raising a window is a request the platform may ignore (focus-stealing
// prevention). The result says what was attempted, never that it worked.
enum class ForegroundResult {
    Requested,     // asked the platform; may or may not be honoured
    Unsupported    // host has no way to ask
};

// Abstract render host: the only thing that draws windows or runs
// content. Implementations: TerminalRenderHost (ftxui), NullRenderHost.
// All calls are made from the dispatch loop thread.
class IRenderHost {
public:
    virtual ~IRenderHost() = default;

    // Lifecycle
    virtual bool start() = 0;
    virtual void stop() = 0;

    // Windows. openWindow returns false and fills error when the host
    // cannot materialise the window at all.
    virtual bool openWindow(const WindowSpec& spec, std::string& error) = 0;
    virtual void closeWindow(WindowId id) = 0;

    // Ask the content to report its rendered size plus padding.
    // The answer arrives later as a ContentMeasured event.
    virtual void requestMeasurement(WindowId id, int padding) = 0;

    // outer = full window size including chrome
    virtual void resizeWindow(WindowId id, Size outer) = 0;
    virtual void centerWindow(WindowId id) = 0;
    virtual ForegroundResult bringToFront(WindowId id) = 0;

    // Notifications and the message dashboard
    virtual void showToast(const std::string& text, const std::string& level) = 0;
    virtual void setDashboardVisible(bool visible) = 0;
    virtual void postDashboardMessage(const nlohmann::json& message) = 0;

    // Pump host events for at most maxWait. Events are handed to onEvent
    // synchronously, on the calling thread.
    virtual void processEvents(std::chrono::milliseconds maxWait) = 0;

    // Name for logging
    virtual std::string backendName() const = 0;

    std::function<void(const HostEvent&)> onEvent;
};
