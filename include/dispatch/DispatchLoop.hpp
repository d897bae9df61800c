#pragma once
#include "AutoResizeController.hpp"
#include "MessageBoard.hpp"
#include "WindowSession.hpp"
#include "bridge/RequestMailbox.hpp"
#include "render/IRenderHost.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <unordered_map>

struct DispatchConfig {
    std::chrono::milliseconds idleWait{250};      // mailbox wait with nothing open
    std::chrono::milliseconds pumpInterval{16};   // host pump rate while windows are open
    AutoResizeController::ChromeOffset chrome;
    int    measurementPadding = 20;
    size_t messageHistory     = 500;
};

// Sole consumer of the RequestMailbox. Runs on the UI-owning thread and is
// the only code that talks to the render host or touches a WindowSession.
//
// Each iteration pumps host events, expires sessions past their deadline,
// then waits on the mailbox for the next request. A request that fails is
// answered with an error and the loop carries on.
class DispatchLoop {
public:
    DispatchLoop(RequestMailbox& mailbox, IRenderHost& host,
                 const DispatchConfig& config = {});
    ~DispatchLoop();

    DispatchLoop(const DispatchLoop&) = delete;
    DispatchLoop& operator=(const DispatchLoop&) = delete;

    // Attach as the mailbox consumer and subscribe to host events.
    // Called by run(); exposed for embedding in a foreign event loop.
    void start();

    // Block until stop(). Must be called on the UI-owning thread.
    void run();

    // One iteration; waits at most maxWait for a request.
    // Returns true if a request was dispatched.
    bool runOnce(std::chrono::milliseconds maxWait);

    // Thread-safe. run() answers everything still pending and returns.
    void stop();

    // Flag only, no locking; safe from a signal handler. run() notices
    // within one idle wait.
    void requestStop() noexcept { stopRequested_ = true; }

    // Detach, close open windows, answer outstanding requests
    void shutdown();

    bool isRunning() const { return running_; }

    // Loop thread only
    size_t openSessionCount() const { return sessions_.size(); }
    std::optional<AutoResizeController::Stage> resizeStage(WindowId id) const;
    // Outer size applied by auto-resize; empty before the resize
    std::optional<Size> windowSize(WindowId id) const;
    const MessageBoard& messageBoard() const { return board_; }
    uint64_t dispatchedCount() const { return dispatched_; }

private:
    void dispatch(UIRequest request);
    void openWindow(UIRequest request);
    void answerProbe(const UIRequest& request);
    void showToast(const UIRequest& request);
    void handleMessaging(const UIRequest& request);

    void onHostEvent(const HostEvent& event);
    void onMeasured(WindowSession& session, Size measured);
    void expireSessions();
    void finish(WindowId id, Outcome outcome, bool closeWindow);
    void reply(const UIRequest& request, Outcome outcome);
    void setDashboardVisible(bool visible);

    std::chrono::milliseconds nextWait(std::chrono::milliseconds maxWait) const;

    RequestMailbox& mailbox_;
    IRenderHost&    host_;
    DispatchConfig  config_;
    MessageBoard    board_;

    std::unordered_map<WindowId, WindowSession> sessions_;
    bool dashboardVisible_ = false;

    std::atomic<bool>     running_{false};
    std::atomic<bool>     stopRequested_{false};
    std::atomic<uint64_t> dispatched_{0};
};
