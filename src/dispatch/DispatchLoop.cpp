#include "dispatch/DispatchLoop.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>
#include <thread>
#include <vector>

using std::chrono::milliseconds;
using std::chrono::steady_clock;

DispatchLoop::DispatchLoop(RequestMailbox& mailbox, IRenderHost& host,
                           const DispatchConfig& config)
    : mailbox_(mailbox)
    , host_(host)
    , config_(config)
    , board_(config.messageHistory)
{
}

DispatchLoop::~DispatchLoop() {
    if (running_) shutdown();
}

void DispatchLoop::start() {
    if (running_) return;

    host_.onEvent = [this](const HostEvent& e) { onHostEvent(e); };
    mailbox_.attachConsumer();
    running_ = true;

    spdlog::info("Dispatch loop attached — render host '{}'",
                 host_.backendName());
}

void DispatchLoop::run() {
    start();
    spdlog::debug("Dispatch loop running");

    while (!stopRequested_)
        runOnce(config_.idleWait);

    shutdown();
    spdlog::debug("Dispatch loop stopped");
}

void DispatchLoop::stop() {
    requestStop();
    mailbox_.wake();
}

bool DispatchLoop::runOnce(milliseconds maxWait) {
    host_.processEvents(milliseconds(0));
    expireSessions();

    auto request = mailbox_.dequeueBlocking(nextWait(maxWait));
    if (!request) return false;

    dispatch(std::move(*request));
    return true;
}

void DispatchLoop::shutdown() {
    if (!running_) return;

    auto leftover = mailbox_.detachConsumer();
    for (auto& r : leftover) {
        spdlog::warn("Dropping queued request {} — dispatch loop stopping",
                     r.describe());
        reply(r, Outcome::error("UI dispatch loop stopped"));
    }

    std::vector<WindowId> open;
    for (auto& [id, s] : sessions_) open.push_back(id);
    for (auto id : open)
        finish(id, Outcome::error("UI dispatch loop stopped"), true);

    host_.onEvent = nullptr;
    running_ = false;
    spdlog::info("Dispatch loop detached ({} requests served)",
                 dispatched_.load());
}

std::optional<AutoResizeController::Stage>
DispatchLoop::resizeStage(WindowId id) const {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.resizeStage();
}

std::optional<Size> DispatchLoop::windowSize(WindowId id) const {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.outerSize;
}

// ── Request handling ─────────────────────────────────────────────────────

void DispatchLoop::dispatch(UIRequest request) {
    dispatched_++;
    const WindowId id = request.id;
    auto channel = request.reply;

    spdlog::debug("Dispatching {}", request.describe());

    try {
        switch (request.operation) {
            case OperationKind::Popup:
            case OperationKind::ModalDialog:
            case OperationKind::PrebuiltCollector:
                openWindow(std::move(request));
                break;
            case OperationKind::DiagnosticProbe:
                answerProbe(request);
                break;
            case OperationKind::Toast:
                showToast(request);
                break;
            case OperationKind::SendMessage:
            case OperationKind::CheckMessages:
            case OperationKind::ShowDashboard:
            case OperationKind::HideDashboard:
            case OperationKind::MessageHistory:
            case OperationKind::ClearMessages:
                handleMessaging(request);
                break;
            case OperationKind::Introspection:
                reply(request, Outcome::error(
                    "readme is answered by the caller side, not the UI thread"));
                break;
        }
    } catch (const std::exception& e) {
        spdlog::error("Request #{} failed on UI thread: {}", id, e.what());
        if (sessions_.count(id)) {
            finish(id, Outcome::error(std::string("Render host error: ") + e.what()),
                   true);
        } else if (!channel->deliver(Outcome::error(
                       std::string("Render host error: ") + e.what()))) {
            spdlog::debug("Error reply for #{} discarded", id);
        }
    }
}

void DispatchLoop::openWindow(UIRequest request) {
    const WindowId id = request.id;

    if (auto deadline = request.deadline();
        deadline && *deadline <= steady_clock::now()) {
        spdlog::warn("Request #{} expired before it could be shown", id);
        reply(request, Outcome::timeout(
            "UI request timed out after " +
            std::to_string(request.timeout.count()) +
            " seconds (expired while queued)"));
        return;
    }

    if (sessions_.count(id)) {
        reply(request, Outcome::error("Duplicate request id " +
                                      std::to_string(id)));
        return;
    }

    if (!request.content) {
        reply(request, Outcome::error("Window request without content"));
        return;
    }

    WindowSession session{std::move(request), {}, std::nullopt, std::nullopt};
    const auto& hints = session.request.hints;

    Size openSize{hints.width, hints.height};
    if (hints.autoResize) {
        session.autoResize.emplace(config_.chrome, config_.measurementPadding);
        openSize = session.autoResize->begin(openSize);
    }
    session.contentSize = openSize;

    WindowSpec spec;
    spec.id             = id;
    spec.title          = hints.title;
    spec.content        = *session.request.content;
    spec.contentSize    = openSize;
    spec.modal          = hints.modal;
    spec.resizable      = hints.resizable;
    spec.alwaysOnTop    = hints.alwaysOnTop;
    spec.centerOnScreen = hints.centerOnScreen;

    std::string error;
    if (!host_.openWindow(spec, error)) {
        spdlog::error("Render host could not open window #{}: {}", id, error);
        reply(session.request, Outcome::error(
            error.empty() ? "Render host failed to open the window" : error));
        return;
    }

    auto& s = sessions_.emplace(id, std::move(session)).first->second;

    spdlog::info("Window #{} open: '{}' {}x{} modal={} auto_resize={}",
                 id, s.request.hints.title, openSize.width, openSize.height,
                 s.request.hints.modal, s.autoResize.has_value());

    if (s.request.hints.bringToFront) {
        auto fg = host_.bringToFront(id);
        spdlog::debug("Window #{} bring-to-front: {}", id,
                      fg == ForegroundResult::Requested ? "requested"
                                                        : "unsupported");
    }

    if (s.autoResize)
        host_.requestMeasurement(id, s.autoResize->padding());
}

void DispatchLoop::answerProbe(const UIRequest& request) {
    std::ostringstream tid;
    tid << std::this_thread::get_id();

    auto queuedMs = std::chrono::duration_cast<milliseconds>(
        steady_clock::now() - request.created).count();

    nlohmann::json data = {
        {"echo",                request.payload.value("message", "")},
        {"dispatch_thread",     tid.str()},
        {"queued_ms",           queuedMs},
        {"queue_depth",         mailbox_.size()},
        {"open_windows",        sessions_.size()},
        {"requests_dispatched", dispatched_.load()},
        {"render_host",         host_.backendName()}
    };

    spdlog::info("Queue probe #{} answered after {}ms", request.id, queuedMs);
    reply(request, Outcome::success(data, "Queue round trip completed"));
}

void DispatchLoop::showToast(const UIRequest& request) {
    std::string text  = request.payload.value("message", "");
    std::string level = request.payload.value("level", "info");

    host_.showToast(text, level);
    reply(request, Outcome::success({{"level", level}, {"text", text}},
                                    "Toast notification sent"));
}

void DispatchLoop::handleMessaging(const UIRequest& request) {
    const auto& p = request.payload;

    switch (request.operation) {
        case OperationKind::SendMessage: {
            const auto& m = board_.postFromAi(
                p.value("content", ""),
                p.value("msg_type", "status"),
                p.value("priority", "normal"),
                p.value("requires_response", false));
            host_.postDashboardMessage(m.toJson());
            if (p.value("show_dashboard", true))
                setDashboardVisible(true);
            reply(request, Outcome::success({
                {"message_id", m.id},
                {"status",     "queued"},
                {"timestamp",  m.timestamp}
            }));
            break;
        }
        case OperationKind::CheckMessages: {
            MessageBoard::Filter f;
            f.markAsRead = p.value("mark_as_read", true);
            if (p.contains("filter_type") && p["filter_type"].is_string())
                f.type = p["filter_type"].get<std::string>();
            if (p.contains("since_timestamp") && p["since_timestamp"].is_number())
                f.sinceTimestamp = p["since_timestamp"].get<double>();

            nlohmann::json list = nlohmann::json::array();
            for (auto& m : board_.unreadFromUser(f))
                list.push_back(m.toJson());
            spdlog::debug("check_messages: {} new", list.size());
            reply(request, Outcome::success({{"messages", list},
                                             {"count", list.size()}}));
            break;
        }
        case OperationKind::MessageHistory: {
            nlohmann::json list = nlohmann::json::array();
            for (auto& m : board_.history())
                list.push_back(m.toJson());
            reply(request, Outcome::success({{"history", list},
                                             {"count", list.size()}}));
            break;
        }
        case OperationKind::ClearMessages:
            board_.clear();
            reply(request, Outcome::success(nullptr, "Message queues cleared"));
            break;
        case OperationKind::ShowDashboard:
            setDashboardVisible(true);
            reply(request, Outcome::success(nullptr, "Dashboard shown"));
            break;
        case OperationKind::HideDashboard:
            setDashboardVisible(false);
            reply(request, Outcome::success(nullptr, "Dashboard hidden"));
            break;
        default:
            reply(request, Outcome::error(std::string("Not a messaging operation: ") +
                                          operationName(request.operation)));
            break;
    }
}

void DispatchLoop::setDashboardVisible(bool visible) {
    host_.setDashboardVisible(visible);
    dashboardVisible_ = visible;
}

// ── Host events ──────────────────────────────────────────────────────────

void DispatchLoop::onHostEvent(const HostEvent& event) {
    try {
        switch (event.type) {
            case HostEvent::Type::ContentMeasured: {
                auto it = sessions_.find(event.window);
                if (it == sessions_.end()) {
                    spdlog::debug("Measurement for closed window #{} ignored",
                                  event.window);
                    return;
                }
                onMeasured(it->second, event.measured);
                break;
            }
            case HostEvent::Type::WindowClosed:
                finish(event.window,
                       Outcome::fromWindowResponse(event.userResponse), false);
                break;
            case HostEvent::Type::HostError:
                spdlog::error("Render host error on window #{}: {}",
                              event.window, event.detail);
                finish(event.window, Outcome::error(event.detail), true);
                break;
            case HostEvent::Type::UserMessage: {
                std::string content = event.message.value("content", "");
                if (content.empty()) return;
                board_.postFromUser(content,
                                    event.message.value("type", "response"));
                spdlog::info("User message received ({} chars)", content.size());
                break;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed handling host event for window #{}: {}",
                      event.window, e.what());
        finish(event.window, Outcome::error(e.what()), true);
    }
}

void DispatchLoop::onMeasured(WindowSession& session, Size measured) {
    if (!session.autoResize) {
        spdlog::debug("Window #{} sent a measurement without auto_resize",
                      session.id());
        return;
    }

    auto finalSize = session.autoResize->onMeasured(measured);
    if (!finalSize) {
        spdlog::debug("Window #{} already resized — extra measurement ignored",
                      session.id());
        return;
    }

    host_.resizeWindow(session.id(), *finalSize);
    host_.centerWindow(session.id());
    session.contentSize = measured;
    session.outerSize   = *finalSize;

    spdlog::info("Window #{} auto-resized: content {}x{} -> window {}x{}",
                 session.id(), measured.width, measured.height,
                 finalSize->width, finalSize->height);
}

// ── Session teardown ─────────────────────────────────────────────────────

void DispatchLoop::expireSessions() {
    if (sessions_.empty()) return;

    auto now = steady_clock::now();
    std::vector<WindowId> expired;
    for (auto& [id, s] : sessions_) {
        auto deadline = s.request.deadline();
        if (deadline && *deadline <= now) expired.push_back(id);
    }

    for (auto id : expired) {
        const auto& s = sessions_.at(id);
        if (s.resizeStage() == AutoResizeController::Stage::MeasuringOversized)
            spdlog::warn("Window #{} timed out waiting for content measurement", id);

        Outcome o = Outcome::timeout(
            "UI request timed out after " +
            std::to_string(s.request.timeout.count()) + " seconds");
        o.windowClosed = true;
        finish(id, std::move(o), true);
    }
}

void DispatchLoop::finish(WindowId id, Outcome outcome, bool closeWindow) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        spdlog::debug("Outcome for unknown window #{} dropped", id);
        return;
    }

    WindowSession session = std::move(it->second);
    sessions_.erase(it);

    if (closeWindow) {
        try {
            host_.closeWindow(id);
        } catch (const std::exception& e) {
            spdlog::warn("Closing window #{} failed: {}", id, e.what());
        }
    }

    spdlog::info("Window #{} finished: {}", id, outcome.statusName());
    reply(session.request, std::move(outcome));
}

void DispatchLoop::reply(const UIRequest& request, Outcome outcome) {
    if (!request.reply->deliver(std::move(outcome)))
        spdlog::debug("Reply for #{} discarded — caller no longer waiting",
                      request.id);
}

milliseconds DispatchLoop::nextWait(milliseconds maxWait) const {
    milliseconds wait = maxWait;
    if (!sessions_.empty() || dashboardVisible_)
        wait = std::min(wait, config_.pumpInterval);

    auto now = steady_clock::now();
    for (auto& [id, s] : sessions_) {
        auto deadline = s.request.deadline();
        if (!deadline) continue;
        auto left = std::chrono::duration_cast<milliseconds>(*deadline - now);
        wait = std::min(wait, std::max(left, milliseconds(0)));
    }
    return wait;
}
