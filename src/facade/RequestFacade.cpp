#include "facade/RequestFacade.hpp"
#include "facade/CollectorPage.hpp"
#include "facade/ToolDocs.hpp"
#include "facade/ToolSchema.hpp"
#include <spdlog/spdlog.h>

using std::chrono::seconds;

namespace {

// Integer parameter already type-checked by ToolSchema. Values beyond
// long long (unsigned JSON numbers) are reported as out of range.
std::optional<long long> boundedInteger(const nlohmann::json& v,
                                        long long lo, long long hi) {
    if (v.is_number_unsigned()) {
        auto u = v.get<unsigned long long>();
        if (u > static_cast<unsigned long long>(hi)) return std::nullopt;
        return static_cast<long long>(u);
    }
    auto n = v.get<long long>();
    if (n < lo || n > hi) return std::nullopt;
    return n;
}

} // namespace

RequestFacade::RequestFacade(RequestMailbox& mailbox, ToolIdentity identity,
                             ISettingsStore* settings,
                             const FacadeConfig& config)
    : mailbox_(mailbox)
    , identity_(std::move(identity))
    , settings_(settings)
    , config_(config)
{
}

ToolResult RequestFacade::handle(const nlohmann::json& raw) {
    const nlohmann::json& input =
        (raw.is_object() && raw.contains("input") && raw["input"].is_object())
            ? raw["input"] : raw;

    try {
        if (!input.is_object())
            return invalid("Invalid input format. Expected an object with tool "
                           "parameters.", true);

        if (input.contains("operation") && input["operation"] == "readme")
            return readme();

        std::string presented;
        if (input.contains("tool_unlock_token") &&
            input["tool_unlock_token"].is_string())
            presented = input["tool_unlock_token"].get<std::string>();

        if (TokenValidator::validate(presented, identity_) !=
            TokenValidator::Result::Valid)
            return rejectToken(input);

        auto v = ToolSchema::validate(input);
        if (!v.valid) return invalid(v.error, v.withDocs);

        const auto& params = v.params;
        auto op = operationFromName(params["operation"].get<std::string>());
        if (!op) return invalid("Unknown operation", true);

        auto caller = TokenValidator::callerPart(presented);
        if (!caller.empty())
            spdlog::debug("user: {} on behalf of another tool", operationName(*op));

        switch (*op) {
            case OperationKind::Popup:
            case OperationKind::ModalDialog:
                return showWindow(params, *op);
            case OperationKind::PrebuiltCollector:
                return collectApiKey(params);
            case OperationKind::DiagnosticProbe:
                return probe(params);
            case OperationKind::Toast:
                return toast(params);
            case OperationKind::SendMessage:
            case OperationKind::CheckMessages:
            case OperationKind::ShowDashboard:
            case OperationKind::HideDashboard:
            case OperationKind::MessageHistory:
            case OperationKind::ClearMessages:
                return messaging(params, *op);
            case OperationKind::Introspection:
                return readme();
        }
        return invalid("Unhandled operation", true);
    } catch (const std::exception& e) {
        spdlog::error("user: request failed: {}", e.what());
        return ToolResult::failure(ToolResult::Kind::RenderHostError,
                                   std::string("Error in user interaction operation: ") +
                                   e.what());
    }
}

// ── Documentation and rejections ─────────────────────────────────────────

ToolResult RequestFacade::readme() const {
    spdlog::debug("user: readme");
    return ToolResult::plainText(ToolDocs::readmeText(token()));
}

ToolResult RequestFacade::rejectToken(const nlohmann::json& input) const {
    spdlog::warn("user: invalid or missing unlock token (operation '{}')",
                 input.value("operation", std::string("?")));
    return ToolResult::failure(
        ToolResult::Kind::TokenInvalid,
        "Invalid or missing tool_unlock_token: your context is missing the "
        "details below, which are needed to use this tool correctly:" +
        ToolDocs::readmeText(token()));
}

ToolResult RequestFacade::invalid(const std::string& error, bool withDocs) const {
    spdlog::warn("user: {}", error);
    return ToolResult::failure(ToolResult::Kind::ValidationError,
                               withDocs ? error + ToolDocs::readmeText(token())
                                        : error);
}

// ── Operations ───────────────────────────────────────────────────────────

ToolResult RequestFacade::showWindow(const nlohmann::json& params, OperationKind op) {
    std::string html = params.value("html", "");
    std::string url  = params.value("url", "");

    if (html.empty() && url.empty())
        return invalid("Missing required parameter: provide either 'html' or 'url'", true);
    if (!html.empty() && !url.empty())
        return invalid("Cannot specify both 'html' and 'url', choose one", true);

    auto width  = boundedInteger(params["width"], 1, maxWindowExtent);
    auto height = boundedInteger(params["height"], 1, maxWindowExtent);
    if (!width)
        return invalid("Parameter 'width' must be a positive integer no larger than " +
                       std::to_string(maxWindowExtent) + ", got " +
                       params["width"].dump() + ".", false);
    if (!height)
        return invalid("Parameter 'height' must be a positive integer no larger than " +
                       std::to_string(maxWindowExtent) + ", got " +
                       params["height"].dump() + ".", false);

    seconds timeout = config_.defaultTimeout;
    if (params.contains("timeout")) {
        auto t = boundedInteger(params["timeout"], 0, maxTimeoutSeconds);
        if (!t)
            return invalid("Parameter 'timeout' must be an integer between 0 and " +
                           std::to_string(maxTimeoutSeconds) + ", got " +
                           params["timeout"].dump() + ".", false);
        timeout = seconds(*t);
    }

    UIRequest req = makeRequest(op);
    req.content = html.empty() ? ContentSource::locator(url)
                               : ContentSource::markup(html);
    req.timeout = timeout;

    auto& h = req.hints;
    h.title          = params["title"].get<std::string>();
    h.width          = static_cast<int>(*width);
    h.height         = static_cast<int>(*height);
    h.modal          = op == OperationKind::Popup ? false : params.value("modal", true);
    h.resizable      = params["resizable"].get<bool>();
    h.alwaysOnTop    = params["always_on_top"].get<bool>();
    h.centerOnScreen = params["center_on_screen"].get<bool>();
    h.bringToFront   = params["bring_to_front"].get<bool>();
    h.autoResize     = params["auto_resize"].get<bool>();

    bool wait = params["wait_for_response"].get<bool>() && timeout.count() > 0;

    spdlog::info("user: {} ({}) {} '{}' {}x{} timeout={}s",
                 req.describe(), wait ? "sync" : "async",
                 h.modal ? "modal" : "non-modal", h.title, h.width, h.height,
                 timeout.count());

    auto channel = req.reply;
    if (auto rejected = submit(std::move(req))) return *rejected;

    if (!wait) {
        return ToolResult::ok({
            {"status",  "success"},
            {"message", "Window opened successfully (async mode - not waiting "
                        "for user response)"},
            {"async",   true}
        });
    }

    return awaitReply(*channel, timeout + config_.replyGrace, timeout);
}

ToolResult RequestFacade::collectApiKey(const nlohmann::json& params) {
    if (!settings_)
        return ToolResult::failure(ToolResult::Kind::RenderHostError,
                                   "No settings store configured - cannot save API keys");

    std::string service = params["service_name"].get<std::string>();
    if (service.empty())
        return invalid("Parameter 'service_name' must not be empty.", false);

    std::string keyName = CollectorPage::keyNameFor(service);

    UIRequest req = makeRequest(OperationKind::PrebuiltCollector);
    req.content = ContentSource::markup(
        CollectorPage::html(service, params["service_url"].get<std::string>()));
    req.timeout = config_.collectorTimeout;
    req.hints.title      = CollectorPage::title(service);
    req.hints.width      = CollectorPage::width;
    req.hints.height     = CollectorPage::height;
    req.hints.modal      = true;
    req.hints.autoResize = false;

    spdlog::info("user: collecting {} for '{}'", keyName, service);

    auto channel = req.reply;
    if (auto rejected = submit(std::move(req))) return *rejected;

    auto result = awaitReply(*channel, config_.collectorTimeout + config_.replyGrace,
                             config_.collectorTimeout);
    if (result.kind != ToolResult::Kind::Ok) return result;

    const auto& data = result.body.contains("data") ? result.body["data"]
                                                    : nlohmann::json();
    if (!data.is_object() || !data.contains("api_key") ||
        !data["api_key"].is_string() || data["api_key"].get<std::string>().empty()) {
        return ToolResult::withStatus(ToolResult::Kind::RenderHostError, {
            {"status", "error"},
            {"error",  "Collector window closed without an api_key"}
        });
    }

    if (!settings_->setApiKey(keyName, data["api_key"].get<std::string>())) {
        return ToolResult::withStatus(ToolResult::Kind::RenderHostError, {
            {"status", "error"},
            {"error",  "Could not save " + keyName + " to the settings store"}
        });
    }

    return ToolResult::ok({
        {"status",  "success"},
        {"message", "API key saved"},
        {"data", {
            {"service",  service},
            {"key_name", keyName},
            {"saved",    true}
        }}
    });
}

ToolResult RequestFacade::probe(const nlohmann::json& params) {
    UIRequest req = makeRequest(OperationKind::DiagnosticProbe);
    req.payload = {{"message", params.value("message", "Hello from uibridge")}};

    auto started = std::chrono::steady_clock::now();
    auto channel = req.reply;
    if (auto rejected = submit(std::move(req))) return *rejected;

    auto result = awaitReply(*channel, config_.probeTimeout, config_.probeTimeout);
    if (result.body.is_object()) {
        result.body["round_trip_ms"] =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
    }
    return result;
}

ToolResult RequestFacade::toast(const nlohmann::json& params) {
    std::string message = params.value("message", "");
    if (message.empty())
        return invalid("Missing required parameter: 'message' is required for "
                       "show_toast", true);

    UIRequest req = makeRequest(OperationKind::Toast);
    req.payload = {{"message", message}, {"level", params["level"]}};

    auto channel = req.reply;
    if (auto rejected = submit(std::move(req))) return *rejected;
    return awaitReply(*channel, config_.messagingTimeout, config_.messagingTimeout);
}

ToolResult RequestFacade::messaging(const nlohmann::json& params, OperationKind op) {
    if (op == OperationKind::SendMessage && params.value("content", "").empty())
        return invalid("Missing required parameter: content", false);

    UIRequest req = makeRequest(op);
    req.payload = params;
    req.payload.erase("tool_unlock_token");
    req.payload.erase("operation");

    auto channel = req.reply;
    if (auto rejected = submit(std::move(req))) return *rejected;
    return awaitReply(*channel, config_.messagingTimeout, config_.messagingTimeout);
}

// ── Mailbox handoff ──────────────────────────────────────────────────────

UIRequest RequestFacade::makeRequest(OperationKind op) {
    UIRequest req;
    req.id        = nextId_++;
    req.operation = op;
    req.created   = std::chrono::steady_clock::now();
    return req;
}

std::optional<ToolResult> RequestFacade::submit(UIRequest request) {
    auto id = request.id;
    auto op = request.operation;

    if (mailbox_.enqueue(std::move(request)) ==
        RequestMailbox::EnqueueStatus::Accepted)
        return std::nullopt;

    spdlog::error("user: #{} {} rejected, no UI dispatch loop attached",
                  id, operationName(op));
    return ToolResult::withStatus(ToolResult::Kind::QueueUnavailable, {
        {"status", "error"},
        {"error",  "No UI request queue available - the UI dispatch loop is "
                   "not running"}
    });
}

ToolResult RequestFacade::awaitReply(ReplyChannel& channel, seconds wait,
                                     seconds reportedTimeout) {
    auto r = channel.await(std::chrono::duration_cast<std::chrono::milliseconds>(wait));

    switch (r.status) {
        case ReplyChannel::AwaitStatus::Delivered:
            return fromOutcome(*r.outcome);
        case ReplyChannel::AwaitStatus::TimedOut:
            spdlog::warn("user: gave up waiting after {}s", wait.count());
            return ToolResult::withStatus(ToolResult::Kind::Timeout, {
                {"status", "timeout"},
                {"error",  "UI request timed out after " +
                           std::to_string(reportedTimeout.count()) + " seconds"}
            });
        case ReplyChannel::AwaitStatus::NotAwaited:
        case ReplyChannel::AwaitStatus::Consumed:
            break;
    }
    return ToolResult::withStatus(ToolResult::Kind::RenderHostError, {
        {"status", "error"},
        {"error",  "Reply channel was not awaitable"}
    });
}

ToolResult RequestFacade::fromOutcome(const Outcome& outcome) {
    auto kind = std::visit(Overloaded{
        [](const Outcome::Success&)   { return ToolResult::Kind::Ok; },
        [](const Outcome::Cancelled&) { return ToolResult::Kind::UserCancelled; },
        [](const Outcome::Timeout&)   { return ToolResult::Kind::Timeout; },
        [](const Outcome::Error&)     { return ToolResult::Kind::RenderHostError; },
    }, outcome.value);

    spdlog::info("user: outcome {}", outcome.statusName());
    return ToolResult::withStatus(kind, outcome.toResponseJson());
}
