#include "server/ToolServer.hpp"
#include "facade/ToolDocs.hpp"
#include "facade/ToolSchema.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>

static void sendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

static nlohmann::json parseJsonBody(const std::string& body) {
    return nlohmann::json::parse(body, nullptr, false);
}

ToolServer::ToolServer(RequestFacade& facade, RequestMailbox& mailbox,
                       std::string renderHostName)
    : facade_(facade)
    , mailbox_(mailbox)
    , renderHostName_(std::move(renderHostName))
    , server_(std::make_unique<httplib::Server>())
{
    registerRoutes();
}

ToolServer::~ToolServer() {
    stop();
}

// ── Lifecycle ────────────────────────────────────────────────────────────

bool ToolServer::start(const std::string& host, int port) {
    if (running_) return true;

    if (port == 0) {
        boundPort_ = server_->bind_to_any_port(host);
        if (boundPort_ < 0) boundPort_ = 0;
    } else if (server_->bind_to_port(host, port)) {
        boundPort_ = port;
    }

    if (boundPort_ == 0) {
        spdlog::error("Tool server: cannot bind {}:{}", host, port);
        return false;
    }

    running_ = true;
    listenThread_ = std::thread([this] {
        if (!server_->listen_after_bind())
            spdlog::warn("Tool server: listener exited with an error");
        running_ = false;
    });

    spdlog::info("Tool server listening on http://{}:{}", host, boundPort_);
    return true;
}

void ToolServer::stop() {
    if (server_) server_->stop();
    if (listenThread_.joinable()) listenThread_.join();
    running_ = false;
}

// ── Routes ───────────────────────────────────────────────────────────────

void ToolServer::registerRoutes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, health());
    });

    server_->Get("/tools", [](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, toolListing());
    });

    server_->Post("/tools/user", [this](const httplib::Request& req,
                                        httplib::Response& res) {
        int status = 200;
        auto body = callTool(req.body, status);
        sendJson(res, status, body);
    });

    server_->set_exception_handler([](const httplib::Request& req,
                                      httplib::Response& res,
                                      std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        spdlog::error("Tool server: {} {} failed: {}", req.method, req.path, what);
        ToolResult r = ToolResult::failure(ToolResult::Kind::RenderHostError,
                                           "Internal error: " + what);
        sendJson(res, 500, r.toJson());
    });
}

nlohmann::json ToolServer::health() const {
    return {
        {"status",          "ok"},
        {"render_host",     renderHostName_},
        {"queued_requests", mailbox_.size()},
        {"consumer",        mailbox_.hasConsumer()}
    };
}

nlohmann::json ToolServer::toolListing() {
    return {
        {"tools", nlohmann::json::array({
            {
                {"name",        ToolSchema::toolName},
                {"description", ToolDocs::shortDescription()},
                {"parameters",  ToolSchema::listingParameters()}
            }
        })}
    };
}

nlohmann::json ToolServer::callTool(const std::string& body, int& status) {
    auto j = parseJsonBody(body);
    if (j.is_discarded()) {
        spdlog::warn("Tool server: malformed JSON body ({} bytes)", body.size());
        status = 400;
        return ToolResult::failure(ToolResult::Kind::ValidationError,
                                   "Request body is not valid JSON").toJson();
    }

    auto result = facade_.handle(j);
    spdlog::debug("Tool server: user -> {}", kindName(result.kind));
    status = 200;
    return result.toJson();
}
