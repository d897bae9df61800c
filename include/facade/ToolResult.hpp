#pragma once
#include <nlohmann/json.hpp>
#include <string>

// What the facade hands back to its caller. Never thrown; every failure
// mode ends up here.
struct ToolResult {
    enum class Kind {
        Ok,
        ValidationError,
        TokenInvalid,       // text carries the usage documentation
        QueueUnavailable,   // no dispatch loop attached
        Timeout,
        RenderHostError,
        UserCancelled
    };

    Kind           kind = Kind::Ok;
    nlohmann::json body;           // structured response, null for plain text
    std::string    text;           // text sent back when body is null
    bool           isError = false;

    static ToolResult ok(nlohmann::json body) {
        return {Kind::Ok, std::move(body), "", false};
    }
    static ToolResult withStatus(Kind kind, nlohmann::json body) {
        return {kind, std::move(body), "", false};
    }
    static ToolResult failure(Kind kind, std::string text) {
        return {kind, nullptr, std::move(text), true};
    }
    static ToolResult plainText(std::string text) {
        return {Kind::Ok, nullptr, std::move(text), false};
    }

    // Pretty-printed body, or the plain text
    std::string renderText() const {
        return body.is_null() ? text : body.dump(2);
    }

    // MCP tool-call envelope
    nlohmann::json toJson() const {
        return {
            {"content", nlohmann::json::array({
                {{"type", "text"}, {"text", renderText()}}
            })},
            {"isError", isError}
        };
    }
};

inline const char* kindName(ToolResult::Kind k) {
    switch (k) {
        case ToolResult::Kind::Ok:               return "ok";
        case ToolResult::Kind::ValidationError:  return "validation_error";
        case ToolResult::Kind::TokenInvalid:     return "token_invalid";
        case ToolResult::Kind::QueueUnavailable: return "queue_unavailable";
        case ToolResult::Kind::Timeout:          return "timeout";
        case ToolResult::Kind::RenderHostError:  return "render_host_error";
        case ToolResult::Kind::UserCancelled:    return "user_cancelled";
    }
    return "unknown";
}
