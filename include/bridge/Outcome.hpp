#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

// Result of one UI request, written once into its ReplyChannel.
// Consumers match exhaustively with std::visit.
struct Outcome {
    struct Success {
        nlohmann::json data;       // null when the content reported no data
        std::string    message;
    };
    struct Cancelled {
        std::string reason;
    };
    struct Timeout {
        std::string detail;
    };
    struct Error {
        std::string detail;
    };

    std::variant<Success, Cancelled, Timeout, Error> value;
    bool windowClosed = false;   // outcome produced by a window closing

    static Outcome success(nlohmann::json data = nullptr,
                           std::string message = "") {
        return {Success{std::move(data), std::move(message)}};
    }
    static Outcome cancelled(std::string reason = "") {
        return {Cancelled{std::move(reason)}};
    }
    static Outcome timeout(std::string detail) {
        return {Timeout{std::move(detail)}};
    }
    static Outcome error(std::string detail) {
        return {Error{std::move(detail)}};
    }

    bool isSuccess() const   { return std::holds_alternative<Success>(value); }
    bool isCancelled() const { return std::holds_alternative<Cancelled>(value); }
    bool isTimeout() const   { return std::holds_alternative<Timeout>(value); }
    bool isError() const     { return std::holds_alternative<Error>(value); }

    std::string statusName() const {
        return std::visit(Overloaded{
            [](const Success&)   { return std::string("success"); },
            [](const Cancelled&) { return std::string("cancelled"); },
            [](const Timeout&)   { return std::string("timeout"); },
            [](const Error&)     { return std::string("error"); },
        }, value);
    }

    // Caller-facing response object:
    // {status, data?, message?, error?, window_closed?}
    nlohmann::json toResponseJson() const {
        nlohmann::json j = {{"status", statusName()}};
        std::visit(Overloaded{
            [&](const Success& s) {
                if (!s.data.is_null())   j["data"] = s.data;
                if (!s.message.empty())  j["message"] = s.message;
            },
            [&](const Cancelled& c) {
                if (!c.reason.empty())   j["message"] = c.reason;
            },
            [&](const Timeout& t) {
                j["error"] = t.detail;
            },
            [&](const Error& e) {
                j["error"] = e.detail;
            },
        }, value);
        if (windowClosed) j["window_closed"] = true;
        return j;
    }

    // Maps the value the hosted content left in the well-known
    // window.userResponse global when its window closed.
    // No value at close time means the user dismissed the window.
    static Outcome fromWindowResponse(
        const std::optional<nlohmann::json>& response)
    {
        Outcome o = cancelled("Window closed without a response");
        o.windowClosed = true;
        if (!response || response->is_null()) return o;

        if (!response->is_object()) {
            o.value = Error{"Window response must be an object"};
            return o;
        }

        const auto& r = *response;
        std::string status;
        if (r.contains("status") && r["status"].is_string())
            status = r["status"].get<std::string>();

        auto text = [&r](const char* key) {
            if (r.contains(key) && r[key].is_string())
                return r[key].get<std::string>();
            return std::string();
        };

        if (status == "success") {
            nlohmann::json data = r.contains("data") ? r["data"]
                                                     : nlohmann::json();
            // Content that reports extra top-level fields (e.g. "service")
            // keeps them under data.
            if (data.is_null()) {
                nlohmann::json extra = nlohmann::json::object();
                for (auto it = r.begin(); it != r.end(); ++it) {
                    if (it.key() != "status" && it.key() != "message")
                        extra[it.key()] = it.value();
                }
                if (!extra.empty()) data = extra;
            }
            o.value = Success{data, text("message")};
        } else if (status == "cancelled") {
            std::string reason = text("message");
            o.value = Cancelled{reason.empty() ? "User cancelled" : reason};
        } else if (status == "error") {
            std::string detail = text("error");
            if (detail.empty()) detail = text("message");
            o.value = Error{detail.empty() ? "Window reported an error"
                                           : detail};
        } else {
            o.value = Error{"Unrecognised window response status '" +
                            status + "'"};
        }
        return o;
    }
};
