#pragma once
#include "ReplyChannel.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Every tool operation maps to one of these
enum class OperationKind {
    Popup,              // show_popup, non-modal window
    ModalDialog,        // show_dialog
    PrebuiltCollector,  // collect_api_key
    Introspection,      // readme: answered by the facade, never enqueued
    DiagnosticProbe,    // test_queue: round trip through the mailbox
    Toast,              // show_toast
    SendMessage,        // send_message
    CheckMessages,      // check_messages
    ShowDashboard,
    HideDashboard,
    MessageHistory,     // get_message_history
    ClearMessages
};

inline const char* operationName(OperationKind op) {
    switch (op) {
        case OperationKind::Popup:             return "show_popup";
        case OperationKind::ModalDialog:       return "show_dialog";
        case OperationKind::PrebuiltCollector: return "collect_api_key";
        case OperationKind::Introspection:     return "readme";
        case OperationKind::DiagnosticProbe:   return "test_queue";
        case OperationKind::Toast:             return "show_toast";
        case OperationKind::SendMessage:       return "send_message";
        case OperationKind::CheckMessages:     return "check_messages";
        case OperationKind::ShowDashboard:     return "show_dashboard";
        case OperationKind::HideDashboard:     return "hide_dashboard";
        case OperationKind::MessageHistory:    return "get_message_history";
        case OperationKind::ClearMessages:     return "clear_messages";
    }
    return "unknown";
}

inline std::optional<OperationKind> operationFromName(const std::string& s) {
    if (s == "show_popup")          return OperationKind::Popup;
    if (s == "show_dialog")         return OperationKind::ModalDialog;
    if (s == "collect_api_key")     return OperationKind::PrebuiltCollector;
    if (s == "readme")              return OperationKind::Introspection;
    if (s == "test_queue")          return OperationKind::DiagnosticProbe;
    if (s == "show_toast")          return OperationKind::Toast;
    if (s == "send_message")        return OperationKind::SendMessage;
    if (s == "check_messages")      return OperationKind::CheckMessages;
    if (s == "show_dashboard")      return OperationKind::ShowDashboard;
    if (s == "hide_dashboard")      return OperationKind::HideDashboard;
    if (s == "get_message_history") return OperationKind::MessageHistory;
    if (s == "clear_messages")      return OperationKind::ClearMessages;
    return std::nullopt;
}

// Operations that materialise a window on the render host
inline bool opensWindow(OperationKind op) {
    return op == OperationKind::Popup ||
           op == OperationKind::ModalDialog ||
           op == OperationKind::PrebuiltCollector;
}

struct ContentSource {
    enum class Kind { InlineMarkup, RemoteLocator } kind = Kind::InlineMarkup;
    std::string value;     // markup text or URL

    static ContentSource markup(std::string html) {
        return {Kind::InlineMarkup, std::move(html)};
    }
    static ContentSource locator(std::string url) {
        return {Kind::RemoteLocator, std::move(url)};
    }

    // For logs; never the content itself
    std::string describe() const {
        if (kind == Kind::RemoteLocator) return "URL=" + value;
        return "HTML=" + std::to_string(value.size()) + " chars";
    }
};

struct WindowHints {
    std::string title       = "User Interface";
    int  width              = 600;    // content area, excluding chrome
    int  height             = 400;
    bool resizable          = false;
    bool alwaysOnTop        = true;
    bool modal              = true;
    bool autoResize         = false;
    bool centerOnScreen     = true;
    bool bringToFront       = true;   // best-effort only
};

// Envelope carried by the RequestMailbox. Not modified after enqueue.
struct UIRequest {
    uint64_t                              id = 0;
    OperationKind                         operation = OperationKind::Popup;
    std::optional<ContentSource>          content;    // window operations
    WindowHints                           hints;
    std::chrono::seconds                  timeout{0}; // 0 = no window deadline
    std::chrono::steady_clock::time_point created = std::chrono::steady_clock::now();
    nlohmann::json                        payload;    // operation-specific fields
    std::shared_ptr<ReplyChannel>         reply = std::make_shared<ReplyChannel>();

    std::optional<std::chrono::steady_clock::time_point> deadline() const {
        if (timeout.count() <= 0) return std::nullopt;
        return created + timeout;
    }

    std::string describe() const {
        std::string d = "#" + std::to_string(id) + " " + operationName(operation);
        if (content) d += " " + content->describe();
        return d;
    }
};
