#include "facade/ToolDocs.hpp"
#include "facade/ToolSchema.hpp"

std::string ToolDocs::shortDescription() {
    return "Show HTML windows to the user and get their answer back: forms, "
           "confirmations, API key entry, rich content, toasts and a two-way "
           "message dashboard.\n"
           "Call with {\"input\":{\"operation\":\"readme\"}} first for the "
           "full documentation.\n";
}

std::string ToolDocs::usageGuide(const std::string& token) {
    std::string doc = R"(
Show HTML windows on the user's desktop and return what the user did.

Every window is opened by one UI thread. Calls from any thread are queued,
served in order, and answered exactly once.

## Unlock token
Each call must carry tool_unlock_token. The token is derived (HMAC) from
this installation, the user account and the tool version, so it changes
when any of them does.

Your tool_unlock_token is: )" + token + R"(

A tool calling on behalf of another tool may send "-<its token>-<this token>".

## Operations

### show_popup
Non-modal window. Other windows stay usable.

### show_dialog
Modal window (modal defaults to true).

### collect_api_key
Ready-made form that asks the user for an API key for service_name and
saves it in the local settings store under <SERVICE_NAME>_API_KEY.
The key itself is never returned to you.

### show_toast
Short notification. Needs message; level is info, warning, error or success.

### send_message / check_messages
Two-way message dashboard that does not block you. send_message posts to
the user (content required). check_messages returns new replies the user
typed into the dashboard.

### show_dashboard / hide_dashboard / get_message_history / clear_messages
Dashboard visibility, full history in both directions, and reset.

### test_queue
Round trip through the UI queue with no window. Echoes message back with
the UI thread id and queue depth.

### readme
This document. No token needed.

## Window parameters
- html or url (exactly one): the document to show
- title (default "User Interface")
- width, height (defaults 600 x 400): content area in pixels
- timeout: seconds until the window is closed and "timeout" is reported.
  Defaults to 60. 0 opens the window and returns immediately.
- wait_for_response (default true): false returns immediately
- modal, resizable, always_on_top, center_on_screen, bring_to_front
- auto_resize (default false): open tall, measure the content, then shrink
  the window to fit. Content that sizes itself from the viewport height
  (100vh layouts) does not settle; give those an explicit height instead.

## Window size
The window frame adds 16 px to the width and 39 px to the height you ask
for. The content area gets exactly width x height. Ask for more height
than you think you need; scrollbars look broken.

## Returning data from the window
Before the window closes, set the global window.userResponse:

    window.userResponse = {"status": "success", "data": {"choice": "yes"}};
    window.userResponse = {"status": "cancelled", "message": "User declined"};
    window.userResponse = {"status": "error", "error": "Details"};

Closing the window without setting it reports "cancelled".

## Responses
{"status": "success" | "cancelled" | "timeout" | "error",
 "data": ..., "message": ..., "error": ..., "window_closed": true,
 "async": true (when you did not wait)}
)";
    return doc;
}

nlohmann::json ToolDocs::readmePayload(const std::string& token) {
    return {
        {"description", usageGuide(token)},
        {"parameters",  ToolSchema::toJson(token)}
    };
}

std::string ToolDocs::readmeText(const std::string& token) {
    return "\n\n" + readmePayload(token).dump(2);
}
