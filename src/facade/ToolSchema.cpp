#include "facade/ToolSchema.hpp"
#include "bridge/UIRequest.hpp"
#include <algorithm>

namespace {

std::string joinSorted(std::vector<std::string> names) {
    std::sort(names.begin(), names.end());
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

std::string joinQuoted(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += "'" + values[i] + "'";
    }
    return out + "]";
}

bool matchesType(const nlohmann::json& v, ToolSchema::ParamType t) {
    switch (t) {
        case ToolSchema::ParamType::String:  return v.is_string();
        case ToolSchema::ParamType::Integer: return v.is_number_integer();
        case ToolSchema::ParamType::Number:  return v.is_number();
        case ToolSchema::ParamType::Boolean: return v.is_boolean();
        case ToolSchema::ParamType::Object:  return v.is_object();
    }
    return false;
}

std::string article(ToolSchema::ParamType t) {
    return t == ToolSchema::ParamType::Integer || t == ToolSchema::ParamType::Object
        ? "an " : "a ";
}

} // namespace

const char* ToolSchema::typeName(ParamType t) {
    switch (t) {
        case ParamType::String:  return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number:  return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::Object:  return "object";
    }
    return "unknown";
}

std::vector<std::string> ToolSchema::operationNames() {
    static const OperationKind all[] = {
        OperationKind::Introspection,   OperationKind::Popup,
        OperationKind::ModalDialog,     OperationKind::DiagnosticProbe,
        OperationKind::PrebuiltCollector, OperationKind::Toast,
        OperationKind::SendMessage,     OperationKind::CheckMessages,
        OperationKind::ShowDashboard,   OperationKind::HideDashboard,
        OperationKind::MessageHistory,  OperationKind::ClearMessages
    };
    std::vector<std::string> names;
    for (auto op : all) names.push_back(operationName(op));
    return names;
}

const std::vector<ToolSchema::Param>& ToolSchema::parameters() {
    using T = ParamType;
    static const std::vector<Param> params = {
        {"operation", T::String, "Operation to perform", nullptr, operationNames()},

        // Windows
        {"html",  T::String, "HTML document to show in the window (use either html or url)", nullptr, {}},
        {"url",   T::String, "URL to load in the window (use either html or url)", nullptr, {}},
        {"title", T::String, "Window title", "User Interface", {}},
        {"width", T::Integer, "Content width in pixels, chrome excluded", 600, {}},
        {"height", T::Integer, "Content height in pixels, chrome excluded", 400, {}},
        {"modal", T::Boolean, "Block other windows until this one closes (show_dialog)", nullptr, {}},
        {"timeout", T::Integer,
         "Seconds before the window is closed and a timeout reported. 0 = open it and return at once", nullptr, {}},
        {"wait_for_response", T::Boolean,
         "Wait for the window to close before returning. false = fire-and-forget", true, {}},
        {"resizable", T::Boolean, "Let the user resize the window", false, {}},
        {"always_on_top", T::Boolean, "Keep the window above other windows", true, {}},
        {"center_on_screen", T::Boolean, "Center the window on screen", true, {}},
        {"bring_to_front", T::Boolean, "Try to raise the window (the platform may refuse)", true, {}},
        {"auto_resize", T::Boolean, "Shrink the window to fit its content after it renders", false, {}},

        // Probe and toast share `message`
        {"message", T::String, "Toast text (show_toast) or echo text (test_queue)", nullptr, {}},
        {"level", T::String, "Toast severity (show_toast)", "info",
         {"info", "warning", "error", "success"}},

        // API key collector
        {"service_name", T::String, "Service the API key is for (collect_api_key)", "API Service", {}},
        {"service_url", T::String, "Where the user can get a key (collect_api_key)", "", {}},

        // Messaging dashboard
        {"content", T::String, "Message text (send_message)", nullptr, {}},
        {"msg_type", T::String, "Message type (send_message)", "status",
         {"question", "status", "notification", "response"}},
        {"priority", T::String, "Message priority (send_message)", "normal",
         {"low", "normal", "high", "critical"}},
        {"requires_response", T::Boolean, "Ask the user to reply (send_message)", false, {}},
        {"show_dashboard", T::Boolean, "Show the dashboard if hidden (send_message)", true, {}},
        {"mark_as_read", T::Boolean, "Mark returned messages read (check_messages)", true, {}},
        {"filter_type", T::String, "Only messages of this type (check_messages)", nullptr, {}},
        {"since_timestamp", T::Number, "Only messages after this epoch time (check_messages)", nullptr, {}},

        {"tool_unlock_token", T::String, "Security token from the readme operation", nullptr, {}},
    };
    return params;
}

ToolSchema::ValidationResult ToolSchema::validate(const nlohmann::json& input) {
    ValidationResult r;

    if (!input.is_object()) {
        r.error = "Invalid input format. Expected an object with tool parameters.";
        r.withDocs = true;
        return r;
    }

    const auto& params = parameters();

    std::vector<std::string> expected;
    for (auto& p : params) expected.push_back(p.name);

    std::vector<std::string> unexpected;
    for (auto it = input.begin(); it != input.end(); ++it) {
        if (std::find(expected.begin(), expected.end(), it.key()) == expected.end())
            unexpected.push_back(it.key());
    }
    if (!unexpected.empty()) {
        r.error = "Unexpected parameters provided: " + joinSorted(unexpected) +
                  ". Expected parameters are: " + joinSorted(expected) + ".";
        r.withDocs = true;
        return r;
    }

    std::vector<std::string> required = {"operation"};
    bool isReadme = input.contains("operation") &&
                    input["operation"].is_string() &&
                    input["operation"].get<std::string>() == "readme";
    if (!isReadme) required.push_back("tool_unlock_token");

    std::vector<std::string> missing;
    for (auto& name : required)
        if (!input.contains(name)) missing.push_back(name);
    if (!missing.empty()) {
        r.error = "Missing required parameters: " + joinSorted(missing) +
                  ". Required parameters are: " + joinSorted(required) + ".";
        r.withDocs = true;
        return r;
    }

    nlohmann::json out = nlohmann::json::object();
    for (auto& p : params) {
        auto it = input.find(p.name);
        if (it == input.end()) {
            if (!p.defaultValue.is_null()) out[p.name] = p.defaultValue;
            continue;
        }

        if (!matchesType(*it, p.type)) {
            r.error = "Parameter '" + p.name + "' must be " + article(p.type) +
                      typeName(p.type) + ", got " + it->type_name() + ".";
            return r;
        }

        if (!p.allowed.empty()) {
            auto v = it->get<std::string>();
            if (std::find(p.allowed.begin(), p.allowed.end(), v) == p.allowed.end()) {
                r.error = "Parameter '" + p.name + "' must be one of " +
                          joinQuoted(p.allowed) + ", got '" + v + "'.";
                r.withDocs = true;
                return r;
            }
        }

        out[p.name] = *it;
    }

    r.valid  = true;
    r.params = std::move(out);
    return r;
}

nlohmann::json ToolSchema::toJson(const std::string& token) {
    nlohmann::json props = nlohmann::json::object();
    for (auto& p : parameters()) {
        nlohmann::json j = {
            {"type",        typeName(p.type)},
            {"description", p.description}
        };
        if (p.name == "tool_unlock_token")
            j["description"] = "Security token, " + token +
                ", from the readme operation. Send it again whenever context was lost";
        if (!p.defaultValue.is_null()) j["default"] = p.defaultValue;
        if (!p.allowed.empty())        j["enum"] = p.allowed;
        props[p.name] = std::move(j);
    }

    return {
        {"type",       "object"},
        {"properties", props},
        {"required",   nlohmann::json::array({"operation", "tool_unlock_token"})}
    };
}

nlohmann::json ToolSchema::listingParameters() {
    return {
        {"type", "object"},
        {"properties", {
            {"input", {
                {"type", "object"},
                {"description",
                 "All parameters go in this one object. Call with "
                 "{\"input\":{\"operation\":\"readme\"}} for the full "
                 "documentation, parameter list and unlock token."}
            }}
        }},
        {"required", nlohmann::json::array()}
    };
}
