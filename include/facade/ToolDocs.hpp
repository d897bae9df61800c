#pragma once
#include <nlohmann/json.hpp>
#include <string>

// Usage documentation for the `user` tool. The long form is returned by the
// readme operation and whenever a call arrives without a valid token.
class ToolDocs {
public:
    // One-paragraph description shown in the tool listing
    static std::string shortDescription();

    // Full usage guide with the caller's unlock token embedded
    static std::string usageGuide(const std::string& token);

    // {"description": usageGuide, "parameters": schema}
    static nlohmann::json readmePayload(const std::string& token);

    // Text appended to responses: "\n\n" + pretty-printed readmePayload
    static std::string readmeText(const std::string& token);
};
