#pragma once
#include <string>

// Prebuilt page for the collect_api_key operation.
// The page reports {"status":"success","data":{"api_key":...}} through
// window.userResponse; the facade stores the key, the page never does.
class CollectorPage {
public:
    static constexpr int width  = 550;
    static constexpr int height = 450;

    // "Open AI" -> "OPEN_AI_API_KEY", "my-svc" -> "MY_SVC_API_KEY"
    static std::string keyNameFor(const std::string& serviceName);

    static std::string title(const std::string& serviceName);

    static std::string html(const std::string& serviceName,
                            const std::string& serviceUrl);

    static std::string escapeHtml(const std::string& text);
};
