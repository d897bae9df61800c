#pragma once
#include "ToolResult.hpp"
#include "bridge/RequestMailbox.hpp"
#include "settings/ISettingsStore.hpp"
#include "token/TokenValidator.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <optional>

struct FacadeConfig {
    std::chrono::seconds replyGrace{5};         // caller waits window timeout + this
    std::chrono::seconds probeTimeout{10};      // test_queue
    std::chrono::seconds messagingTimeout{5};   // toast and dashboard operations
    std::chrono::seconds collectorTimeout{300}; // collect_api_key window
    std::chrono::seconds defaultTimeout{60};    // window ops without a timeout
};

// Entry point for callers on any thread. Checks the token, validates the
// parameters, builds a UIRequest, hands it to the mailbox and waits on its
// reply channel. Nothing reaches the mailbox unless it passed validation.
class RequestFacade {
public:
    // Upper bounds on caller-supplied sizes and timeouts. The auto-resize
    // path doubles the height, and deadlines are steady_clock arithmetic.
    static constexpr long long maxWindowExtent = 32768;
    static constexpr long long maxTimeoutSeconds = 86400LL * 365;

    RequestFacade(RequestMailbox& mailbox, ToolIdentity identity,
                  ISettingsStore* settings = nullptr,
                  const FacadeConfig& config = {});

    // Accepts either {"input": {...}} or the bare parameter object
    ToolResult handle(const nlohmann::json& input);

    // Current direct token, for the readme and startup log
    std::string token() const { return TokenValidator::expectedToken(identity_); }

    uint64_t requestsIssued() const { return nextId_ - 1; }

private:
    ToolResult readme() const;
    ToolResult rejectToken(const nlohmann::json& input) const;
    ToolResult invalid(const std::string& error, bool withDocs) const;

    ToolResult showWindow(const nlohmann::json& params, OperationKind op);
    ToolResult collectApiKey(const nlohmann::json& params);
    ToolResult probe(const nlohmann::json& params);
    ToolResult toast(const nlohmann::json& params);
    ToolResult messaging(const nlohmann::json& params, OperationKind op);

    UIRequest makeRequest(OperationKind op);

    // Hand off to the mailbox; set when the loop is not attached
    std::optional<ToolResult> submit(UIRequest request);
    ToolResult awaitReply(ReplyChannel& channel, std::chrono::seconds wait,
                          std::chrono::seconds reportedTimeout);

    static ToolResult fromOutcome(const Outcome& outcome);

    RequestMailbox&       mailbox_;
    ToolIdentity          identity_;
    ISettingsStore*       settings_;
    FacadeConfig          config_;
    std::atomic<uint64_t> nextId_{1};
};
