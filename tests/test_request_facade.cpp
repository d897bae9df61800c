#include <gtest/gtest.h>
#include "FakeRenderHost.hpp"
#include "dispatch/DispatchLoop.hpp"
#include "facade/CollectorPage.hpp"
#include "facade/RequestFacade.hpp"
#include "settings/JsonSettingsStore.hpp"
#include <filesystem>
#include <future>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;
using std::chrono::steady_clock;

static ToolIdentity facadeIdentity() {
    return {"0a1b2c3d4e5f60718293a4b5c6d7e8f9:user", "tester", "0.1.0"};
}

// Facade with no dispatch loop attached: everything that reaches the
// mailbox is rejected.
class RequestFacadeTest : public ::testing::Test {
protected:
    RequestMailbox mailbox_;
    RequestFacade  facade_{mailbox_, facadeIdentity()};
    std::string    token_ = TokenValidator::expectedToken(facadeIdentity());

    json withToken(json params) const {
        params["tool_unlock_token"] = token_;
        return params;
    }
};

TEST_F(RequestFacadeTest, ReadmeNeedsNoToken) {
    auto r = facade_.handle({{"operation", "readme"}});

    EXPECT_EQ(r.kind, ToolResult::Kind::Ok);
    EXPECT_FALSE(r.isError);
    EXPECT_NE(r.text.find(token_), std::string::npos);
    EXPECT_NE(r.text.find("tool_unlock_token"), std::string::npos);
}

TEST_F(RequestFacadeTest, InputWrapperAccepted) {
    auto r = facade_.handle({{"input", {{"operation", "readme"}}}});
    EXPECT_EQ(r.kind, ToolResult::Kind::Ok);
    EXPECT_NE(r.text.find(token_), std::string::npos);
}

TEST_F(RequestFacadeTest, MissingTokenReturnsDocumentation) {
    auto r = facade_.handle({{"operation", "show_dialog"}, {"html", "<p>x</p>"}});

    EXPECT_EQ(r.kind, ToolResult::Kind::TokenInvalid);
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(r.text.rfind("Invalid or missing tool_unlock_token", 0), 0u);
    EXPECT_NE(r.text.find(token_), std::string::npos);
    EXPECT_EQ(mailbox_.size(), 0u);
}

TEST_F(RequestFacadeTest, WrongTokenRejected) {
    auto r = facade_.handle({{"operation", "test_queue"},
                             {"tool_unlock_token", "000000000000000000000000"}});
    EXPECT_EQ(r.kind, ToolResult::Kind::TokenInvalid);
}

TEST_F(RequestFacadeTest, NonObjectInputRejectedWithDocs) {
    auto r = facade_.handle(json::array({1, 2, 3}));
    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
    EXPECT_TRUE(r.isError);
    EXPECT_NE(r.text.find(token_), std::string::npos);
}

TEST_F(RequestFacadeTest, UnexpectedParameterRejectedWithDocs) {
    auto r = facade_.handle(withToken({{"operation", "show_popup"},
                                       {"html", "<p>x</p>"},
                                       {"colour", "red"}}));

    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
    EXPECT_NE(r.text.find("Unexpected parameters provided: colour"), std::string::npos);
    EXPECT_NE(r.text.find(token_), std::string::npos);
}

TEST_F(RequestFacadeTest, WrongTypeRejectedWithoutDocs) {
    auto r = facade_.handle(withToken({{"operation", "show_popup"},
                                       {"html", "<p>x</p>"},
                                       {"width", "wide"}}));

    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
    EXPECT_EQ(r.text, "Parameter 'width' must be an integer, got string.");
}

TEST_F(RequestFacadeTest, UnknownOperationRejected) {
    auto r = facade_.handle(withToken({{"operation", "launch_rocket"}}));
    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
    EXPECT_NE(r.text.find("must be one of"), std::string::npos);
}

TEST_F(RequestFacadeTest, HtmlAndUrlAreExclusive) {
    auto neither = facade_.handle(withToken({{"operation", "show_dialog"}}));
    EXPECT_EQ(neither.kind, ToolResult::Kind::ValidationError);
    EXPECT_NE(neither.text.find("provide either 'html' or 'url'"), std::string::npos);

    auto both = facade_.handle(withToken({{"operation", "show_dialog"},
                                          {"html", "<p>x</p>"},
                                          {"url", "https://example.com"}}));
    EXPECT_EQ(both.kind, ToolResult::Kind::ValidationError);
    EXPECT_NE(both.text.find("Cannot specify both"), std::string::npos);
}

TEST_F(RequestFacadeTest, NonPositiveSizeRejected) {
    auto r = facade_.handle(withToken({{"operation", "show_dialog"},
                                       {"html", "<p>x</p>"},
                                       {"height", 0}}));
    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
    EXPECT_NE(r.text.find("'height' must be a positive integer"), std::string::npos);
}

TEST_F(RequestFacadeTest, NegativeTimeoutRejected) {
    auto r = facade_.handle(withToken({{"operation", "show_dialog"},
                                       {"html", "<p>x</p>"},
                                       {"timeout", -5}}));
    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
}

TEST_F(RequestFacadeTest, OversizedTimeoutRejected) {
    auto r = facade_.handle(withToken({{"operation", "show_dialog"},
                                       {"html", "<p>x</p>"},
                                       {"timeout", 10000000000LL}}));
    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
    EXPECT_NE(r.text.find("'timeout' must be an integer between 0 and"), std::string::npos);
    EXPECT_EQ(mailbox_.size(), 0u);

    auto huge = facade_.handle(withToken({{"operation", "show_dialog"},
                                          {"html", "<p>x</p>"},
                                          {"timeout", 18446744073709551615ULL}}));
    EXPECT_EQ(huge.kind, ToolResult::Kind::ValidationError);
}

TEST_F(RequestFacadeTest, LongestTimeoutStillAccepted) {
    auto r = facade_.handle(withToken({{"operation", "show_dialog"},
                                       {"html", "<p>x</p>"},
                                       {"timeout", RequestFacade::maxTimeoutSeconds}}));
    // Passes validation and reaches the (detached) mailbox
    EXPECT_EQ(r.kind, ToolResult::Kind::QueueUnavailable);
}

TEST_F(RequestFacadeTest, OversizedWidthNotTruncated) {
    auto r = facade_.handle(withToken({{"operation", "show_dialog"},
                                       {"html", "<p>x</p>"},
                                       {"width", 4294967396LL}}));
    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
    EXPECT_NE(r.text.find("'width' must be a positive integer no larger than"),
              std::string::npos);
    EXPECT_NE(r.text.find("4294967396"), std::string::npos);

    auto tall = facade_.handle(withToken({{"operation", "show_dialog"},
                                          {"html", "<p>x</p>"},
                                          {"height", RequestFacade::maxWindowExtent + 1}}));
    EXPECT_EQ(tall.kind, ToolResult::Kind::ValidationError);
}

TEST_F(RequestFacadeTest, QueueUnavailableFailsFast) {
    auto start = steady_clock::now();
    auto r = facade_.handle(withToken({{"operation", "show_dialog"},
                                       {"html", "<p>x</p>"},
                                       {"timeout", 60}}));

    EXPECT_LT(steady_clock::now() - start, 1s);
    EXPECT_EQ(r.kind, ToolResult::Kind::QueueUnavailable);
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(r.body["status"], "error");
    EXPECT_NE(r.body["error"].get<std::string>().find("No UI request queue"),
              std::string::npos);
}

TEST_F(RequestFacadeTest, ToastNeedsMessage) {
    auto r = facade_.handle(withToken({{"operation", "show_toast"}}));
    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
}

TEST_F(RequestFacadeTest, SendMessageNeedsContent) {
    auto r = facade_.handle(withToken({{"operation", "send_message"}}));
    EXPECT_EQ(r.kind, ToolResult::Kind::ValidationError);
    EXPECT_EQ(r.text, "Missing required parameter: content");
}

TEST_F(RequestFacadeTest, CollectorNeedsSettingsStore) {
    auto r = facade_.handle(withToken({{"operation", "collect_api_key"},
                                       {"service_name", "OpenAI"}}));
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(r.kind, ToolResult::Kind::RenderHostError);
}

TEST_F(RequestFacadeTest, ToolCallEnvelope) {
    auto r = facade_.handle({{"operation", "readme"}});
    auto j = r.toJson();

    ASSERT_TRUE(j["content"].is_array());
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_EQ(j["content"][0]["text"], r.text);
    EXPECT_EQ(j["isError"], false);
}

// ── With a running dispatch loop ─────────────────────────────────────────

class RequestFacadeLoopTest : public ::testing::Test {
protected:
    fs::path          tmpDir_;
    RequestMailbox    mailbox_;
    FakeRenderHost    host_;
    std::unique_ptr<JsonSettingsStore> settings_;
    std::unique_ptr<RequestFacade>     facade_;
    std::unique_ptr<DispatchLoop>      loop_;
    std::thread       uiThread_;
    std::string       token_ = TokenValidator::expectedToken(facadeIdentity());

    void SetUp() override {
        tmpDir_ = fs::temp_directory_path() /
                  (std::string("uibridge_facade_test_") +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(tmpDir_);
        settings_ = std::make_unique<JsonSettingsStore>((tmpDir_ / "settings.json").string());

        FacadeConfig fc;
        fc.replyGrace = std::chrono::seconds(1);
        facade_ = std::make_unique<RequestFacade>(mailbox_, facadeIdentity(),
                                                  settings_.get(), fc);

        DispatchConfig dc;
        dc.idleWait     = 20ms;
        dc.pumpInterval = 5ms;
        loop_ = std::make_unique<DispatchLoop>(mailbox_, host_, dc);
        uiThread_ = std::thread([this] { loop_->run(); });

        auto start = steady_clock::now();
        while (!mailbox_.hasConsumer() && steady_clock::now() - start < 2s)
            std::this_thread::sleep_for(1ms);
    }

    void TearDown() override {
        loop_->stop();
        if (uiThread_.joinable()) uiThread_.join();
        fs::remove_all(tmpDir_);
    }

    json withToken(json params) const {
        params["tool_unlock_token"] = token_;
        return params;
    }

    std::future<ToolResult> handleAsync(json params) {
        return std::async(std::launch::async, [this, params] {
            return facade_->handle(params);
        });
    }
};

TEST_F(RequestFacadeLoopTest, ProbeRoundTrip) {
    auto r = facade_->handle(withToken({{"operation", "test_queue"},
                                        {"message", "ping"}}));

    ASSERT_EQ(r.kind, ToolResult::Kind::Ok);
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(r.body["status"], "success");
    EXPECT_EQ(r.body["data"]["echo"], "ping");
    EXPECT_TRUE(r.body.contains("round_trip_ms"));
}

TEST_F(RequestFacadeLoopTest, CompositeTokenAccepted) {
    auto r = facade_->handle({{"operation", "test_queue"},
                              {"tool_unlock_token", "-callertoken-" + token_}});
    EXPECT_EQ(r.kind, ToolResult::Kind::Ok);
}

TEST_F(RequestFacadeLoopTest, DialogReturnsUserResponse) {
    auto pending = handleAsync(withToken({{"operation", "show_dialog"},
                                          {"html", "<form></form>"},
                                          {"title", "Confirm"},
                                          {"timeout", 30}}));

    ASSERT_TRUE(host_.waitForOpened(1, 2000ms));
    auto spec = host_.opened()[0];
    EXPECT_EQ(spec.title, "Confirm");
    EXPECT_TRUE(spec.modal);
    EXPECT_EQ(spec.contentSize, (Size{600, 400}));

    host_.userCloses(spec.id, json{{"status", "success"},
                                   {"data", {{"confirmed", true}}}});

    auto r = pending.get();
    ASSERT_EQ(r.kind, ToolResult::Kind::Ok);
    EXPECT_EQ(r.body["data"]["confirmed"], true);
    EXPECT_EQ(r.body["window_closed"], true);
}

TEST_F(RequestFacadeLoopTest, PopupIsNeverModal) {
    auto pending = handleAsync(withToken({{"operation", "show_popup"},
                                          {"url", "https://example.com"},
                                          {"modal", true},
                                          {"timeout", 30}}));

    ASSERT_TRUE(host_.waitForOpened(1, 2000ms));
    auto spec = host_.opened()[0];
    EXPECT_FALSE(spec.modal);
    EXPECT_EQ(spec.content.kind, ContentSource::Kind::RemoteLocator);

    host_.userCloses(spec.id);
    EXPECT_EQ(pending.get().kind, ToolResult::Kind::UserCancelled);
}

TEST_F(RequestFacadeLoopTest, CancelIsNotAnError) {
    auto pending = handleAsync(withToken({{"operation", "show_dialog"},
                                          {"html", "<p>x</p>"}}));

    ASSERT_TRUE(host_.waitForOpened(1, 2000ms));
    host_.userCloses(host_.opened()[0].id, json{{"status", "cancelled"}});

    auto r = pending.get();
    EXPECT_EQ(r.kind, ToolResult::Kind::UserCancelled);
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(r.body["status"], "cancelled");
}

TEST_F(RequestFacadeLoopTest, TimeoutReportedWithinDeadline) {
    auto start = steady_clock::now();
    auto r = facade_->handle(withToken({{"operation", "show_dialog"},
                                        {"html", "<p>x</p>"},
                                        {"timeout", 1}}));
    auto elapsed = steady_clock::now() - start;

    EXPECT_EQ(r.kind, ToolResult::Kind::Timeout);
    EXPECT_EQ(r.body["status"], "timeout");
    EXPECT_EQ(r.body["window_closed"], true);
    EXPECT_GE(elapsed, 900ms);
    EXPECT_LT(elapsed, 1900ms);
    EXPECT_EQ(host_.closed().size(), 1u);
}

TEST_F(RequestFacadeLoopTest, ZeroTimeoutReturnsImmediately) {
    auto start = steady_clock::now();
    auto r = facade_->handle(withToken({{"operation", "show_popup"},
                                        {"html", "<p>status</p>"},
                                        {"timeout", 0}}));

    EXPECT_LT(steady_clock::now() - start, 500ms);
    ASSERT_EQ(r.kind, ToolResult::Kind::Ok);
    EXPECT_EQ(r.body["async"], true);

    // The window still opens
    EXPECT_TRUE(host_.waitForOpened(1, 2000ms));
}

TEST_F(RequestFacadeLoopTest, NoWaitForResponseReturnsImmediately) {
    auto r = facade_->handle(withToken({{"operation", "show_dialog"},
                                        {"html", "<p>status</p>"},
                                        {"timeout", 30},
                                        {"wait_for_response", false}}));
    ASSERT_EQ(r.kind, ToolResult::Kind::Ok);
    EXPECT_EQ(r.body["async"], true);
}

TEST_F(RequestFacadeLoopTest, ConcurrentCallersEachGetTheirOwnAnswer) {
    auto a = handleAsync(withToken({{"operation", "show_dialog"},
                                    {"html", "<p>A</p>"}, {"timeout", 60}}));
    auto b = handleAsync(withToken({{"operation", "show_dialog"},
                                    {"html", "<p>B</p>"}, {"timeout", 60}}));

    ASSERT_TRUE(host_.waitForOpened(2, 2000ms));
    for (auto& spec : host_.opened()) {
        std::string who = spec.content.value == "<p>A</p>" ? "a" : "b";
        host_.userCloses(spec.id, json{{"status", "success"},
                                       {"data", {{"who", who}}}});
    }

    auto ra = a.get(), rb = b.get();
    ASSERT_EQ(ra.kind, ToolResult::Kind::Ok);
    ASSERT_EQ(rb.kind, ToolResult::Kind::Ok);
    EXPECT_EQ(ra.body["data"]["who"], "a");
    EXPECT_EQ(rb.body["data"]["who"], "b");
}

TEST_F(RequestFacadeLoopTest, CollectApiKeyStoresKeyWithoutEchoingIt) {
    auto pending = handleAsync(withToken({{"operation", "collect_api_key"},
                                          {"service_name", "Open AI"},
                                          {"service_url", "https://platform.openai.com"}}));

    ASSERT_TRUE(host_.waitForOpened(1, 2000ms));
    auto spec = host_.opened()[0];
    EXPECT_EQ(spec.title, "Open AI API Key Required");
    EXPECT_EQ(spec.contentSize, (Size{CollectorPage::width, CollectorPage::height}));
    EXPECT_TRUE(spec.modal);

    host_.userCloses(spec.id, json{{"status", "success"},
                                   {"data", {{"api_key", "sk-test-123"}}}});

    auto r = pending.get();
    ASSERT_EQ(r.kind, ToolResult::Kind::Ok);
    EXPECT_EQ(r.body["data"]["key_name"], "OPEN_AI_API_KEY");
    EXPECT_EQ(r.body["data"]["saved"], true);
    EXPECT_EQ(r.renderText().find("sk-test-123"), std::string::npos);

    EXPECT_EQ(settings_->apiKey("OPEN_AI_API_KEY"), "sk-test-123");
}

TEST_F(RequestFacadeLoopTest, CollectApiKeyCancelledStoresNothing) {
    auto pending = handleAsync(withToken({{"operation", "collect_api_key"},
                                          {"service_name", "Weather"}}));

    ASSERT_TRUE(host_.waitForOpened(1, 2000ms));
    host_.userCloses(host_.opened()[0].id, json{{"status", "cancelled"}});

    EXPECT_EQ(pending.get().kind, ToolResult::Kind::UserCancelled);
    EXPECT_FALSE(settings_->apiKey("WEATHER_API_KEY"));
}

TEST_F(RequestFacadeLoopTest, MessagingRoundTrip) {
    auto sent = facade_->handle(withToken({{"operation", "send_message"},
                                           {"content", "Ready to deploy?"},
                                           {"msg_type", "question"}}));
    ASSERT_EQ(sent.kind, ToolResult::Kind::Ok);
    EXPECT_EQ(sent.body["data"]["status"], "queued");

    host_.userTypes("ship it");

    // The user message lands on the next pump
    json messages;
    auto start = steady_clock::now();
    while (steady_clock::now() - start < 2s) {
        auto r = facade_->handle(withToken({{"operation", "check_messages"}}));
        ASSERT_EQ(r.kind, ToolResult::Kind::Ok);
        if (r.body["data"]["count"] == 1) {
            messages = r.body["data"]["messages"];
            break;
        }
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["content"], "ship it");

    auto history = facade_->handle(withToken({{"operation", "get_message_history"}}));
    EXPECT_EQ(history.body["data"]["count"], 2);
}

TEST_F(RequestFacadeLoopTest, ToastDelivered) {
    auto r = facade_->handle(withToken({{"operation", "show_toast"},
                                        {"message", "Saved"},
                                        {"level", "success"}}));
    ASSERT_EQ(r.kind, ToolResult::Kind::Ok);
    ASSERT_EQ(host_.toasts().size(), 1u);
    EXPECT_EQ(host_.toasts()[0].level, "success");
}
