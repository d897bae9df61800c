#include <gtest/gtest.h>
#include "facade/ToolDocs.hpp"
#include "facade/ToolSchema.hpp"
#include "facade/CollectorPage.hpp"
#include "bridge/UIRequest.hpp"

using json = nlohmann::json;

TEST(ToolSchemaTest, ReadmeNeedsOnlyOperation) {
    auto r = ToolSchema::validate({{"operation", "readme"}});
    EXPECT_TRUE(r.valid) << r.error;
}

TEST(ToolSchemaTest, OtherOperationsNeedToken) {
    auto r = ToolSchema::validate({{"operation", "show_popup"}});

    EXPECT_FALSE(r.valid);
    EXPECT_TRUE(r.withDocs);
    EXPECT_EQ(r.error.rfind("Missing required parameters: tool_unlock_token.", 0), 0u)
        << r.error;
}

TEST(ToolSchemaTest, MissingOperation) {
    auto r = ToolSchema::validate({{"tool_unlock_token", "x"}});
    EXPECT_FALSE(r.valid);
    EXPECT_NE(r.error.find("Missing required parameters: operation"), std::string::npos);
}

TEST(ToolSchemaTest, UnexpectedParametersListedSorted) {
    auto r = ToolSchema::validate({{"operation", "readme"},
                                   {"zeta", 1}, {"alpha", 2}});

    EXPECT_FALSE(r.valid);
    EXPECT_TRUE(r.withDocs);
    EXPECT_EQ(r.error.rfind("Unexpected parameters provided: alpha, zeta. "
                            "Expected parameters are: ", 0), 0u) << r.error;
}

TEST(ToolSchemaTest, DefaultsFilledIn) {
    auto r = ToolSchema::validate({{"operation", "show_dialog"},
                                   {"tool_unlock_token", "t"},
                                   {"html", "<p>x</p>"}});
    ASSERT_TRUE(r.valid) << r.error;

    const auto& p = r.params;
    EXPECT_EQ(p["title"], "User Interface");
    EXPECT_EQ(p["width"], 600);
    EXPECT_EQ(p["height"], 400);
    EXPECT_EQ(p["wait_for_response"], true);
    EXPECT_EQ(p["always_on_top"], true);
    EXPECT_EQ(p["auto_resize"], false);
    EXPECT_EQ(p["level"], "info");
    EXPECT_EQ(p["service_name"], "API Service");

    // No default: absent means "not given"
    EXPECT_FALSE(p.contains("timeout"));
    EXPECT_FALSE(p.contains("modal"));
    EXPECT_FALSE(p.contains("url"));
}

TEST(ToolSchemaTest, TypeMismatchHasNoDocs) {
    auto r = ToolSchema::validate({{"operation", "show_dialog"},
                                   {"tool_unlock_token", "t"},
                                   {"auto_resize", "yes"}});
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(r.withDocs);
    EXPECT_EQ(r.error, "Parameter 'auto_resize' must be a boolean, got string.");
}

TEST(ToolSchemaTest, FloatIsNotAnInteger) {
    auto r = ToolSchema::validate({{"operation", "show_dialog"},
                                   {"tool_unlock_token", "t"},
                                   {"timeout", 2.5}});
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.error, "Parameter 'timeout' must be an integer, got number.");
}

TEST(ToolSchemaTest, NumberAcceptsIntegers) {
    auto r = ToolSchema::validate({{"operation", "check_messages"},
                                   {"tool_unlock_token", "t"},
                                   {"since_timestamp", 1700000000}});
    EXPECT_TRUE(r.valid) << r.error;
}

TEST(ToolSchemaTest, EnumViolationListsAllowedValues) {
    auto r = ToolSchema::validate({{"operation", "show_toast"},
                                   {"tool_unlock_token", "t"},
                                   {"message", "hi"},
                                   {"level", "loud"}});
    EXPECT_FALSE(r.valid);
    EXPECT_TRUE(r.withDocs);
    EXPECT_EQ(r.error, "Parameter 'level' must be one of ['info', 'warning', "
                       "'error', 'success'], got 'loud'.");
}

TEST(ToolSchemaTest, EveryOperationNameRoundTrips) {
    auto names = ToolSchema::operationNames();
    EXPECT_EQ(names.size(), 12u);
    for (auto& n : names) {
        auto op = operationFromName(n);
        ASSERT_TRUE(op) << n;
        EXPECT_EQ(operationName(*op), n);
    }
    EXPECT_FALSE(operationFromName("show_window"));
}

TEST(ToolSchemaTest, SchemaEmbedsToken) {
    auto j = ToolSchema::toJson("abc123");

    EXPECT_EQ(j["type"], "object");
    EXPECT_EQ(j["required"], json::array({"operation", "tool_unlock_token"}));
    EXPECT_NE(j["properties"]["tool_unlock_token"]["description"].get<std::string>()
                  .find("abc123"), std::string::npos);
    EXPECT_EQ(j["properties"]["level"]["enum"].size(), 4u);
    EXPECT_EQ(j["properties"]["width"]["default"], 600);
}

TEST(ToolSchemaTest, ListingExposesSingleInputObject) {
    auto j = ToolSchema::listingParameters();
    ASSERT_TRUE(j["properties"].contains("input"));
    EXPECT_EQ(j["properties"].size(), 1u);
    EXPECT_EQ(j["properties"]["input"]["type"], "object");
}

TEST(ToolDocsTest, ReadmeCarriesGuideAndSchema) {
    auto j = ToolDocs::readmePayload("tok999");
    EXPECT_NE(j["description"].get<std::string>().find("tok999"), std::string::npos);
    EXPECT_TRUE(j["parameters"]["properties"].contains("operation"));

    auto text = ToolDocs::readmeText("tok999");
    EXPECT_EQ(text.rfind("\n\n", 0), 0u);
    EXPECT_EQ(json::parse(text.substr(2)), j);
}

TEST(CollectorPageTest, KeyNames) {
    EXPECT_EQ(CollectorPage::keyNameFor("OpenAI"), "OPENAI_API_KEY");
    EXPECT_EQ(CollectorPage::keyNameFor("Open AI"), "OPEN_AI_API_KEY");
    EXPECT_EQ(CollectorPage::keyNameFor("my-svc"), "MY_SVC_API_KEY");
}

TEST(CollectorPageTest, PageEscapesServiceText) {
    auto html = CollectorPage::html("<Evil & Co>", "https://x.test/?a=1&b=2");

    EXPECT_EQ(html.find("<Evil"), std::string::npos);
    EXPECT_NE(html.find("&lt;Evil &amp; Co&gt;"), std::string::npos);
    EXPECT_NE(html.find("a=1&amp;b=2"), std::string::npos);
    EXPECT_NE(html.find("id=\"api_key\""), std::string::npos);
    EXPECT_NE(html.find("window.userResponse"), std::string::npos);
}
