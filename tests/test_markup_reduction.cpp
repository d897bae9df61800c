#include <gtest/gtest.h>
#include "render/TerminalRenderHost.hpp"
#include <algorithm>

static bool hasLine(const TerminalRenderHost::MarkupView& v, const std::string& line) {
    return std::find(v.lines.begin(), v.lines.end(), line) != v.lines.end();
}

static bool mentions(const TerminalRenderHost::MarkupView& v, const std::string& text) {
    for (auto& l : v.lines)
        if (l.find(text) != std::string::npos) return true;
    return false;
}

static const char* signInPage = R"(<!DOCTYPE html>
<html>
<head><title>Page title</title><style>p { color: red; }</style></head>
<body>
  <h2>Sign in</h2>
  <!-- not shown -->
  <p>Enter your   details &amp; continue.</p>
  <label for="user">User name</label>
  <input id="user" type="text" value="ada">
  <label for="pw">Password</label>
  <input id="pw" type="password">
  <input type="hidden" name="csrf" value="x">
  <input type="checkbox" id="remember">
  <button onclick="submit()">OK</button>
  <script>var shown = "<p>script text</p>";</script>
</body>
</html>)";

TEST(MarkupReductionTest, TextBlocksBecomeLines) {
    auto v = TerminalRenderHost::reduceMarkup(signInPage);

    EXPECT_TRUE(hasLine(v, "Sign in"));
    EXPECT_TRUE(hasLine(v, "Enter your details & continue."));
    EXPECT_TRUE(hasLine(v, "[OK]"));
}

TEST(MarkupReductionTest, HeadScriptAndCommentsDropped) {
    auto v = TerminalRenderHost::reduceMarkup(signInPage);

    EXPECT_FALSE(mentions(v, "Page title"));
    EXPECT_FALSE(mentions(v, "color"));
    EXPECT_FALSE(mentions(v, "script text"));
    EXPECT_FALSE(mentions(v, "not shown"));
}

TEST(MarkupReductionTest, NoLeadingOrTrailingBlankLines) {
    auto v = TerminalRenderHost::reduceMarkup(signInPage);

    ASSERT_FALSE(v.lines.empty());
    EXPECT_FALSE(v.lines.front().empty());
    EXPECT_FALSE(v.lines.back().empty());
    for (size_t i = 1; i < v.lines.size(); i++)
        EXPECT_FALSE(v.lines[i].empty() && v.lines[i - 1].empty());
}

TEST(MarkupReductionTest, EditableFieldsExtracted) {
    auto v = TerminalRenderHost::reduceMarkup(signInPage);

    ASSERT_EQ(v.fields.size(), 2u);
    EXPECT_EQ(v.fields[0].id, "user");
    EXPECT_EQ(v.fields[0].label, "User name");
    EXPECT_EQ(v.fields[0].value, "ada");
    EXPECT_FALSE(v.fields[0].secret);

    EXPECT_EQ(v.fields[1].id, "pw");
    EXPECT_EQ(v.fields[1].label, "Password");
    EXPECT_TRUE(v.fields[1].secret);
}

TEST(MarkupReductionTest, FieldLabelFallsBackToPlaceholderThenName) {
    auto v = TerminalRenderHost::reduceMarkup(
        R"(<textarea name="notes" placeholder="Your notes"></textarea>)"
        R"(<input name="email">)");

    ASSERT_EQ(v.fields.size(), 2u);
    EXPECT_EQ(v.fields[0].id, "notes");
    EXPECT_EQ(v.fields[0].label, "Your notes");
    EXPECT_EQ(v.fields[1].id, "email");
    EXPECT_EQ(v.fields[1].label, "email");
}

TEST(MarkupReductionTest, ListItemsAndBreaks) {
    auto v = TerminalRenderHost::reduceMarkup("<ul><li>one</li><li>two</li></ul>a<br>b");

    EXPECT_TRUE(hasLine(v, "- one"));
    EXPECT_TRUE(hasLine(v, "- two"));
    EXPECT_TRUE(hasLine(v, "a"));
    EXPECT_TRUE(hasLine(v, "b"));
}

TEST(MarkupReductionTest, CollectorPageKeepsApiKeyField) {
    auto v = TerminalRenderHost::reduceMarkup(
        R"(<label for="api_key">API Key</label><input type="password" id="api_key">)");

    ASSERT_EQ(v.fields.size(), 1u);
    EXPECT_EQ(v.fields[0].id, "api_key");
    EXPECT_TRUE(v.fields[0].secret);
}

TEST(MarkupReductionTest, MeasureUsesCellSize) {
    TerminalRenderHost::MarkupView v;
    v.lines = {"abc", "abcdefghij"};

    Size s = TerminalRenderHost::measure(v, 20);
    EXPECT_EQ(s.width,  10 * TerminalRenderHost::cellWidthPx + 20);
    EXPECT_EQ(s.height, 2 * TerminalRenderHost::cellHeightPx + 20);
}

TEST(MarkupReductionTest, MeasureLeavesRoomForFields) {
    TerminalRenderHost::MarkupView v;
    v.lines = {"Hi"};
    v.fields.push_back({"name", "Name", "", false});

    Size s = TerminalRenderHost::measure(v, 0);
    // label, separator and a 20 column input
    EXPECT_EQ(s.width,  (4 + 2 + 20) * TerminalRenderHost::cellWidthPx);
    EXPECT_EQ(s.height, 2 * TerminalRenderHost::cellHeightPx);
}
