#include <gtest/gtest.h>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

#include "tools/ITool.h"
#include "tools/ToolArgs.h"

using nlohmann::json;

static std::string inputError(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const ToolInputError& e) {
    return e.what();
  }
  return "";
}

TEST(ToolArgs, RememberRequiresFact) {
  Limits limits;
  EXPECT_EQ(inputError([&] { ToolArgs::parseRemember(json::object(), limits); }), "fact is required");
  EXPECT_EQ(inputError([&] { ToolArgs::parseRemember({{"fact", ""}}, limits); }), "fact is required");
  EXPECT_EQ(inputError([&] { ToolArgs::parseRemember({{"fact", 12}}, limits); }), "fact is required");
  EXPECT_EQ(inputError([&] { ToolArgs::parseRemember(nullptr, limits); }), "fact is required");
}

TEST(ToolArgs, RememberFactSizeBoundary) {
  Limits limits;
  std::string atLimit(limits.maxFactSize, 'x');
  std::string overLimit(limits.maxFactSize + 1, 'x');

  EXPECT_NO_THROW(ToolArgs::parseRemember({{"fact", atLimit}}, limits));
  EXPECT_EQ(inputError([&] { ToolArgs::parseRemember({{"fact", overLimit}}, limits); }),
            "fact exceeds maximum size of 10000 bytes");
}

TEST(ToolArgs, RememberTagBounds) {
  Limits limits;
  json tooMany = json::array();
  for (int i = 0; i < 21; ++i) tooMany.push_back("t" + std::to_string(i));
  EXPECT_EQ(inputError([&] { ToolArgs::parseRemember({{"fact", "f"}, {"tags", tooMany}}, limits); }),
            "too many tags (max 20)");

  json longTag = json::array({std::string(101, 'a')});
  EXPECT_EQ(inputError([&] { ToolArgs::parseRemember({{"fact", "f"}, {"tags", longTag}}, limits); }),
            "tag exceeds maximum length of 100 characters");

  json okTags = json::array({std::string(100, 'a'), "b"});
  auto req = ToolArgs::parseRemember({{"fact", "f"}, {"tags", okTags}}, limits);
  EXPECT_EQ(req.tags.size(), 2u);
}

TEST(ToolArgs, TagsMustBeStrings) {
  Limits limits;
  EXPECT_EQ(inputError([&] { ToolArgs::parseRemember({{"fact", "f"}, {"tags", "db"}}, limits); }),
            "'tags' must be an array of strings");
  EXPECT_EQ(inputError([&] { ToolArgs::parseRecall({{"tags", json::array({1})}}); }),
            "'tags' must be an array of strings");
}

TEST(ToolArgs, RecallDefaults) {
  auto req = ToolArgs::parseRecall(json::object());
  EXPECT_EQ(req.query, "");
  EXPECT_TRUE(req.tags.empty());
  EXPECT_FALSE(req.currentDirOnly);
  EXPECT_EQ(req.limit, 20);
}

TEST(ToolArgs, RecallTypeErrors) {
  EXPECT_EQ(inputError([] { ToolArgs::parseRecall({{"query", 5}}); }), "'query' must be a string");
  EXPECT_EQ(inputError([] { ToolArgs::parseRecall({{"current_dir_only", "yes"}}); }),
            "'current_dir_only' must be a boolean");
  EXPECT_EQ(inputError([] { ToolArgs::parseRecall({{"limit", "ten"}}); }), "'limit' must be an integer");
  EXPECT_EQ(inputError([] { ToolArgs::parseRecall(json::array()); }), "arguments must be an object");
}

TEST(ToolArgs, SendMessageValidation) {
  Limits limits;
  EXPECT_EQ(inputError([&] { ToolArgs::parseSendMessage({{"content", "hi"}}, limits); }),
            "'to' instance ID is required");
  EXPECT_EQ(inputError([&] { ToolArgs::parseSendMessage({{"to", "abc"}}, limits); }), "'content' is required");
  EXPECT_EQ(inputError([&] {
              ToolArgs::parseSendMessage({{"to", "abc"}, {"content", std::string(10001, 'm')}}, limits);
            }),
            "message exceeds maximum size of 10000 bytes");

  auto req = ToolArgs::parseSendMessage({{"to", "abc"}, {"content", "hi"}}, limits);
  EXPECT_EQ(req.to, "abc");
  EXPECT_EQ(req.content, "hi");
}

TEST(ToolArgs, GetMessagesDefaultsToUnreadOnly) {
  EXPECT_TRUE(ToolArgs::parseGetMessages(json::object()).unreadOnly);
  EXPECT_FALSE(ToolArgs::parseGetMessages({{"unread_only", false}}).unreadOnly);
}

TEST(ToolResultHelpers, TruncateAddsEllipsis) {
  EXPECT_EQ(ToolResult::truncate("short", 100), "short");
  std::string longText(150, 'a');
  std::string cut = ToolResult::truncate(longText, 100);
  EXPECT_EQ(cut.size(), 100u);
  EXPECT_EQ(cut.substr(97), "...");
}

TEST(ToolResultHelpers, TruncateKeepsUtf8Whole) {
  // 'é' is two bytes; cutting at byte 97 would land inside one
  std::string text = std::string(96, 'a') + "\xC3\xA9\xC3\xA9\xC3\xA9";
  std::string cut = ToolResult::truncate(text, 100);
  EXPECT_EQ(cut, std::string(96, 'a') + "...");
}

TEST(ToolResultHelpers, ErrorShape) {
  json err = ToolResult::error("boom");
  EXPECT_TRUE(ToolResult::isError(err));
  EXPECT_EQ(ToolResult::firstText(err), "boom");
  json ok = ToolResult::text("fine");
  EXPECT_FALSE(ToolResult::isError(ok));
  ASSERT_TRUE(ok["content"].is_array());
  EXPECT_EQ(ok["content"][0]["type"], "text");
}
