#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "instance/InstanceManager.h"
#include "store/SqliteStore.h"
#include "tools/BuiltinTools.h"
#include "tools/MessagingTools.h"
#include "tools/ToolRegistry.h"

namespace fs = std::filesystem;
using nlohmann::json;

static std::string ExtractText(const json& result) {
  if (!result.contains("content") || !result["content"].is_array() || result["content"].empty()) {
    return "";
  }
  return result["content"][0].value("text", "");
}

static bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

class MessagingToolsTest : public ::testing::Test {
protected:
  fs::path root;
  std::unique_ptr<SqliteStore> store;
  std::unique_ptr<InstanceManager> instances;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root = fs::temp_directory_path() / (std::string("engram_messaging_test_") + info->name());
    std::error_code ec;
    fs::remove_all(root, ec);
    store = std::make_unique<SqliteStore>(root.u8string());
    instances = std::make_unique<InstanceManager>(*store);
    instances->registerSelf("aaaa1111", 100, "/repo/a");
    instances->registerSelf("bbbb2222", 200, "/repo/b");
  }

  void TearDown() override {
    instances.reset();
    store.reset();
    std::error_code ec;
    fs::remove_all(root, ec);
  }
};

TEST_F(MessagingToolsTest, ListInstancesMarksSelf) {
  ListInstancesTool tool(*instances, "aaaa1111");
  std::string text = ExtractText(tool.execute(json::object()));

  EXPECT_TRUE(Contains(text, "Found 2 running instance(s):")) << text;
  EXPECT_TRUE(Contains(text, "**aaaa1111** (this instance)"));
  EXPECT_TRUE(Contains(text, "**bbbb2222**\n"));
  EXPECT_TRUE(Contains(text, "Directory: /repo/b"));
}

TEST_F(MessagingToolsTest, ListInstancesEmpty) {
  instances->unregister("aaaa1111");
  instances->unregister("bbbb2222");

  ListInstancesTool tool(*instances, "aaaa1111");
  EXPECT_EQ(ExtractText(tool.execute(json::object())), "No other running instances found.");
}

TEST_F(MessagingToolsTest, SendToKnownInstance) {
  SendMessageTool tool(*store, *instances, "aaaa1111", Limits{});
  json res = tool.execute({{"to", "bbbb2222"}, {"content", "please rebase"}});

  ASSERT_FALSE(ToolResult::isError(res)) << res.dump(2);
  EXPECT_TRUE(Contains(ExtractText(res), "sent to bbbb2222"));

  auto inbox = store->getMessages("bbbb2222", true);
  ASSERT_EQ(inbox.size(), 1u);
  EXPECT_EQ(inbox[0].fromInstance, "aaaa1111");
  EXPECT_EQ(inbox[0].content, "please rebase");
}

TEST_F(MessagingToolsTest, SendToUnknownInstanceStoresNothing) {
  SendMessageTool tool(*store, *instances, "aaaa1111", Limits{});
  json res = tool.execute({{"to", "deadbeef"}, {"content", "hello?"}});

  EXPECT_TRUE(ToolResult::isError(res));
  EXPECT_EQ(ExtractText(res), "instance 'deadbeef' not found");
  EXPECT_TRUE(store->getMessages("deadbeef", false).empty());
}

TEST_F(MessagingToolsTest, SendValidatesInput) {
  SendMessageTool tool(*store, *instances, "aaaa1111", Limits{});
  EXPECT_EQ(ExtractText(tool.execute({{"content", "x"}})), "'to' instance ID is required");
  EXPECT_EQ(ExtractText(tool.execute({{"to", "bbbb2222"}})), "'content' is required");
  EXPECT_TRUE(store->getMessages("bbbb2222", false).empty());
}

TEST_F(MessagingToolsTest, GetMessagesMarksRead) {
  store->sendMessage("bbbb2222", "aaaa1111", "first note");
  store->sendMessage("bbbb2222", "aaaa1111", "second note");

  GetMessagesTool tool(*store, "aaaa1111");
  std::string text = ExtractText(tool.execute(json::object()));
  EXPECT_TRUE(Contains(text, "Found 2 message(s):")) << text;
  EXPECT_LT(text.find("first note"), text.find("second note"));
  EXPECT_TRUE(Contains(text, "from bbbb2222 (unread)"));

  EXPECT_EQ(ExtractText(tool.execute(json::object())), "No unread messages.");

  std::string history = ExtractText(tool.execute({{"unread_only", false}}));
  EXPECT_TRUE(Contains(history, "Found 2 message(s):")) << history;
  EXPECT_TRUE(Contains(history, "(read at "));
}

TEST_F(MessagingToolsTest, GetMessagesEmptyHistory) {
  GetMessagesTool tool(*store, "aaaa1111");
  EXPECT_EQ(ExtractText(tool.execute({{"unread_only", false}})), "No messages.");
}

TEST_F(MessagingToolsTest, BuiltinCatalogOrder) {
  ToolRegistry registry;
  registerBuiltinTools(registry, *store, *instances, SessionInfo{"aaaa1111", "/repo/a"}, Limits{});

  json schemas = registry.listToolSchemas();
  ASSERT_EQ(schemas.size(), 6u);
  const char* expected[] = {"remember", "recall", "get_context", "list_instances", "send_message", "get_messages"};
  for (size_t i = 0; i < 6; ++i) {
    EXPECT_EQ(schemas[i]["name"], expected[i]);
    EXPECT_TRUE(schemas[i].contains("description"));
    EXPECT_TRUE(schemas[i]["inputSchema"].is_object());
  }
}

TEST_F(MessagingToolsTest, RegistryUnknownTool) {
  ToolRegistry registry;
  registerBuiltinTools(registry, *store, *instances, SessionInfo{"aaaa1111", "/repo/a"}, Limits{});

  json res = registry.executeTool("forget", json::object());
  EXPECT_TRUE(ToolResult::isError(res));
  EXPECT_EQ(ExtractText(res), "Unknown tool: forget");
  EXPECT_FALSE(registry.hasTool("forget"));
  EXPECT_TRUE(registry.hasTool("send_message"));
}

TEST_F(MessagingToolsTest, RoundTripBetweenTwoSessions) {
  ToolRegistry a;
  ToolRegistry b;
  registerBuiltinTools(a, *store, *instances, SessionInfo{"aaaa1111", "/repo/a"}, Limits{});
  registerBuiltinTools(b, *store, *instances, SessionInfo{"bbbb2222", "/repo/b"}, Limits{});

  json sent = a.executeTool("send_message", {{"to", "bbbb2222"}, {"content", "API changed"}});
  ASSERT_FALSE(ToolResult::isError(sent)) << sent.dump(2);

  std::string inbox = ExtractText(b.executeTool("get_messages", json::object()));
  EXPECT_TRUE(Contains(inbox, "from aaaa1111"));
  EXPECT_TRUE(Contains(inbox, "API changed"));
}
