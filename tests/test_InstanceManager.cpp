#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <thread>

#include "instance/HeartbeatTask.h"
#include "instance/InstanceManager.h"
#include "store/SqliteStore.h"

namespace fs = std::filesystem;

class InstanceManagerTest : public ::testing::Test {
protected:
  fs::path root;
  std::unique_ptr<SqliteStore> store;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root = fs::temp_directory_path() / (std::string("engram_instance_test_") + info->name());
    std::error_code ec;
    fs::remove_all(root, ec);
    store = std::make_unique<SqliteStore>(root.u8string());
  }

  void TearDown() override {
    store.reset();
    std::error_code ec;
    fs::remove_all(root, ec);
  }
};

TEST_F(InstanceManagerTest, GeneratedIdsAreEightHexChars) {
  std::set<std::string> seen;
  for (int i = 0; i < 50; ++i) {
    std::string id = InstanceManager::generateInstanceId();
    ASSERT_EQ(id.size(), 8u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos) << id;
    seen.insert(id);
  }
  EXPECT_GT(seen.size(), 45u);
}

TEST_F(InstanceManagerTest, DefaultStaleThresholdIsFiveMinutes) {
  InstanceManager manager(*store);
  EXPECT_EQ(manager.getStaleAfter(), std::chrono::minutes(5));
}

TEST_F(InstanceManagerTest, RegisterSelfThenFind) {
  InstanceManager manager(*store);
  manager.registerSelf("a1b2c3d4", 100, "/project");

  auto inst = manager.find("a1b2c3d4");
  ASSERT_TRUE(inst.has_value());
  EXPECT_EQ(inst->pid, 100);
  EXPECT_EQ(inst->directory, "/project");
}

TEST_F(InstanceManagerTest, RegisterSelfReclaimsStaleSessions) {
  InstanceManager manager(*store, std::chrono::milliseconds(75));
  store->registerInstance("crashed", 1, "/old");
  std::this_thread::sleep_for(std::chrono::milliseconds(150));

  manager.registerSelf("fresh", 2, "/new");

  EXPECT_FALSE(manager.find("crashed").has_value());
  EXPECT_TRUE(manager.find("fresh").has_value());
}

TEST_F(InstanceManagerTest, ListLiveExcludesStale) {
  InstanceManager manager(*store, std::chrono::milliseconds(75));
  store->registerInstance("stale", 1, "/a");
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  store->registerInstance("live", 2, "/b");

  auto live = manager.listLive();
  ASSERT_EQ(live.size(), 1u);
  EXPECT_EQ(live[0].id, "live");
}

TEST_F(InstanceManagerTest, UnregisterRemoves) {
  InstanceManager manager(*store);
  manager.registerSelf("bye", 1, "/a");
  manager.unregister("bye");
  EXPECT_FALSE(manager.find("bye").has_value());
  EXPECT_TRUE(manager.listLive().empty());
}

TEST_F(InstanceManagerTest, HeartbeatKeepsInstanceAlive) {
  InstanceManager manager(*store, std::chrono::milliseconds(200));
  manager.registerSelf("beating", 1, "/a");

  HeartbeatTask task(manager, "beating", std::chrono::milliseconds(20));
  task.start();
  EXPECT_TRUE(task.isRunning());
  std::this_thread::sleep_for(std::chrono::milliseconds(400));

  auto live = manager.listLive();
  task.stop();

  ASSERT_EQ(live.size(), 1u);
  EXPECT_EQ(live[0].id, "beating");
  EXPECT_GT(task.getBeatCount(), 0);
}

TEST_F(InstanceManagerTest, StopJoinsWorker) {
  InstanceManager manager(*store);
  manager.registerSelf("stopper", 1, "/a");

  HeartbeatTask task(manager, "stopper", std::chrono::seconds(30));
  task.start();

  auto started = std::chrono::steady_clock::now();
  task.stop();
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_FALSE(task.isRunning());
  EXPECT_EQ(task.getBeatCount(), 0);
  EXPECT_LT(elapsed, std::chrono::seconds(5));

  // No heartbeat can land after stop(), so unregistration sticks
  manager.unregister("stopper");
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(manager.find("stopper").has_value());
}

TEST_F(InstanceManagerTest, StopWithoutStartIsHarmless) {
  InstanceManager manager(*store);
  HeartbeatTask task(manager, "never", std::chrono::milliseconds(10));
  EXPECT_NO_THROW(task.stop());
  EXPECT_FALSE(task.isRunning());
}
