#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "gcb/foundation/config_manager.hpp"
#include "gcb/foundation/error_code.hpp"

using namespace gcb::foundation;

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto loaded = config.loadFromString(R"(
gateway:
  listen_port: 58008
  listen_host: 0.0.0.0
  backoff_multiplier: 1.5
  remove_on_give_up: true
  server_ids: [Survival, Creative]
servers:
  Survival:
    token: s3cret
    forward_targets: |
      kook:GroupMessage:123
      # disabled for now
      qq:FriendMessage:9:9

  Creative:
    token: other
    forward_targets: kook:GroupMessage:456
)");
        ASSERT_TRUE(loaded.hasValue());
    }

    ConfigManager config;
};

TEST_F(ConfigManagerTest, TypedScalarAccess) {
    EXPECT_EQ(config.get<int>("gateway.listen_port").value(), 58008);
    EXPECT_EQ(config.get<std::string>("gateway.listen_host").value(), "0.0.0.0");
    EXPECT_DOUBLE_EQ(config.get<double>("gateway.backoff_multiplier").value(), 1.5);
    EXPECT_TRUE(config.get<bool>("gateway.remove_on_give_up").value());
}

TEST_F(ConfigManagerTest, MissingKeyIsConfigKeyNotFound) {
    auto missing = config.get<int>("gateway.nope");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, WrongTypeIsConfigTypeMismatch) {
    auto wrong = config.get<int>("gateway.listen_host");
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, ListFromSequence) {
    auto ids = config.getList("gateway.server_ids");
    ASSERT_TRUE(ids.hasValue());
    EXPECT_EQ(ids.value(), (std::vector<std::string>{"Survival", "Creative"}));
}

TEST_F(ConfigManagerTest, ListFromMultiLineStringSkipsComments) {
    auto targets = config.getList("servers.Survival.forward_targets");
    ASSERT_TRUE(targets.hasValue());
    EXPECT_EQ(targets.value(),
              (std::vector<std::string>{"kook:GroupMessage:123", "qq:FriendMessage:9:9"}));
}

TEST_F(ConfigManagerTest, ListFromSingleScalar) {
    auto targets = config.getList("servers.Creative.forward_targets");
    ASSERT_TRUE(targets.hasValue());
    EXPECT_EQ(targets.value(), (std::vector<std::string>{"kook:GroupMessage:456"}));
}

TEST_F(ConfigManagerTest, ChildKeysAreSortedAndDistinct) {
    EXPECT_EQ(config.childKeys("servers"), (std::vector<std::string>{"Creative", "Survival"}));
    EXPECT_TRUE(config.childKeys("nothing").empty());
}

TEST_F(ConfigManagerTest, SetNotifiesWatchers) {
    std::vector<std::string> seen;
    config.watch("gateway.listen_port", [&](std::string_view key) {
        seen.emplace_back(key);
        EXPECT_EQ(config.get<int>("gateway.listen_port").value(), 9000);
    });
    config.set("gateway.listen_port", 9000);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "gateway.listen_port");
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ASSERT_TRUE(config.loadFromString("logging:\n  level: debug\n").hasValue());
    EXPECT_FALSE(config.hasKey("gateway.listen_port"));
    EXPECT_TRUE(config.hasKey("logging.level"));
}

TEST(ConfigManagerLoadTest, NonMappingRootIsRejected) {
    ConfigManager config;
    auto loaded = config.loadFromString("- just\n- a list\n");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerLoadTest, MissingFileIsConfigLoadFailed) {
    ConfigManager config;
    auto loaded = config.load("/nonexistent/gcb/config.yaml");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerLoadTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "gcb_config_manager_test.yaml";
    {
        std::ofstream out(path);
        out << "gateway:\n  listen_port: 1234\n";
    }
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());
    EXPECT_EQ(config.get<int>("gateway.listen_port").value(), 1234);
    std::filesystem::remove(path);
}
