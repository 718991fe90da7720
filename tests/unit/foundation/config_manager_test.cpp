#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "sre/foundation/config_manager.hpp"

using namespace sre::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("sre_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename, const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGetNestedKeys) {
    auto path = writeYaml("engine.yaml", R"(
combat:
  base_hit_chance: 0.65
world:
  max_room_mobs: 12
magic:
  fatigue_base_seconds: 4
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto hit = config.get<double>("combat.base_hit_chance");
    ASSERT_TRUE(hit.hasValue());
    EXPECT_DOUBLE_EQ(hit.value(), 0.65);

    auto mobs = config.get<int>("world.max_room_mobs");
    ASSERT_TRUE(mobs.hasValue());
    EXPECT_EQ(mobs.value(), 12);
}

TEST_F(ConfigManagerTest, LoadFromString) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("sandbox:\n  class: cleric\n").hasValue());
    EXPECT_EQ(config.getOr<std::string>("sandbox.class", "mage"), "cleric");
}

TEST_F(ConfigManagerTest, LoadReplacesPreviousEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1\nb: 2\n").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 3\n").hasValue());
    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_EQ(config.getOr<int>("b", 0), 3);
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnMissingOrMistyped) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());
    EXPECT_EQ(config.getOr<int>("value", 7), 7);
    EXPECT_EQ(config.getOr<int>("missing", 9), 9);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYaml) {
    ConfigManager config;
    auto result = config.loadFromString("key: [unterminated");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("world.max_room_mobs", 20);

    auto result = config.get<int>("world.max_room_mobs");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 20);
}

TEST_F(ConfigManagerTest, HasKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("key: value").hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    std::vector<std::string> notified;

    config.watch("combat.base_hit_chance", [&](std::string_view key) {
        notified.emplace_back(key);
    });

    config.set<double>("combat.base_hit_chance", 0.7);
    config.set<double>("magic.max_failure_chance", 0.3);
    ASSERT_EQ(notified.size(), 1u);
    EXPECT_EQ(notified[0], "combat.base_hit_chance");
}

TEST_F(ConfigManagerTest, WatcherMayReadConfig) {
    ConfigManager config;
    int seen = 0;
    config.watch("world.max_room_mobs", [&](std::string_view key) {
        seen = config.getOr<int>(std::string(key), 0);
    });

    config.set<int>("world.max_room_mobs", 33);
    EXPECT_EQ(seen, 33);
}
