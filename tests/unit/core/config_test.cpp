// Tickwise Unit Tests
// config_test.cpp - Tests for JSON configuration

#include <gtest/gtest.h>

#include <string>
#include <tickwise/core/config.hpp>
#include <tickwise/platform/file_io.hpp>

namespace tickwise::core {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = platform::FileSystem::get_temp_directory() / "config_test";
        platform::FileSystem::create_directories(test_dir_);
    }

    void TearDown() override { platform::FileSystem::remove_all(test_dir_); }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigTest, HasDefaults) {
    Config config;

    EXPECT_FALSE(config.get_bool(config_section::SCHEDULER, config_key::START_PAUSED, true));
    EXPECT_EQ(config.get_int(config_section::SIMULATION, config_key::MAX_TURNS), 100);
    EXPECT_EQ(config.get_int(config_section::SIMULATION, config_key::ACTOR_COUNT), 4);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::SIMULATION, config_key::SPEED_STEP), 0.5);
    EXPECT_EQ(config.get_string(config_section::DEBUG, config_key::LOG_LEVEL), "info");
}

TEST_F(ConfigTest, MissingKeysReturnDefault) {
    Config config;

    EXPECT_EQ(config.get_int("nowhere", "nothing", 42), 42);
    EXPECT_FALSE(config.has("nowhere", "nothing"));
    EXPECT_FALSE(config.has_section("nowhere"));
}

TEST_F(ConfigTest, TypeMismatchReturnsDefault) {
    Config config;
    config.set_string(config_section::SIMULATION, config_key::MAX_TURNS, "many");

    EXPECT_EQ(config.get_int(config_section::SIMULATION, config_key::MAX_TURNS, 7), 7);
}

TEST_F(ConfigTest, SettersMarkDirtyAndNotify) {
    Config config;
    config.mark_clean();

    std::string changed;
    config.set_change_callback(
        [&changed](std::string_view section, std::string_view key) { changed = std::string(section) + "." + std::string(key); });

    config.set_double(config_section::SIMULATION, config_key::BASE_SPEED, 3.5);

    EXPECT_TRUE(config.is_dirty());
    EXPECT_EQ(changed, "simulation.base_speed");
    EXPECT_DOUBLE_EQ(config.get_double(config_section::SIMULATION, config_key::BASE_SPEED), 3.5);
}

TEST_F(ConfigTest, LoadFromStringMergesOverDefaults) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"simulation": {"max_turns": 12}})"));

    EXPECT_EQ(config.get_int(config_section::SIMULATION, config_key::MAX_TURNS), 12);
    EXPECT_EQ(config.get_int(config_section::SIMULATION, config_key::ACTOR_COUNT), 4);
    EXPECT_FALSE(config.is_dirty());
}

TEST_F(ConfigTest, RejectsInvalidJson) {
    Config config;

    EXPECT_FALSE(config.load_from_string("{ not json"));
    EXPECT_FALSE(config.load_from_string("[1, 2, 3]"));
    EXPECT_EQ(config.get_int(config_section::SIMULATION, config_key::MAX_TURNS), 100);
}

TEST_F(ConfigTest, SaveAndLoadRoundTrip) {
    auto path = test_dir_ / "config.json";

    Config original;
    original.set_bool(config_section::SCHEDULER, config_key::START_PAUSED, true);
    original.set_int(config_section::SIMULATION, config_key::ACTOR_COUNT, 9);
    ASSERT_TRUE(original.save(path));

    Config loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_TRUE(loaded.get_bool(config_section::SCHEDULER, config_key::START_PAUSED));
    EXPECT_EQ(loaded.get_int(config_section::SIMULATION, config_key::ACTOR_COUNT), 9);
    EXPECT_EQ(loaded.get_path(), path);
}

TEST_F(ConfigTest, LoadOrCreateDefaultWritesFile) {
    auto path = test_dir_ / "nested" / "config.json";

    Config config;
    EXPECT_TRUE(config.load_or_create_default(path));
    EXPECT_TRUE(platform::FileSystem::exists(path));
    EXPECT_FALSE(config.is_dirty());
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    Config config;
    EXPECT_FALSE(config.load(test_dir_ / "missing.json"));
}

TEST_F(ConfigTest, SaveWithoutPathFails) {
    Config config;
    EXPECT_FALSE(config.save());
}

TEST_F(ConfigTest, RemoveKey) {
    Config config;

    EXPECT_TRUE(config.remove(config_section::DEBUG, config_key::LOG_LEVEL));
    EXPECT_FALSE(config.has(config_section::DEBUG, config_key::LOG_LEVEL));
    EXPECT_FALSE(config.remove(config_section::DEBUG, config_key::LOG_LEVEL));
}

}  // namespace
}  // namespace tickwise::core
