#include "config/config.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace pushhub::config;
using json = nlohmann::json;

TEST(ConfigIdListTest, NumericTokensBecomeIntegers) {
    auto ids = parse_id_list("tools-list-push,1");
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], json("tools-list-push"));
    EXPECT_TRUE(ids[1].is_number_integer());
    EXPECT_EQ(ids[1], json(1));
}

TEST(ConfigIdListTest, WhitespaceAndEmptyTokens) {
    auto ids = parse_id_list(" a , ,42,, b2 ");
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], json("a"));
    EXPECT_EQ(ids[1], json(42));
    EXPECT_EQ(ids[2], json("b2"));
    EXPECT_TRUE(parse_id_list("").empty());
    EXPECT_TRUE(parse_id_list(" , ").empty());
}

TEST(ConfigIdListTest, NegativeOrHugeStaysString) {
    auto ids = parse_id_list("-1,99999999999999999999");
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_TRUE(ids[0].is_string());
    EXPECT_TRUE(ids[1].is_string());
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("pushhub_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".ini");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void write(const std::string &content) {
        std::ofstream out(path);
        out << content;
    }

    std::filesystem::path path;
};

TEST_F(ConfigFileTest, LoadsAllSections) {
    write("[server]\n"
          "ip=127.0.0.1\n"
          "port=9100\n"
          "io_threads=4\n"
          "server_name=test-hub\n"
          "log_level=debug\n"
          "[hub]\n"
          "heartbeat_interval_ms=1000\n"
          "channel_capacity=8\n"
          "overflow_policy=reject\n"
          "[notifier]\n"
          "list_changed_delay_ms=50\n"
          "direct_list_delay_ms=60\n"
          "direct_list_followup_ms=70\n"
          "direct_list_ids=a,2\n");

    auto config = GlobalConfig::load(path.string());
    EXPECT_EQ(config.server.ip, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9100);
    EXPECT_EQ(config.server.io_threads, 4u);
    EXPECT_EQ(config.server.server_name, "test-hub");
    EXPECT_EQ(config.server.log_level, "debug");
    EXPECT_EQ(config.hub.heartbeat_interval_ms, 1000u);
    EXPECT_EQ(config.hub.channel_capacity, 8u);
    EXPECT_EQ(config.hub.overflow_policy, "reject");
    EXPECT_EQ(config.notifier.list_changed_delay_ms, 50u);
    EXPECT_EQ(config.notifier.direct_list_delay_ms, 60u);
    EXPECT_EQ(config.notifier.direct_list_followup_ms, 70u);
    EXPECT_EQ(config.notifier.direct_list_ids, "a,2");
}

TEST_F(ConfigFileTest, MissingKeysKeepDefaults) {
    write("[server]\nport=8123\n");

    auto config = GlobalConfig::load(path.string());
    EXPECT_EQ(config.server.port, 8123);
    EXPECT_EQ(config.server.ip, "0.0.0.0");
    EXPECT_EQ(config.server.server_name, "calculator-server");
    EXPECT_EQ(config.hub.heartbeat_interval_ms, 25000u);
    EXPECT_EQ(config.hub.channel_capacity, 256u);
    EXPECT_EQ(config.hub.overflow_policy, "drop_oldest");
    EXPECT_TRUE(config.hub.send_connect_event);
    EXPECT_EQ(config.hub.shutdown_grace_ms, 1000u);
    EXPECT_EQ(config.notifier.list_changed_delay_ms, 500u);
    EXPECT_TRUE(config.notifier.direct_list_enabled);
    EXPECT_EQ(config.notifier.direct_list_ids, "tools-list-push,1");
}

TEST_F(ConfigFileTest, HeartbeatIntervalHasFloor) {
    write("[hub]\nheartbeat_interval_ms=0\nshutdown_grace_ms=250\n");

    auto config = GlobalConfig::load(path.string());
    EXPECT_EQ(config.hub.heartbeat_interval_ms, HubConfig::MIN_HEARTBEAT_INTERVAL_MS);
    EXPECT_EQ(config.hub.shutdown_grace_ms, 250u);
}

TEST(ConfigLoaderTest, NoneModeUsesDefaults) {
    DefaultConfigLoader loader;
    auto config = loader.load(ConfigMode::NONE);
    ASSERT_NE(config, nullptr);
    EXPECT_EQ(config->server.port, 8000);
    EXPECT_EQ(config->server.io_threads, 2u);
    EXPECT_EQ(config->hub.heartbeat_interval_ms, 25000u);
}

TEST(ConfigLoaderTest, StaticModeWithoutFileUsesDefaults) {
    auto missing = std::filesystem::temp_directory_path() / "pushhub_config_test_missing.ini";
    std::error_code ec;
    std::filesystem::remove(missing, ec);

    auto previous = get_config_file_path();
    set_config_file_path(missing.string());
    DefaultConfigLoader loader;
    auto config = loader.load(ConfigMode::STATIC);
    set_config_file_path(previous);

    ASSERT_NE(config, nullptr);
    EXPECT_EQ(config->server.server_name, "calculator-server");
    EXPECT_FALSE(std::filesystem::exists(missing));
}
