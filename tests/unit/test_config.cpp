#include <gtest/gtest.h>

#include "Config.h"
#include "Logger.h"
#include "TransferSettings.h"
#include "TestHarness.h"

#include <unistd.h>

using namespace TermXfer;
using namespace TermXfer::test;

class TransferSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("termxfer_config_" + std::to_string(::getpid()));
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        fs::remove_all(testDir_);
    }

    fs::path testDir_;
};

TEST_F(TransferSettingsTest, DefaultsWithEmptyConfig) {
    Config config;
    TransferSettings s = TransferSettings::fromConfig(config);
    EXPECT_TRUE(s.bypassSecret.empty());
    EXPECT_EQ(s.expireTime, std::chrono::minutes(10));
    EXPECT_EQ(s.maxActiveReceives, 10u);
    EXPECT_EQ(s.maxActiveSends, 10u);
    EXPECT_EQ(s.chunkSize, 1024u * 1024u);
    EXPECT_EQ(s.retryDelay, std::chrono::milliseconds(200));
    EXPECT_EQ(s.sendPumpDelay, std::chrono::milliseconds(50));
    EXPECT_EQ(s.cancelGrace, std::chrono::seconds(5));
}

TEST_F(TransferSettingsTest, OverridesAndClamps) {
    Config config;
    config.set("transfer.bypass_secret", "hunter2");
    config.setInt("transfer.expire_minutes", -3);
    config.setSize("transfer.max_active_receives", 2);
    config.setSize("transfer.chunk_size", 100);
    config.setInt("transfer.retry_delay_ms", 25);

    TransferSettings s = TransferSettings::fromConfig(config);
    EXPECT_EQ(s.bypassSecret, "hunter2");
    EXPECT_EQ(s.expireTime, std::chrono::minutes(10));
    EXPECT_EQ(s.maxActiveReceives, 2u);
    EXPECT_EQ(s.chunkSize, 4096u);
    EXPECT_EQ(s.retryDelay, std::chrono::milliseconds(25));
}

TEST_F(TransferSettingsTest, LoadsFromFile) {
    fs::path file = testDir_ / "termxfer.conf";
    writeFile(file,
              "# transfer tuning\n"
              "\n"
              "transfer.expire_minutes = 3\n"
              "transfer.max_active_sends=1\n"
              "log.level = debug\n"
              "not a setting\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(file.string()));
    EXPECT_FALSE(config.hasKey("not a setting"));
    EXPECT_EQ(config.get("log.level"), "debug");

    TransferSettings s = TransferSettings::fromConfig(config);
    EXPECT_EQ(s.expireTime, std::chrono::minutes(3));
    EXPECT_EQ(s.maxActiveSends, 1u);
    EXPECT_EQ(Logger::parseLevel(config.get("log.level"), LogLevel::WARN), LogLevel::DEBUG);
}

TEST_F(TransferSettingsTest, MissingFileIsReported) {
    Config config;
    EXPECT_FALSE(config.loadFromFile((testDir_ / "absent.conf").string()));
}
