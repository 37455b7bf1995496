#include <gtest/gtest.h>
#include "Logger.h"
#include "LoggerMacros.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace TermXfer;
namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logPath_ = fs::temp_directory_path() / ("termxfer_logger_" + std::to_string(getpid()) + ".log");
        fs::remove(logPath_);
        Logger::instance().setConsoleOutput(false);
        Logger::instance().setLogFile(logPath_.string());
    }

    void TearDown() override {
        Logger::instance().setLogFile("/dev/null");
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setConsoleOutput(true);
        fs::remove(logPath_);
    }

    std::string contents() const {
        std::ifstream in(logPath_);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    fs::path logPath_;
};

TEST_F(LoggerTest, SingletonIsShared) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, WritesLevelAndComponent) {
    Logger::instance().setLevel(LogLevel::DEBUG);
    Logger::instance().info("Transfer started", "Sender");
    Logger::instance().error("Transfer failed", "Broker");

    std::string log = contents();
    EXPECT_NE(log.find("[INFO] [Sender] Transfer started"), std::string::npos);
    EXPECT_NE(log.find("[ERROR] [Broker] Transfer failed"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowCurrentLevel) {
    Logger::instance().setLevel(LogLevel::WARN);
    Logger::instance().info("hidden");
    LOG_DEBUG_COMP_IF("also hidden", "Test");
    Logger::instance().warn("shown");

    std::string log = contents();
    EXPECT_EQ(log.find("hidden"), std::string::npos);
    EXPECT_NE(log.find("shown"), std::string::npos);
}

TEST(LoggerLevelTest, ParseLevelIsCaseInsensitive) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("nonsense", LogLevel::CRITICAL), LogLevel::CRITICAL);
}
