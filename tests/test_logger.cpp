#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/logger.hpp"

using namespace mydbd::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = (std::filesystem::temp_directory_path() / "mydbd_logger_test" / "test.log").string();
        std::filesystem::remove_all(std::filesystem::path(path).parent_path());
    }

    void TearDown() override {
        // 恢复默认配置，关闭日志文件
        Logger::instance().configure(LogLevel::Info);
        std::filesystem::remove_all(std::filesystem::path(path).parent_path());
    }

    std::string readLog() const {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::string path;
};

TEST_F(LoggerTest, WritesToFileWithComponent) {
    Logger::instance().configure(LogLevel::Trace, path, false);

    MYDBD_LOG_INFO("database", "Connected to ", "db1", ":", 3306);
    MYDBD_LOG_ERROR("statement", "Driver error ", 1062);

    ASSERT_TRUE(std::filesystem::exists(path));
    auto content = readLog();
    EXPECT_NE(content.find("[INFO] [database] Connected to db1:3306"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] [statement] Driver error 1062"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger::instance().configure(LogLevel::Warn, path, false);

    MYDBD_LOG_DEBUG("query_log", "hidden");
    MYDBD_LOG_INFO("database", "hidden too");
    MYDBD_LOG_WARN("database", "shown");

    auto content = readLog();
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("[WARN] [database] shown"), std::string::npos);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Warn);
}

TEST(LogLevelTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("verbose", LogLevel::Error), LogLevel::Error);
}
