#include "logger.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace {

class LoggerFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "labsched_logger_test.log";
        std::remove(path_.c_str());
    }

    void TearDown() override {
        // назад к тихой конфигурации из test_main
        LoggerConfig quiet;
        quiet.filePath = "";
        quiet.minLevel = LogLevel::Error;
        initLogger(quiet);
        std::remove(path_.c_str());
    }

    std::string readLog() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
};

TEST_F(LoggerFileTest, FiltersBelowMinimumLevel) {
    LoggerConfig cfg;
    cfg.filePath = path_;
    cfg.minLevel = LogLevel::Warning;
    cfg.toStderr = false;
    initLogger(cfg);

    logDebug("debug-line");
    logInfo("info-line");
    logWarning("warning-line");
    logError("error-line");

    std::string text = readLog();
    EXPECT_EQ(text.find("debug-line"), std::string::npos);
    EXPECT_EQ(text.find("info-line"), std::string::npos);
    EXPECT_NE(text.find("][WARN][t"), std::string::npos);
    EXPECT_NE(text.find("] warning-line\n"), std::string::npos);
    EXPECT_NE(text.find("][ERROR][t"), std::string::npos);
}

TEST_F(LoggerFileTest, AppendsAcrossReinit) {
    LoggerConfig cfg;
    cfg.filePath = path_;
    cfg.minLevel = LogLevel::Info;
    cfg.toStderr = false;

    initLogger(cfg);
    logInfo("first");
    initLogger(cfg);
    logInfo("second");

    std::string text = readLog();
    size_t first = text.find("first");
    size_t second = text.find("second");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

TEST(FormatLogLineTest, Layout) {
    std::string line = formatLogLine(LogLevel::Info, "t7", "hello");
    // [YYYY-MM-DD HH:MM:SS][INFO][t7] hello
    ASSERT_EQ(line.size(), 21u + std::string("[INFO][t7] hello").size());
    EXPECT_EQ(line[0], '[');
    EXPECT_EQ(line[20], ']');
    EXPECT_EQ(line.substr(21), "[INFO][t7] hello");
}

}  // namespace
