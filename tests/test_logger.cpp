#include <gtest/gtest.h>
#include "logger.h"

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static std::string readFile(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = (fs::temp_directory_path() / "transfer_test_logger.log").string();
        fs::remove(log_path_);
        saved_level_ = Logger::instance().level();
        Logger::instance().setLevel(LogLevel::LVL_INFO);
    }

    void TearDown() override {
        // Release the file handle held by the singleton.
        Logger::instance().setLogFile("");
        Logger::instance().setLevel(saved_level_);
        fs::remove(log_path_);
    }

    std::string log_path_;
    LogLevel saved_level_ = LogLevel::LVL_INFO;
};

TEST_F(LoggerTest, SingletonReturnsSameInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, LineHasTimestampAndLevel) {
    Logger::instance().setLogFile(log_path_);
    Logger::instance().info("Transfer 7 download finished");

    std::string content = readFile(log_path_);
    std::regex pattern(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] \[INFO\] Transfer 7 download finished)");
    EXPECT_TRUE(std::regex_search(content, pattern));
}

TEST_F(LoggerTest, EveryLevelWritesItsTag) {
    Logger::instance().setLevel(LogLevel::LVL_DEBUG);
    Logger::instance().setLogFile(log_path_);
    Logger::instance().debug("d");
    Logger::instance().info("i");
    Logger::instance().warn("w");
    Logger::instance().error("e");

    std::string content = readFile(log_path_);
    EXPECT_NE(content.find("[DEBUG] d"), std::string::npos);
    EXPECT_NE(content.find("[INFO] i"), std::string::npos);
    EXPECT_NE(content.find("[WARN] w"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] e"), std::string::npos);
}

// ── Level filter ───────────────────────────────────────────────

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    Logger::instance().setLogFile(log_path_);
    Logger::instance().setLevel(LogLevel::LVL_WARN);
    Logger::instance().debug("hidden debug");
    Logger::instance().info("hidden info");
    Logger::instance().warn("shown warn");

    std::string content = readFile(log_path_);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("[WARN] shown warn"), std::string::npos);
}

TEST_F(LoggerTest, DefaultLevelSkipsDebug) {
    Logger::instance().setLogFile(log_path_);
    Logger::instance().debug("chunk of 16384 bytes");

    EXPECT_EQ(readFile(log_path_).find("chunk of 16384 bytes"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::LVL_DEBUG);
    EXPECT_EQ(Logger::parseLevel("info"), LogLevel::LVL_INFO);
    EXPECT_EQ(Logger::parseLevel("warn"), LogLevel::LVL_WARN);
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::LVL_ERROR);
    EXPECT_EQ(Logger::parseLevel("verbose"), LogLevel::LVL_INFO);
    EXPECT_EQ(Logger::parseLevel(""), LogLevel::LVL_INFO);
}

// ── Log file ───────────────────────────────────────────────────

TEST_F(LoggerTest, LinesAreWrittenInOrder) {
    Logger::instance().setLogFile(log_path_);
    for (int i = 0; i < 5; ++i) {
        Logger::instance().info("msg" + std::to_string(i));
    }

    std::string content = readFile(log_path_);
    size_t previous = 0;
    for (int i = 0; i < 5; ++i) {
        size_t at = content.find("msg" + std::to_string(i));
        ASSERT_NE(at, std::string::npos);
        EXPECT_GE(at, previous);
        previous = at;
    }
}

TEST_F(LoggerTest, EmptyPathClosesFile) {
    Logger::instance().setLogFile(log_path_);
    Logger::instance().info("before close");
    Logger::instance().setLogFile("");
    Logger::instance().info("after close");

    std::string content = readFile(log_path_);
    EXPECT_NE(content.find("before close"), std::string::npos);
    EXPECT_EQ(content.find("after close"), std::string::npos);

    // Reopening appends
    Logger::instance().setLogFile(log_path_);
    Logger::instance().info("reopened");
    content = readFile(log_path_);
    EXPECT_NE(content.find("before close"), std::string::npos);
    EXPECT_NE(content.find("reopened"), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    Logger::instance().setLogFile(log_path_);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                Logger::instance().info("t" + std::to_string(t) + "_m" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::string content = readFile(log_path_);
    int line_count = 0;
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) ++line_count;
    }
    EXPECT_EQ(line_count, kThreads * kMessagesPerThread);
}
