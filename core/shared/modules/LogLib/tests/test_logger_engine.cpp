/**
 * @file test_logger_engine.cpp
 * @brief LogLib LoggerEngine 단독 테스트
 */

#include "LoggerEngine.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using LogLib::LoggerEngine;
using LogLib::LogLevel;

class LoggerEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() / "baclink_loglib_test";
        fs::remove_all(base_);

        auto &engine = LoggerEngine::getInstance();
        engine.setConsoleOutput(false);
        engine.setFileOutput(true);
        engine.setFrameLogging(false);
        engine.clearCategoryLevels();
        engine.setMaxLogSizeMB(100);
        engine.setMaxLogFiles(30);
        engine.setLogBasePath(base_.string());
        engine.setLogLevel(LogLevel::DEBUG);
        engine.resetStatistics();
    }

    void TearDown() override {
        auto &engine = LoggerEngine::getInstance();
        engine.clearCategoryLevels();
        engine.setFrameLogging(false);
        engine.flushAll();
        fs::remove_all(base_);
    }

    // base_ 아래에서 파일 이름이 일치하는 첫 파일
    fs::path Find(const std::string &filename) {
        LoggerEngine::getInstance().flushAll();
        if (!fs::exists(base_)) {
            return {};
        }
        for (const auto &entry : fs::recursive_directory_iterator(base_)) {
            if (entry.path().filename() == filename) {
                return entry.path();
            }
        }
        return {};
    }

    std::string Read(const std::string &filename) {
        fs::path path = Find(filename);
        if (path.empty()) {
            return "";
        }
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path base_;
};

TEST_F(LoggerEngineTest, FiltersBelowMinimumLevel) {
    auto &engine = LoggerEngine::getInstance();
    engine.log("unit", LogLevel::INFO, "visible message");
    engine.log("unit", LogLevel::TRACE, "hidden message");

    std::string content = Read("unit.log");
    EXPECT_NE(content.find("visible message"), std::string::npos);
    EXPECT_EQ(content.find("hidden message"), std::string::npos);
    EXPECT_NE(content.find("[INFO][unit]"), std::string::npos);

    auto stats = engine.getStatistics();
    EXPECT_EQ(stats.total_logs, 1u);
    EXPECT_EQ(stats.count(LogLevel::INFO), 1u);
    EXPECT_EQ(stats.count(LogLevel::TRACE), 0u);
}

TEST_F(LoggerEngineTest, ErrorLevelIsWrittenWithPlainName) {
    auto &engine = LoggerEngine::getInstance();
    engine.log("unit", LogLevel::LOG_ERROR, "broken");

    EXPECT_NE(Read("unit.log").find("[ERROR][unit] broken"), std::string::npos);
    EXPECT_EQ(engine.getStatistics().count(LogLevel::LOG_ERROR), 1u);
}

TEST_F(LoggerEngineTest, FilesAreGroupedByDate) {
    LoggerEngine::getInstance().log("registry", LogLevel::INFO, "saved");

    fs::path path = Find("registry.log");
    ASSERT_FALSE(path.empty());
    EXPECT_EQ(path.parent_path().filename().string().size(), 8u);
    EXPECT_EQ(path.parent_path().parent_path(), base_);
}

TEST_F(LoggerEngineTest, CategoryLevelOverridesGlobalLevel) {
    auto &engine = LoggerEngine::getInstance();
    engine.setLogLevel(LogLevel::WARN);
    engine.setCategoryLevel("bacnet", LogLevel::TRACE);

    EXPECT_TRUE(engine.isEnabled("bacnet", LogLevel::TRACE));
    EXPECT_FALSE(engine.isEnabled("mqtt", LogLevel::INFO));
    EXPECT_EQ(engine.getEffectiveLevel("mqtt"), LogLevel::WARN);

    engine.log("bacnet", LogLevel::DEBUG, "frame decoded");
    engine.log("mqtt", LogLevel::INFO, "connected");

    EXPECT_NE(Read("bacnet.log").find("frame decoded"), std::string::npos);
    EXPECT_TRUE(Find("mqtt.log").empty());

    engine.clearCategoryLevels();
    EXPECT_FALSE(engine.isEnabled("bacnet", LogLevel::DEBUG));
}

TEST_F(LoggerEngineTest, OffSilencesCategory) {
    auto &engine = LoggerEngine::getInstance();
    engine.setCategoryLevel("noisy", LogLevel::OFF);
    engine.log("noisy", LogLevel::LOG_FATAL, "never");

    EXPECT_TRUE(Find("noisy.log").empty());
    EXPECT_EQ(engine.getStatistics().total_logs, 0u);
}

TEST_F(LoggerEngineTest, FramesAreDroppedUnlessEnabled) {
    auto &engine = LoggerEngine::getInstance();
    const std::vector<uint8_t> frame{0x81, 0x05, 0x00, 0x06, 0x00, 0x1e};

    engine.logFrame("bvll", "192.0.2.1:47808", frame, "Register-Foreign-Device");
    EXPECT_FALSE(fs::exists(base_ / "frames"));
    EXPECT_EQ(engine.getStatistics().frames, 0u);

    engine.setFrameLogging(true);
    engine.logFrame("bvll", "192.0.2.1:47808", frame, "Register-Foreign-Device");

    std::string content = Read("bvll.log");
    EXPECT_TRUE(fs::exists(base_ / "frames"));
    EXPECT_NE(content.find("[192.0.2.1:47808] Register-Foreign-Device (6 bytes)"),
              std::string::npos);
    EXPECT_NE(content.find("81 05 00 06 00 1e"), std::string::npos);
    EXPECT_EQ(engine.getStatistics().frames, 1u);
    EXPECT_EQ(engine.getStatistics().total_logs, 0u);
}

TEST_F(LoggerEngineTest, RotatesIntoNumberedBackups) {
    auto &engine = LoggerEngine::getInstance();
    engine.setMaxLogSizeMB(1);
    engine.setMaxLogFiles(2);

    const std::string chunk(64 * 1024, 'x');
    for (int i = 0; i < 40; ++i) {
        engine.log("bulk", LogLevel::INFO, chunk);
    }

    fs::path current = Find("bulk.log");
    ASSERT_FALSE(current.empty());
    EXPECT_TRUE(fs::exists(current.parent_path() / "bulk.1.log"));
    EXPECT_TRUE(fs::exists(current.parent_path() / "bulk.2.log"));
    EXPECT_FALSE(fs::exists(current.parent_path() / "bulk.3.log"));
    EXPECT_LT(fs::file_size(current), 1024u * 1024u);
}

TEST_F(LoggerEngineTest, DisabledFileOutputWritesNothing) {
    auto &engine = LoggerEngine::getInstance();
    engine.setFileOutput(false);
    engine.log("unit", LogLevel::INFO, "console only");

    EXPECT_FALSE(fs::exists(base_));
    EXPECT_EQ(engine.getStatistics().total_logs, 1u);
}

TEST_F(LoggerEngineTest, CleanupRemovesExpiredFilesAndEmptyDirectories) {
    auto &engine = LoggerEngine::getInstance();
    fs::path old_dir = base_ / "20200101";
    fs::create_directories(old_dir);
    {
        std::ofstream(old_dir / "engine.log") << "stale\n";
    }
    fs::last_write_time(old_dir / "engine.log",
                        fs::file_time_type::clock::now() - std::chrono::hours(24 * 40));

    engine.log("fresh", LogLevel::INFO, "recent");
    engine.flushAll();

    EXPECT_EQ(engine.cleanupOldLogs(30), 1u);
    EXPECT_FALSE(fs::exists(old_dir));
    EXPECT_FALSE(Find("fresh.log").empty());
    EXPECT_EQ(engine.cleanupOldLogs(0), 0u);
}

TEST(LogLevelParseTest, AcceptsAliasesCaseInsensitively) {
    EXPECT_EQ(LogLib::ParseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(LogLib::ParseLogLevel(" Error "), LogLevel::LOG_ERROR);
    EXPECT_EQ(LogLib::ParseLogLevel("err"), LogLevel::LOG_ERROR);
    EXPECT_EQ(LogLib::ParseLogLevel("critical"), LogLevel::LOG_FATAL);
    EXPECT_EQ(LogLib::ParseLogLevel("none"), LogLevel::OFF);
    EXPECT_FALSE(LogLib::ParseLogLevel("bogus").has_value());

    EXPECT_EQ(LoggerEngine::stringToLogLevel("bogus"), LogLevel::INFO);
    EXPECT_EQ(LoggerEngine::stringToLogLevel("", LogLevel::WARN), LogLevel::WARN);
    EXPECT_STREQ(LogLib::LogLevelToString(LogLevel::LOG_FATAL), "FATAL");
}

TEST(HexDumpTest, FormatsBytesAsSpacedPairs) {
    EXPECT_EQ(LoggerEngine::hexDump({0x81, 0x0a, 0xff}), "81 0a ff");
    EXPECT_EQ(LoggerEngine::hexDump({}), "");
}
