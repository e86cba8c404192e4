/*
 * BinSight - Binary Content Analysis Toolkit
 * Copyright (C) 2026 BinSight Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>
#include "../../../src/Utils/Logger.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

using namespace BinSight::Utils;
namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("binsight_logger_") + info->name());
        fs::remove_all(dir);
    }

    void TearDown() override {
        Logger::Instance().ShutDown();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    LoggerConfig FileConfig(bool async = false) const {
        LoggerConfig cfg;
        cfg.async = async;
        cfg.toConsole = false;
        cfg.toFile = true;
        cfg.logDirectory = dir.string();
        cfg.baseFileName = "test";
        cfg.minimalLevel = LogLevel::Trace;
        return cfg;
    }

    static size_t CountOf(const std::string& text, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
            ++n;
        }
        return n;
    }

    std::string ReadLog(const std::string& name = "test.log") const {
        std::ifstream in(dir / name, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    for (LogLevel lvl : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                         LogLevel::Warn, LogLevel::Error, LogLevel::Fatal}) {
        LogLevel parsed = LogLevel::Info;
        ASSERT_TRUE(LogLevelFromString(LogLevelToString(lvl), parsed));
        EXPECT_EQ(parsed, lvl);
    }
}

TEST_F(LoggerTest, LevelParsingIsCaseInsensitive) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(LogLevelFromString("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(LogLevelFromString("Warning", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);

    lvl = LogLevel::Error;
    EXPECT_FALSE(LogLevelFromString("verbose", lvl));
    EXPECT_FALSE(LogLevelFromString("", lvl));
    EXPECT_EQ(lvl, LogLevel::Error);
}

TEST_F(LoggerTest, NothingWrittenBeforeInitialize) {
    ASSERT_FALSE(Logger::Instance().IsInitialized());
    BS_LOG_ERROR("Test", "dropped %d", 1);
    EXPECT_FALSE(fs::exists(dir / "test.log"));
}

TEST_F(LoggerTest, SyncFileOutput) {
    Logger::Instance().Initialize(FileConfig());
    ASSERT_TRUE(Logger::Instance().IsInitialized());

    BS_LOG_INFO("Entropy", "section %s entropy %.2f", ".text", 6.5);
    BS_LOG_WARN("Digest", "value %d", 42);
    Logger::Instance().ShutDown();

    const std::string text = ReadLog();
    EXPECT_NE(text.find("[INFO]"), std::string::npos) << text;
    EXPECT_NE(text.find("[Entropy]"), std::string::npos) << text;
    EXPECT_NE(text.find("section .text entropy 6.50"), std::string::npos) << text;
    EXPECT_NE(text.find("[WARN]"), std::string::npos) << text;
    EXPECT_NE(text.find("value 42"), std::string::npos) << text;
}

TEST_F(LoggerTest, AsyncOutputIsDrainedOnShutDown) {
    Logger::Instance().Initialize(FileConfig(true));
    for (int i = 0; i < 100; ++i) {
        BS_LOG_DEBUG("Async", "message %d", i);
    }
    Logger::Instance().ShutDown();

    const std::string text = ReadLog();
    EXPECT_NE(text.find("message 0"), std::string::npos);
    EXPECT_NE(text.find("message 99"), std::string::npos);
}

TEST_F(LoggerTest, MinimalLevelFilters) {
    auto cfg = FileConfig();
    cfg.minimalLevel = LogLevel::Warn;
    Logger::Instance().Initialize(cfg);

    EXPECT_FALSE(Logger::Instance().IsEnabled(LogLevel::Info));
    EXPECT_TRUE(Logger::Instance().IsEnabled(LogLevel::Warn));
    EXPECT_TRUE(Logger::Instance().IsEnabled(LogLevel::Fatal));

    BS_LOG_INFO("Filter", "hidden");
    BS_LOG_ERROR("Filter", "shown");

    Logger::Instance().setMinimalLevel(LogLevel::Trace);
    BS_LOG_TRACE("Filter", "now visible");
    Logger::Instance().ShutDown();

    const std::string text = ReadLog();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown"), std::string::npos);
    EXPECT_NE(text.find("now visible"), std::string::npos);
}

TEST_F(LoggerTest, JsonLinesEscapesMessage) {
    auto cfg = FileConfig();
    cfg.jsonLines = true;
    cfg.includeSrcLocation = false;
    Logger::Instance().Initialize(cfg);

    BS_LOG_INFO("Json", "quote \" backslash \\ done");
    Logger::Instance().ShutDown();

    const std::string text = ReadLog();
    EXPECT_EQ(text.front(), '{');
    EXPECT_NE(text.find("\"level\":\"INFO\""), std::string::npos) << text;
    EXPECT_NE(text.find("\"category\":\"Json\""), std::string::npos) << text;
    EXPECT_NE(text.find("quote \\\" backslash \\\\ done"), std::string::npos) << text;
}

TEST_F(LoggerTest, RotatesWhenFileIsFull) {
    auto cfg = FileConfig();
    cfg.maxFileSizeBytes = 512;
    cfg.maxFileCount = 2;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 50; ++i) {
        BS_LOG_INFO("Rotate", "filler line number %d with some padding text", i);
    }
    Logger::Instance().ShutDown();

    EXPECT_TRUE(fs::exists(dir / "test.log"));
    EXPECT_TRUE(fs::exists(dir / "test.1.log"));
    EXPECT_TRUE(fs::exists(dir / "test.2.log"));
    EXPECT_FALSE(fs::exists(dir / "test.3.log"));
    EXPECT_LE(fs::file_size(dir / "test.log"), 512u);
}

TEST_F(LoggerTest, ScopeLogsEnterAndExit) {
    Logger::Instance().Initialize(FileConfig());
    {
        BS_LOG_SCOPE("Scoped");
    }
    Logger::Instance().ShutDown();

    const std::string text = ReadLog();
    EXPECT_NE(text.find("Enter"), std::string::npos) << text;
    EXPECT_NE(text.find("Exit ("), std::string::npos) << text;
}

TEST_F(LoggerTest, FormatMessageHandlesLongOutput) {
    Logger::Instance().Initialize(FileConfig());
    const std::string big(5000, 'x');
    BS_LOG_INFO("Long", "%s|end", big.c_str());
    Logger::Instance().ShutDown();

    EXPECT_NE(ReadLog().find(big + "|end"), std::string::npos);
}

TEST_F(LoggerTest, FlushWritesQueuedMessages) {
    auto cfg = FileConfig(true);
    cfg.flushLevel = LogLevel::Fatal;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 500; ++i) {
        BS_LOG_INFO("Flush", "queued %d;", i);
    }
    Logger::Instance().Flush();

    // worker still running, nothing may be left in the queue
    const std::string text = ReadLog();
    EXPECT_EQ(CountOf(text, "queued "), 500u);
    EXPECT_NE(text.find("queued 499;"), std::string::npos);
}

TEST_F(LoggerTest, ReinitializeWhileLoggingKeepsEveryMessage) {
    constexpr int kMessages = 2000;

    auto asyncCfg = FileConfig(true);
    asyncCfg.maxQueueSize = 8;
    asyncCfg.bpPolicy = LoggerConfig::BackPressurePolicy::Block;
    const auto syncCfg = FileConfig(false);

    Logger::Instance().Initialize(asyncCfg);

    std::atomic<bool> done{ false };
    std::thread producer([&] {
        for (int i = 0; i < kMessages; ++i) {
            BS_LOG_INFO("Race", "concurrent message %d;", i);
        }
        done.store(true);
    });

    for (int round = 0; round < 20 && !done.load(); ++round) {
        Logger::Instance().Initialize(round % 2 == 0 ? syncCfg : asyncCfg);
        std::this_thread::yield();
    }

    producer.join();
    Logger::Instance().ShutDown();

    const std::string text = ReadLog();
    EXPECT_EQ(CountOf(text, "concurrent message "), static_cast<size_t>(kMessages));
    EXPECT_NE(text.find("concurrent message 0;"), std::string::npos);
    EXPECT_NE(text.find("concurrent message 1999;"), std::string::npos);
}

TEST_F(LoggerTest, ShutDownWhileLoggingIsSafe) {
    Logger::Instance().Initialize(FileConfig(true));

    std::thread producer([] {
        for (int i = 0; i < 1000; ++i) {
            BS_LOG_INFO("Race", "late message %d", i);
        }
    });
    Logger::Instance().ShutDown();
    producer.join();

    // messages after ShutDown are dropped; the rest reached the file exactly once
    const std::string text = ReadLog();
    EXPECT_LE(CountOf(text, "late message "), 1000u);
    EXPECT_FALSE(Logger::Instance().IsInitialized());
}
