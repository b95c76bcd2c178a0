// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Newtonia Contributors

#include <newtonia/config.hpp>
#include <newtonia/formatter.hpp>
#include <newtonia/logger.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace newtonia {
namespace {

struct Captured {
    Level level;
    std::string line;
};

// Test fixture that captures every line instead of printing it
class LoggerTest : public ::testing::Test {
protected:
    Logger& make_logger(const LogConfig& config) {
        logger_ = std::make_unique<Logger>(config);
        logger_->set_write_callback([this](const LogRecord& record, std::string_view line) {
            captured_.push_back({record.level, std::string(line)});
            return false;
        });
        return *logger_;
    }

    void emit_all(Logger& logger) {
        logger.verbose("t", "verbose %d", 1);
        logger.debug("t", "debug %d", 2);
        logger.info("t", "info %d", 3);
        logger.warn("t", "warn %d", 4);
        logger.error("t", "error %d", 5);
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        for (const auto& c : captured_) out.push_back(c.line);
        return out;
    }

    std::unique_ptr<Logger> logger_;
    std::vector<Captured> captured_;
};

// ============================================================================
// LogConfig
// ============================================================================

TEST(LogConfigTest, DefaultChannels) {
    LogConfig config;
    EXPECT_FALSE(config.is_enabled(Level::Verbose));
    EXPECT_FALSE(config.is_enabled(Level::Debug));
    EXPECT_TRUE(config.is_enabled(Level::Info));
    EXPECT_TRUE(config.is_enabled(Level::Warn));
    EXPECT_TRUE(config.is_enabled(Level::Error));
    EXPECT_FALSE(config.is_enabled(Level::Off));
}

TEST(LogConfigTest, QuietKeepsErrors) {
    LogConfig config{.quiet = true};
    EXPECT_FALSE(config.is_enabled(Level::Info));
    EXPECT_FALSE(config.is_enabled(Level::Warn));
    EXPECT_TRUE(config.is_enabled(Level::Error));
    EXPECT_TRUE(config.is_enabled(Level::Fatal));
}

TEST(LogConfigTest, VerboseOverridesQuietForInfo) {
    LogConfig config{.verbose = true, .quiet = true};
    EXPECT_TRUE(config.is_enabled(Level::Verbose));
    EXPECT_TRUE(config.is_enabled(Level::Info));
    EXPECT_FALSE(config.is_enabled(Level::Warn));
}

TEST(LogConfigTest, DebugIndependentOfQuiet) {
    LogConfig config{.quiet = true, .debug = true};
    EXPECT_TRUE(config.is_enabled(Level::Debug));
    EXPECT_FALSE(config.is_enabled(Level::Verbose));
}

// ============================================================================
// Filtering
// ============================================================================

TEST_F(LoggerTest, DefaultShowsInfoWarnError) {
    emit_all(make_logger({}));
    std::vector<std::string> expected = {"info 3\n", "warn 4\n", "error 5\n"};
    EXPECT_EQ(lines(), expected);
}

TEST_F(LoggerTest, QuietShowsOnlyErrors) {
    emit_all(make_logger({.quiet = true}));
    std::vector<std::string> expected = {"error 5\n"};
    EXPECT_EQ(lines(), expected);
}

TEST_F(LoggerTest, VerboseAndDebugShowEverything) {
    emit_all(make_logger({.verbose = true, .debug = true}));
    EXPECT_EQ(captured_.size(), 5u);
    EXPECT_EQ(captured_.front().level, Level::Verbose);
    EXPECT_EQ(captured_.front().line, "verbose 1\n");
}

TEST_F(LoggerTest, LogMethodRespectsFilter) {
    auto& logger = make_logger({.quiet = true});
    logger.log(Level::Info, "t", "hidden");
    logger.log(Level::Error, "t", "shown");
    std::vector<std::string> expected = {"shown\n"};
    EXPECT_EQ(lines(), expected);
}

TEST_F(LoggerTest, CustomPattern) {
    auto& logger = make_logger({.format_pattern = "{level}/{tag}: {msg}"});
    logger.warn("batch", "value=%s", "x");
    std::vector<std::string> expected = {"W/batch: value=x"};
    EXPECT_EQ(lines(), expected);
}

TEST_F(LoggerTest, DetailedPatternPrefixesLines) {
    auto& logger = make_logger({.debug = true,
                                .format_pattern = std::string(Formatter::kDetailedPattern)});
    logger.debug("engine", "Input data size: %d bytes", 13);
    ASSERT_EQ(captured_.size(), 1u);
    const auto& line = captured_[0].line;
    EXPECT_EQ(line.substr(0, 4), "[D][");
    EXPECT_NE(line.find("][engine] Input data size: 13 bytes\n"), std::string::npos) << line;
}

TEST_F(LoggerTest, LongMessagesNotTruncated) {
    auto& logger = make_logger({});
    std::string big(10000, 'z');
    logger.info("t", "%s", big.c_str());
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].line.size(), big.size() + 1);
}

TEST_F(LoggerTest, ConfigAccessor) {
    auto& logger = make_logger({.verbose = true});
    EXPECT_TRUE(logger.config().verbose);
    EXPECT_TRUE(logger.is_enabled(Level::Verbose));
    EXPECT_FALSE(logger.is_enabled(Level::Debug));
}

TEST_F(LoggerTest, MoveKeepsConfiguration) {
    Logger original(LogConfig{.debug = true});
    Logger moved(std::move(original));
    EXPECT_TRUE(moved.is_enabled(Level::Debug));
}

} // namespace
} // namespace newtonia
