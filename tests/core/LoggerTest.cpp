#include <gtest/gtest.h>
#include <strata/common/Logger.h>

#include <memory>
#include <string>
#include <vector>

using namespace strata;

namespace {

struct RecordedLine {
    LogLevel level;
    std::string message;
};

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<RecordedLine>& sink) : sink_(sink) {}

    void log(LogLevel level, const std::string& message,
             const std::source_location&) override {
        if (level >= level_) {
            sink_.push_back({level, message});
        }
    }
    void setLevel(LogLevel level) override { level_ = level; }
    void flush() override {}

private:
    std::vector<RecordedLine>& sink_;
    LogLevel level_ = LogLevel::Trace;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::clearCapturedLogs();
        Logger::enableCapture(true);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(nullptr);
    }
};

}  // namespace

static void emitWarning() {
    LOG_WARN("edge {} -> {} skipped", "a", "b");
}

// =============================================================================
// Level parsing
// =============================================================================

TEST(LogLevelTest, Parse_AcceptsAliasesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("Err"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST(LogLevelTest, Name_MatchesParser) {
    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                           LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parseLogLevel(logLevelName(level)), level);
    }
}

// =============================================================================
// Capture
// =============================================================================

TEST_F(LoggerTest, Capture_PrefixesLevelAndFunction) {
    emitWarning();

    auto lines = Logger::getCapturedLogs("[warn]");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("emitWarning() - edge a -> b skipped"), std::string::npos);
}

TEST_F(LoggerTest, Capture_FiltersByPatternAndKeepsNewest) {
    LOG_INFO("first {}", 1);
    LOG_INFO("second {}", 2);
    LOG_ERROR("third {}", 3);

    EXPECT_EQ(Logger::getCapturedLogs().size(), 3u);
    EXPECT_EQ(Logger::getCapturedLogs("[info]").size(), 2u);

    auto newest = Logger::getCapturedLogs("", 1);
    ASSERT_EQ(newest.size(), 1u);
    EXPECT_NE(newest[0].find("third 3"), std::string::npos);
}

TEST_F(LoggerTest, Capture_DisabledRecordsNothing) {
    Logger::enableCapture(false);
    EXPECT_FALSE(Logger::isCaptureEnabled());

    LOG_WARN("not kept");

    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, ClearCapturedLogs_EmptiesBuffer) {
    LOG_DEBUG("something");
    Logger::clearCapturedLogs();
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

// =============================================================================
// Backend
// =============================================================================

TEST_F(LoggerTest, SetBackend_RoutesMessagesAndLevel) {
    std::vector<RecordedLine> lines;
    Logger::setBackend(std::make_unique<RecordingBackend>(lines));
    Logger::setLevel(LogLevel::Warn);

    LOG_INFO("dropped");
    LOG_WARN("kept {}", 42);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, LogLevel::Warn);
    EXPECT_NE(lines[0].message.find("kept 42"), std::string::npos);
}

TEST_F(LoggerTest, ResetBackend_FallsBackToDefault) {
    Logger::setBackend(nullptr);
    EXPECT_NO_THROW(LOG_INFO("default backend"));
    EXPECT_NO_THROW(Logger::flush());
}
