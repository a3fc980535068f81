#include <gtest/gtest.h>
#include "feedweave/common/log.hpp"
#include "common/test_sources.hpp"
#include <sstream>

using namespace feedweave;
using namespace feedweave::test_support;

// =============================================================================
// StreamLogSink
// =============================================================================

class StreamLogSinkTests : public ::testing::Test
{
protected:
    std::ostringstream out;
};

TEST_F(StreamLogSinkTests, Write_FormatsOneLinePerRecord)
{
    StreamLogSink sink{out, LogLevel::Debug};
    sink.write(LogLevel::Warning, "engine", "something happened");
    EXPECT_EQ(out.str(), "[feedweave] [warning] [engine] something happened\n");
}

TEST_F(StreamLogSinkTests, Write_BelowMinimumLevel_IsDropped)
{
    StreamLogSink sink{out, LogLevel::Warning};
    sink.write(LogLevel::Info, "engine", "chatty");
    sink.write(LogLevel::Error, "engine", "bad");
    EXPECT_EQ(out.str(), "[feedweave] [error] [engine] bad\n");
}

TEST_F(StreamLogSinkTests, Enabled_NeverForOff)
{
    StreamLogSink sink{out, LogLevel::Debug};
    EXPECT_TRUE(sink.enabled(LogLevel::Debug));
    EXPECT_FALSE(sink.enabled(LogLevel::Off));
}

// =============================================================================
// Logger
// =============================================================================

class LoggerTests : public ::testing::Test
{
protected:
    std::shared_ptr<RecordingLogSink> sink = std::make_shared<RecordingLogSink>();
};

TEST_F(LoggerTests, Log_TagsRecordsWithComponent)
{
    Logger logger{sink, "refresh"};
    logger.warning("slow source");

    auto records = sink->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Warning);
    EXPECT_EQ(records[0].component, "refresh");
    EXPECT_EQ(records[0].message, "slow source");
}

TEST_F(LoggerTests, Child_SharesSinkWithNewComponent)
{
    Logger parent{sink, "engine"};
    Logger child = parent.child("timer");
    child.info("armed");

    auto records = sink->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].component, "timer");
    EXPECT_EQ(parent.component(), "engine");
}

TEST_F(LoggerTests, DefaultConstructed_WritesNothing)
{
    Logger logger;
    EXPECT_FALSE(logger.enabled(LogLevel::Error));
    EXPECT_NO_THROW(logger.error("ignored"));
}

TEST_F(LoggerTests, NullSink_IsNeverEnabled)
{
    Logger logger{std::make_shared<NullLogSink>(), "engine"};
    EXPECT_FALSE(logger.enabled(LogLevel::Error));
}

TEST(LogLevelTests, ToString_NamesEveryLevel)
{
    EXPECT_STREQ(to_string(LogLevel::Debug), "debug");
    EXPECT_STREQ(to_string(LogLevel::Info), "info");
    EXPECT_STREQ(to_string(LogLevel::Warning), "warning");
    EXPECT_STREQ(to_string(LogLevel::Error), "error");
    EXPECT_STREQ(to_string(LogLevel::Off), "off");
}
