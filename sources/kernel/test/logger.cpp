#include <gtest/gtest.h>

#include "logger/logger.hpp"

struct RecordedMessage {
    cm::LogLevel level;
    const cm::Logger *logger;
    std::string message;
};

class TestAppender final : public cm::ILogAppender {
public:
    std::vector<RecordedMessage> mMessages;

    void write(const cm::LogMessageView& message) override {
        mMessages.push_back({
            .level = message.level,
            .logger = message.logger,
            .message = std::string(std::string_view(message.message)),
        });
    }
};

class LoggerTest : public testing::Test {
public:
    void SetUp() override {
        ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);
    }

    void AssertMessage(size_t index, cm::LogLevel level, std::string_view message) {
        ASSERT_GT(appender.mMessages.size(), index);
        EXPECT_EQ(appender.mMessages[index].level, level);
        EXPECT_EQ(appender.mMessages[index].message, message);
        EXPECT_EQ(appender.mMessages[index].logger, &logger);
    }

    cm::LogQueue queue;
    TestAppender appender;
    cm::Logger logger{"TestLogger", &queue};
};

TEST_F(LoggerTest, Name) {
    EXPECT_EQ(logger.getName(), "TestLogger");
    EXPECT_EQ(appender.mMessages.size(), 0);
}

TEST_F(LoggerTest, LogMessage) {
    logger.dbgf("Test message");
    EXPECT_EQ(appender.mMessages.size(), 1);
    AssertMessage(0, cm::LogLevel::eDebug, "Test message");
    EXPECT_EQ(queue.getCommittedCount(), 1);
}

TEST_F(LoggerTest, FormatSeverityLevels) {
    logger.dbgf("Debug message ", 25);
    logger.infof("Info message ", true);
    logger.warnf("Warning message ", 1234);
    logger.errorf("Error message ", cm::Hex(0xDEADBEEF), " more text");
    logger.fatalf("Fatal message ", OsStatusId(OsStatusNotFound));

    EXPECT_EQ(appender.mMessages.size(), 5);

    AssertMessage(0, cm::LogLevel::eDebug, "Debug message 25");
    AssertMessage(1, cm::LogLevel::eInfo, "Info message True");
    AssertMessage(2, cm::LogLevel::eWarning, "Warning message 1234");
    AssertMessage(3, cm::LogLevel::eError, "Error message 0xDEADBEEF more text");
    AssertMessage(4, cm::LogLevel::eFatal, "Fatal message Not found (0x00000002)");
}

TEST_F(LoggerTest, Println) {
    logger.println("| ", 1, " |");
    AssertMessage(0, cm::LogLevel::ePrint, "| 1 |\n");
}

TEST_F(LoggerTest, LongMessageIsTruncated) {
    std::string text(cm::kLogMessageSize * 2, 'x');
    logger.infof(stdx::StringView(text.data(), text.data() + text.size()));

    ASSERT_EQ(appender.mMessages.size(), 1);
    EXPECT_EQ(appender.mMessages[0].message.size(), cm::kLogMessageSize);
}

TEST(LogQueueTest, AddAppender) {
    cm::LogQueue queue;
    TestAppender appender;

    ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);
    ASSERT_EQ(queue.addAppender(&appender), OsStatusAlreadyExists);
    ASSERT_EQ(queue.appenderCount(), 1);

    queue.removeAppender(&appender);
    ASSERT_EQ(queue.appenderCount(), 0);
}

TEST(LogQueueTest, AppenderLimit) {
    cm::LogQueue queue;
    TestAppender appenders[5];

    for (size_t i = 0; i < 4; i++) {
        ASSERT_EQ(queue.addAppender(&appenders[i]), OsStatusSuccess);
    }

    ASSERT_EQ(queue.addAppender(&appenders[4]), OsStatusOutOfMemory);
}

TEST(LogQueueTest, ReplaceAppender) {
    cm::LogQueue queue;
    TestAppender console;
    TestAppender serial;
    cm::Logger logger { "TEST", &queue };

    ASSERT_EQ(queue.addAppender(&console), OsStatusSuccess);
    logger.infof("before");

    ASSERT_EQ(queue.replaceAppender(&console, &serial), OsStatusSuccess);
    logger.infof("after");

    ASSERT_EQ(console.mMessages.size(), 1);
    ASSERT_EQ(serial.mMessages.size(), 1);
    ASSERT_EQ(serial.mMessages[0].message, "after");

    ASSERT_EQ(queue.replaceAppender(&console, &serial), OsStatusNotFound);
}

TEST(LogQueueTest, FanOut) {
    cm::LogQueue queue;
    TestAppender first;
    TestAppender second;
    cm::Logger logger { "TEST", &queue };

    ASSERT_EQ(queue.addAppender(&first), OsStatusSuccess);
    ASSERT_EQ(queue.addAppender(&second), OsStatusSuccess);

    logger.warnf("message");

    ASSERT_EQ(first.mMessages.size(), 1);
    ASSERT_EQ(second.mMessages.size(), 1);
}

class ReentrantAppender final : public cm::ILogAppender {
public:
    cm::Logger *mLogger = nullptr;
    size_t mWrites = 0;

    void write(const cm::LogMessageView&) override {
        mWrites += 1;
        mLogger->infof("nested");
    }
};

TEST(LogQueueTest, NestedMessageIsDropped) {
    cm::LogQueue queue;
    cm::Logger logger { "TEST", &queue };
    ReentrantAppender appender;
    appender.mLogger = &logger;

    ASSERT_EQ(queue.addAppender(&appender), OsStatusSuccess);

    logger.infof("outer");

    ASSERT_EQ(appender.mWrites, 1);
    ASSERT_EQ(queue.getDroppedCount(), 1);
    ASSERT_EQ(queue.getCommittedCount(), 1);
}
