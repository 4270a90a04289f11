#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"

// kcenon headers for the mock logger registration
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace cpr::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return log_level::trace; }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const { return flushed_.load(std::memory_order_acquire); }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<bool> flushed_{false};
};

class RuntimeLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
        RuntimeLogger::instance().setAllLevels(LogLevel::Info);
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// Names and parsing
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, CategoryNames) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Discovery), "Discovery");
    EXPECT_EQ(logCategoryName(LogCategory::Loader), "Loader");
    EXPECT_EQ(logCategoryName(LogCategory::Lifecycle), "Lifecycle");
    EXPECT_EQ(logCategoryName(LogCategory::Security), "Security");
    EXPECT_EQ(logCategoryName(LogCategory::Isolation), "Isolation");
    EXPECT_EQ(logCategoryName(LogCategory::State), "State");
    EXPECT_EQ(logCategoryName(LogCategory::Stream), "Stream");
    EXPECT_EQ(logCategoryName(LogCategory::Events), "Events");
    EXPECT_EQ(kLogCategoryCount, 9u);
}

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

// ---------------------------------------------------------------------------
// Level control
// ---------------------------------------------------------------------------

TEST(RuntimeLoggerBasicTest, DefaultsToInfo) {
    RuntimeLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Security), LogLevel::Info);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Core));
}

TEST(RuntimeLoggerBasicTest, SetCategoryLevelOnlyAffectsThatCategory) {
    RuntimeLogger logger;
    logger.setCategoryLevel(LogCategory::Isolation, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Isolation));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Loader));
}

TEST(RuntimeLoggerBasicTest, SetAllLevelsAndOff) {
    RuntimeLogger logger;
    logger.setAllLevels(LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Stream));

    logger.setAllLevels(LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Events));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Events));
}

TEST(RuntimeLoggerBasicTest, InvalidCategoryIsOff) {
    RuntimeLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(RuntimeLoggerTest, LogPrefixesCategory) {
    RuntimeLogger logger;
    logger.log(LogLevel::Warning, LogCategory::Security, "limit exceeded");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message, "[Security] limit exceeded");
}

TEST_F(RuntimeLoggerTest, LogFiltersBelowLevel) {
    RuntimeLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Loader, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(RuntimeLoggerTest, ContextFieldsAreAppended) {
    RuntimeLogger logger;
    LogContext ctx;
    ctx.extensionId = "text.tools";
    ctx.action = "summarize";
    ctx.streamId = 7;
    ctx.extra["limit"] = "wall_clock";
    logger.logWithContext(LogLevel::Info, LogCategory::Stream, "closed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Stream] closed {"), std::string::npos);
    EXPECT_NE(msg.find("extension=text.tools"), std::string::npos);
    EXPECT_NE(msg.find("action=summarize"), std::string::npos);
    EXPECT_NE(msg.find("stream=7"), std::string::npos);
    EXPECT_NE(msg.find("limit=wall_clock"), std::string::npos);
}

TEST_F(RuntimeLoggerTest, EmptyContextOmitsBraces) {
    RuntimeLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "plain", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] plain");
}

TEST_F(RuntimeLoggerTest, FlushDelegatesToLogger) {
    RuntimeLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(RuntimeLoggerTest, MacroHonorsSingletonLevels) {
    RuntimeLogger::instance().setCategoryLevel(LogCategory::Discovery, LogLevel::Debug);
    CPR_LOG_DEBUG(LogCategory::Discovery, "scanning root");

    RuntimeLogger::instance().setCategoryLevel(LogCategory::Discovery, LogLevel::Error);
    CPR_LOG_WARN(LogCategory::Discovery, "should not appear");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Discovery] scanning root");
}
