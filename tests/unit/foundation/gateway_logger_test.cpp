#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "gcb/foundation/error_code.hpp"
#include "gcb/foundation/gateway_error.hpp"
#include "gcb/foundation/gateway_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace gcb::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class GatewayLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// ErrorCode / GatewayError
// ---------------------------------------------------------------------------

TEST(GatewayErrorTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::TransportLost), "Network");
    EXPECT_EQ(errorSubsystem(ErrorCode::MalformedMessage), "Protocol");
    EXPECT_EQ(errorSubsystem(ErrorCode::QueueOverflow), "Session");
    EXPECT_EQ(errorSubsystem(ErrorCode::ServerNotConnected), "Routing");
    EXPECT_EQ(errorSubsystem(ErrorCode::AuthenticationFailed), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigTypeMismatch), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::CodeExpired), "Binding");
    EXPECT_EQ(errorSubsystem(ErrorCode::QueryTimeout), "Query");
}

TEST(GatewayErrorTest, DescribePrefixesCodeName) {
    GatewayError err(ErrorCode::ServerNotConnected, "server Survival is RECONNECTING");
    EXPECT_EQ(err.describe(), "ServerNotConnected: server Survival is RECONNECTING");

    GatewayError bare(ErrorCode::QueryTimeout);
    EXPECT_EQ(bare.describe(), "Timeout");
}

TEST(GatewayErrorTest, TypedContext) {
    GatewayError err(ErrorCode::AuthenticationFailed, "bad token", ErrorCode::InvalidToken);
    ASSERT_TRUE(err.hasContext());
    ASSERT_NE(err.context<ErrorCode>(), nullptr);
    EXPECT_EQ(*err.context<ErrorCode>(), ErrorCode::InvalidToken);
    EXPECT_EQ(err.context<std::string>(), nullptr);
}

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Network), "Network");
    EXPECT_EQ(logCategoryName(LogCategory::Protocol), "Protocol");
    EXPECT_EQ(logCategoryName(LogCategory::Session), "Session");
    EXPECT_EQ(logCategoryName(LogCategory::Routing), "Routing");
    EXPECT_EQ(logCategoryName(LogCategory::Binding), "Binding");
    EXPECT_EQ(logCategoryName(LogCategory::Query), "Query");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
}

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

// ---------------------------------------------------------------------------
// isEnabled / setCategoryLevel
// ---------------------------------------------------------------------------

TEST(GatewayLoggerBasicTest, DefaultsToInfoEverywhere) {
    GatewayLogger logger;
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        EXPECT_EQ(logger.getCategoryLevel(static_cast<LogCategory>(i)), LogLevel::Info);
    }
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Session));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Warning, LogCategory::Session));
}

TEST(GatewayLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    GatewayLogger logger;
    logger.setCategoryLevel(LogCategory::Binding, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Binding));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Binding));
    // Other categories are untouched.
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Routing));
}

TEST(GatewayLoggerBasicTest, InvalidCategoryReturnsOff) {
    GatewayLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(GatewayLoggerTest, LogFormatsMessageWithCategory) {
    GatewayLogger logger;
    logger.log(LogLevel::Info, LogCategory::Session, "session state changed");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Session] session state changed");
}

TEST_F(GatewayLoggerTest, LogFiltersMessagesBelowLevel) {
    GatewayLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Core, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(GatewayLoggerTest, ContextFieldsAreAppendedInStableOrder) {
    GatewayLogger logger;

    LogContext ctx;
    ctx.serverId = "Survival";
    ctx.transportId = "ws-7";
    ctx.correlationId = "c-1";
    ctx.extra["to"] = "CONNECTED";
    ctx.extra["from"] = "AUTHENTICATING";
    logger.logWithContext(LogLevel::Warning, LogCategory::Session, "transition", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message,
              "[Session] transition {server_id=Survival, transport=ws-7, correlation_id=c-1, "
              "from=AUTHENTICATING, to=CONNECTED}");
}

TEST_F(GatewayLoggerTest, EmptyContextOmitsBraces) {
    GatewayLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(GatewayLoggerTest, FlushDelegatesToLogger) {
    GatewayLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(GatewayLoggerTest, MacroLogsThroughSingleton) {
    GatewayLogger::instance().setCategoryLevel(LogCategory::Routing, LogLevel::Debug);
    GCB_LOG_DEBUG(LogCategory::Routing, "macro test");
    GatewayLogger::instance().setCategoryLevel(LogCategory::Routing, LogLevel::Info);

    bool found = false;
    for (const auto& r : mockLogger_->records()) {
        if (r.message == "[Routing] macro test") {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}
