#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "sedit/foundation/editor_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace sedit::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

// ===========================================================================
// RecordingLogger: captures log lines for assertions
// ===========================================================================

struct LogRecord {
    log_level level;
    std::string message;
};

class RecordingLogger : public ILogger {
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

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return minLevel_.load(std::memory_order_acquire); }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const { return flushed_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

class EditorLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        sink_ = std::make_shared<RecordingLogger>();
        registry.set_default_logger(sink_);
    }

    void TearDown() override { GlobalLoggerRegistry::instance().clear(); }

    std::shared_ptr<RecordingLogger> sink_;
};

// ===========================================================================
// Names and parsing
// ===========================================================================

TEST(LogCategoryTest, Names) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::ECS), "ECS");
    EXPECT_EQ(logCategoryName(LogCategory::Command), "Command");
    EXPECT_EQ(logCategoryName(LogCategory::Scene), "Scene");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogCategoryTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogCategory("ecs"), LogCategory::ECS);
    EXPECT_EQ(parseLogCategory("COMMAND"), LogCategory::Command);
    EXPECT_FALSE(parseLogCategory("network").has_value());
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

// ===========================================================================
// Level filtering
// ===========================================================================

TEST(EditorLoggerBasicTest, DefaultCategoryLevels) {
    EditorLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::ECS), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Command), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Scene), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

TEST(EditorLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    EditorLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Scene));

    logger.setCategoryLevel(LogCategory::Scene, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Scene));

    logger.setCategoryLevel(LogCategory::Scene, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Scene));
}

TEST(EditorLoggerBasicTest, InvalidCategoryIsOff) {
    EditorLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ===========================================================================
// Output
// ===========================================================================

TEST_F(EditorLoggerTest, PrefixesCategory) {
    EditorLogger logger;
    logger.log(LogLevel::Info, LogCategory::Command, "undo");

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Command] undo");
}

TEST_F(EditorLoggerTest, FiltersBelowCategoryLevel) {
    EditorLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Core, "hidden");
    EXPECT_TRUE(sink_->records().empty());
}

TEST_F(EditorLoggerTest, ContextAppendedInBraces) {
    EditorLogger logger;
    LogContext ctx;
    ctx.entityId = 12;
    ctx.command = "Delete Node";
    ctx.extra["reason"] = "root";

    logger.logWithContext(LogLevel::Error, LogCategory::Command, "rejected command", ctx);

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::error);
    EXPECT_EQ(records[0].message,
              "[Command] rejected command {entity_id=12, command=Delete Node, reason=root}");
}

TEST_F(EditorLoggerTest, EmptyContextOmitsBraces) {
    EditorLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Scene, "saved", LogContext{});

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Scene] saved");
}

TEST_F(EditorLoggerTest, MacroUsesGlobalInstance) {
    EditorLogger::instance().setCategoryLevel(LogCategory::ECS, LogLevel::Debug);
    SEDIT_LOG_WARN(LogCategory::ECS, "cycle rejected");

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message, "[ECS] cycle rejected");
}

TEST_F(EditorLoggerTest, FlushReachesDefaultLogger) {
    EditorLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(sink_->wasFlushed());
}
