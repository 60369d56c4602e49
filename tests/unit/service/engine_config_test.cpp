/// @file engine_config_test.cpp
/// @brief Unit tests for EngineConfig::fromConfig and applyLogging.

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <string>

#include "gec/foundation/config_manager.hpp"
#include "gec/service/engine_config.hpp"

using namespace gec::foundation;
using namespace gec::service;

namespace {

GameResult<EngineConfig> parse(const std::string& yaml) {
    ConfigManager config;
    auto loaded = config.loadFromString(yaml);
    EXPECT_TRUE(loaded.hasValue());
    return EngineConfig::fromConfig(config);
}

}  // namespace

// ===========================================================================
// Defaults and overrides
// ===========================================================================

TEST(EngineConfigTest, EmptyDocumentKeepsDefaults) {
    auto cfg = parse("{}");
    ASSERT_TRUE(cfg.hasValue());
    const auto& c = cfg.value();
    EXPECT_EQ(c.lock.timeout, std::chrono::milliseconds(50));
    EXPECT_EQ(c.lock.maxAttempts, 5u);
    EXPECT_EQ(c.lock.backoff, std::chrono::milliseconds(1));
    EXPECT_EQ(c.maintenanceInterval, std::chrono::seconds(3600));
    EXPECT_FALSE(c.catalogPath.has_value());
    EXPECT_EQ(c.inventory.bankCapacity, 800u);
    EXPECT_EQ(c.exchange.buyLimitWindow, std::chrono::hours(4));
    EXPECT_EQ(c.exchange.depthLevels, 10u);
    EXPECT_EQ(c.exchange.summaryWindow, std::chrono::hours(24));
    EXPECT_DOUBLE_EQ(c.exchange.trendThreshold, 0.02);
    EXPECT_EQ(c.rating.initialRating, 1000);
    EXPECT_EQ(c.rating.decayPeriod, std::chrono::hours(24 * 30));
    EXPECT_FALSE(c.databaseEnabled);
    EXPECT_FALSE(c.logLevel.has_value());
    EXPECT_TRUE(c.categoryLevels.empty());
}

TEST(EngineConfigTest, OverridesEverySection) {
    auto cfg = parse(R"(
engine:
  lock_timeout_ms: 200
  lock_backoff_ms: 3
  max_lock_attempts: 9
  maintenance_interval_s: 60
  catalog_path: /etc/gec/catalog.yaml
inventory:
  bank_capacity: 400
exchange:
  buy_limit_window_hours: 2
  depth_levels: 5
  summary_window_hours: 12
  trend_threshold: 0.05
rating:
  initial_rating: 1200
  k_max: 32.0
  decay_period_days: 14
)");
    ASSERT_TRUE(cfg.hasValue()) << cfg.error().message();
    const auto& c = cfg.value();
    EXPECT_EQ(c.lock.timeout, std::chrono::milliseconds(200));
    EXPECT_EQ(c.lock.backoff, std::chrono::milliseconds(3));
    EXPECT_EQ(c.lock.maxAttempts, 9u);
    EXPECT_EQ(c.maintenanceInterval, std::chrono::seconds(60));
    ASSERT_TRUE(c.catalogPath.has_value());
    EXPECT_EQ(*c.catalogPath, "/etc/gec/catalog.yaml");
    EXPECT_EQ(c.inventory.bankCapacity, 400u);
    EXPECT_EQ(c.exchange.buyLimitWindow, std::chrono::hours(2));
    EXPECT_EQ(c.exchange.depthLevels, 5u);
    EXPECT_EQ(c.exchange.summaryWindow, std::chrono::hours(12));
    EXPECT_DOUBLE_EQ(c.exchange.trendThreshold, 0.05);
    EXPECT_EQ(c.rating.initialRating, 1200);
    EXPECT_DOUBLE_EQ(c.rating.kMax, 32.0);
    EXPECT_EQ(c.rating.decayPeriod, std::chrono::hours(24 * 14));
}

TEST(EngineConfigTest, DatabaseSectionReadWhenEnabled) {
    auto cfg = parse(R"(
database:
  enabled: true
  type: sqlite
  connection_string: "file:economy.db"
  max_connections: 8
  connection_timeout_s: 3
)");
    ASSERT_TRUE(cfg.hasValue()) << cfg.error().message();
    const auto& db = cfg.value().database;
    EXPECT_TRUE(cfg.value().databaseEnabled);
    EXPECT_EQ(db.dbType, DatabaseType::SQLite);
    EXPECT_EQ(db.connectionString, "file:economy.db");
    EXPECT_EQ(db.maxConnections, 8u);
    EXPECT_EQ(db.connectionTimeout, std::chrono::seconds(3));
}

TEST(EngineConfigTest, DisabledDatabaseIgnoresItsKeys) {
    auto cfg = parse(R"(
database:
  enabled: false
  type: oracle
)");
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_FALSE(cfg.value().databaseEnabled);
}

// ===========================================================================
// Rejections
// ===========================================================================

TEST(EngineConfigTest, WrongTypeIsMismatch) {
    auto cfg = parse("engine:\n  lock_timeout_ms: soon\n");
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);

    cfg = parse("exchange:\n  trend_threshold: [1, 2]\n");
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(EngineConfigTest, OutOfRangeValuesRejected) {
    const std::array<const char*, 7> documents = {
        "engine:\n  lock_timeout_ms: 0\n",
        "engine:\n  max_lock_attempts: 0\n",
        "inventory:\n  bank_capacity: 0\n",
        "exchange:\n  summary_window_hours: 0\n",
        "exchange:\n  trend_threshold: -0.1\n",
        "rating:\n  uncertainty_shrink: 1.5\n",
        "rating:\n  decay_period_days: 0\n",
    };
    for (const char* doc : documents) {
        auto cfg = parse(doc);
        ASSERT_TRUE(cfg.hasError()) << doc;
        EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidArgument) << doc;
    }
}

TEST(EngineConfigTest, InconsistentRatingBoundsRejected) {
    auto cfg = parse("rating:\n  uncertainty_floor: 400\n");
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidArgument);

    cfg = parse("rating:\n  k_min: 50\n");
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidArgument);
}

TEST(EngineConfigTest, EnabledDatabaseNeedsConnectionString) {
    auto cfg = parse("database:\n  enabled: true\n");
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidArgument);

    cfg = parse("database:\n  enabled: true\n  type: oracle\n  connection_string: x\n");
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::InvalidArgument);
}

// ===========================================================================
// Logging
// ===========================================================================

TEST(EngineConfigTest, LoggingLevelsParsed) {
    auto cfg = parse(R"(
logging:
  level: warning
  categories:
    exchange: debug
    battle: OFF
)");
    ASSERT_TRUE(cfg.hasValue()) << cfg.error().message();
    const auto& c = cfg.value();
    ASSERT_TRUE(c.logLevel.has_value());
    EXPECT_EQ(*c.logLevel, LogLevel::Warning);
    ASSERT_EQ(c.categoryLevels.size(), 2u);
    EXPECT_EQ(c.categoryLevels.at(LogCategory::Exchange), LogLevel::Debug);
    EXPECT_EQ(c.categoryLevels.at(LogCategory::Battle), LogLevel::Off);
}

TEST(EngineConfigTest, UnknownLogLevelRejected) {
    auto cfg = parse("logging:\n  level: chatty\n");
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(EngineConfigTest, ApplyLoggingUpdatesLogger) {
    auto& logger = GameLogger::instance();
    std::array<LogLevel, kLogCategoryCount> saved{};
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        saved[i] = logger.getCategoryLevel(static_cast<LogCategory>(i));
    }

    EngineConfig cfg;
    cfg.logLevel = LogLevel::Error;
    cfg.categoryLevels[LogCategory::Exchange] = LogLevel::Trace;
    cfg.applyLogging();

    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Error);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Exchange), LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Exchange));

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        logger.setCategoryLevel(static_cast<LogCategory>(i), saved[i]);
    }
}
