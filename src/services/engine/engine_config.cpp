/// @file engine_config.cpp
/// @brief EngineConfig::fromConfig implementation.

#include "gec/service/engine_config.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace gec::service {

using gec::foundation::ConfigManager;
using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;
using gec::foundation::LogLevel;

namespace {

/// Overwrite @p target when @p key is present; a wrong type is an error.
template <typename T>
GameResult<void> read(const ConfigManager& config, std::string_view key, T& target) {
    auto value = config.getOr<T>(key, target);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    target = value.value();
    return GameResult<void>::ok();
}

GameResult<void> invalid(std::string_view key, std::string_view why) {
    return GameResult<void>::err(
        GameError(ErrorCode::InvalidArgument, std::string(key) + " " + std::string(why)));
}

GameResult<LogLevel> readLevel(const ConfigManager& config, std::string_view key) {
    auto name = config.get<std::string>(key);
    if (!name) {
        return GameResult<LogLevel>::err(name.error());
    }
    auto level = foundation::parseLogLevel(name.value());
    if (!level) {
        return GameResult<LogLevel>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string(key) + " is not a log level: " + name.value()));
    }
    return GameResult<LogLevel>::ok(*level);
}

#define GEC_READ(key, target)                       \
    do {                                            \
        auto gecRead = read(config, (key), target); \
        if (!gecRead) {                             \
            return GameResult<EngineConfig>::err(gecRead.error()); \
        }                                           \
    } while (0)

#define GEC_REQUIRE(cond, key, why)                                     \
    do {                                                                \
        if (!(cond)) {                                                  \
            return GameResult<EngineConfig>::err(invalid((key), (why)).error()); \
        }                                                               \
    } while (0)

}  // namespace

GameResult<EngineConfig> EngineConfig::fromConfig(const ConfigManager& config) {
    EngineConfig out;

    // -- engine.* -------------------------------------------------------------
    int64_t lockTimeoutMs = out.lock.timeout.count();
    int64_t lockBackoffMs = out.lock.backoff.count();
    uint32_t lockAttempts = out.lock.maxAttempts;
    int64_t maintenanceSeconds = out.maintenanceInterval.count();
    GEC_READ("engine.lock_timeout_ms", lockTimeoutMs);
    GEC_READ("engine.lock_backoff_ms", lockBackoffMs);
    GEC_READ("engine.max_lock_attempts", lockAttempts);
    GEC_READ("engine.maintenance_interval_s", maintenanceSeconds);
    GEC_REQUIRE(lockTimeoutMs > 0, "engine.lock_timeout_ms", "must be positive");
    GEC_REQUIRE(lockBackoffMs >= 0, "engine.lock_backoff_ms", "cannot be negative");
    GEC_REQUIRE(lockAttempts >= 1, "engine.max_lock_attempts", "must be at least 1");
    GEC_REQUIRE(maintenanceSeconds > 0, "engine.maintenance_interval_s", "must be positive");
    out.lock.timeout = std::chrono::milliseconds(lockTimeoutMs);
    out.lock.backoff = std::chrono::milliseconds(lockBackoffMs);
    out.lock.maxAttempts = lockAttempts;
    out.maintenanceInterval = std::chrono::seconds(maintenanceSeconds);
    if (config.hasKey("engine.catalog_path")) {
        std::string path;
        GEC_READ("engine.catalog_path", path);
        out.catalogPath = path;
    }

    // -- inventory.* ----------------------------------------------------------
    uint32_t bankCapacity = static_cast<uint32_t>(out.inventory.bankCapacity);
    GEC_READ("inventory.bank_capacity", bankCapacity);
    GEC_REQUIRE(bankCapacity > 0, "inventory.bank_capacity", "must be positive");
    out.inventory.bankCapacity = bankCapacity;

    // -- exchange.* -----------------------------------------------------------
    int64_t buyLimitHours = out.exchange.buyLimitWindow.count();
    int64_t summaryHours = out.exchange.summaryWindow.count();
    uint32_t depthLevels = static_cast<uint32_t>(out.exchange.depthLevels);
    GEC_READ("exchange.buy_limit_window_hours", buyLimitHours);
    GEC_READ("exchange.summary_window_hours", summaryHours);
    GEC_READ("exchange.depth_levels", depthLevels);
    GEC_READ("exchange.trend_threshold", out.exchange.trendThreshold);
    GEC_REQUIRE(buyLimitHours > 0, "exchange.buy_limit_window_hours", "must be positive");
    GEC_REQUIRE(summaryHours > 0, "exchange.summary_window_hours", "must be positive");
    GEC_REQUIRE(out.exchange.trendThreshold >= 0.0, "exchange.trend_threshold",
                "cannot be negative");
    out.exchange.buyLimitWindow = std::chrono::hours(buyLimitHours);
    out.exchange.summaryWindow = std::chrono::hours(summaryHours);
    out.exchange.depthLevels = depthLevels;

    // -- rating.* -------------------------------------------------------------
    auto& r = out.rating;
    int64_t decayDays = std::chrono::duration_cast<std::chrono::hours>(r.decayPeriod).count() / 24;
    GEC_READ("rating.initial_rating", r.initialRating);
    GEC_READ("rating.initial_uncertainty", r.initialUncertainty);
    GEC_READ("rating.uncertainty_floor", r.uncertaintyFloor);
    GEC_READ("rating.uncertainty_max", r.uncertaintyMax);
    GEC_READ("rating.k_min", r.kMin);
    GEC_READ("rating.k_max", r.kMax);
    GEC_READ("rating.uncertainty_shrink", r.uncertaintyShrink);
    GEC_READ("rating.decay_constant", r.decayConstant);
    GEC_READ("rating.decay_period_days", decayDays);
    GEC_REQUIRE(r.uncertaintyFloor > 0.0 && r.uncertaintyMax > r.uncertaintyFloor,
                "rating.uncertainty_max", "must exceed a positive uncertainty_floor");
    GEC_REQUIRE(r.initialUncertainty >= r.uncertaintyFloor &&
                    r.initialUncertainty <= r.uncertaintyMax,
                "rating.initial_uncertainty", "must lie within floor..max");
    GEC_REQUIRE(r.kMin > 0.0 && r.kMax >= r.kMin, "rating.k_max", "must be >= a positive k_min");
    GEC_REQUIRE(r.uncertaintyShrink > 0.0 && r.uncertaintyShrink <= 1.0,
                "rating.uncertainty_shrink", "must be within (0, 1]");
    GEC_REQUIRE(decayDays > 0, "rating.decay_period_days", "must be positive");
    r.decayPeriod = std::chrono::hours(24 * decayDays);

    // -- database.* -----------------------------------------------------------
    GEC_READ("database.enabled", out.databaseEnabled);
    if (out.databaseEnabled) {
        std::string type = "postgres";
        uint32_t minConnections = out.database.minConnections;
        uint32_t maxConnections = out.database.maxConnections;
        int64_t timeoutSeconds = out.database.connectionTimeout.count();
        GEC_READ("database.type", type);
        GEC_READ("database.connection_string", out.database.connectionString);
        GEC_READ("database.min_connections", minConnections);
        GEC_READ("database.max_connections", maxConnections);
        GEC_READ("database.connection_timeout_s", timeoutSeconds);
        auto dbType = foundation::parseDatabaseType(type);
        GEC_REQUIRE(dbType.has_value(), "database.type", "is not a supported backend");
        GEC_REQUIRE(!out.database.connectionString.empty(), "database.connection_string",
                    "is required when the database is enabled");
        GEC_REQUIRE(timeoutSeconds > 0, "database.connection_timeout_s", "must be positive");
        out.database.dbType = *dbType;
        out.database.minConnections = minConnections;
        out.database.maxConnections = maxConnections;
        out.database.connectionTimeout = std::chrono::seconds(timeoutSeconds);
    }

    // -- logging.* ------------------------------------------------------------
    if (config.hasKey("logging.level")) {
        auto level = readLevel(config, "logging.level");
        if (!level) {
            return GameResult<EngineConfig>::err(level.error());
        }
        out.logLevel = level.value();
    }
    constexpr std::array<std::string_view, foundation::kLogCategoryCount> kCategoryKeys = {
        "core", "skills", "inventory", "exchange", "battle", "tournament", "persistence", "config"};
    for (std::size_t i = 0; i < kCategoryKeys.size(); ++i) {
        auto key = "logging.categories." + std::string(kCategoryKeys[i]);
        if (!config.hasKey(key)) {
            continue;
        }
        auto level = readLevel(config, key);
        if (!level) {
            return GameResult<EngineConfig>::err(level.error());
        }
        out.categoryLevels[static_cast<LogCategory>(i)] = level.value();
    }

    return GameResult<EngineConfig>::ok(std::move(out));
}

#undef GEC_READ
#undef GEC_REQUIRE

void EngineConfig::applyLogging() const {
    auto& logger = foundation::GameLogger::instance();
    if (logLevel) {
        logger.setAllCategoryLevels(*logLevel);
    }
    for (const auto& [category, level] : categoryLevels) {
        logger.setCategoryLevel(category, level);
    }
}

}  // namespace gec::service
