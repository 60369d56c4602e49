#pragma once

/// @file engine_config.hpp
/// @brief Engine settings assembled from a ConfigManager.

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "gec/foundation/config_manager.hpp"
#include "gec/foundation/game_database.hpp"
#include "gec/foundation/game_logger.hpp"
#include "gec/game/rating_calculator.hpp"
#include "gec/service/exchange_service.hpp"
#include "gec/service/inventory_ledger.hpp"
#include "gec/service/lock_policy.hpp"

namespace gec::service {

/// Every tunable of the engine. Missing keys keep the defaults below.
///
/// | Key                               | Default  |
/// |-----------------------------------|----------|
/// | engine.lock_timeout_ms            | 50       |
/// | engine.max_lock_attempts          | 5        |
/// | engine.lock_backoff_ms            | 1        |
/// | engine.catalog_path               | (none)   |
/// | engine.maintenance_interval_s     | 3600     |
/// | inventory.bank_capacity           | 800      |
/// | exchange.buy_limit_window_hours   | 4        |
/// | exchange.depth_levels             | 10       |
/// | exchange.summary_window_hours     | 24       |
/// | exchange.trend_threshold          | 0.02     |
/// | rating.*                          | RatingParams |
/// | database.enabled                  | false    |
/// | logging.level                     | (per-category defaults) |
struct EngineConfig {
    LockPolicy lock;
    InventoryConfig inventory;
    ExchangeConfig exchange;
    game::RatingParams rating;

    std::optional<std::string> catalogPath;
    std::chrono::seconds maintenanceInterval{3600};

    bool databaseEnabled = false;
    foundation::DatabaseConfig database;

    std::optional<foundation::LogLevel> logLevel;
    std::map<foundation::LogCategory, foundation::LogLevel> categoryLevels;

    /// Read every known key from @p config.
    /// @return ConfigTypeMismatch for a key of the wrong type,
    ///         InvalidArgument for a value out of range.
    [[nodiscard]] static foundation::GameResult<EngineConfig> fromConfig(
        const foundation::ConfigManager& config);

    /// Push the logging settings into GameLogger::instance().
    void applyLogging() const;
};

}  // namespace gec::service
