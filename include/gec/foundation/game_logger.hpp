#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon logger interfaces for engine logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gec/foundation/game_result.hpp"
#include "gec/foundation/types.hpp"

namespace gec::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Engine wiring and lifecycle
    Skills      = 1, ///< Skill writes and derived-stat recomputation
    Inventory   = 2, ///< Inventory, bank, equipment and coin ledger
    Exchange    = 3, ///< Order book and trade settlement
    Battle      = 4, ///< Battle recording and rating updates
    Tournament  = 5, ///< Bracket management
    Persistence = 6, ///< Persistence sink and database adapter
    Config      = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Skills", "Inventory", "Exchange",
        "Battle", "Tournament", "Persistence", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration ("debug", "INFO", ...).
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerId = PlayerId(42);
///   ctx.itemId = ItemId(4151);
///   ctx.extra["filled"] = "10";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Exchange,
///                         "order matched", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<ItemId> itemId;
    std::optional<OrderId> orderId;
    std::optional<TournamentId> tournamentId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logger registry.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Skills      | Debug         |
/// | Inventory   | Info          |
/// | Exchange    | Debug         |
/// | Battle      | Debug         |
/// | Tournament  | Info          |
/// | Persistence | Info          |
/// | Config      | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setAllCategoryLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry's default logger.
    GameResult<void> flush();

    /// Process-wide logger used by the GEC_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gec::foundation

/// @name GEC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// GEC_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GEC_MIN_LOG_LEVEL
    #define GEC_MIN_LOG_LEVEL 0
#endif

#define GEC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= GEC_MIN_LOG_LEVEL &&                      \
            ::gec::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::gec::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define GEC_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                         \
        if (static_cast<int>(level) >= GEC_MIN_LOG_LEVEL &&                      \
            ::gec::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::gec::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
    } while (0)

#define GEC_LOG_DEBUG(cat, msg) \
    GEC_LOG(::gec::foundation::LogLevel::Debug, (cat), (msg))

#define GEC_LOG_INFO(cat, msg) \
    GEC_LOG(::gec::foundation::LogLevel::Info, (cat), (msg))

#define GEC_LOG_WARN(cat, msg) \
    GEC_LOG(::gec::foundation::LogLevel::Warning, (cat), (msg))

#define GEC_LOG_ERROR(cat, msg) \
    GEC_LOG(::gec::foundation::LogLevel::Error, (cat), (msg))

/// @}
