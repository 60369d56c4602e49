#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the economy engine.

#include <cstdint>
#include <string_view>

namespace gec::foundation {

/// Error codes categorized by failure class using hex ranges.
///
/// Each class occupies a 256-value range (0x100), so the taxonomy an
/// error belongs to can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    NotImplemented = 0x0002,

    // Validation (0x0100 - 0x01FF): malformed input, rejected before any write
    ValidationError = 0x0100,
    InvalidArgument = 0x0101,
    InvalidQuantity = 0x0102,
    InvalidPrice = 0x0103,
    InvalidSlot = 0x0104,
    UnknownSkill = 0x0105,
    ExperienceOutOfRange = 0x0106,
    ItemNotTradeable = 0x0107,
    ItemNotEquipable = 0x0108,
    RequirementNotMet = 0x0109,
    InvalidParticipants = 0x010A,
    PermissionDenied = 0x010B,

    // Constraint (0x0200 - 0x02FF): uniqueness and slot conflicts
    ConstraintViolation = 0x0200,
    SlotOccupied = 0x0201,
    AlreadyExists = 0x0202,
    OrderNotCancellable = 0x0203,
    BuyLimitExceeded = 0x0204,
    TournamentFull = 0x0205,
    InvalidStateTransition = 0x0206,
    RoundNotComplete = 0x0207,
    PlayerInactive = 0x0208,

    // Resource (0x0300 - 0x03FF): quantity or balance shortfall
    InsufficientResource = 0x0300,
    InsufficientQuantity = 0x0301,
    InsufficientFunds = 0x0302,
    InventoryFull = 0x0303,
    BankFull = 0x0304,
    StackOverflow = 0x0305,

    // Invariant (0x0400 - 0x04FF): aborts the whole unit of work
    InvariantViolation = 0x0400,
    ExperienceRegression = 0x0401,
    OverFill = 0x0402,
    BracketCorrupted = 0x0403,

    // Concurrency (0x0500 - 0x05FF): retryable
    ConcurrencyConflict = 0x0500,
    LockTimeout = 0x0501,

    // NotFound (0x0600 - 0x06FF)
    NotFound = 0x0600,
    PlayerNotFound = 0x0601,
    ItemNotFound = 0x0602,
    OrderNotFound = 0x0603,
    TournamentNotFound = 0x0604,
    MatchNotFound = 0x0605,
    QuestNotFound = 0x0606,
    AchievementNotFound = 0x0607,
    BattleNotFound = 0x0608,

    // Database (0x0700 - 0x07FF)
    DatabaseError = 0x0700,
    QueryFailed = 0x0701,
    TransactionFailed = 0x0702,
    ConnectionPoolExhausted = 0x0703,
    NotConnected = 0x0704,

    // Config (0x0800 - 0x08FF)
    ConfigLoadFailed = 0x0800,
    ConfigKeyNotFound = 0x0801,
    ConfigTypeMismatch = 0x0802,

    // Logger (0x0900 - 0x09FF)
    LoggerError = 0x0900,
    LoggerFlushFailed = 0x0901,
};

/// Failure class of an error code.
enum class ErrorCategory : uint8_t {
    General,
    Validation,
    Constraint,
    Resource,
    Invariant,
    Concurrency,
    NotFound,
    Database,
    Config,
    Logger,
};

/// Return the failure class for a given error code.
constexpr ErrorCategory errorCategory(ErrorCode code) {
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0100: return ErrorCategory::Validation;
        case 0x0200: return ErrorCategory::Constraint;
        case 0x0300: return ErrorCategory::Resource;
        case 0x0400: return ErrorCategory::Invariant;
        case 0x0500: return ErrorCategory::Concurrency;
        case 0x0600: return ErrorCategory::NotFound;
        case 0x0700: return ErrorCategory::Database;
        case 0x0800: return ErrorCategory::Config;
        case 0x0900: return ErrorCategory::Logger;
        default: return ErrorCategory::General;
    }
}

/// Return the taxonomy name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (errorCategory(code)) {
        case ErrorCategory::General: return "General";
        case ErrorCategory::Validation: return "ValidationError";
        case ErrorCategory::Constraint: return "ConstraintViolation";
        case ErrorCategory::Resource: return "InsufficientResource";
        case ErrorCategory::Invariant: return "InvariantViolation";
        case ErrorCategory::Concurrency: return "ConcurrencyConflict";
        case ErrorCategory::NotFound: return "NotFoundError";
        case ErrorCategory::Database: return "Database";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Logger: return "Logger";
    }
    return "Unknown";
}

/// Concurrency conflicts may succeed when the caller repeats the request.
constexpr bool isRetryable(ErrorCode code) {
    return errorCategory(code) == ErrorCategory::Concurrency;
}

} // namespace gec::foundation
