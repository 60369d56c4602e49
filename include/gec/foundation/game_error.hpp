#pragma once

/// @file game_error.hpp
/// @brief Engine error type used with Result<T, GameError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "gec/foundation/error_code.hpp"

namespace gec::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data (e.g. the conflicting slot).
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The failure class this error belongs to.
    [[nodiscard]] ErrorCategory category() const noexcept {
        return errorCategory(code_);
    }

    /// The taxonomy name ("ValidationError", "NotFoundError", ...).
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Whether repeating the same request may succeed.
    [[nodiscard]] bool isRetryable() const noexcept {
        return gec::foundation::isRetryable(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace gec::foundation
