#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for engine error handling.

#include "gec/core/result.hpp"
#include "gec/foundation/game_error.hpp"

namespace gec::foundation {

/// Result type specialized with GameError for engine operations.
///
/// Example:
/// @code
///   GameResult<int64_t> escrowFor(int64_t quantity, int64_t price) {
///       if (quantity <= 0) {
///           return GameResult<int64_t>::err(
///               GameError(ErrorCode::InvalidQuantity, "quantity must be positive"));
///       }
///       return GameResult<int64_t>::ok(quantity * price);
///   }
/// @endcode
template <typename T>
using GameResult = gec::Result<T, GameError>;

/// Shorthand for building an error result.
template <typename T>
[[nodiscard]] GameResult<T> fail(ErrorCode code, std::string message) {
    return GameResult<T>::err(GameError(code, std::move(message)));
}

}  // namespace gec::foundation
