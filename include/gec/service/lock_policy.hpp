#pragma once

/// @file lock_policy.hpp
/// @brief Timed, bounded-retry lock acquisition in a caller-defined order.
///
/// Global acquisition order is tournament -> item order books (ascending
/// item id) -> players (ascending player id). OrderedLocks does not sort;
/// callers acquire in that order.

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

#include "gec/foundation/game_result.hpp"

namespace gec::service {

/// Read from `engine.lock_timeout_ms` / `engine.max_lock_attempts`.
struct LockPolicy {
    std::chrono::milliseconds timeout{50};
    uint32_t maxAttempts = 5;
    std::chrono::milliseconds backoff{1};  ///< Multiplied by the attempt number.
};

/// RAII set of held timed mutexes, released in reverse acquisition order.
class OrderedLocks {
public:
    explicit OrderedLocks(LockPolicy policy);
    ~OrderedLocks();

    OrderedLocks(const OrderedLocks&) = delete;
    OrderedLocks& operator=(const OrderedLocks&) = delete;

    /// Acquire @p mutex, retrying up to maxAttempts times.
    /// @return ConcurrencyConflict when every attempt timed out.
    [[nodiscard]] foundation::GameResult<void> acquire(std::timed_mutex& mutex,
                                                       std::string_view what);

    void releaseAll() noexcept;

    [[nodiscard]] std::size_t heldCount() const noexcept { return held_.size(); }

private:
    LockPolicy policy_;
    std::vector<std::timed_mutex*> held_;
};

}  // namespace gec::service
