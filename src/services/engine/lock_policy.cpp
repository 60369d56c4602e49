/// @file lock_policy.cpp
/// @brief OrderedLocks implementation.

#include "gec/service/lock_policy.hpp"

#include <string>
#include <thread>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;

OrderedLocks::OrderedLocks(LockPolicy policy) : policy_(policy) {}

OrderedLocks::~OrderedLocks() {
    releaseAll();
}

GameResult<void> OrderedLocks::acquire(std::timed_mutex& mutex, std::string_view what) {
    const uint32_t attempts = policy_.maxAttempts == 0 ? 1 : policy_.maxAttempts;
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        if (mutex.try_lock_for(policy_.timeout)) {
            held_.push_back(&mutex);
            return GameResult<void>::ok();
        }
        if (attempt < attempts) {
            std::this_thread::sleep_for(policy_.backoff * attempt);
        }
    }
    GEC_LOG_WARN(LogCategory::Core,
                 "lock acquisition exhausted " + std::to_string(attempts) +
                     " attempt(s) on " + std::string(what));
    return GameResult<void>::err(
        GameError(ErrorCode::ConcurrencyConflict,
                  "could not lock " + std::string(what) + "; retry the request"));
}

void OrderedLocks::releaseAll() noexcept {
    for (auto it = held_.rbegin(); it != held_.rend(); ++it) {
        (*it)->unlock();
    }
    held_.clear();
}

}  // namespace gec::service
