#pragma once

/// @file persistence_sink.hpp
/// @brief Persistence mirror interface and in-process implementations.
///
/// Abstracts the durable store so engine services can run against any
/// backend (nothing, in-memory capture for tests, SQL via GameDatabase).

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include "gec/foundation/game_result.hpp"
#include "gec/service/change_set.hpp"

namespace gec::service {

/// Receives every unit of work's changes before they become visible.
///
/// An error aborts the unit: nothing is published.
/// Implementations must be thread-safe when shared across services.
class IPersistenceSink {
public:
    virtual ~IPersistenceSink() = default;

    [[nodiscard]] virtual foundation::GameResult<void> apply(const ChangeSet& changes) = 0;

    /// Everything applied so far, folded to its latest state.
    [[nodiscard]] virtual foundation::GameResult<EngineSnapshot> load() = 0;
};

/// Accepts and discards everything. The default sink.
class NullPersistenceSink : public IPersistenceSink {
public:
    [[nodiscard]] foundation::GameResult<void> apply(const ChangeSet& changes) override;

    /// Always empty.
    [[nodiscard]] foundation::GameResult<EngineSnapshot> load() override;
};

/// Keeps every applied change set in memory, for tests and development.
class InMemoryPersistenceSink : public IPersistenceSink {
public:
    [[nodiscard]] foundation::GameResult<void> apply(const ChangeSet& changes) override;

    /// Replays the history the way the SQL mirror would store it: latest
    /// row wins, deleted players take their orders with them.
    [[nodiscard]] foundation::GameResult<EngineSnapshot> load() override;

    /// Make the next apply() fail with @p error (one shot).
    void failNextApply(foundation::GameError error);

    [[nodiscard]] std::vector<ChangeSet> history() const;
    [[nodiscard]] std::size_t appliedCount() const;
    [[nodiscard]] std::optional<ChangeSet> last() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<ChangeSet> applied_;
    std::optional<foundation::GameError> pendingFailure_;
};

}  // namespace gec::service
