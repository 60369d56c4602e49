#pragma once

/// @file player_store.hpp
/// @brief Player arena and the unit-of-work primitive every writer uses.
///
/// Each player lives in one arena entry guarded by its own timed mutex.
/// A unit of work locks the involved players in ascending id order,
/// stages copies of their state, lets the caller mutate the copies,
/// mirrors the result to the persistence sink and only then publishes.
/// Any failure before publication leaves every player untouched.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "gec/foundation/game_result.hpp"
#include "gec/foundation/types.hpp"
#include "gec/game/player_state.hpp"
#include "gec/service/change_set.hpp"
#include "gec/service/lock_policy.hpp"
#include "gec/service/persistence_sink.hpp"

namespace gec::service {

/// Profile fields supplied on first contact.
struct NewPlayer {
    std::string displayName;
    int32_t world = game::kDefaultWorld;
    std::string gameMode = "normal";
    bool member = false;
    int64_t startingCoins = 0;
};

/// Rows removed by a cascade delete, keyed by table name.
struct DeletionReport {
    foundation::PlayerId player;
    std::map<std::string, std::size_t> rowsByTable;

    [[nodiscard]] std::size_t total() const;
};

/// Staged view handed to a unit-of-work body.
class PlayerTxn {
public:
    /// Staged state of @p id, or nullptr if @p id is not part of the unit.
    [[nodiscard]] game::PlayerState* find(foundation::PlayerId id);

    /// Staged state of @p id, which must be part of the unit.
    [[nodiscard]] game::PlayerState& at(foundation::PlayerId id) { return staged_.at(id); }

    [[nodiscard]] const std::vector<foundation::PlayerId>& ids() const noexcept { return ids_; }

    /// Non-player rows written by this unit (orders, trades, ...).
    [[nodiscard]] ChangeSet& changes() noexcept { return changes_; }

    /// Unit timestamp; every row written by the unit shares it.
    [[nodiscard]] foundation::Timestamp now() const noexcept { return now_; }

    /// Run @p hook after the unit publishes, while its locks are still held.
    void onCommit(std::function<void()> hook) { commitHooks_.push_back(std::move(hook)); }

private:
    friend class PlayerStore;

    std::vector<foundation::PlayerId> ids_;
    std::map<foundation::PlayerId, game::PlayerState> staged_;
    ChangeSet changes_;
    foundation::Timestamp now_;
    std::vector<std::function<void()>> commitHooks_;
};

class PlayerStore {
public:
    using Body = std::function<foundation::GameResult<void>(PlayerTxn&)>;

    PlayerStore(IPersistenceSink& sink, LockPolicy policy,
                foundation::Clock clock = foundation::systemNow);

    PlayerStore(const PlayerStore&) = delete;
    PlayerStore& operator=(const PlayerStore&) = delete;

    // -- Lifecycle ------------------------------------------------------------

    /// Create a player with every skill at baseline. Display names are unique.
    [[nodiscard]] foundation::GameResult<foundation::PlayerId> createPlayer(NewPlayer request);

    /// Soft-deactivate; the record and its history remain.
    [[nodiscard]] foundation::GameResult<void> deactivatePlayer(foundation::PlayerId id);

    [[nodiscard]] foundation::GameResult<void> setStatus(foundation::PlayerId id,
                                                         game::AccountStatus status);

    [[nodiscard]] foundation::GameResult<void> recordLogin(foundation::PlayerId id);

    /// Remove the player and everything it owns. The caller must already
    /// hold any order-book locks covering the player's orders;
    /// @p ownedOrders is reported and @p onCommit runs before the entry is
    /// dropped, with the player's lock still held.
    [[nodiscard]] foundation::GameResult<DeletionReport> deletePlayer(
        foundation::PlayerId id,
        std::size_t ownedOrders = 0,
        std::function<void()> onCommit = {});

    /// Load persisted players into an empty store. New ids continue after
    /// the highest restored id. Nothing is mirrored back to the sink.
    [[nodiscard]] foundation::GameResult<void> restore(std::vector<game::PlayerState> players);

    // -- Reads ----------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<game::PlayerState> snapshot(foundation::PlayerId id) const;

    [[nodiscard]] std::optional<foundation::PlayerId> findByName(std::string_view name) const;

    [[nodiscard]] bool exists(foundation::PlayerId id) const;

    [[nodiscard]] std::vector<foundation::PlayerId> playerIds() const;

    [[nodiscard]] std::size_t playerCount() const;

    // -- Units of work --------------------------------------------------------

    /// Run @p body over staged copies of @p ids (any order, duplicates ok).
    [[nodiscard]] foundation::GameResult<void> runUnit(std::vector<foundation::PlayerId> ids,
                                                       std::string_view operation,
                                                       const Body& body);

    /// runUnit() returning a value produced by the body.
    template <typename R, typename Fn>
    [[nodiscard]] foundation::GameResult<R> transact(std::vector<foundation::PlayerId> ids,
                                                     std::string_view operation, Fn&& fn);

    /// Mirror rows that touch no player (e.g. tournament state) to the sink.
    [[nodiscard]] foundation::GameResult<void> persistDetached(ChangeSet changes);

    [[nodiscard]] foundation::Timestamp now() const { return clock_(); }

    [[nodiscard]] const LockPolicy& lockPolicy() const noexcept { return policy_; }

private:
    struct Entry {
        std::timed_mutex mutex;
        game::PlayerState state;
        bool deleted = false;
    };

    using EntryPtr = std::shared_ptr<Entry>;

    [[nodiscard]] EntryPtr lookup(foundation::PlayerId id) const;

    [[nodiscard]] foundation::GameResult<void> mirror(ChangeSet& changes,
                                                      std::string_view operation);

    IPersistenceSink& sink_;
    LockPolicy policy_;
    foundation::Clock clock_;

    mutable std::shared_mutex arenaMutex_;
    std::unordered_map<foundation::PlayerId, EntryPtr> arena_;
    std::unordered_map<std::string, foundation::PlayerId> byName_;
    std::atomic<uint64_t> nextId_{1};
};

// --- Template implementations ---

template <typename R, typename Fn>
foundation::GameResult<R> PlayerStore::transact(std::vector<foundation::PlayerId> ids,
                                                std::string_view operation, Fn&& fn) {
    if constexpr (std::is_void_v<R>) {
        return runUnit(std::move(ids), operation, std::forward<Fn>(fn));
    } else {
        std::optional<R> produced;
        auto status = runUnit(std::move(ids), operation,
                              [&](PlayerTxn& txn) -> foundation::GameResult<void> {
                                  auto result = fn(txn);
                                  if (!result) {
                                      return foundation::GameResult<void>::err(result.error());
                                  }
                                  produced.emplace(std::move(result).value());
                                  return foundation::GameResult<void>::ok();
                              });
        if (!status) {
            return foundation::GameResult<R>::err(status.error());
        }
        return foundation::GameResult<R>::ok(std::move(*produced));
    }
}

}  // namespace gec::service
