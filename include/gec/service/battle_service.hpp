#pragma once

/// @file battle_service.hpp
/// @brief Battle recording, rating updates, rewards and inactivity decay.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "gec/foundation/game_result.hpp"
#include "gec/game/battle_types.hpp"
#include "gec/game/rating_calculator.hpp"
#include "gec/service/catalog.hpp"
#include "gec/service/engine_events.hpp"
#include "gec/service/inventory_ledger.hpp"
#include "gec/service/player_store.hpp"

namespace gec::service {

/// A finished battle as reported by the game.
struct BattleRequest {
    /// Idempotency key; a replay with a recorded key changes nothing.
    std::string battleKey;
    game::BattleCategory category = game::BattleCategory::Duel;
    foundation::PlayerId playerA;
    foundation::PlayerId playerB;
    std::optional<foundation::PlayerId> winner;  ///< nullopt = draw.
    game::BattleOutcome outcome;
};

/// Counts from one inactivity-decay pass.
struct DecayReport {
    std::size_t playersScanned = 0;
    std::size_t ratingsDecayed = 0;
};

class BattleService {
public:
    BattleService(PlayerStore& players, const Catalog& catalog, const InventoryLedger& ledger,
                  game::RatingParams params = {});

    BattleService(const BattleService&) = delete;
    BattleService& operator=(const BattleService&) = delete;

    /// Record a battle and update both ratings in one unit of work.
    /// A replayed key returns the stored record; a key already used by a
    /// different pair of players is rejected with AlreadyExists.
    [[nodiscard]] foundation::GameResult<game::BattleRecord> recordBattle(
        const BattleRequest& request);

    /// Load persisted battle records so replayed keys stay idempotent
    /// across restarts. Battle ids continue after the highest restored id.
    [[nodiscard]] foundation::GameResult<void> restore(const std::vector<game::BattleRecord>& records);

    [[nodiscard]] foundation::GameResult<game::BattleRecord> getBattle(foundation::BattleId id) const;

    [[nodiscard]] std::optional<game::BattleRecord> findByKey(const std::string& battleKey) const;

    /// Grow the uncertainty of every rating idle for at least one decay
    /// period, then advance its anchor by the periods applied.
    [[nodiscard]] foundation::GameResult<DecayReport> applyInactivityDecay(foundation::Timestamp now);

    [[nodiscard]] BattleRecordedSignal& onBattleRecorded() noexcept { return battleRecorded_; }

    [[nodiscard]] const game::RatingParams& params() const noexcept { return params_; }

private:
    [[nodiscard]] foundation::GameResult<void> validate(const BattleRequest& request) const;

    [[nodiscard]] game::BattleRating& stageRating(game::PlayerState& state,
                                                  game::BattleCategory category,
                                                  foundation::Timestamp at) const;

    [[nodiscard]] foundation::GameResult<void> stageReward(game::PlayerState& state,
                                                           const game::BattleReward& reward,
                                                           foundation::Timestamp at) const;

    /// Wait until no unit holds @p key, then either return its stored
    /// record or reserve it for the caller.
    [[nodiscard]] std::optional<game::BattleRecord> claimKey(const std::string& key);

    void releaseKey(const std::string& key);

    /// Whole decay periods elapsed since @p rating's anchor.
    [[nodiscard]] int64_t duePeriods(const game::BattleRating& rating,
                                     foundation::Timestamp now) const;

    PlayerStore& players_;
    const Catalog& catalog_;
    const InventoryLedger& ledger_;
    game::RatingParams params_;
    BattleRecordedSignal battleRecorded_;

    mutable std::shared_mutex recordsMutex_;
    std::unordered_map<foundation::BattleId, game::BattleRecord> records_;
    std::unordered_map<std::string, foundation::BattleId> byKey_;
    /// Keys whose unit of work is in flight.
    std::unordered_set<std::string> pendingKeys_;
    std::condition_variable_any keyReleased_;
    std::atomic<uint64_t> nextBattleId_{1};
};

}  // namespace gec::service
