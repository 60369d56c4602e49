#pragma once

/// @file battle_types.hpp
/// @brief Battle categories, per-category ratings and immutable battle records.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gec/foundation/types.hpp"
#include "gec/game/item_types.hpp"

namespace gec::game {

/// Rated battle categories. Ratings are tracked per (player, category).
enum class BattleCategory : uint8_t {
    Duel,
    Wilderness,
    Creature,
    Tournament
};

std::string_view battleCategoryName(BattleCategory category);

std::optional<BattleCategory> parseBattleCategory(std::string_view name);

/// Result of a battle from one participant's point of view.
enum class BattleResult : uint8_t { Win, Loss, Draw };

/// Score used by the rating formula: 1 win, 0.5 draw, 0 loss.
constexpr double actualScore(BattleResult result) noexcept {
    switch (result) {
        case BattleResult::Win:  return 1.0;
        case BattleResult::Draw: return 0.5;
        case BattleResult::Loss: return 0.0;
    }
    return 0.0;
}

/// Rewards granted to one participant inside the battle's unit of work.
struct BattleReward {
    int64_t coins = 0;
    std::vector<ItemStack> items;  ///< Credited to the bank.
};

/// What one participant did during a battle.
struct ParticipantOutcome {
    int64_t damageDealt = 0;
    int64_t damageTaken = 0;
    std::map<std::string, int32_t> moveUsage;
    BattleReward reward;
};

/// Structured payload submitted with a battle result.
struct BattleOutcome {
    int32_t durationSeconds = 0;
    int32_t turns = 0;
    ParticipantOutcome first;   ///< Participant A.
    ParticipantOutcome second;  ///< Participant B.
};

/// Immutable record of one completed battle.
struct BattleRecord {
    foundation::BattleId id;
    std::string battleKey;  ///< External idempotency key.
    BattleCategory category = BattleCategory::Duel;
    foundation::PlayerId playerA;
    foundation::PlayerId playerB;
    std::optional<foundation::PlayerId> winner;  ///< nullopt = draw.
    BattleOutcome outcome;
    foundation::Timestamp recordedAt;

    [[nodiscard]] bool IsDraw() const noexcept { return !winner.has_value(); }

    /// Result for @p player, who must be one of the participants.
    [[nodiscard]] BattleResult ResultFor(foundation::PlayerId player) const noexcept {
        if (!winner) {
            return BattleResult::Draw;
        }
        return *winner == player ? BattleResult::Win : BattleResult::Loss;
    }
};

/// Per-(player, category) rating and battle statistics.
struct BattleRating {
    int32_t rating = 1000;
    double uncertainty = 350.0;
    int32_t wins = 0;
    int32_t losses = 0;
    int32_t draws = 0;
    int32_t totalBattles = 0;
    int32_t winStreak = 0;
    int32_t bestWinStreak = 0;
    int64_t damageDealt = 0;
    int64_t damageTaken = 0;
    std::map<std::string, int64_t> moveUsage;
    std::string favouriteMove;
    std::optional<foundation::Timestamp> lastBattle;

    /// Start of the inactivity interval not yet charged by decay.
    foundation::Timestamp decayAnchor;

    /// Fold one battle's counters into the record. A loss resets the
    /// current win streak; a draw leaves it untouched.
    void ApplyOutcome(BattleResult result, const ParticipantOutcome& outcome,
                      foundation::Timestamp at);
};

}  // namespace gec::game
