/// @file battle_types.cpp
/// @brief Battle category names and rating bookkeeping.

#include "gec/game/battle_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace gec::game {

namespace {

constexpr std::array<std::string_view, 4> kCategoryNames = {
    "duel", "wilderness", "creature", "tournament"};

}  // namespace

std::string_view battleCategoryName(BattleCategory category) {
    auto idx = static_cast<std::size_t>(category);
    return idx < kCategoryNames.size() ? kCategoryNames[idx] : "unknown";
}

std::optional<BattleCategory> parseBattleCategory(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (std::size_t i = 0; i < kCategoryNames.size(); ++i) {
        if (kCategoryNames[i] == lower) {
            return static_cast<BattleCategory>(i);
        }
    }
    return std::nullopt;
}

void BattleRating::ApplyOutcome(BattleResult result, const ParticipantOutcome& outcome,
                                foundation::Timestamp at) {
    ++totalBattles;
    switch (result) {
        case BattleResult::Win:
            ++wins;
            ++winStreak;
            bestWinStreak = std::max(bestWinStreak, winStreak);
            break;
        case BattleResult::Loss:
            ++losses;
            winStreak = 0;
            break;
        case BattleResult::Draw:
            ++draws;
            break;
    }

    damageDealt += outcome.damageDealt;
    damageTaken += outcome.damageTaken;

    for (const auto& [move, uses] : outcome.moveUsage) {
        moveUsage[move] += uses;
    }
    // Most used move; ties go to the alphabetically first name.
    int64_t best = 0;
    for (const auto& [move, uses] : moveUsage) {
        if (uses > best) {
            best = uses;
            favouriteMove = move;
        }
    }

    lastBattle = at;
    decayAnchor = at;
}

}  // namespace gec::game
