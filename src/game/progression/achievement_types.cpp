/// @file achievement_types.cpp
/// @brief Achievement criterion evaluation.

#include "gec/game/achievement_types.hpp"

#include <algorithm>
#include <type_traits>

#include "gec/game/player_state.hpp"

namespace gec::game {

namespace {

/// Largest value of @p field over the ratings the criterion covers.
template <typename Field>
int64_t bestOver(const PlayerState& state, const std::optional<BattleCategory>& category,
                 Field field) {
    if (category) {
        auto it = state.ratings.find(*category);
        return it == state.ratings.end() ? 0 : field(it->second);
    }
    int64_t best = 0;
    for (const auto& [cat, rating] : state.ratings) {
        best = std::max(best, field(rating));
    }
    return best;
}

}  // namespace

bool isCriterionMet(const AchievementCriterion& criterion, const PlayerState& state) {
    return std::visit([&](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, WinStreakAtLeast>) {
            // Best streak, so a streak reached before a loss still counts.
            return bestOver(state, c.category,
                            [](const BattleRating& r) { return int64_t{r.bestWinStreak}; }) >= c.streak;
        } else if constexpr (std::is_same_v<T, WinsAtLeast>) {
            return bestOver(state, c.category,
                            [](const BattleRating& r) { return int64_t{r.wins}; }) >= c.wins;
        } else if constexpr (std::is_same_v<T, BattlesAtLeast>) {
            return bestOver(state, c.category,
                            [](const BattleRating& r) { return int64_t{r.totalBattles}; }) >= c.battles;
        } else if constexpr (std::is_same_v<T, RatingAtLeast>) {
            if (state.ratings.empty() ||
                (c.category && state.ratings.count(*c.category) == 0)) {
                return false;
            }
            return bestOver(state, c.category,
                            [](const BattleRating& r) { return int64_t{r.rating}; }) >= c.rating;
        } else if constexpr (std::is_same_v<T, TotalLevelAtLeast>) {
            return state.profile.totalLevel >= c.level;
        } else if constexpr (std::is_same_v<T, CombatLevelAtLeast>) {
            return state.profile.combatLevel >= c.level;
        } else {
            return state.profile.questPoints >= c.points;
        }
    }, criterion);
}

}  // namespace gec::game
