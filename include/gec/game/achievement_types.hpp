#pragma once

/// @file achievement_types.hpp
/// @brief Achievement and quest catalog definitions with typed criteria.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "gec/foundation/types.hpp"
#include "gec/game/battle_types.hpp"
#include "gec/game/requirement.hpp"

namespace gec::game {

struct PlayerState;

// -- Achievement criteria -----------------------------------------------------
// A criterion without a category matches the best value over all categories.

struct WinStreakAtLeast {
    int32_t streak = 0;
    std::optional<BattleCategory> category;
};

struct WinsAtLeast {
    int32_t wins = 0;
    std::optional<BattleCategory> category;
};

struct BattlesAtLeast {
    int32_t battles = 0;
    std::optional<BattleCategory> category;
};

struct RatingAtLeast {
    int32_t rating = 0;
    std::optional<BattleCategory> category;
};

struct TotalLevelAtLeast {
    int32_t level = 0;
};

struct CombatLevelAtLeast {
    int32_t level = 0;
};

struct QuestPointsAtLeast {
    int32_t points = 0;
};

using AchievementCriterion = std::variant<WinStreakAtLeast,
                                          WinsAtLeast,
                                          BattlesAtLeast,
                                          RatingAtLeast,
                                          TotalLevelAtLeast,
                                          CombatLevelAtLeast,
                                          QuestPointsAtLeast>;

struct AchievementDefinition {
    foundation::AchievementId id;
    std::string name;
    std::string description;
    AchievementCriterion criterion;
};

/// Whether the staged player state meets @p criterion.
[[nodiscard]] bool isCriterionMet(const AchievementCriterion& criterion, const PlayerState& state);

// -- Quests -------------------------------------------------------------------

struct QuestDefinition {
    foundation::QuestId id;
    std::string name;
    std::string difficulty;
    int32_t questPoints = 1;
    RequirementList requirements;
};

}  // namespace gec::game
