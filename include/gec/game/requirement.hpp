#pragma once

/// @file requirement.hpp
/// @brief Typed requirement variants used by items and quests.

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "gec/foundation/types.hpp"
#include "gec/game/skill_types.hpp"

namespace gec::game {

/// Skill must be at or above a level.
struct LevelRequirement {
    Skill skill = Skill::Attack;
    int32_t level = kMinSkillLevel;
};

/// A quest must already be completed.
struct QuestRequirement {
    foundation::QuestId quest;
};

/// The player must hold a quantity of an item (inventory, bank or worn).
struct ItemRequirement {
    foundation::ItemId item;
    int64_t quantity = 1;
};

struct CombatLevelRequirement {
    int32_t level = 3;
};

struct TotalLevelRequirement {
    int32_t level = 32;
};

using Requirement = std::variant<LevelRequirement,
                                 QuestRequirement,
                                 ItemRequirement,
                                 CombatLevelRequirement,
                                 TotalLevelRequirement>;

using RequirementList = std::vector<Requirement>;

/// Short human-readable form, e.g. "attack 60" or "quest 12".
std::string describe(const Requirement& requirement);

}  // namespace gec::game
