#pragma once

/// @file derived_stats.hpp
/// @brief Pure functions computing total level and combat level.

#include <cstdint>

#include "gec/game/skill_types.hpp"

namespace gec::game {

/// The seven skills combat level depends on.
struct CombatSkills {
    int32_t attack = 1;
    int32_t strength = 1;
    int32_t defence = 1;
    int32_t hitpoints = kHitpointsBaselineLevel;
    int32_t prayer = 1;
    int32_t ranged = 1;
    int32_t magic = 1;

    static CombatSkills From(const SkillSet& skills);
};

/// floor(0.25 * (def + hp + floor(prayer / 2))
///       + max(0.325 * (att + str), 0.325 * floor(1.5 * ranged),
///             0.325 * floor(1.5 * magic)))
///
/// Evaluated in integer fortieths so boundary values are exact.
[[nodiscard]] int32_t computeCombatLevel(const CombatSkills& skills);

[[nodiscard]] int32_t computeCombatLevel(const SkillSet& skills);

/// Sum of every skill level.
[[nodiscard]] int32_t computeTotalLevel(const SkillSet& skills);

}  // namespace gec::game
