/// @file derived_stats.cpp
/// @brief Combat level and total level computation.

#include "gec/game/derived_stats.hpp"

#include <algorithm>
#include <numeric>

namespace gec::game {

CombatSkills CombatSkills::From(const SkillSet& skills) {
    CombatSkills c;
    c.attack = skills[skillIndex(Skill::Attack)].level;
    c.strength = skills[skillIndex(Skill::Strength)].level;
    c.defence = skills[skillIndex(Skill::Defence)].level;
    c.hitpoints = skills[skillIndex(Skill::Hitpoints)].level;
    c.prayer = skills[skillIndex(Skill::Prayer)].level;
    c.ranged = skills[skillIndex(Skill::Ranged)].level;
    c.magic = skills[skillIndex(Skill::Magic)].level;
    return c;
}

int32_t computeCombatLevel(const CombatSkills& s) {
    // 0.25 = 10/40 and 0.325 = 13/40.
    const int64_t base = s.defence + s.hitpoints + s.prayer / 2;
    const int64_t melee = s.attack + s.strength;
    const int64_t range = (3 * s.ranged) / 2;
    const int64_t mage = (3 * s.magic) / 2;
    const int64_t offence = std::max({melee, range, mage});
    return static_cast<int32_t>((10 * base + 13 * offence) / 40);
}

int32_t computeCombatLevel(const SkillSet& skills) {
    return computeCombatLevel(CombatSkills::From(skills));
}

int32_t computeTotalLevel(const SkillSet& skills) {
    return std::accumulate(skills.begin(), skills.end(), 0,
                           [](int32_t sum, const SkillEntry& e) { return sum + e.level; });
}

}  // namespace gec::game
