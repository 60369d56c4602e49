/// @file skill_types.cpp
/// @brief Skill names and baseline values.

#include "gec/game/skill_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace gec::game {

namespace {

constexpr std::array<std::string_view, kSkillCount> kSkillNames = {
    "attack",   "defence",  "strength",   "hitpoints",  "ranged",
    "prayer",   "magic",    "cooking",    "woodcutting", "fletching",
    "fishing",  "firemaking", "crafting", "smithing",   "mining",
    "herblore", "agility",  "thieving",   "slayer",     "farming",
    "runecrafting", "hunter", "construction"};

}  // namespace

std::string_view skillName(Skill skill) {
    auto idx = skillIndex(skill);
    return idx < kSkillCount ? kSkillNames[idx] : "unknown";
}

std::optional<Skill> parseSkill(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // American spelling shows up in imported data.
    if (lower == "defense") {
        return Skill::Defence;
    }
    for (std::size_t i = 0; i < kSkillCount; ++i) {
        if (kSkillNames[i] == lower) {
            return static_cast<Skill>(i);
        }
    }
    return std::nullopt;
}

SkillEntry baselineSkill(Skill skill) {
    SkillEntry entry;
    if (skill == Skill::Hitpoints) {
        entry.level = kHitpointsBaselineLevel;
        entry.experience = kHitpointsBaselineExperience;
    }
    return entry;
}

SkillSet baselineSkills() {
    SkillSet skills;
    for (std::size_t i = 0; i < kSkillCount; ++i) {
        skills[i] = baselineSkill(static_cast<Skill>(i));
    }
    return skills;
}

}  // namespace gec::game
