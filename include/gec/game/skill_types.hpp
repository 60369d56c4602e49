#pragma once

/// @file skill_types.hpp
/// @brief The 23 trainable skills, their baselines and per-skill records.

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "gec/foundation/types.hpp"

namespace gec::game {

/// Trainable skill identifiers, in hiscore order.
///
/// COUNT is a sentinel used for array sizing.
enum class Skill : uint8_t {
    Attack,
    Defence,
    Strength,
    Hitpoints,
    Ranged,
    Prayer,
    Magic,
    Cooking,
    Woodcutting,
    Fletching,
    Fishing,
    Firemaking,
    Crafting,
    Smithing,
    Mining,
    Herblore,
    Agility,
    Thieving,
    Slayer,
    Farming,
    Runecrafting,
    Hunter,
    Construction,
    COUNT  ///< Sentinel: total number of skills.
};

constexpr std::size_t kSkillCount = static_cast<std::size_t>(Skill::COUNT);

constexpr int32_t kMinSkillLevel = 1;
constexpr int32_t kMaxSkillLevel = 99;
constexpr int64_t kMaxExperience = 200'000'000;

/// Hitpoints starts trained; every other skill starts at level 1 / 0 xp.
constexpr int32_t kHitpointsBaselineLevel = 10;
constexpr int64_t kHitpointsBaselineExperience = 1'154;

/// Lower-case skill name as stored in the skills table.
std::string_view skillName(Skill skill);

/// Case-insensitive lookup of a skill by name.
std::optional<Skill> parseSkill(std::string_view name);

/// Whether @p skill feeds the combat level formula.
constexpr bool isCombatSkill(Skill skill) noexcept {
    switch (skill) {
        case Skill::Attack:
        case Skill::Strength:
        case Skill::Defence:
        case Skill::Hitpoints:
        case Skill::Prayer:
        case Skill::Ranged:
        case Skill::Magic:
            return true;
        default:
            return false;
    }
}

/// One (player, skill) row.
struct SkillEntry {
    int32_t level = kMinSkillLevel;
    int64_t experience = 0;
    std::optional<foundation::Timestamp> lastTrained;
};

using SkillSet = std::array<SkillEntry, kSkillCount>;

/// Starting record for a single skill.
SkillEntry baselineSkill(Skill skill);

/// Starting records for all skills of a freshly created player.
SkillSet baselineSkills();

/// Index helper for SkillSet access.
constexpr std::size_t skillIndex(Skill skill) noexcept {
    return static_cast<std::size_t>(skill);
}

}  // namespace gec::game
