/// @file skill_service.cpp
/// @brief SkillService and DerivedStatRecomputer implementation.

#include "gec/service/skill_service.hpp"

#include <algorithm>
#include <string>

#include "gec/foundation/game_logger.hpp"
#include "gec/game/derived_stats.hpp"
#include "gec/game/experience_table.hpp"

namespace gec::service {

using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;
using gec::foundation::LogContext;
using gec::foundation::LogLevel;
using gec::foundation::PlayerId;
using gec::game::Skill;
using gec::game::SkillEntry;

// -- DerivedStatRecomputer ----------------------------------------------------

void DerivedStatRecomputer::recompute(game::PlayerState& state, const SkillChanged& change) {
    state.profile.totalLevel = game::computeTotalLevel(state.skills);
    if (game::isCombatSkill(change.skill)) {
        state.profile.combatLevel = game::computeCombatLevel(state.skills);
    }
}

SkillChangedSignal::SlotId DerivedStatRecomputer::attach(SkillChangedSignal& signal) {
    return signal.connect(&DerivedStatRecomputer::recompute);
}

// -- SkillService -------------------------------------------------------------

SkillService::SkillService(PlayerStore& players) : players_(players) {
    DerivedStatRecomputer::attach(skillChanged_);
}

GameResult<SkillEntry> SkillService::stageExperience(game::PlayerState& state, Skill skill,
                                                     int64_t experience,
                                                     foundation::Timestamp at,
                                                     bool allowDecrease) {
    if (game::skillIndex(skill) >= game::kSkillCount) {
        return GameResult<SkillEntry>::err(
            GameError(ErrorCode::UnknownSkill, "unknown skill"));
    }
    if (experience < 0 || experience > game::kMaxExperience) {
        return GameResult<SkillEntry>::err(
            GameError(ErrorCode::ExperienceOutOfRange,
                      "experience must be within 0.." + std::to_string(game::kMaxExperience)));
    }

    auto& entry = state.skills[game::skillIndex(skill)];
    if (experience < entry.experience && !allowDecrease) {
        return GameResult<SkillEntry>::err(
            GameError(ErrorCode::ExperienceRegression,
                      std::string(game::skillName(skill)) + " experience cannot decrease from " +
                          std::to_string(entry.experience) + " to " +
                          std::to_string(experience)));
    }

    SkillChanged change;
    change.player = state.profile.id;
    change.skill = skill;
    change.oldLevel = entry.level;
    change.oldExperience = entry.experience;

    entry.experience = experience;
    entry.level = game::levelForExperience(experience);
    entry.lastTrained = at;

    change.newLevel = entry.level;
    change.newExperience = entry.experience;
    change.at = at;
    skillChanged_.emit(state, change);

    if (change.newLevel != change.oldLevel) {
        LogContext ctx;
        ctx.playerId = change.player;
        ctx.extra["skill"] = std::string(game::skillName(skill));
        ctx.extra["level"] = std::to_string(change.newLevel);
        GEC_LOG_CTX(LogLevel::Debug, LogCategory::Skills, "skill level changed", ctx);
    }
    return GameResult<SkillEntry>::ok(entry);
}

GameResult<SkillEntry> SkillService::write(
    PlayerId player, Skill skill, std::string_view operation,
    const std::function<GameResult<int64_t>(const SkillEntry&)>& target,
    bool allowDecrease) {
    return players_.transact<SkillEntry>(
        {player}, operation, [&](PlayerTxn& txn) -> GameResult<SkillEntry> {
            auto& state = txn.at(player);
            auto experience = target(state.skills[game::skillIndex(skill)]);
            if (!experience) {
                return GameResult<SkillEntry>::err(experience.error());
            }
            return stageExperience(state, skill, experience.value(), txn.now(), allowDecrease);
        });
}

GameResult<SkillEntry> SkillService::updateSkillExperience(PlayerId player, Skill skill,
                                                           int64_t experience) {
    return write(player, skill, "update_skill_experience",
                 [experience](const SkillEntry&) { return GameResult<int64_t>::ok(experience); },
                 false);
}

GameResult<SkillEntry> SkillService::updateSkillExperience(PlayerId player,
                                                           std::string_view skillName,
                                                           int64_t experience) {
    auto skill = game::parseSkill(skillName);
    if (!skill) {
        return GameResult<SkillEntry>::err(
            GameError(ErrorCode::UnknownSkill, "unknown skill: " + std::string(skillName)));
    }
    return updateSkillExperience(player, *skill, experience);
}

GameResult<SkillEntry> SkillService::addExperience(PlayerId player, Skill skill, int64_t delta) {
    if (delta < 0) {
        return GameResult<SkillEntry>::err(
            GameError(ErrorCode::ExperienceRegression, "experience delta cannot be negative"));
    }
    return write(player, skill, "add_experience",
                 [delta](const SkillEntry& current) {
                     return GameResult<int64_t>::ok(
                         std::min(game::kMaxExperience, current.experience + delta));
                 },
                 false);
}

GameResult<SkillEntry> SkillService::setSkillLevel(PlayerId player, Skill skill, int32_t level) {
    if (level < game::kMinSkillLevel || level > game::kMaxSkillLevel) {
        return GameResult<SkillEntry>::err(
            GameError(ErrorCode::ExperienceOutOfRange,
                      "level must be within 1..99, got " + std::to_string(level)));
    }
    return write(player, skill, "set_skill_level",
                 [skill, level](const SkillEntry& current) -> GameResult<int64_t> {
                     if (level < current.level) {
                         return GameResult<int64_t>::err(
                             GameError(ErrorCode::ExperienceRegression,
                                       std::string(game::skillName(skill)) +
                                           " is already above level " + std::to_string(level)));
                     }
                     // Already at the level: keep any progress past the threshold.
                     return GameResult<int64_t>::ok(
                         std::max(current.experience, game::experienceForLevel(level)));
                 },
                 false);
}

GameResult<SkillEntry> SkillService::resetSkill(PlayerId player, Skill skill) {
    auto baseline = game::baselineSkill(skill);
    return write(player, skill, "reset_skill",
                 [baseline](const SkillEntry&) { return GameResult<int64_t>::ok(baseline.experience); },
                 true);
}

}  // namespace gec::service
