#pragma once

/// @file skill_service.hpp
/// @brief Skill experience writes and the derived-stat recomputation engine.
///
/// Every skill write publishes SkillChanged inside the player's unit of
/// work. DerivedStatRecomputer is the first subscriber: it refreshes
/// total level on every change and combat level when a combat skill
/// changed, so derived fields commit together with the skill write.

#include <cstdint>
#include <functional>
#include <string_view>

#include "gec/foundation/game_result.hpp"
#include "gec/game/player_state.hpp"
#include "gec/service/engine_events.hpp"
#include "gec/service/player_store.hpp"

namespace gec::service {

/// Keeps total_level and combat_level consistent with the skill rows.
class DerivedStatRecomputer {
public:
    /// Recompute the derived fields of @p state after @p change.
    static void recompute(game::PlayerState& state, const SkillChanged& change);

    /// Subscribe to @p signal. Returns the slot id.
    static SkillChangedSignal::SlotId attach(SkillChangedSignal& signal);
};

class SkillService {
public:
    explicit SkillService(PlayerStore& players);

    /// Set absolute experience. Lower than current -> ExperienceRegression.
    [[nodiscard]] foundation::GameResult<game::SkillEntry> updateSkillExperience(
        foundation::PlayerId player, game::Skill skill, int64_t experience);

    /// Name-addressed variant; unknown names -> UnknownSkill.
    [[nodiscard]] foundation::GameResult<game::SkillEntry> updateSkillExperience(
        foundation::PlayerId player, std::string_view skillName, int64_t experience);

    /// Add a non-negative delta, capped at the experience maximum.
    [[nodiscard]] foundation::GameResult<game::SkillEntry> addExperience(
        foundation::PlayerId player, game::Skill skill, int64_t delta);

    /// Raise experience to the threshold of @p level.
    [[nodiscard]] foundation::GameResult<game::SkillEntry> setSkillLevel(
        foundation::PlayerId player, game::Skill skill, int32_t level);

    /// Return the skill to its starting level/experience. The only write
    /// allowed to lower experience.
    [[nodiscard]] foundation::GameResult<game::SkillEntry> resetSkill(
        foundation::PlayerId player, game::Skill skill);

    /// Stage a skill write inside an existing unit of work and publish
    /// SkillChanged. Validation matches updateSkillExperience().
    [[nodiscard]] foundation::GameResult<game::SkillEntry> stageExperience(
        game::PlayerState& state, game::Skill skill, int64_t experience,
        foundation::Timestamp at, bool allowDecrease = false);

    [[nodiscard]] SkillChangedSignal& onSkillChanged() noexcept { return skillChanged_; }

private:
    [[nodiscard]] foundation::GameResult<game::SkillEntry> write(
        foundation::PlayerId player, game::Skill skill, std::string_view operation,
        const std::function<foundation::GameResult<int64_t>(const game::SkillEntry&)>& target,
        bool allowDecrease);

    PlayerStore& players_;
    SkillChangedSignal skillChanged_;
};

}  // namespace gec::service
