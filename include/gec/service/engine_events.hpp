#pragma once

/// @file engine_events.hpp
/// @brief Events published synchronously inside a unit of work.
///
/// Handlers receive the staged PlayerState by reference, so anything they
/// change (derived levels, achievements) commits or aborts together with
/// the write that triggered them.

#include <cstdint>

#include "gec/foundation/signal.hpp"
#include "gec/foundation/types.hpp"
#include "gec/game/battle_types.hpp"
#include "gec/game/player_state.hpp"
#include "gec/game/skill_types.hpp"

namespace gec::service {

/// A skill's experience (and possibly level) changed.
struct SkillChanged {
    foundation::PlayerId player;
    game::Skill skill = game::Skill::Attack;
    int32_t oldLevel = 1;
    int32_t newLevel = 1;
    int64_t oldExperience = 0;
    int64_t newExperience = 0;
    foundation::Timestamp at;
};

/// A rated battle was recorded; emitted once per participant.
struct BattleRecorded {
    foundation::BattleId battle;
    game::BattleCategory category = game::BattleCategory::Duel;
    foundation::PlayerId player;
    foundation::PlayerId opponent;
    game::BattleResult result = game::BattleResult::Draw;
    foundation::Timestamp at;
};

/// A quest was completed for the first time.
struct QuestCompleted {
    foundation::PlayerId player;
    foundation::QuestId quest;
    int32_t questPoints = 0;
    foundation::Timestamp at;
};

// -- Signals ------------------------------------------------------------------
// The staged PlayerState of the affected player travels with each event.

using SkillChangedSignal = foundation::Signal<game::PlayerState&, const SkillChanged&>;
using BattleRecordedSignal = foundation::Signal<game::PlayerState&, const BattleRecorded&>;
using QuestCompletedSignal = foundation::Signal<game::PlayerState&, const QuestCompleted&>;

}  // namespace gec::service
