#pragma once

/// @file achievement_ledger.hpp
/// @brief Insert-or-ignore achievement awards and the criterion evaluator.
///
/// The ledger subscribes to the skill, battle and quest signals. Each
/// event re-evaluates every catalog achievement against the staged state
/// of the affected player, so awards commit (or abort) together with the
/// write that earned them.

#include <vector>

#include "gec/foundation/game_result.hpp"
#include "gec/service/catalog.hpp"
#include "gec/service/engine_events.hpp"
#include "gec/service/player_store.hpp"

namespace gec::service {

class AchievementLedger {
public:
    AchievementLedger(PlayerStore& players, const Catalog& catalog);

    /// Award @p achievement unconditionally.
    /// @return true if the award is new; false if the player already had it.
    [[nodiscard]] foundation::GameResult<bool> awardAchievement(
        foundation::PlayerId player, foundation::AchievementId achievement);

    /// Insert-or-ignore on a staged state. @return true if inserted.
    static bool stageAward(game::PlayerState& state, foundation::AchievementId achievement,
                           foundation::Timestamp at);

    /// Award every catalog achievement whose criterion @p state now meets.
    /// @return The newly awarded ids, in catalog order.
    std::vector<foundation::AchievementId> evaluate(game::PlayerState& state,
                                                    foundation::Timestamp at) const;

    void attach(SkillChangedSignal& signal);
    void attach(BattleRecordedSignal& signal);
    void attach(QuestCompletedSignal& signal);

private:
    PlayerStore& players_;
    const Catalog& catalog_;
};

}  // namespace gec::service
