/// @file achievement_ledger.cpp
/// @brief AchievementLedger implementation.

#include "gec/service/achievement_ledger.hpp"

#include <string>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::AchievementId;
using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;
using gec::foundation::LogContext;
using gec::foundation::LogLevel;
using gec::foundation::PlayerId;

AchievementLedger::AchievementLedger(PlayerStore& players, const Catalog& catalog)
    : players_(players), catalog_(catalog) {}

GameResult<bool> AchievementLedger::awardAchievement(PlayerId player,
                                                     AchievementId achievement) {
    if (catalog_.findAchievement(achievement) == nullptr) {
        return GameResult<bool>::err(
            GameError(ErrorCode::AchievementNotFound,
                      "unknown achievement " + std::to_string(achievement.value())));
    }
    return players_.transact<bool>(
        {player}, "award_achievement", [&](PlayerTxn& txn) -> GameResult<bool> {
            return GameResult<bool>::ok(stageAward(txn.at(player), achievement, txn.now()));
        });
}

bool AchievementLedger::stageAward(game::PlayerState& state, AchievementId achievement,
                                   foundation::Timestamp at) {
    return state.achievements.emplace(achievement, at).second;
}

std::vector<AchievementId> AchievementLedger::evaluate(game::PlayerState& state,
                                                       foundation::Timestamp at) const {
    std::vector<AchievementId> awarded;
    for (const auto* definition : catalog_.achievements()) {
        if (state.achievements.count(definition->id) > 0) {
            continue;
        }
        if (!game::isCriterionMet(definition->criterion, state)) {
            continue;
        }
        stageAward(state, definition->id, at);
        awarded.push_back(definition->id);

        LogContext ctx;
        ctx.playerId = state.profile.id;
        ctx.extra["achievement"] = definition->name;
        GEC_LOG_CTX(LogLevel::Info, LogCategory::Battle, "achievement unlocked", ctx);
    }
    return awarded;
}

void AchievementLedger::attach(SkillChangedSignal& signal) {
    signal.connect([this](game::PlayerState& state, const SkillChanged& event) {
        evaluate(state, event.at);
    });
}

void AchievementLedger::attach(BattleRecordedSignal& signal) {
    signal.connect([this](game::PlayerState& state, const BattleRecorded& event) {
        evaluate(state, event.at);
    });
}

void AchievementLedger::attach(QuestCompletedSignal& signal) {
    signal.connect([this](game::PlayerState& state, const QuestCompleted& event) {
        evaluate(state, event.at);
    });
}

}  // namespace gec::service
