/// @file quest_service.cpp
/// @brief QuestService implementation.

#include "gec/service/quest_service.hpp"

#include <string>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;
using gec::foundation::LogContext;
using gec::foundation::LogLevel;
using gec::foundation::PlayerId;
using gec::foundation::QuestId;

QuestService::QuestService(PlayerStore& players, const Catalog& catalog)
    : players_(players), catalog_(catalog) {}

GameResult<bool> QuestService::completeQuest(PlayerId player, QuestId quest) {
    const auto* definition = catalog_.findQuest(quest);
    if (definition == nullptr) {
        return GameResult<bool>::err(
            GameError(ErrorCode::QuestNotFound, "unknown quest " + std::to_string(quest.value())));
    }
    return players_.transact<bool>({player}, "complete_quest", [&](PlayerTxn& txn) {
        return stageCompletion(txn.at(player), *definition, txn.now());
    });
}

GameResult<bool> QuestService::stageCompletion(game::PlayerState& state,
                                               const game::QuestDefinition& quest,
                                               foundation::Timestamp at) {
    if (state.profile.status != game::AccountStatus::Active) {
        return GameResult<bool>::err(
            GameError(ErrorCode::PlayerInactive,
                      state.profile.displayName + " is " +
                          std::string(game::accountStatusName(state.profile.status))));
    }
    if (state.HasCompletedQuest(quest.id)) {
        return GameResult<bool>::ok(false);
    }
    if (auto unmet = game::firstUnmet(state, quest.requirements)) {
        return GameResult<bool>::err(
            GameError(ErrorCode::RequirementNotMet,
                      quest.name + " requires " + game::describe(*unmet)));
    }

    state.completedQuests.emplace(quest.id, at);
    state.profile.questPoints += quest.questPoints;

    QuestCompleted event;
    event.player = state.profile.id;
    event.quest = quest.id;
    event.questPoints = quest.questPoints;
    event.at = at;
    questCompleted_.emit(state, event);

    LogContext ctx;
    ctx.playerId = state.profile.id;
    ctx.extra["quest"] = quest.name;
    ctx.extra["quest_points"] = std::to_string(state.profile.questPoints);
    GEC_LOG_CTX(LogLevel::Info, LogCategory::Skills, "quest completed", ctx);
    return GameResult<bool>::ok(true);
}

}  // namespace gec::service
