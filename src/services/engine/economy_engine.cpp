/// @file economy_engine.cpp
/// @brief EconomyEngine wiring.

#include "gec/service/economy_engine.hpp"

#include <string>
#include <utility>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::GameResult;
using gec::foundation::LogCategory;

EconomyEngine::EconomyEngine(EngineConfig config, IPersistenceSink& sink, foundation::Clock clock)
    : config_(std::move(config)),
      players_(sink, config_.lock, std::move(clock)),
      skills_(players_),
      inventory_(players_, catalog_, config_.inventory),
      quests_(players_, catalog_),
      achievements_(players_, catalog_),
      exchange_(players_, catalog_, inventory_, config_.exchange),
      battles_(players_, catalog_, inventory_, config_.rating),
      tournaments_(players_, battles_) {
    achievements_.attach(skills_.onSkillChanged());
    achievements_.attach(battles_.onBattleRecorded());
    achievements_.attach(quests_.onQuestCompleted());
    GEC_LOG_INFO(LogCategory::Core, "economy engine ready");
}

GameResult<game::PlayerState> EconomyEngine::playerSnapshot(foundation::PlayerId player) const {
    return players_.snapshot(player);
}

GameResult<DeletionReport> EconomyEngine::deletePlayer(foundation::PlayerId player) {
    return exchange_.deletePlayer(player);
}

GameResult<void> EconomyEngine::restore(EngineSnapshot snapshot) {
    const auto playerCount = snapshot.players.size();
    if (auto restored = players_.restore(std::move(snapshot.players)); !restored) {
        return restored;
    }
    if (auto restored = exchange_.restore(snapshot.orders, snapshot.trades); !restored) {
        return restored;
    }
    if (auto restored = battles_.restore(snapshot.battles); !restored) {
        return restored;
    }
    if (auto restored = tournaments_.restore(std::move(snapshot.tournaments)); !restored) {
        return restored;
    }
    GEC_LOG_INFO(LogCategory::Core,
                 "engine restored with " + std::to_string(playerCount) + " players");
    return GameResult<void>::ok();
}

GameResult<DecayReport> EconomyEngine::runMaintenance(foundation::Timestamp now) {
    return battles_.applyInactivityDecay(now);
}

}  // namespace gec::service
