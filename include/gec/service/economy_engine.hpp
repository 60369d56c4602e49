#pragma once

/// @file economy_engine.hpp
/// @brief Owns and wires every engine service around one player store.
///
/// Observer wiring, in connection order:
///   SkillChanged   -> DerivedStatRecomputer, AchievementLedger
///   BattleRecorded -> AchievementLedger
///   QuestCompleted -> AchievementLedger

#include "gec/foundation/game_result.hpp"
#include "gec/foundation/types.hpp"
#include "gec/service/achievement_ledger.hpp"
#include "gec/service/battle_service.hpp"
#include "gec/service/catalog.hpp"
#include "gec/service/change_set.hpp"
#include "gec/service/engine_config.hpp"
#include "gec/service/exchange_service.hpp"
#include "gec/service/inventory_ledger.hpp"
#include "gec/service/persistence_sink.hpp"
#include "gec/service/player_store.hpp"
#include "gec/service/quest_service.hpp"
#include "gec/service/skill_service.hpp"
#include "gec/service/tournament_manager.hpp"

namespace gec::service {

/// Usage:
/// @code
///   InMemoryPersistenceSink sink;
///   EconomyEngine engine(EngineConfig{}, sink);
///   auto loaded = engine.catalog().loadFromFile("config/catalog.yaml");
///   auto id = engine.players().createPlayer({.displayName = "Zezima"});
/// @endcode
class EconomyEngine {
public:
    EconomyEngine(EngineConfig config, IPersistenceSink& sink,
                  foundation::Clock clock = foundation::systemNow);

    EconomyEngine(const EconomyEngine&) = delete;
    EconomyEngine& operator=(const EconomyEngine&) = delete;

    [[nodiscard]] Catalog& catalog() noexcept { return catalog_; }
    [[nodiscard]] PlayerStore& players() noexcept { return players_; }
    [[nodiscard]] SkillService& skills() noexcept { return skills_; }
    [[nodiscard]] InventoryLedger& inventory() noexcept { return inventory_; }
    [[nodiscard]] QuestService& quests() noexcept { return quests_; }
    [[nodiscard]] AchievementLedger& achievements() noexcept { return achievements_; }
    [[nodiscard]] ExchangeService& exchange() noexcept { return exchange_; }
    [[nodiscard]] BattleService& battles() noexcept { return battles_; }
    [[nodiscard]] TournamentManager& tournaments() noexcept { return tournaments_; }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// Full read model of one player.
    [[nodiscard]] foundation::GameResult<game::PlayerState> playerSnapshot(
        foundation::PlayerId player) const;

    /// Cascade delete through the exchange so resting orders leave the books.
    [[nodiscard]] foundation::GameResult<DeletionReport> deletePlayer(foundation::PlayerId player);

    /// Rebuild in-memory state from a persisted snapshot. Only valid on a
    /// freshly constructed engine with its catalog already loaded.
    [[nodiscard]] foundation::GameResult<void> restore(EngineSnapshot snapshot);

    /// Periodic maintenance: the inactivity-decay pass.
    [[nodiscard]] foundation::GameResult<DecayReport> runMaintenance(foundation::Timestamp now);

private:
    EngineConfig config_;
    Catalog catalog_;
    PlayerStore players_;
    SkillService skills_;
    InventoryLedger inventory_;
    QuestService quests_;
    AchievementLedger achievements_;
    ExchangeService exchange_;
    BattleService battles_;
    TournamentManager tournaments_;
};

}  // namespace gec::service
