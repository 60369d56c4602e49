/// @file economy_engine_test.cpp
/// @brief End-to-end tests of EconomyEngine wiring, snapshots, cascade
///        delete and maintenance.

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>

#include "gec/foundation/config_manager.hpp"
#include "gec/service/economy_engine.hpp"
#include "unit/service/engine_test_support.hpp"

using namespace gec::foundation;
using namespace gec::game;
using namespace gec::service;

class EconomyEngineTest : public gec::test::EngineTest {};

// ===========================================================================
// Wiring
// ===========================================================================

TEST_F(EconomyEngineTest, ServicesShareOnePlayerStore) {
    auto id = makePlayer("Zezima", 1000);
    ASSERT_TRUE(engine_->skills().setSkillLevel(id, Skill::Attack, 70).hasValue());
    ASSERT_TRUE(engine_->inventory().placeItem(id, 0, ItemId(4151), 1).hasValue());
    ASSERT_TRUE(engine_->inventory().equip(id, 0).hasValue());
    ASSERT_TRUE(engine_->quests().completeQuest(id, QuestId(1)).hasValue());

    auto s = state(id);
    EXPECT_EQ(s.Level(Skill::Attack), 70);
    EXPECT_EQ(s.EquippedCount(ItemId(4151)), 1);
    EXPECT_EQ(s.profile.questPoints, 1);
    EXPECT_EQ(s.profile.coins, 1000);
}

TEST_F(EconomyEngineTest, AchievementsFollowEverySignal) {
    auto a = makePlayer("Alpha");
    auto b = makePlayer("Beta");

    // SkillChanged
    ASSERT_TRUE(engine_->skills().setSkillLevel(a, Skill::Attack, 99).hasValue());
    ASSERT_TRUE(engine_->skills().setSkillLevel(a, Skill::Strength, 99).hasValue());
    // BattleRecorded
    BattleRequest request;
    request.battleKey = "wiring";
    request.playerA = a;
    request.playerB = b;
    request.winner = a;
    ASSERT_TRUE(engine_->battles().recordBattle(request).hasValue());
    // QuestCompleted
    ASSERT_TRUE(engine_->quests().completeQuest(a, QuestId(1)).hasValue());
    ASSERT_TRUE(engine_->skills().setSkillLevel(a, Skill::Crafting, 8).hasValue());
    bank(a, ItemId(1511), 1);
    ASSERT_TRUE(engine_->quests().completeQuest(a, QuestId(3)).hasValue());

    auto s = state(a);
    EXPECT_EQ(s.achievements.count(AchievementId(5)), 1u);
    EXPECT_EQ(s.achievements.count(AchievementId(1)), 1u);
    EXPECT_EQ(s.achievements.count(AchievementId(4)), 1u);
    EXPECT_TRUE(state(b).achievements.empty());
}

TEST_F(EconomyEngineTest, EveryWriteMirrorsOneChangeSet) {
    const auto start = sink_.appliedCount();
    auto id = makePlayer("Mirror", 50);
    ASSERT_TRUE(engine_->inventory().grantCoins(id, 25).hasValue());
    ASSERT_TRUE(engine_->skills().addExperience(id, Skill::Cooking, 100).hasValue());
    EXPECT_EQ(sink_.appliedCount(), start + 3);

    auto last = sink_.last();
    ASSERT_TRUE(last.has_value());
    ASSERT_EQ(last->players.size(), 1u);
    EXPECT_EQ(last->players.front().profile.coins, 75);
    EXPECT_EQ(last->players.front().SkillOf(Skill::Cooking).experience, 100);
}

TEST_F(EconomyEngineTest, SnapshotOfUnknownPlayer) {
    auto snap = engine_->playerSnapshot(PlayerId(12345));
    ASSERT_TRUE(snap.hasError());
    EXPECT_EQ(snap.error().code(), ErrorCode::PlayerNotFound);
}

TEST_F(EconomyEngineTest, SnapshotIsACopy) {
    auto id = makePlayer("Copy", 10);
    auto snap = state(id);
    snap.profile.coins = 999999;
    EXPECT_EQ(state(id).profile.coins, 10);
}

// ===========================================================================
// Cascade delete
// ===========================================================================

TEST_F(EconomyEngineTest, DeleteRemovesPlayerAndRestingOrders) {
    auto seller = makePlayer("Leaving", 0);
    auto buyer = makePlayer("Staying", 100000);
    bank(seller, ItemId(314), 500);
    ASSERT_TRUE(engine_->inventory().placeItem(seller, 0, ItemId(4151), 1).hasValue());
    ASSERT_TRUE(engine_->skills().setSkillLevel(seller, Skill::Attack, 70).hasValue());
    ASSERT_TRUE(engine_->inventory().equip(seller, 0).hasValue());

    auto resting = engine_->exchange().submitOrder(seller, ItemId(314), OrderSide::Sell, 200, 5);
    ASSERT_TRUE(resting.hasValue());
    auto partial = engine_->exchange().submitOrder(buyer, ItemId(314), OrderSide::Buy, 50, 5);
    ASSERT_TRUE(partial.hasValue());
    ASSERT_EQ(partial.value().trades.size(), 1u);

    auto report = engine_->deletePlayer(seller);
    ASSERT_TRUE(report.hasValue()) << report.error().message();
    const auto& rows = report.value().rowsByTable;
    EXPECT_EQ(report.value().player, seller);
    EXPECT_EQ(rows.at("orders"), 1u);
    EXPECT_EQ(rows.at("equipment"), 1u);
    EXPECT_EQ(rows.at("bank"), 1u);
    EXPECT_EQ(rows.at("players"), 1u);
    EXPECT_EQ(rows.at("skills"), kSkillCount);

    EXPECT_EQ(engine_->playerSnapshot(seller).error().code(), ErrorCode::PlayerNotFound);
    EXPECT_EQ(engine_->exchange().getOrder(resting.value().order.id).error().code(),
              ErrorCode::OrderNotFound);
    auto depth = engine_->exchange().depth(ItemId(314));
    ASSERT_TRUE(depth.hasValue());
    EXPECT_TRUE(depth.value().asks.empty());

    // Executed trades stay in the market history.
    auto trades = engine_->exchange().tradesForItem(ItemId(314));
    ASSERT_TRUE(trades.hasValue());
    EXPECT_EQ(trades.value().size(), 1u);

    auto last = sink_.last();
    ASSERT_TRUE(last.has_value());
    ASSERT_EQ(last->deletedPlayers.size(), 1u);
    EXPECT_EQ(last->deletedPlayers.front(), seller);

    EXPECT_EQ(state(buyer).BankCount(ItemId(314)), 50);
}

TEST_F(EconomyEngineTest, DeleteUnknownPlayer) {
    auto report = engine_->deletePlayer(PlayerId(404));
    ASSERT_TRUE(report.hasError());
    EXPECT_EQ(report.error().code(), ErrorCode::PlayerNotFound);
}

TEST_F(EconomyEngineTest, DeletedNameCanBeReused) {
    auto id = makePlayer("Phoenix");
    ASSERT_TRUE(engine_->deletePlayer(id).hasValue());
    auto again = makePlayer("phoenix");
    EXPECT_TRUE(again.isValid());
    EXPECT_NE(again, id);
}

// ===========================================================================
// Maintenance
// ===========================================================================

TEST_F(EconomyEngineTest, MaintenanceWithoutRatingsIsQuiet) {
    makePlayer("Idle");
    const auto writes = sink_.appliedCount();
    clock_.advance(std::chrono::hours(24 * 365));
    auto report = engine_->runMaintenance(clock_.now());
    ASSERT_TRUE(report.hasValue());
    EXPECT_EQ(report.value().playersScanned, 1u);
    EXPECT_EQ(report.value().ratingsDecayed, 0u);
    EXPECT_EQ(sink_.appliedCount(), writes);
}

TEST_F(EconomyEngineTest, MaintenanceMirrorsDecay) {
    auto a = makePlayer("Old");
    auto b = makePlayer("Timer");
    BattleRequest request;
    request.battleKey = "long-ago";
    request.playerA = a;
    request.playerB = b;
    ASSERT_TRUE(engine_->battles().recordBattle(request).hasValue());

    clock_.advance(std::chrono::hours(24 * 31));
    const auto writes = sink_.appliedCount();
    auto report = engine_->runMaintenance(clock_.now());
    ASSERT_TRUE(report.hasValue());
    EXPECT_EQ(report.value().ratingsDecayed, 2u);
    EXPECT_EQ(sink_.appliedCount(), writes + 2);
    EXPECT_EQ(sink_.last()->operation, "inactivity_decay");
}

// ===========================================================================
// Restart
// ===========================================================================

TEST_F(EconomyEngineTest, RestartRestoresPersistedState) {
    constexpr ItemId kFeather{314};
    auto seller = makePlayer("Merchant");
    bank(seller, kFeather, 20);
    auto buyer = makePlayer("Collector", 5000);
    auto ask = engine_->exchange().submitOrder(seller, kFeather, OrderSide::Sell, 20, 50);
    ASSERT_TRUE(ask.hasValue());
    auto bid = engine_->exchange().submitOrder(buyer, kFeather, OrderSide::Buy, 5, 50);
    ASSERT_TRUE(bid.hasValue());
    ASSERT_EQ(bid.value().trades.size(), 1u);

    BattleRequest duel;
    duel.battleKey = "before-restart";
    duel.playerA = seller;
    duel.playerB = buyer;
    duel.winner = seller;
    auto battle = engine_->battles().recordBattle(duel);
    ASSERT_TRUE(battle.hasValue());

    auto cup = engine_->tournaments().createTournament("Restart Cup", BattleCategory::Tournament, 2);
    ASSERT_TRUE(cup.hasValue());
    ASSERT_TRUE(engine_->tournaments().registerParticipant(cup.value(), seller).hasValue());
    ASSERT_TRUE(engine_->tournaments().registerParticipant(cup.value(), buyer).hasValue());
    auto started = engine_->tournaments().startTournament(cup.value());
    ASSERT_TRUE(started.hasValue());
    const auto decider = started.value().rounds[0][0].id;

    auto persisted = sink_.load();
    ASSERT_TRUE(persisted.hasValue());
    EconomyEngine restarted(EngineConfig{}, sink_, clock_.clock());
    ASSERT_TRUE(restarted.catalog().loadFromString(gec::test::kTestCatalog).hasValue());
    auto restored = restarted.restore(std::move(persisted.value()));
    ASSERT_TRUE(restored.hasValue()) << restored.error().message();

    // Players and balances.
    auto b = restarted.playerSnapshot(buyer);
    ASSERT_TRUE(b.hasValue());
    EXPECT_EQ(b.value().profile.coins, 5000 - 250);
    EXPECT_EQ(b.value().BankCount(kFeather), 5);
    EXPECT_EQ(restarted.playerSnapshot(seller).value().profile.coins, 250);
    EXPECT_TRUE(restarted.players().createPlayer({.displayName = "Merchant"}).hasError());

    NewPlayer newcomer;
    newcomer.displayName = "Newcomer";
    newcomer.startingCoins = 1000;
    auto fresh = restarted.players().createPlayer(newcomer);
    ASSERT_TRUE(fresh.hasValue());
    EXPECT_GT(fresh.value().value(), buyer.value());

    // The resting ask is back on the book and keeps matching.
    auto depth = restarted.exchange().depth(kFeather);
    ASSERT_TRUE(depth.hasValue());
    ASSERT_EQ(depth.value().asks.size(), 1u);
    EXPECT_EQ(depth.value().asks[0].quantity, 15);
    auto later = restarted.exchange().submitOrder(fresh.value(), kFeather, OrderSide::Buy, 10, 50);
    ASSERT_TRUE(later.hasValue()) << later.error().message();
    ASSERT_EQ(later.value().trades.size(), 1u);
    EXPECT_EQ(later.value().trades[0].sellOrder, ask.value().order.id);
    EXPECT_GT(later.value().order.id, bid.value().order.id);
    EXPECT_GT(later.value().trades[0].id, bid.value().trades[0].id);
    EXPECT_EQ(restarted.exchange().tradesForItem(kFeather).value().size(), 2u);

    // Battle keys stay idempotent.
    auto replayed = restarted.battles().recordBattle(duel);
    ASSERT_TRUE(replayed.hasValue());
    EXPECT_EQ(replayed.value().id, battle.value().id);
    EXPECT_EQ(restarted.playerSnapshot(seller).value().RatingFor(BattleCategory::Duel).wins, 1);

    // The bracket picks up where it stopped.
    ASSERT_TRUE(restarted.tournaments().scheduleMatch(cup.value(), decider, clock_.now()).hasValue());
    auto champion = restarted.tournaments().reportMatchResult(cup.value(), decider, buyer, {});
    ASSERT_TRUE(champion.hasValue()) << champion.error().message();
    EXPECT_GT(champion.value().battleId->value(), battle.value().id.value());
    EXPECT_EQ(restarted.tournaments().getTournament(cup.value()).value().status,
              TournamentStatus::Completed);
    auto next = restarted.tournaments().createTournament("Second Cup", BattleCategory::Duel, 4);
    ASSERT_TRUE(next.hasValue());
    EXPECT_GT(next.value(), cup.value());

    auto twice = restarted.restore(EngineSnapshot{});
    ASSERT_TRUE(twice.hasError());
    EXPECT_EQ(twice.error().code(), ErrorCode::InvalidStateTransition);
}

TEST_F(EconomyEngineTest, RestoreRejectsDuplicatePlayers) {
    auto id = makePlayer("Twice");
    auto persisted = sink_.load();
    ASSERT_TRUE(persisted.hasValue());
    auto snapshot = persisted.value();
    snapshot.players.push_back(snapshot.players.front());

    EconomyEngine restarted(EngineConfig{}, sink_, clock_.clock());
    auto restored = restarted.restore(std::move(snapshot));
    ASSERT_TRUE(restored.hasError());
    EXPECT_EQ(restored.error().code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(restarted.playerSnapshot(id).error().code(), ErrorCode::PlayerNotFound);
}

TEST_F(EconomyEngineTest, DeletedPlayerStaysDeletedAfterRestart) {
    auto gone = makePlayer("Gone", 1000);
    auto kept = makePlayer("Kept");
    ASSERT_TRUE(engine_->exchange().submitOrder(gone, ItemId(314), OrderSide::Buy, 1, 10).hasValue());
    ASSERT_TRUE(engine_->deletePlayer(gone).hasValue());

    auto persisted = sink_.load();
    ASSERT_TRUE(persisted.hasValue());
    EXPECT_EQ(persisted.value().players.size(), 1u);
    EXPECT_TRUE(persisted.value().orders.empty());

    EconomyEngine restarted(EngineConfig{}, sink_, clock_.clock());
    ASSERT_TRUE(restarted.restore(std::move(persisted.value())).hasValue());
    EXPECT_TRUE(restarted.playerSnapshot(kept).hasValue());
    EXPECT_EQ(restarted.playerSnapshot(gone).error().code(), ErrorCode::PlayerNotFound);
    EXPECT_TRUE(restarted.exchange().depth(ItemId(314)).value().bids.empty());
}

// ===========================================================================
// Configuration
// ===========================================================================

class ConfiguredEngineTest : public gec::test::EngineTest {
protected:
    EngineConfig config() const override {
        ConfigManager manager;
        EXPECT_TRUE(manager
                        .loadFromString("inventory:\n  bank_capacity: 1\n"
                                        "exchange:\n  depth_levels: 1\n"
                                        "rating:\n  initial_rating: 1500\n")
                        .hasValue());
        auto cfg = EngineConfig::fromConfig(manager);
        EXPECT_TRUE(cfg.hasValue());
        return cfg.hasValue() ? cfg.value() : EngineConfig{};
    }
};

TEST_F(ConfiguredEngineTest, SettingsReachTheServices) {
    EXPECT_EQ(engine_->config().inventory.bankCapacity, 1u);
    EXPECT_EQ(engine_->battles().params().initialRating, 1500);
    EXPECT_EQ(engine_->exchange().config().depthLevels, 1u);

    auto id = makePlayer("Hoarder", 100000);
    bank(id, ItemId(314), 10);
    ASSERT_TRUE(engine_->inventory().placeItem(id, 0, ItemId(1511), 1).hasValue());
    auto full = engine_->inventory().depositItem(id, 0, 1);
    ASSERT_TRUE(full.hasError());
    EXPECT_EQ(full.error().code(), ErrorCode::BankFull);

    ASSERT_TRUE(engine_->exchange().submitOrder(id, ItemId(1511), OrderSide::Buy, 1, 10).hasValue());
    ASSERT_TRUE(engine_->exchange().submitOrder(id, ItemId(1511), OrderSide::Buy, 1, 11).hasValue());
    auto depth = engine_->exchange().depth(ItemId(1511));
    ASSERT_TRUE(depth.hasValue());
    ASSERT_EQ(depth.value().bids.size(), 1u);
    EXPECT_EQ(depth.value().bids.front().price, 11);
}
