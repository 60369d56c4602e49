/// @file battle_service_test.cpp
/// @brief Unit tests for BattleService: rating updates, idempotent replay,
///        rewards, achievements and inactivity decay.

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <string>
#include <utility>

#include "gec/service/battle_service.hpp"
#include "unit/service/engine_test_support.hpp"

using namespace gec::foundation;
using namespace gec::game;
using namespace gec::service;

class BattleServiceTest : public gec::test::EngineTest {
protected:
    void SetUp() override {
        EngineTest::SetUp();
        alice_ = makePlayer("Alice");
        bob_ = makePlayer("Bob");
    }

    BattleService& battles() { return engine_->battles(); }

    BattleRequest duel(const std::string& key, std::optional<PlayerId> winner) {
        BattleRequest request;
        request.battleKey = key;
        request.category = BattleCategory::Duel;
        request.playerA = alice_;
        request.playerB = bob_;
        request.winner = winner;
        request.outcome.durationSeconds = 90;
        request.outcome.turns = 12;
        return request;
    }

    BattleRecord record(const BattleRequest& request) {
        auto result = battles().recordBattle(request);
        EXPECT_TRUE(result.hasValue()) << (result ? "" : std::string(result.error().message()));
        return result.hasValue() ? result.value() : BattleRecord{};
    }

    PlayerId alice_;
    PlayerId bob_;
};

// ===========================================================================
// Ratings
// ===========================================================================

TEST_F(BattleServiceTest, WinMovesBothRatings) {
    auto rec = record(duel("duel-1", alice_));
    EXPECT_TRUE(rec.id.isValid());
    EXPECT_FALSE(rec.IsDraw());
    EXPECT_EQ(rec.recordedAt, clock_.now());

    auto a = state(alice_).RatingFor(BattleCategory::Duel);
    auto b = state(bob_).RatingFor(BattleCategory::Duel);
    EXPECT_EQ(a.rating, 1020);
    EXPECT_EQ(b.rating, 980);
    EXPECT_DOUBLE_EQ(a.uncertainty, 350.0 * 0.95);
    EXPECT_EQ(a.wins, 1);
    EXPECT_EQ(b.losses, 1);
    EXPECT_EQ(a.totalBattles, 1);
    EXPECT_EQ(a.winStreak, 1);
    EXPECT_EQ(b.winStreak, 0);
}

TEST_F(BattleServiceTest, DrawBetweenEqualsKeepsRatings) {
    auto rec = record(duel("draw-1", std::nullopt));
    EXPECT_TRUE(rec.IsDraw());
    auto a = state(alice_).RatingFor(BattleCategory::Duel);
    EXPECT_EQ(a.rating, 1000);
    EXPECT_EQ(a.draws, 1);
}

TEST_F(BattleServiceTest, RatingsTrackedPerCategory) {
    auto request = duel("wild-1", bob_);
    request.category = BattleCategory::Wilderness;
    record(request);

    auto s = state(bob_);
    EXPECT_EQ(s.RatingFor(BattleCategory::Wilderness).rating, 1020);
    EXPECT_EQ(s.RatingFor(BattleCategory::Duel).rating, 1000);
    EXPECT_EQ(s.ratings.count(BattleCategory::Duel), 0u);
}

TEST_F(BattleServiceTest, StreakRules) {
    record(duel("s1", alice_));
    record(duel("s2", alice_));
    record(duel("s3", std::nullopt));
    EXPECT_EQ(state(alice_).RatingFor(BattleCategory::Duel).winStreak, 2);

    record(duel("s4", bob_));
    auto a = state(alice_).RatingFor(BattleCategory::Duel);
    EXPECT_EQ(a.winStreak, 0);
    EXPECT_EQ(a.bestWinStreak, 2);
}

TEST_F(BattleServiceTest, StatsAndFavouriteMove) {
    auto request = duel("stats", alice_);
    request.outcome.first.damageDealt = 99;
    request.outcome.first.damageTaken = 20;
    request.outcome.first.moveUsage = {{"stab", 3}, {"slash", 3}, {"special", 1}};
    record(request);

    auto a = state(alice_).RatingFor(BattleCategory::Duel);
    EXPECT_EQ(a.damageDealt, 99);
    EXPECT_EQ(a.damageTaken, 20);
    EXPECT_EQ(a.moveUsage.at("stab"), 3);
    EXPECT_EQ(a.favouriteMove, "slash");
    ASSERT_TRUE(a.lastBattle.has_value());
    EXPECT_EQ(*a.lastBattle, clock_.now());
}

// ===========================================================================
// Idempotency
// ===========================================================================

TEST_F(BattleServiceTest, ReplayReturnsStoredRecord) {
    auto first = record(duel("replay", alice_));
    const auto writes = sink_.appliedCount();

    clock_.advance(std::chrono::minutes(1));
    auto again = record(duel("replay", bob_));
    EXPECT_EQ(again.id, first.id);
    EXPECT_EQ(again.winner, alice_);
    EXPECT_EQ(again.recordedAt, first.recordedAt);
    EXPECT_EQ(sink_.appliedCount(), writes);

    auto a = state(alice_).RatingFor(BattleCategory::Duel);
    EXPECT_EQ(a.wins, 1);
    EXPECT_EQ(a.totalBattles, 1);
    EXPECT_EQ(a.rating, 1020);
}

TEST_F(BattleServiceTest, ReplayWithSwappedSidesIsTheSameBattle) {
    auto first = record(duel("swapped", alice_));
    auto request = duel("swapped", alice_);
    std::swap(request.playerA, request.playerB);
    auto again = record(request);
    EXPECT_EQ(again.id, first.id);
    EXPECT_EQ(again.playerA, alice_);
}

TEST_F(BattleServiceTest, KeyOfAnotherPairRejected) {
    auto carol = makePlayer("Carol");
    auto first = record(duel("taken", alice_));
    const auto writes = sink_.appliedCount();

    auto request = duel("taken", carol);
    request.playerB = carol;
    auto reused = battles().recordBattle(request);
    ASSERT_TRUE(reused.hasError());
    EXPECT_EQ(reused.error().code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(sink_.appliedCount(), writes);
    EXPECT_EQ(state(carol).ratings.size(), 0u);
    EXPECT_EQ(battles().findByKey("taken")->playerB, bob_);

    // Rejections consume no battle id.
    auto next = record(duel("fresh", bob_));
    EXPECT_EQ(next.id.value(), first.id.value() + 1);
}

TEST_F(BattleServiceTest, LookupByIdAndKey) {
    auto rec = record(duel("lookup", alice_));
    auto byId = battles().getBattle(rec.id);
    ASSERT_TRUE(byId.hasValue());
    EXPECT_EQ(byId.value().battleKey, "lookup");

    auto byKey = battles().findByKey("lookup");
    ASSERT_TRUE(byKey.has_value());
    EXPECT_EQ(byKey->id, rec.id);

    EXPECT_FALSE(battles().findByKey("missing").has_value());
    EXPECT_EQ(battles().getBattle(BattleId(404)).error().code(), ErrorCode::BattleNotFound);
}

TEST_F(BattleServiceTest, SinkFailureRecordsNothing) {
    sink_.failNextApply(GameError(ErrorCode::QueryFailed, "timeout"));
    auto failed = battles().recordBattle(duel("flaky", alice_));
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::TransactionFailed);
    EXPECT_FALSE(battles().findByKey("flaky").has_value());
    EXPECT_EQ(state(alice_).ratings.size(), 0u);
    EXPECT_TRUE(state(alice_).achievements.empty());

    auto retried = record(duel("flaky", alice_));
    EXPECT_TRUE(retried.id.isValid());
    EXPECT_EQ(state(alice_).RatingFor(BattleCategory::Duel).wins, 1);
}

// ===========================================================================
// Validation
// ===========================================================================

TEST_F(BattleServiceTest, RejectsMalformedRequests) {
    auto noKey = duel("", alice_);
    EXPECT_EQ(battles().recordBattle(noKey).error().code(), ErrorCode::InvalidArgument);

    auto self = duel("self", alice_);
    self.playerB = alice_;
    EXPECT_EQ(battles().recordBattle(self).error().code(), ErrorCode::InvalidParticipants);

    auto outsider = duel("outsider", PlayerId(999));
    EXPECT_EQ(battles().recordBattle(outsider).error().code(), ErrorCode::InvalidParticipants);

    auto negative = duel("negative", alice_);
    negative.outcome.second.damageTaken = -1;
    EXPECT_EQ(battles().recordBattle(negative).error().code(), ErrorCode::InvalidArgument);

    auto badReward = duel("reward", alice_);
    badReward.outcome.first.reward.items.push_back(ItemStack{ItemId(12345), 1});
    EXPECT_EQ(battles().recordBattle(badReward).error().code(), ErrorCode::ItemNotFound);

    auto ghost = duel("ghost", alice_);
    ghost.playerB = PlayerId(999);
    EXPECT_EQ(battles().recordBattle(ghost).error().code(), ErrorCode::PlayerNotFound);
}

TEST_F(BattleServiceTest, InactiveParticipantRejected) {
    ASSERT_TRUE(engine_->players().deactivatePlayer(bob_).hasValue());
    auto result = battles().recordBattle(duel("inactive", alice_));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::PlayerInactive);
    EXPECT_FALSE(battles().findByKey("inactive").has_value());
}

// ===========================================================================
// Rewards and achievements
// ===========================================================================

TEST_F(BattleServiceTest, RewardsCreditedWithBattle) {
    auto request = duel("loot", alice_);
    request.outcome.first.reward.coins = 5000;
    request.outcome.first.reward.items.push_back(ItemStack{ItemId(6570), 1});
    request.outcome.second.reward.coins = 100;
    record(request);

    auto a = state(alice_);
    EXPECT_EQ(a.profile.coins, 5000);
    EXPECT_EQ(a.BankCount(ItemId(6570)), 1);
    EXPECT_EQ(a.collectionLog.count(ItemId(6570)), 1u);
    EXPECT_EQ(state(bob_).profile.coins, 100);
}

TEST_F(BattleServiceTest, AchievementsAwardedOnceAcrossReplays) {
    record(duel("a1", alice_));
    auto s = state(alice_);
    EXPECT_EQ(s.achievements.count(AchievementId(1)), 1u);
    EXPECT_EQ(s.achievements.count(AchievementId(2)), 0u);
    EXPECT_EQ(state(bob_).achievements.count(AchievementId(1)), 0u);

    record(duel("a2", alice_));
    record(duel("a3", alice_));
    record(duel("a3", alice_));
    s = state(alice_);
    EXPECT_EQ(s.RatingFor(BattleCategory::Duel).winStreak, 3);
    EXPECT_EQ(s.achievements.count(AchievementId(2)), 1u);
    EXPECT_EQ(s.achievements.size(), 2u);
}

TEST_F(BattleServiceTest, StreakAchievementNeedsItsCategory) {
    for (int i = 0; i < 3; ++i) {
        auto request = duel("creature-" + std::to_string(i), alice_);
        request.category = BattleCategory::Creature;
        record(request);
    }
    EXPECT_EQ(state(alice_).achievements.count(AchievementId(2)), 0u);
}

TEST_F(BattleServiceTest, BattleCountAchievementSpansCategories) {
    for (int i = 0; i < 5; ++i) {
        auto request = duel("mixed-" + std::to_string(i), bob_);
        request.category = i % 2 == 0 ? BattleCategory::Duel : BattleCategory::Wilderness;
        record(request);
    }
    // Five battles, but never five in one category.
    EXPECT_EQ(state(alice_).achievements.count(AchievementId(3)), 0u);

    auto request = duel("mixed-5", bob_);
    request.category = BattleCategory::Duel;
    record(request);
    record(duel("mixed-6", bob_));
    EXPECT_EQ(state(alice_).achievements.count(AchievementId(3)), 1u);
}

// ===========================================================================
// Inactivity decay
// ===========================================================================

TEST_F(BattleServiceTest, DecayGrowsIdleUncertainty) {
    record(duel("old", alice_));
    const double before = state(alice_).RatingFor(BattleCategory::Duel).uncertainty;

    clock_.advance(std::chrono::hours(24 * 61));
    auto report = engine_->runMaintenance(clock_.now());
    ASSERT_TRUE(report.hasValue());
    EXPECT_EQ(report.value().playersScanned, 2u);
    EXPECT_EQ(report.value().ratingsDecayed, 2u);

    auto a = state(alice_).RatingFor(BattleCategory::Duel);
    EXPECT_NEAR(a.uncertainty, std::sqrt(before * before + 35.0 * 35.0 * 2), 1e-9);
    EXPECT_EQ(a.rating, 1020);

    // Idempotent within the same period.
    auto again = engine_->runMaintenance(clock_.now());
    ASSERT_TRUE(again.hasValue());
    EXPECT_EQ(again.value().ratingsDecayed, 0u);
    EXPECT_NEAR(state(alice_).RatingFor(BattleCategory::Duel).uncertainty, a.uncertainty, 1e-9);
}

TEST_F(BattleServiceTest, DecayCappedAtMaximum) {
    record(duel("ancient", alice_));
    clock_.advance(std::chrono::hours(24 * 365 * 10));
    ASSERT_TRUE(engine_->runMaintenance(clock_.now()).hasValue());
    EXPECT_DOUBLE_EQ(state(alice_).RatingFor(BattleCategory::Duel).uncertainty, 350.0);
}

TEST_F(BattleServiceTest, RecentBattleNotDecayed) {
    record(duel("fresh", alice_));
    clock_.advance(std::chrono::hours(24 * 29));
    auto report = engine_->runMaintenance(clock_.now());
    ASSERT_TRUE(report.hasValue());
    EXPECT_EQ(report.value().ratingsDecayed, 0u);
}
