/// @file tournament_manager_test.cpp
/// @brief Unit tests for TournamentManager: registration, seeding with
///        byes, match results and round advancement.

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "gec/service/tournament_manager.hpp"
#include "unit/service/engine_test_support.hpp"

using namespace gec::foundation;
using namespace gec::game;
using namespace gec::service;

class TournamentManagerTest : public gec::test::EngineTest {
protected:
    TournamentManager& tournaments() { return engine_->tournaments(); }

    std::vector<PlayerId> makePlayers(int count) {
        std::vector<PlayerId> ids;
        for (int i = 0; i < count; ++i) {
            ids.push_back(makePlayer("Fighter" + std::to_string(i)));
        }
        return ids;
    }

    TournamentId openTournament(const std::vector<PlayerId>& players, int32_t capacity = 8) {
        auto id = tournaments().createTournament("Castle Wars Cup", BattleCategory::Tournament,
                                                 capacity);
        EXPECT_TRUE(id.hasValue());
        for (auto player : players) {
            EXPECT_TRUE(tournaments().registerParticipant(id.value(), player).hasValue());
        }
        return id.value();
    }

    void schedule(TournamentId id, MatchId match) {
        auto scheduled = tournaments().scheduleMatch(id, match, clock_.now());
        ASSERT_TRUE(scheduled.hasValue()) << scheduled.error().message();
    }

    /// Schedule and report a match in one step.
    GameResult<TournamentMatch> play(TournamentId id, MatchId match, PlayerId winner) {
        schedule(id, match);
        return tournaments().reportMatchResult(id, match, winner, BattleOutcome{});
    }

    /// Report every open match of the current round, playerA winning.
    void playRound(TournamentId id) {
        auto view = tournaments().bracket(id);
        ASSERT_TRUE(view.hasValue());
        for (const auto& match : view.value().rounds.back()) {
            if (match.IsCompleted()) {
                continue;
            }
            auto reported = play(id, match.id, *match.playerA);
            ASSERT_TRUE(reported.hasValue()) << reported.error().message();
        }
    }
};

// ===========================================================================
// Creation and registration
// ===========================================================================

TEST_F(TournamentManagerTest, CreateValidatesInput) {
    EXPECT_EQ(tournaments().createTournament("", BattleCategory::Duel, 4).error().code(),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(tournaments().createTournament("Solo", BattleCategory::Duel, 1).error().code(),
              ErrorCode::InvalidArgument);

    auto id = tournaments().createTournament("Weekly", BattleCategory::Duel, 4);
    ASSERT_TRUE(id.hasValue());
    auto t = tournaments().getTournament(id.value());
    ASSERT_TRUE(t.hasValue());
    EXPECT_EQ(t.value().status, TournamentStatus::Pending);
    EXPECT_EQ(t.value().currentRound, 0);
    EXPECT_EQ(t.value().createdAt, clock_.now());

    auto last = sink_.last();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->operation, "create_tournament");
    ASSERT_EQ(last->tournaments.size(), 1u);
}

TEST_F(TournamentManagerTest, RegistrationRules) {
    auto players = makePlayers(3);
    auto id = openTournament({players[0], players[1]}, 2);

    auto dup = tournaments().registerParticipant(id, players[0]);
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::AlreadyExists);

    auto full = tournaments().registerParticipant(id, players[2]);
    ASSERT_TRUE(full.hasError());
    EXPECT_EQ(full.error().code(), ErrorCode::TournamentFull);

    EXPECT_EQ(tournaments().getTournament(id).value().participants.size(), 2u);
}

TEST_F(TournamentManagerTest, RegistrationNeedsActiveKnownPlayer) {
    auto players = makePlayers(1);
    auto id = openTournament({});
    EXPECT_EQ(tournaments().registerParticipant(id, PlayerId(999)).error().code(),
              ErrorCode::PlayerNotFound);

    ASSERT_TRUE(engine_->players().deactivatePlayer(players[0]).hasValue());
    EXPECT_EQ(tournaments().registerParticipant(id, players[0]).error().code(),
              ErrorCode::PlayerInactive);
}

TEST_F(TournamentManagerTest, UnknownTournament) {
    EXPECT_EQ(tournaments().registerParticipant(TournamentId(77), PlayerId(1)).error().code(),
              ErrorCode::TournamentNotFound);
    EXPECT_EQ(tournaments().bracket(TournamentId(77)).error().code(),
              ErrorCode::TournamentNotFound);
}

TEST_F(TournamentManagerTest, SinkFailureLeavesTournamentUnchanged) {
    auto players = makePlayers(1);
    auto id = openTournament({});
    sink_.failNextApply(GameError(ErrorCode::QueryFailed, "down"));
    auto failed = tournaments().registerParticipant(id, players[0]);
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::TransactionFailed);
    EXPECT_TRUE(tournaments().getTournament(id).value().participants.empty());
}

// ===========================================================================
// Starting
// ===========================================================================

TEST_F(TournamentManagerTest, StartNeedsTwoParticipants) {
    auto players = makePlayers(1);
    auto id = openTournament(players);
    auto started = tournaments().startTournament(id);
    ASSERT_TRUE(started.hasError());
    EXPECT_EQ(started.error().code(), ErrorCode::InvalidParticipants);
    EXPECT_EQ(tournaments().getTournament(id).value().status, TournamentStatus::Pending);
}

TEST_F(TournamentManagerTest, StartSeedsByRegistrationOrderWithByes) {
    auto players = makePlayers(5);
    auto id = openTournament(players);

    auto started = tournaments().startTournament(id);
    ASSERT_TRUE(started.hasValue());
    const auto& view = started.value();
    EXPECT_EQ(view.status, TournamentStatus::InProgress);
    EXPECT_EQ(view.currentRound, 1);
    ASSERT_EQ(view.rounds.size(), 1u);

    // Five players fill a bracket of eight: seeds 0-2 get byes.
    const auto& round = view.rounds[0];
    ASSERT_EQ(round.size(), 4u);
    for (int m = 0; m < 3; ++m) {
        EXPECT_TRUE(round[m].IsBye());
        EXPECT_TRUE(round[m].IsCompleted());
        EXPECT_EQ(round[m].winner, players[m]);
        EXPECT_TRUE(round[m].completedAt.has_value());
    }
    EXPECT_EQ(round[3].playerA, players[3]);
    EXPECT_EQ(round[3].playerB, players[4]);
    EXPECT_EQ(round[3].status, MatchStatus::Pending);

    EXPECT_EQ(tournaments().registerParticipant(id, makePlayer("Latecomer")).error().code(),
              ErrorCode::InvalidStateTransition);
    EXPECT_EQ(tournaments().startTournament(id).error().code(),
              ErrorCode::InvalidStateTransition);
}

// ===========================================================================
// Matches
// ===========================================================================

TEST_F(TournamentManagerTest, ScheduleOnlyPendingMatches) {
    auto players = makePlayers(3);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];
    const auto when = clock_.now() + std::chrono::hours(2);

    // round[0] is the bye for seed 0.
    EXPECT_EQ(tournaments().scheduleMatch(id, round[0].id, when).error().code(),
              ErrorCode::InvalidStateTransition);

    auto scheduled = tournaments().scheduleMatch(id, round[1].id, when);
    ASSERT_TRUE(scheduled.hasValue());
    EXPECT_EQ(scheduled.value().status, MatchStatus::Scheduled);
    EXPECT_EQ(scheduled.value().scheduledAt, when);

    EXPECT_EQ(tournaments().scheduleMatch(id, round[1].id, when).error().code(),
              ErrorCode::InvalidStateTransition);
    EXPECT_EQ(tournaments().scheduleMatch(id, MatchId(999), when).error().code(),
              ErrorCode::MatchNotFound);
}

TEST_F(TournamentManagerTest, ReportRecordsRatedBattle) {
    auto players = makePlayers(4);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];
    // Seed 0 meets seed 3.
    ASSERT_EQ(round[0].playerA, players[0]);
    ASSERT_EQ(round[0].playerB, players[3]);

    auto reported = play(id, round[0].id, players[3]);
    ASSERT_TRUE(reported.hasValue());
    const auto& match = reported.value();
    EXPECT_TRUE(match.IsCompleted());
    EXPECT_EQ(match.winner, players[3]);
    ASSERT_TRUE(match.battleId.has_value());

    auto battle = engine_->battles().getBattle(*match.battleId);
    ASSERT_TRUE(battle.hasValue());
    EXPECT_EQ(battle.value().battleKey, "tournament:" + std::to_string(id.value()) + ":match:" +
                                            std::to_string(round[0].id.value()));
    EXPECT_EQ(battle.value().category, BattleCategory::Tournament);
    EXPECT_EQ(state(players[3]).RatingFor(BattleCategory::Tournament).wins, 1);
    EXPECT_EQ(state(players[0]).RatingFor(BattleCategory::Tournament).losses, 1);
}

TEST_F(TournamentManagerTest, ReportRejectsBadResults) {
    auto players = makePlayers(3);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];

    EXPECT_EQ(tournaments().reportMatchResult(id, round[0].id, players[0], {}).error().code(),
              ErrorCode::InvalidStateTransition);
    schedule(id, round[1].id);
    EXPECT_EQ(tournaments().reportMatchResult(id, round[1].id, players[0], {}).error().code(),
              ErrorCode::InvalidParticipants);

    ASSERT_TRUE(tournaments().reportMatchResult(id, round[1].id, players[1], {}).hasValue());
    auto twice = tournaments().reportMatchResult(id, round[1].id, players[2], {});
    ASSERT_TRUE(twice.hasError());
    EXPECT_EQ(twice.error().code(), ErrorCode::InvalidStateTransition);
    EXPECT_EQ(state(players[1]).RatingFor(BattleCategory::Tournament).totalBattles, 1);
}

TEST_F(TournamentManagerTest, ReportNeedsScheduledMatch) {
    auto players = makePlayers(2);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];
    ASSERT_EQ(round[0].status, MatchStatus::Pending);

    auto unscheduled = tournaments().reportMatchResult(id, round[0].id, players[0], {});
    ASSERT_TRUE(unscheduled.hasError());
    EXPECT_EQ(unscheduled.error().code(), ErrorCode::InvalidStateTransition);
    EXPECT_FALSE(tournaments().getTournament(id).value().matches[0].IsCompleted());
    EXPECT_EQ(state(players[0]).RatingFor(BattleCategory::Tournament).totalBattles, 0);

    schedule(id, round[0].id);
    EXPECT_TRUE(tournaments().reportMatchResult(id, round[0].id, players[0], {}).hasValue());
}

TEST_F(TournamentManagerTest, ReportBeforeStartRejected) {
    auto players = makePlayers(2);
    auto id = openTournament(players);
    EXPECT_EQ(tournaments().reportMatchResult(id, MatchId(1), players[0], {}).error().code(),
              ErrorCode::InvalidStateTransition);
}

// ===========================================================================
// Advancement
// ===========================================================================

TEST_F(TournamentManagerTest, AdvanceWaitsForOpenMatches) {
    auto players = makePlayers(4);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];
    ASSERT_TRUE(play(id, round[0].id, players[0]).hasValue());

    auto early = tournaments().advanceTournamentRound(id);
    ASSERT_TRUE(early.hasError());
    EXPECT_EQ(early.error().code(), ErrorCode::RoundNotComplete);
    EXPECT_EQ(tournaments().getTournament(id).value().currentRound, 1);
}

TEST_F(TournamentManagerTest, NextRoundHoldsOnlyPreviousWinners) {
    auto players = makePlayers(8);
    auto id = openTournament(players);
    ASSERT_TRUE(tournaments().startTournament(id).hasValue());

    for (int32_t round = 1; round <= 2; ++round) {
        playRound(id);
        auto before = tournaments().bracket(id).value();
        std::set<PlayerId> winners;
        for (const auto& match : before.rounds.back()) {
            winners.insert(*match.winner);
        }

        auto advanced = tournaments().advanceTournamentRound(id);
        ASSERT_TRUE(advanced.hasValue());
        EXPECT_EQ(advanced.value().currentRound, round + 1);
        const auto& next = advanced.value().rounds.back();
        EXPECT_EQ(next.size(), winners.size() / 2);
        for (const auto& match : next) {
            EXPECT_EQ(winners.count(*match.playerA), 1u);
            EXPECT_EQ(winners.count(*match.playerB), 1u);
            EXPECT_EQ(match.round, round + 1);
        }
    }
}

TEST_F(TournamentManagerTest, FinalResultCompletesTournament) {
    auto players = makePlayers(3);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];
    ASSERT_TRUE(play(id, round[1].id, players[2]).hasValue());

    auto semi = tournaments().advanceTournamentRound(id);
    ASSERT_TRUE(semi.hasValue());
    ASSERT_EQ(semi.value().rounds.size(), 2u);
    const auto& decider = semi.value().rounds[1].front();
    EXPECT_EQ(decider.playerA, players[0]);
    EXPECT_EQ(decider.playerB, players[2]);

    ASSERT_TRUE(play(id, decider.id, players[2]).hasValue());
    auto t = tournaments().getTournament(id).value();
    EXPECT_EQ(t.status, TournamentStatus::Completed);
    EXPECT_EQ(t.winner, players[2]);
    ASSERT_TRUE(t.completedAt.has_value());

    EXPECT_EQ(tournaments().advanceTournamentRound(id).error().code(),
              ErrorCode::InvalidStateTransition);
}

TEST_F(TournamentManagerTest, TwoPlayerFinalFromTheStart) {
    auto players = makePlayers(2);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];
    ASSERT_EQ(round.size(), 1u);
    ASSERT_TRUE(play(id, round[0].id, players[1]).hasValue());

    auto view = tournaments().bracket(id);
    ASSERT_TRUE(view.hasValue());
    EXPECT_EQ(view.value().status, TournamentStatus::Completed);
    EXPECT_EQ(view.value().winner, players[1]);
}

TEST_F(TournamentManagerTest, FullBracketRunsToChampion) {
    auto players = makePlayers(8);
    auto id = openTournament(players);
    ASSERT_TRUE(tournaments().startTournament(id).hasValue());

    playRound(id);
    ASSERT_TRUE(tournaments().advanceTournamentRound(id).hasValue());
    playRound(id);
    ASSERT_TRUE(tournaments().advanceTournamentRound(id).hasValue());
    playRound(id);

    auto view = tournaments().bracket(id).value();
    EXPECT_EQ(view.status, TournamentStatus::Completed);
    ASSERT_EQ(view.rounds.size(), 3u);
    EXPECT_EQ(view.rounds[0].size(), 4u);
    EXPECT_EQ(view.rounds[1].size(), 2u);
    EXPECT_EQ(view.rounds[2].size(), 1u);
    // playerA always wins, so seed 0 takes the title.
    EXPECT_EQ(view.winner, players[0]);
    EXPECT_EQ(state(players[0]).RatingFor(BattleCategory::Tournament).wins, 3);
}

// ===========================================================================
// Forfeits
// ===========================================================================

TEST_F(TournamentManagerTest, ForfeitAwardsMatchWithoutBattle) {
    auto players = makePlayers(4);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];
    ASSERT_TRUE(engine_->players().deactivatePlayer(players[3]).hasValue());

    // round[0] pairs seed 0 with seed 3.
    auto forfeited = tournaments().forfeitMatch(id, round[0].id, players[3]);
    ASSERT_TRUE(forfeited.hasValue()) << forfeited.error().message();
    const auto& match = forfeited.value();
    EXPECT_TRUE(match.IsCompleted());
    EXPECT_TRUE(match.walkover);
    EXPECT_EQ(match.winner, players[0]);
    EXPECT_FALSE(match.battleId.has_value());
    EXPECT_TRUE(match.completedAt.has_value());
    EXPECT_EQ(state(players[0]).RatingFor(BattleCategory::Tournament).totalBattles, 0);

    auto last = sink_.last();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->operation, "forfeit_match");
    EXPECT_TRUE(last->battles.empty());

    ASSERT_TRUE(play(id, round[1].id, players[1]).hasValue());
    auto advanced = tournaments().advanceTournamentRound(id);
    ASSERT_TRUE(advanced.hasValue());
    const auto& decider = advanced.value().rounds.back().front();
    EXPECT_EQ(decider.playerA, players[0]);
    EXPECT_EQ(decider.playerB, players[1]);
}

TEST_F(TournamentManagerTest, ForfeitRules) {
    auto players = makePlayers(3);
    auto outsider = makePlayer("Outsider");
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];

    EXPECT_EQ(tournaments().forfeitMatch(id, round[0].id, players[0]).error().code(),
              ErrorCode::InvalidStateTransition);
    EXPECT_EQ(tournaments().forfeitMatch(id, round[1].id, outsider).error().code(),
              ErrorCode::InvalidParticipants);
    EXPECT_EQ(tournaments().forfeitMatch(id, MatchId(999), players[1]).error().code(),
              ErrorCode::MatchNotFound);

    // A scheduled match can still be forfeited, but only once.
    schedule(id, round[1].id);
    ASSERT_TRUE(tournaments().forfeitMatch(id, round[1].id, players[1]).hasValue());
    EXPECT_EQ(tournaments().forfeitMatch(id, round[1].id, players[2]).error().code(),
              ErrorCode::InvalidStateTransition);
    EXPECT_EQ(tournaments().reportMatchResult(id, round[1].id, players[1], {}).error().code(),
              ErrorCode::InvalidStateTransition);
}

TEST_F(TournamentManagerTest, ForfeitedFinalCompletesTournament) {
    auto players = makePlayers(2);
    auto id = openTournament(players);
    auto round = tournaments().startTournament(id).value().rounds[0];

    ASSERT_TRUE(tournaments().forfeitMatch(id, round[0].id, players[0]).hasValue());
    auto t = tournaments().getTournament(id).value();
    EXPECT_EQ(t.status, TournamentStatus::Completed);
    EXPECT_EQ(t.winner, players[1]);
    ASSERT_TRUE(t.completedAt.has_value());

    EXPECT_EQ(tournaments().forfeitMatch(id, round[0].id, players[1]).error().code(),
              ErrorCode::InvalidStateTransition);
}
