#include <gtest/gtest.h>

#include <set>

#include "gec/game/tournament_types.hpp"

using namespace gec::foundation;
using namespace gec::game;

namespace {

std::vector<PlayerId> players(uint64_t count) {
    std::vector<PlayerId> out;
    for (uint64_t i = 1; i <= count; ++i) {
        out.emplace_back(i);
    }
    return out;
}

}  // namespace

TEST(BracketMathTest, SizeAndRounds) {
    EXPECT_EQ(bracketSize(2), 2u);
    EXPECT_EQ(bracketSize(3), 4u);
    EXPECT_EQ(bracketSize(8), 8u);
    EXPECT_EQ(bracketSize(9), 16u);
    EXPECT_EQ(roundCount(2), 1);
    EXPECT_EQ(roundCount(5), 3);
    EXPECT_EQ(roundCount(16), 4);
}

TEST(BracketSeedingTest, FullBracketPairsOuterSeeds) {
    auto round = seedFirstRound(players(4));
    ASSERT_EQ(round.size(), 2u);
    EXPECT_EQ(round[0].playerA, PlayerId(1));
    EXPECT_EQ(round[0].playerB, PlayerId(4));
    EXPECT_EQ(round[1].playerA, PlayerId(2));
    EXPECT_EQ(round[1].playerB, PlayerId(3));
    for (const auto& m : round) {
        EXPECT_EQ(m.round, 1);
        EXPECT_EQ(m.status, MatchStatus::Pending);
        EXPECT_FALSE(m.IsBye());
    }
}

TEST(BracketSeedingTest, ByesGoToTopSeeds) {
    auto round = seedFirstRound(players(5));
    ASSERT_EQ(round.size(), 4u);

    int byes = 0;
    for (const auto& m : round) {
        if (m.IsBye()) {
            ++byes;
            EXPECT_TRUE(m.IsCompleted());
            EXPECT_EQ(m.winner, m.playerA);
        }
    }
    EXPECT_EQ(byes, 3);
    // Seed 1 meets seed 8 (absent), so seed 1 gets a bye.
    EXPECT_TRUE(round[0].IsBye());
    EXPECT_EQ(round[0].winner, PlayerId(1));
    // Seeds 4 and 5 play.
    EXPECT_FALSE(round[3].IsBye());
    EXPECT_EQ(round[3].playerA, PlayerId(4));
    EXPECT_EQ(round[3].playerB, PlayerId(5));
}

TEST(BracketSeedingTest, EveryParticipantAppearsOnce) {
    auto round = seedFirstRound(players(11));
    std::set<PlayerId> seen;
    for (const auto& m : round) {
        if (m.playerA) {
            EXPECT_TRUE(seen.insert(*m.playerA).second);
        }
        if (m.playerB) {
            EXPECT_TRUE(seen.insert(*m.playerB).second);
        }
    }
    EXPECT_EQ(seen.size(), 11u);
}

TEST(BracketSeedingTest, TooFewParticipants) {
    EXPECT_TRUE(seedFirstRound(players(1)).empty());
}

TEST(BracketPairingTest, NextRoundTakesOnlyWinners) {
    auto round1 = seedFirstRound(players(4));
    round1[0].winner = round1[0].playerB;  // seed 4 upsets seed 1
    round1[0].status = MatchStatus::Completed;
    round1[1].winner = round1[1].playerA;
    round1[1].status = MatchStatus::Completed;

    std::vector<const TournamentMatch*> done = {&round1[0], &round1[1]};
    auto round2 = pairNextRound(done, 2);
    ASSERT_EQ(round2.size(), 1u);
    EXPECT_EQ(round2[0].round, 2);
    EXPECT_EQ(round2[0].playerA, PlayerId(4));
    EXPECT_EQ(round2[0].playerB, PlayerId(2));
    EXPECT_FALSE(round2[0].Involves(PlayerId(1)));
    EXPECT_FALSE(round2[0].Involves(PlayerId(3)));
}

TEST(BracketPairingTest, IncompleteRoundYieldsNothing) {
    auto round1 = seedFirstRound(players(4));
    round1[0].winner = round1[0].playerA;
    round1[0].status = MatchStatus::Completed;

    std::vector<const TournamentMatch*> partial = {&round1[0], &round1[1]};
    EXPECT_TRUE(pairNextRound(partial, 2).empty());
}

TEST(TournamentTest, RoundMatchesSortedByPosition) {
    Tournament t;
    TournamentMatch late;
    late.round = 1;
    late.position = 1;
    late.id = MatchId(2);
    TournamentMatch early;
    early.round = 1;
    early.position = 0;
    early.id = MatchId(1);
    t.matches = {late, early};

    auto matches = t.RoundMatches(1);
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0]->id, MatchId(1));
    EXPECT_TRUE(t.RoundMatches(2).empty());
    ASSERT_NE(t.FindMatch(MatchId(2)), nullptr);
    EXPECT_EQ(t.FindMatch(MatchId(3)), nullptr);
    EXPECT_EQ(tournamentStatusName(TournamentStatus::InProgress), "in_progress");
}
