#pragma once

/// @file tournament_types.hpp
/// @brief Single-elimination tournament data and pure bracket seeding.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gec/foundation/types.hpp"
#include "gec/game/battle_types.hpp"

namespace gec::game {

/// Pending -> InProgress -> Completed.
enum class TournamentStatus : uint8_t { Pending, InProgress, Completed };

/// Pending -> Scheduled -> Completed. Byes and forfeits complete without
/// passing through Scheduled.
enum class MatchStatus : uint8_t { Pending, Scheduled, Completed };

std::string_view tournamentStatusName(TournamentStatus status);
std::string_view matchStatusName(MatchStatus status);
std::optional<TournamentStatus> parseTournamentStatus(std::string_view name);
std::optional<MatchStatus> parseMatchStatus(std::string_view name);

struct TournamentMatch {
    foundation::MatchId id;
    int32_t round = 1;
    int32_t position = 0;  ///< Index within the round.
    std::optional<foundation::PlayerId> playerA;
    std::optional<foundation::PlayerId> playerB;  ///< nullopt on a bye.
    std::optional<foundation::PlayerId> winner;
    MatchStatus status = MatchStatus::Pending;
    std::optional<foundation::Timestamp> scheduledAt;
    std::optional<foundation::Timestamp> completedAt;
    std::optional<foundation::BattleId> battleId;
    /// Won by forfeit; no battle was recorded.
    bool walkover = false;

    [[nodiscard]] bool IsBye() const noexcept { return !playerA || !playerB; }
    [[nodiscard]] bool IsCompleted() const noexcept { return status == MatchStatus::Completed; }

    [[nodiscard]] bool Involves(foundation::PlayerId player) const noexcept {
        return (playerA && *playerA == player) || (playerB && *playerB == player);
    }
};

struct Tournament {
    foundation::TournamentId id;
    std::string name;
    BattleCategory category = BattleCategory::Tournament;
    TournamentStatus status = TournamentStatus::Pending;
    int32_t maxParticipants = 0;
    std::vector<foundation::PlayerId> participants;  ///< Registration order.
    std::optional<foundation::PlayerId> winner;
    int32_t currentRound = 0;  ///< 0 until started.
    std::vector<TournamentMatch> matches;
    foundation::Timestamp createdAt;
    std::optional<foundation::Timestamp> startedAt;
    std::optional<foundation::Timestamp> completedAt;

    [[nodiscard]] bool IsRegistered(foundation::PlayerId player) const;

    /// Matches of @p round in bracket-position order.
    [[nodiscard]] std::vector<const TournamentMatch*> RoundMatches(int32_t round) const;

    [[nodiscard]] TournamentMatch* FindMatch(foundation::MatchId match);
};

/// All matches grouped by round, for bracket reads.
struct BracketView {
    foundation::TournamentId tournament;
    TournamentStatus status = TournamentStatus::Pending;
    int32_t currentRound = 0;
    std::optional<foundation::PlayerId> winner;
    std::vector<std::vector<TournamentMatch>> rounds;  ///< rounds[0] = round 1.
};

// -- Bracket maths ------------------------------------------------------------

/// Smallest power of two >= @p participants (minimum 2).
[[nodiscard]] std::size_t bracketSize(std::size_t participants);

/// Number of rounds a bracket of @p participants needs.
[[nodiscard]] int32_t roundCount(std::size_t participants);

/// Round-1 pairings: match m pairs seed m with seed size-1-m, where seeds
/// are registration order. A missing opponent becomes a completed bye won
/// by the present player. Match ids are left unassigned.
[[nodiscard]] std::vector<TournamentMatch> seedFirstRound(
    const std::vector<foundation::PlayerId>& participants);

/// Next-round pairings: match j takes the winners of matches 2j and 2j+1
/// of @p completed (sorted by position). Every input match must be
/// completed with a winner; returns an empty list otherwise.
[[nodiscard]] std::vector<TournamentMatch> pairNextRound(
    const std::vector<const TournamentMatch*>& completed, int32_t nextRound);

}  // namespace gec::game
