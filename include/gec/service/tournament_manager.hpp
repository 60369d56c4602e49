#pragma once

/// @file tournament_manager.hpp
/// @brief Single-elimination tournaments: registration, seeding, match
///        results and round advancement.
///
/// Every tournament has its own timed lock, taken before any player lock.
/// Match results are recorded through BattleService with a key derived
/// from the tournament and match ids, so a repeated report is harmless.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "gec/foundation/game_result.hpp"
#include "gec/game/tournament_types.hpp"
#include "gec/service/battle_service.hpp"
#include "gec/service/player_store.hpp"

namespace gec::service {

class TournamentManager {
public:
    TournamentManager(PlayerStore& players, BattleService& battles);

    TournamentManager(const TournamentManager&) = delete;
    TournamentManager& operator=(const TournamentManager&) = delete;

    [[nodiscard]] foundation::GameResult<foundation::TournamentId> createTournament(
        std::string name, game::BattleCategory category, int32_t maxParticipants);

    /// Pending tournaments only; each player once, up to capacity.
    [[nodiscard]] foundation::GameResult<void> registerParticipant(
        foundation::TournamentId tournament, foundation::PlayerId player);

    /// Seed round 1 by registration order. Byes complete immediately.
    [[nodiscard]] foundation::GameResult<game::BracketView> startTournament(
        foundation::TournamentId tournament);

    [[nodiscard]] foundation::GameResult<game::TournamentMatch> scheduleMatch(
        foundation::TournamentId tournament, foundation::MatchId match,
        foundation::Timestamp when);

    /// Record the battle and complete a scheduled match. Draws are rejected.
    [[nodiscard]] foundation::GameResult<game::TournamentMatch> reportMatchResult(
        foundation::TournamentId tournament, foundation::MatchId match,
        foundation::PlayerId winner, const game::BattleOutcome& outcome);

    /// Award an open match of the current round to the opponent of
    /// @p absent without recording a battle. Covers participants who were
    /// deactivated or deleted after the bracket was seeded.
    [[nodiscard]] foundation::GameResult<game::TournamentMatch> forfeitMatch(
        foundation::TournamentId tournament, foundation::MatchId match,
        foundation::PlayerId absent);

    /// Pair the winners of the completed current round, or finish the
    /// tournament when the current round was the final.
    [[nodiscard]] foundation::GameResult<game::BracketView> advanceTournamentRound(
        foundation::TournamentId tournament);

    /// Load persisted tournaments into an empty manager. Tournament and
    /// match ids continue after the highest restored values.
    [[nodiscard]] foundation::GameResult<void> restore(std::vector<game::Tournament> tournaments);

    [[nodiscard]] foundation::GameResult<game::BracketView> bracket(
        foundation::TournamentId tournament) const;

    [[nodiscard]] foundation::GameResult<game::Tournament> getTournament(
        foundation::TournamentId tournament) const;

private:
    struct Entry {
        std::timed_mutex mutex;
        game::Tournament tournament;
    };

    [[nodiscard]] std::shared_ptr<Entry> lookup(foundation::TournamentId id) const;

    /// Lock @p id and run @p fn on a copy; the copy is persisted and
    /// published only if @p fn succeeds.
    template <typename R, typename Fn>
    [[nodiscard]] foundation::GameResult<R> mutate(foundation::TournamentId id,
                                                   std::string_view operation, Fn&& fn);

    static game::BracketView view(const game::Tournament& tournament);

    PlayerStore& players_;
    BattleService& battles_;

    mutable std::shared_mutex tournamentsMutex_;
    std::map<foundation::TournamentId, std::shared_ptr<Entry>> tournaments_;
    std::atomic<uint64_t> nextTournamentId_{1};
    std::atomic<uint64_t> nextMatchId_{1};
};

}  // namespace gec::service
