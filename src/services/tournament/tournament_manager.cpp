/// @file tournament_manager.cpp
/// @brief TournamentManager implementation.

#include "gec/service/tournament_manager.hpp"

#include <algorithm>
#include <string>
#include <string_view>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;
using gec::foundation::LogContext;
using gec::foundation::LogLevel;
using gec::foundation::MatchId;
using gec::foundation::PlayerId;
using gec::foundation::TournamentId;
using gec::game::BracketView;
using gec::game::MatchStatus;
using gec::game::Tournament;
using gec::game::TournamentMatch;
using gec::game::TournamentStatus;

namespace {

GameError wrongStatus(const Tournament& t, std::string_view action) {
    return GameError(ErrorCode::InvalidStateTransition,
                     "cannot " + std::string(action) + " tournament " +
                         std::to_string(t.id.value()) + " while " +
                         std::string(game::tournamentStatusName(t.status)));
}

GameError matchNotFound(MatchId id) {
    return GameError(ErrorCode::MatchNotFound, "match " + std::to_string(id.value()) + " not found");
}

void finish(Tournament& t, const TournamentMatch& last, foundation::Timestamp at) {
    t.status = TournamentStatus::Completed;
    t.winner = last.winner;
    t.completedAt = at;
}

/// The final is a single completed match with a winner in the last round.
const TournamentMatch* completedFinal(const Tournament& t) {
    auto round = t.RoundMatches(t.currentRound);
    if (round.size() != 1 || !round.front()->IsCompleted() || !round.front()->winner) {
        return nullptr;
    }
    return round.front();
}

}  // namespace

TournamentManager::TournamentManager(PlayerStore& players, BattleService& battles)
    : players_(players), battles_(battles) {}

template <typename R, typename Fn>
GameResult<R> TournamentManager::mutate(TournamentId id, std::string_view operation, Fn&& fn) {
    auto entry = lookup(id);
    if (!entry) {
        return GameResult<R>::err(GameError(ErrorCode::TournamentNotFound,
                                            "tournament " + std::to_string(id.value()) +
                                                " not found"));
    }
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(entry->mutex, "tournament " + std::to_string(id.value()));
    if (!locked) {
        return GameResult<R>::err(locked.error());
    }

    Tournament staged = entry->tournament;
    auto result = fn(staged);
    if (!result) {
        return result;
    }

    ChangeSet changes;
    changes.operation = std::string(operation);
    changes.tournaments.push_back(staged);
    auto persisted = players_.persistDetached(std::move(changes));
    if (!persisted) {
        return GameResult<R>::err(persisted.error());
    }
    entry->tournament = std::move(staged);
    return result;
}

// -- Writes -------------------------------------------------------------------

GameResult<TournamentId> TournamentManager::createTournament(std::string name,
                                                             game::BattleCategory category,
                                                             int32_t maxParticipants) {
    if (name.empty()) {
        return GameResult<TournamentId>::err(
            GameError(ErrorCode::InvalidArgument, "tournament name must not be empty"));
    }
    if (maxParticipants < 2) {
        return GameResult<TournamentId>::err(
            GameError(ErrorCode::InvalidArgument, "a tournament needs room for two players"));
    }

    auto entry = std::make_shared<Entry>();
    auto& t = entry->tournament;
    t.id = TournamentId(nextTournamentId_.fetch_add(1));
    t.name = std::move(name);
    t.category = category;
    t.maxParticipants = maxParticipants;
    t.createdAt = players_.now();

    ChangeSet changes;
    changes.operation = "create_tournament";
    changes.tournaments.push_back(t);
    auto persisted = players_.persistDetached(std::move(changes));
    if (!persisted) {
        return GameResult<TournamentId>::err(persisted.error());
    }

    auto id = t.id;
    {
        std::unique_lock lock(tournamentsMutex_);
        tournaments_.emplace(id, std::move(entry));
    }
    LogContext ctx;
    ctx.tournamentId = id;
    ctx.extra["capacity"] = std::to_string(maxParticipants);
    GEC_LOG_CTX(LogLevel::Info, LogCategory::Tournament, "tournament created", ctx);
    return GameResult<TournamentId>::ok(id);
}

GameResult<void> TournamentManager::registerParticipant(TournamentId id, PlayerId player) {
    return mutate<void>(id, "register_participant", [&](Tournament& t) -> GameResult<void> {
        if (t.status != TournamentStatus::Pending) {
            return GameResult<void>::err(wrongStatus(t, "register for"));
        }
        if (t.IsRegistered(player)) {
            return GameResult<void>::err(
                GameError(ErrorCode::AlreadyExists, "player is already registered"));
        }
        if (static_cast<int32_t>(t.participants.size()) >= t.maxParticipants) {
            return GameResult<void>::err(
                GameError(ErrorCode::TournamentFull,
                          "tournament is full at " + std::to_string(t.maxParticipants)));
        }
        auto profile = players_.snapshot(player);
        if (!profile) {
            return GameResult<void>::err(profile.error());
        }
        if (profile.value().profile.status != game::AccountStatus::Active) {
            return GameResult<void>::err(
                GameError(ErrorCode::PlayerInactive, "inactive players cannot register"));
        }
        t.participants.push_back(player);
        return GameResult<void>::ok();
    });
}

GameResult<BracketView> TournamentManager::startTournament(TournamentId id) {
    auto result = mutate<BracketView>(id, "start_tournament", [&](Tournament& t) -> GameResult<BracketView> {
        if (t.status != TournamentStatus::Pending) {
            return GameResult<BracketView>::err(wrongStatus(t, "start"));
        }
        if (t.participants.size() < 2) {
            return GameResult<BracketView>::err(
                GameError(ErrorCode::InvalidParticipants,
                          "a tournament needs at least two participants to start"));
        }
        auto now = players_.now();
        for (auto& match : game::seedFirstRound(t.participants)) {
            match.id = MatchId(nextMatchId_.fetch_add(1));
            if (match.IsCompleted()) {
                match.completedAt = now;
            }
            t.matches.push_back(std::move(match));
        }
        t.status = TournamentStatus::InProgress;
        t.currentRound = 1;
        t.startedAt = now;
        return GameResult<BracketView>::ok(view(t));
    });

    if (result) {
        LogContext ctx;
        ctx.tournamentId = id;
        ctx.extra["rounds"] = std::to_string(result.value().rounds.size());
        GEC_LOG_CTX(LogLevel::Info, LogCategory::Tournament, "tournament started", ctx);
    }
    return result;
}

GameResult<TournamentMatch> TournamentManager::scheduleMatch(TournamentId id, MatchId matchId,
                                                             foundation::Timestamp when) {
    return mutate<TournamentMatch>(
        id, "schedule_match", [&](Tournament& t) -> GameResult<TournamentMatch> {
            if (t.status != TournamentStatus::InProgress) {
                return GameResult<TournamentMatch>::err(wrongStatus(t, "schedule a match of"));
            }
            auto* match = t.FindMatch(matchId);
            if (match == nullptr) {
                return GameResult<TournamentMatch>::err(matchNotFound(matchId));
            }
            if (match->status != MatchStatus::Pending) {
                return GameResult<TournamentMatch>::err(
                    GameError(ErrorCode::InvalidStateTransition,
                              "match is " + std::string(game::matchStatusName(match->status))));
            }
            match->status = MatchStatus::Scheduled;
            match->scheduledAt = when;
            return GameResult<TournamentMatch>::ok(*match);
        });
}

GameResult<TournamentMatch> TournamentManager::reportMatchResult(TournamentId id, MatchId matchId,
                                                                 PlayerId winner,
                                                                 const game::BattleOutcome& outcome) {
    auto result = mutate<TournamentMatch>(
        id, "report_match_result", [&](Tournament& t) -> GameResult<TournamentMatch> {
            if (t.status != TournamentStatus::InProgress) {
                return GameResult<TournamentMatch>::err(wrongStatus(t, "report a match of"));
            }
            auto* match = t.FindMatch(matchId);
            if (match == nullptr) {
                return GameResult<TournamentMatch>::err(matchNotFound(matchId));
            }
            if (match->round != t.currentRound || match->IsCompleted()) {
                return GameResult<TournamentMatch>::err(
                    GameError(ErrorCode::InvalidStateTransition,
                              "match " + std::to_string(matchId.value()) +
                                  " is not open for a result"));
            }
            if (match->IsBye()) {
                return GameResult<TournamentMatch>::err(
                    GameError(ErrorCode::InvalidStateTransition, "a bye has no result to report"));
            }
            if (match->status != MatchStatus::Scheduled) {
                return GameResult<TournamentMatch>::err(
                    GameError(ErrorCode::InvalidStateTransition,
                              "match " + std::to_string(matchId.value()) +
                                  " must be scheduled before its result is reported"));
            }
            if (!match->Involves(winner)) {
                return GameResult<TournamentMatch>::err(
                    GameError(ErrorCode::InvalidParticipants, "winner is not in this match"));
            }

            BattleRequest request;
            request.battleKey = "tournament:" + std::to_string(t.id.value()) + ":match:" +
                                std::to_string(matchId.value());
            request.category = t.category;
            request.playerA = *match->playerA;
            request.playerB = *match->playerB;
            request.winner = winner;
            request.outcome = outcome;
            auto battle = battles_.recordBattle(request);
            if (!battle) {
                return GameResult<TournamentMatch>::err(battle.error());
            }

            auto now = players_.now();
            match->winner = winner;
            match->battleId = battle.value().id;
            match->status = MatchStatus::Completed;
            match->completedAt = now;
            auto completed = *match;

            if (const auto* last = completedFinal(t)) {
                finish(t, *last, now);
            }
            return GameResult<TournamentMatch>::ok(completed);
        });

    if (result) {
        LogContext ctx;
        ctx.tournamentId = id;
        ctx.playerId = winner;
        ctx.extra["match"] = std::to_string(matchId.value());
        GEC_LOG_CTX(LogLevel::Info, LogCategory::Tournament, "match completed", ctx);
    }
    return result;
}

GameResult<TournamentMatch> TournamentManager::forfeitMatch(TournamentId id, MatchId matchId,
                                                            PlayerId absent) {
    std::optional<PlayerId> awarded;
    auto result = mutate<TournamentMatch>(
        id, "forfeit_match", [&](Tournament& t) -> GameResult<TournamentMatch> {
            if (t.status != TournamentStatus::InProgress) {
                return GameResult<TournamentMatch>::err(wrongStatus(t, "forfeit a match of"));
            }
            auto* match = t.FindMatch(matchId);
            if (match == nullptr) {
                return GameResult<TournamentMatch>::err(matchNotFound(matchId));
            }
            if (match->round != t.currentRound || match->IsCompleted() || match->IsBye()) {
                return GameResult<TournamentMatch>::err(
                    GameError(ErrorCode::InvalidStateTransition,
                              "match " + std::to_string(matchId.value()) +
                                  " is not open for a forfeit"));
            }
            if (!match->Involves(absent)) {
                return GameResult<TournamentMatch>::err(
                    GameError(ErrorCode::InvalidParticipants,
                              "forfeiting player is not in this match"));
            }

            auto now = players_.now();
            match->winner = *match->playerA == absent ? match->playerB : match->playerA;
            match->walkover = true;
            match->status = MatchStatus::Completed;
            match->completedAt = now;
            awarded = match->winner;
            auto completed = *match;

            if (const auto* last = completedFinal(t)) {
                finish(t, *last, now);
            }
            return GameResult<TournamentMatch>::ok(completed);
        });

    if (result) {
        LogContext ctx;
        ctx.tournamentId = id;
        ctx.playerId = absent;
        ctx.extra["match"] = std::to_string(matchId.value());
        ctx.extra["awarded_to"] = std::to_string(awarded ? awarded->value() : 0);
        GEC_LOG_CTX(LogLevel::Info, LogCategory::Tournament, "match forfeited", ctx);
    }
    return result;
}

GameResult<BracketView> TournamentManager::advanceTournamentRound(TournamentId id) {
    return mutate<BracketView>(
        id, "advance_tournament_round", [&](Tournament& t) -> GameResult<BracketView> {
            if (t.status != TournamentStatus::InProgress) {
                return GameResult<BracketView>::err(wrongStatus(t, "advance"));
            }
            auto current = t.RoundMatches(t.currentRound);
            for (const auto* match : current) {
                if (!match->IsCompleted() || !match->winner) {
                    return GameResult<BracketView>::err(
                        GameError(ErrorCode::RoundNotComplete,
                                  "round " + std::to_string(t.currentRound) +
                                      " still has open matches"));
                }
            }
            if (const auto* last = completedFinal(t)) {
                finish(t, *last, players_.now());
                return GameResult<BracketView>::ok(view(t));
            }

            const int32_t next = t.currentRound + 1;
            auto paired = game::pairNextRound(current, next);
            if (paired.empty()) {
                return GameResult<BracketView>::err(
                    GameError(ErrorCode::BracketCorrupted,
                              "round " + std::to_string(t.currentRound) + " cannot be paired"));
            }
            for (auto& match : paired) {
                // Only winners of the finished round may appear in the next.
                for (const auto& slot : {match.playerA, match.playerB}) {
                    bool wonLastRound = std::any_of(
                        current.begin(), current.end(),
                        [&](const TournamentMatch* m) { return m->winner == slot; });
                    if (!slot || !wonLastRound) {
                        return GameResult<BracketView>::err(
                            GameError(ErrorCode::BracketCorrupted,
                                      "next round would include a non-winner"));
                    }
                }
                match.id = MatchId(nextMatchId_.fetch_add(1));
            }
            for (auto& match : paired) {
                t.matches.push_back(std::move(match));
            }
            t.currentRound = next;

            LogContext ctx;
            ctx.tournamentId = t.id;
            ctx.extra["round"] = std::to_string(next);
            GEC_LOG_CTX(LogLevel::Info, LogCategory::Tournament, "round advanced", ctx);
            return GameResult<BracketView>::ok(view(t));
        });
}

GameResult<void> TournamentManager::restore(std::vector<Tournament> tournaments) {
    std::unique_lock lock(tournamentsMutex_);
    if (!tournaments_.empty()) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidStateTransition,
                                               "tournaments can only be restored once"));
    }
    uint64_t highestTournament = 0;
    uint64_t highestMatch = 0;
    std::map<TournamentId, std::shared_ptr<Entry>> restored;
    for (auto& t : tournaments) {
        highestTournament = std::max(highestTournament, t.id.value());
        for (const auto& match : t.matches) {
            highestMatch = std::max(highestMatch, match.id.value());
        }
        auto entry = std::make_shared<Entry>();
        const auto id = t.id;
        entry->tournament = std::move(t);
        if (!restored.emplace(id, std::move(entry)).second) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvariantViolation,
                          "tournament " + std::to_string(id.value()) + " restored twice"));
        }
    }
    tournaments_ = std::move(restored);
    nextTournamentId_ = std::max<uint64_t>(nextTournamentId_.load(), highestTournament + 1);
    nextMatchId_ = std::max<uint64_t>(nextMatchId_.load(), highestMatch + 1);

    GEC_LOG_INFO(LogCategory::Tournament,
                 "restored " + std::to_string(tournaments_.size()) + " tournaments");
    return GameResult<void>::ok();
}

// -- Reads --------------------------------------------------------------------

GameResult<Tournament> TournamentManager::getTournament(TournamentId id) const {
    auto entry = lookup(id);
    if (!entry) {
        return GameResult<Tournament>::err(GameError(ErrorCode::TournamentNotFound,
                                                     "tournament " + std::to_string(id.value()) +
                                                         " not found"));
    }
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(entry->mutex, "tournament " + std::to_string(id.value()));
    if (!locked) {
        return GameResult<Tournament>::err(locked.error());
    }
    return GameResult<Tournament>::ok(entry->tournament);
}

GameResult<BracketView> TournamentManager::bracket(TournamentId id) const {
    auto t = getTournament(id);
    if (!t) {
        return GameResult<BracketView>::err(t.error());
    }
    return GameResult<BracketView>::ok(view(t.value()));
}

BracketView TournamentManager::view(const Tournament& t) {
    BracketView out;
    out.tournament = t.id;
    out.status = t.status;
    out.currentRound = t.currentRound;
    out.winner = t.winner;
    for (int32_t round = 1; round <= t.currentRound; ++round) {
        std::vector<TournamentMatch> matches;
        for (const auto* m : t.RoundMatches(round)) {
            matches.push_back(*m);
        }
        out.rounds.push_back(std::move(matches));
    }
    return out;
}

std::shared_ptr<TournamentManager::Entry> TournamentManager::lookup(TournamentId id) const {
    std::shared_lock lock(tournamentsMutex_);
    auto it = tournaments_.find(id);
    return it == tournaments_.end() ? nullptr : it->second;
}

}  // namespace gec::service
