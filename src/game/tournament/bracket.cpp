/// @file bracket.cpp
/// @brief Bracket seeding and round pairing.

#include "gec/game/tournament_types.hpp"

#include <algorithm>

namespace gec::game {

using foundation::MatchId;
using foundation::PlayerId;

std::string_view tournamentStatusName(TournamentStatus status) {
    switch (status) {
        case TournamentStatus::Pending:    return "pending";
        case TournamentStatus::InProgress: return "in_progress";
        case TournamentStatus::Completed:  return "completed";
    }
    return "unknown";
}

std::string_view matchStatusName(MatchStatus status) {
    switch (status) {
        case MatchStatus::Pending:   return "pending";
        case MatchStatus::Scheduled: return "scheduled";
        case MatchStatus::Completed: return "completed";
    }
    return "unknown";
}

std::optional<TournamentStatus> parseTournamentStatus(std::string_view name) {
    for (auto status : {TournamentStatus::Pending, TournamentStatus::InProgress,
                        TournamentStatus::Completed}) {
        if (tournamentStatusName(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<MatchStatus> parseMatchStatus(std::string_view name) {
    for (auto status : {MatchStatus::Pending, MatchStatus::Scheduled, MatchStatus::Completed}) {
        if (matchStatusName(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

bool Tournament::IsRegistered(PlayerId player) const {
    return std::find(participants.begin(), participants.end(), player) != participants.end();
}

std::vector<const TournamentMatch*> Tournament::RoundMatches(int32_t round) const {
    std::vector<const TournamentMatch*> out;
    for (const auto& m : matches) {
        if (m.round == round) {
            out.push_back(&m);
        }
    }
    std::sort(out.begin(), out.end(), [](const TournamentMatch* a, const TournamentMatch* b) {
        return a->position < b->position;
    });
    return out;
}

TournamentMatch* Tournament::FindMatch(MatchId match) {
    auto it = std::find_if(matches.begin(), matches.end(),
                           [match](const TournamentMatch& m) { return m.id == match; });
    return it == matches.end() ? nullptr : &*it;
}

std::size_t bracketSize(std::size_t participants) {
    std::size_t size = 2;
    while (size < participants) {
        size <<= 1;
    }
    return size;
}

int32_t roundCount(std::size_t participants) {
    int32_t rounds = 0;
    for (std::size_t size = bracketSize(participants); size > 1; size >>= 1) {
        ++rounds;
    }
    return rounds;
}

std::vector<TournamentMatch> seedFirstRound(const std::vector<PlayerId>& participants) {
    std::vector<TournamentMatch> round;
    if (participants.size() < 2) {
        return round;
    }
    const auto size = bracketSize(participants.size());
    for (std::size_t m = 0; m < size / 2; ++m) {
        TournamentMatch match;
        match.round = 1;
        match.position = static_cast<int32_t>(m);
        match.playerA = participants[m];
        auto opponent = size - 1 - m;
        if (opponent < participants.size()) {
            match.playerB = participants[opponent];
        } else {
            match.winner = participants[m];
            match.status = MatchStatus::Completed;
        }
        round.push_back(match);
    }
    return round;
}

std::vector<TournamentMatch> pairNextRound(const std::vector<const TournamentMatch*>& completed,
                                           int32_t nextRound) {
    std::vector<TournamentMatch> round;
    if (completed.size() < 2 || completed.size() % 2 != 0) {
        return round;
    }
    for (const auto* m : completed) {
        if (!m->IsCompleted() || !m->winner) {
            return {};
        }
    }
    for (std::size_t j = 0; j < completed.size() / 2; ++j) {
        TournamentMatch match;
        match.round = nextRound;
        match.position = static_cast<int32_t>(j);
        match.playerA = completed[2 * j]->winner;
        match.playerB = completed[2 * j + 1]->winner;
        round.push_back(match);
    }
    return round;
}

}  // namespace gec::game
