/// @file persistence_sink.cpp
/// @brief Null and in-memory persistence sinks.

#include "gec/service/persistence_sink.hpp"

#include <map>
#include <set>
#include <string>

namespace gec::service {

using gec::foundation::GameError;
using gec::foundation::GameResult;

GameResult<void> NullPersistenceSink::apply(const ChangeSet& /*changes*/) {
    return GameResult<void>::ok();
}

GameResult<EngineSnapshot> NullPersistenceSink::load() {
    return GameResult<EngineSnapshot>::ok(EngineSnapshot{});
}

GameResult<void> InMemoryPersistenceSink::apply(const ChangeSet& changes) {
    std::lock_guard lock(mutex_);
    if (pendingFailure_) {
        auto error = std::move(*pendingFailure_);
        pendingFailure_.reset();
        return GameResult<void>::err(std::move(error));
    }
    applied_.push_back(changes);
    return GameResult<void>::ok();
}

GameResult<EngineSnapshot> InMemoryPersistenceSink::load() {
    std::map<foundation::PlayerId, game::PlayerState> players;
    std::map<foundation::OrderId, game::Order> orders;
    std::map<foundation::TradeId, game::Trade> trades;
    std::map<std::string, game::BattleRecord> battles;
    std::map<foundation::TournamentId, game::Tournament> tournaments;
    {
        std::lock_guard lock(mutex_);
        for (const auto& changes : applied_) {
            for (auto id : changes.deletedPlayers) {
                players.erase(id);
                std::erase_if(orders, [id](const auto& kv) { return kv.second.player == id; });
            }
            for (const auto& state : changes.players) {
                players[state.profile.id] = state;
            }
            for (const auto& order : changes.orders) {
                orders[order.id] = order;
            }
            for (const auto& trade : changes.trades) {
                trades.emplace(trade.id, trade);
            }
            for (const auto& battle : changes.battles) {
                battles.emplace(battle.battleKey, battle);
            }
            for (const auto& tournament : changes.tournaments) {
                tournaments[tournament.id] = tournament;
            }
        }
    }

    EngineSnapshot snapshot;
    for (auto& [id, state] : players) {
        snapshot.players.push_back(std::move(state));
    }
    for (auto& [id, order] : orders) {
        snapshot.orders.push_back(std::move(order));
    }
    for (auto& [id, trade] : trades) {
        snapshot.trades.push_back(std::move(trade));
    }
    for (auto& [key, battle] : battles) {
        snapshot.battles.push_back(std::move(battle));
    }
    for (auto& [id, tournament] : tournaments) {
        snapshot.tournaments.push_back(std::move(tournament));
    }
    return GameResult<EngineSnapshot>::ok(std::move(snapshot));
}

void InMemoryPersistenceSink::failNextApply(GameError error) {
    std::lock_guard lock(mutex_);
    pendingFailure_ = std::move(error);
}

std::vector<ChangeSet> InMemoryPersistenceSink::history() const {
    std::lock_guard lock(mutex_);
    return applied_;
}

std::size_t InMemoryPersistenceSink::appliedCount() const {
    std::lock_guard lock(mutex_);
    return applied_.size();
}

std::optional<ChangeSet> InMemoryPersistenceSink::last() const {
    std::lock_guard lock(mutex_);
    if (applied_.empty()) {
        return std::nullopt;
    }
    return applied_.back();
}

void InMemoryPersistenceSink::clear() {
    std::lock_guard lock(mutex_);
    applied_.clear();
    pendingFailure_.reset();
}

}  // namespace gec::service
