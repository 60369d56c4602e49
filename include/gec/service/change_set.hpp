#pragma once

/// @file change_set.hpp
/// @brief Row mutations produced by one unit of work.

#include <string>
#include <vector>

#include "gec/foundation/types.hpp"
#include "gec/game/battle_types.hpp"
#include "gec/game/order_types.hpp"
#include "gec/game/player_state.hpp"
#include "gec/game/tournament_types.hpp"

namespace gec::service {

/// Everything a unit of work writes, handed to the persistence sink
/// before the staged state is published.
///
/// Player aggregates are carried whole; the sink decides how to map them
/// onto rows. Trades and battle records are append-only.
struct ChangeSet {
    std::string operation;
    std::vector<game::PlayerState> players;
    std::vector<foundation::PlayerId> deletedPlayers;
    std::vector<game::Order> orders;
    std::vector<game::Trade> trades;
    std::vector<game::BattleRecord> battles;
    std::vector<game::Tournament> tournaments;

    [[nodiscard]] bool empty() const noexcept {
        return players.empty() && deletedPlayers.empty() && orders.empty() &&
               trades.empty() && battles.empty() && tournaments.empty();
    }
};

/// Durable state read back from a sink when the engine starts. Players
/// carry all their child rows; orders include closed ones so order reads
/// and collection boxes survive a restart.
struct EngineSnapshot {
    std::vector<game::PlayerState> players;
    std::vector<game::Order> orders;
    std::vector<game::Trade> trades;
    std::vector<game::BattleRecord> battles;
    std::vector<game::Tournament> tournaments;
};

}  // namespace gec::service
