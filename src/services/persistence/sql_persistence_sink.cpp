/// @file sql_persistence_sink.cpp
/// @brief SqlPersistenceSink implementation (PostgreSQL dialect).

#include "gec/service/sql_persistence_sink.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::DbNull;
using gec::foundation::DbRow;
using gec::foundation::DbValue;
using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;
using gec::foundation::PlayerId;
using gec::foundation::PreparedStatement;
using gec::foundation::QueryResult;
using gec::foundation::Timestamp;
using gec::foundation::Transaction;
using gec::foundation::fromEpochMicros;
using gec::foundation::toEpochMicros;

namespace {

// -- Statements ---------------------------------------------------------------

constexpr std::string_view kUpsertPlayer =
    "INSERT INTO osrs_players (player_id, display_name, world, game_mode, member, status, "
    "total_level, combat_level, quest_points, coins, created_at_us, last_login_us) "
    "VALUES ($player_id, $display_name, $world, $game_mode, $member, $status, $total_level, "
    "$combat_level, $quest_points, $coins, $created_at_us, $last_login_us) "
    "ON CONFLICT (player_id) DO UPDATE SET display_name = EXCLUDED.display_name, "
    "world = EXCLUDED.world, game_mode = EXCLUDED.game_mode, member = EXCLUDED.member, "
    "status = EXCLUDED.status, total_level = EXCLUDED.total_level, "
    "combat_level = EXCLUDED.combat_level, quest_points = EXCLUDED.quest_points, "
    "coins = EXCLUDED.coins, last_login_us = EXCLUDED.last_login_us";

constexpr std::string_view kUpsertSkill =
    "INSERT INTO player_skills (player_id, skill, level, experience, last_trained_us) "
    "VALUES ($player_id, $skill, $level, $experience, $last_trained_us) "
    "ON CONFLICT (player_id, skill) DO UPDATE SET level = EXCLUDED.level, "
    "experience = EXCLUDED.experience, last_trained_us = EXCLUDED.last_trained_us";

constexpr std::string_view kInsertInventory =
    "INSERT INTO player_inventory (player_id, slot, item_id, quantity) "
    "VALUES ($player_id, $slot, $item_id, $quantity)";

constexpr std::string_view kInsertBank =
    "INSERT INTO player_bank (player_id, item_id, quantity, tab) "
    "VALUES ($player_id, $item_id, $quantity, $tab)";

constexpr std::string_view kInsertEquipment =
    "INSERT INTO player_equipment (player_id, slot, item_id, quantity) "
    "VALUES ($player_id, $slot, $item_id, $quantity)";

constexpr std::string_view kUpsertRating =
    "INSERT INTO battle_ratings (player_id, category, rating, uncertainty, wins, losses, draws, "
    "total_battles, win_streak, best_win_streak, damage_dealt, damage_taken, favourite_move, "
    "last_battle_us, decay_anchor_us) "
    "VALUES ($player_id, $category, $rating, $uncertainty, $wins, $losses, $draws, "
    "$total_battles, $win_streak, $best_win_streak, $damage_dealt, $damage_taken, "
    "$favourite_move, $last_battle_us, $decay_anchor_us) "
    "ON CONFLICT (player_id, category) DO UPDATE SET rating = EXCLUDED.rating, "
    "uncertainty = EXCLUDED.uncertainty, wins = EXCLUDED.wins, losses = EXCLUDED.losses, "
    "draws = EXCLUDED.draws, total_battles = EXCLUDED.total_battles, "
    "win_streak = EXCLUDED.win_streak, best_win_streak = EXCLUDED.best_win_streak, "
    "damage_dealt = EXCLUDED.damage_dealt, damage_taken = EXCLUDED.damage_taken, "
    "favourite_move = EXCLUDED.favourite_move, last_battle_us = EXCLUDED.last_battle_us, "
    "decay_anchor_us = EXCLUDED.decay_anchor_us";

constexpr std::string_view kInsertMoveUsage =
    "INSERT INTO battle_move_usage (player_id, category, move, uses) "
    "VALUES ($player_id, $category, $move, $uses)";

constexpr std::string_view kInsertAchievement =
    "INSERT INTO player_achievements (player_id, achievement_id, awarded_at_us) "
    "VALUES ($player_id, $achievement_id, $at) ON CONFLICT DO NOTHING";

constexpr std::string_view kInsertCollection =
    "INSERT INTO collection_log (player_id, item_id, obtained_at_us) "
    "VALUES ($player_id, $item_id, $at) ON CONFLICT DO NOTHING";

constexpr std::string_view kInsertQuest =
    "INSERT INTO quest_completions (player_id, quest_id, completed_at_us) "
    "VALUES ($player_id, $quest_id, $at) ON CONFLICT DO NOTHING";

constexpr std::string_view kInsertBuyLimit =
    "INSERT INTO ge_buy_limits (player_id, item_id, bought_at_us, quantity) "
    "VALUES ($player_id, $item_id, $at, $quantity)";

constexpr std::string_view kUpsertOrder =
    "INSERT INTO ge_orders (order_id, player_id, item_id, side, quantity, price, "
    "quantity_filled, status, created_at_us, completed_at_us, sequence, collect_items, "
    "collect_coins) "
    "VALUES ($order_id, $player_id, $item_id, $side, $quantity, $price, $filled, $status, "
    "$created_at_us, $completed_at_us, $sequence, $collect_items, $collect_coins) "
    "ON CONFLICT (order_id) DO UPDATE SET quantity_filled = EXCLUDED.quantity_filled, "
    "status = EXCLUDED.status, completed_at_us = EXCLUDED.completed_at_us, "
    "collect_items = EXCLUDED.collect_items, collect_coins = EXCLUDED.collect_coins";

constexpr std::string_view kInsertTrade =
    "INSERT INTO ge_trades (trade_id, item_id, buy_order_id, sell_order_id, buyer_id, "
    "seller_id, quantity, price, executed_at_us) "
    "VALUES ($trade_id, $item_id, $buy_order_id, $sell_order_id, $buyer_id, $seller_id, "
    "$quantity, $price, $executed_at_us) ON CONFLICT DO NOTHING";

constexpr std::string_view kInsertBattle =
    "INSERT INTO battle_records (battle_id, battle_key, category, player_a, player_b, "
    "winner_id, duration_seconds, turns, damage_a, damage_b, recorded_at_us) "
    "VALUES ($battle_id, $battle_key, $category, $player_a, $player_b, $winner_id, "
    "$duration_seconds, $turns, $damage_a, $damage_b, $recorded_at_us) "
    "ON CONFLICT (battle_key) DO NOTHING";

constexpr std::string_view kUpsertTournament =
    "INSERT INTO tournaments (tournament_id, name, category, status, max_participants, "
    "current_round, winner_id, created_at_us, started_at_us, completed_at_us) "
    "VALUES ($tournament_id, $name, $category, $status, $max_participants, $current_round, "
    "$winner_id, $created_at_us, $started_at_us, $completed_at_us) "
    "ON CONFLICT (tournament_id) DO UPDATE SET status = EXCLUDED.status, "
    "current_round = EXCLUDED.current_round, winner_id = EXCLUDED.winner_id, "
    "started_at_us = EXCLUDED.started_at_us, completed_at_us = EXCLUDED.completed_at_us";

constexpr std::string_view kInsertParticipant =
    "INSERT INTO tournament_participants (tournament_id, player_id, seed) "
    "VALUES ($tournament_id, $player_id, $seed) ON CONFLICT DO NOTHING";

constexpr std::string_view kUpsertMatch =
    "INSERT INTO tournament_matches (match_id, tournament_id, round, position, player_a, "
    "player_b, winner_id, status, scheduled_at_us, completed_at_us, battle_id, walkover) "
    "VALUES ($match_id, $tournament_id, $round, $position, $player_a, $player_b, $winner_id, "
    "$status, $scheduled_at_us, $completed_at_us, $battle_id, $walkover) "
    "ON CONFLICT (match_id) DO UPDATE SET winner_id = EXCLUDED.winner_id, "
    "status = EXCLUDED.status, scheduled_at_us = EXCLUDED.scheduled_at_us, "
    "completed_at_us = EXCLUDED.completed_at_us, battle_id = EXCLUDED.battle_id, "
    "walkover = EXCLUDED.walkover";

// Child tables rewritten whole on every player write.
constexpr std::string_view kRewrittenTables[] = {
    "player_inventory", "player_bank", "player_equipment", "ge_buy_limits", "battle_move_usage"};

struct LoadQuery {
    std::string_view table;
    std::string_view sql;
};

// Parents before children; assemble() relies on this order only for
// readability, it indexes results by table name.
constexpr LoadQuery kLoadQueries[] = {
    {"osrs_players", "SELECT * FROM osrs_players ORDER BY player_id"},
    {"player_skills", "SELECT * FROM player_skills ORDER BY player_id"},
    {"player_inventory", "SELECT * FROM player_inventory ORDER BY player_id, slot"},
    {"player_bank", "SELECT * FROM player_bank ORDER BY player_id, item_id"},
    {"player_equipment", "SELECT * FROM player_equipment ORDER BY player_id"},
    {"battle_ratings", "SELECT * FROM battle_ratings ORDER BY player_id"},
    {"battle_move_usage", "SELECT * FROM battle_move_usage ORDER BY player_id"},
    {"player_achievements", "SELECT * FROM player_achievements ORDER BY player_id"},
    {"collection_log", "SELECT * FROM collection_log ORDER BY player_id"},
    {"quest_completions", "SELECT * FROM quest_completions ORDER BY player_id"},
    {"ge_buy_limits", "SELECT * FROM ge_buy_limits ORDER BY player_id, item_id, bought_at_us"},
    {"ge_orders", "SELECT * FROM ge_orders ORDER BY order_id"},
    {"ge_trades", "SELECT * FROM ge_trades ORDER BY trade_id"},
    {"battle_records", "SELECT * FROM battle_records ORDER BY battle_id"},
    {"tournaments", "SELECT * FROM tournaments ORDER BY tournament_id"},
    {"tournament_participants",
     "SELECT * FROM tournament_participants ORDER BY tournament_id, seed"},
    {"tournament_matches",
     "SELECT * FROM tournament_matches ORDER BY tournament_id, round, position"},
};

// -- Binding helpers ----------------------------------------------------------

template <typename Id>
void bindOptionalId(PreparedStatement& stmt, std::string_view name, const std::optional<Id>& id) {
    if (id) {
        stmt.bindInt(name, static_cast<int64_t>(id->value()));
    } else {
        stmt.bindNull(name);
    }
}

void bindOptionalTime(PreparedStatement& stmt, std::string_view name,
                      const std::optional<Timestamp>& at) {
    if (at) {
        stmt.bindInt(name, toEpochMicros(*at));
    } else {
        stmt.bindNull(name);
    }
}

// -- Row writers --------------------------------------------------------------

class Writer {
public:
    explicit Writer(Transaction& txn) : txn_(txn) {}

    GameResult<void> run(const PreparedStatement& stmt) { return txn_.execute(stmt); }

    GameResult<void> player(const game::PlayerState& state) {
        const auto& p = state.profile;
        const auto playerId = static_cast<int64_t>(p.id.value());

        PreparedStatement profile{std::string(kUpsertPlayer)};
        profile.bindInt("player_id", playerId)
            .bindString("display_name", p.displayName)
            .bindInt("world", p.world)
            .bindString("game_mode", p.gameMode)
            .bindBool("member", p.member)
            .bindString("status", std::string(game::accountStatusName(p.status)))
            .bindInt("total_level", p.totalLevel)
            .bindInt("combat_level", p.combatLevel)
            .bindInt("quest_points", p.questPoints)
            .bindInt("coins", p.coins)
            .bindInt("created_at_us", toEpochMicros(p.createdAt))
            .bindInt("last_login_us", toEpochMicros(p.lastLogin));
        if (auto r = run(profile); !r) {
            return r;
        }

        for (std::size_t i = 0; i < game::kSkillCount; ++i) {
            const auto skill = static_cast<game::Skill>(i);
            const auto& entry = state.skills[i];
            PreparedStatement row{std::string(kUpsertSkill)};
            row.bindInt("player_id", playerId)
                .bindString("skill", std::string(game::skillName(skill)))
                .bindInt("level", entry.level)
                .bindInt("experience", entry.experience);
            bindOptionalTime(row, "last_trained_us", entry.lastTrained);
            if (auto r = run(row); !r) {
                return r;
            }
        }

        for (auto table : kRewrittenTables) {
            PreparedStatement clear("DELETE FROM " + std::string(table) +
                                    " WHERE player_id = $player_id");
            clear.bindInt("player_id", playerId);
            if (auto r = run(clear); !r) {
                return r;
            }
        }

        for (std::size_t slot = 0; slot < state.inventory.size(); ++slot) {
            const auto& stack = state.inventory[slot];
            if (stack.IsEmpty()) {
                continue;
            }
            PreparedStatement row{std::string(kInsertInventory)};
            row.bindInt("player_id", playerId)
                .bindInt("slot", static_cast<int64_t>(slot))
                .bindInt("item_id", stack.item.value())
                .bindInt("quantity", stack.quantity);
            if (auto r = run(row); !r) {
                return r;
            }
        }

        for (const auto& [item, entry] : state.bank) {
            PreparedStatement row{std::string(kInsertBank)};
            row.bindInt("player_id", playerId)
                .bindInt("item_id", item.value())
                .bindInt("quantity", entry.quantity)
                .bindInt("tab", entry.tab);
            if (auto r = run(row); !r) {
                return r;
            }
        }

        for (std::size_t slot = 0; slot < state.equipment.size(); ++slot) {
            const auto& stack = state.equipment[slot];
            if (stack.IsEmpty()) {
                continue;
            }
            PreparedStatement row{std::string(kInsertEquipment)};
            row.bindInt("player_id", playerId)
                .bindString("slot",
                            std::string(game::equipSlotName(static_cast<game::EquipSlot>(slot))))
                .bindInt("item_id", stack.item.value())
                .bindInt("quantity", stack.quantity);
            if (auto r = run(row); !r) {
                return r;
            }
        }

        for (const auto& [item, entries] : state.buyLimitUsage) {
            for (const auto& entry : entries) {
                PreparedStatement row{std::string(kInsertBuyLimit)};
                row.bindInt("player_id", playerId)
                    .bindInt("item_id", item.value())
                    .bindInt("at", toEpochMicros(entry.at))
                    .bindInt("quantity", entry.quantity);
                if (auto r = run(row); !r) {
                    return r;
                }
            }
        }

        for (const auto& [category, rating] : state.ratings) {
            PreparedStatement row{std::string(kUpsertRating)};
            row.bindInt("player_id", playerId)
                .bindString("category", std::string(game::battleCategoryName(category)))
                .bindInt("rating", rating.rating)
                .bindDouble("uncertainty", rating.uncertainty)
                .bindInt("wins", rating.wins)
                .bindInt("losses", rating.losses)
                .bindInt("draws", rating.draws)
                .bindInt("total_battles", rating.totalBattles)
                .bindInt("win_streak", rating.winStreak)
                .bindInt("best_win_streak", rating.bestWinStreak)
                .bindInt("damage_dealt", rating.damageDealt)
                .bindInt("damage_taken", rating.damageTaken)
                .bindString("favourite_move", rating.favouriteMove)
                .bindInt("decay_anchor_us", toEpochMicros(rating.decayAnchor));
            bindOptionalTime(row, "last_battle_us", rating.lastBattle);
            if (auto r = run(row); !r) {
                return r;
            }
            for (const auto& [move, uses] : rating.moveUsage) {
                PreparedStatement usage{std::string(kInsertMoveUsage)};
                usage.bindInt("player_id", playerId)
                    .bindString("category", std::string(game::battleCategoryName(category)))
                    .bindString("move", move)
                    .bindInt("uses", uses);
                if (auto r = run(usage); !r) {
                    return r;
                }
            }
        }

        // Insert-or-ignore ledgers.
        for (const auto& [id, at] : state.achievements) {
            PreparedStatement row{std::string(kInsertAchievement)};
            row.bindInt("player_id", playerId).bindInt("achievement_id", id.value())
                .bindInt("at", toEpochMicros(at));
            if (auto r = run(row); !r) {
                return r;
            }
        }
        for (const auto& [id, at] : state.collectionLog) {
            PreparedStatement row{std::string(kInsertCollection)};
            row.bindInt("player_id", playerId).bindInt("item_id", id.value())
                .bindInt("at", toEpochMicros(at));
            if (auto r = run(row); !r) {
                return r;
            }
        }
        for (const auto& [id, at] : state.completedQuests) {
            PreparedStatement row{std::string(kInsertQuest)};
            row.bindInt("player_id", playerId).bindInt("quest_id", id.value())
                .bindInt("at", toEpochMicros(at));
            if (auto r = run(row); !r) {
                return r;
            }
        }
        return GameResult<void>::ok();
    }

    GameResult<void> order(const game::Order& o) {
        PreparedStatement row{std::string(kUpsertOrder)};
        row.bindInt("order_id", static_cast<int64_t>(o.id.value()))
            .bindInt("player_id", static_cast<int64_t>(o.player.value()))
            .bindInt("item_id", o.item.value())
            .bindString("side", std::string(game::orderSideName(o.side)))
            .bindInt("quantity", o.quantity)
            .bindInt("price", o.price)
            .bindInt("filled", o.filled)
            .bindString("status", std::string(game::orderStatusName(o.status)))
            .bindInt("created_at_us", toEpochMicros(o.createdAt))
            .bindInt("sequence", static_cast<int64_t>(o.sequence))
            .bindInt("collect_items", o.collectItems)
            .bindInt("collect_coins", o.collectCoins);
        bindOptionalTime(row, "completed_at_us", o.completedAt);
        return run(row);
    }

    GameResult<void> trade(const game::Trade& t) {
        PreparedStatement row{std::string(kInsertTrade)};
        row.bindInt("trade_id", static_cast<int64_t>(t.id.value()))
            .bindInt("item_id", t.item.value())
            .bindInt("buy_order_id", static_cast<int64_t>(t.buyOrder.value()))
            .bindInt("sell_order_id", static_cast<int64_t>(t.sellOrder.value()))
            .bindInt("buyer_id", static_cast<int64_t>(t.buyer.value()))
            .bindInt("seller_id", static_cast<int64_t>(t.seller.value()))
            .bindInt("quantity", t.quantity)
            .bindInt("price", t.price)
            .bindInt("executed_at_us", toEpochMicros(t.executedAt));
        return run(row);
    }

    GameResult<void> battle(const game::BattleRecord& b) {
        PreparedStatement row{std::string(kInsertBattle)};
        row.bindInt("battle_id", static_cast<int64_t>(b.id.value()))
            .bindString("battle_key", b.battleKey)
            .bindString("category", std::string(game::battleCategoryName(b.category)))
            .bindInt("player_a", static_cast<int64_t>(b.playerA.value()))
            .bindInt("player_b", static_cast<int64_t>(b.playerB.value()))
            .bindInt("duration_seconds", b.outcome.durationSeconds)
            .bindInt("turns", b.outcome.turns)
            .bindInt("damage_a", b.outcome.first.damageDealt)
            .bindInt("damage_b", b.outcome.second.damageDealt)
            .bindInt("recorded_at_us", toEpochMicros(b.recordedAt));
        bindOptionalId(row, "winner_id", b.winner);
        return run(row);
    }

    GameResult<void> tournament(const game::Tournament& t) {
        const auto tournamentId = static_cast<int64_t>(t.id.value());
        PreparedStatement row{std::string(kUpsertTournament)};
        row.bindInt("tournament_id", tournamentId)
            .bindString("name", t.name)
            .bindString("category", std::string(game::battleCategoryName(t.category)))
            .bindString("status", std::string(game::tournamentStatusName(t.status)))
            .bindInt("max_participants", t.maxParticipants)
            .bindInt("current_round", t.currentRound)
            .bindInt("created_at_us", toEpochMicros(t.createdAt));
        bindOptionalId(row, "winner_id", t.winner);
        bindOptionalTime(row, "started_at_us", t.startedAt);
        bindOptionalTime(row, "completed_at_us", t.completedAt);
        if (auto r = run(row); !r) {
            return r;
        }

        for (std::size_t seed = 0; seed < t.participants.size(); ++seed) {
            PreparedStatement entrant{std::string(kInsertParticipant)};
            entrant.bindInt("tournament_id", tournamentId)
                .bindInt("player_id", static_cast<int64_t>(t.participants[seed].value()))
                .bindInt("seed", static_cast<int64_t>(seed));
            if (auto r = run(entrant); !r) {
                return r;
            }
        }

        for (const auto& m : t.matches) {
            PreparedStatement match{std::string(kUpsertMatch)};
            match.bindInt("match_id", static_cast<int64_t>(m.id.value()))
                .bindInt("tournament_id", tournamentId)
                .bindInt("round", m.round)
                .bindInt("position", m.position)
                .bindString("status", std::string(game::matchStatusName(m.status)))
                .bindBool("walkover", m.walkover);
            bindOptionalId(match, "player_a", m.playerA);
            bindOptionalId(match, "player_b", m.playerB);
            bindOptionalId(match, "winner_id", m.winner);
            bindOptionalId(match, "battle_id", m.battleId);
            bindOptionalTime(match, "scheduled_at_us", m.scheduledAt);
            bindOptionalTime(match, "completed_at_us", m.completedAt);
            if (auto r = run(match); !r) {
                return r;
            }
        }
        return GameResult<void>::ok();
    }

private:
    Transaction& txn_;
};

// -- Row readers --------------------------------------------------------------

/// Typed column access over one result row. The first failure is kept
/// and later reads return zero values; check the reader before use.
class RowReader {
public:
    RowReader(std::string_view table, const DbRow& row) : table_(table), row_(row) {}

    explicit operator bool() const noexcept { return !error_.has_value(); }
    [[nodiscard]] const GameError& error() const { return *error_; }

    int64_t integer(std::string_view column) {
        auto value = optionalInteger(column);
        if (!value) {
            fail(column, "is null");
            return 0;
        }
        return *value;
    }

    std::optional<int64_t> optionalInteger(std::string_view column) {
        const auto* value = find(column);
        if (value == nullptr || std::holds_alternative<DbNull>(*value)) {
            return std::nullopt;
        }
        if (const auto* n = std::get_if<int64_t>(value)) {
            return *n;
        }
        if (const auto* d = std::get_if<double>(value)) {
            return static_cast<int64_t>(*d);
        }
        if (const auto* b = std::get_if<bool>(value)) {
            return *b ? 1 : 0;
        }
        const auto& text = std::get<std::string>(*value);
        int64_t parsed = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec != std::errc{} || end != text.data() + text.size()) {
            fail(column, "is not an integer");
            return 0;
        }
        return parsed;
    }

    double real(std::string_view column) {
        const auto* value = find(column);
        if (value != nullptr) {
            if (const auto* d = std::get_if<double>(value)) {
                return *d;
            }
            if (const auto* n = std::get_if<int64_t>(value)) {
                return static_cast<double>(*n);
            }
            if (const auto* s = std::get_if<std::string>(value)) {
                char* end = nullptr;
                const double parsed = std::strtod(s->c_str(), &end);
                if (!s->empty() && end == s->c_str() + s->size()) {
                    return parsed;
                }
            }
        }
        fail(column, "is not a number");
        return 0.0;
    }

    bool flag(std::string_view column) {
        const auto* value = find(column);
        if (value != nullptr) {
            if (const auto* b = std::get_if<bool>(value)) {
                return *b;
            }
            if (const auto* n = std::get_if<int64_t>(value)) {
                return *n != 0;
            }
            if (const auto* s = std::get_if<std::string>(value)) {
                if (*s == "t" || *s == "true" || *s == "1") {
                    return true;
                }
                if (*s == "f" || *s == "false" || *s == "0") {
                    return false;
                }
            }
        }
        fail(column, "is not a boolean");
        return false;
    }

    std::string text(std::string_view column) {
        const auto* value = find(column);
        if (value != nullptr) {
            if (const auto* s = std::get_if<std::string>(value)) {
                return *s;
            }
        }
        fail(column, "is not text");
        return {};
    }

    Timestamp time(std::string_view column) { return fromEpochMicros(integer(column)); }

    std::optional<Timestamp> optionalTime(std::string_view column) {
        auto micros = optionalInteger(column);
        if (!micros) {
            return std::nullopt;
        }
        return fromEpochMicros(*micros);
    }

    template <typename Id>
    Id id(std::string_view column) {
        using Raw = decltype(Id{}.value());
        return Id(static_cast<Raw>(integer(column)));
    }

    template <typename Id>
    std::optional<Id> optionalId(std::string_view column) {
        using Raw = decltype(Id{}.value());
        auto raw = optionalInteger(column);
        if (!raw) {
            return std::nullopt;
        }
        return Id(static_cast<Raw>(*raw));
    }

    /// Unwrap a parse*() result, failing on an unknown name.
    template <typename Enum>
    Enum named(std::optional<Enum> parsed, std::string_view column) {
        if (!parsed) {
            fail(column, "holds an unknown name");
            return Enum{};
        }
        return *parsed;
    }

    void fail(std::string_view column, std::string_view why) {
        if (!error_) {
            error_ = GameError(ErrorCode::InvariantViolation,
                               std::string(table_) + "." + std::string(column) + " " +
                                   std::string(why));
        }
    }

private:
    const DbValue* find(std::string_view column) const {
        auto it = row_.find(std::string(column));
        return it == row_.end() ? nullptr : &it->second;
    }

    std::string_view table_;
    const DbRow& row_;
    std::optional<GameError> error_;
};

const QueryResult& rowsOf(const SqlPersistenceSink::TableRows& tables, std::string_view table) {
    static const QueryResult kNone;
    auto it = tables.find(std::string(table));
    return it == tables.end() ? kNone : it->second;
}

// -- Snapshot assembly --------------------------------------------------------

class Assembler {
public:
    explicit Assembler(const SqlPersistenceSink::TableRows& tables) : tables_(tables) {}

    GameResult<EngineSnapshot> run() {
        for (auto step : {&Assembler::players, &Assembler::skills, &Assembler::inventory,
                          &Assembler::bank, &Assembler::equipment, &Assembler::ratings,
                          &Assembler::moveUsage, &Assembler::ledgers, &Assembler::buyLimits,
                          &Assembler::orders, &Assembler::trades, &Assembler::battles,
                          &Assembler::tournaments, &Assembler::participants,
                          &Assembler::matches}) {
            if (auto done = (this->*step)(); !done) {
                return GameResult<EngineSnapshot>::err(done.error());
            }
        }
        for (auto& [id, state] : players_) {
            snapshot_.players.push_back(std::move(state));
        }
        for (auto& [id, tournament] : tournaments_) {
            snapshot_.tournaments.push_back(std::move(tournament));
        }
        return GameResult<EngineSnapshot>::ok(std::move(snapshot_));
    }

private:
    using Step = GameResult<void>;

    /// Visit each row of @p table, stopping at the first read failure.
    template <typename Fn>
    Step each(std::string_view table, Fn&& fn) {
        for (const auto& row : rowsOf(tables_, table)) {
            RowReader r(table, row);
            fn(r);
            if (!r) {
                return Step::err(r.error());
            }
        }
        return Step::ok();
    }

    game::PlayerState* owner(RowReader& r) {
        auto it = players_.find(r.id<PlayerId>("player_id"));
        if (it == players_.end()) {
            r.fail("player_id", "references an unknown player");
            return nullptr;
        }
        return &it->second;
    }

    Step players() {
        return each("osrs_players", [&](RowReader& r) {
            game::PlayerState state;
            auto& p = state.profile;
            p.id = r.id<PlayerId>("player_id");
            p.displayName = r.text("display_name");
            p.world = static_cast<int32_t>(r.integer("world"));
            p.gameMode = r.text("game_mode");
            p.member = r.flag("member");
            p.status = r.named(game::parseAccountStatus(r.text("status")), "status");
            p.totalLevel = static_cast<int32_t>(r.integer("total_level"));
            p.combatLevel = static_cast<int32_t>(r.integer("combat_level"));
            p.questPoints = static_cast<int32_t>(r.integer("quest_points"));
            p.coins = r.integer("coins");
            p.createdAt = r.time("created_at_us");
            p.lastLogin = r.time("last_login_us");
            const auto id = p.id;
            players_[id] = std::move(state);
        });
    }

    Step skills() {
        return each("player_skills", [&](RowReader& r) {
            auto* state = owner(r);
            const auto skill = r.named(game::parseSkill(r.text("skill")), "skill");
            if (state == nullptr || !r) {
                return;
            }
            auto& entry = state->skills[game::skillIndex(skill)];
            entry.level = static_cast<int32_t>(r.integer("level"));
            entry.experience = r.integer("experience");
            entry.lastTrained = r.optionalTime("last_trained_us");
        });
    }

    Step inventory() {
        return each("player_inventory", [&](RowReader& r) {
            auto* state = owner(r);
            const auto slot = r.integer("slot");
            if (slot < 0 || slot >= static_cast<int64_t>(game::kInventorySlotCount)) {
                r.fail("slot", "is out of range");
            }
            if (state == nullptr || !r) {
                return;
            }
            state->inventory[static_cast<std::size_t>(slot)] =
                game::ItemStack{r.id<foundation::ItemId>("item_id"), r.integer("quantity")};
        });
    }

    Step bank() {
        return each("player_bank", [&](RowReader& r) {
            if (auto* state = owner(r)) {
                state->bank[r.id<foundation::ItemId>("item_id")] =
                    game::BankEntry{r.integer("quantity"), static_cast<int32_t>(r.integer("tab"))};
            }
        });
    }

    Step equipment() {
        return each("player_equipment", [&](RowReader& r) {
            auto* state = owner(r);
            const auto slot = r.named(game::parseEquipSlot(r.text("slot")), "slot");
            if (state == nullptr || !r) {
                return;
            }
            state->equipment[static_cast<std::size_t>(slot)] =
                game::ItemStack{r.id<foundation::ItemId>("item_id"), r.integer("quantity")};
        });
    }

    Step ratings() {
        return each("battle_ratings", [&](RowReader& r) {
            auto* state = owner(r);
            const auto category =
                r.named(game::parseBattleCategory(r.text("category")), "category");
            if (state == nullptr || !r) {
                return;
            }
            auto& rating = state->ratings[category];
            rating.rating = static_cast<int32_t>(r.integer("rating"));
            rating.uncertainty = r.real("uncertainty");
            rating.wins = static_cast<int32_t>(r.integer("wins"));
            rating.losses = static_cast<int32_t>(r.integer("losses"));
            rating.draws = static_cast<int32_t>(r.integer("draws"));
            rating.totalBattles = static_cast<int32_t>(r.integer("total_battles"));
            rating.winStreak = static_cast<int32_t>(r.integer("win_streak"));
            rating.bestWinStreak = static_cast<int32_t>(r.integer("best_win_streak"));
            rating.damageDealt = r.integer("damage_dealt");
            rating.damageTaken = r.integer("damage_taken");
            rating.favouriteMove = r.text("favourite_move");
            rating.lastBattle = r.optionalTime("last_battle_us");
            rating.decayAnchor = r.time("decay_anchor_us");
        });
    }

    Step moveUsage() {
        return each("battle_move_usage", [&](RowReader& r) {
            auto* state = owner(r);
            const auto category =
                r.named(game::parseBattleCategory(r.text("category")), "category");
            if (state == nullptr || !r) {
                return;
            }
            auto it = state->ratings.find(category);
            if (it == state->ratings.end()) {
                r.fail("category", "has no rating row");
                return;
            }
            it->second.moveUsage[r.text("move")] = r.integer("uses");
        });
    }

    Step ledgers() {
        auto achievements = each("player_achievements", [&](RowReader& r) {
            if (auto* state = owner(r)) {
                state->achievements[r.id<foundation::AchievementId>("achievement_id")] =
                    r.time("awarded_at_us");
            }
        });
        if (!achievements) {
            return achievements;
        }
        auto collection = each("collection_log", [&](RowReader& r) {
            if (auto* state = owner(r)) {
                state->collectionLog[r.id<foundation::ItemId>("item_id")] =
                    r.time("obtained_at_us");
            }
        });
        if (!collection) {
            return collection;
        }
        return each("quest_completions", [&](RowReader& r) {
            if (auto* state = owner(r)) {
                state->completedQuests[r.id<foundation::QuestId>("quest_id")] =
                    r.time("completed_at_us");
            }
        });
    }

    Step buyLimits() {
        return each("ge_buy_limits", [&](RowReader& r) {
            if (auto* state = owner(r)) {
                state->buyLimitUsage[r.id<foundation::ItemId>("item_id")].push_back(
                    game::BuyLimitEntry{r.time("bought_at_us"), r.integer("quantity")});
            }
        });
    }

    Step orders() {
        return each("ge_orders", [&](RowReader& r) {
            game::Order o;
            o.id = r.id<foundation::OrderId>("order_id");
            o.player = r.id<PlayerId>("player_id");
            o.item = r.id<foundation::ItemId>("item_id");
            o.side = r.named(game::parseOrderSide(r.text("side")), "side");
            o.quantity = r.integer("quantity");
            o.price = r.integer("price");
            o.filled = r.integer("quantity_filled");
            o.status = r.named(game::parseOrderStatus(r.text("status")), "status");
            o.createdAt = r.time("created_at_us");
            o.completedAt = r.optionalTime("completed_at_us");
            o.sequence = static_cast<uint64_t>(r.integer("sequence"));
            o.collectItems = r.integer("collect_items");
            o.collectCoins = r.integer("collect_coins");
            snapshot_.orders.push_back(std::move(o));
        });
    }

    Step trades() {
        return each("ge_trades", [&](RowReader& r) {
            game::Trade t;
            t.id = r.id<foundation::TradeId>("trade_id");
            t.item = r.id<foundation::ItemId>("item_id");
            t.buyOrder = r.id<foundation::OrderId>("buy_order_id");
            t.sellOrder = r.id<foundation::OrderId>("sell_order_id");
            t.buyer = r.id<PlayerId>("buyer_id");
            t.seller = r.id<PlayerId>("seller_id");
            t.quantity = r.integer("quantity");
            t.price = r.integer("price");
            t.executedAt = r.time("executed_at_us");
            snapshot_.trades.push_back(t);
        });
    }

    Step battles() {
        return each("battle_records", [&](RowReader& r) {
            game::BattleRecord b;
            b.id = r.id<foundation::BattleId>("battle_id");
            b.battleKey = r.text("battle_key");
            b.category = r.named(game::parseBattleCategory(r.text("category")), "category");
            b.playerA = r.id<PlayerId>("player_a");
            b.playerB = r.id<PlayerId>("player_b");
            b.winner = r.optionalId<PlayerId>("winner_id");
            b.outcome.durationSeconds = static_cast<int32_t>(r.integer("duration_seconds"));
            b.outcome.turns = static_cast<int32_t>(r.integer("turns"));
            b.outcome.first.damageDealt = r.integer("damage_a");
            b.outcome.second.damageDealt = r.integer("damage_b");
            b.recordedAt = r.time("recorded_at_us");
            snapshot_.battles.push_back(std::move(b));
        });
    }

    game::Tournament* tournament(RowReader& r) {
        auto it = tournaments_.find(r.id<foundation::TournamentId>("tournament_id"));
        if (it == tournaments_.end()) {
            r.fail("tournament_id", "references an unknown tournament");
            return nullptr;
        }
        return &it->second;
    }

    Step tournaments() {
        return each("tournaments", [&](RowReader& r) {
            game::Tournament t;
            t.id = r.id<foundation::TournamentId>("tournament_id");
            t.name = r.text("name");
            t.category = r.named(game::parseBattleCategory(r.text("category")), "category");
            t.status = r.named(game::parseTournamentStatus(r.text("status")), "status");
            t.maxParticipants = static_cast<int32_t>(r.integer("max_participants"));
            t.currentRound = static_cast<int32_t>(r.integer("current_round"));
            t.winner = r.optionalId<PlayerId>("winner_id");
            t.createdAt = r.time("created_at_us");
            t.startedAt = r.optionalTime("started_at_us");
            t.completedAt = r.optionalTime("completed_at_us");
            const auto id = t.id;
            tournaments_[id] = std::move(t);
        });
    }

    // Rows arrive ordered by seed, which is registration order.
    Step participants() {
        return each("tournament_participants", [&](RowReader& r) {
            if (auto* t = tournament(r)) {
                t->participants.push_back(r.id<PlayerId>("player_id"));
            }
        });
    }

    Step matches() {
        return each("tournament_matches", [&](RowReader& r) {
            auto* t = tournament(r);
            if (t == nullptr) {
                return;
            }
            game::TournamentMatch m;
            m.id = r.id<foundation::MatchId>("match_id");
            m.round = static_cast<int32_t>(r.integer("round"));
            m.position = static_cast<int32_t>(r.integer("position"));
            m.playerA = r.optionalId<PlayerId>("player_a");
            m.playerB = r.optionalId<PlayerId>("player_b");
            m.winner = r.optionalId<PlayerId>("winner_id");
            m.status = r.named(game::parseMatchStatus(r.text("status")), "status");
            m.scheduledAt = r.optionalTime("scheduled_at_us");
            m.completedAt = r.optionalTime("completed_at_us");
            m.battleId = r.optionalId<foundation::BattleId>("battle_id");
            m.walkover = r.flag("walkover");
            t->matches.push_back(std::move(m));
        });
    }

    const SqlPersistenceSink::TableRows& tables_;
    std::map<PlayerId, game::PlayerState> players_;
    std::map<foundation::TournamentId, game::Tournament> tournaments_;
    EngineSnapshot snapshot_;
};

}  // namespace

SqlPersistenceSink::SqlPersistenceSink(foundation::GameDatabase& database) : database_(database) {}

std::vector<std::string> SqlPersistenceSink::schemaStatements() {
    return {
        "CREATE TABLE IF NOT EXISTS osrs_players ("
        " player_id BIGINT PRIMARY KEY,"
        " display_name VARCHAR(64) NOT NULL UNIQUE,"
        " world INTEGER NOT NULL DEFAULT 301,"
        " game_mode VARCHAR(32) NOT NULL DEFAULT 'normal',"
        " member BOOLEAN NOT NULL DEFAULT FALSE,"
        " status VARCHAR(16) NOT NULL DEFAULT 'active',"
        " total_level INTEGER NOT NULL DEFAULT 32,"
        " combat_level INTEGER NOT NULL DEFAULT 3,"
        " quest_points INTEGER NOT NULL DEFAULT 0,"
        " coins BIGINT NOT NULL DEFAULT 0 CHECK (coins >= 0),"
        " created_at_us BIGINT NOT NULL,"
        " last_login_us BIGINT NOT NULL)",

        "CREATE TABLE IF NOT EXISTS player_skills ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " skill VARCHAR(16) NOT NULL,"
        " level INTEGER NOT NULL CHECK (level BETWEEN 1 AND 99),"
        " experience BIGINT NOT NULL CHECK (experience BETWEEN 0 AND 200000000),"
        " last_trained_us BIGINT,"
        " PRIMARY KEY (player_id, skill))",

        "CREATE TABLE IF NOT EXISTS player_inventory ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " slot INTEGER NOT NULL CHECK (slot BETWEEN 0 AND 27),"
        " item_id INTEGER NOT NULL,"
        " quantity BIGINT NOT NULL CHECK (quantity > 0),"
        " PRIMARY KEY (player_id, slot))",

        "CREATE TABLE IF NOT EXISTS player_bank ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " item_id INTEGER NOT NULL,"
        " quantity BIGINT NOT NULL CHECK (quantity > 0),"
        " tab INTEGER NOT NULL DEFAULT 0,"
        " PRIMARY KEY (player_id, item_id))",

        "CREATE TABLE IF NOT EXISTS player_equipment ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " slot VARCHAR(16) NOT NULL,"
        " item_id INTEGER NOT NULL,"
        " quantity BIGINT NOT NULL CHECK (quantity > 0),"
        " PRIMARY KEY (player_id, slot))",

        "CREATE TABLE IF NOT EXISTS battle_ratings ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " category VARCHAR(16) NOT NULL,"
        " rating INTEGER NOT NULL,"
        " uncertainty DOUBLE PRECISION NOT NULL,"
        " wins INTEGER NOT NULL, losses INTEGER NOT NULL, draws INTEGER NOT NULL,"
        " total_battles INTEGER NOT NULL,"
        " win_streak INTEGER NOT NULL, best_win_streak INTEGER NOT NULL,"
        " damage_dealt BIGINT NOT NULL, damage_taken BIGINT NOT NULL,"
        " favourite_move VARCHAR(64) NOT NULL DEFAULT '',"
        " last_battle_us BIGINT,"
        " decay_anchor_us BIGINT NOT NULL,"
        " PRIMARY KEY (player_id, category))",

        "CREATE TABLE IF NOT EXISTS battle_move_usage ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " category VARCHAR(16) NOT NULL,"
        " move VARCHAR(64) NOT NULL,"
        " uses BIGINT NOT NULL CHECK (uses > 0),"
        " PRIMARY KEY (player_id, category, move))",

        "CREATE TABLE IF NOT EXISTS player_achievements ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " achievement_id INTEGER NOT NULL,"
        " awarded_at_us BIGINT NOT NULL,"
        " PRIMARY KEY (player_id, achievement_id))",

        "CREATE TABLE IF NOT EXISTS collection_log ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " item_id INTEGER NOT NULL,"
        " obtained_at_us BIGINT NOT NULL,"
        " PRIMARY KEY (player_id, item_id))",

        "CREATE TABLE IF NOT EXISTS quest_completions ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " quest_id INTEGER NOT NULL,"
        " completed_at_us BIGINT NOT NULL,"
        " PRIMARY KEY (player_id, quest_id))",

        "CREATE TABLE IF NOT EXISTS ge_buy_limits ("
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " item_id INTEGER NOT NULL,"
        " bought_at_us BIGINT NOT NULL,"
        " quantity BIGINT NOT NULL)",

        "CREATE TABLE IF NOT EXISTS ge_orders ("
        " order_id BIGINT PRIMARY KEY,"
        " player_id BIGINT NOT NULL REFERENCES osrs_players(player_id) ON DELETE CASCADE,"
        " item_id INTEGER NOT NULL,"
        " side VARCHAR(4) NOT NULL,"
        " quantity BIGINT NOT NULL CHECK (quantity > 0),"
        " price BIGINT NOT NULL CHECK (price > 0),"
        " quantity_filled BIGINT NOT NULL DEFAULT 0,"
        " status VARCHAR(16) NOT NULL,"
        " created_at_us BIGINT NOT NULL,"
        " completed_at_us BIGINT,"
        " sequence BIGINT NOT NULL,"
        " collect_items BIGINT NOT NULL DEFAULT 0 CHECK (collect_items >= 0),"
        " collect_coins BIGINT NOT NULL DEFAULT 0 CHECK (collect_coins >= 0),"
        " CHECK (quantity_filled BETWEEN 0 AND quantity))",

        // Trades and battle records outlive the players they mention.
        "CREATE TABLE IF NOT EXISTS ge_trades ("
        " trade_id BIGINT PRIMARY KEY,"
        " item_id INTEGER NOT NULL,"
        " buy_order_id BIGINT NOT NULL, sell_order_id BIGINT NOT NULL,"
        " buyer_id BIGINT NOT NULL, seller_id BIGINT NOT NULL,"
        " quantity BIGINT NOT NULL CHECK (quantity > 0),"
        " price BIGINT NOT NULL,"
        " executed_at_us BIGINT NOT NULL)",

        "CREATE INDEX IF NOT EXISTS ge_trades_item_time ON ge_trades (item_id, executed_at_us)",

        "CREATE TABLE IF NOT EXISTS battle_records ("
        " battle_id BIGINT PRIMARY KEY,"
        " battle_key VARCHAR(128) NOT NULL UNIQUE,"
        " category VARCHAR(16) NOT NULL,"
        " player_a BIGINT NOT NULL, player_b BIGINT NOT NULL,"
        " winner_id BIGINT,"
        " duration_seconds INTEGER NOT NULL, turns INTEGER NOT NULL,"
        " damage_a BIGINT NOT NULL, damage_b BIGINT NOT NULL,"
        " recorded_at_us BIGINT NOT NULL)",

        "CREATE TABLE IF NOT EXISTS tournaments ("
        " tournament_id BIGINT PRIMARY KEY,"
        " name VARCHAR(128) NOT NULL,"
        " category VARCHAR(16) NOT NULL,"
        " status VARCHAR(16) NOT NULL,"
        " max_participants INTEGER NOT NULL,"
        " current_round INTEGER NOT NULL,"
        " winner_id BIGINT,"
        " created_at_us BIGINT NOT NULL,"
        " started_at_us BIGINT,"
        " completed_at_us BIGINT)",

        "CREATE TABLE IF NOT EXISTS tournament_participants ("
        " tournament_id BIGINT NOT NULL REFERENCES tournaments(tournament_id) ON DELETE CASCADE,"
        " player_id BIGINT NOT NULL,"
        " seed INTEGER NOT NULL,"
        " PRIMARY KEY (tournament_id, player_id))",

        "CREATE TABLE IF NOT EXISTS tournament_matches ("
        " match_id BIGINT PRIMARY KEY,"
        " tournament_id BIGINT NOT NULL REFERENCES tournaments(tournament_id) ON DELETE CASCADE,"
        " round INTEGER NOT NULL, position INTEGER NOT NULL,"
        " player_a BIGINT, player_b BIGINT, winner_id BIGINT,"
        " status VARCHAR(16) NOT NULL,"
        " scheduled_at_us BIGINT, completed_at_us BIGINT,"
        " battle_id BIGINT,"
        " walkover BOOLEAN NOT NULL DEFAULT FALSE)",
    };
}

GameResult<void> SqlPersistenceSink::createSchema() {
    for (const auto& statement : schemaStatements()) {
        auto created = database_.execute(statement);
        if (!created) {
            return created;
        }
    }
    GEC_LOG_INFO(LogCategory::Persistence, "schema ready");
    return GameResult<void>::ok();
}

GameResult<void> SqlPersistenceSink::apply(const ChangeSet& changes) {
    if (changes.empty()) {
        return GameResult<void>::ok();
    }
    auto begun = database_.beginTransaction();
    if (!begun) {
        return GameResult<void>::err(begun.error());
    }
    auto& txn = begun.value();
    Writer writer(txn);

    auto fail = [&](const GameError& error) {
        // A rollback failure is only logged; the statement error is reported.
        if (auto rolledBack = txn.rollback(); !rolledBack) {
            GEC_LOG_WARN(LogCategory::Persistence,
                         "rollback failed: " + std::string(rolledBack.error().message()));
        }
        return GameResult<void>::err(
            GameError(ErrorCode::TransactionFailed,
                      changes.operation + ": " + std::string(error.message())));
    };

    for (auto id : changes.deletedPlayers) {
        PreparedStatement remove("DELETE FROM osrs_players WHERE player_id = $player_id");
        remove.bindInt("player_id", static_cast<int64_t>(id.value()));
        if (auto r = writer.run(remove); !r) {
            return fail(r.error());
        }
    }
    for (const auto& state : changes.players) {
        if (auto r = writer.player(state); !r) {
            return fail(r.error());
        }
    }
    for (const auto& order : changes.orders) {
        if (auto r = writer.order(order); !r) {
            return fail(r.error());
        }
    }
    for (const auto& trade : changes.trades) {
        if (auto r = writer.trade(trade); !r) {
            return fail(r.error());
        }
    }
    for (const auto& battle : changes.battles) {
        if (auto r = writer.battle(battle); !r) {
            return fail(r.error());
        }
    }
    for (const auto& tournament : changes.tournaments) {
        if (auto r = writer.tournament(tournament); !r) {
            return fail(r.error());
        }
    }

    auto committed = txn.commit();
    if (!committed) {
        return GameResult<void>::err(
            GameError(ErrorCode::TransactionFailed,
                      changes.operation + ": commit failed: " +
                          std::string(committed.error().message())));
    }
    GEC_LOG_DEBUG(LogCategory::Persistence, "applied " + changes.operation);
    return GameResult<void>::ok();
}

GameResult<EngineSnapshot> SqlPersistenceSink::load() {
    TableRows tables;
    for (const auto& query : kLoadQueries) {
        auto rows = database_.query(query.sql);
        if (!rows) {
            return GameResult<EngineSnapshot>::err(rows.error());
        }
        tables.emplace(std::string(query.table), std::move(rows.value()));
    }
    auto snapshot = assemble(tables);
    if (snapshot) {
        const auto& s = snapshot.value();
        GEC_LOG_INFO(LogCategory::Persistence,
                     "loaded " + std::to_string(s.players.size()) + " players, " +
                         std::to_string(s.orders.size()) + " orders, " +
                         std::to_string(s.battles.size()) + " battles and " +
                         std::to_string(s.tournaments.size()) + " tournaments");
    } else {
        GEC_LOG_ERROR(LogCategory::Persistence,
                      "load failed: " + std::string(snapshot.error().message()));
    }
    return snapshot;
}

GameResult<EngineSnapshot> SqlPersistenceSink::assemble(const TableRows& tables) {
    return Assembler(tables).run();
}

}  // namespace gec::service
