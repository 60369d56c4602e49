/// @file sql_persistence_sink_test.cpp
/// @brief Unit tests for SqlPersistenceSink schema and error paths, and for
///        the service runner's argument helpers.
///
/// No database server is available to unit tests, so writes are exercised
/// against a disconnected GameDatabase.

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "gec/foundation/game_database.hpp"
#include "gec/service/persistence_sink.hpp"
#include "gec/service/service_runner.hpp"
#include "gec/service/sql_persistence_sink.hpp"

using namespace gec::foundation;
using namespace gec::service;

// ===========================================================================
// Schema
// ===========================================================================

TEST(SqlPersistenceSinkTest, SchemaCoversEveryTable) {
    const auto statements = SqlPersistenceSink::schemaStatements();
    const std::vector<std::string> tables = {
        "osrs_players",    "player_skills",     "player_inventory", "player_bank",
        "player_equipment", "battle_ratings",   "battle_move_usage", "player_achievements",
        "collection_log",
        "quest_completions", "ge_buy_limits",   "ge_orders",        "ge_trades",
        "battle_records",  "tournaments",       "tournament_participants", "tournament_matches"};
    ASSERT_EQ(statements.size(), tables.size());

    for (std::size_t i = 0; i < tables.size(); ++i) {
        const std::string prefix = "CREATE TABLE IF NOT EXISTS " + tables[i] + " (";
        EXPECT_EQ(statements[i].rfind(prefix, 0), 0u) << statements[i];
    }
}

TEST(SqlPersistenceSinkTest, ParentsCreatedBeforeChildren) {
    const auto statements = SqlPersistenceSink::schemaStatements();
    auto indexOf = [&](const std::string& table) {
        const std::string prefix = "CREATE TABLE IF NOT EXISTS " + table + " (";
        auto it = std::find_if(statements.begin(), statements.end(), [&](const std::string& s) {
            return s.rfind(prefix, 0) == 0;
        });
        return static_cast<std::size_t>(it - statements.begin());
    };
    for (const auto& statement : statements) {
        auto ref = statement.find("REFERENCES ");
        while (ref != std::string::npos) {
            auto start = ref + std::string("REFERENCES ").size();
            auto end = statement.find_first_of(" (", start);
            const auto parent = statement.substr(start, end - start);
            EXPECT_LT(indexOf(parent), statements.size()) << parent;
            EXPECT_LT(indexOf(parent), static_cast<std::size_t>(
                                           std::find(statements.begin(), statements.end(), statement) -
                                           statements.begin()))
                << parent;
            ref = statement.find("REFERENCES ", end);
        }
    }
}

// ===========================================================================
// Disconnected database
// ===========================================================================

TEST(SqlPersistenceSinkTest, CreateSchemaNeedsConnection) {
    GameDatabase db;
    SqlPersistenceSink sink(db);
    auto created = sink.createSchema();
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::NotConnected);
}

TEST(SqlPersistenceSinkTest, ApplyNeedsConnection) {
    GameDatabase db;
    SqlPersistenceSink sink(db);

    ChangeSet changes;
    changes.operation = "create_player";
    gec::game::PlayerState state;
    state.profile.id = PlayerId(1);
    state.profile.displayName = "Offline";
    changes.players.push_back(state);

    auto applied = sink.apply(changes);
    ASSERT_TRUE(applied.hasError());
    EXPECT_EQ(applied.error().code(), ErrorCode::NotConnected);
    EXPECT_EQ(applied.error().category(), ErrorCategory::Database);
}

TEST(SqlPersistenceSinkTest, LoadNeedsConnection) {
    GameDatabase db;
    SqlPersistenceSink sink(db);
    auto loaded = sink.load();
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::NotConnected);
}

TEST(SqlPersistenceSinkTest, EmptyChangeSetNeedsNoDatabase) {
    GameDatabase db;
    SqlPersistenceSink sink(db);
    ChangeSet changes;
    changes.operation = "noop";
    EXPECT_TRUE(sink.apply(changes).hasValue());
}

TEST(SqlPersistenceSinkTest, NullSinkAcceptsEverything) {
    NullPersistenceSink sink;
    ChangeSet changes;
    changes.operation = "create_player";
    changes.deletedPlayers.push_back(PlayerId(7));
    EXPECT_TRUE(sink.apply(changes).hasValue());
}

// ===========================================================================
// Snapshot assembly
// ===========================================================================

namespace {

DbRow playerRow(int64_t id, std::string name) {
    return {{"player_id", id},
            {"display_name", std::move(name)},
            {"world", int64_t{302}},
            {"game_mode", std::string("ironman")},
            {"member", true},
            {"status", std::string("active")},
            {"total_level", int64_t{40}},
            {"combat_level", int64_t{5}},
            {"quest_points", int64_t{1}},
            {"coins", std::string("1500")},  // text protocol
            {"created_at_us", int64_t{1'000'000}},
            {"last_login_us", std::string("2000000")}};
}

}  // namespace

TEST(SqlPersistenceSinkTest, AssemblesPlayersWithChildRows) {
    SqlPersistenceSink::TableRows tables;
    tables["osrs_players"] = {playerRow(4, "Lynx")};
    tables["player_skills"] = {{{"player_id", int64_t{4}},
                                {"skill", std::string("attack")},
                                {"level", int64_t{10}},
                                {"experience", int64_t{1154}},
                                {"last_trained_us", DbNull{}}}};
    tables["player_inventory"] = {{{"player_id", int64_t{4}},
                                   {"slot", int64_t{3}},
                                   {"item_id", int64_t{314}},
                                   {"quantity", int64_t{50}}}};
    tables["player_bank"] = {{{"player_id", int64_t{4}},
                              {"item_id", int64_t{1511}},
                              {"quantity", int64_t{7}},
                              {"tab", int64_t{1}}}};
    tables["battle_ratings"] = {{{"player_id", int64_t{4}},
                                 {"category", std::string("duel")},
                                 {"rating", int64_t{1016}},
                                 {"uncertainty", std::string("340.5")},
                                 {"wins", int64_t{1}},
                                 {"losses", int64_t{0}},
                                 {"draws", int64_t{0}},
                                 {"total_battles", int64_t{1}},
                                 {"win_streak", int64_t{1}},
                                 {"best_win_streak", int64_t{1}},
                                 {"damage_dealt", int64_t{40}},
                                 {"damage_taken", int64_t{12}},
                                 {"favourite_move", std::string("slash")},
                                 {"last_battle_us", int64_t{3'000'000}},
                                 {"decay_anchor_us", int64_t{3'000'000}}}};
    tables["battle_move_usage"] = {{{"player_id", int64_t{4}},
                                    {"category", std::string("duel")},
                                    {"move", std::string("slash")},
                                    {"uses", int64_t{3}}}};
    tables["ge_orders"] = {{{"order_id", int64_t{9}},
                            {"player_id", int64_t{4}},
                            {"item_id", int64_t{314}},
                            {"side", std::string("sell")},
                            {"quantity", int64_t{10}},
                            {"price", int64_t{5}},
                            {"quantity_filled", int64_t{4}},
                            {"status", std::string("active")},
                            {"created_at_us", int64_t{2'500'000}},
                            {"completed_at_us", DbNull{}},
                            {"sequence", int64_t{12}},
                            {"collect_items", int64_t{0}},
                            {"collect_coins", int64_t{20}}}};

    auto assembled = SqlPersistenceSink::assemble(tables);
    ASSERT_TRUE(assembled.hasValue()) << assembled.error().message();
    const auto& snapshot = assembled.value();
    ASSERT_EQ(snapshot.players.size(), 1u);

    const auto& state = snapshot.players[0];
    EXPECT_EQ(state.profile.id, PlayerId(4));
    EXPECT_EQ(state.profile.gameMode, "ironman");
    EXPECT_TRUE(state.profile.member);
    EXPECT_EQ(state.profile.coins, 1500);
    EXPECT_EQ(state.profile.lastLogin, fromEpochMicros(2'000'000));
    EXPECT_EQ(state.Level(gec::game::Skill::Attack), 10);
    EXPECT_FALSE(state.SkillOf(gec::game::Skill::Attack).lastTrained.has_value());
    EXPECT_EQ(state.inventory[3].quantity, 50);
    EXPECT_EQ(state.BankCount(ItemId(1511)), 7);

    const auto duel = state.RatingFor(gec::game::BattleCategory::Duel);
    EXPECT_EQ(duel.rating, 1016);
    EXPECT_DOUBLE_EQ(duel.uncertainty, 340.5);
    EXPECT_EQ(duel.moveUsage.at("slash"), 3);

    ASSERT_EQ(snapshot.orders.size(), 1u);
    EXPECT_EQ(snapshot.orders[0].side, gec::game::OrderSide::Sell);
    EXPECT_EQ(snapshot.orders[0].Remaining(), 6);
    EXPECT_EQ(snapshot.orders[0].collectCoins, 20);
    EXPECT_FALSE(snapshot.orders[0].completedAt.has_value());
}

TEST(SqlPersistenceSinkTest, AssemblesTournamentsInSeedOrder) {
    SqlPersistenceSink::TableRows tables;
    tables["tournaments"] = {{{"tournament_id", int64_t{2}},
                              {"name", std::string("Weekly")},
                              {"category", std::string("tournament")},
                              {"status", std::string("in_progress")},
                              {"max_participants", int64_t{4}},
                              {"current_round", int64_t{1}},
                              {"winner_id", DbNull{}},
                              {"created_at_us", int64_t{0}},
                              {"started_at_us", int64_t{10}},
                              {"completed_at_us", DbNull{}}}};
    tables["tournament_participants"] = {
        {{"tournament_id", int64_t{2}}, {"player_id", int64_t{8}}, {"seed", int64_t{0}}},
        {{"tournament_id", int64_t{2}}, {"player_id", int64_t{5}}, {"seed", int64_t{1}}}};
    tables["tournament_matches"] = {{{"match_id", int64_t{30}},
                                     {"tournament_id", int64_t{2}},
                                     {"round", int64_t{1}},
                                     {"position", int64_t{0}},
                                     {"player_a", int64_t{8}},
                                     {"player_b", int64_t{5}},
                                     {"winner_id", int64_t{5}},
                                     {"status", std::string("completed")},
                                     {"scheduled_at_us", DbNull{}},
                                     {"completed_at_us", int64_t{20}},
                                     {"battle_id", DbNull{}},
                                     {"walkover", std::string("t")}}};

    auto assembled = SqlPersistenceSink::assemble(tables);
    ASSERT_TRUE(assembled.hasValue()) << assembled.error().message();
    ASSERT_EQ(assembled.value().tournaments.size(), 1u);
    const auto& t = assembled.value().tournaments[0];
    EXPECT_EQ(t.status, gec::game::TournamentStatus::InProgress);
    ASSERT_EQ(t.participants.size(), 2u);
    EXPECT_EQ(t.participants[0], PlayerId(8));
    ASSERT_EQ(t.matches.size(), 1u);
    EXPECT_TRUE(t.matches[0].walkover);
    EXPECT_FALSE(t.matches[0].battleId.has_value());
    EXPECT_EQ(t.matches[0].winner, PlayerId(5));
}

TEST(SqlPersistenceSinkTest, OrphanChildRowRejected) {
    SqlPersistenceSink::TableRows tables;
    tables["osrs_players"] = {playerRow(1, "Only")};
    tables["player_bank"] = {{{"player_id", int64_t{2}},
                              {"item_id", int64_t{314}},
                              {"quantity", int64_t{1}},
                              {"tab", int64_t{0}}}};
    auto assembled = SqlPersistenceSink::assemble(tables);
    ASSERT_TRUE(assembled.hasError());
    EXPECT_EQ(assembled.error().code(), ErrorCode::InvariantViolation);
}

TEST(SqlPersistenceSinkTest, UnknownNameRejected) {
    SqlPersistenceSink::TableRows tables;
    auto row = playerRow(1, "Odd");
    row["status"] = std::string("frozen");
    tables["osrs_players"] = {row};
    auto assembled = SqlPersistenceSink::assemble(tables);
    ASSERT_TRUE(assembled.hasError());
    EXPECT_EQ(assembled.error().code(), ErrorCode::InvariantViolation);
    EXPECT_NE(std::string(assembled.error().message()).find("osrs_players.status"),
              std::string::npos);
}

TEST(SqlPersistenceSinkTest, EmptyTablesGiveEmptySnapshot) {
    auto assembled = SqlPersistenceSink::assemble({});
    ASSERT_TRUE(assembled.hasValue());
    EXPECT_TRUE(assembled.value().players.empty());
    EXPECT_TRUE(assembled.value().tournaments.empty());
}

// ===========================================================================
// Service runner arguments
// ===========================================================================

TEST(ServiceRunnerTest, ParsesConfigArgument) {
    std::string prog = "gec_maintenance";
    std::string flag = "--config";
    std::string path = "/etc/gec/engine.yaml";
    std::string once = "--once";
    char* argv[] = {prog.data(), flag.data(), path.data(), once.data()};

    EXPECT_EQ(parseConfigArg(4, argv), std::filesystem::path("/etc/gec/engine.yaml"));
    EXPECT_TRUE(hasFlag(4, argv, "--once"));
    EXPECT_FALSE(hasFlag(4, argv, "--verbose"));
}

TEST(ServiceRunnerTest, DanglingConfigFlagIgnored) {
    std::string prog = "gec_maintenance";
    std::string flag = "--config";
    char* argv[] = {prog.data(), flag.data()};
    EXPECT_TRUE(parseConfigArg(2, argv).empty());
}

TEST(ServiceRunnerTest, ProgramNameIsNotAFlag) {
    std::string prog = "--once";
    char* argv[] = {prog.data()};
    EXPECT_FALSE(hasFlag(1, argv, "--once"));
}

TEST(ServiceRunnerTest, MissingConfigFileFails) {
    ConfigManager config;
    auto loaded = loadConfig(config, "/nonexistent/gec/engine.yaml");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}
