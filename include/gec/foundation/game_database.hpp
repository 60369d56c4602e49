#pragma once

/// @file game_database.hpp
/// @brief GameDatabase wrapping kcenon database_system for the SQL
///        persistence mirror: pooled connections, named-parameter
///        statements and RAII transactions.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "gec/foundation/game_result.hpp"

namespace gec::foundation {

// ── Value types ─────────────────────────────────────────────────────────────

/// Sentinel type representing SQL NULL.
struct DbNull {};

/// A single column value in a query result row.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// A single row: column name → value.
using DbRow = std::unordered_map<std::string, DbValue>;

using QueryResult = std::vector<DbRow>;

/// Supported database backend types.
enum class DatabaseType : uint8_t {
    PostgreSQL,
    MySQL,
    SQLite
};

/// Parse a backend name from configuration ("postgres", "mysql", "sqlite").
std::optional<DatabaseType> parseDatabaseType(std::string_view name);

/// Connection pool settings, read from the `database.*` config keys.
struct DatabaseConfig {
    std::string connectionString;
    DatabaseType dbType = DatabaseType::PostgreSQL;
    uint32_t minConnections = 1;
    uint32_t maxConnections = 4;
    std::chrono::seconds connectionTimeout{10};
};

// ── PreparedStatement ───────────────────────────────────────────────────────

/// A SQL template with `$name` placeholders bound by name.
///
/// Example:
/// @code
///   PreparedStatement stmt(
///       "UPDATE players SET coins = $coins WHERE player_id = $player_id");
///   stmt.bindInt("coins", 1500).bindInt("player_id", 7);
///   txn.execute(stmt);
/// @endcode
class PreparedStatement {
public:
    explicit PreparedStatement(std::string sql);

    PreparedStatement& bindString(std::string_view name, std::string value);
    PreparedStatement& bindInt(std::string_view name, std::int64_t value);
    PreparedStatement& bindDouble(std::string_view name, double value);
    PreparedStatement& bindBool(std::string_view name, bool value);
    PreparedStatement& bindNull(std::string_view name);

    [[nodiscard]] std::string_view sql() const noexcept;

    /// Resolve the template with every bound parameter substituted.
    /// Strings are quoted with embedded single quotes doubled; a
    /// placeholder only matches when followed by a non-identifier char.
    [[nodiscard]] std::string resolve() const;

    void clearBindings();

private:
    std::string sql_;
    std::unordered_map<std::string, DbValue> params_;
};

// ── Transaction ─────────────────────────────────────────────────────────────

/// RAII transaction guard holding one pooled connection.
///
/// Rolls back on destruction unless commit() or rollback() was called.
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) noexcept;
    Transaction& operator=(Transaction&&) noexcept;

    [[nodiscard]] GameResult<void> commit();
    [[nodiscard]] GameResult<void> rollback();

    [[nodiscard]] GameResult<QueryResult> query(std::string_view sql);

    /// Execute a command (INSERT/UPDATE/DELETE/DDL).
    [[nodiscard]] GameResult<void> execute(std::string_view sql);
    [[nodiscard]] GameResult<void> execute(const PreparedStatement& stmt);

    [[nodiscard]] bool isActive() const noexcept;

private:
    friend class GameDatabase;
    struct Impl;
    explicit Transaction(std::unique_ptr<Impl> impl);
    void release() noexcept;

    std::unique_ptr<Impl> impl_;
};

// ── GameDatabase ────────────────────────────────────────────────────────────

/// Database adapter over kcenon's database_system with a small
/// connection pool. PIMPL keeps kcenon headers out of engine code.
class GameDatabase {
public:
    GameDatabase();
    ~GameDatabase();

    GameDatabase(const GameDatabase&) = delete;
    GameDatabase& operator=(const GameDatabase&) = delete;
    GameDatabase(GameDatabase&&) noexcept;
    GameDatabase& operator=(GameDatabase&&) noexcept;

    /// Open minConnections connections.
    [[nodiscard]] GameResult<void> connect(const DatabaseConfig& config);

    void disconnect();

    [[nodiscard]] bool isConnected() const noexcept;

    [[nodiscard]] GameResult<QueryResult> query(std::string_view sql);
    [[nodiscard]] GameResult<QueryResult> query(const PreparedStatement& stmt);

    [[nodiscard]] GameResult<void> execute(std::string_view sql);

    [[nodiscard]] GameResult<Transaction> beginTransaction();

    /// Number of connections currently checked out.
    [[nodiscard]] std::size_t activeConnections() const noexcept;

    [[nodiscard]] std::size_t poolSize() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gec::foundation
