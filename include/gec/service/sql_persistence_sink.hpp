#pragma once

/// @file sql_persistence_sink.hpp
/// @brief Persistence sink writing change sets to SQL through GameDatabase.
///
/// Each change set becomes one database transaction. Player aggregates
/// are written as a profile upsert plus a rewrite of their child rows;
/// trades and battle records are append-only inserts. Timestamps are
/// stored as microseconds since the Unix epoch (UTC).
///
/// load() reads every table back into an EngineSnapshot at start-up.
/// Battle records keep only the damage totals of each side, so a
/// replayed battle key returns a record without per-move detail.

#include <map>
#include <string>
#include <vector>

#include "gec/foundation/game_database.hpp"
#include "gec/service/persistence_sink.hpp"

namespace gec::service {

class SqlPersistenceSink : public IPersistenceSink {
public:
    /// @p database must be connected and outlive the sink.
    explicit SqlPersistenceSink(foundation::GameDatabase& database);

    /// PostgreSQL DDL for every table the sink writes, parents first.
    [[nodiscard]] static std::vector<std::string> schemaStatements();

    /// Run schemaStatements() against the database.
    [[nodiscard]] foundation::GameResult<void> createSchema();

    [[nodiscard]] foundation::GameResult<void> apply(const ChangeSet& changes) override;

    /// Read every table and assemble the persisted engine state.
    [[nodiscard]] foundation::GameResult<EngineSnapshot> load() override;

    /// Raw query results keyed by table name.
    using TableRows = std::map<std::string, foundation::QueryResult>;

    /// Decode raw rows into a snapshot. Numeric columns may arrive as
    /// integers or as text, depending on the backend. A child row whose
    /// parent is missing, or an unparseable value, is InvariantViolation.
    [[nodiscard]] static foundation::GameResult<EngineSnapshot> assemble(const TableRows& tables);

private:
    foundation::GameDatabase& database_;
};

}  // namespace gec::service
