/// @file game_database.cpp
/// @brief GameDatabase implementation wrapping kcenon database_system.

#include "gec/foundation/game_database.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <functional>
#include <mutex>

#include "gec/foundation/game_logger.hpp"

namespace gec::foundation {

namespace {

using Manager = ::database::database_manager;

::database::database_types toKcenon(DatabaseType type) {
    switch (type) {
        case DatabaseType::PostgreSQL: return ::database::database_types::postgres;
        case DatabaseType::MySQL:      return ::database::database_types::mysql;
        case DatabaseType::SQLite:     return ::database::database_types::sqlite;
    }
    return ::database::database_types::postgres;
}

QueryResult convertResult(const ::database::core::database_result& kcResult) {
    QueryResult result;
    result.reserve(kcResult.size());

    for (const auto& kcRow : kcResult) {
        DbRow row;
        for (const auto& [col, val] : kcRow) {
            row[col] = std::visit([](auto&& arg) -> DbValue {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::string> ||
                              std::is_same_v<T, std::int64_t> ||
                              std::is_same_v<T, double> ||
                              std::is_same_v<T, bool>) {
                    return arg;
                } else {
                    return DbNull{};
                }
            }, val);
        }
        result.push_back(std::move(row));
    }
    return result;
}

std::string quoteLiteral(const std::string& text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted += '\'';
    for (char c : text) {
        if (c == '\'') {
            quoted += '\'';
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string renderValue(const DbValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return quoteLiteral(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "TRUE" : "FALSE";
        } else {
            return std::to_string(arg);
        }
    }, value);
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

GameError notActive() {
    return GameError(ErrorCode::TransactionFailed, "transaction not active");
}

} // namespace

std::optional<DatabaseType> parseDatabaseType(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "postgres" || lower == "postgresql") {
        return DatabaseType::PostgreSQL;
    }
    if (lower == "mysql") {
        return DatabaseType::MySQL;
    }
    if (lower == "sqlite") {
        return DatabaseType::SQLite;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(std::string sql)
    : sql_(std::move(sql)) {}

PreparedStatement& PreparedStatement::bindString(std::string_view name, std::string value) {
    params_[std::string(name)] = std::move(value);
    return *this;
}

PreparedStatement& PreparedStatement::bindInt(std::string_view name, std::int64_t value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindDouble(std::string_view name, double value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindBool(std::string_view name, bool value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindNull(std::string_view name) {
    params_[std::string(name)] = DbNull{};
    return *this;
}

std::string_view PreparedStatement::sql() const noexcept {
    return sql_;
}

std::string PreparedStatement::resolve() const {
    // Single left-to-right scan so substituted text is never rescanned.
    std::string resolved;
    resolved.reserve(sql_.size() + 32);

    std::size_t pos = 0;
    while (pos < sql_.size()) {
        if (sql_[pos] != '$') {
            resolved += sql_[pos++];
            continue;
        }
        auto end = pos + 1;
        while (end < sql_.size() && isIdentifierChar(sql_[end])) {
            ++end;
        }
        auto it = params_.find(sql_.substr(pos + 1, end - pos - 1));
        if (it == params_.end()) {
            resolved.append(sql_, pos, end - pos);
        } else {
            resolved += renderValue(it->second);
        }
        pos = end;
    }
    return resolved;
}

void PreparedStatement::clearBindings() {
    params_.clear();
}

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

struct Transaction::Impl {
    std::shared_ptr<Manager> manager;
    std::function<void(Manager*)> returnConnection;
    bool active = true;
};

Transaction::Transaction(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

Transaction::~Transaction() {
    release();
}

Transaction::Transaction(Transaction&&) noexcept = default;

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        release();
        impl_ = std::move(other.impl_);
    }
    return *this;
}

void Transaction::release() noexcept {
    if (!impl_) {
        return;
    }
    if (impl_->active) {
        // Nothing to report to: the owner already abandoned the transaction.
        (void)impl_->manager->rollback_transaction();
        impl_->active = false;
    }
    if (impl_->returnConnection) {
        impl_->returnConnection(impl_->manager.get());
        impl_->returnConnection = nullptr;
    }
}

GameResult<void> Transaction::commit() {
    if (!isActive()) {
        return GameResult<void>::err(notActive());
    }
    auto result = impl_->manager->commit_transaction();
    impl_->active = false;
    if (!result.is_ok()) {
        return GameResult<void>::err(
            GameError(ErrorCode::TransactionFailed,
                      "commit failed: " + result.error().message));
    }
    return GameResult<void>::ok();
}

GameResult<void> Transaction::rollback() {
    if (!isActive()) {
        return GameResult<void>::err(notActive());
    }
    auto result = impl_->manager->rollback_transaction();
    impl_->active = false;
    if (!result.is_ok()) {
        return GameResult<void>::err(
            GameError(ErrorCode::TransactionFailed,
                      "rollback failed: " + result.error().message));
    }
    return GameResult<void>::ok();
}

GameResult<QueryResult> Transaction::query(std::string_view sql) {
    if (!isActive()) {
        return GameResult<QueryResult>::err(notActive());
    }
    auto result = impl_->manager->select_query_result(std::string(sql));
    if (!result.is_ok()) {
        return GameResult<QueryResult>::err(
            GameError(ErrorCode::QueryFailed, result.error().message));
    }
    return GameResult<QueryResult>::ok(convertResult(result.value()));
}

GameResult<void> Transaction::execute(std::string_view sql) {
    if (!isActive()) {
        return GameResult<void>::err(notActive());
    }
    auto result = impl_->manager->execute_query_result(std::string(sql));
    if (!result.is_ok()) {
        return GameResult<void>::err(
            GameError(ErrorCode::QueryFailed, result.error().message));
    }
    return GameResult<void>::ok();
}

GameResult<void> Transaction::execute(const PreparedStatement& stmt) {
    return execute(stmt.resolve());
}

bool Transaction::isActive() const noexcept {
    return impl_ && impl_->active;
}

// ---------------------------------------------------------------------------
// GameDatabase::Impl
// ---------------------------------------------------------------------------

struct GameDatabase::Impl {
    struct Pooled {
        std::shared_ptr<::database::database_context> context;
        std::shared_ptr<Manager> manager;
        bool inUse = false;
    };

    DatabaseConfig config;
    std::vector<Pooled> pool;
    mutable std::mutex poolMutex;
    std::condition_variable poolCv;
    std::atomic<bool> connected{false};

    Pooled open() const {
        Pooled conn;
        conn.context = std::make_shared<::database::database_context>();
        conn.manager = std::make_shared<Manager>(conn.context);
        if (!conn.manager->set_mode(toKcenon(config.dbType))) {
            conn.manager.reset();
            return conn;
        }
        auto result = conn.manager->connect_result(config.connectionString);
        if (!result.is_ok()) {
            GEC_LOG_ERROR(LogCategory::Persistence,
                          "database connect failed: " + result.error().message);
            conn.manager.reset();
        }
        return conn;
    }

    /// Borrow a connection, growing the pool up to maxConnections and
    /// otherwise waiting until connectionTimeout elapses.
    std::shared_ptr<Manager> checkout() {
        std::unique_lock lock(poolMutex);
        auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;
        while (true) {
            auto idle = std::find_if(pool.begin(), pool.end(),
                                     [](const Pooled& c) { return !c.inUse; });
            if (idle != pool.end()) {
                idle->inUse = true;
                return idle->manager;
            }
            if (pool.size() < config.maxConnections) {
                auto conn = open();
                if (conn.manager) {
                    conn.inUse = true;
                    pool.push_back(conn);
                    return conn.manager;
                }
            }
            if (poolCv.wait_until(lock, deadline) == std::cv_status::timeout) {
                return nullptr;
            }
        }
    }

    void checkin(Manager* mgr) {
        std::lock_guard lock(poolMutex);
        for (auto& conn : pool) {
            if (conn.manager.get() == mgr) {
                conn.inUse = false;
                poolCv.notify_one();
                return;
            }
        }
    }

    /// Run @p fn on a borrowed connection, mapping pool failures to errors.
    template <typename T, typename Fn>
    GameResult<T> withConnection(Fn&& fn) {
        if (!connected.load()) {
            return GameResult<T>::err(
                GameError(ErrorCode::NotConnected, "not connected to database"));
        }
        auto mgr = checkout();
        if (!mgr) {
            return GameResult<T>::err(
                GameError(ErrorCode::ConnectionPoolExhausted,
                          "no available connections in pool"));
        }
        auto result = fn(*mgr);
        checkin(mgr.get());
        return result;
    }
};

// ---------------------------------------------------------------------------
// GameDatabase
// ---------------------------------------------------------------------------

GameDatabase::GameDatabase()
    : impl_(std::make_unique<Impl>()) {}

GameDatabase::~GameDatabase() {
    if (impl_) {
        disconnect();
    }
}

GameDatabase::GameDatabase(GameDatabase&&) noexcept = default;

GameDatabase& GameDatabase::operator=(GameDatabase&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

GameResult<void> GameDatabase::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "already connected"));
    }
    if (config.minConnections == 0 || config.maxConnections < config.minConnections) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "invalid connection pool bounds"));
    }

    impl_->config = config;
    for (uint32_t i = 0; i < config.minConnections; ++i) {
        auto conn = impl_->open();
        if (!conn.manager) {
            disconnect();
            return GameResult<void>::err(
                GameError(ErrorCode::DatabaseError,
                          "failed to open connection " + std::to_string(i + 1) +
                              "/" + std::to_string(config.minConnections)));
        }
        std::lock_guard lock(impl_->poolMutex);
        impl_->pool.push_back(std::move(conn));
    }

    impl_->connected.store(true);
    GEC_LOG_INFO(LogCategory::Persistence,
                 "database pool ready with " + std::to_string(config.minConnections) +
                     " connection(s)");
    return GameResult<void>::ok();
}

void GameDatabase::disconnect() {
    impl_->connected.store(false);

    std::lock_guard lock(impl_->poolMutex);
    for (auto& conn : impl_->pool) {
        if (conn.manager) {
            (void)conn.manager->disconnect_result();
        }
    }
    impl_->pool.clear();
}

bool GameDatabase::isConnected() const noexcept {
    return impl_->connected.load();
}

GameResult<QueryResult> GameDatabase::query(std::string_view sql) {
    std::string text(sql);
    return impl_->withConnection<QueryResult>([&](Manager& mgr) {
        auto result = mgr.select_query_result(text);
        if (!result.is_ok()) {
            return GameResult<QueryResult>::err(
                GameError(ErrorCode::QueryFailed, result.error().message));
        }
        return GameResult<QueryResult>::ok(convertResult(result.value()));
    });
}

GameResult<QueryResult> GameDatabase::query(const PreparedStatement& stmt) {
    return query(stmt.resolve());
}

GameResult<void> GameDatabase::execute(std::string_view sql) {
    std::string text(sql);
    return impl_->withConnection<void>([&](Manager& mgr) {
        auto result = mgr.execute_query_result(text);
        if (!result.is_ok()) {
            return GameResult<void>::err(
                GameError(ErrorCode::QueryFailed, result.error().message));
        }
        return GameResult<void>::ok();
    });
}

GameResult<Transaction> GameDatabase::beginTransaction() {
    if (!impl_->connected.load()) {
        return GameResult<Transaction>::err(
            GameError(ErrorCode::NotConnected, "not connected to database"));
    }
    auto mgr = impl_->checkout();
    if (!mgr) {
        return GameResult<Transaction>::err(
            GameError(ErrorCode::ConnectionPoolExhausted,
                      "no available connections in pool"));
    }

    auto begun = mgr->begin_transaction();
    if (!begun.is_ok()) {
        impl_->checkin(mgr.get());
        return GameResult<Transaction>::err(
            GameError(ErrorCode::TransactionFailed,
                      "failed to begin transaction: " + begun.error().message));
    }

    auto txnImpl = std::make_unique<Transaction::Impl>();
    txnImpl->manager = mgr;
    auto* pool = impl_.get();
    txnImpl->returnConnection = [pool](Manager* m) { pool->checkin(m); };
    return GameResult<Transaction>::ok(Transaction(std::move(txnImpl)));
}

std::size_t GameDatabase::activeConnections() const noexcept {
    std::lock_guard lock(impl_->poolMutex);
    return static_cast<std::size_t>(std::count_if(
        impl_->pool.begin(), impl_->pool.end(),
        [](const Impl::Pooled& c) { return c.inUse; }));
}

std::size_t GameDatabase::poolSize() const noexcept {
    std::lock_guard lock(impl_->poolMutex);
    return impl_->pool.size();
}

} // namespace gec::foundation
