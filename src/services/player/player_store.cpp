/// @file player_store.cpp
/// @brief PlayerStore implementation: arena, staging and cascade deletion.

#include "gec/service/player_store.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;
using gec::foundation::LogContext;
using gec::foundation::LogLevel;
using gec::foundation::PlayerId;

namespace {

constexpr std::size_t kMaxDisplayNameLength = 64;

std::string nameKey(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

GameError playerNotFound(PlayerId id) {
    return GameError(ErrorCode::PlayerNotFound,
                     "player " + std::to_string(id.value()) + " not found");
}

std::size_t nonEmpty(const auto& slots) {
    return static_cast<std::size_t>(std::count_if(
        slots.begin(), slots.end(), [](const game::ItemStack& s) { return !s.IsEmpty(); }));
}

}  // namespace

std::size_t DeletionReport::total() const {
    return std::accumulate(rowsByTable.begin(), rowsByTable.end(), std::size_t{0},
                           [](std::size_t sum, const auto& kv) { return sum + kv.second; });
}

game::PlayerState* PlayerTxn::find(PlayerId id) {
    auto it = staged_.find(id);
    return it == staged_.end() ? nullptr : &it->second;
}

PlayerStore::PlayerStore(IPersistenceSink& sink, LockPolicy policy, foundation::Clock clock)
    : sink_(sink), policy_(policy), clock_(clock ? std::move(clock) : foundation::Clock(foundation::systemNow)) {}

// -- Lifecycle ----------------------------------------------------------------

GameResult<PlayerId> PlayerStore::createPlayer(NewPlayer request) {
    if (request.displayName.empty() || request.displayName.size() > kMaxDisplayNameLength) {
        return GameResult<PlayerId>::err(
            GameError(ErrorCode::InvalidArgument, "display name must be 1-64 characters"));
    }
    if (request.startingCoins < 0) {
        return GameResult<PlayerId>::err(
            GameError(ErrorCode::InvalidQuantity, "starting coins cannot be negative"));
    }

    std::unique_lock arenaLock(arenaMutex_);
    auto key = nameKey(request.displayName);
    if (byName_.count(key) > 0) {
        return GameResult<PlayerId>::err(
            GameError(ErrorCode::AlreadyExists,
                      "display name already taken: " + request.displayName));
    }

    auto now = clock_();
    auto entry = std::make_shared<Entry>();
    auto& state = entry->state;
    state.profile.id = PlayerId(nextId_.fetch_add(1));
    state.profile.displayName = std::move(request.displayName);
    state.profile.world = request.world;
    state.profile.gameMode = std::move(request.gameMode);
    state.profile.member = request.member;
    state.profile.coins = request.startingCoins;
    state.profile.createdAt = now;
    state.profile.lastLogin = now;

    ChangeSet changes;
    changes.players.push_back(state);
    auto mirrored = mirror(changes, "create_player");
    if (!mirrored) {
        return GameResult<PlayerId>::err(mirrored.error());
    }

    auto id = state.profile.id;
    arena_.emplace(id, entry);
    byName_.emplace(std::move(key), id);

    LogContext ctx;
    ctx.playerId = id;
    GEC_LOG_CTX(LogLevel::Info, LogCategory::Core, "player created", ctx);
    return GameResult<PlayerId>::ok(id);
}

GameResult<void> PlayerStore::setStatus(PlayerId id, game::AccountStatus status) {
    return runUnit({id}, "set_status", [&](PlayerTxn& txn) -> GameResult<void> {
        txn.at(id).profile.status = status;
        return GameResult<void>::ok();
    });
}

GameResult<void> PlayerStore::deactivatePlayer(PlayerId id) {
    return setStatus(id, game::AccountStatus::Inactive);
}

GameResult<void> PlayerStore::recordLogin(PlayerId id) {
    return runUnit({id}, "record_login", [&](PlayerTxn& txn) -> GameResult<void> {
        txn.at(id).profile.lastLogin = txn.now();
        return GameResult<void>::ok();
    });
}

GameResult<DeletionReport> PlayerStore::deletePlayer(PlayerId id, std::size_t ownedOrders,
                                                     std::function<void()> onCommit) {
    auto entry = lookup(id);
    if (!entry) {
        return GameResult<DeletionReport>::err(playerNotFound(id));
    }

    OrderedLocks locks(policy_);
    auto locked = locks.acquire(entry->mutex, "player " + std::to_string(id.value()));
    if (!locked) {
        return GameResult<DeletionReport>::err(locked.error());
    }
    if (entry->deleted) {
        return GameResult<DeletionReport>::err(playerNotFound(id));
    }

    // Child tables first, profile last.
    const auto& state = entry->state;
    DeletionReport report;
    report.player = id;
    report.rowsByTable["orders"] = ownedOrders;
    report.rowsByTable["battle_ratings"] = state.ratings.size();
    report.rowsByTable["achievements"] = state.achievements.size();
    report.rowsByTable["collection_log"] = state.collectionLog.size();
    report.rowsByTable["quest_completions"] = state.completedQuests.size();
    report.rowsByTable["equipment"] = nonEmpty(state.equipment);
    report.rowsByTable["bank"] = state.bank.size();
    report.rowsByTable["inventory"] = nonEmpty(state.inventory);
    report.rowsByTable["skills"] = game::kSkillCount;
    report.rowsByTable["players"] = 1;

    ChangeSet changes;
    changes.deletedPlayers.push_back(id);
    auto mirrored = mirror(changes, "delete_player");
    if (!mirrored) {
        return GameResult<DeletionReport>::err(mirrored.error());
    }

    if (onCommit) {
        onCommit();
    }
    entry->deleted = true;
    {
        std::unique_lock arenaLock(arenaMutex_);
        byName_.erase(nameKey(state.profile.displayName));
        arena_.erase(id);
    }

    LogContext ctx;
    ctx.playerId = id;
    ctx.extra["rows"] = std::to_string(report.total());
    GEC_LOG_CTX(LogLevel::Info, LogCategory::Core, "player deleted", ctx);
    return GameResult<DeletionReport>::ok(std::move(report));
}

GameResult<void> PlayerStore::restore(std::vector<game::PlayerState> players) {
    std::unique_lock arenaLock(arenaMutex_);
    if (!arena_.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidStateTransition, "players can only be restored once"));
    }

    std::unordered_map<PlayerId, EntryPtr> arena;
    std::unordered_map<std::string, PlayerId> byName;
    uint64_t highest = 0;
    for (auto& state : players) {
        const auto id = state.profile.id;
        if (!id.isValid() || arena.count(id) > 0 ||
            !byName.emplace(nameKey(state.profile.displayName), id).second) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvariantViolation,
                          "restored player " + std::to_string(id.value()) +
                              " has a duplicate id or display name"));
        }
        highest = std::max(highest, id.value());
        auto entry = std::make_shared<Entry>();
        entry->state = std::move(state);
        arena.emplace(id, std::move(entry));
    }

    arena_ = std::move(arena);
    byName_ = std::move(byName);
    nextId_ = std::max<uint64_t>(nextId_.load(), highest + 1);

    GEC_LOG_INFO(LogCategory::Core, "restored " + std::to_string(arena_.size()) + " players");
    return GameResult<void>::ok();
}

// -- Reads --------------------------------------------------------------------

GameResult<game::PlayerState> PlayerStore::snapshot(PlayerId id) const {
    auto entry = lookup(id);
    if (!entry) {
        return GameResult<game::PlayerState>::err(playerNotFound(id));
    }
    OrderedLocks locks(policy_);
    auto locked = locks.acquire(entry->mutex, "player " + std::to_string(id.value()));
    if (!locked) {
        return GameResult<game::PlayerState>::err(locked.error());
    }
    if (entry->deleted) {
        return GameResult<game::PlayerState>::err(playerNotFound(id));
    }
    return GameResult<game::PlayerState>::ok(entry->state);
}

std::optional<PlayerId> PlayerStore::findByName(std::string_view name) const {
    std::shared_lock lock(arenaMutex_);
    auto it = byName_.find(nameKey(name));
    if (it == byName_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PlayerStore::exists(PlayerId id) const {
    return lookup(id) != nullptr;
}

std::vector<PlayerId> PlayerStore::playerIds() const {
    std::vector<PlayerId> ids;
    {
        std::shared_lock lock(arenaMutex_);
        ids.reserve(arena_.size());
        for (const auto& [id, entry] : arena_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t PlayerStore::playerCount() const {
    std::shared_lock lock(arenaMutex_);
    return arena_.size();
}

// -- Units of work ------------------------------------------------------------

GameResult<void> PlayerStore::runUnit(std::vector<PlayerId> ids, std::string_view operation,
                                      const Body& body) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    if (ids.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "unit of work names no players"));
    }

    std::vector<EntryPtr> entries;
    entries.reserve(ids.size());
    for (auto id : ids) {
        auto entry = lookup(id);
        if (!entry) {
            return GameResult<void>::err(playerNotFound(id));
        }
        entries.push_back(std::move(entry));
    }

    // Ascending player id; ids is sorted.
    OrderedLocks locks(policy_);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto locked = locks.acquire(entries[i]->mutex,
                                    "player " + std::to_string(ids[i].value()));
        if (!locked) {
            return locked;
        }
        if (entries[i]->deleted) {
            return GameResult<void>::err(playerNotFound(ids[i]));
        }
    }

    PlayerTxn txn;
    txn.ids_ = ids;
    txn.now_ = clock_();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        txn.staged_.emplace(ids[i], entries[i]->state);
    }

    auto outcome = body(txn);
    if (!outcome) {
        return outcome;
    }

    ChangeSet& changes = txn.changes_;
    for (const auto& [id, state] : txn.staged_) {
        changes.players.push_back(state);
    }
    auto mirrored = mirror(changes, operation);
    if (!mirrored) {
        return mirrored;
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
        entries[i]->state = std::move(txn.staged_.at(ids[i]));
    }
    for (auto& hook : txn.commitHooks_) {
        hook();
    }
    return GameResult<void>::ok();
}

GameResult<void> PlayerStore::persistDetached(ChangeSet changes) {
    auto operation = changes.operation;
    return mirror(changes, operation);
}

GameResult<void> PlayerStore::mirror(ChangeSet& changes, std::string_view operation) {
    changes.operation = std::string(operation);
    auto applied = sink_.apply(changes);
    if (!applied) {
        GEC_LOG_ERROR(LogCategory::Persistence,
                      "persistence sink rejected " + changes.operation + ": " +
                          std::string(applied.error().message()));
        return GameResult<void>::err(
            GameError(ErrorCode::TransactionFailed,
                      changes.operation + " aborted: " + std::string(applied.error().message())));
    }
    return GameResult<void>::ok();
}

PlayerStore::EntryPtr PlayerStore::lookup(PlayerId id) const {
    std::shared_lock lock(arenaMutex_);
    auto it = arena_.find(id);
    return it == arena_.end() ? nullptr : it->second;
}

}  // namespace gec::service
