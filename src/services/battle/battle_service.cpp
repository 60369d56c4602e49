/// @file battle_service.cpp
/// @brief BattleService implementation.

#include "gec/service/battle_service.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::BattleId;
using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::LogCategory;
using gec::foundation::LogContext;
using gec::foundation::LogLevel;
using gec::foundation::PlayerId;
using gec::foundation::Timestamp;
using gec::game::BattleRating;
using gec::game::BattleRecord;
using gec::game::RatingCalculator;

namespace {

GameResult<void> checkParticipant(const game::ParticipantOutcome& outcome) {
    if (outcome.damageDealt < 0 || outcome.damageTaken < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "damage counters cannot be negative"));
    }
    for (const auto& [move, uses] : outcome.moveUsage) {
        if (move.empty() || uses < 0) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidArgument, "move usage needs a name and a count >= 0"));
        }
    }
    if (outcome.reward.coins < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidQuantity, "reward coins cannot be negative"));
    }
    for (const auto& stack : outcome.reward.items) {
        if (stack.quantity <= 0) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidQuantity, "reward item quantity must be positive"));
        }
    }
    return GameResult<void>::ok();
}

}  // namespace

BattleService::BattleService(PlayerStore& players, const Catalog& catalog,
                             const InventoryLedger& ledger, game::RatingParams params)
    : players_(players), catalog_(catalog), ledger_(ledger), params_(params) {}

GameResult<void> BattleService::validate(const BattleRequest& request) const {
    if (request.battleKey.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "battle key must not be empty"));
    }
    if (!request.playerA.isValid() || !request.playerB.isValid() ||
        request.playerA == request.playerB) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidParticipants, "a battle needs two distinct players"));
    }
    if (request.winner && *request.winner != request.playerA &&
        *request.winner != request.playerB) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidParticipants, "winner did not take part in the battle"));
    }
    if (request.outcome.durationSeconds < 0 || request.outcome.turns < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "duration and turns cannot be negative"));
    }
    for (const auto* side : {&request.outcome.first, &request.outcome.second}) {
        auto checked = checkParticipant(*side);
        if (!checked) {
            return checked;
        }
        for (const auto& stack : side->reward.items) {
            if (catalog_.findItem(stack.item) == nullptr) {
                return GameResult<void>::err(
                    GameError(ErrorCode::ItemNotFound,
                              "unknown reward item " + std::to_string(stack.item.value())));
            }
        }
    }
    return GameResult<void>::ok();
}

GameResult<BattleRecord> BattleService::recordBattle(const BattleRequest& request) {
    auto valid = validate(request);
    if (!valid) {
        return GameResult<BattleRecord>::err(valid.error());
    }
    if (auto stored = claimKey(request.battleKey)) {
        const bool samePair =
            (stored->playerA == request.playerA && stored->playerB == request.playerB) ||
            (stored->playerA == request.playerB && stored->playerB == request.playerA);
        if (!samePair) {
            return GameResult<BattleRecord>::err(
                GameError(ErrorCode::AlreadyExists,
                          "battle key " + request.battleKey + " belongs to another pair"));
        }
        return GameResult<BattleRecord>::ok(std::move(*stored));
    }

    // The key is reserved until this scope ends, committed or not.
    struct Reservation {
        BattleService& service;
        const std::string& key;
        ~Reservation() { service.releaseKey(key); }
    } reservation{*this, request.battleKey};

    auto result = players_.transact<BattleRecord>(
        {request.playerA, request.playerB}, "record_battle",
        [&](PlayerTxn& txn) -> GameResult<BattleRecord> {
            auto& stateA = txn.at(request.playerA);
            auto& stateB = txn.at(request.playerB);
            for (const auto* state : {&stateA, &stateB}) {
                if (state->profile.status != game::AccountStatus::Active) {
                    return GameResult<BattleRecord>::err(
                        GameError(ErrorCode::PlayerInactive,
                                  state->profile.displayName + " cannot battle while " +
                                      std::string(game::accountStatusName(state->profile.status))));
                }
            }

            BattleRecord record;
            record.id = BattleId(nextBattleId_.fetch_add(1));
            record.battleKey = request.battleKey;
            record.category = request.category;
            record.playerA = request.playerA;
            record.playerB = request.playerB;
            record.winner = request.winner;
            record.outcome = request.outcome;
            record.recordedAt = txn.now();

            auto& ratingA = stageRating(stateA, request.category, txn.now());
            auto& ratingB = stageRating(stateB, request.category, txn.now());

            // Both sides use the pre-battle ratings.
            const int32_t beforeA = ratingA.rating;
            const int32_t beforeB = ratingB.rating;
            const auto resultA = record.ResultFor(request.playerA);
            const auto resultB = record.ResultFor(request.playerB);

            ratingA.rating = RatingCalculator::newRating(
                beforeA, game::actualScore(resultA), RatingCalculator::expectedScore(beforeA, beforeB),
                RatingCalculator::kFactor(ratingA.uncertainty, params_));
            ratingB.rating = RatingCalculator::newRating(
                beforeB, game::actualScore(resultB), RatingCalculator::expectedScore(beforeB, beforeA),
                RatingCalculator::kFactor(ratingB.uncertainty, params_));
            ratingA.uncertainty = RatingCalculator::shrinkUncertainty(ratingA.uncertainty, params_);
            ratingB.uncertainty = RatingCalculator::shrinkUncertainty(ratingB.uncertainty, params_);
            ratingA.ApplyOutcome(resultA, request.outcome.first, txn.now());
            ratingB.ApplyOutcome(resultB, request.outcome.second, txn.now());

            auto rewarded = stageReward(stateA, request.outcome.first.reward, txn.now());
            if (!rewarded) {
                return GameResult<BattleRecord>::err(rewarded.error());
            }
            rewarded = stageReward(stateB, request.outcome.second.reward, txn.now());
            if (!rewarded) {
                return GameResult<BattleRecord>::err(rewarded.error());
            }

            battleRecorded_.emit(stateA, BattleRecorded{record.id, record.category, request.playerA,
                                                        request.playerB, resultA, txn.now()});
            battleRecorded_.emit(stateB, BattleRecorded{record.id, record.category, request.playerB,
                                                        request.playerA, resultB, txn.now()});

            txn.changes().battles.push_back(record);
            txn.onCommit([this, record]() {
                std::unique_lock lock(recordsMutex_);
                byKey_.emplace(record.battleKey, record.id);
                records_.emplace(record.id, record);
            });
            return GameResult<BattleRecord>::ok(std::move(record));
        });

    if (result) {
        const auto& record = result.value();
        LogContext ctx;
        ctx.playerId = record.winner.value_or(record.playerA);
        ctx.extra["battle"] = std::to_string(record.id.value());
        ctx.extra["category"] = std::string(game::battleCategoryName(record.category));
        ctx.extra["draw"] = record.IsDraw() ? "true" : "false";
        GEC_LOG_CTX(LogLevel::Debug, LogCategory::Battle, "battle recorded", ctx);
    }
    return result;
}

BattleRating& BattleService::stageRating(game::PlayerState& state, game::BattleCategory category,
                                         Timestamp at) const {
    auto it = state.ratings.find(category);
    if (it == state.ratings.end()) {
        BattleRating fresh;
        fresh.rating = params_.initialRating;
        fresh.uncertainty = params_.initialUncertainty;
        fresh.decayAnchor = at;
        it = state.ratings.emplace(category, std::move(fresh)).first;
    }
    return it->second;
}

GameResult<void> BattleService::stageReward(game::PlayerState& state,
                                            const game::BattleReward& reward, Timestamp at) const {
    if (reward.coins > 0) {
        auto paid = InventoryLedger::stageCoinCredit(state, reward.coins);
        if (!paid) {
            return paid;
        }
    }
    for (const auto& stack : reward.items) {
        auto banked = ledger_.stageBankCredit(state, stack.item, stack.quantity);
        if (!banked) {
            return banked;
        }
        InventoryLedger::stageCollection(state, stack.item, at);
    }
    return GameResult<void>::ok();
}

GameResult<void> BattleService::restore(const std::vector<BattleRecord>& records) {
    std::unique_lock lock(recordsMutex_);
    if (!records_.empty()) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidStateTransition,
                                               "battles can only be restored once"));
    }
    uint64_t highest = 0;
    for (const auto& record : records) {
        if (!byKey_.emplace(record.battleKey, record.id).second) {
            records_.clear();
            byKey_.clear();
            return GameResult<void>::err(
                GameError(ErrorCode::InvariantViolation,
                          "battle key " + record.battleKey + " restored twice"));
        }
        records_.emplace(record.id, record);
        highest = std::max(highest, record.id.value());
    }
    nextBattleId_ = std::max<uint64_t>(nextBattleId_.load(), highest + 1);

    GEC_LOG_INFO(LogCategory::Battle, "restored " + std::to_string(records_.size()) + " battles");
    return GameResult<void>::ok();
}

GameResult<BattleRecord> BattleService::getBattle(BattleId id) const {
    std::shared_lock lock(recordsMutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return GameResult<BattleRecord>::err(
            GameError(ErrorCode::BattleNotFound, "battle " + std::to_string(id.value()) + " not found"));
    }
    return GameResult<BattleRecord>::ok(it->second);
}

std::optional<BattleRecord> BattleService::claimKey(const std::string& key) {
    std::unique_lock lock(recordsMutex_);
    keyReleased_.wait(lock, [&] { return pendingKeys_.count(key) == 0; });
    if (auto it = byKey_.find(key); it != byKey_.end()) {
        return records_.at(it->second);
    }
    pendingKeys_.insert(key);
    return std::nullopt;
}

void BattleService::releaseKey(const std::string& key) {
    {
        std::unique_lock lock(recordsMutex_);
        pendingKeys_.erase(key);
    }
    keyReleased_.notify_all();
}

std::optional<BattleRecord> BattleService::findByKey(const std::string& battleKey) const {
    std::shared_lock lock(recordsMutex_);
    auto key = byKey_.find(battleKey);
    if (key == byKey_.end()) {
        return std::nullopt;
    }
    return records_.at(key->second);
}

// -- Inactivity decay ---------------------------------------------------------

int64_t BattleService::duePeriods(const BattleRating& rating, Timestamp now) const {
    if (now <= rating.decayAnchor || params_.decayPeriod.count() <= 0) {
        return 0;
    }
    return (now - rating.decayAnchor) / params_.decayPeriod;
}

GameResult<DecayReport> BattleService::applyInactivityDecay(Timestamp now) {
    DecayReport report;
    for (auto id : players_.playerIds()) {
        ++report.playersScanned;

        auto current = players_.snapshot(id);
        if (!current) {
            if (current.error().code() == ErrorCode::PlayerNotFound) {
                continue;
            }
            return GameResult<DecayReport>::err(current.error());
        }
        bool due = false;
        for (const auto& [category, rating] : current.value().ratings) {
            due = due || duePeriods(rating, now) > 0;
        }
        if (!due) {
            continue;
        }

        // Recomputed under the lock: a battle may have reset an anchor.
        auto decayed = players_.transact<std::size_t>(
            {id}, "inactivity_decay", [&](PlayerTxn& txn) -> GameResult<std::size_t> {
                std::size_t count = 0;
                for (auto& [category, rating] : txn.at(id).ratings) {
                    auto periods = duePeriods(rating, now);
                    if (periods <= 0) {
                        continue;
                    }
                    rating.uncertainty =
                        RatingCalculator::decayUncertainty(rating.uncertainty, periods, params_);
                    rating.decayAnchor += params_.decayPeriod * periods;
                    ++count;
                }
                return GameResult<std::size_t>::ok(count);
            });
        if (!decayed) {
            if (decayed.error().code() == ErrorCode::PlayerNotFound) {
                continue;
            }
            return GameResult<DecayReport>::err(decayed.error());
        }
        report.ratingsDecayed += decayed.value();
    }

    GEC_LOG_INFO(LogCategory::Battle,
                 "inactivity decay applied to " + std::to_string(report.ratingsDecayed) +
                     " ratings across " + std::to_string(report.playersScanned) + " players");
    return GameResult<DecayReport>::ok(report);
}

}  // namespace gec::service
