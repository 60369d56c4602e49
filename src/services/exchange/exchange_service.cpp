/// @file exchange_service.cpp
/// @brief ExchangeService implementation: escrow, matching and settlement.

#include "gec/service/exchange_service.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <set>
#include <string>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::ItemId;
using gec::foundation::LogCategory;
using gec::foundation::LogContext;
using gec::foundation::LogLevel;
using gec::foundation::OrderId;
using gec::foundation::PlayerId;
using gec::foundation::Timestamp;
using gec::foundation::TradeId;
using gec::game::Order;
using gec::game::OrderSide;
using gec::game::OrderStatus;
using gec::game::Trade;

namespace {

std::string itemLabel(ItemId item) {
    return "item " + std::to_string(item.value());
}

GameError orderNotFound(OrderId id) {
    return GameError(ErrorCode::OrderNotFound, "order " + std::to_string(id.value()) + " not found");
}

/// Apply @p quantity to @p order, completing it when fully filled.
GameResult<void> fillOrder(Order& order, int64_t quantity, Timestamp at) {
    if (quantity <= 0 || quantity > order.Remaining()) {
        return GameResult<void>::err(
            GameError(ErrorCode::OverFill,
                      "fill of " + std::to_string(quantity) + " exceeds remaining " +
                          std::to_string(order.Remaining()) + " of order " +
                          std::to_string(order.id.value())));
    }
    order.filled += quantity;
    if (order.filled == order.quantity) {
        order.status = OrderStatus::Completed;
        order.completedAt = at;
    }
    return GameResult<void>::ok();
}

/// Bank @p quantity of the order's item for @p owner. A bank that cannot
/// take it leaves the quantity in the order's collection box instead.
GameResult<void> deliverItems(const InventoryLedger& ledger, game::PlayerState& owner,
                              Order& order, int64_t quantity) {
    auto banked = ledger.stageBankCredit(owner, order.item, quantity);
    if (banked) {
        return banked;
    }
    const auto code = banked.error().code();
    if (code != ErrorCode::BankFull && code != ErrorCode::StackOverflow) {
        return banked;
    }
    order.collectItems += quantity;
    return GameResult<void>::ok();
}

/// Pay @p amount to @p owner, or into the order's collection box when the
/// balance would overflow.
GameResult<void> deliverCoins(game::PlayerState& owner, Order& order, int64_t amount) {
    if (amount == 0) {
        return GameResult<void>::ok();
    }
    auto paid = InventoryLedger::stageCoinCredit(owner, amount);
    if (paid || paid.error().code() != ErrorCode::StackOverflow) {
        return paid;
    }
    if (amount > std::numeric_limits<int64_t>::max() - order.collectCoins) {
        return paid;
    }
    order.collectCoins += amount;
    return GameResult<void>::ok();
}

std::optional<double> meanPrice(const std::vector<game::PricePoint>& history, Timestamp from,
                                Timestamp to) {
    double notional = 0.0;
    int64_t volume = 0;
    for (const auto& point : history) {
        if (point.at > from && point.at <= to) {
            notional += static_cast<double>(point.price) * static_cast<double>(point.quantity);
            volume += point.quantity;
        }
    }
    if (volume == 0) {
        return std::nullopt;
    }
    return notional / static_cast<double>(volume);
}

}  // namespace

ExchangeService::ExchangeService(PlayerStore& players, const Catalog& catalog,
                                 const InventoryLedger& ledger, ExchangeConfig config)
    : players_(players), catalog_(catalog), ledger_(ledger), config_(config) {}

// -- Writes -------------------------------------------------------------------

GameResult<OrderResult> ExchangeService::submitOrder(PlayerId player, ItemId item, OrderSide side,
                                                     int64_t quantity, int64_t price) {
    if (quantity <= 0) {
        return GameResult<OrderResult>::err(
            GameError(ErrorCode::InvalidQuantity, "order quantity must be positive"));
    }
    if (price <= 0) {
        return GameResult<OrderResult>::err(
            GameError(ErrorCode::InvalidPrice, "order price must be positive"));
    }
    if (quantity > std::numeric_limits<int64_t>::max() / price) {
        return GameResult<OrderResult>::err(
            GameError(ErrorCode::InvalidPrice, "order value overflows the coin balance"));
    }
    auto definition = tradeableItem(item);
    if (!definition) {
        return GameResult<OrderResult>::err(definition.error());
    }
    const auto& itemDef = *definition.value();

    auto& mkt = market(item);
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(mkt.mutex, itemLabel(item));
    if (!locked) {
        return GameResult<OrderResult>::err(locked.error());
    }

    auto fills = mkt.book.planMatch(side, price, quantity);
    std::vector<PlayerId> involved{player};
    std::vector<Order> resting;
    resting.reserve(fills.size());
    for (const auto& fill : fills) {
        auto restingOrder = orderCopy(fill.restingId);
        if (!restingOrder) {
            return GameResult<OrderResult>::err(
                GameError(ErrorCode::InvariantViolation,
                          "resting order " + std::to_string(fill.restingId.value()) +
                              " has no record"));
        }
        involved.push_back(fill.restingOwner);
        resting.push_back(std::move(*restingOrder));
    }

    auto result = players_.transact<OrderResult>(
        involved, "submit_order", [&](PlayerTxn& txn) -> GameResult<OrderResult> {
            auto& owner = txn.at(player);
            if (owner.profile.status != game::AccountStatus::Active) {
                return GameResult<OrderResult>::err(
                    GameError(ErrorCode::PlayerInactive,
                              owner.profile.displayName + " cannot trade while " +
                                  std::string(game::accountStatusName(owner.profile.status))));
            }

            // Escrow.
            if (side == OrderSide::Buy) {
                auto limited = stageBuyLimit(owner, itemDef, quantity, txn.now());
                if (!limited) {
                    return GameResult<OrderResult>::err(limited.error());
                }
                auto escrowed = InventoryLedger::stageCoinDebit(owner, quantity * price);
                if (!escrowed) {
                    return GameResult<OrderResult>::err(escrowed.error());
                }
            } else {
                auto escrowed = ledger_.stageHeldDebit(owner, item, quantity);
                if (!escrowed) {
                    return GameResult<OrderResult>::err(escrowed.error());
                }
            }

            OrderResult out;
            auto& incoming = out.order;
            incoming.id = OrderId(nextOrderId_.fetch_add(1));
            incoming.player = player;
            incoming.item = item;
            incoming.side = side;
            incoming.quantity = quantity;
            incoming.price = price;
            incoming.createdAt = txn.now();
            incoming.sequence = nextSequence_.fetch_add(1);

            // Settlement, one trade per planned fill.
            for (std::size_t i = 0; i < fills.size(); ++i) {
                const auto& fill = fills[i];
                auto& counter = resting[i];

                auto filled = fillOrder(incoming, fill.quantity, txn.now());
                if (!filled) {
                    return GameResult<OrderResult>::err(filled.error());
                }
                filled = fillOrder(counter, fill.quantity, txn.now());
                if (!filled) {
                    return GameResult<OrderResult>::err(filled.error());
                }

                Trade trade;
                trade.id = TradeId(nextTradeId_.fetch_add(1));
                trade.item = item;
                trade.buyOrder = side == OrderSide::Buy ? incoming.id : counter.id;
                trade.sellOrder = side == OrderSide::Buy ? counter.id : incoming.id;
                trade.buyer = side == OrderSide::Buy ? player : counter.player;
                trade.seller = side == OrderSide::Buy ? counter.player : player;
                trade.quantity = fill.quantity;
                trade.price = fill.price;
                trade.executedAt = txn.now();

                // Proceeds never fail the match: what the bank or purse
                // cannot take waits in the receiving order's collection box.
                auto& buyer = txn.at(trade.buyer);
                auto& seller = txn.at(trade.seller);
                auto& buyOrder = side == OrderSide::Buy ? incoming : counter;
                auto& sellOrder = side == OrderSide::Buy ? counter : incoming;
                auto delivered = deliverItems(ledger_, buyer, buyOrder, trade.quantity);
                if (!delivered) {
                    return GameResult<OrderResult>::err(delivered.error());
                }
                auto paid = deliverCoins(seller, sellOrder, trade.quantity * trade.price);
                if (!paid) {
                    return GameResult<OrderResult>::err(paid.error());
                }
                // An incoming buy escrowed its own limit; refund the difference.
                if (side == OrderSide::Buy && trade.price < price) {
                    auto refunded =
                        deliverCoins(buyer, incoming, trade.quantity * (price - trade.price));
                    if (!refunded) {
                        return GameResult<OrderResult>::err(refunded.error());
                    }
                }
                out.trades.push_back(trade);
            }

            txn.changes().orders.push_back(incoming);
            for (const auto& counter : resting) {
                txn.changes().orders.push_back(counter);
            }
            for (const auto& trade : out.trades) {
                txn.changes().trades.push_back(trade);
            }

            txn.onCommit([this, &mkt, &fills, &resting, side, incoming, trades = out.trades]() {
                if (!mkt.book.applyFills(side, fills)) {
                    GEC_LOG_ERROR(LogCategory::Exchange,
                                  "order book rejected planned fills for " + itemLabel(incoming.item));
                }
                if (incoming.IsActive()) {
                    mkt.book.add(side, game::RestingOrder{incoming.id, incoming.player,
                                                          incoming.price, incoming.Remaining(),
                                                          incoming.sequence});
                }
                {
                    std::unique_lock lock(ordersMutex_);
                    orders_[incoming.id] = incoming;
                    for (const auto& counter : resting) {
                        orders_[counter.id] = counter;
                    }
                }
                for (const auto& trade : trades) {
                    mkt.trades.push_back(trade);
                    mkt.history.push_back(
                        game::PricePoint{trade.executedAt, trade.price, trade.quantity});
                }
            });
            return GameResult<OrderResult>::ok(std::move(out));
        });

    if (result) {
        const auto& order = result.value().order;
        LogContext ctx;
        ctx.playerId = player;
        ctx.itemId = item;
        ctx.orderId = order.id;
        ctx.extra["side"] = std::string(game::orderSideName(side));
        ctx.extra["filled"] = std::to_string(order.filled);
        ctx.extra["trades"] = std::to_string(result.value().trades.size());
        GEC_LOG_CTX(LogLevel::Debug, LogCategory::Exchange, "order submitted", ctx);
    }
    return result;
}

GameResult<Order> ExchangeService::cancelOrder(PlayerId player, OrderId id) {
    auto known = orderCopy(id);
    if (!known) {
        return GameResult<Order>::err(orderNotFound(id));
    }
    auto& mkt = market(known->item);
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(mkt.mutex, itemLabel(known->item));
    if (!locked) {
        return GameResult<Order>::err(locked.error());
    }

    // Re-read under the item lock; a match may have completed it meanwhile.
    auto current = orderCopy(id);
    if (!current) {
        return GameResult<Order>::err(orderNotFound(id));
    }
    if (current->player != player) {
        return GameResult<Order>::err(
            GameError(ErrorCode::PermissionDenied, "only the owner may cancel an order"));
    }
    if (!current->IsActive()) {
        return GameResult<Order>::err(
            GameError(ErrorCode::OrderNotCancellable,
                      "order " + std::to_string(id.value()) + " is " +
                          std::string(game::orderStatusName(current->status))));
    }

    auto result = players_.transact<Order>(
        {player}, "cancel_order", [&](PlayerTxn& txn) -> GameResult<Order> {
            auto& owner = txn.at(player);
            Order order = *current;
            const int64_t remainder = order.Remaining();
            auto released = order.side == OrderSide::Buy
                                ? deliverCoins(owner, order, remainder * order.price)
                                : deliverItems(ledger_, owner, order, remainder);
            if (!released) {
                return GameResult<Order>::err(released.error());
            }
            order.status = OrderStatus::Cancelled;
            order.completedAt = txn.now();
            txn.changes().orders.push_back(order);

            txn.onCommit([this, &mkt, order]() {
                mkt.book.remove(order.id);
                std::unique_lock lock(ordersMutex_);
                orders_[order.id] = order;
            });
            return GameResult<Order>::ok(order);
        });

    if (result) {
        LogContext ctx;
        ctx.playerId = player;
        ctx.itemId = current->item;
        ctx.orderId = id;
        ctx.extra["released"] = std::to_string(current->Remaining());
        GEC_LOG_CTX(LogLevel::Debug, LogCategory::Exchange, "order cancelled", ctx);
    }
    return result;
}

GameResult<Order> ExchangeService::collectOrder(PlayerId player, OrderId id) {
    auto known = orderCopy(id);
    if (!known) {
        return GameResult<Order>::err(orderNotFound(id));
    }
    auto& mkt = market(known->item);
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(mkt.mutex, itemLabel(known->item));
    if (!locked) {
        return GameResult<Order>::err(locked.error());
    }

    auto current = orderCopy(id);
    if (!current) {
        return GameResult<Order>::err(orderNotFound(id));
    }
    if (current->player != player) {
        return GameResult<Order>::err(
            GameError(ErrorCode::PermissionDenied, "only the owner may collect an order"));
    }
    if (!current->HasUncollected()) {
        return GameResult<Order>::ok(std::move(*current));
    }

    auto result = players_.transact<Order>(
        {player}, "collect_order", [&](PlayerTxn& txn) -> GameResult<Order> {
            auto& owner = txn.at(player);
            Order order = *current;
            if (order.collectCoins > 0) {
                auto paid = InventoryLedger::stageCoinCredit(owner, order.collectCoins);
                if (!paid) {
                    return GameResult<Order>::err(paid.error());
                }
                order.collectCoins = 0;
            }
            if (order.collectItems > 0) {
                auto banked = ledger_.stageBankCredit(owner, order.item, order.collectItems);
                if (!banked) {
                    return GameResult<Order>::err(banked.error());
                }
                order.collectItems = 0;
            }
            txn.changes().orders.push_back(order);
            txn.onCommit([this, order]() {
                std::unique_lock lock(ordersMutex_);
                orders_[order.id] = order;
            });
            return GameResult<Order>::ok(order);
        });

    if (result) {
        LogContext ctx;
        ctx.playerId = player;
        ctx.itemId = current->item;
        ctx.orderId = id;
        ctx.extra["items"] = std::to_string(current->collectItems);
        ctx.extra["coins"] = std::to_string(current->collectCoins);
        GEC_LOG_CTX(LogLevel::Debug, LogCategory::Exchange, "order collected", ctx);
    }
    return result;
}

GameResult<void> ExchangeService::restore(const std::vector<Order>& orders,
                                          const std::vector<Trade>& trades) {
    {
        std::shared_lock lock(ordersMutex_);
        if (!orders_.empty()) {
            return GameResult<void>::err(GameError(ErrorCode::InvalidStateTransition,
                                                   "orders can only be restored once"));
        }
    }

    uint64_t highestOrder = 0;
    uint64_t highestSequence = 0;
    for (const auto& order : orders) {
        if (order.filled < 0 || order.filled > order.quantity ||
            (order.IsActive() && order.Remaining() == 0)) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvariantViolation,
                          "restored order " + std::to_string(order.id.value()) +
                              " has an inconsistent fill"));
        }
        highestOrder = std::max(highestOrder, order.id.value());
        highestSequence = std::max(highestSequence, order.sequence);
    }

    for (const auto& order : orders) {
        if (order.IsActive()) {
            auto& mkt = market(order.item);
            std::lock_guard lock(mkt.mutex);
            mkt.book.add(order.side, game::RestingOrder{order.id, order.player, order.price,
                                                        order.Remaining(), order.sequence});
        }
    }
    {
        std::unique_lock lock(ordersMutex_);
        for (const auto& order : orders) {
            orders_[order.id] = order;
        }
    }

    // Trades replay oldest first so price history stays time-ordered.
    std::vector<Trade> ordered(trades);
    std::sort(ordered.begin(), ordered.end(),
              [](const Trade& a, const Trade& b) { return a.id < b.id; });
    uint64_t highestTrade = 0;
    for (const auto& trade : ordered) {
        auto& mkt = market(trade.item);
        std::lock_guard lock(mkt.mutex);
        mkt.trades.push_back(trade);
        mkt.history.push_back(game::PricePoint{trade.executedAt, trade.price, trade.quantity});
        highestTrade = std::max(highestTrade, trade.id.value());
        // Orders of deleted players are gone but their ids stay taken.
        highestOrder = std::max({highestOrder, trade.buyOrder.value(), trade.sellOrder.value()});
    }

    nextOrderId_ = std::max<uint64_t>(nextOrderId_.load(), highestOrder + 1);
    nextTradeId_ = std::max<uint64_t>(nextTradeId_.load(), highestTrade + 1);
    nextSequence_ = std::max<uint64_t>(nextSequence_.load(), highestSequence + 1);

    GEC_LOG_INFO(LogCategory::Exchange,
                 "restored " + std::to_string(orders.size()) + " orders and " +
                     std::to_string(ordered.size()) + " trades");
    return GameResult<void>::ok();
}

GameResult<DeletionReport> ExchangeService::deletePlayer(PlayerId player) {
    const auto& policy = players_.lockPolicy();
    for (uint32_t attempt = 0; attempt < policy.maxAttempts; ++attempt) {
        std::set<ItemId> items;
        for (const auto& order : ordersForPlayer(player, true)) {
            items.insert(order.item);
        }

        // Ascending item id, then the player lock inside deletePlayer().
        OrderedLocks locks(policy);
        bool lockedAll = true;
        for (auto item : items) {
            auto locked = locks.acquire(market(item).mutex, itemLabel(item));
            if (!locked) {
                return GameResult<DeletionReport>::err(locked.error());
            }
        }

        // An order for a new item may have arrived before the locks were held.
        auto owned = ordersForPlayer(player, false);
        for (const auto& order : owned) {
            if (order.IsActive() && items.count(order.item) == 0) {
                lockedAll = false;
                break;
            }
        }
        if (!lockedAll) {
            continue;
        }

        auto removeOrders = [this, &owned]() {
            for (const auto& order : owned) {
                if (order.IsActive()) {
                    market(order.item).book.remove(order.id);
                }
            }
            std::unique_lock lock(ordersMutex_);
            for (const auto& order : owned) {
                orders_.erase(order.id);
            }
        };
        return players_.deletePlayer(player, owned.size(), removeOrders);
    }
    return GameResult<DeletionReport>::err(
        GameError(ErrorCode::ConcurrencyConflict,
                  "orders of player " + std::to_string(player.value()) +
                      " kept changing during deletion"));
}

// -- Reads --------------------------------------------------------------------

GameResult<Order> ExchangeService::getOrder(OrderId id) const {
    auto order = orderCopy(id);
    if (!order) {
        return GameResult<Order>::err(orderNotFound(id));
    }
    return GameResult<Order>::ok(std::move(*order));
}

std::vector<Order> ExchangeService::ordersForPlayer(PlayerId player, bool activeOnly) const {
    std::vector<Order> out;
    std::shared_lock lock(ordersMutex_);
    for (const auto& [id, order] : orders_) {
        if (order.player == player && (!activeOnly || order.IsActive())) {
            out.push_back(order);
        }
    }
    return out;
}

GameResult<game::BookDepth> ExchangeService::depth(ItemId item, std::size_t maxLevels) {
    auto definition = tradeableItem(item);
    if (!definition) {
        return GameResult<game::BookDepth>::err(definition.error());
    }
    auto& mkt = market(item);
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(mkt.mutex, itemLabel(item));
    if (!locked) {
        return GameResult<game::BookDepth>::err(locked.error());
    }
    return GameResult<game::BookDepth>::ok(
        mkt.book.depth(maxLevels == 0 ? config_.depthLevels : maxLevels));
}

GameResult<std::vector<game::PricePoint>> ExchangeService::priceHistory(ItemId item,
                                                                        Timestamp from,
                                                                        Timestamp to) {
    using Points = std::vector<game::PricePoint>;
    auto definition = tradeableItem(item);
    if (!definition) {
        return GameResult<Points>::err(definition.error());
    }
    if (to < from) {
        return GameResult<Points>::err(
            GameError(ErrorCode::InvalidArgument, "history window ends before it starts"));
    }
    auto& mkt = market(item);
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(mkt.mutex, itemLabel(item));
    if (!locked) {
        return GameResult<Points>::err(locked.error());
    }
    Points window;
    std::copy_if(mkt.history.begin(), mkt.history.end(), std::back_inserter(window),
                 [&](const game::PricePoint& p) { return p.at >= from && p.at <= to; });
    return GameResult<Points>::ok(std::move(window));
}

GameResult<game::PriceSummary> ExchangeService::priceSummary(ItemId item) {
    auto definition = tradeableItem(item);
    if (!definition) {
        return GameResult<game::PriceSummary>::err(definition.error());
    }
    auto& mkt = market(item);
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(mkt.mutex, itemLabel(item));
    if (!locked) {
        return GameResult<game::PriceSummary>::err(locked.error());
    }

    const auto now = players_.now();
    const auto windowStart = now - config_.summaryWindow;

    game::PriceSummary summary;
    summary.item = item;
    if (!mkt.history.empty()) {
        summary.lastPrice = mkt.history.back().price;
    }
    for (const auto& point : mkt.history) {
        if (point.at <= windowStart || point.at > now) {
            continue;
        }
        summary.volume24h += point.quantity;
        summary.high24h = std::max(summary.high24h.value_or(point.price), point.price);
        summary.low24h = std::min(summary.low24h.value_or(point.price), point.price);
    }

    auto recent = meanPrice(mkt.history, windowStart, now);
    auto previous = meanPrice(mkt.history, windowStart - config_.summaryWindow, windowStart);
    if (recent && previous && *previous > 0.0) {
        const double change = (*recent - *previous) / *previous;
        if (change > config_.trendThreshold) {
            summary.trend = game::PriceTrend::Rising;
        } else if (change < -config_.trendThreshold) {
            summary.trend = game::PriceTrend::Falling;
        }
    }
    return GameResult<game::PriceSummary>::ok(summary);
}

GameResult<std::vector<Trade>> ExchangeService::tradesForItem(ItemId item) {
    auto definition = tradeableItem(item);
    if (!definition) {
        return GameResult<std::vector<Trade>>::err(definition.error());
    }
    auto& mkt = market(item);
    OrderedLocks locks(players_.lockPolicy());
    auto locked = locks.acquire(mkt.mutex, itemLabel(item));
    if (!locked) {
        return GameResult<std::vector<Trade>>::err(locked.error());
    }
    return GameResult<std::vector<Trade>>::ok(mkt.trades);
}

// -- Internals ----------------------------------------------------------------

GameResult<const game::ItemDefinition*> ExchangeService::tradeableItem(ItemId item) const {
    const auto* definition = catalog_.findItem(item);
    if (definition == nullptr) {
        return GameResult<const game::ItemDefinition*>::err(
            GameError(ErrorCode::ItemNotFound, "unknown " + itemLabel(item)));
    }
    if (!definition->tradeable) {
        return GameResult<const game::ItemDefinition*>::err(
            GameError(ErrorCode::ItemNotTradeable, definition->name + " cannot be traded"));
    }
    return GameResult<const game::ItemDefinition*>::ok(definition);
}

ExchangeService::Market& ExchangeService::market(ItemId item) {
    std::lock_guard lock(marketsMutex_);
    auto it = markets_.find(item);
    if (it == markets_.end()) {
        it = markets_.emplace(item, std::make_unique<Market>(item)).first;
    }
    return *it->second;
}

std::optional<Order> ExchangeService::orderCopy(OrderId id) const {
    std::shared_lock lock(ordersMutex_);
    auto it = orders_.find(id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

GameResult<void> ExchangeService::stageBuyLimit(game::PlayerState& state,
                                                const game::ItemDefinition& item,
                                                int64_t quantity, Timestamp at) const {
    if (item.buyLimit <= 0) {
        return GameResult<void>::ok();
    }
    auto& usage = state.buyLimitUsage[item.id];
    const auto cutoff = at - config_.buyLimitWindow;
    std::erase_if(usage, [cutoff](const game::BuyLimitEntry& e) { return e.at <= cutoff; });

    int64_t used = 0;
    for (const auto& entry : usage) {
        used += entry.quantity;
    }
    if (used + quantity > item.buyLimit) {
        return GameResult<void>::err(
            GameError(ErrorCode::BuyLimitExceeded,
                      item.name + " buy limit is " + std::to_string(item.buyLimit) + " per " +
                          std::to_string(config_.buyLimitWindow.count()) + "h; " +
                          std::to_string(used) + " already bought"));
    }
    usage.push_back(game::BuyLimitEntry{at, quantity});
    return GameResult<void>::ok();
}

}  // namespace gec::service
