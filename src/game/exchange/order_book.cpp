/// @file order_book.cpp
/// @brief OrderBook matching and depth.

#include "gec/game/order_book.hpp"

#include <algorithm>

namespace gec::game {

using foundation::OrderId;
using foundation::PlayerId;

namespace {

template <typename Levels, typename Accept>
std::vector<Fill> walk(const Levels& levels, int64_t quantity, Accept accept) {
    std::vector<Fill> fills;
    int64_t left = quantity;
    for (auto it = levels.begin(); it != levels.end() && left > 0; ++it) {
        if (!accept(it->first)) {
            break;
        }
        for (const auto& resting : it->second) {
            if (left == 0) {
                break;
            }
            auto take = std::min(left, resting.remaining);
            fills.push_back(Fill{resting.id, resting.owner, take, resting.price});
            left -= take;
        }
    }
    return fills;
}

}  // namespace

OrderBook::OrderBook(foundation::ItemId item) : item_(item) {}

std::vector<Fill> OrderBook::planMatch(OrderSide incomingSide,
                                       int64_t limitPrice,
                                       int64_t quantity) const {
    if (quantity <= 0) {
        return {};
    }
    if (incomingSide == OrderSide::Buy) {
        return walk(asks_, quantity, [limitPrice](int64_t ask) { return ask <= limitPrice; });
    }
    return walk(bids_, quantity, [limitPrice](int64_t bid) { return bid >= limitPrice; });
}

OrderBook::Level* OrderBook::levelFor(const Location& loc) {
    if (loc.side == OrderSide::Buy) {
        auto it = bids_.find(loc.price);
        return it == bids_.end() ? nullptr : &it->second;
    }
    auto it = asks_.find(loc.price);
    return it == asks_.end() ? nullptr : &it->second;
}

bool OrderBook::applyFills(OrderSide incomingSide, const std::vector<Fill>& fills) {
    const auto restingSide = incomingSide == OrderSide::Buy ? OrderSide::Sell : OrderSide::Buy;

    // Validate everything first so a bad plan leaves the book untouched.
    for (const auto& fill : fills) {
        auto resting = find(fill.restingId);
        if (!resting || fill.quantity <= 0 || fill.quantity > resting->remaining ||
            index_.at(fill.restingId).side != restingSide) {
            return false;
        }
    }

    for (const auto& fill : fills) {
        auto loc = index_.at(fill.restingId);
        auto* level = levelFor(loc);
        auto it = std::find_if(level->begin(), level->end(),
                               [&](const RestingOrder& r) { return r.id == fill.restingId; });
        it->remaining -= fill.quantity;
        if (it->remaining == 0) {
            level->erase(it);
            index_.erase(fill.restingId);
            if (level->empty()) {
                if (loc.side == OrderSide::Buy) {
                    bids_.erase(loc.price);
                } else {
                    asks_.erase(loc.price);
                }
            }
        }
    }
    return true;
}

void OrderBook::add(OrderSide side, RestingOrder order) {
    if (order.remaining <= 0 || index_.count(order.id) > 0) {
        return;
    }
    index_.emplace(order.id, Location{side, order.price});
    auto& level = side == OrderSide::Buy ? bids_[order.price] : asks_[order.price];
    // Keep sequence order even if a caller inserts out of order.
    auto pos = std::upper_bound(level.begin(), level.end(), order.sequence,
                                [](uint64_t seq, const RestingOrder& r) { return seq < r.sequence; });
    level.insert(pos, order);
}

bool OrderBook::remove(OrderId id) {
    auto idx = index_.find(id);
    if (idx == index_.end()) {
        return false;
    }
    auto loc = idx->second;
    auto* level = levelFor(loc);
    if (level != nullptr) {
        std::erase_if(*level, [id](const RestingOrder& r) { return r.id == id; });
        if (level->empty()) {
            if (loc.side == OrderSide::Buy) {
                bids_.erase(loc.price);
            } else {
                asks_.erase(loc.price);
            }
        }
    }
    index_.erase(idx);
    return true;
}

std::optional<RestingOrder> OrderBook::find(OrderId id) const {
    auto idx = index_.find(id);
    if (idx == index_.end()) {
        return std::nullopt;
    }
    const Level* level = nullptr;
    if (idx->second.side == OrderSide::Buy) {
        auto it = bids_.find(idx->second.price);
        level = it == bids_.end() ? nullptr : &it->second;
    } else {
        auto it = asks_.find(idx->second.price);
        level = it == asks_.end() ? nullptr : &it->second;
    }
    if (level == nullptr) {
        return std::nullopt;
    }
    for (const auto& r : *level) {
        if (r.id == id) {
            return r;
        }
    }
    return std::nullopt;
}

template <typename Levels>
void OrderBook::collectDepth(const Levels& levels, std::size_t maxLevels,
                             std::vector<PriceLevel>& out) {
    for (const auto& [price, level] : levels) {
        if (maxLevels != 0 && out.size() >= maxLevels) {
            break;
        }
        PriceLevel pl;
        pl.price = price;
        pl.orderCount = level.size();
        for (const auto& r : level) {
            pl.quantity += r.remaining;
        }
        out.push_back(pl);
    }
}

BookDepth OrderBook::depth(std::size_t maxLevels) const {
    BookDepth d;
    d.item = item_;
    collectDepth(bids_, maxLevels, d.bids);
    collectDepth(asks_, maxLevels, d.asks);
    return d;
}

std::optional<int64_t> OrderBook::bestBid() const {
    if (bids_.empty()) {
        return std::nullopt;
    }
    return bids_.begin()->first;
}

std::optional<int64_t> OrderBook::bestAsk() const {
    if (asks_.empty()) {
        return std::nullopt;
    }
    return asks_.begin()->first;
}

std::vector<OrderId> OrderBook::ordersOf(PlayerId owner) const {
    std::vector<OrderId> ids;
    auto scan = [&](const auto& levels) {
        for (const auto& [price, level] : levels) {
            for (const auto& r : level) {
                if (r.owner == owner) {
                    ids.push_back(r.id);
                }
            }
        }
    };
    scan(bids_);
    scan(asks_);
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace gec::game
