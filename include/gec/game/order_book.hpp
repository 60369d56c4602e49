#pragma once

/// @file order_book.hpp
/// @brief Price-time priority order book for a single item.
///
/// The book only knows resting quantities. Matching is split into a
/// read-only planning step and an apply step, so the caller can settle
/// the planned fills in a unit of work and mutate the book only after
/// that unit commits.

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

#include "gec/game/order_types.hpp"

namespace gec::game {

/// The book's view of an active order.
struct RestingOrder {
    foundation::OrderId id;
    foundation::PlayerId owner;
    int64_t price = 0;
    int64_t remaining = 0;
    uint64_t sequence = 0;
};

/// One planned match of the incoming order against a resting order.
struct Fill {
    foundation::OrderId restingId;
    foundation::PlayerId restingOwner;
    int64_t quantity = 0;
    int64_t price = 0;  ///< Resting order's price.
};

class OrderBook {
public:
    explicit OrderBook(foundation::ItemId item);

    [[nodiscard]] foundation::ItemId item() const noexcept { return item_; }

    /// Plan fills for an incoming order without mutating the book.
    ///
    /// A buy walks asks from the lowest price up while price <= limit; a
    /// sell walks bids from the highest price down while price >= limit.
    /// Within a level, earlier sequence fills first.
    [[nodiscard]] std::vector<Fill> planMatch(OrderSide incomingSide,
                                              int64_t limitPrice,
                                              int64_t quantity) const;

    /// Apply fills produced by planMatch(); exhausted orders leave the book.
    /// @return false if a fill names an order that is not resting or
    ///         exceeds its remaining quantity (the book is left unchanged).
    bool applyFills(OrderSide incomingSide, const std::vector<Fill>& fills);

    /// Insert an order at the back of its price level.
    void add(OrderSide side, RestingOrder order);

    /// Remove a resting order. @return false if it was not resting.
    bool remove(foundation::OrderId id);

    [[nodiscard]] std::optional<RestingOrder> find(foundation::OrderId id) const;

    /// Aggregated depth, at most @p maxLevels per side (0 = all).
    [[nodiscard]] BookDepth depth(std::size_t maxLevels) const;

    [[nodiscard]] std::optional<int64_t> bestBid() const;
    [[nodiscard]] std::optional<int64_t> bestAsk() const;

    [[nodiscard]] std::size_t orderCount() const noexcept { return index_.size(); }

    /// Ids of every resting order owned by @p owner.
    [[nodiscard]] std::vector<foundation::OrderId> ordersOf(foundation::PlayerId owner) const;

private:
    using Level = std::deque<RestingOrder>;
    using Bids = std::map<int64_t, Level, std::greater<>>;
    using Asks = std::map<int64_t, Level>;

    struct Location {
        OrderSide side;
        int64_t price;
    };

    template <typename Levels>
    static void collectDepth(const Levels& levels, std::size_t maxLevels,
                             std::vector<PriceLevel>& out);

    Level* levelFor(const Location& loc);

    foundation::ItemId item_;
    Bids bids_;
    Asks asks_;
    std::unordered_map<foundation::OrderId, Location> index_;
};

}  // namespace gec::game
