#pragma once

/// @file order_types.hpp
/// @brief Exchange orders, trades and market read models.

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "gec/foundation/types.hpp"

namespace gec::game {

enum class OrderSide : uint8_t { Buy, Sell };

/// Order lifecycle: Active -> Completed | Cancelled. No other transition.
enum class OrderStatus : uint8_t { Active, Completed, Cancelled };

std::string_view orderSideName(OrderSide side);
std::string_view orderStatusName(OrderStatus status);
std::optional<OrderSide> parseOrderSide(std::string_view name);
std::optional<OrderStatus> parseOrderStatus(std::string_view name);

/// A buy or sell offer for one item.
struct Order {
    foundation::OrderId id;
    foundation::PlayerId player;
    foundation::ItemId item;
    OrderSide side = OrderSide::Buy;
    int64_t quantity = 0;
    int64_t price = 0;  ///< Per unit.
    int64_t filled = 0;
    OrderStatus status = OrderStatus::Active;
    foundation::Timestamp createdAt;
    std::optional<foundation::Timestamp> completedAt;

    /// Submission sequence; breaks price ties (earlier first).
    uint64_t sequence = 0;

    /// Collection box: proceeds the owner's bank or purse could not take
    /// at settlement or cancellation. Has no capacity limit.
    int64_t collectItems = 0;
    int64_t collectCoins = 0;

    [[nodiscard]] int64_t Remaining() const noexcept { return quantity - filled; }
    [[nodiscard]] bool IsActive() const noexcept { return status == OrderStatus::Active; }
    [[nodiscard]] bool HasUncollected() const noexcept {
        return collectItems > 0 || collectCoins > 0;
    }
};

/// Immutable record of a match between one buy and one sell order.
struct Trade {
    foundation::TradeId id;
    foundation::ItemId item;
    foundation::OrderId buyOrder;
    foundation::OrderId sellOrder;
    foundation::PlayerId buyer;
    foundation::PlayerId seller;
    int64_t quantity = 0;
    int64_t price = 0;
    foundation::Timestamp executedAt;
};

/// Aggregated resting quantity at one price.
struct PriceLevel {
    int64_t price = 0;
    int64_t quantity = 0;
    std::size_t orderCount = 0;
};

/// Order-book depth: bids best (highest) first, asks best (lowest) first.
struct BookDepth {
    foundation::ItemId item;
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
};

/// One entry of the append-only price history.
struct PricePoint {
    foundation::Timestamp at;
    int64_t price = 0;
    int64_t quantity = 0;
};

enum class PriceTrend : uint8_t { Rising, Falling, Stable };

std::string_view priceTrendName(PriceTrend trend);

/// Per-item market summary.
struct PriceSummary {
    foundation::ItemId item;
    std::optional<int64_t> lastPrice;
    int64_t volume24h = 0;
    std::optional<int64_t> high24h;
    std::optional<int64_t> low24h;
    PriceTrend trend = PriceTrend::Stable;
};

}  // namespace gec::game
