/// @file order_types.cpp
/// @brief Order, trade and trend names.

#include "gec/game/order_types.hpp"

namespace gec::game {

std::string_view orderSideName(OrderSide side) {
    return side == OrderSide::Buy ? "buy" : "sell";
}

std::string_view orderStatusName(OrderStatus status) {
    switch (status) {
        case OrderStatus::Active:    return "active";
        case OrderStatus::Completed: return "completed";
        case OrderStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<OrderSide> parseOrderSide(std::string_view name) {
    if (name == "buy") {
        return OrderSide::Buy;
    }
    if (name == "sell") {
        return OrderSide::Sell;
    }
    return std::nullopt;
}

std::optional<OrderStatus> parseOrderStatus(std::string_view name) {
    for (auto status : {OrderStatus::Active, OrderStatus::Completed, OrderStatus::Cancelled}) {
        if (orderStatusName(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

std::string_view priceTrendName(PriceTrend trend) {
    switch (trend) {
        case PriceTrend::Rising:  return "rising";
        case PriceTrend::Falling: return "falling";
        case PriceTrend::Stable:  return "stable";
    }
    return "stable";
}

}  // namespace gec::game
