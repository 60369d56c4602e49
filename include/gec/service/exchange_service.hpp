#pragma once

/// @file exchange_service.hpp
/// @brief Grand Exchange: order submission, matching, settlement and reads.
///
/// Each item has its own market guarded by a timed mutex. Submission
/// locks the item, plans the fills against the book without changing it,
/// settles escrow and payouts for every involved player in one unit of
/// work, and applies the fills to the book only after that unit commits.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "gec/foundation/game_result.hpp"
#include "gec/game/order_book.hpp"
#include "gec/game/order_types.hpp"
#include "gec/service/catalog.hpp"
#include "gec/service/inventory_ledger.hpp"
#include "gec/service/player_store.hpp"

namespace gec::service {

/// Read from the `exchange.*` config keys.
struct ExchangeConfig {
    /// Rolling window the per-item buy limit applies to.
    std::chrono::hours buyLimitWindow{4};
    std::size_t depthLevels = 10;
    std::chrono::hours summaryWindow{24};
    /// Relative change of the mean trade price that counts as a trend.
    double trendThreshold = 0.02;
};

/// The submitted order after matching, with the trades it produced.
struct OrderResult {
    game::Order order;
    std::vector<game::Trade> trades;
};

class ExchangeService {
public:
    ExchangeService(PlayerStore& players, const Catalog& catalog, const InventoryLedger& ledger,
                    ExchangeConfig config = {});

    ExchangeService(const ExchangeService&) = delete;
    ExchangeService& operator=(const ExchangeService&) = delete;

    // -- Writes ---------------------------------------------------------------

    /// Escrow, create and match an order. A buy escrows quantity * price
    /// coins; a sell escrows items from the inventory, then the bank.
    [[nodiscard]] foundation::GameResult<OrderResult> submitOrder(
        foundation::PlayerId player, foundation::ItemId item, game::OrderSide side,
        int64_t quantity, int64_t price);

    /// Cancel an active order and release its unfilled remainder: coins to
    /// the balance, items to the bank. Whatever the bank or balance cannot
    /// take stays in the order's collection box.
    [[nodiscard]] foundation::GameResult<game::Order> cancelOrder(foundation::PlayerId player,
                                                                  foundation::OrderId order);

    /// Move an order's collection box into the owner's bank and balance.
    /// Fails, moving nothing, while the bank still cannot take the items.
    [[nodiscard]] foundation::GameResult<game::Order> collectOrder(foundation::PlayerId player,
                                                                   foundation::OrderId order);

    /// Load persisted orders and trades into an empty exchange. Active
    /// orders rest on their books again; id and sequence counters continue
    /// after the highest restored value.
    [[nodiscard]] foundation::GameResult<void> restore(const std::vector<game::Order>& orders,
                                                       const std::vector<game::Trade>& trades);

    /// Delete a player together with every order it owns.
    [[nodiscard]] foundation::GameResult<DeletionReport> deletePlayer(foundation::PlayerId player);

    // -- Reads ----------------------------------------------------------------

    [[nodiscard]] foundation::GameResult<game::Order> getOrder(foundation::OrderId order) const;

    [[nodiscard]] std::vector<game::Order> ordersForPlayer(foundation::PlayerId player,
                                                           bool activeOnly = false) const;

    /// Depth aggregated by price level; @p maxLevels 0 uses the configured default.
    [[nodiscard]] foundation::GameResult<game::BookDepth> depth(foundation::ItemId item,
                                                                std::size_t maxLevels = 0);

    /// Trades executed in [from, to], oldest first.
    [[nodiscard]] foundation::GameResult<std::vector<game::PricePoint>> priceHistory(
        foundation::ItemId item, foundation::Timestamp from, foundation::Timestamp to);

    [[nodiscard]] foundation::GameResult<game::PriceSummary> priceSummary(foundation::ItemId item);

    [[nodiscard]] foundation::GameResult<std::vector<game::Trade>> tradesForItem(
        foundation::ItemId item);

    [[nodiscard]] const ExchangeConfig& config() const noexcept { return config_; }

private:
    struct Market {
        explicit Market(foundation::ItemId item) : book(item) {}

        std::timed_mutex mutex;
        game::OrderBook book;
        std::vector<game::Trade> trades;
        std::vector<game::PricePoint> history;
    };

    [[nodiscard]] foundation::GameResult<const game::ItemDefinition*> tradeableItem(
        foundation::ItemId item) const;

    Market& market(foundation::ItemId item);

    [[nodiscard]] std::optional<game::Order> orderCopy(foundation::OrderId id) const;

    /// Check and record the buy-limit usage of a staged buyer.
    [[nodiscard]] foundation::GameResult<void> stageBuyLimit(game::PlayerState& state,
                                                             const game::ItemDefinition& item,
                                                             int64_t quantity,
                                                             foundation::Timestamp at) const;

    PlayerStore& players_;
    const Catalog& catalog_;
    const InventoryLedger& ledger_;
    ExchangeConfig config_;

    std::mutex marketsMutex_;
    std::map<foundation::ItemId, std::unique_ptr<Market>> markets_;

    mutable std::shared_mutex ordersMutex_;
    std::map<foundation::OrderId, game::Order> orders_;

    std::atomic<uint64_t> nextOrderId_{1};
    std::atomic<uint64_t> nextTradeId_{1};
    std::atomic<uint64_t> nextSequence_{1};
};

}  // namespace gec::service
