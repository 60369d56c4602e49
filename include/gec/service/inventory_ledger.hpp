#pragma once

/// @file inventory_ledger.hpp
/// @brief Inventory, bank, equipment, coin and collection-log ledger.
///
/// Public operations each run as their own unit of work. The stage*()
/// helpers mutate an already staged PlayerState so the exchange and the
/// battle engine can move items and coins inside their own units.

#include <cstddef>
#include <cstdint>

#include "gec/foundation/game_result.hpp"
#include "gec/game/item_types.hpp"
#include "gec/game/player_state.hpp"
#include "gec/service/catalog.hpp"
#include "gec/service/player_store.hpp"

namespace gec::service {

/// Read from the `inventory.*` config keys.
struct InventoryConfig {
    std::size_t bankCapacity = game::kDefaultBankCapacity;
};

class InventoryLedger {
public:
    InventoryLedger(PlayerStore& players, const Catalog& catalog, InventoryConfig config = {});

    // -- Inventory ------------------------------------------------------------

    /// Put @p quantity of @p item into inventory @p slot. The slot must be
    /// empty or hold the same stackable item.
    [[nodiscard]] foundation::GameResult<game::ItemStack> placeItem(
        foundation::PlayerId player, std::size_t slot, foundation::ItemId item, int64_t quantity);

    /// Take @p quantity out of @p slot. Returns what is left in the slot.
    [[nodiscard]] foundation::GameResult<game::ItemStack> removeItem(
        foundation::PlayerId player, std::size_t slot, int64_t quantity);

    // -- Equipment ------------------------------------------------------------

    /// Wear the item in inventory @p slot; the previously worn item moves
    /// into the freed slot.
    [[nodiscard]] foundation::GameResult<void> equip(foundation::PlayerId player, std::size_t slot);

    /// Return worn equipment to the inventory. Returns the receiving slot.
    [[nodiscard]] foundation::GameResult<std::size_t> unequip(foundation::PlayerId player,
                                                              game::EquipSlot slot);

    // -- Bank -----------------------------------------------------------------

    /// Move @p quantity from inventory @p slot into the bank. Returns the
    /// new bank quantity of that item.
    [[nodiscard]] foundation::GameResult<int64_t> depositItem(
        foundation::PlayerId player, std::size_t slot, int64_t quantity);

    /// Move @p quantity of @p item from the bank into the inventory.
    /// Returns the quantity left in the bank.
    [[nodiscard]] foundation::GameResult<int64_t> withdrawItem(
        foundation::PlayerId player, foundation::ItemId item, int64_t quantity);

    [[nodiscard]] foundation::GameResult<void> setBankTab(
        foundation::PlayerId player, foundation::ItemId item, int32_t tab);

    // -- Coins and collection log --------------------------------------------

    /// @return The new coin balance.
    [[nodiscard]] foundation::GameResult<int64_t> grantCoins(foundation::PlayerId player,
                                                             int64_t amount);

    /// @return The new coin balance, or InsufficientFunds.
    [[nodiscard]] foundation::GameResult<int64_t> spendCoins(foundation::PlayerId player,
                                                             int64_t amount);

    /// Insert-or-ignore. @return true if the entry was new.
    [[nodiscard]] foundation::GameResult<bool> recordCollection(foundation::PlayerId player,
                                                                foundation::ItemId item);

    // -- Staged helpers -------------------------------------------------------

    [[nodiscard]] foundation::GameResult<void> stageBankCredit(
        game::PlayerState& state, foundation::ItemId item, int64_t quantity) const;

    /// Remove @p quantity of @p item from the inventory first, then the bank.
    [[nodiscard]] foundation::GameResult<void> stageHeldDebit(
        game::PlayerState& state, foundation::ItemId item, int64_t quantity) const;

    [[nodiscard]] static foundation::GameResult<void> stageCoinCredit(game::PlayerState& state,
                                                                      int64_t amount);

    [[nodiscard]] static foundation::GameResult<void> stageCoinDebit(game::PlayerState& state,
                                                                     int64_t amount);

    /// @return true if the collection-log entry was new.
    static bool stageCollection(game::PlayerState& state, foundation::ItemId item,
                                foundation::Timestamp at);

    [[nodiscard]] const InventoryConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] foundation::GameResult<const game::ItemDefinition*> definition(
        foundation::ItemId item) const;

    PlayerStore& players_;
    const Catalog& catalog_;
    InventoryConfig config_;
};

}  // namespace gec::service
