/// @file inventory_ledger.cpp
/// @brief InventoryLedger implementation.

#include "gec/service/inventory_ledger.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::ItemId;
using gec::foundation::LogCategory;
using gec::foundation::LogContext;
using gec::foundation::LogLevel;
using gec::foundation::PlayerId;
using gec::game::ItemStack;
using gec::game::kMaxStackQuantity;

namespace {

GameError invalidSlot(std::size_t slot) {
    return GameError(ErrorCode::InvalidSlot,
                     "inventory slot " + std::to_string(slot) + " out of range 0..27");
}

GameError nonPositive(int64_t quantity) {
    return GameError(ErrorCode::InvalidQuantity,
                     "quantity must be positive, got " + std::to_string(quantity));
}

bool wouldOverflow(int64_t current, int64_t add) {
    return add > kMaxStackQuantity - current;
}

GameError overflow(ItemId item) {
    return GameError(ErrorCode::StackOverflow,
                     "stack of item " + std::to_string(item.value()) + " would exceed " +
                         std::to_string(kMaxStackQuantity));
}

}  // namespace

InventoryLedger::InventoryLedger(PlayerStore& players, const Catalog& catalog,
                                 InventoryConfig config)
    : players_(players), catalog_(catalog), config_(config) {}

GameResult<const game::ItemDefinition*> InventoryLedger::definition(ItemId item) const {
    const auto* def = catalog_.findItem(item);
    if (def == nullptr) {
        return GameResult<const game::ItemDefinition*>::err(
            GameError(ErrorCode::ItemNotFound, "unknown item " + std::to_string(item.value())));
    }
    return GameResult<const game::ItemDefinition*>::ok(def);
}

// -- Inventory ----------------------------------------------------------------

GameResult<ItemStack> InventoryLedger::placeItem(PlayerId player, std::size_t slot, ItemId item,
                                                 int64_t quantity) {
    if (slot >= game::kInventorySlotCount) {
        return GameResult<ItemStack>::err(invalidSlot(slot));
    }
    if (quantity <= 0) {
        return GameResult<ItemStack>::err(nonPositive(quantity));
    }
    auto def = definition(item);
    if (!def) {
        return GameResult<ItemStack>::err(def.error());
    }
    const bool stackable = def.value()->stackable;
    if (!stackable && quantity != 1) {
        return GameResult<ItemStack>::err(
            GameError(ErrorCode::InvalidQuantity,
                      def.value()->name + " is not stackable; place one per slot"));
    }

    return players_.transact<ItemStack>(
        {player}, "place_item", [&](PlayerTxn& txn) -> GameResult<ItemStack> {
            auto& target = txn.at(player).inventory[slot];
            if (target.IsEmpty()) {
                target.item = item;
                target.quantity = quantity;
                return GameResult<ItemStack>::ok(target);
            }
            if (target.item != item || !stackable) {
                return GameResult<ItemStack>::err(
                    GameError(ErrorCode::SlotOccupied,
                              "inventory slot " + std::to_string(slot) + " is occupied"));
            }
            if (wouldOverflow(target.quantity, quantity)) {
                return GameResult<ItemStack>::err(overflow(item));
            }
            target.quantity += quantity;
            return GameResult<ItemStack>::ok(target);
        });
}

GameResult<ItemStack> InventoryLedger::removeItem(PlayerId player, std::size_t slot,
                                                  int64_t quantity) {
    if (slot >= game::kInventorySlotCount) {
        return GameResult<ItemStack>::err(invalidSlot(slot));
    }
    if (quantity <= 0) {
        return GameResult<ItemStack>::err(nonPositive(quantity));
    }
    return players_.transact<ItemStack>(
        {player}, "remove_item", [&](PlayerTxn& txn) -> GameResult<ItemStack> {
            auto& target = txn.at(player).inventory[slot];
            const int64_t present = target.IsEmpty() ? 0 : target.quantity;
            if (quantity > present) {
                return GameResult<ItemStack>::err(
                    GameError(ErrorCode::InsufficientQuantity,
                              "slot " + std::to_string(slot) + " holds " +
                                  std::to_string(present) + ", requested " +
                                  std::to_string(quantity)));
            }
            target.quantity -= quantity;
            if (target.quantity == 0) {
                target.Clear();
            }
            return GameResult<ItemStack>::ok(target);
        });
}

// -- Equipment ----------------------------------------------------------------

GameResult<void> InventoryLedger::equip(PlayerId player, std::size_t slot) {
    if (slot >= game::kInventorySlotCount) {
        return GameResult<void>::err(invalidSlot(slot));
    }
    return players_.runUnit({player}, "equip", [&](PlayerTxn& txn) -> GameResult<void> {
        auto& state = txn.at(player);
        auto& source = state.inventory[slot];
        if (source.IsEmpty()) {
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidSlot, "inventory slot " + std::to_string(slot) + " is empty"));
        }
        auto def = definition(source.item);
        if (!def) {
            return GameResult<void>::err(def.error());
        }
        const auto& item = *def.value();
        if (!item.IsEquippable()) {
            return GameResult<void>::err(
                GameError(ErrorCode::ItemNotEquipable, item.name + " cannot be equipped"));
        }
        if (auto unmet = game::firstUnmet(state, item.equipRequirements)) {
            return GameResult<void>::err(
                GameError(ErrorCode::RequirementNotMet,
                          item.name + " requires " + game::describe(*unmet)));
        }

        auto& worn = state.equipment[static_cast<std::size_t>(*item.slot)];
        if (!worn.IsEmpty() && worn.item == source.item && item.stackable) {
            if (wouldOverflow(worn.quantity, source.quantity)) {
                return GameResult<void>::err(overflow(source.item));
            }
            worn.quantity += source.quantity;
            source.Clear();
        } else {
            std::swap(worn, source);
        }

        LogContext ctx;
        ctx.playerId = player;
        ctx.itemId = item.id;
        ctx.extra["slot"] = std::string(game::equipSlotName(*item.slot));
        GEC_LOG_CTX(LogLevel::Debug, LogCategory::Inventory, "item equipped", ctx);
        return GameResult<void>::ok();
    });
}

GameResult<std::size_t> InventoryLedger::unequip(PlayerId player, game::EquipSlot slot) {
    if (static_cast<std::size_t>(slot) >= game::kEquipSlotCount) {
        return GameResult<std::size_t>::err(
            GameError(ErrorCode::InvalidSlot, "unknown equipment slot"));
    }
    return players_.transact<std::size_t>(
        {player}, "unequip", [&](PlayerTxn& txn) -> GameResult<std::size_t> {
            auto& state = txn.at(player);
            auto& worn = state.equipment[static_cast<std::size_t>(slot)];
            if (worn.IsEmpty()) {
                return GameResult<std::size_t>::err(
                    GameError(ErrorCode::InvalidSlot,
                              "nothing equipped in " + std::string(game::equipSlotName(slot))));
            }
            const auto* def = catalog_.findItem(worn.item);
            const bool stackable = def != nullptr && def->stackable;

            if (stackable) {
                if (auto existing = state.SlotHolding(worn.item)) {
                    auto& stack = state.inventory[*existing];
                    if (wouldOverflow(stack.quantity, worn.quantity)) {
                        return GameResult<std::size_t>::err(overflow(worn.item));
                    }
                    stack.quantity += worn.quantity;
                    worn.Clear();
                    return GameResult<std::size_t>::ok(*existing);
                }
            }
            auto free = state.FirstFreeSlot();
            if (!free) {
                return GameResult<std::size_t>::err(
                    GameError(ErrorCode::InventoryFull, "no free inventory slot to unequip into"));
            }
            state.inventory[*free] = worn;
            worn.Clear();
            return GameResult<std::size_t>::ok(*free);
        });
}

// -- Bank ---------------------------------------------------------------------

GameResult<int64_t> InventoryLedger::depositItem(PlayerId player, std::size_t slot,
                                                 int64_t quantity) {
    if (slot >= game::kInventorySlotCount) {
        return GameResult<int64_t>::err(invalidSlot(slot));
    }
    if (quantity <= 0) {
        return GameResult<int64_t>::err(nonPositive(quantity));
    }
    return players_.transact<int64_t>(
        {player}, "deposit_item", [&](PlayerTxn& txn) -> GameResult<int64_t> {
            auto& state = txn.at(player);
            auto& source = state.inventory[slot];
            const int64_t present = source.IsEmpty() ? 0 : source.quantity;
            if (quantity > present) {
                return GameResult<int64_t>::err(
                    GameError(ErrorCode::InsufficientQuantity,
                              "slot " + std::to_string(slot) + " holds only " +
                                  std::to_string(present)));
            }
            auto item = source.item;
            auto credited = stageBankCredit(state, item, quantity);
            if (!credited) {
                return GameResult<int64_t>::err(credited.error());
            }
            source.quantity -= quantity;
            if (source.quantity == 0) {
                source.Clear();
            }
            return GameResult<int64_t>::ok(state.BankCount(item));
        });
}

GameResult<int64_t> InventoryLedger::withdrawItem(PlayerId player, ItemId item, int64_t quantity) {
    if (quantity <= 0) {
        return GameResult<int64_t>::err(nonPositive(quantity));
    }
    auto def = definition(item);
    if (!def) {
        return GameResult<int64_t>::err(def.error());
    }
    const bool stackable = def.value()->stackable;

    return players_.transact<int64_t>(
        {player}, "withdraw_item", [&](PlayerTxn& txn) -> GameResult<int64_t> {
            auto& state = txn.at(player);
            auto banked = state.bank.find(item);
            if (banked == state.bank.end() || banked->second.quantity < quantity) {
                return GameResult<int64_t>::err(
                    GameError(ErrorCode::InsufficientQuantity,
                              "bank holds " + std::to_string(state.BankCount(item)) +
                                  " of item " + std::to_string(item.value())));
            }

            if (stackable) {
                auto target = state.SlotHolding(item);
                if (!target) {
                    target = state.FirstFreeSlot();
                }
                if (!target) {
                    return GameResult<int64_t>::err(
                        GameError(ErrorCode::InventoryFull, "no free inventory slot"));
                }
                auto& stack = state.inventory[*target];
                const int64_t current = stack.IsEmpty() ? 0 : stack.quantity;
                if (wouldOverflow(current, quantity)) {
                    return GameResult<int64_t>::err(overflow(item));
                }
                stack.item = item;
                stack.quantity = current + quantity;
            } else {
                if (static_cast<int64_t>(state.FreeSlotCount()) < quantity) {
                    return GameResult<int64_t>::err(
                        GameError(ErrorCode::InventoryFull,
                                  "withdrawal needs " + std::to_string(quantity) +
                                      " free inventory slots"));
                }
                for (int64_t placed = 0; placed < quantity; ++placed) {
                    auto& stack = state.inventory[*state.FirstFreeSlot()];
                    stack.item = item;
                    stack.quantity = 1;
                }
            }

            banked->second.quantity -= quantity;
            int64_t left = banked->second.quantity;
            if (left == 0) {
                state.bank.erase(banked);
            }
            return GameResult<int64_t>::ok(left);
        });
}

GameResult<void> InventoryLedger::setBankTab(PlayerId player, ItemId item, int32_t tab) {
    if (tab < 0) {
        return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, "bank tab cannot be negative"));
    }
    return players_.runUnit({player}, "set_bank_tab", [&](PlayerTxn& txn) -> GameResult<void> {
        auto& bank = txn.at(player).bank;
        auto it = bank.find(item);
        if (it == bank.end()) {
            return GameResult<void>::err(
                GameError(ErrorCode::ItemNotFound, "item is not in the bank"));
        }
        it->second.tab = tab;
        return GameResult<void>::ok();
    });
}

// -- Coins and collection log -------------------------------------------------

GameResult<int64_t> InventoryLedger::grantCoins(PlayerId player, int64_t amount) {
    if (amount <= 0) {
        return GameResult<int64_t>::err(nonPositive(amount));
    }
    return players_.transact<int64_t>(
        {player}, "grant_coins", [&](PlayerTxn& txn) -> GameResult<int64_t> {
            auto& state = txn.at(player);
            auto credited = stageCoinCredit(state, amount);
            if (!credited) {
                return GameResult<int64_t>::err(credited.error());
            }
            return GameResult<int64_t>::ok(state.profile.coins);
        });
}

GameResult<int64_t> InventoryLedger::spendCoins(PlayerId player, int64_t amount) {
    if (amount <= 0) {
        return GameResult<int64_t>::err(nonPositive(amount));
    }
    return players_.transact<int64_t>(
        {player}, "spend_coins", [&](PlayerTxn& txn) -> GameResult<int64_t> {
            auto& state = txn.at(player);
            auto debited = stageCoinDebit(state, amount);
            if (!debited) {
                return GameResult<int64_t>::err(debited.error());
            }
            return GameResult<int64_t>::ok(state.profile.coins);
        });
}

GameResult<bool> InventoryLedger::recordCollection(PlayerId player, ItemId item) {
    auto def = definition(item);
    if (!def) {
        return GameResult<bool>::err(def.error());
    }
    return players_.transact<bool>(
        {player}, "record_collection", [&](PlayerTxn& txn) -> GameResult<bool> {
            return GameResult<bool>::ok(stageCollection(txn.at(player), item, txn.now()));
        });
}

// -- Staged helpers -----------------------------------------------------------

GameResult<void> InventoryLedger::stageBankCredit(game::PlayerState& state, ItemId item,
                                                  int64_t quantity) const {
    if (quantity <= 0) {
        return GameResult<void>::err(nonPositive(quantity));
    }
    auto it = state.bank.find(item);
    if (it == state.bank.end()) {
        if (state.bank.size() >= config_.bankCapacity) {
            return GameResult<void>::err(
                GameError(ErrorCode::BankFull,
                          "bank already holds " + std::to_string(config_.bankCapacity) +
                              " distinct items"));
        }
        state.bank.emplace(item, game::BankEntry{quantity, 0});
        return GameResult<void>::ok();
    }
    if (wouldOverflow(it->second.quantity, quantity)) {
        return GameResult<void>::err(overflow(item));
    }
    it->second.quantity += quantity;
    return GameResult<void>::ok();
}

GameResult<void> InventoryLedger::stageHeldDebit(game::PlayerState& state, ItemId item,
                                                 int64_t quantity) const {
    if (quantity <= 0) {
        return GameResult<void>::err(nonPositive(quantity));
    }
    const int64_t available = state.InventoryCount(item) + state.BankCount(item);
    if (available < quantity) {
        return GameResult<void>::err(
            GameError(ErrorCode::InsufficientQuantity,
                      "holds " + std::to_string(available) + " of item " +
                          std::to_string(item.value()) + ", needs " + std::to_string(quantity)));
    }

    int64_t left = quantity;
    for (auto& stack : state.inventory) {
        if (left == 0) {
            break;
        }
        if (stack.IsEmpty() || stack.item != item) {
            continue;
        }
        auto take = std::min(left, stack.quantity);
        stack.quantity -= take;
        left -= take;
        if (stack.quantity == 0) {
            stack.Clear();
        }
    }
    if (left > 0) {
        auto banked = state.bank.find(item);
        banked->second.quantity -= left;
        if (banked->second.quantity == 0) {
            state.bank.erase(banked);
        }
    }
    return GameResult<void>::ok();
}

GameResult<void> InventoryLedger::stageCoinCredit(game::PlayerState& state, int64_t amount) {
    if (amount < 0) {
        return GameResult<void>::err(nonPositive(amount));
    }
    if (amount > std::numeric_limits<int64_t>::max() - state.profile.coins) {
        return GameResult<void>::err(
            GameError(ErrorCode::StackOverflow, "coin balance would overflow"));
    }
    state.profile.coins += amount;
    return GameResult<void>::ok();
}

GameResult<void> InventoryLedger::stageCoinDebit(game::PlayerState& state, int64_t amount) {
    if (amount < 0) {
        return GameResult<void>::err(nonPositive(amount));
    }
    if (state.profile.coins < amount) {
        return GameResult<void>::err(
            GameError(ErrorCode::InsufficientFunds,
                      "balance " + std::to_string(state.profile.coins) + " is below " +
                          std::to_string(amount)));
    }
    state.profile.coins -= amount;
    return GameResult<void>::ok();
}

bool InventoryLedger::stageCollection(game::PlayerState& state, ItemId item,
                                      foundation::Timestamp at) {
    return state.collectionLog.emplace(item, at).second;
}

}  // namespace gec::service
