/// @file player_state.cpp
/// @brief PlayerState container queries and requirement checks.

#include "gec/game/player_state.hpp"

#include <algorithm>
#include <type_traits>

#include "gec/game/derived_stats.hpp"

namespace gec::game {

using foundation::ItemId;

std::string_view accountStatusName(AccountStatus status) {
    switch (status) {
        case AccountStatus::Active:   return "active";
        case AccountStatus::Inactive: return "inactive";
        case AccountStatus::Banned:   return "banned";
    }
    return "unknown";
}

std::optional<AccountStatus> parseAccountStatus(std::string_view name) {
    for (auto status : {AccountStatus::Active, AccountStatus::Inactive, AccountStatus::Banned}) {
        if (accountStatusName(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

int64_t PlayerState::InventoryCount(ItemId item) const {
    int64_t total = 0;
    for (const auto& slot : inventory) {
        if (!slot.IsEmpty() && slot.item == item) {
            total += slot.quantity;
        }
    }
    return total;
}

int64_t PlayerState::BankCount(ItemId item) const {
    auto it = bank.find(item);
    return it == bank.end() ? 0 : it->second.quantity;
}

int64_t PlayerState::EquippedCount(ItemId item) const {
    int64_t total = 0;
    for (const auto& worn : equipment) {
        if (!worn.IsEmpty() && worn.item == item) {
            total += worn.quantity;
        }
    }
    return total;
}

int64_t PlayerState::HeldCount(ItemId item) const {
    return InventoryCount(item) + BankCount(item) + EquippedCount(item);
}

std::optional<std::size_t> PlayerState::FirstFreeSlot() const {
    for (std::size_t i = 0; i < inventory.size(); ++i) {
        if (inventory[i].IsEmpty()) {
            return i;
        }
    }
    return std::nullopt;
}

std::size_t PlayerState::FreeSlotCount() const {
    return static_cast<std::size_t>(std::count_if(
        inventory.begin(), inventory.end(), [](const ItemStack& s) { return s.IsEmpty(); }));
}

std::optional<std::size_t> PlayerState::SlotHolding(ItemId item) const {
    for (std::size_t i = 0; i < inventory.size(); ++i) {
        if (!inventory[i].IsEmpty() && inventory[i].item == item) {
            return i;
        }
    }
    return std::nullopt;
}

BattleRating PlayerState::RatingFor(BattleCategory category) const {
    auto it = ratings.find(category);
    return it == ratings.end() ? BattleRating{} : it->second;
}

bool meetsRequirement(const PlayerState& state, const Requirement& requirement) {
    return std::visit([&](const auto& req) -> bool {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, LevelRequirement>) {
            return state.Level(req.skill) >= req.level;
        } else if constexpr (std::is_same_v<T, QuestRequirement>) {
            return state.HasCompletedQuest(req.quest);
        } else if constexpr (std::is_same_v<T, ItemRequirement>) {
            return state.HeldCount(req.item) >= req.quantity;
        } else if constexpr (std::is_same_v<T, CombatLevelRequirement>) {
            return computeCombatLevel(state.skills) >= req.level;
        } else {
            return computeTotalLevel(state.skills) >= req.level;
        }
    }, requirement);
}

std::optional<Requirement> firstUnmet(const PlayerState& state,
                                      const RequirementList& requirements) {
    for (const auto& req : requirements) {
        if (!meetsRequirement(state, req)) {
            return req;
        }
    }
    return std::nullopt;
}

}  // namespace gec::game
