#pragma once

/// @file player_state.hpp
/// @brief Per-player aggregate: profile, skills, containers and ledgers.
///
/// Everything a player owns lives in one PlayerState value keyed by
/// PlayerId, so a unit of work can stage a copy, mutate it and publish
/// it whole, and cascade deletion is the removal of one entry.

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "gec/foundation/types.hpp"
#include "gec/game/battle_types.hpp"
#include "gec/game/item_types.hpp"
#include "gec/game/requirement.hpp"
#include "gec/game/skill_types.hpp"

namespace gec::game {

/// Soft account states; players are never silently removed.
enum class AccountStatus : uint8_t { Active, Inactive, Banned };

std::string_view accountStatusName(AccountStatus status);
std::optional<AccountStatus> parseAccountStatus(std::string_view name);

constexpr int32_t kDefaultWorld = 301;
constexpr int32_t kDefaultTotalLevel = 32;
constexpr int32_t kDefaultCombatLevel = 3;

struct PlayerProfile {
    foundation::PlayerId id;
    std::string displayName;
    int32_t world = kDefaultWorld;
    std::string gameMode = "normal";
    bool member = false;
    AccountStatus status = AccountStatus::Active;
    int32_t totalLevel = kDefaultTotalLevel;
    int32_t combatLevel = kDefaultCombatLevel;
    int32_t questPoints = 0;
    int64_t coins = 0;
    foundation::Timestamp createdAt;
    foundation::Timestamp lastLogin;
};

/// Quantity of an item bought at one instant, for the buy-limit window.
struct BuyLimitEntry {
    foundation::Timestamp at;
    int64_t quantity = 0;
};

struct PlayerState {
    PlayerProfile profile;
    SkillSet skills = baselineSkills();
    std::array<ItemStack, kInventorySlotCount> inventory{};
    std::map<foundation::ItemId, BankEntry> bank;
    std::array<ItemStack, kEquipSlotCount> equipment{};
    std::map<BattleCategory, BattleRating> ratings;
    std::map<foundation::AchievementId, foundation::Timestamp> achievements;
    std::map<foundation::ItemId, foundation::Timestamp> collectionLog;
    std::map<foundation::QuestId, foundation::Timestamp> completedQuests;
    std::map<foundation::ItemId, std::vector<BuyLimitEntry>> buyLimitUsage;

    [[nodiscard]] const SkillEntry& SkillOf(game::Skill skill) const {
        return skills[skillIndex(skill)];
    }

    [[nodiscard]] int32_t Level(game::Skill skill) const { return SkillOf(skill).level; }

    [[nodiscard]] int64_t InventoryCount(foundation::ItemId item) const;
    [[nodiscard]] int64_t BankCount(foundation::ItemId item) const;
    [[nodiscard]] int64_t EquippedCount(foundation::ItemId item) const;

    /// Inventory + bank + worn quantity.
    [[nodiscard]] int64_t HeldCount(foundation::ItemId item) const;

    [[nodiscard]] std::optional<std::size_t> FirstFreeSlot() const;
    [[nodiscard]] std::size_t FreeSlotCount() const;

    /// Slot already holding @p item, if any.
    [[nodiscard]] std::optional<std::size_t> SlotHolding(foundation::ItemId item) const;

    [[nodiscard]] bool HasCompletedQuest(foundation::QuestId quest) const {
        return completedQuests.count(quest) > 0;
    }

    /// Rating for @p category, default-initialised when never rated.
    [[nodiscard]] BattleRating RatingFor(BattleCategory category) const;

    /// Sum of worn equipment bonuses, resolved through @p lookup.
    template <typename Lookup>
    [[nodiscard]] EquipmentBonuses TotalBonuses(Lookup&& lookup) const {
        EquipmentBonuses total;
        for (const auto& worn : equipment) {
            if (!worn.IsEmpty()) {
                if (const ItemDefinition* def = lookup(worn.item)) {
                    total += def->bonuses;
                }
            }
        }
        return total;
    }
};

/// Whether @p state satisfies @p requirement.
[[nodiscard]] bool meetsRequirement(const PlayerState& state, const Requirement& requirement);

/// First requirement of @p requirements that @p state fails, if any.
[[nodiscard]] std::optional<Requirement> firstUnmet(const PlayerState& state,
                                                    const RequirementList& requirements);

}  // namespace gec::game
