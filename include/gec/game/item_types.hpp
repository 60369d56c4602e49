#pragma once

/// @file item_types.hpp
/// @brief Item catalog entries, equipment slots and container limits.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "gec/foundation/types.hpp"
#include "gec/game/requirement.hpp"

namespace gec::game {

/// Number of inventory slots, indexed 0..27.
constexpr std::size_t kInventorySlotCount = 28;

/// Largest quantity a single stack may hold.
constexpr int64_t kMaxStackQuantity = 2'147'483'647;

/// Default number of distinct items a bank can hold.
constexpr std::size_t kDefaultBankCapacity = 800;

/// Worn equipment positions.
///
/// COUNT is a sentinel used for array sizing.
enum class EquipSlot : uint8_t {
    Head,
    Cape,
    Neck,
    Ammo,
    Weapon,
    Body,
    Shield,
    Legs,
    Hands,
    Feet,
    Ring,
    COUNT  ///< Sentinel: total number of equipment slots.
};

constexpr std::size_t kEquipSlotCount = static_cast<std::size_t>(EquipSlot::COUNT);

std::string_view equipSlotName(EquipSlot slot);

std::optional<EquipSlot> parseEquipSlot(std::string_view name);

/// Attack, defence and other bonuses granted while an item is worn.
struct EquipmentBonuses {
    int32_t attackStab = 0;
    int32_t attackSlash = 0;
    int32_t attackCrush = 0;
    int32_t attackMagic = 0;
    int32_t attackRanged = 0;
    int32_t defenceStab = 0;
    int32_t defenceSlash = 0;
    int32_t defenceCrush = 0;
    int32_t defenceMagic = 0;
    int32_t defenceRanged = 0;
    int32_t meleeStrength = 0;
    int32_t rangedStrength = 0;
    int32_t magicDamage = 0;
    int32_t prayer = 0;

    EquipmentBonuses& operator+=(const EquipmentBonuses& other);
};

/// Static item definition (catalog data, never mutated at run time).
struct ItemDefinition {
    foundation::ItemId id;
    std::string name;
    bool tradeable = true;
    bool stackable = false;
    bool equipable = false;
    std::optional<EquipSlot> slot;
    int64_t value = 0;
    int64_t highAlch = 0;
    int64_t lowAlch = 0;
    double weight = 0.0;

    /// Maximum quantity bought per buy-limit window; 0 = unlimited.
    int64_t buyLimit = 0;

    EquipmentBonuses bonuses;
    RequirementList equipRequirements;

    [[nodiscard]] bool IsEquippable() const noexcept { return equipable && slot.has_value(); }
};

/// A quantity of one item held in an inventory or equipment slot.
struct ItemStack {
    foundation::ItemId item;  ///< Invalid id = empty slot.
    int64_t quantity = 0;

    [[nodiscard]] bool IsEmpty() const noexcept { return !item.isValid() || quantity <= 0; }

    void Clear() noexcept {
        item = foundation::ItemId();
        quantity = 0;
    }
};

/// One bank row: unique per item.
struct BankEntry {
    int64_t quantity = 0;
    int32_t tab = 0;
};

}  // namespace gec::game
