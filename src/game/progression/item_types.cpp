/// @file item_types.cpp
/// @brief Equipment slot names and bonus arithmetic.

#include "gec/game/item_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace gec::game {

namespace {

constexpr std::array<std::string_view, kEquipSlotCount> kSlotNames = {
    "head", "cape", "neck", "ammo", "weapon", "body",
    "shield", "legs", "hands", "feet", "ring"};

}  // namespace

std::string_view equipSlotName(EquipSlot slot) {
    auto idx = static_cast<std::size_t>(slot);
    return idx < kEquipSlotCount ? kSlotNames[idx] : "none";
}

std::optional<EquipSlot> parseEquipSlot(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (std::size_t i = 0; i < kEquipSlotCount; ++i) {
        if (kSlotNames[i] == lower) {
            return static_cast<EquipSlot>(i);
        }
    }
    return std::nullopt;
}

EquipmentBonuses& EquipmentBonuses::operator+=(const EquipmentBonuses& other) {
    attackStab += other.attackStab;
    attackSlash += other.attackSlash;
    attackCrush += other.attackCrush;
    attackMagic += other.attackMagic;
    attackRanged += other.attackRanged;
    defenceStab += other.defenceStab;
    defenceSlash += other.defenceSlash;
    defenceCrush += other.defenceCrush;
    defenceMagic += other.defenceMagic;
    defenceRanged += other.defenceRanged;
    meleeStrength += other.meleeStrength;
    rangedStrength += other.rangedStrength;
    magicDamage += other.magicDamage;
    prayer += other.prayer;
    return *this;
}

}  // namespace gec::game
