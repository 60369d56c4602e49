/// @file requirement.cpp
/// @brief Requirement descriptions.

#include "gec/game/requirement.hpp"

#include <type_traits>

namespace gec::game {

std::string describe(const Requirement& requirement) {
    return std::visit([](const auto& req) -> std::string {
        using T = std::decay_t<decltype(req)>;
        if constexpr (std::is_same_v<T, LevelRequirement>) {
            return std::string(skillName(req.skill)) + " " + std::to_string(req.level);
        } else if constexpr (std::is_same_v<T, QuestRequirement>) {
            return "quest " + std::to_string(req.quest.value());
        } else if constexpr (std::is_same_v<T, ItemRequirement>) {
            return "item " + std::to_string(req.item.value()) + " x" +
                   std::to_string(req.quantity);
        } else if constexpr (std::is_same_v<T, CombatLevelRequirement>) {
            return "combat " + std::to_string(req.level);
        } else {
            return "total " + std::to_string(req.level);
        }
    }, requirement);
}

}  // namespace gec::game
