#pragma once

/// @file catalog.hpp
/// @brief Immutable reference data: items, quests and achievements.
///
/// Catalogs are filled at start-up (in code or from YAML) and only read
/// afterwards. Returned pointers stay valid for the catalog's lifetime.

#include <cstddef>
#include <filesystem>
#include <map>
#include <shared_mutex>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gec/foundation/game_result.hpp"
#include "gec/game/achievement_types.hpp"
#include "gec/game/item_types.hpp"

namespace gec::service {

/// Usage:
/// @code
///   Catalog catalog;
///   auto loaded = catalog.loadFromFile("config/catalog.yaml");
///   const auto* whip = catalog.findItem(ItemId(4151));
/// @endcode
class Catalog {
public:
    Catalog() = default;

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    // -- Registration ---------------------------------------------------------

    /// Add or replace an item definition.
    [[nodiscard]] foundation::GameResult<void> addItem(game::ItemDefinition item);

    [[nodiscard]] foundation::GameResult<void> addQuest(game::QuestDefinition quest);

    [[nodiscard]] foundation::GameResult<void> addAchievement(game::AchievementDefinition achievement);

    /// Load `items`, `quests` and `achievements` sequences from a YAML file.
    [[nodiscard]] foundation::GameResult<void> loadFromFile(const std::filesystem::path& path);

    [[nodiscard]] foundation::GameResult<void> loadFromString(std::string_view document);

    // -- Lookup ---------------------------------------------------------------

    [[nodiscard]] const game::ItemDefinition* findItem(foundation::ItemId id) const;
    [[nodiscard]] const game::QuestDefinition* findQuest(foundation::QuestId id) const;
    [[nodiscard]] const game::AchievementDefinition* findAchievement(foundation::AchievementId id) const;

    [[nodiscard]] std::vector<const game::AchievementDefinition*> achievements() const;

    [[nodiscard]] std::size_t itemCount() const;
    [[nodiscard]] std::size_t questCount() const;
    [[nodiscard]] std::size_t achievementCount() const;

private:
    [[nodiscard]] foundation::GameResult<void> loadDocument(const YAML::Node& root);

    mutable std::shared_mutex mutex_;
    std::map<foundation::ItemId, game::ItemDefinition> items_;
    std::map<foundation::QuestId, game::QuestDefinition> quests_;
    std::map<foundation::AchievementId, game::AchievementDefinition> achievements_;
};

}  // namespace gec::service
