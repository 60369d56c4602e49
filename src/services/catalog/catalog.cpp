/// @file catalog.cpp
/// @brief Catalog registration, lookup and YAML loading.

#include "gec/service/catalog.hpp"

#include <mutex>
#include <optional>
#include <string>

#include "gec/foundation/game_logger.hpp"

namespace gec::service {

using gec::foundation::AchievementId;
using gec::foundation::ErrorCode;
using gec::foundation::GameError;
using gec::foundation::GameResult;
using gec::foundation::ItemId;
using gec::foundation::LogCategory;
using gec::foundation::QuestId;

namespace {

// -- YAML decoding --------------------------------------------------------------
// Decoders return nullopt and fill `why` on malformed input.

template <typename T>
T field(const YAML::Node& node, const char* key, T fallback) {
    auto child = node[key];
    return child ? child.as<T>() : fallback;
}

std::optional<game::Requirement> decodeRequirement(const YAML::Node& node, std::string& why) {
    auto type = field<std::string>(node, "type", "");
    if (type == "level") {
        auto skill = game::parseSkill(field<std::string>(node, "skill", ""));
        if (!skill) {
            why = "unknown skill in level requirement";
            return std::nullopt;
        }
        return game::LevelRequirement{*skill, field<int32_t>(node, "level", 1)};
    }
    if (type == "quest") {
        return game::QuestRequirement{QuestId(field<uint32_t>(node, "quest", 0))};
    }
    if (type == "item") {
        return game::ItemRequirement{ItemId(field<uint32_t>(node, "item", 0)),
                                     field<int64_t>(node, "quantity", 1)};
    }
    if (type == "combat_level") {
        return game::CombatLevelRequirement{field<int32_t>(node, "level", 3)};
    }
    if (type == "total_level") {
        return game::TotalLevelRequirement{field<int32_t>(node, "level", 32)};
    }
    why = "unknown requirement type '" + type + "'";
    return std::nullopt;
}

std::optional<game::RequirementList> decodeRequirements(const YAML::Node& node, std::string& why) {
    game::RequirementList list;
    if (!node) {
        return list;
    }
    for (const auto& entry : node) {
        auto req = decodeRequirement(entry, why);
        if (!req) {
            return std::nullopt;
        }
        list.push_back(std::move(*req));
    }
    return list;
}

game::EquipmentBonuses decodeBonuses(const YAML::Node& node) {
    game::EquipmentBonuses b;
    if (!node) {
        return b;
    }
    b.attackStab = field<int32_t>(node, "attack_stab", 0);
    b.attackSlash = field<int32_t>(node, "attack_slash", 0);
    b.attackCrush = field<int32_t>(node, "attack_crush", 0);
    b.attackMagic = field<int32_t>(node, "attack_magic", 0);
    b.attackRanged = field<int32_t>(node, "attack_ranged", 0);
    b.defenceStab = field<int32_t>(node, "defence_stab", 0);
    b.defenceSlash = field<int32_t>(node, "defence_slash", 0);
    b.defenceCrush = field<int32_t>(node, "defence_crush", 0);
    b.defenceMagic = field<int32_t>(node, "defence_magic", 0);
    b.defenceRanged = field<int32_t>(node, "defence_ranged", 0);
    b.meleeStrength = field<int32_t>(node, "melee_strength", 0);
    b.rangedStrength = field<int32_t>(node, "ranged_strength", 0);
    b.magicDamage = field<int32_t>(node, "magic_damage", 0);
    b.prayer = field<int32_t>(node, "prayer", 0);
    return b;
}

std::optional<game::ItemDefinition> decodeItem(const YAML::Node& node, std::string& why) {
    game::ItemDefinition item;
    item.id = ItemId(field<uint32_t>(node, "id", 0));
    item.name = field<std::string>(node, "name", "");
    item.tradeable = field<bool>(node, "tradeable", true);
    item.stackable = field<bool>(node, "stackable", false);
    item.equipable = field<bool>(node, "equipable", false);
    if (auto slot = node["slot"]) {
        item.slot = game::parseEquipSlot(slot.as<std::string>());
        if (!item.slot) {
            why = "unknown equipment slot for item " + item.name;
            return std::nullopt;
        }
    }
    item.value = field<int64_t>(node, "value", 0);
    item.highAlch = field<int64_t>(node, "high_alch", 0);
    item.lowAlch = field<int64_t>(node, "low_alch", 0);
    item.weight = field<double>(node, "weight", 0.0);
    item.buyLimit = field<int64_t>(node, "buy_limit", 0);
    item.bonuses = decodeBonuses(node["bonuses"]);
    auto reqs = decodeRequirements(node["requirements"], why);
    if (!reqs) {
        return std::nullopt;
    }
    item.equipRequirements = std::move(*reqs);
    return item;
}

std::optional<game::QuestDefinition> decodeQuest(const YAML::Node& node, std::string& why) {
    game::QuestDefinition quest;
    quest.id = QuestId(field<uint32_t>(node, "id", 0));
    quest.name = field<std::string>(node, "name", "");
    quest.difficulty = field<std::string>(node, "difficulty", "");
    quest.questPoints = field<int32_t>(node, "quest_points", 1);
    auto reqs = decodeRequirements(node["requirements"], why);
    if (!reqs) {
        return std::nullopt;
    }
    quest.requirements = std::move(*reqs);
    return quest;
}

std::optional<game::AchievementCriterion> decodeCriterion(const YAML::Node& node, std::string& why) {
    auto type = field<std::string>(node, "type", "");
    auto value = field<int32_t>(node, "value", 0);
    std::optional<game::BattleCategory> category;
    if (auto cat = node["category"]) {
        category = game::parseBattleCategory(cat.as<std::string>());
        if (!category) {
            why = "unknown battle category '" + cat.as<std::string>() + "'";
            return std::nullopt;
        }
    }
    if (type == "win_streak") {
        return game::WinStreakAtLeast{value, category};
    }
    if (type == "wins") {
        return game::WinsAtLeast{value, category};
    }
    if (type == "battles") {
        return game::BattlesAtLeast{value, category};
    }
    if (type == "rating") {
        return game::RatingAtLeast{value, category};
    }
    if (type == "total_level") {
        return game::TotalLevelAtLeast{value};
    }
    if (type == "combat_level") {
        return game::CombatLevelAtLeast{value};
    }
    if (type == "quest_points") {
        return game::QuestPointsAtLeast{value};
    }
    why = "unknown achievement criterion '" + type + "'";
    return std::nullopt;
}

std::optional<game::AchievementDefinition> decodeAchievement(const YAML::Node& node,
                                                             std::string& why) {
    game::AchievementDefinition achievement;
    achievement.id = AchievementId(field<uint32_t>(node, "id", 0));
    achievement.name = field<std::string>(node, "name", "");
    achievement.description = field<std::string>(node, "description", "");
    auto criterion = decodeCriterion(node["criterion"], why);
    if (!criterion) {
        return std::nullopt;
    }
    achievement.criterion = std::move(*criterion);
    return achievement;
}

GameError malformed(const std::string& why) {
    return GameError(ErrorCode::ConfigLoadFailed, "malformed catalog: " + why);
}

}  // namespace

// -- Registration -------------------------------------------------------------

GameResult<void> Catalog::addItem(game::ItemDefinition item) {
    if (!item.id.isValid() || item.name.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "item needs an id and a name"));
    }
    if (item.equipable && !item.slot) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "equipable item " + item.name + " has no slot"));
    }
    if (item.buyLimit < 0 || item.value < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "item " + item.name + " has a negative limit or value"));
    }
    std::unique_lock lock(mutex_);
    auto id = item.id;
    items_.insert_or_assign(id, std::move(item));
    return GameResult<void>::ok();
}

GameResult<void> Catalog::addQuest(game::QuestDefinition quest) {
    if (!quest.id.isValid() || quest.questPoints < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "quest needs an id and non-negative points"));
    }
    std::unique_lock lock(mutex_);
    auto id = quest.id;
    quests_.insert_or_assign(id, std::move(quest));
    return GameResult<void>::ok();
}

GameResult<void> Catalog::addAchievement(game::AchievementDefinition achievement) {
    if (!achievement.id.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "achievement needs an id"));
    }
    std::unique_lock lock(mutex_);
    auto id = achievement.id;
    achievements_.insert_or_assign(id, std::move(achievement));
    return GameResult<void>::ok();
}

GameResult<void> Catalog::loadFromFile(const std::filesystem::path& path) {
    try {
        auto loaded = loadDocument(YAML::LoadFile(path.string()));
        if (loaded) {
            GEC_LOG_INFO(LogCategory::Config,
                         "catalog loaded from " + path.string() + ": " +
                             std::to_string(itemCount()) + " items, " +
                             std::to_string(questCount()) + " quests, " +
                             std::to_string(achievementCount()) + " achievements");
        }
        return loaded;
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open catalog file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<void> Catalog::loadFromString(std::string_view document) {
    try {
        return loadDocument(YAML::Load(std::string(document)));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<void> Catalog::loadDocument(const YAML::Node& root) {
    std::vector<game::ItemDefinition> items;
    std::vector<game::QuestDefinition> quests;
    std::vector<game::AchievementDefinition> achievements;
    std::string why;

    // Decode everything before registering anything.
    try {
        for (const auto& node : root["items"]) {
            auto item = decodeItem(node, why);
            if (!item) {
                return GameResult<void>::err(malformed(why));
            }
            items.push_back(std::move(*item));
        }
        for (const auto& node : root["quests"]) {
            auto quest = decodeQuest(node, why);
            if (!quest) {
                return GameResult<void>::err(malformed(why));
            }
            quests.push_back(std::move(*quest));
        }
        for (const auto& node : root["achievements"]) {
            auto achievement = decodeAchievement(node, why);
            if (!achievement) {
                return GameResult<void>::err(malformed(why));
            }
            achievements.push_back(std::move(*achievement));
        }
    } catch (const YAML::Exception& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigTypeMismatch, std::string("catalog field: ") + e.what()));
    }

    for (auto& item : items) {
        auto added = addItem(std::move(item));
        if (!added) {
            return added;
        }
    }
    for (auto& quest : quests) {
        auto added = addQuest(std::move(quest));
        if (!added) {
            return added;
        }
    }
    for (auto& achievement : achievements) {
        auto added = addAchievement(std::move(achievement));
        if (!added) {
            return added;
        }
    }
    return GameResult<void>::ok();
}

// -- Lookup -------------------------------------------------------------------

const game::ItemDefinition* Catalog::findItem(ItemId id) const {
    std::shared_lock lock(mutex_);
    auto it = items_.find(id);
    return it == items_.end() ? nullptr : &it->second;
}

const game::QuestDefinition* Catalog::findQuest(QuestId id) const {
    std::shared_lock lock(mutex_);
    auto it = quests_.find(id);
    return it == quests_.end() ? nullptr : &it->second;
}

const game::AchievementDefinition* Catalog::findAchievement(AchievementId id) const {
    std::shared_lock lock(mutex_);
    auto it = achievements_.find(id);
    return it == achievements_.end() ? nullptr : &it->second;
}

std::vector<const game::AchievementDefinition*> Catalog::achievements() const {
    std::shared_lock lock(mutex_);
    std::vector<const game::AchievementDefinition*> out;
    out.reserve(achievements_.size());
    for (const auto& [id, def] : achievements_) {
        out.push_back(&def);
    }
    return out;
}

std::size_t Catalog::itemCount() const {
    std::shared_lock lock(mutex_);
    return items_.size();
}

std::size_t Catalog::questCount() const {
    std::shared_lock lock(mutex_);
    return quests_.size();
}

std::size_t Catalog::achievementCount() const {
    std::shared_lock lock(mutex_);
    return achievements_.size();
}

}  // namespace gec::service
