/// @file experience_table.cpp
/// @brief Experience table lookups.

#include "gec/game/experience_table.hpp"

#include "gec/game/skill_types.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace gec::game {

namespace {

using Table = std::array<int64_t, kMaxSkillLevel + 1>;

// thresholds[L] = floor(sum_{l=1}^{L-1} floor(l + 300 * 2^(l/7)) / 4)
Table buildTable() {
    Table thresholds{};
    int64_t points = 0;
    thresholds[1] = 0;
    for (int32_t level = 1; level < kMaxSkillLevel; ++level) {
        points += static_cast<int64_t>(
            std::floor(level + 300.0 * std::pow(2.0, level / 7.0)));
        thresholds[level + 1] = points / 4;
    }
    return thresholds;
}

const Table& table() {
    static const Table thresholds = buildTable();
    return thresholds;
}

}  // namespace

int64_t experienceForLevel(int32_t level) {
    level = std::clamp(level, kMinSkillLevel, kMaxSkillLevel);
    return table()[static_cast<std::size_t>(level)];
}

int32_t levelForExperience(int64_t experience) {
    const auto& thresholds = table();
    // First threshold strictly greater than experience, searched over 1..99.
    auto it = std::upper_bound(thresholds.begin() + 1, thresholds.end(), experience);
    auto level = static_cast<int32_t>(std::distance(thresholds.begin(), it)) - 1;
    return std::clamp(level, kMinSkillLevel, kMaxSkillLevel);
}

}  // namespace gec::game
