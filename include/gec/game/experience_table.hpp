#pragma once

/// @file experience_table.hpp
/// @brief Level <-> experience conversion using the standard 99-level curve.

#include <cstdint>

namespace gec::game {

/// Minimum experience required to reach @p level.
///
/// Levels outside 1..99 are clamped into range.
[[nodiscard]] int64_t experienceForLevel(int32_t level);

/// Highest level whose experience threshold is <= @p experience (1..99).
[[nodiscard]] int32_t levelForExperience(int64_t experience);

}  // namespace gec::game
