#pragma once

/// @file types.hpp
/// @brief Strong surrogate-key types and time aliases shared by the engine.

#include <chrono>
#include <cstdint>
#include <functional>

namespace gec::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g., PlayerId and
/// ItemId) at compile time while keeping the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};
struct ItemIdTag {};
struct OrderIdTag {};
struct TradeIdTag {};
struct BattleIdTag {};
struct TournamentIdTag {};
struct MatchIdTag {};
struct AchievementIdTag {};
struct QuestIdTag {};

using PlayerId = StrongId<PlayerIdTag>;
using ItemId = StrongId<ItemIdTag, uint32_t>;
using OrderId = StrongId<OrderIdTag>;
using TradeId = StrongId<TradeIdTag>;
using BattleId = StrongId<BattleIdTag>;
using TournamentId = StrongId<TournamentIdTag>;
using MatchId = StrongId<MatchIdTag>;
using AchievementId = StrongId<AchievementIdTag, uint32_t>;
using QuestId = StrongId<QuestIdTag, uint32_t>;

/// Wall-clock instant. system_clock is UTC, so stored values are
/// timezone-independent.
using Timestamp = std::chrono::system_clock::time_point;

/// Source of the current time; injectable so tests control ordering.
using Clock = std::function<Timestamp()>;

/// Default clock reading std::chrono::system_clock.
inline Timestamp systemNow() {
    return std::chrono::system_clock::now();
}

/// Microseconds since the Unix epoch, as stored in the database.
inline int64_t toEpochMicros(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               ts.time_since_epoch())
        .count();
}

/// Inverse of toEpochMicros().
inline Timestamp fromEpochMicros(int64_t micros) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::microseconds(micros)));
}

} // namespace gec::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<gec::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const gec::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
