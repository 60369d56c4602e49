#pragma once

/// @file rating_calculator.hpp
/// @brief Uncertainty-weighted Elo rating maths for battle results.
///
/// Ratings follow the standard Elo expected-score formula:
///   E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
/// with a K-factor that scales with the player's rating uncertainty, so
/// new or long-inactive players move faster than settled ones.

#include <chrono>
#include <cstdint>

namespace gec::game {

/// Tunable constants, read from the `rating.*` config keys.
struct RatingParams {
    int32_t initialRating = 1000;
    double initialUncertainty = 350.0;
    double uncertaintyFloor = 50.0;
    double uncertaintyMax = 350.0;
    double kMin = 16.0;
    double kMax = 40.0;

    /// Multiplier applied to uncertainty after every rated battle.
    double uncertaintyShrink = 0.95;

    /// Growth constant c in sqrt(u^2 + c^2 * periods).
    double decayConstant = 35.0;
    std::chrono::hours decayPeriod{24 * 30};
};

/// Static utility class for rating calculations.
class RatingCalculator {
public:
    RatingCalculator() = delete;

    /// Expected score for a player rated @p rating against @p opponent.
    /// @return Expected score in (0.0, 1.0).
    [[nodiscard]] static double expectedScore(int32_t rating, int32_t opponent);

    /// K = kMin + (kMax - kMin) * (u - uFloor) / (uMax - uFloor),
    /// clamped to [kMin, kMax].
    [[nodiscard]] static double kFactor(double uncertainty, const RatingParams& params);

    /// rating + round(K * (actual - expected)).
    [[nodiscard]] static int32_t newRating(int32_t currentRating,
                                           double actualScore,
                                           double expectedScore,
                                           double kFactor);

    /// max(uFloor, u * shrink).
    [[nodiscard]] static double shrinkUncertainty(double uncertainty,
                                                  const RatingParams& params);

    /// min(uMax, sqrt(u^2 + c^2 * periods)).
    [[nodiscard]] static double decayUncertainty(double uncertainty,
                                                 int64_t periods,
                                                 const RatingParams& params);
};

}  // namespace gec::game
