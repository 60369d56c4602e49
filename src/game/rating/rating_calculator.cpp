/// @file rating_calculator.cpp
/// @brief RatingCalculator implementation.

#include "gec/game/rating_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace gec::game {

double RatingCalculator::expectedScore(int32_t rating, int32_t opponent) {
    double exponent = static_cast<double>(opponent - rating) / 400.0;
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

double RatingCalculator::kFactor(double uncertainty, const RatingParams& params) {
    double span = params.uncertaintyMax - params.uncertaintyFloor;
    if (span <= 0.0) {
        return params.kMax;
    }
    double weight = std::clamp((uncertainty - params.uncertaintyFloor) / span, 0.0, 1.0);
    return params.kMin + (params.kMax - params.kMin) * weight;
}

int32_t RatingCalculator::newRating(int32_t currentRating,
                                    double actualScore,
                                    double expected,
                                    double k) {
    double delta = k * (actualScore - expected);
    return currentRating + static_cast<int32_t>(std::lround(delta));
}

double RatingCalculator::shrinkUncertainty(double uncertainty, const RatingParams& params) {
    return std::max(params.uncertaintyFloor, uncertainty * params.uncertaintyShrink);
}

double RatingCalculator::decayUncertainty(double uncertainty,
                                          int64_t periods,
                                          const RatingParams& params) {
    if (periods <= 0) {
        return uncertainty;
    }
    double c = params.decayConstant;
    double grown = std::sqrt(uncertainty * uncertainty +
                             c * c * static_cast<double>(periods));
    return std::min(params.uncertaintyMax, grown);
}

}  // namespace gec::game
