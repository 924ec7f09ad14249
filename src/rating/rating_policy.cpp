/// @file rating_policy.cpp
/// @brief RatingPolicy lookup, margin classification and validation.

#include "rally/rating/rating_policy.hpp"

#include <cmath>
#include <string>

namespace rally::rating {

using foundation::ErrorCode;
using foundation::RallyError;
using foundation::RallyResult;

MultiplierTable defaultMultiplierTable() {
    using O = OutcomeClass;
    using L = FavorednessLevel;
    using M = MarginClass;
    return {
        // Underdog heavy wins (biggest gains)
        {{O::Underdog, L::Heavy, M::Narrow}, 25.0},
        {{O::Underdog, L::Heavy, M::Solid}, 30.0},
        {{O::Underdog, L::Heavy, M::Blowout}, 35.0},

        {{O::Underdog, L::Slight, M::Narrow}, 18.0},
        {{O::Underdog, L::Slight, M::Solid}, 22.0},
        {{O::Underdog, L::Slight, M::Blowout}, 26.0},

        {{O::Tossup, L::None, M::Narrow}, 12.0},
        {{O::Tossup, L::None, M::Solid}, 15.0},
        {{O::Tossup, L::None, M::Blowout}, 18.0},

        {{O::Favored, L::Slight, M::Narrow}, 8.0},
        {{O::Favored, L::Slight, M::Solid}, 10.0},
        {{O::Favored, L::Slight, M::Blowout}, 12.0},

        // Heavy favorite wins (minimal gains)
        {{O::Favored, L::Heavy, M::Narrow}, 3.0},
        {{O::Favored, L::Heavy, M::Solid}, 5.0},
        {{O::Favored, L::Heavy, M::Blowout}, 7.0},
    };
}

double RatingPolicy::multiplierFor(const PolicyKey& key) const {
    auto it = multipliers.find(key);
    return it != multipliers.end() ? it->second : fallbackMultiplier;
}

MarginClass RatingPolicy::classifyMargin(int margin) const noexcept {
    if (margin >= blowoutMargin) {
        return MarginClass::Blowout;
    }
    if (margin >= narrowMargin) {
        return MarginClass::Solid;
    }
    return MarginClass::Narrow;
}

RallyResult<void> RatingPolicy::validate() const {
    auto invalid = [](std::string msg) {
        return RallyResult<void>::err(RallyError(ErrorCode::InvalidPolicy, std::move(msg)));
    };

    if (!std::isfinite(defaultRating) || !std::isfinite(baseRatingDelta) ||
        !std::isfinite(winningBonus) || !std::isfinite(fallbackMultiplier)) {
        return invalid("rating policy values must be finite");
    }
    if (baseRatingDelta < 0.0) {
        return invalid("base rating delta must not be negative");
    }
    if (winningBonus < 0.0) {
        return invalid("winning bonus must not be negative");
    }
    if (tossupThreshold < 0.0 || slightThreshold < tossupThreshold) {
        return invalid("thresholds must satisfy 0 <= tossup_threshold <= slight_threshold");
    }
    if (narrowMargin < 0 || blowoutMargin < narrowMargin) {
        return invalid("margins must satisfy 0 <= narrow_margin <= blowout_margin");
    }
    for (const auto& [key, value] : multipliers) {
        if (!std::isfinite(value) || value < 0.0) {
            return invalid("multiplier for " + std::string(outcomeClassName(key.outcome)) + "/" +
                           std::string(favorednessName(key.level)) + "/" +
                           std::string(marginClassName(key.margin)) + " must be a non-negative number");
        }
    }
    return RallyResult<void>::ok();
}

} // namespace rally::rating
