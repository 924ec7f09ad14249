/// @file trueskill_estimator.cpp
/// @brief TrueSkillEstimator update rule.

#include "rally/rating/trueskill_estimator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <string>

#include "rally/foundation/rally_logger.hpp"

namespace rally::rating {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RallyError;
using foundation::RallyResult;

namespace {

// Below this the normal cdf is treated as zero and v, w use their limits.
constexpr double kMinCdf = 2.222758749e-162;

// sigma^2 never shrinks below this fraction of its pre-game value.
constexpr double kMinVarianceFactor = 1e-4;

double normalPdf(double x) {
    return std::exp(-0.5 * x * x) / std::sqrt(2.0 * std::numbers::pi);
}

double normalCdf(double x) {
    return 0.5 * std::erfc(-x / std::numbers::sqrt2);
}

} // namespace

TrueSkillEstimator::TrueSkillEstimator(TrueSkillParams params)
    : params_(params) {}

double TrueSkillEstimator::vWin(double t) {
    double denom = normalCdf(t);
    if (denom < kMinCdf) {
        return -t;
    }
    return normalPdf(t) / denom;
}

double TrueSkillEstimator::wWin(double t) {
    double denom = normalCdf(t);
    if (denom < kMinCdf) {
        return t < 0.0 ? 1.0 : 0.0;
    }
    double v = vWin(t);
    return v * (v + t);
}

RallyResult<SkillTable> TrueSkillEstimator::estimate(std::span<const Composition> compositions) {
    if (!(params_.sigma > 0.0) || !(params_.beta > 0.0) || params_.tau < 0.0 ||
        !std::isfinite(params_.mu)) {
        return RallyResult<SkillTable>::err(
            RallyError(ErrorCode::InvalidPolicy,
                       "trueskill parameters require sigma > 0, beta > 0 and tau >= 0"));
    }

    SkillTable table;
    auto lookup = [&](const std::string& player) -> SkillEstimate& {
        return table.try_emplace(player, SkillEstimate{params_.mu, params_.sigma}).first->second;
    };

    std::size_t index = 0;
    for (const auto& comp : compositions) {
        const std::array<const std::string*, 4> names = {
            &comp.winners[0], &comp.winners[1], &comp.losers[0], &comp.losers[1]};
        for (const auto* name : names) {
            if (name->empty()) {
                return RallyResult<SkillTable>::err(
                    RallyError(ErrorCode::EstimatorFailed,
                               "composition " + std::to_string(index) + " has an empty player slot"));
            }
        }

        std::array<SkillEstimate, 4> prior;
        std::array<double, 4> variance{};
        double sumVariance = 0.0;
        for (std::size_t i = 0; i < 4; ++i) {
            prior[i] = lookup(*names[i]);
            variance[i] = prior[i].sigma * prior[i].sigma + params_.tau * params_.tau;
            sumVariance += variance[i];
        }

        double c = std::sqrt(sumVariance + 4.0 * params_.beta * params_.beta);
        double t = ((prior[0].mu + prior[1].mu) - (prior[2].mu + prior[3].mu)) / c;
        double v = vWin(t);
        double w = wWin(t);

        for (std::size_t i = 0; i < 4; ++i) {
            double sign = i < 2 ? 1.0 : -1.0;
            double factor = std::max(1.0 - variance[i] / (c * c) * w, kMinVarianceFactor);
            auto& est = lookup(*names[i]);
            est.mu = prior[i].mu + sign * variance[i] / c * v;
            est.sigma = std::sqrt(variance[i] * factor);
        }
        ++index;
    }

    RALLY_LOG_INFO(LogCategory::Estimator,
                   "trueskill estimated " + std::to_string(table.size()) + " players from " +
                       std::to_string(compositions.size()) + " games");
    return RallyResult<SkillTable>::ok(std::move(table));
}

} // namespace rally::rating
