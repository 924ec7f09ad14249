#pragma once

/// @file trueskill_estimator.hpp
/// @brief Sequential two-team TrueSkill estimator without draws.

#include "rally/rating/iskill_estimator.hpp"

namespace rally::rating {

/// Prior and noise parameters. Defaults give every player a wide initial
/// uncertainty and no skill drift between games.
struct TrueSkillParams {
    double mu = 25.0;     ///< Prior mean.
    double sigma = 8.333; ///< Prior standard deviation.
    double beta = 4.1667; ///< Per-game performance noise.
    double tau = 0.0;     ///< Dynamics noise added before each game.
};

/// Applies the TrueSkill factor-graph update for a two-team, no-draw game
/// one composition at a time. Team performance is the sum of both
/// players' skills.
///
/// For winners W and losers L with c^2 = sum(sigma_i^2) + 4*beta^2 and
/// t = (sum mu_W - sum mu_L) / c:
///   mu_i     += +/- sigma_i^2 / c * v(t)
///   sigma_i^2 *= 1 - sigma_i^2 / c^2 * w(t)
/// where v(t) = pdf(t) / cdf(t) and w(t) = v(t) * (v(t) + t).
class TrueSkillEstimator final : public ISkillEstimator {
public:
    explicit TrueSkillEstimator(TrueSkillParams params = {});

    [[nodiscard]] std::string_view name() const override { return "trueskill"; }

    [[nodiscard]] foundation::RallyResult<SkillTable> estimate(
        std::span<const Composition> compositions) override;

    [[nodiscard]] const TrueSkillParams& params() const noexcept { return params_; }

    /// Mean-shift factor for a win at normalized performance gap t.
    [[nodiscard]] static double vWin(double t);

    /// Variance-shrink factor for a win at normalized performance gap t.
    [[nodiscard]] static double wWin(double t);

private:
    TrueSkillParams params_;
};

} // namespace rally::rating
