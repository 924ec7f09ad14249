#pragma once

/// @file iskill_estimator.hpp
/// @brief Seam for probabilistic skill estimators.

#include <span>
#include <string_view>
#include <vector>

#include "rally/foundation/rally_result.hpp"
#include "rally/league/match_store.hpp"
#include "rally/rating/skill_types.hpp"

namespace rally::rating {

/// A skill estimator consumes chronologically ordered (winners, losers)
/// compositions and returns a (mu, sigma) estimate per player.
///
/// Implementations hold no state between estimate() calls that would make
/// a second call depend on the first.
class ISkillEstimator {
public:
    virtual ~ISkillEstimator() = default;

    /// Short identifier used in logs (e.g. "trueskill").
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Estimate skills from the given compositions.
    /// @return One estimate per player seen, or EstimatorFailed.
    [[nodiscard]] virtual foundation::RallyResult<SkillTable> estimate(
        std::span<const Composition> compositions) = 0;
};

/// The store's games as compositions, in chronological order.
[[nodiscard]] std::vector<Composition> compositionsOf(const league::MatchStore& store);

} // namespace rally::rating
