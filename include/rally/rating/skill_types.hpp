#pragma once

/// @file skill_types.hpp
/// @brief Skill values exchanged between rating sources and consumers.

#include <array>
#include <functional>
#include <map>
#include <string>

namespace rally::rating {

/// Player name -> scalar skill location. The synergy analyzer consumes
/// this regardless of which rating source produced it.
using SkillMap = std::map<std::string, double, std::less<>>;

/// Probabilistic skill estimate: location and uncertainty.
struct SkillEstimate {
    double mu = 0.0;
    double sigma = 0.0;

    /// Conservative skill, three standard deviations below the mean.
    [[nodiscard]] double exposed() const noexcept { return mu - 3.0 * sigma; }
};

using SkillTable = std::map<std::string, SkillEstimate, std::less<>>;

/// Reduce estimates to their location values.
[[nodiscard]] inline SkillMap locationsOf(const SkillTable& table) {
    SkillMap skills;
    for (const auto& [player, estimate] : table) {
        skills.emplace(player, estimate.mu);
    }
    return skills;
}

/// Winning and losing pair of one game, in the order an estimator sees them.
struct Composition {
    std::array<std::string, 2> winners;
    std::array<std::string, 2> losers;
};

} // namespace rally::rating
