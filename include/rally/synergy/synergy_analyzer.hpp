#pragma once

/// @file synergy_analyzer.hpp
/// @brief Partnership synergy: results relative to individual-skill expectation.
///
/// For every game of a partnership the expected win probability is
///   expected = 1 / (1 + 10^((opponentStrength - teamStrength) / scale))
/// where each strength is the sum of two players' skill locations.
/// synergy = 100 * mean(actual - expected). A positive score means the pair
/// wins more often than its players' individual skills predict.

#include <cstddef>
#include <string>
#include <vector>

#include "rally/foundation/rally_result.hpp"
#include "rally/league/match_store.hpp"
#include "rally/rating/skill_types.hpp"
#include "rally/synergy/partnership_ledger.hpp"

namespace rally::synergy {

struct SynergyConfig {
    /// Partnerships with fewer joint games are left out of the result.
    std::size_t minGames = 2;
    /// Logistic scale of the expectation model.
    double logisticScale = 10.0;
};

/// One ranked row of synergy output.
struct SynergyEntry {
    PartnershipKey partnership;
    std::string team;
    double synergyScore = 0.0;
    double winRate = 0.0;
    std::size_t gamesPlayed = 0;
    double meanScoreDiff = 0.0;
    double individualStrength = 0.0;
};

/// Scores partnerships against any player -> skill mapping.
class SynergyAnalyzer {
public:
    explicit SynergyAnalyzer(SynergyConfig config = {});

    /// Logistic win expectation of a team against its opponents.
    [[nodiscard]] static double expectedWin(double teamStrength, double opponentStrength,
                                            double scale);

    /// Score every partnership with at least minGames games.
    ///
    /// @return Entries sorted by synergy score (highest first), or
    ///         MissingSkillEstimate if any player in an eligible
    ///         partnership's history is absent from @p skills.
    [[nodiscard]] foundation::RallyResult<std::vector<SynergyEntry>> analyze(
        const PartnershipLedger& ledger, const rating::SkillMap& skills) const;

    /// Build the ledger from a store and fill each entry's team name from
    /// the team the first player was first recorded on.
    [[nodiscard]] foundation::RallyResult<std::vector<SynergyEntry>> analyze(
        const league::MatchStore& store, const rating::SkillMap& skills) const;

    [[nodiscard]] const SynergyConfig& config() const noexcept { return config_; }

private:
    SynergyConfig config_;
};

} // namespace rally::synergy
