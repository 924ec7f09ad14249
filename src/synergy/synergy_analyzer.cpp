/// @file synergy_analyzer.cpp
/// @brief SynergyAnalyzer scoring and ranking.

#include "rally/synergy/synergy_analyzer.hpp"

#include <algorithm>
#include <cmath>

#include "rally/foundation/rally_logger.hpp"

namespace rally::synergy {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RallyError;
using foundation::RallyResult;

namespace {

RallyResult<double> strengthOf(const rating::SkillMap& skills, const PartnershipKey& pair) {
    for (const auto* player : {&pair.first, &pair.second}) {
        if (skills.find(*player) == skills.end()) {
            return RallyResult<double>::err(
                RallyError(ErrorCode::MissingSkillEstimate,
                           "no skill estimate for player '" + *player + "'"));
        }
    }
    return RallyResult<double>::ok(skills.find(pair.first)->second +
                                   skills.find(pair.second)->second);
}

} // namespace

SynergyAnalyzer::SynergyAnalyzer(SynergyConfig config)
    : config_(config) {}

double SynergyAnalyzer::expectedWin(double teamStrength, double opponentStrength, double scale) {
    return 1.0 / (1.0 + std::pow(10.0, (opponentStrength - teamStrength) / scale));
}

RallyResult<std::vector<SynergyEntry>> SynergyAnalyzer::analyze(
    const PartnershipLedger& ledger, const rating::SkillMap& skills) const {
    using Entries = RallyResult<std::vector<SynergyEntry>>;

    std::vector<SynergyEntry> entries;
    std::size_t excluded = 0;

    for (const auto& [key, rec] : ledger.partnerships()) {
        if (rec.gamesPlayed() < config_.minGames) {
            ++excluded;
            continue;
        }

        auto team = strengthOf(skills, key);
        if (!team) {
            return Entries::err(team.error());
        }

        double totalPerformance = 0.0;
        for (const auto& game : rec.games) {
            auto opponents = strengthOf(skills, game.opponents);
            if (!opponents) {
                return Entries::err(opponents.error());
            }
            double expected = expectedWin(team.value(), opponents.value(), config_.logisticScale);
            double actual = game.won ? 1.0 : 0.0;
            totalPerformance += actual - expected;
        }

        SynergyEntry entry;
        entry.partnership = key;
        entry.synergyScore = totalPerformance / static_cast<double>(rec.gamesPlayed()) * 100.0;
        entry.winRate = rec.winRate();
        entry.gamesPlayed = rec.gamesPlayed();
        entry.meanScoreDiff = rec.meanScoreDiff();
        entry.individualStrength = team.value();
        entries.push_back(std::move(entry));
    }

    // Ledger order is alphabetical, so equal scores stay in name order.
    std::stable_sort(entries.begin(), entries.end(), [](const SynergyEntry& lhs, const SynergyEntry& rhs) {
        return lhs.synergyScore > rhs.synergyScore;
    });

    RALLY_LOG_DEBUG(LogCategory::Synergy,
                    "scored " + std::to_string(entries.size()) + " partnerships, " +
                        std::to_string(excluded) + " below " + std::to_string(config_.minGames) +
                        " games excluded");
    return Entries::ok(std::move(entries));
}

RallyResult<std::vector<SynergyEntry>> SynergyAnalyzer::analyze(
    const league::MatchStore& store, const rating::SkillMap& skills) const {
    auto result = analyze(PartnershipLedger::fromStore(store), skills);
    if (!result) {
        return result;
    }
    for (auto& entry : result.value()) {
        entry.team = store.teamOf(entry.partnership.first).value_or("");
    }
    return result;
}

} // namespace rally::synergy
