/// @file report_writer.cpp
/// @brief CSV table writers.

#include "rally/report/report_writer.hpp"

#include <algorithm>
#include <cstdio>
#include <ostream>
#include <string_view>
#include <vector>

#include "rally/foundation/rally_logger.hpp"
#include "rally/io/csv_reader.hpp"

namespace rally::report {

using foundation::LogCategory;

std::string formatFixed(double value, int precision) {
    precision = std::clamp(precision, 0, 17);
    char buf[64];
    int n = std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    if (n < 0) {
        return {};
    }
    std::string text(buf, static_cast<std::size_t>(std::min(n, static_cast<int>(sizeof(buf)) - 1)));
    // Avoid printing "-0.00" for values that round to zero.
    if (text.starts_with('-') && text.find_first_not_of("-0.") == std::string::npos) {
        text.erase(0, 1);
    }
    return text;
}

void writeRatingTable(std::ostream& out, const rating::RatingStore& ratings,
                      const ReportOptions& options) {
    out << "Rank,Player,Rating\n";
    std::size_t rank = 0;
    for (const auto& entry : ratings.ranked()) {
        out << ++rank << ',' << io::csvField(entry.player) << ','
            << formatFixed(entry.rating, options.precision) << '\n';
    }
    RALLY_LOG_DEBUG(LogCategory::Report, "wrote " + std::to_string(rank) + " rating rows");
}

void writeSkillTable(std::ostream& out, const rating::SkillTable& skills,
                     const ReportOptions& options) {
    std::vector<std::pair<std::string_view, rating::SkillEstimate>> rows(skills.begin(),
                                                                         skills.end());
    std::stable_sort(rows.begin(), rows.end(),
                     [](const auto& a, const auto& b) { return a.second.mu > b.second.mu; });

    out << "Rank,Player,Mu,Sigma\n";
    std::size_t rank = 0;
    for (const auto& [player, estimate] : rows) {
        out << ++rank << ',' << io::csvField(player) << ','
            << formatFixed(estimate.mu, options.precision) << ','
            << formatFixed(estimate.sigma, options.precision) << '\n';
    }
    RALLY_LOG_DEBUG(LogCategory::Report, "wrote " + std::to_string(rank) + " skill rows");
}

void writeSynergyTable(std::ostream& out, std::span<const synergy::SynergyEntry> entries,
                       const ReportOptions& options) {
    out << "Rank,Partnership,Player1,Player2,Team,Synergy_Score,Win_Rate,Games,"
           "Individual_Strength\n";
    std::size_t rank = 0;
    for (const auto& entry : entries) {
        out << ++rank << ',' << io::csvField(entry.partnership.label()) << ','
            << io::csvField(entry.partnership.first) << ','
            << io::csvField(entry.partnership.second) << ',' << io::csvField(entry.team) << ','
            << formatFixed(entry.synergyScore, options.precision) << ','
            << formatFixed(entry.winRate, options.precision) << ',' << entry.gamesPlayed << ','
            << formatFixed(entry.individualStrength, options.precision) << '\n';
    }
    RALLY_LOG_DEBUG(LogCategory::Report, "wrote " + std::to_string(rank) + " synergy rows");
}

void writePoolReport(std::ostream& out, std::span<const pool::Pool> pools) {
    out << "Found " << pools.size() << " disconnected player pools.\n";
    std::size_t index = 0;
    for (const auto& pool : pools) {
        out << "Pool " << ++index << " - " << pool.size() << " players: ";
        for (std::size_t i = 0; i < pool.members.size(); ++i) {
            if (i > 0) {
                out << ", ";
            }
            out << pool.members[i];
        }
        out << '\n';
    }
}

} // namespace rally::report
