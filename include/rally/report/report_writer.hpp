#pragma once

/// @file report_writer.hpp
/// @brief Tabular CSV output of ratings, skill estimates, synergy and pools.

#include <iosfwd>
#include <span>
#include <string>

#include "rally/pool/pool_partitioner.hpp"
#include "rally/rating/rating_store.hpp"
#include "rally/rating/skill_types.hpp"
#include "rally/synergy/synergy_analyzer.hpp"

namespace rally::report {

struct ReportOptions {
    /// Digits after the decimal point for every real-valued column.
    int precision = 2;
};

/// "Rank,Player,Rating", highest rating first.
void writeRatingTable(std::ostream& out, const rating::RatingStore& ratings,
                      const ReportOptions& options = {});

/// "Rank,Player,Mu,Sigma", highest mu first, ties by name.
void writeSkillTable(std::ostream& out, const rating::SkillTable& skills,
                     const ReportOptions& options = {});

/// "Rank,Partnership,Player1,Player2,Team,Synergy_Score,Win_Rate,Games,Individual_Strength"
/// in the order given (the analyzer already ranks by synergy).
void writeSynergyTable(std::ostream& out, std::span<const synergy::SynergyEntry> entries,
                       const ReportOptions& options = {});

/// Human-readable pool listing:
///   Found N disconnected player pools.
///   Pool 1 - 3 players: A, B, C
void writePoolReport(std::ostream& out, std::span<const pool::Pool> pools);

/// Fixed-point text of a value.
[[nodiscard]] std::string formatFixed(double value, int precision);

} // namespace rally::report
