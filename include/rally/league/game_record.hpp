#pragma once

/// @file game_record.hpp
/// @brief Value types for recorded doubles games.
///
/// A Game is one best-of-set game inside a league match: two named teams
/// of exactly two players each and the points both teams scored.

#include <array>
#include <chrono>
#include <string>
#include <string_view>

#include "rally/foundation/rally_result.hpp"

namespace rally::league {

/// Player-slot marker for a team that defaulted the game.
inline constexpr std::string_view kForfeitSentinel = "DEFAULT";

using MatchDate = std::chrono::year_month_day;

/// Parse a strict YYYY-MM-DD calendar date.
/// @return The date, or InvalidDate for malformed text or impossible days.
[[nodiscard]] foundation::RallyResult<MatchDate> parseMatchDate(std::string_view text);

/// Format a date back to YYYY-MM-DD.
[[nodiscard]] std::string formatMatchDate(MatchDate date);

/// One side of a game: a team name and its two players.
struct Team {
    std::string name;
    std::string first;
    std::string second;

    [[nodiscard]] bool contains(std::string_view player) const noexcept {
        return first == player || second == player;
    }

    /// True if either slot holds the forfeit sentinel.
    [[nodiscard]] bool isForfeit() const noexcept {
        return first == kForfeitSentinel || second == kForfeitSentinel;
    }
};

/// A recorded game. Scores are never equal for an accepted game.
struct Game {
    std::string matchId;
    int gameNumber = 0;
    MatchDate date{};
    Team team1;
    Team team2;
    int team1Points = 0;
    int team2Points = 0;

    [[nodiscard]] bool team1Won() const noexcept { return team1Points > team2Points; }

    [[nodiscard]] const Team& winner() const noexcept { return team1Won() ? team1 : team2; }

    [[nodiscard]] const Team& loser() const noexcept { return team1Won() ? team2 : team1; }

    /// Absolute point difference.
    [[nodiscard]] int margin() const noexcept {
        return team1Points > team2Points ? team1Points - team2Points
                                         : team2Points - team1Points;
    }

    [[nodiscard]] bool isForfeit() const noexcept {
        return team1.isForfeit() || team2.isForfeit();
    }

    /// The four player slots in team order.
    [[nodiscard]] std::array<std::string_view, 4> players() const noexcept {
        return {team1.first, team1.second, team2.first, team2.second};
    }

    /// "A/B (11) vs C/D (2)", for log lines.
    [[nodiscard]] std::string describe() const;
};

/// The eleven textual fields of one input record, before validation.
struct RawGameRow {
    std::string matchId;
    std::string gameId;
    std::string matchDate;
    std::string team1Name;
    std::string team2Name;
    std::string partner1;
    std::string partner2;
    std::string opponent1;
    std::string opponent2;
    std::string team1Points;
    std::string team2Points;
};

} // namespace rally::league
