/// @file game_record.cpp
/// @brief Date parsing and formatting for game records.

#include "rally/league/game_record.hpp"

#include <charconv>
#include <cstdio>

namespace rally::league {

using foundation::ErrorCode;
using foundation::RallyError;
using foundation::RallyResult;

namespace {

bool parseDigits(std::string_view text, int& out) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

RallyResult<MatchDate> parseMatchDate(std::string_view text) {
    auto invalid = [&] {
        return RallyResult<MatchDate>::err(
            RallyError(ErrorCode::InvalidDate,
                       "invalid match date '" + std::string(text) + "', expected YYYY-MM-DD"));
    };

    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return invalid();
    }

    int y = 0;
    int m = 0;
    int d = 0;
    if (!parseDigits(text.substr(0, 4), y) ||
        !parseDigits(text.substr(5, 2), m) ||
        !parseDigits(text.substr(8, 2), d)) {
        return invalid();
    }

    MatchDate date{std::chrono::year{y},
                   std::chrono::month{static_cast<unsigned>(m)},
                   std::chrono::day{static_cast<unsigned>(d)}};
    if (!date.ok()) {
        return invalid();
    }
    return RallyResult<MatchDate>::ok(date);
}

std::string formatMatchDate(MatchDate date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buf;
}

std::string Game::describe() const {
    return team1.first + "/" + team1.second + " (" + std::to_string(team1Points) + ") vs " +
           team2.first + "/" + team2.second + " (" + std::to_string(team2Points) + ")";
}

} // namespace rally::league
