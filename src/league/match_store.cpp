/// @file match_store.cpp
/// @brief MatchStore validation, forfeit filtering and ordering.

#include "rally/league/match_store.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <set>
#include <tuple>

#include "rally/foundation/rally_logger.hpp"

namespace rally::league {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RallyError;
using foundation::RallyLogger;
using foundation::RallyResult;

namespace {

std::string trimmed(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n\v\f";
    auto begin = text.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(kSpace);
    return std::string(text.substr(begin, end - begin + 1));
}

bool parseInt(std::string_view text, int& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

RallyError withRow(const RallyError& error, const RawGameRow& row) {
    return RallyError(error.code(),
                      std::string(error.message()) + " (match " + row.matchId +
                          ", game " + row.gameId + ")",
                      row);
}

LogContext contextOf(const std::string& matchId, const std::string& gameId) {
    LogContext ctx;
    ctx.matchId = matchId;
    ctx.extra["game_id"] = gameId;
    return ctx;
}

} // namespace

void sortChronologically(std::vector<Game>& games) {
    std::stable_sort(games.begin(), games.end(), [](const Game& lhs, const Game& rhs) {
        return std::tie(lhs.date, lhs.gameNumber) < std::tie(rhs.date, rhs.gameNumber);
    });
}

// -- Ingestion ----------------------------------------------------------------

RallyResult<IngestOutcome> MatchStore::ingest(const RawGameRow& raw) {
    RawGameRow row{trimmed(raw.matchId),   trimmed(raw.gameId),      trimmed(raw.matchDate),
                   trimmed(raw.team1Name), trimmed(raw.team2Name),   trimmed(raw.partner1),
                   trimmed(raw.partner2),  trimmed(raw.opponent1),   trimmed(raw.opponent2),
                   trimmed(raw.team1Points), trimmed(raw.team2Points)};

    const std::array<const std::string*, 4> slots = {
        &row.partner1, &row.partner2, &row.opponent1, &row.opponent2};

    if (std::any_of(slots.begin(), slots.end(),
                    [](const std::string* p) { return *p == kForfeitSentinel; })) {
        countRecord(row.matchId, IngestOutcome::Forfeit);
        RallyLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Ingest, "skipping defaulted game",
            contextOf(row.matchId, row.gameId));
        return RallyResult<IngestOutcome>::ok(IngestOutcome::Forfeit);
    }

    auto missing = [&](std::string_view field) {
        return RallyResult<IngestOutcome>::err(withRow(
            RallyError(ErrorCode::MissingField, "missing required field '" + std::string(field) + "'"),
            row));
    };
    if (row.matchId.empty()) return missing("match_id");
    if (row.gameId.empty()) return missing("game_id");
    if (row.matchDate.empty()) return missing("match_date");
    if (row.partner1.empty()) return missing("partner1");
    if (row.partner2.empty()) return missing("partner2");
    if (row.opponent1.empty()) return missing("opponent1");
    if (row.opponent2.empty()) return missing("opponent2");

    int team1Points = 0;
    int team2Points = 0;
    if (!parseInt(row.team1Points, team1Points) || !parseInt(row.team2Points, team2Points)) {
        countRecord(row.matchId, IngestOutcome::UnparseableScore);
        auto ctx = contextOf(row.matchId, row.gameId);
        ctx.extra["score"] = row.team1Points + "-" + row.team2Points;
        RallyLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Ingest, "skipping game with unparseable score", ctx);
        return RallyResult<IngestOutcome>::ok(IngestOutcome::UnparseableScore);
    }

    auto date = parseMatchDate(row.matchDate);
    if (!date) {
        return RallyResult<IngestOutcome>::err(withRow(date.error(), row));
    }

    int gameNumber = 0;
    if (!parseInt(row.gameId, gameNumber)) {
        return RallyResult<IngestOutcome>::err(withRow(
            RallyError(ErrorCode::InvalidGameNumber, "game id '" + row.gameId + "' is not an integer"),
            row));
    }

    Game game;
    game.matchId = row.matchId;
    game.gameNumber = gameNumber;
    game.date = date.value();
    game.team1 = Team{row.team1Name, row.partner1, row.partner2};
    game.team2 = Team{row.team2Name, row.opponent1, row.opponent2};
    game.team1Points = team1Points;
    game.team2Points = team2Points;

    auto accepted = accept(std::move(game));
    if (!accepted) {
        return RallyResult<IngestOutcome>::err(withRow(accepted.error(), row));
    }
    return accepted;
}

RallyResult<IngestSummary> MatchStore::ingestAll(std::span<const RawGameRow> rows) {
    IngestSummary pass;
    for (const auto& row : rows) {
        auto outcome = ingest(row);
        if (!outcome) {
            return RallyResult<IngestSummary>::err(outcome.error());
        }
        switch (outcome.value()) {
            case IngestOutcome::Accepted: ++pass.accepted; break;
            case IngestOutcome::Forfeit: ++pass.forfeits; break;
            case IngestOutcome::UnparseableScore: ++pass.unparseableScores; break;
        }
    }

    RALLY_LOG_INFO(LogCategory::Ingest,
                   "ingested " + std::to_string(pass.accepted) + " games (" +
                       std::to_string(pass.forfeits) + " forfeits, " +
                       std::to_string(pass.unparseableScores) + " unparseable scores skipped)");
    return RallyResult<IngestSummary>::ok(pass);
}

RallyResult<IngestOutcome> MatchStore::add(Game game) {
    if (game.isForfeit()) {
        countRecord(game.matchId, IngestOutcome::Forfeit);
        return RallyResult<IngestOutcome>::ok(IngestOutcome::Forfeit);
    }
    return accept(std::move(game));
}

RallyResult<IngestOutcome> MatchStore::accept(Game game) {
    for (auto player : game.players()) {
        if (player.empty()) {
            return RallyResult<IngestOutcome>::err(
                RallyError(ErrorCode::MissingField, "game has an empty player slot"));
        }
    }
    if (game.team1Points < 0 || game.team2Points < 0) {
        return RallyResult<IngestOutcome>::err(
            RallyError(ErrorCode::InvalidScore, "scores must be non-negative"));
    }
    if (game.team1Points == game.team2Points) {
        return RallyResult<IngestOutcome>::err(
            RallyError(ErrorCode::TiedScore,
                       "tied score " + std::to_string(game.team1Points) + "-" +
                           std::to_string(game.team2Points)));
    }

    auto players = game.players();
    std::set<std::string_view> distinct(players.begin(), players.end());
    if (distinct.size() != players.size()) {
        return RallyResult<IngestOutcome>::err(
            RallyError(ErrorCode::DuplicatePlayer,
                       "a player appears more than once in " + game.describe()));
    }

    // First team a player is seen on wins.
    for (const Team* team : {&game.team1, &game.team2}) {
        teamOfPlayer_.try_emplace(team->first, team->name);
        teamOfPlayer_.try_emplace(team->second, team->name);
    }

    countRecord(game.matchId, IngestOutcome::Accepted);
    games_.push_back(std::move(game));
    return RallyResult<IngestOutcome>::ok(IngestOutcome::Accepted);
}

void MatchStore::countRecord(const std::string& matchId, IngestOutcome outcome) {
    ++recordsPerMatch_[matchId];
    switch (outcome) {
        case IngestOutcome::Accepted: ++summary_.accepted; break;
        case IngestOutcome::Forfeit: ++summary_.forfeits; break;
        case IngestOutcome::UnparseableScore: ++summary_.unparseableScores; break;
    }
}

// -- Queries ------------------------------------------------------------------

std::vector<Game> MatchStore::chronological() const {
    std::vector<Game> ordered = games_;
    sortChronologically(ordered);
    return ordered;
}

std::optional<std::string> MatchStore::teamOf(std::string_view player) const {
    auto it = teamOfPlayer_.find(std::string(player));
    if (it == teamOfPlayer_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MatchStore::players() const {
    std::vector<std::string> names;
    names.reserve(teamOfPlayer_.size());
    for (const auto& [name, team] : teamOfPlayer_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<MatchGameCount> MatchStore::incompleteMatches(std::size_t expectedGames) const {
    std::vector<MatchGameCount> result;
    if (expectedGames == 0) {
        return result;
    }
    for (const auto& [matchId, count] : recordsPerMatch_) {
        if (count != expectedGames) {
            result.push_back({matchId, count});
        }
    }
    return result;
}

} // namespace rally::league
