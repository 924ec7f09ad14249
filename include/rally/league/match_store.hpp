#pragma once

/// @file match_store.hpp
/// @brief Validated, ordered collection of recorded games.
///
/// MatchStore is the common input of the rating engine, the partnership
/// ledger and the pool partitioner. Rows are validated on the way in:
/// forfeits and unparseable scores are counted and skipped, any other
/// malformed record fails the ingestion.

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rally/foundation/rally_result.hpp"
#include "rally/league/game_record.hpp"

namespace rally::league {

/// What happened to a single ingested record.
enum class IngestOutcome {
    Accepted,         ///< Stored.
    Forfeit,          ///< A player slot held the forfeit sentinel; not stored.
    UnparseableScore  ///< A score was not an integer; not stored.
};

/// Counters for one ingestion pass.
struct IngestSummary {
    std::size_t accepted = 0;
    std::size_t forfeits = 0;
    std::size_t unparseableScores = 0;

    [[nodiscard]] std::size_t total() const noexcept {
        return accepted + forfeits + unparseableScores;
    }
};

/// Per-match record count that differs from the expected games per match.
struct MatchGameCount {
    std::string matchId;
    std::size_t games = 0;
};

/// Order games by match date, then game number. Stable on input order.
void sortChronologically(std::vector<Game>& games);

/// Validated game collection.
///
/// Usage:
/// @code
///   MatchStore store;
///   auto summary = store.ingestAll(rows);
///   if (!summary) { return summary.error(); }
///   for (const auto& game : store.chronological()) { ... }
/// @endcode
class MatchStore {
public:
    MatchStore() = default;

    /// Validate one raw record and store it when acceptable.
    ///
    /// Fatal errors: MissingField, InvalidDate, InvalidGameNumber,
    /// InvalidScore (negative), TiedScore, DuplicatePlayer. The failing
    /// row is attached to the error as context.
    [[nodiscard]] foundation::RallyResult<IngestOutcome> ingest(const RawGameRow& row);

    /// Ingest rows in order, stopping at the first fatal record.
    /// Rows before the failing one stay stored.
    [[nodiscard]] foundation::RallyResult<IngestSummary> ingestAll(std::span<const RawGameRow> rows);

    /// Store an already-typed game after the same structural checks as ingest().
    [[nodiscard]] foundation::RallyResult<IngestOutcome> add(Game game);

    /// Accepted games in ingestion order.
    [[nodiscard]] const std::vector<Game>& games() const noexcept { return games_; }

    /// Accepted games in rating order (date, then game number).
    [[nodiscard]] std::vector<Game> chronological() const;

    [[nodiscard]] std::size_t size() const noexcept { return games_.size(); }
    [[nodiscard]] bool empty() const noexcept { return games_.empty(); }

    [[nodiscard]] const IngestSummary& summary() const noexcept { return summary_; }

    /// Team name a player first appeared under.
    [[nodiscard]] std::optional<std::string> teamOf(std::string_view player) const;

    /// Every player of an accepted game, sorted.
    [[nodiscard]] std::vector<std::string> players() const;

    /// Matches whose record count (accepted or skipped) differs from
    /// expectedGames, sorted by match id. Empty when expectedGames is 0.
    [[nodiscard]] std::vector<MatchGameCount> incompleteMatches(std::size_t expectedGames) const;

private:
    foundation::RallyResult<IngestOutcome> accept(Game game);
    void countRecord(const std::string& matchId, IngestOutcome outcome);

    std::vector<Game> games_;
    IngestSummary summary_;
    std::unordered_map<std::string, std::string> teamOfPlayer_;
    std::map<std::string, std::size_t> recordsPerMatch_;
};

} // namespace rally::league
