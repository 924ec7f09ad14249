#pragma once

/// @file csv_reader.hpp
/// @brief CSV parsing and the match-record / rating-snapshot file formats.

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "rally/foundation/rally_result.hpp"
#include "rally/league/game_record.hpp"
#include "rally/rating/rating_store.hpp"

namespace rally::io {

/// Header plus data rows of a CSV document.
struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    /// Column index of a header name, or -1.
    [[nodiscard]] int column(std::string_view name) const;
};

/// Parse CSV text: comma separated, double-quoted fields with "" escapes,
/// LF or CRLF line ends. The first record is the header; blank lines are
/// skipped.
/// @return The table, or MalformedRow for an unterminated quote.
[[nodiscard]] foundation::RallyResult<CsvTable> parseCsv(std::istream& in);

/// Quote a field if it contains a comma, quote or line break.
[[nodiscard]] std::string csvField(std::string_view value);

/// Column names of the match record schema, in file order.
inline constexpr std::string_view kMatchColumns[] = {
    "match_id",  "game_id",   "match_date", "team1_name",   "team2_name",  "partner1",
    "partner2",  "opponent1", "opponent2",  "team1_points", "team2_points"};

/// Read match records by header name.
/// @return Raw rows, or MissingColumn / MalformedRow.
[[nodiscard]] foundation::RallyResult<std::vector<league::RawGameRow>> readMatchRows(std::istream& in);

/// readMatchRows() on a file; FileOpenFailed if it cannot be opened.
[[nodiscard]] foundation::RallyResult<std::vector<league::RawGameRow>> readMatchFile(
    const std::filesystem::path& path);

/// Read a "Player,Rating" snapshot.
[[nodiscard]] foundation::RallyResult<std::vector<rating::PlayerRating>> readRatingSnapshot(std::istream& in);

/// Seed a rating store from a snapshot file.
[[nodiscard]] foundation::RallyResult<rating::RatingStore> loadRatingSnapshot(
    const std::filesystem::path& path, double defaultRating);

/// Write ratings as a "Player,Rating" snapshot, highest first, full precision.
void writeRatingSnapshot(std::ostream& out, const rating::RatingStore& store);

[[nodiscard]] foundation::RallyResult<void> saveRatingSnapshot(
    const std::filesystem::path& path, const rating::RatingStore& store);

} // namespace rally::io
