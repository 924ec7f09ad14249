/// @file csv_reader.cpp
/// @brief CSV parsing and record-file readers.

#include "rally/io/csv_reader.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <istream>
#include <iterator>
#include <limits>
#include <ostream>

#include "rally/foundation/rally_logger.hpp"

namespace rally::io {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RallyError;
using foundation::RallyResult;

namespace {

bool isBlank(const std::vector<std::string>& record) {
    return record.size() == 1 && record.front().find_first_not_of(" \t") == std::string::npos;
}

std::string trimmed(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n";
    auto begin = text.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(kSpace);
    return std::string(text.substr(begin, end - begin + 1));
}

} // namespace

int CsvTable::column(std::string_view name) const {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

RallyResult<CsvTable> parseCsv(std::istream& in) {
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool inQuotes = false;
    std::size_t line = 1;

    auto endRecord = [&] {
        record.push_back(std::move(field));
        field.clear();
        if (!isBlank(record)) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"': inQuotes = true; break;
            case ',':
                record.push_back(std::move(field));
                field.clear();
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                endRecord();
                ++line;
                break;
            case '\n':
                endRecord();
                ++line;
                break;
            default: field += c; break;
        }
    }

    if (inQuotes) {
        return RallyResult<CsvTable>::err(
            RallyError(ErrorCode::MalformedRow,
                       "unterminated quoted field at line " + std::to_string(line)));
    }
    if (!field.empty() || !record.empty()) {
        endRecord();
    }

    CsvTable table;
    if (records.empty()) {
        return RallyResult<CsvTable>::ok(std::move(table));
    }
    table.header = std::move(records.front());
    for (auto& name : table.header) {
        name = trimmed(name);
    }
    // A UTF-8 byte order mark would otherwise hide the first column name.
    if (!table.header.empty() && table.header.front().starts_with("\xEF\xBB\xBF")) {
        table.header.front().erase(0, 3);
    }
    table.rows.assign(std::make_move_iterator(records.begin() + 1),
                      std::make_move_iterator(records.end()));
    return RallyResult<CsvTable>::ok(std::move(table));
}

std::string csvField(std::string_view value) {
    if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(value);
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// -- Match records ------------------------------------------------------------

RallyResult<std::vector<league::RawGameRow>> readMatchRows(std::istream& in) {
    using Rows = RallyResult<std::vector<league::RawGameRow>>;

    auto parsed = parseCsv(in);
    if (!parsed) {
        return Rows::err(parsed.error());
    }
    const auto& table = parsed.value();

    constexpr std::size_t kColumnCount = std::size(kMatchColumns);
    std::array<std::size_t, kColumnCount> index{};
    for (std::size_t i = 0; i < kColumnCount; ++i) {
        int col = table.column(kMatchColumns[i]);
        if (col < 0) {
            return Rows::err(RallyError(ErrorCode::MissingColumn,
                                        "match file has no '" + std::string(kMatchColumns[i]) +
                                            "' column"));
        }
        index[i] = static_cast<std::size_t>(col);
    }

    std::vector<league::RawGameRow> rows;
    rows.reserve(table.rows.size());
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const auto& rec = table.rows[r];
        if (rec.size() < table.header.size()) {
            return Rows::err(RallyError(ErrorCode::MalformedRow,
                                        "record " + std::to_string(r + 1) + " has " +
                                            std::to_string(rec.size()) + " fields, expected " +
                                            std::to_string(table.header.size())));
        }
        league::RawGameRow row;
        row.matchId = rec[index[0]];
        row.gameId = rec[index[1]];
        row.matchDate = rec[index[2]];
        row.team1Name = rec[index[3]];
        row.team2Name = rec[index[4]];
        row.partner1 = rec[index[5]];
        row.partner2 = rec[index[6]];
        row.opponent1 = rec[index[7]];
        row.opponent2 = rec[index[8]];
        row.team1Points = rec[index[9]];
        row.team2Points = rec[index[10]];
        rows.push_back(std::move(row));
    }
    return Rows::ok(std::move(rows));
}

RallyResult<std::vector<league::RawGameRow>> readMatchFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return RallyResult<std::vector<league::RawGameRow>>::err(
            RallyError(ErrorCode::FileOpenFailed, "cannot open match file: " + path.string()));
    }
    auto rows = readMatchRows(in);
    if (rows) {
        RALLY_LOG_INFO(LogCategory::Io,
                       "read " + std::to_string(rows.value().size()) + " records from " + path.string());
    }
    return rows;
}

// -- Rating snapshots ---------------------------------------------------------

RallyResult<std::vector<rating::PlayerRating>> readRatingSnapshot(std::istream& in) {
    using Ratings = RallyResult<std::vector<rating::PlayerRating>>;

    auto parsed = parseCsv(in);
    if (!parsed) {
        return Ratings::err(parsed.error());
    }
    const auto& table = parsed.value();

    std::vector<rating::PlayerRating> ratings;
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const auto& rec = table.rows[r];
        if (rec.size() < 2) {
            return Ratings::err(RallyError(ErrorCode::MalformedRow,
                                           "snapshot record " + std::to_string(r + 1) +
                                               " needs a player and a rating"));
        }
        auto player = trimmed(rec[0]);
        auto text = trimmed(rec[1]);
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (player.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
            !std::isfinite(value)) {
            return Ratings::err(RallyError(ErrorCode::MalformedRow,
                                           "snapshot record " + std::to_string(r + 1) +
                                               " has an invalid rating '" + text + "'"));
        }
        ratings.push_back({std::move(player), value});
    }
    return Ratings::ok(std::move(ratings));
}

RallyResult<rating::RatingStore> loadRatingSnapshot(const std::filesystem::path& path,
                                                    double defaultRating) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return RallyResult<rating::RatingStore>::err(
            RallyError(ErrorCode::FileOpenFailed, "cannot open rating snapshot: " + path.string()));
    }
    auto ratings = readRatingSnapshot(in);
    if (!ratings) {
        return RallyResult<rating::RatingStore>::err(ratings.error());
    }

    rating::RatingStore store(defaultRating);
    for (const auto& entry : ratings.value()) {
        store.set(entry.player, entry.rating);
    }
    RALLY_LOG_INFO(LogCategory::Io,
                   "seeded " + std::to_string(store.size()) + " ratings from " + path.string());
    return RallyResult<rating::RatingStore>::ok(std::move(store));
}

void writeRatingSnapshot(std::ostream& out, const rating::RatingStore& store) {
    out << "Player,Rating\n";
    auto flags = out.flags();
    auto precision = out.precision();
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& entry : store.ranked()) {
        out << csvField(entry.player) << ',' << entry.rating << '\n';
    }
    out.flags(flags);
    out.precision(precision);
}

RallyResult<void> saveRatingSnapshot(const std::filesystem::path& path,
                                     const rating::RatingStore& store) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return RallyResult<void>::err(
            RallyError(ErrorCode::FileOpenFailed, "cannot write rating snapshot: " + path.string()));
    }
    writeRatingSnapshot(out, store);
    out.flush();
    if (!out) {
        return RallyResult<void>::err(
            RallyError(ErrorCode::WriteFailed, "failed writing rating snapshot: " + path.string()));
    }
    return RallyResult<void>::ok();
}

} // namespace rally::io
