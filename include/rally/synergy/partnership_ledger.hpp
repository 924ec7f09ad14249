#pragma once

/// @file partnership_ledger.hpp
/// @brief Per-partnership game history accumulated from recorded games.

#include <compare>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "rally/league/game_record.hpp"
#include "rally/league/match_store.hpp"

namespace rally::synergy {

/// Unordered pair of players, stored in sorted order so {A,B} == {B,A}.
struct PartnershipKey {
    std::string first;
    std::string second;

    [[nodiscard]] static PartnershipKey of(std::string_view a, std::string_view b);

    /// "A + B".
    [[nodiscard]] std::string label() const { return first + " + " + second; }

    auto operator<=>(const PartnershipKey&) const = default;
};

/// One game from the partnership's point of view.
struct PartnershipGame {
    bool won = false;
    /// Positive when the partnership won, negative when it lost.
    int scoreDiff = 0;
    PartnershipKey opponents;
};

/// Accumulated history of one partnership.
struct PartnershipRecord {
    PartnershipKey key;
    std::vector<PartnershipGame> games;
    std::size_t wins = 0;
    std::size_t losses = 0;

    [[nodiscard]] std::size_t gamesPlayed() const noexcept { return games.size(); }

    /// wins / (wins + losses); 0 with no games.
    [[nodiscard]] double winRate() const noexcept;

    /// Mean signed score differential; 0 with no games.
    [[nodiscard]] double meanScoreDiff() const noexcept;
};

/// Partnership histories keyed by canonical pair.
///
/// Records are created the first time two players appear as teammates and
/// appended to for every later game they play together. Forfeited games
/// are ignored.
class PartnershipLedger {
public:
    PartnershipLedger() = default;

    /// Record both partnerships of a game.
    void record(const league::Game& game);

    /// Ledger of every accepted game in a store.
    [[nodiscard]] static PartnershipLedger fromStore(const league::MatchStore& store);

    [[nodiscard]] const std::map<PartnershipKey, PartnershipRecord>& partnerships() const noexcept {
        return records_;
    }

    /// Record for a pair in either order, or nullptr.
    [[nodiscard]] const PartnershipRecord* find(std::string_view a, std::string_view b) const;

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

private:
    void append(const league::Team& team, const league::Team& opponents, bool won, int margin);

    std::map<PartnershipKey, PartnershipRecord> records_;
};

} // namespace rally::synergy
