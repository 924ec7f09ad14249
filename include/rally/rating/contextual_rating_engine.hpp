#pragma once

/// @file contextual_rating_engine.hpp
/// @brief Heuristic, explainable per-game rating update for doubles games.
///
/// For each game the engine:
///   1. averages each team's two current ratings,
///   2. classifies the gap as tossup / slight / heavy and the winner as
///      favored or underdog,
///   3. classifies the score margin as narrow / solid / blowout,
///   4. looks up a multiplier and moves every player by
///      delta = baseRatingDelta * multiplier / 2 (plus the winning bonus
///      for winners).
///
/// All four new ratings are computed from the ratings held before the
/// game and committed together. Because every update reads the running
/// state, games are folded in chronological order; run() sorts first.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "rally/foundation/rally_result.hpp"
#include "rally/league/game_record.hpp"
#include "rally/league/match_store.hpp"
#include "rally/rating/rating_policy.hpp"
#include "rally/rating/rating_store.hpp"

namespace rally::rating {

/// Classification of one game against the pre-game ratings.
struct GameContext {
    double team1Rating = 0.0;
    double team2Rating = 0.0;
    double ratingDiff = 0.0;
    bool team1Won = false;
    /// Set unless the game is a tossup.
    std::optional<bool> team1Favored;
    PolicyKey key;
    double multiplier = 0.0;
    /// Per-player change before the winning bonus.
    double delta = 0.0;
};

/// Before/after rating of one player in one game.
struct PlayerDelta {
    std::string player;
    double before = 0.0;
    double after = 0.0;

    [[nodiscard]] double change() const noexcept { return after - before; }
};

/// Everything one applied game changed.
struct RatingUpdate {
    GameContext context;
    /// Team 1 players first, then team 2.
    std::array<PlayerDelta, 4> players;

    /// Sum of all four changes: zero without a winning bonus,
    /// twice the bonus with one.
    [[nodiscard]] double netChange() const noexcept;
};

/// Counters for one fold over a game list.
struct RatingRunSummary {
    std::size_t gamesRated = 0;
    std::size_t gamesSkipped = 0;
};

/// Contextual rating engine. One instance owns one rating mapping.
class ContextualRatingEngine {
public:
    explicit ContextualRatingEngine(RatingPolicy policy = {});

    /// Start from previously saved ratings (e.g. a snapshot file).
    ContextualRatingEngine(RatingPolicy policy, RatingStore seed);

    /// Classify a game against the current ratings without mutating them.
    [[nodiscard]] GameContext classify(const league::Game& game) const;

    /// Apply one game.
    ///
    /// @return The update; std::nullopt for a forfeited game (skipped, no
    ///         mutation); TiedScore or InvalidScore for a game that should
    ///         never have passed ingestion (no mutation).
    [[nodiscard]] foundation::RallyResult<std::optional<RatingUpdate>> apply(const league::Game& game);

    /// Sort the games chronologically and fold them in that order.
    /// Stops at the first fatal game; earlier updates stay committed.
    [[nodiscard]] foundation::RallyResult<RatingRunSummary> run(std::vector<league::Game> games);

    /// Fold every game of the store in chronological order.
    [[nodiscard]] foundation::RallyResult<RatingRunSummary> run(const league::MatchStore& store);

    [[nodiscard]] const RatingStore& ratings() const noexcept { return ratings_; }
    [[nodiscard]] const RatingPolicy& policy() const noexcept { return policy_; }

private:
    void logUpdate(const league::Game& game, const RatingUpdate& update) const;

    RatingPolicy policy_;
    RatingStore ratings_;
};

} // namespace rally::rating
