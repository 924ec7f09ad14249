#pragma once

/// @file rating_store.hpp
/// @brief Player -> scalar rating mapping owned by one rating run.

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rally/foundation/rally_result.hpp"
#include "rally/rating/skill_types.hpp"

namespace rally::rating {

/// One row of a ranked rating table.
struct PlayerRating {
    std::string player;
    double rating = 0.0;
};

/// Scalar rating per player.
///
/// Ratings are created on first access through getOrInsertDefault() with
/// the store's default rating and are never removed. Read-only lookups
/// (find, ratingOf, peek) never insert.
class RatingStore {
public:
    explicit RatingStore(double defaultRating = 3.5);

    /// Return the player's rating, inserting the default rating first if
    /// the player has never been seen.
    double& getOrInsertDefault(std::string_view player);

    /// Current rating, or the default rating if unseen. Does not insert.
    [[nodiscard]] double peek(std::string_view player) const;

    [[nodiscard]] std::optional<double> find(std::string_view player) const;

    /// Current rating of a known player.
    /// @return The rating, or UnknownPlayer.
    [[nodiscard]] foundation::RallyResult<double> ratingOf(std::string_view player) const;

    /// Overwrite (or create) a player's rating.
    void set(std::string_view player, double rating);

    [[nodiscard]] bool contains(std::string_view player) const;
    [[nodiscard]] std::size_t size() const noexcept { return ratings_.size(); }
    [[nodiscard]] bool empty() const noexcept { return ratings_.empty(); }
    [[nodiscard]] double defaultRating() const noexcept { return defaultRating_; }

    /// Players sorted by rating (highest first), ties by name.
    [[nodiscard]] std::vector<PlayerRating> ranked() const;

    /// Ratings as skill locations for the synergy analyzer.
    [[nodiscard]] SkillMap toSkillMap() const;

private:
    double defaultRating_;
    std::map<std::string, double, std::less<>> ratings_;
};

} // namespace rally::rating
