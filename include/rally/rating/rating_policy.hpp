#pragma once

/// @file rating_policy.hpp
/// @brief Tunables and classification rules of the contextual rating update.
///
/// Each game is classified by how favored the winner was before the game
/// (favoredness) and how lopsided the final score was (margin). The pair
/// selects a multiplier from a table; the per-player change is
///   delta = baseRatingDelta * multiplier / 2
/// so upsets move ratings most and expected blowouts least.

#include <compare>
#include <cstdint>
#include <map>
#include <string_view>

#include "rally/foundation/rally_result.hpp"

namespace rally::rating {

/// How the winning team stood relative to expectations.
enum class OutcomeClass : uint8_t {
    Tossup,   ///< Team ratings too close to call.
    Favored,  ///< The higher-rated team won.
    Underdog  ///< The lower-rated team won.
};

/// Size of the pre-game rating gap. None only for tossups.
enum class FavorednessLevel : uint8_t {
    None,
    Slight,
    Heavy
};

/// How lopsided the final score was.
enum class MarginClass : uint8_t {
    Narrow,
    Solid,
    Blowout
};

constexpr std::string_view outcomeClassName(OutcomeClass c) {
    switch (c) {
        case OutcomeClass::Tossup:   return "tossup";
        case OutcomeClass::Favored:  return "favored";
        case OutcomeClass::Underdog: return "underdog";
    }
    return "unknown";
}

constexpr std::string_view favorednessName(FavorednessLevel l) {
    switch (l) {
        case FavorednessLevel::None:   return "none";
        case FavorednessLevel::Slight: return "slight";
        case FavorednessLevel::Heavy:  return "heavy";
    }
    return "unknown";
}

constexpr std::string_view marginClassName(MarginClass m) {
    switch (m) {
        case MarginClass::Narrow:  return "narrow";
        case MarginClass::Solid:   return "solid";
        case MarginClass::Blowout: return "blowout";
    }
    return "unknown";
}

/// Multiplier table key.
struct PolicyKey {
    OutcomeClass outcome = OutcomeClass::Tossup;
    FavorednessLevel level = FavorednessLevel::None;
    MarginClass margin = MarginClass::Narrow;

    auto operator<=>(const PolicyKey&) const = default;
};

using MultiplierTable = std::map<PolicyKey, double>;

/// The fifteen-entry table used when no configuration overrides it.
///
/// | outcome  | level  | narrow | solid | blowout |
/// |----------|--------|--------|-------|---------|
/// | underdog | heavy  | 25     | 30    | 35      |
/// | underdog | slight | 18     | 22    | 26      |
/// | tossup   | -      | 12     | 15    | 18      |
/// | favored  | slight | 8      | 10    | 12      |
/// | favored  | heavy  | 3      | 5     | 7       |
[[nodiscard]] MultiplierTable defaultMultiplierTable();

/// Tunables of the contextual rating update.
struct RatingPolicy {
    double defaultRating = 3.5;       ///< Rating of a never-seen player.
    double baseRatingDelta = 0.0035;  ///< Scales every multiplier.
    double winningBonus = 0.0;        ///< Flat extra gain per winning player.
    double tossupThreshold = 0.1;     ///< Team gap below this is a tossup.
    double slightThreshold = 0.2;     ///< Team gap below this is a slight favorite.
    int blowoutMargin = 12;           ///< Margin at or above this is a blowout.
    int narrowMargin = 3;             ///< Margin below this is narrow.
    double fallbackMultiplier = 10.0; ///< Used for keys missing from the table.
    MultiplierTable multipliers = defaultMultiplierTable();

    /// Table lookup with fallbackMultiplier for unmatched keys.
    [[nodiscard]] double multiplierFor(const PolicyKey& key) const;

    /// Classify an absolute score margin.
    [[nodiscard]] MarginClass classifyMargin(int margin) const noexcept;

    /// Check threshold ordering and sign constraints.
    /// @return Success or InvalidPolicy.
    [[nodiscard]] foundation::RallyResult<void> validate() const;
};

} // namespace rally::rating
