#include "rally/rating/rating_store.hpp"

#include <algorithm>

namespace rally::rating {

using foundation::ErrorCode;
using foundation::RallyError;
using foundation::RallyResult;

RatingStore::RatingStore(double defaultRating)
    : defaultRating_(defaultRating) {}

double& RatingStore::getOrInsertDefault(std::string_view player) {
    auto it = ratings_.find(player);
    if (it == ratings_.end()) {
        it = ratings_.emplace(std::string(player), defaultRating_).first;
    }
    return it->second;
}

double RatingStore::peek(std::string_view player) const {
    auto it = ratings_.find(player);
    return it != ratings_.end() ? it->second : defaultRating_;
}

std::optional<double> RatingStore::find(std::string_view player) const {
    auto it = ratings_.find(player);
    if (it == ratings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

RallyResult<double> RatingStore::ratingOf(std::string_view player) const {
    auto it = ratings_.find(player);
    if (it == ratings_.end()) {
        return RallyResult<double>::err(
            RallyError(ErrorCode::UnknownPlayer,
                       "no rating recorded for player '" + std::string(player) + "'"));
    }
    return RallyResult<double>::ok(it->second);
}

void RatingStore::set(std::string_view player, double rating) {
    getOrInsertDefault(player) = rating;
}

bool RatingStore::contains(std::string_view player) const {
    return ratings_.find(player) != ratings_.end();
}

std::vector<PlayerRating> RatingStore::ranked() const {
    std::vector<PlayerRating> table;
    table.reserve(ratings_.size());
    for (const auto& [player, rating] : ratings_) {
        table.push_back({player, rating});
    }
    // ratings_ is name-ordered, so a stable sort keeps ties alphabetical.
    std::stable_sort(table.begin(), table.end(), [](const PlayerRating& lhs, const PlayerRating& rhs) {
        return lhs.rating > rhs.rating;
    });
    return table;
}

SkillMap RatingStore::toSkillMap() const {
    return SkillMap(ratings_.begin(), ratings_.end());
}

} // namespace rally::rating
