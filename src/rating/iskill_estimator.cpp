/// @file iskill_estimator.cpp
/// @brief Conversion of stored games into estimator compositions.

#include "rally/rating/iskill_estimator.hpp"

namespace rally::rating {

std::vector<Composition> compositionsOf(const league::MatchStore& store) {
    std::vector<Composition> compositions;
    auto games = store.chronological();
    compositions.reserve(games.size());
    for (const auto& game : games) {
        const auto& w = game.winner();
        const auto& l = game.loser();
        compositions.push_back({{w.first, w.second}, {l.first, l.second}});
    }
    return compositions;
}

} // namespace rally::rating
