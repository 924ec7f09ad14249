/// @file pool_partitioner.cpp
/// @brief PoolPartitioner union-find implementation.

#include "rally/pool/pool_partitioner.hpp"

#include <algorithm>
#include <map>

#include "rally/foundation/rally_logger.hpp"

namespace rally::pool {

using foundation::LogCategory;

void PoolPartitioner::addGame(const league::Game& game) {
    if (game.isForfeit()) {
        return;
    }
    const auto& t1 = game.team1;
    const auto& t2 = game.team2;

    connect(t1.first, t1.second);
    connect(t2.first, t2.second);

    connect(t1.first, t2.first);
    connect(t1.first, t2.second);
    connect(t1.second, t2.first);
    connect(t1.second, t2.second);
}

void PoolPartitioner::addGames(std::span<const league::Game> games) {
    for (const auto& game : games) {
        addGame(game);
    }
}

PoolPartitioner PoolPartitioner::fromStore(const league::MatchStore& store) {
    PoolPartitioner partitioner;
    partitioner.addGames(store.games());
    RALLY_LOG_INFO(LogCategory::Pool,
                   "competition graph has " + std::to_string(partitioner.vertexCount()) +
                       " players and " + std::to_string(partitioner.edgeCount()) + " edges");
    return partitioner;
}

std::vector<Pool> PoolPartitioner::pools() const {
    std::map<std::size_t, Pool> byRoot;
    for (std::size_t v = 0; v < names_.size(); ++v) {
        byRoot[root(v)].members.push_back(names_[v]);
    }

    std::vector<Pool> result;
    result.reserve(byRoot.size());
    for (auto& [r, pool] : byRoot) {
        std::sort(pool.members.begin(), pool.members.end());
        result.push_back(std::move(pool));
    }
    std::sort(result.begin(), result.end(), [](const Pool& lhs, const Pool& rhs) {
        if (lhs.size() != rhs.size()) {
            return lhs.size() > rhs.size();
        }
        return lhs.members.front() < rhs.members.front();
    });
    return result;
}

bool PoolPartitioner::isConnected() const {
    if (names_.empty()) {
        return true;
    }
    auto first = root(0);
    for (std::size_t v = 1; v < names_.size(); ++v) {
        if (root(v) != first) {
            return false;
        }
    }
    return true;
}

std::size_t PoolPartitioner::vertex(const std::string& player) {
    auto [it, inserted] = index_.try_emplace(player, names_.size());
    if (inserted) {
        names_.push_back(player);
        parent_.push_back(it->second);
        rank_.push_back(0);
    }
    return it->second;
}

std::size_t PoolPartitioner::root(std::size_t v) const {
    while (parent_[v] != v) {
        parent_[v] = parent_[parent_[v]];
        v = parent_[v];
    }
    return v;
}

void PoolPartitioner::connect(const std::string& a, const std::string& b) {
    auto va = vertex(a);
    auto vb = vertex(b);
    edges_.emplace(std::min(va, vb), std::max(va, vb));

    auto ra = root(va);
    auto rb = root(vb);
    if (ra == rb) {
        return;
    }
    // Union by rank.
    if (rank_[ra] < rank_[rb]) {
        std::swap(ra, rb);
    }
    parent_[rb] = ra;
    if (rank_[ra] == rank_[rb]) {
        ++rank_[ra];
    }
}

} // namespace rally::pool
