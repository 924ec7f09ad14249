#pragma once

/// @file pool_partitioner.hpp
/// @brief Connected components of the played-with / played-against graph.
///
/// Two players are comparable under one ranking only if a chain of shared
/// games links them. Each game adds edges between teammates and between
/// every pair of opponents; the connected components of that graph are the
/// competitive pools. More than one pool means ratings across pools have
/// no defined relationship.

#include <cstddef>
#include <set>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rally/league/game_record.hpp"
#include "rally/league/match_store.hpp"

namespace rally::pool {

/// One connected component, members sorted alphabetically.
struct Pool {
    std::vector<std::string> members;

    [[nodiscard]] std::size_t size() const noexcept { return members.size(); }
};

/// Union-find over player names with an explicit edge set.
class PoolPartitioner {
public:
    PoolPartitioner() = default;

    /// Add the six edges of a game (two teammate, four opponent).
    /// Forfeited games add nothing.
    void addGame(const league::Game& game);

    void addGames(std::span<const league::Game> games);

    [[nodiscard]] static PoolPartitioner fromStore(const league::MatchStore& store);

    [[nodiscard]] std::size_t vertexCount() const noexcept { return names_.size(); }

    /// Distinct undirected edges.
    [[nodiscard]] std::size_t edgeCount() const noexcept { return edges_.size(); }

    /// Components sorted by size (largest first), ties by first member.
    [[nodiscard]] std::vector<Pool> pools() const;

    /// True when every player is in one pool (or there are no players).
    [[nodiscard]] bool isConnected() const;

private:
    std::size_t vertex(const std::string& player);
    std::size_t root(std::size_t v) const;
    void connect(const std::string& a, const std::string& b);

    std::vector<std::string> names_;
    std::unordered_map<std::string, std::size_t> index_;
    mutable std::vector<std::size_t> parent_;
    std::vector<std::size_t> rank_;
    std::set<std::pair<std::size_t, std::size_t>> edges_;
};

} // namespace rally::pool
