/// @file partnership_ledger.cpp
/// @brief Partnership history accumulation.

#include "rally/synergy/partnership_ledger.hpp"

namespace rally::synergy {

PartnershipKey PartnershipKey::of(std::string_view a, std::string_view b) {
    if (b < a) {
        return {std::string(b), std::string(a)};
    }
    return {std::string(a), std::string(b)};
}

double PartnershipRecord::winRate() const noexcept {
    auto total = wins + losses;
    return total > 0 ? static_cast<double>(wins) / static_cast<double>(total) : 0.0;
}

double PartnershipRecord::meanScoreDiff() const noexcept {
    if (games.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& g : games) {
        sum += g.scoreDiff;
    }
    return sum / static_cast<double>(games.size());
}

void PartnershipLedger::record(const league::Game& game) {
    if (game.isForfeit()) {
        return;
    }
    const int margin = game.margin();
    append(game.winner(), game.loser(), true, margin);
    append(game.loser(), game.winner(), false, -margin);
}

PartnershipLedger PartnershipLedger::fromStore(const league::MatchStore& store) {
    PartnershipLedger ledger;
    for (const auto& game : store.games()) {
        ledger.record(game);
    }
    return ledger;
}

const PartnershipRecord* PartnershipLedger::find(std::string_view a, std::string_view b) const {
    auto it = records_.find(PartnershipKey::of(a, b));
    return it != records_.end() ? &it->second : nullptr;
}

void PartnershipLedger::append(const league::Team& team, const league::Team& opponents,
                               bool won, int margin) {
    auto key = PartnershipKey::of(team.first, team.second);
    auto [it, inserted] = records_.try_emplace(key);
    auto& rec = it->second;
    if (inserted) {
        rec.key = key;
    }
    rec.games.push_back({won, margin, PartnershipKey::of(opponents.first, opponents.second)});
    if (won) {
        ++rec.wins;
    } else {
        ++rec.losses;
    }
}

} // namespace rally::synergy
