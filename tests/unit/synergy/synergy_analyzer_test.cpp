#include <gtest/gtest.h>

#include "rally/league/match_store.hpp"
#include "rally/synergy/synergy_analyzer.hpp"

using namespace rally::synergy;
using rally::foundation::ErrorCode;
using rally::league::Game;
using rally::league::Team;
using rally::rating::SkillMap;

namespace {

Game makeGame(std::string a, std::string b, std::string c, std::string d, int s1, int s2,
              std::string team1Name = "Home") {
    Game game;
    game.matchId = "M1";
    game.gameNumber = 1;
    game.team1 = Team{std::move(team1Name), std::move(a), std::move(b)};
    game.team2 = Team{"Away", std::move(c), std::move(d)};
    game.team1Points = s1;
    game.team2Points = s2;
    return game;
}

SkillMap evenSkills() {
    return SkillMap{{"A", 3.5}, {"B", 3.5}, {"C", 3.5}, {"D", 3.5}, {"E", 3.5}, {"F", 3.5}};
}

} // namespace

TEST(SynergyAnalyzerTest, ExpectedWinIsLogistic) {
    EXPECT_DOUBLE_EQ(SynergyAnalyzer::expectedWin(7.0, 7.0, 10.0), 0.5);
    EXPECT_NEAR(SynergyAnalyzer::expectedWin(20.0, 10.0, 10.0), 1.0 / 1.1, 1e-12);
    EXPECT_NEAR(SynergyAnalyzer::expectedWin(10.0, 20.0, 10.0) +
                    SynergyAnalyzer::expectedWin(20.0, 10.0, 10.0),
                1.0, 1e-12);
}

TEST(SynergyAnalyzerTest, SingleGamePartnershipIsExcluded) {
    PartnershipLedger ledger;
    ledger.record(makeGame("A", "B", "C", "D", 11, 5));

    SynergyAnalyzer analyzer;
    auto entries = analyzer.analyze(ledger, evenSkills());
    ASSERT_TRUE(entries.hasValue());
    EXPECT_TRUE(entries.value().empty());
}

TEST(SynergyAnalyzerTest, TwoGamePartnershipIsIncluded) {
    PartnershipLedger ledger;
    ledger.record(makeGame("A", "B", "C", "D", 11, 5));
    ledger.record(makeGame("A", "B", "E", "F", 11, 9));

    SynergyAnalyzer analyzer;
    auto entries = analyzer.analyze(ledger, evenSkills());
    ASSERT_TRUE(entries.hasValue());
    ASSERT_EQ(entries.value().size(), 1u);

    const auto& entry = entries.value().front();
    EXPECT_EQ(entry.partnership, PartnershipKey::of("A", "B"));
    EXPECT_EQ(entry.gamesPlayed, 2u);
    EXPECT_DOUBLE_EQ(entry.winRate, 1.0);
    EXPECT_DOUBLE_EQ(entry.synergyScore, 50.0);
    EXPECT_DOUBLE_EQ(entry.individualStrength, 7.0);
    EXPECT_DOUBLE_EQ(entry.meanScoreDiff, 4.0);
}

TEST(SynergyAnalyzerTest, RankedBySynergyDescending) {
    PartnershipLedger ledger;
    ledger.record(makeGame("A", "B", "C", "D", 11, 5));
    ledger.record(makeGame("C", "D", "A", "B", 11, 8));
    ledger.record(makeGame("A", "B", "C", "D", 11, 2));

    SynergyAnalyzer analyzer;
    auto entries = analyzer.analyze(ledger, evenSkills());
    ASSERT_TRUE(entries.hasValue());
    ASSERT_EQ(entries.value().size(), 2u);
    EXPECT_EQ(entries.value()[0].partnership.label(), "A + B");
    EXPECT_NEAR(entries.value()[0].synergyScore, (2.0 / 3.0 - 0.5) * 100.0, 1e-9);
    EXPECT_EQ(entries.value()[1].partnership.label(), "C + D");
    EXPECT_LT(entries.value()[1].synergyScore, 0.0);
}

TEST(SynergyAnalyzerTest, StrongPairWinningAsExpectedScoresNearZero) {
    PartnershipLedger ledger;
    ledger.record(makeGame("A", "B", "C", "D", 11, 5));
    ledger.record(makeGame("A", "B", "C", "D", 11, 7));

    SkillMap skills{{"A", 50.0}, {"B", 50.0}, {"C", 10.0}, {"D", 10.0}};
    SynergyAnalyzer analyzer;
    auto entries = analyzer.analyze(ledger, skills);
    ASSERT_TRUE(entries.hasValue());
    ASSERT_EQ(entries.value().size(), 2u);
    EXPECT_NEAR(entries.value()[0].synergyScore, 0.0, 1e-3);
    EXPECT_NEAR(entries.value()[1].synergyScore, 0.0, 1e-3);
}

TEST(SynergyAnalyzerTest, MinGamesIsConfigurable) {
    PartnershipLedger ledger;
    ledger.record(makeGame("A", "B", "C", "D", 11, 5));

    SynergyAnalyzer analyzer(SynergyConfig{1, 10.0});
    auto entries = analyzer.analyze(ledger, evenSkills());
    ASSERT_TRUE(entries.hasValue());
    EXPECT_EQ(entries.value().size(), 2u);
}

TEST(SynergyAnalyzerTest, MissingSkillIsAnError) {
    PartnershipLedger ledger;
    ledger.record(makeGame("A", "B", "C", "X", 11, 5));
    ledger.record(makeGame("A", "B", "C", "X", 11, 5));

    SynergyAnalyzer analyzer;
    auto entries = analyzer.analyze(ledger, evenSkills());
    ASSERT_TRUE(entries.hasError());
    EXPECT_EQ(entries.error().code(), ErrorCode::MissingSkillEstimate);
}

TEST(SynergyAnalyzerTest, TeamComesFromFirstAppearance) {
    rally::league::MatchStore store;
    ASSERT_TRUE(store.add(makeGame("A", "B", "C", "D", 11, 5, "Aces")).hasValue());
    ASSERT_TRUE(store.add(makeGame("A", "B", "C", "D", 8, 11, "Renamed")).hasValue());

    SynergyAnalyzer analyzer;
    auto entries = analyzer.analyze(store, evenSkills());
    ASSERT_TRUE(entries.hasValue());
    ASSERT_EQ(entries.value().size(), 2u);
    for (const auto& entry : entries.value()) {
        if (entry.partnership.first == "A") {
            EXPECT_EQ(entry.team, "Aces");
            EXPECT_DOUBLE_EQ(entry.synergyScore, 0.0);
        } else {
            EXPECT_EQ(entry.team, "Away");
        }
    }
}
