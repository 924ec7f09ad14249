#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <vector>

#include "rally/league/match_store.hpp"
#include "rally/rating/trueskill_estimator.hpp"

using namespace rally::rating;
using rally::foundation::ErrorCode;

TEST(TrueSkillEstimatorTest, VAndWAtZero) {
    EXPECT_NEAR(TrueSkillEstimator::vWin(0.0), std::sqrt(2.0 / std::numbers::pi), 1e-12);
    EXPECT_NEAR(TrueSkillEstimator::wWin(0.0), 2.0 / std::numbers::pi, 1e-12);
}

TEST(TrueSkillEstimatorTest, VShrinksForExpectedWins) {
    EXPECT_GT(TrueSkillEstimator::vWin(-2.0), TrueSkillEstimator::vWin(0.0));
    EXPECT_LT(TrueSkillEstimator::vWin(2.0), TrueSkillEstimator::vWin(0.0));
    // Deep in the tail the limits take over.
    EXPECT_NEAR(TrueSkillEstimator::vWin(-50.0), 50.0, 1e-9);
    EXPECT_NEAR(TrueSkillEstimator::wWin(-50.0), 1.0, 1e-9);
}

TEST(TrueSkillEstimatorTest, SingleGameFromEqualPriors) {
    TrueSkillParams params;
    TrueSkillEstimator estimator(params);
    std::vector<Composition> games = {{{"A", "B"}, {"C", "D"}}};

    auto table = estimator.estimate(games);
    ASSERT_TRUE(table.hasValue());
    const auto& skills = table.value();
    ASSERT_EQ(skills.size(), 4u);

    double variance = params.sigma * params.sigma;
    double c = std::sqrt(4.0 * variance + 4.0 * params.beta * params.beta);
    double shift = variance / c * std::sqrt(2.0 / std::numbers::pi);

    EXPECT_NEAR(skills.at("A").mu, params.mu + shift, 1e-9);
    EXPECT_NEAR(skills.at("B").mu, params.mu + shift, 1e-9);
    EXPECT_NEAR(skills.at("C").mu, params.mu - shift, 1e-9);
    EXPECT_NEAR(skills.at("D").mu, params.mu - shift, 1e-9);

    for (const auto& [player, est] : skills) {
        EXPECT_LT(est.sigma, params.sigma) << player;
        EXPECT_NEAR(est.sigma, skills.at("A").sigma, 1e-12) << player;
        EXPECT_LT(est.exposed(), est.mu);
    }
}

TEST(TrueSkillEstimatorTest, RepeatedWinsKeepRaisingWinner) {
    TrueSkillEstimator estimator;
    std::vector<Composition> games(5, Composition{{"A", "B"}, {"C", "D"}});

    auto table = estimator.estimate(games);
    ASSERT_TRUE(table.hasValue());
    EXPECT_GT(table.value().at("A").mu, table.value().at("C").mu);

    std::vector<Composition> oneGame(1, Composition{{"A", "B"}, {"C", "D"}});
    auto single = estimator.estimate(oneGame);
    ASSERT_TRUE(single.hasValue());
    EXPECT_GT(table.value().at("A").mu, single.value().at("A").mu);
    EXPECT_LT(table.value().at("A").sigma, single.value().at("A").sigma);
}

TEST(TrueSkillEstimatorTest, EstimateIsRepeatable) {
    TrueSkillEstimator estimator;
    std::vector<Composition> games = {{{"A", "B"}, {"C", "D"}}, {{"C", "A"}, {"B", "D"}}};
    auto first = estimator.estimate(games);
    auto second = estimator.estimate(games);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(first.value().at("A").mu, second.value().at("A").mu);
}

TEST(TrueSkillEstimatorTest, EmptyInputGivesEmptyTable) {
    TrueSkillEstimator estimator;
    auto table = estimator.estimate({});
    ASSERT_TRUE(table.hasValue());
    EXPECT_TRUE(table.value().empty());
    EXPECT_EQ(estimator.name(), "trueskill");
}

TEST(TrueSkillEstimatorTest, RejectsInvalidParameters) {
    TrueSkillParams params;
    params.sigma = 0.0;
    TrueSkillEstimator estimator(params);
    auto table = estimator.estimate({});
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::InvalidPolicy);
}

TEST(TrueSkillEstimatorTest, RejectsEmptySlot) {
    TrueSkillEstimator estimator;
    std::vector<Composition> games = {{{"A", ""}, {"C", "D"}}};
    auto table = estimator.estimate(games);
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::EstimatorFailed);
}

TEST(CompositionsTest, WinnersFirstInChronologicalOrder) {
    using rally::league::Game;
    using rally::league::MatchDate;
    using rally::league::Team;

    auto makeGame = [](unsigned dayOfMonth, int s1, int s2) {
        Game game;
        game.matchId = "M" + std::to_string(dayOfMonth);
        game.gameNumber = 1;
        game.date = MatchDate{std::chrono::year{2024}, std::chrono::month{5},
                              std::chrono::day{dayOfMonth}};
        game.team1 = Team{"Home", "A", "B"};
        game.team2 = Team{"Away", "C", "D"};
        game.team1Points = s1;
        game.team2Points = s2;
        return game;
    };

    rally::league::MatchStore store;
    ASSERT_TRUE(store.add(makeGame(9, 4, 11)).hasValue());
    ASSERT_TRUE(store.add(makeGame(2, 11, 4)).hasValue());

    auto compositions = compositionsOf(store);
    ASSERT_EQ(compositions.size(), 2u);
    EXPECT_EQ(compositions[0].winners[0], "A");
    EXPECT_EQ(compositions[1].winners[0], "C");
    EXPECT_EQ(compositions[1].losers[1], "B");
}
