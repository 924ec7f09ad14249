#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rally/league/match_store.hpp"
#include "rally/rating/contextual_rating_engine.hpp"

using namespace rally::rating;
using rally::foundation::ErrorCode;
using rally::league::Game;
using rally::league::MatchDate;
using rally::league::Team;

namespace {

Game makeGame(std::string a, std::string b, std::string c, std::string d, int s1, int s2,
              MatchDate date = MatchDate{std::chrono::year{2024}, std::chrono::month{1},
                                         std::chrono::day{1}},
              int gameNumber = 1) {
    Game game;
    game.matchId = "M1";
    game.gameNumber = gameNumber;
    game.date = date;
    game.team1 = Team{"Home", std::move(a), std::move(b)};
    game.team2 = Team{"Away", std::move(c), std::move(d)};
    game.team1Points = s1;
    game.team2Points = s2;
    return game;
}

MatchDate day(unsigned d) {
    return MatchDate{std::chrono::year{2024}, std::chrono::month{3}, std::chrono::day{d}};
}

} // namespace

// ---------------------------------------------------------------------------
// Worked examples
// ---------------------------------------------------------------------------

TEST(ContextualRatingEngineTest, EvenTeamsNarrowWinUsesTossupNarrowMultiplier) {
    RatingPolicy policy;
    policy.narrowMargin = 10;  // 11-2 counts as narrow
    policy.blowoutMargin = 12;
    ContextualRatingEngine engine(policy);

    auto applied = engine.apply(makeGame("A", "B", "C", "D", 11, 2));
    ASSERT_TRUE(applied.hasValue());
    ASSERT_TRUE(applied.value().has_value());

    const auto& ctx = applied.value()->context;
    EXPECT_EQ(ctx.key.outcome, OutcomeClass::Tossup);
    EXPECT_EQ(ctx.key.margin, MarginClass::Narrow);
    EXPECT_FALSE(ctx.team1Favored.has_value());
    EXPECT_DOUBLE_EQ(ctx.multiplier, 12.0);

    const double delta = 0.0035 * 12.0 / 2.0;
    EXPECT_DOUBLE_EQ(engine.ratings().peek("A"), 3.5 + delta);
    EXPECT_DOUBLE_EQ(engine.ratings().peek("B"), 3.5 + delta);
    EXPECT_DOUBLE_EQ(engine.ratings().peek("C"), 3.5 - delta);
    EXPECT_DOUBLE_EQ(engine.ratings().peek("D"), 3.5 - delta);
    EXPECT_NEAR(engine.ratings().peek("A"), 3.521, 1e-12);
}

TEST(ContextualRatingEngineTest, NineMarginIsSolidWithDefaultMargins) {
    ContextualRatingEngine engine;
    auto applied = engine.apply(makeGame("A", "B", "C", "D", 11, 2));
    ASSERT_TRUE(applied.hasValue());
    EXPECT_EQ(applied.value()->context.key.margin, MarginClass::Solid);
    EXPECT_NEAR(engine.ratings().peek("A"), 3.5 + 0.0035 * 15.0 / 2.0, 1e-12);
}

TEST(ContextualRatingEngineTest, HeavyUnderdogWinGainsMost) {
    RatingStore seed(3.5);
    seed.set("A", 3.0);
    seed.set("B", 3.0);
    seed.set("C", 3.8);
    seed.set("D", 3.8);
    ContextualRatingEngine engine(RatingPolicy{}, seed);

    auto applied = engine.apply(makeGame("A", "B", "C", "D", 11, 10));
    ASSERT_TRUE(applied.hasValue());
    const auto& ctx = applied.value()->context;
    EXPECT_EQ(ctx.key.outcome, OutcomeClass::Underdog);
    EXPECT_EQ(ctx.key.level, FavorednessLevel::Heavy);
    EXPECT_EQ(ctx.key.margin, MarginClass::Narrow);
    ASSERT_TRUE(ctx.team1Favored.has_value());
    EXPECT_FALSE(*ctx.team1Favored);
    EXPECT_NEAR(ctx.ratingDiff, 0.8, 1e-12);
    EXPECT_NEAR(engine.ratings().peek("A"), 3.0 + 0.0035 * 25.0 / 2.0, 1e-12);
    EXPECT_NEAR(engine.ratings().peek("C"), 3.8 - 0.0035 * 25.0 / 2.0, 1e-12);
}

TEST(ContextualRatingEngineTest, SlightFavoriteBlowout) {
    RatingStore seed(3.5);
    seed.set("A", 3.65);
    seed.set("B", 3.65);
    ContextualRatingEngine engine(RatingPolicy{}, seed);

    auto ctx = engine.classify(makeGame("A", "B", "C", "D", 15, 2));
    EXPECT_EQ(ctx.key.outcome, OutcomeClass::Favored);
    EXPECT_EQ(ctx.key.level, FavorednessLevel::Slight);
    EXPECT_EQ(ctx.key.margin, MarginClass::Blowout);
    EXPECT_DOUBLE_EQ(ctx.multiplier, 12.0);
    // classify() never mutates.
    EXPECT_FALSE(engine.ratings().contains("C"));
}

// ---------------------------------------------------------------------------
// Conservation and determinism
// ---------------------------------------------------------------------------

TEST(ContextualRatingEngineTest, UpdateIsZeroSumWithoutBonus) {
    RatingStore seed(3.5);
    seed.set("A", 3.2);
    seed.set("B", 3.9);
    seed.set("C", 3.55);
    ContextualRatingEngine engine(RatingPolicy{}, seed);

    for (const auto& game : {makeGame("A", "B", "C", "D", 11, 7), makeGame("A", "C", "B", "D", 4, 11),
                             makeGame("D", "B", "A", "C", 11, 0)}) {
        auto applied = engine.apply(game);
        ASSERT_TRUE(applied.hasValue());
        EXPECT_NEAR(applied.value()->netChange(), 0.0, 1e-12);
    }
}

TEST(ContextualRatingEngineTest, WinningBonusAddsTwiceBonus) {
    RatingPolicy policy;
    policy.winningBonus = 0.005;
    ContextualRatingEngine engine(policy);

    auto applied = engine.apply(makeGame("A", "B", "C", "D", 11, 8));
    ASSERT_TRUE(applied.hasValue());
    EXPECT_NEAR(applied.value()->netChange(), 0.01, 1e-12);

    const auto& players = applied.value()->players;
    EXPECT_NEAR(players[0].change(), -players[2].change() + 0.005, 1e-12);
}

TEST(ContextualRatingEngineTest, RerunIsBitIdentical) {
    std::vector<Game> games = {
        makeGame("A", "B", "C", "D", 11, 3, day(1), 1),
        makeGame("A", "C", "B", "D", 9, 11, day(1), 2),
        makeGame("B", "C", "A", "D", 11, 10, day(8), 1),
        makeGame("A", "D", "B", "C", 2, 11, day(15), 1),
    };

    ContextualRatingEngine first;
    ContextualRatingEngine second;
    ASSERT_TRUE(first.run(games).hasValue());
    ASSERT_TRUE(second.run(games).hasValue());

    for (const auto& name : {"A", "B", "C", "D"}) {
        EXPECT_EQ(first.ratings().peek(name), second.ratings().peek(name)) << name;
    }
}

TEST(ContextualRatingEngineTest, ChronologicalOrderMatters) {
    RatingPolicy policy;
    policy.baseRatingDelta = 0.01;

    auto runWith = [&](MatchDate blowoutDate, MatchDate closeDate) {
        ContextualRatingEngine engine(policy);
        std::vector<Game> games = {
            makeGame("A", "B", "C", "D", 11, 2, blowoutDate),
            makeGame("A", "B", "C", "D", 9, 11, closeDate),
        };
        EXPECT_TRUE(engine.run(games).hasValue());
        return engine.ratings().peek("A");
    };

    double blowoutFirst = runWith(day(1), day(8));
    double closeFirst = runWith(day(8), day(1));

    EXPECT_NEAR(blowoutFirst, 3.485, 1e-12);
    EXPECT_NEAR(closeFirst, 3.55, 1e-12);
    EXPECT_NE(blowoutFirst, closeFirst);
}

TEST(ContextualRatingEngineTest, RunSortsInputByDateThenGameNumber) {
    std::vector<Game> ordered = {
        makeGame("A", "B", "C", "D", 11, 2, day(1), 1),
        makeGame("A", "B", "C", "D", 9, 11, day(1), 2),
        makeGame("A", "C", "B", "D", 11, 6, day(2), 1),
    };
    std::vector<Game> shuffled = {ordered[2], ordered[1], ordered[0]};

    ContextualRatingEngine a;
    ContextualRatingEngine b;
    ASSERT_TRUE(a.run(ordered).hasValue());
    ASSERT_TRUE(b.run(shuffled).hasValue());
    for (const auto& name : {"A", "B", "C", "D"}) {
        EXPECT_EQ(a.ratings().peek(name), b.ratings().peek(name)) << name;
    }
}

// ---------------------------------------------------------------------------
// Skipped and rejected games
// ---------------------------------------------------------------------------

TEST(ContextualRatingEngineTest, ForfeitCausesNoMutation) {
    ContextualRatingEngine engine;
    auto applied = engine.apply(makeGame("A", "DEFAULT", "C", "D", 0, 11));
    ASSERT_TRUE(applied.hasValue());
    EXPECT_FALSE(applied.value().has_value());
    EXPECT_TRUE(engine.ratings().empty());

    std::vector<Game> games = {makeGame("A", "B", "C", "DEFAULT", 11, 0)};
    auto summary = engine.run(games);
    ASSERT_TRUE(summary.hasValue());
    EXPECT_EQ(summary.value().gamesRated, 0u);
    EXPECT_EQ(summary.value().gamesSkipped, 1u);
    EXPECT_TRUE(engine.ratings().empty());
}

TEST(ContextualRatingEngineTest, TiedGameIsRejectedWithoutMutation) {
    ContextualRatingEngine engine;
    auto applied = engine.apply(makeGame("A", "B", "C", "D", 7, 7));
    ASSERT_TRUE(applied.hasError());
    EXPECT_EQ(applied.error().code(), ErrorCode::TiedScore);
    EXPECT_TRUE(engine.ratings().empty());
}

TEST(ContextualRatingEngineTest, RunFromStore) {
    rally::league::MatchStore store;
    ASSERT_TRUE(store.add(makeGame("A", "B", "C", "D", 11, 4)).hasValue());
    ASSERT_TRUE(store.add(makeGame("A", "B", "C", "DEFAULT", 11, 0)).hasValue());

    ContextualRatingEngine engine;
    auto summary = engine.run(store);
    ASSERT_TRUE(summary.hasValue());
    EXPECT_EQ(summary.value().gamesRated, 1u);
    EXPECT_EQ(engine.ratings().size(), 4u);
    EXPECT_GT(engine.ratings().peek("A"), engine.ratings().peek("C"));
}
