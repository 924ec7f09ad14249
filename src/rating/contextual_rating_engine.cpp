/// @file contextual_rating_engine.cpp
/// @brief ContextualRatingEngine classification and update fold.

#include "rally/rating/contextual_rating_engine.hpp"

#include <cmath>
#include <cstdio>
#include <utility>

#include "rally/foundation/rally_logger.hpp"

namespace rally::rating {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RallyError;
using foundation::RallyLogger;
using foundation::RallyResult;

namespace {

std::string fixed3(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    return buf;
}

} // namespace

double RatingUpdate::netChange() const noexcept {
    double sum = 0.0;
    for (const auto& p : players) {
        sum += p.change();
    }
    return sum;
}

ContextualRatingEngine::ContextualRatingEngine(RatingPolicy policy)
    : policy_(std::move(policy)), ratings_(policy_.defaultRating) {}

ContextualRatingEngine::ContextualRatingEngine(RatingPolicy policy, RatingStore seed)
    : policy_(std::move(policy)), ratings_(std::move(seed)) {}

GameContext ContextualRatingEngine::classify(const league::Game& game) const {
    GameContext ctx;
    ctx.team1Rating = (ratings_.peek(game.team1.first) + ratings_.peek(game.team1.second)) / 2.0;
    ctx.team2Rating = (ratings_.peek(game.team2.first) + ratings_.peek(game.team2.second)) / 2.0;
    ctx.ratingDiff = std::abs(ctx.team1Rating - ctx.team2Rating);
    ctx.team1Won = game.team1Won();

    if (ctx.ratingDiff < policy_.tossupThreshold) {
        ctx.key.outcome = OutcomeClass::Tossup;
        ctx.key.level = FavorednessLevel::None;
    } else {
        bool team1Favored = ctx.team1Rating > ctx.team2Rating;
        ctx.team1Favored = team1Favored;
        ctx.key.level = ctx.ratingDiff < policy_.slightThreshold ? FavorednessLevel::Slight
                                                                 : FavorednessLevel::Heavy;
        ctx.key.outcome = team1Favored == ctx.team1Won ? OutcomeClass::Favored
                                                       : OutcomeClass::Underdog;
    }

    ctx.key.margin = policy_.classifyMargin(game.margin());
    ctx.multiplier = policy_.multiplierFor(ctx.key);
    ctx.delta = policy_.baseRatingDelta * ctx.multiplier / 2.0;
    return ctx;
}

RallyResult<std::optional<RatingUpdate>> ContextualRatingEngine::apply(const league::Game& game) {
    using Outcome = RallyResult<std::optional<RatingUpdate>>;

    if (game.isForfeit()) {
        LogContext lc;
        lc.matchId = game.matchId;
        lc.gameNumber = game.gameNumber;
        RallyLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Rating,
                                               "skipping defaulted game", lc);
        return Outcome::ok(std::nullopt);
    }
    if (game.team1Points < 0 || game.team2Points < 0) {
        return Outcome::err(RallyError(ErrorCode::InvalidScore,
                                       "negative score in " + game.describe()));
    }
    if (game.team1Points == game.team2Points) {
        return Outcome::err(RallyError(ErrorCode::TiedScore,
                                       "tied game cannot be rated: " + game.describe()));
    }

    RatingUpdate update;
    update.context = classify(game);
    const auto& ctx = update.context;

    // Capture all four pre-game ratings before writing any of them.
    const std::array<const std::string*, 4> names = {
        &game.team1.first, &game.team1.second, &game.team2.first, &game.team2.second};
    for (std::size_t i = 0; i < names.size(); ++i) {
        update.players[i].player = *names[i];
        update.players[i].before = ratings_.getOrInsertDefault(*names[i]);
    }

    const double winnerChange = ctx.delta + policy_.winningBonus;
    const double loserChange = -ctx.delta;
    for (std::size_t i = 0; i < names.size(); ++i) {
        bool onTeam1 = i < 2;
        bool won = onTeam1 == ctx.team1Won;
        update.players[i].after = update.players[i].before + (won ? winnerChange : loserChange);
    }

    for (const auto& p : update.players) {
        ratings_.set(p.player, p.after);
    }

    logUpdate(game, update);
    return Outcome::ok(std::move(update));
}

RallyResult<RatingRunSummary> ContextualRatingEngine::run(std::vector<league::Game> games) {
    league::sortChronologically(games);

    RatingRunSummary summary;
    for (const auto& game : games) {
        auto applied = apply(game);
        if (!applied) {
            return RallyResult<RatingRunSummary>::err(applied.error());
        }
        if (applied.value()) {
            ++summary.gamesRated;
        } else {
            ++summary.gamesSkipped;
        }
    }

    RALLY_LOG_INFO(LogCategory::Rating,
                   "rated " + std::to_string(summary.gamesRated) + " games for " +
                       std::to_string(ratings_.size()) + " players");
    return RallyResult<RatingRunSummary>::ok(summary);
}

RallyResult<RatingRunSummary> ContextualRatingEngine::run(const league::MatchStore& store) {
    return run(store.games());
}

void ContextualRatingEngine::logUpdate(const league::Game& game, const RatingUpdate& update) const {
    auto& logger = RallyLogger::instance();
    if (!logger.isEnabled(LogLevel::Debug, LogCategory::Rating)) {
        return;
    }

    const auto& ctx = update.context;
    LogContext lc;
    lc.matchId = game.matchId;
    lc.gameNumber = game.gameNumber;
    lc.extra["team_ratings"] = fixed3(ctx.team1Rating) + "/" + fixed3(ctx.team2Rating);
    lc.extra["diff"] = fixed3(ctx.ratingDiff);
    lc.extra["outcome"] = std::string(outcomeClassName(ctx.key.outcome));
    lc.extra["level"] = std::string(favorednessName(ctx.key.level));
    lc.extra["margin"] = std::string(marginClassName(ctx.key.margin));
    lc.extra["multiplier"] = fixed3(ctx.multiplier);
    lc.extra["delta"] = fixed3(ctx.delta);
    for (const auto& p : update.players) {
        lc.extra[p.player] = fixed3(p.before) + "->" + fixed3(p.after);
    }
    logger.logWithContext(LogLevel::Debug, LogCategory::Rating, game.describe(), lc);
}

} // namespace rally::rating
