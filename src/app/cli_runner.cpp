/// @file cli_runner.cpp
/// @brief Command implementations of the rally command-line tool.

#include "rally/app/cli_runner.hpp"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "rally/foundation/rally_logger.hpp"
#include "rally/io/csv_reader.hpp"
#include "rally/pool/pool_partitioner.hpp"
#include "rally/rating/contextual_rating_engine.hpp"
#include "rally/rating/trueskill_estimator.hpp"
#include "rally/report/report_writer.hpp"
#include "rally/synergy/synergy_analyzer.hpp"

namespace rally::app {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RallyError;
using foundation::RallyResult;

namespace {

RallyResult<CliOptions> usageError(std::string message) {
    return RallyResult<CliOptions>::err(RallyError(ErrorCode::InvalidArgument, std::move(message)));
}

std::optional<Command> parseCommand(std::string_view name) {
    if (name == "rank") return Command::Rank;
    if (name == "skill") return Command::Skill;
    if (name == "synergy") return Command::Synergy;
    if (name == "pools") return Command::Pools;
    return std::nullopt;
}

/// Warn (never fail) when the league splits into several pools.
void warnIfFragmented(const league::MatchStore& store) {
    auto pools = pool::PoolPartitioner::fromStore(store).pools();
    if (pools.size() > 1) {
        RALLY_LOG_WARN(LogCategory::Pool,
                       "players form " + std::to_string(pools.size()) +
                           " disconnected pools; ratings are not comparable across pools");
    }
}

RallyResult<rating::ContextualRatingEngine> runContextual(const CliOptions& options,
                                                          const AppConfig& config,
                                                          const league::MatchStore& store) {
    using EngineResult = RallyResult<rating::ContextualRatingEngine>;

    rating::RatingStore seed(config.policy.defaultRating);
    if (options.seedRatingsPath) {
        auto loaded = io::loadRatingSnapshot(*options.seedRatingsPath, config.policy.defaultRating);
        if (!loaded) {
            return EngineResult::err(loaded.error());
        }
        seed = std::move(loaded).value();
    }

    rating::ContextualRatingEngine engine(config.policy, std::move(seed));
    auto summary = engine.run(store);
    if (!summary) {
        return EngineResult::err(summary.error());
    }

    if (options.saveRatingsPath) {
        auto saved = io::saveRatingSnapshot(*options.saveRatingsPath, engine.ratings());
        if (!saved) {
            return EngineResult::err(saved.error());
        }
    }
    return EngineResult::ok(std::move(engine));
}

RallyResult<rating::SkillTable> runTrueSkill(const AppConfig& config,
                                            const league::MatchStore& store) {
    rating::TrueSkillEstimator estimator(config.trueskill);
    auto compositions = rating::compositionsOf(store);
    return estimator.estimate(compositions);
}

RallyResult<void> runSynergy(const CliOptions& options, const AppConfig& config,
                             const league::MatchStore& store, std::ostream& out) {
    rating::SkillMap skills;
    if (options.source == SkillSource::TrueSkill) {
        auto table = runTrueSkill(config, store);
        if (!table) {
            return RallyResult<void>::err(table.error());
        }
        skills = rating::locationsOf(table.value());
    } else {
        auto engine = runContextual(options, config, store);
        if (!engine) {
            return RallyResult<void>::err(engine.error());
        }
        skills = engine.value().ratings().toSkillMap();
    }

    synergy::SynergyAnalyzer analyzer(config.synergy);
    auto entries = analyzer.analyze(store, skills);
    if (!entries) {
        return RallyResult<void>::err(entries.error());
    }
    report::writeSynergyTable(out, entries.value(), config.report);
    return RallyResult<void>::ok();
}

} // namespace

std::string_view usage() {
    return "usage: rally_cli <rank|skill|synergy|pools> <matches.csv> [--config <file>]\n"
           "                 [--ratings <seed.csv>] [--save-ratings <out.csv>]\n"
           "                 [--source contextual|trueskill]\n";
}

RallyResult<CliOptions> parseCliArgs(std::span<const std::string_view> args) {
    CliOptions options;
    std::vector<std::string_view> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        auto arg = args[i];
        if (!arg.starts_with("--")) {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= args.size()) {
            return usageError("option " + std::string(arg) + " needs a value");
        }
        auto value = args[++i];
        if (arg == "--config") {
            options.configPath = value;
        } else if (arg == "--ratings") {
            options.seedRatingsPath = std::filesystem::path(value);
        } else if (arg == "--save-ratings") {
            options.saveRatingsPath = std::filesystem::path(value);
        } else if (arg == "--source") {
            if (value == "contextual") {
                options.source = SkillSource::Contextual;
            } else if (value == "trueskill") {
                options.source = SkillSource::TrueSkill;
            } else {
                return usageError("unknown skill source: " + std::string(value));
            }
        } else {
            return usageError("unknown option: " + std::string(arg));
        }
    }

    if (positional.size() != 2) {
        return usageError("expected a command and a match file");
    }
    auto command = parseCommand(positional[0]);
    if (!command) {
        return usageError("unknown command: " + std::string(positional[0]));
    }
    options.command = *command;
    options.matchesPath = positional[1];
    return RallyResult<CliOptions>::ok(std::move(options));
}

RallyResult<league::MatchStore> loadMatches(const std::filesystem::path& path,
                                            const AppConfig& config) {
    using StoreResult = RallyResult<league::MatchStore>;

    auto rows = io::readMatchFile(path);
    if (!rows) {
        return StoreResult::err(rows.error());
    }

    league::MatchStore store;
    auto summary = store.ingestAll(rows.value());
    if (!summary) {
        return StoreResult::err(summary.error());
    }

    const auto& counts = summary.value();
    RALLY_LOG_INFO(LogCategory::Ingest,
                   "accepted " + std::to_string(counts.accepted) + " games, skipped " +
                       std::to_string(counts.forfeits) + " forfeits and " +
                       std::to_string(counts.unparseableScores) + " unparseable scores");

    for (const auto& match : store.incompleteMatches(config.expectedGamesPerMatch)) {
        RALLY_LOG_WARN(LogCategory::Ingest,
                       "match " + match.matchId + " has " + std::to_string(match.games) +
                           " games, expected " + std::to_string(config.expectedGamesPerMatch));
    }
    return StoreResult::ok(std::move(store));
}

RallyResult<void> runCommand(const CliOptions& options, const AppConfig& config,
                             std::ostream& out) {
    auto loaded = loadMatches(options.matchesPath, config);
    if (!loaded) {
        return RallyResult<void>::err(loaded.error());
    }
    const auto& store = loaded.value();

    switch (options.command) {
        case Command::Pools: {
            auto pools = pool::PoolPartitioner::fromStore(store).pools();
            report::writePoolReport(out, pools);
            return RallyResult<void>::ok();
        }
        case Command::Rank: {
            warnIfFragmented(store);
            auto engine = runContextual(options, config, store);
            if (!engine) {
                return RallyResult<void>::err(engine.error());
            }
            report::writeRatingTable(out, engine.value().ratings(), config.report);
            return RallyResult<void>::ok();
        }
        case Command::Skill: {
            warnIfFragmented(store);
            auto table = runTrueSkill(config, store);
            if (!table) {
                return RallyResult<void>::err(table.error());
            }
            report::writeSkillTable(out, table.value(), config.report);
            return RallyResult<void>::ok();
        }
        case Command::Synergy:
            warnIfFragmented(store);
            return runSynergy(options, config, store, out);
    }
    return RallyResult<void>::err(RallyError(ErrorCode::InvalidArgument, "unknown command"));
}

} // namespace rally::app
