/// @file app_config.cpp
/// @brief AppConfig construction from flattened YAML keys.

#include "rally/app/app_config.hpp"

#include <array>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace rally::app {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::RallyError;
using foundation::RallyResult;
using rating::FavorednessLevel;
using rating::MarginClass;
using rating::OutcomeClass;
using rating::PolicyKey;

namespace {

/// Overwrite @p target with the key's value if the key is present.
template <typename T>
RallyResult<void> readOptional(const ConfigManager& config, const std::string& key, T& target) {
    if (!config.hasKey(key)) {
        return RallyResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return RallyResult<void>::err(value.error());
    }
    target = value.value();
    return RallyResult<void>::ok();
}

RallyResult<void> readCount(const ConfigManager& config, const std::string& key,
                            std::size_t& target) {
    int value = static_cast<int>(target);
    auto read = readOptional(config, key, value);
    if (!read) {
        return read;
    }
    if (value < 0) {
        return RallyResult<void>::err(
            RallyError(ErrorCode::InvalidArgument, key + " must not be negative"));
    }
    target = static_cast<std::size_t>(value);
    return RallyResult<void>::ok();
}

std::string multiplierKey(const PolicyKey& key) {
    std::string path = "rating.multipliers.";
    path += rating::outcomeClassName(key.outcome);
    if (key.outcome != OutcomeClass::Tossup) {
        path += '.';
        path += rating::favorednessName(key.level);
    }
    path += '.';
    path += rating::marginClassName(key.margin);
    return path;
}

RallyResult<void> readPolicy(const ConfigManager& config, rating::RatingPolicy& policy) {
    const std::pair<const char*, double*> reals[] = {
        {"rating.default_rating", &policy.defaultRating},
        {"rating.base_delta", &policy.baseRatingDelta},
        {"rating.winning_bonus", &policy.winningBonus},
        {"rating.tossup_threshold", &policy.tossupThreshold},
        {"rating.slight_threshold", &policy.slightThreshold},
        {"rating.fallback_multiplier", &policy.fallbackMultiplier},
    };
    for (const auto& [key, target] : reals) {
        if (auto read = readOptional(config, key, *target); !read) {
            return read;
        }
    }
    if (auto read = readOptional(config, "rating.blowout_margin", policy.blowoutMargin); !read) {
        return read;
    }
    if (auto read = readOptional(config, "rating.narrow_margin", policy.narrowMargin); !read) {
        return read;
    }

    constexpr std::array kMargins = {MarginClass::Narrow, MarginClass::Solid, MarginClass::Blowout};
    constexpr std::array kSided = {OutcomeClass::Underdog, OutcomeClass::Favored};
    constexpr std::array kLevels = {FavorednessLevel::Slight, FavorednessLevel::Heavy};

    std::vector<PolicyKey> keys;
    for (auto margin : kMargins) {
        keys.push_back({OutcomeClass::Tossup, FavorednessLevel::None, margin});
        for (auto outcome : kSided) {
            for (auto level : kLevels) {
                keys.push_back({outcome, level, margin});
            }
        }
    }
    for (const auto& key : keys) {
        double value = policy.multiplierFor(key);
        auto path = multiplierKey(key);
        if (!config.hasKey(path)) {
            continue;
        }
        if (auto read = readOptional(config, path, value); !read) {
            return read;
        }
        policy.multipliers[key] = value;
    }
    return policy.validate();
}

} // namespace

RallyResult<AppConfig> loadRallyConfig(const ConfigManager& config) {
    AppConfig app;

    if (auto read = readPolicy(config, app.policy); !read) {
        return RallyResult<AppConfig>::err(read.error());
    }

    if (auto read = readCount(config, "synergy.min_games", app.synergy.minGames); !read) {
        return RallyResult<AppConfig>::err(read.error());
    }
    if (auto read = readOptional(config, "synergy.logistic_scale", app.synergy.logisticScale);
        !read) {
        return RallyResult<AppConfig>::err(read.error());
    }
    if (!(app.synergy.logisticScale > 0.0)) {
        return RallyResult<AppConfig>::err(
            RallyError(ErrorCode::InvalidArgument, "synergy.logistic_scale must be positive"));
    }

    const std::pair<const char*, double*> trueskill[] = {
        {"estimator.trueskill.mu", &app.trueskill.mu},
        {"estimator.trueskill.sigma", &app.trueskill.sigma},
        {"estimator.trueskill.beta", &app.trueskill.beta},
        {"estimator.trueskill.tau", &app.trueskill.tau},
    };
    for (const auto& [key, target] : trueskill) {
        if (auto read = readOptional(config, key, *target); !read) {
            return RallyResult<AppConfig>::err(read.error());
        }
    }

    if (auto read = readCount(config, "league.expected_games_per_match",
                              app.expectedGamesPerMatch);
        !read) {
        return RallyResult<AppConfig>::err(read.error());
    }

    if (auto read = readOptional(config, "report.precision", app.report.precision); !read) {
        return RallyResult<AppConfig>::err(read.error());
    }
    if (app.report.precision < 0 || app.report.precision > 17) {
        return RallyResult<AppConfig>::err(
            RallyError(ErrorCode::InvalidArgument, "report.precision must be within 0..17"));
    }

    std::string levelName;
    if (auto read = readOptional(config, "logging.level", levelName); !read) {
        return RallyResult<AppConfig>::err(read.error());
    }
    if (!levelName.empty()) {
        app.logLevel = foundation::parseLogLevel(levelName);
        if (!app.logLevel) {
            return RallyResult<AppConfig>::err(
                RallyError(ErrorCode::InvalidArgument, "unknown logging.level: " + levelName));
        }
    }

    return RallyResult<AppConfig>::ok(std::move(app));
}

RallyResult<void> loadConfigFile(ConfigManager& config, const std::filesystem::path& path) {
    std::filesystem::path configPath = path;

    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }
    if (configPath.empty()) {
        return RallyResult<void>::ok();
    }
    return config.load(configPath);
}

} // namespace rally::app
