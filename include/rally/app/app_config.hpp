#pragma once

/// @file app_config.hpp
/// @brief Typed application configuration built from a ConfigManager.

#include <cstddef>
#include <filesystem>
#include <optional>

#include "rally/foundation/config_manager.hpp"
#include "rally/foundation/rally_logger.hpp"
#include "rally/foundation/rally_result.hpp"
#include "rally/rating/rating_policy.hpp"
#include "rally/rating/trueskill_estimator.hpp"
#include "rally/report/report_writer.hpp"
#include "rally/synergy/synergy_analyzer.hpp"

namespace rally::app {

/// Environment variable that overrides the --config path.
inline constexpr const char* kConfigPathEnv = "RALLY_CONFIG_PATH";

/// Everything a command run needs besides its inputs.
struct AppConfig {
    rating::RatingPolicy policy;
    synergy::SynergyConfig synergy;
    rating::TrueSkillParams trueskill;
    /// Games a complete match should contain; 0 disables the check.
    std::size_t expectedGamesPerMatch = 9;
    report::ReportOptions report;
    /// Applied to every log category when set.
    std::optional<foundation::LogLevel> logLevel;
};

/// Build an AppConfig from recognized keys. Absent keys keep their
/// defaults.
/// @return The config, ConfigTypeMismatch for a value of the wrong type,
///         or InvalidPolicy / InvalidArgument for out-of-range values.
[[nodiscard]] foundation::RallyResult<AppConfig> loadRallyConfig(
    const foundation::ConfigManager& config);

/// Load the YAML file at @p path, or at RALLY_CONFIG_PATH when that is set.
/// Leaves @p config untouched when neither names a file.
[[nodiscard]] foundation::RallyResult<void> loadConfigFile(foundation::ConfigManager& config,
                                                           const std::filesystem::path& path);

} // namespace rally::app
