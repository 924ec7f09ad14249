#pragma once

/// @file cli_runner.hpp
/// @brief Command-line option parsing and the rank / skill / synergy / pools commands.

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string_view>

#include "rally/app/app_config.hpp"
#include "rally/foundation/rally_result.hpp"
#include "rally/league/match_store.hpp"

namespace rally::app {

enum class Command { Rank, Skill, Synergy, Pools };

/// Where the synergy command takes individual skill from.
enum class SkillSource { Contextual, TrueSkill };

struct CliOptions {
    Command command = Command::Rank;
    std::filesystem::path matchesPath;
    std::filesystem::path configPath;
    std::optional<std::filesystem::path> seedRatingsPath;
    std::optional<std::filesystem::path> saveRatingsPath;
    SkillSource source = SkillSource::Contextual;
};

/// Usage text printed for usage errors.
[[nodiscard]] std::string_view usage();

/// Parse arguments (program name excluded).
/// @return The options, or InvalidArgument describing the usage error.
[[nodiscard]] foundation::RallyResult<CliOptions> parseCliArgs(std::span<const std::string_view> args);

/// Read, validate and ingest the match file; warns about matches whose
/// game count differs from the expected count.
[[nodiscard]] foundation::RallyResult<league::MatchStore> loadMatches(
    const std::filesystem::path& path, const AppConfig& config);

/// Execute a parsed command, writing its table to @p out.
[[nodiscard]] foundation::RallyResult<void> runCommand(const CliOptions& options,
                                                       const AppConfig& config, std::ostream& out);

} // namespace rally::app
