#pragma once

/// @file rally_logger.hpp
/// @brief RallyLogger wrapping the kcenon common logger interfaces for
/// category-filtered, structured logging of rating runs.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rally/foundation/rally_result.hpp"

namespace rally::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Pipeline stages used for per-category filtering.
enum class LogCategory : uint8_t {
    Core      = 0, ///< CLI and run orchestration
    Ingest    = 1, ///< Record validation and forfeit filtering
    Rating    = 2, ///< Contextual rating updates
    Estimator = 3, ///< Probabilistic skill estimation
    Synergy   = 4, ///< Partnership synergy scoring
    Pool      = 5, ///< Connectivity analysis
    Report    = 6, ///< Table output
    Io        = 7  ///< CSV and snapshot files
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Ingest", "Rating", "Estimator", "Synergy", "Pool", "Report", "Io"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a case-insensitive level name ("debug", "WARNING", "warn", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured identifiers attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.matchId = "1042";
///   ctx.gameNumber = 3;
///   ctx.extra["margin"] = "blowout";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Rating,
///                         "game rated", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> matchId;
    std::optional<int> gameNumber;
    std::optional<std::string> player;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger in front of kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to a registry logger named "rally.<Category>"
/// and falls back to the registry default. Uses PIMPL so the kcenon
/// headers stay out of the public API.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Ingest    | Info          |
/// | Rating    | Debug         |
/// | Estimator | Info          |
/// | Synergy   | Debug         |
/// | Pool      | Info          |
/// | Report    | Info          |
/// | Io        | Info          |
class RallyLogger {
public:
    RallyLogger();
    ~RallyLogger();

    RallyLogger(const RallyLogger&) = delete;
    RallyLogger& operator=(const RallyLogger&) = delete;
    RallyLogger(RallyLogger&&) noexcept;
    RallyLogger& operator=(RallyLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by its context as " {key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry default logger.
    RallyResult<void> flush();

    /// Process-wide instance used by the RALLY_LOG macros.
    static RallyLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rally::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name RALLY_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define RALLY_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef RALLY_MIN_LOG_LEVEL
    #define RALLY_MIN_LOG_LEVEL 0
#endif

#define RALLY_LOG(level, cat, msg)                                                   \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= RALLY_MIN_LOG_LEVEL &&                        \
            ::rally::foundation::RallyLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::rally::foundation::RallyLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define RALLY_LOG_DEBUG(cat, msg) \
    RALLY_LOG(::rally::foundation::LogLevel::Debug, (cat), (msg))

#define RALLY_LOG_INFO(cat, msg) \
    RALLY_LOG(::rally::foundation::LogLevel::Info, (cat), (msg))

#define RALLY_LOG_WARN(cat, msg) \
    RALLY_LOG(::rally::foundation::LogLevel::Warning, (cat), (msg))

#define RALLY_LOG_ERROR(cat, msg) \
    RALLY_LOG(::rally::foundation::LogLevel::Error, (cat), (msg))

/// @}
