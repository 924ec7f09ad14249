/// @file rally_logger.cpp
/// @brief RallyLogger implementation over kcenon common_system.

#include "rally/foundation/rally_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace rally::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: rally -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Ingest
    LogLevel::Debug,  // Rating
    LogLevel::Info,   // Estimator
    LogLevel::Debug,  // Synergy
    LogLevel::Info,   // Pool
    LogLevel::Info,   // Report
    LogLevel::Info    // Io
};

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "critical") return LogLevel::Critical;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.matchId && !ctx.matchId->empty()) {
        append("match_id", *ctx.matchId);
    }
    if (ctx.gameNumber) {
        append("game", std::to_string(*ctx.gameNumber));
    }
    if (ctx.player && !ctx.player->empty()) {
        append("player", *ctx.player);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct RallyLogger::Impl {
    // Read on every log call; atomics keep the level check lock-free.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("rally.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto logger = registry.get_logger(loggerNames[idx]);
        // An unregistered name resolves to the null logger, which accepts nothing.
        if (!logger->is_enabled(kci::log_level::off)) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              const std::string& ctxStr) const {
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }
        getLogger(cat)->log(mapLevel(level), formatted);
    }
};

RallyLogger::RallyLogger() : impl_(std::make_unique<Impl>()) {}

RallyLogger::~RallyLogger() = default;

RallyLogger::RallyLogger(RallyLogger&&) noexcept = default;
RallyLogger& RallyLogger::operator=(RallyLogger&&) noexcept = default;

void RallyLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void RallyLogger::logWithContext(LogLevel level, LogCategory cat,
                                 std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void RallyLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void RallyLogger::setAllLevels(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel RallyLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return LogLevel::Off;
    }
    return impl_->categoryLevels[idx].load(std::memory_order_acquire);
}

bool RallyLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

RallyResult<void> RallyLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return RallyResult<void>::err(
            RallyError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return RallyResult<void>::ok();
}

RallyLogger& RallyLogger::instance() {
    static RallyLogger inst;
    return inst;
}

} // namespace rally::foundation
