#pragma once

/// @file console_logger.hpp
/// @brief Line-oriented kcenon ILogger that writes to a stream (stderr by default).

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace rally::foundation {

/// Writes "LEVEL message" lines. Installed as the registry default logger
/// by the command-line tool so report output on stdout stays clean.
class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    explicit ConsoleLogger(std::ostream& out = std::cerr,
                           log_level minLevel = log_level::trace);

    kcenon::common::VoidResult log(log_level level, const std::string& message) override;

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(log_level level) const override;

    kcenon::common::VoidResult set_level(log_level level) override;

    log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

private:
    std::ostream& out_;
    std::mutex mutex_;
    std::atomic<log_level> minLevel_;
};

} // namespace rally::foundation
