#pragma once

/// @file rally_error.hpp
/// @brief Error type carried by RallyResult<T>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "rally/foundation/error_code.hpp"

namespace rally::foundation {

/// Error code plus a human-readable message and optional typed context
/// (for example the offending RawGameRow of a rejected record).
class RallyError {
public:
    RallyError() = default;

    explicit RallyError(ErrorCode code)
        : code_(code) {}

    RallyError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    RallyError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace rally::foundation
