#pragma once

/// @file result.hpp
/// @brief Result<T,E> value-or-error type used across the rating pipeline.

#include <string>
#include <utility>
#include <variant>

namespace rally {

/// Minimal error payload for Result when no richer type is needed.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Holds either a computed value or the error that prevented it.
///
/// Ingestion, rating, synergy and config code return Result instead of
/// throwing, so a fatal record aborts a run through ordinary control flow.
///
/// Example:
/// @code
///   auto loaded = readMatchCsv("match_data.csv");
///   if (!loaded) {
///       std::cerr << loaded.error().message() << '\n';
///       return EXIT_FAILURE;
///   }
///   auto rows = std::move(loaded).value();
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }

    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }

    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<E>(data_); }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the value (undefined behavior if this holds an error).
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Access the error (undefined behavior if this holds a value).
    [[nodiscard]] const E& error() const& { return std::get<E>(data_); }
    [[nodiscard]] E& error() & { return std::get<E>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(E error) : data_(std::move(error)) {}

    std::variant<T, E> data_;
};

/// Specialization for operations that only succeed or fail.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace rally
