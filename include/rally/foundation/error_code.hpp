#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the rating pipeline.

#include <cstdint>
#include <string_view>

namespace rally::foundation {

/// Error codes grouped by subsystem in 0x100-wide ranges, so the
/// producing subsystem can be read off the value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Record ingestion (0x0100 - 0x01FF)
    RecordError = 0x0100,
    MissingField = 0x0101,
    InvalidDate = 0x0102,
    InvalidGameNumber = 0x0103,
    InvalidScore = 0x0104,
    TiedScore = 0x0105,
    DuplicatePlayer = 0x0106,

    // Rating (0x0200 - 0x02FF)
    RatingError = 0x0200,
    UnknownPlayer = 0x0201,
    InvalidPolicy = 0x0202,
    EstimatorFailed = 0x0203,

    // Synergy (0x0300 - 0x03FF)
    SynergyError = 0x0300,
    MissingSkillEstimate = 0x0301,

    // I/O (0x0400 - 0x04FF)
    IoError = 0x0400,
    FileOpenFailed = 0x0401,
    MissingColumn = 0x0402,
    MalformedRow = 0x0403,
    WriteFailed = 0x0404,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Record";
        case 0x0200: return "Rating";
        case 0x0300: return "Synergy";
        case 0x0400: return "Io";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace rally::foundation
