#pragma once

/// @file rally_result.hpp
/// @brief RallyResult<T> alias used by every fallible operation.

#include "rally/core/result.hpp"
#include "rally/foundation/rally_error.hpp"

namespace rally::foundation {

/// Result type specialized with RallyError.
///
/// Example:
/// @code
///   RallyResult<int> parsePoints(std::string_view text) {
///       if (text.empty()) {
///           return RallyResult<int>::err(
///               RallyError(ErrorCode::MissingField, "points are empty"));
///       }
///       return RallyResult<int>::ok(std::stoi(std::string(text)));
///   }
/// @endcode
template <typename T>
using RallyResult = rally::Result<T, RallyError>;

}  // namespace rally::foundation
