#pragma once

/// @file runtime_result.hpp
/// @brief RuntimeResult<T> alias for plugin runtime error handling.

#include "cpr/core/result.hpp"
#include "cpr/foundation/runtime_error.hpp"

namespace cpr::foundation {

/// Result type specialized with RuntimeError.
///
/// Example:
/// @code
///   RuntimeResult<Version> parse(std::string_view text) {
///       if (text.empty()) {
///           return RuntimeResult<Version>::err(
///               RuntimeError(ErrorCode::InvalidArgument, "empty version"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using RuntimeResult = cpr::Result<T, RuntimeError>;

/// Shorthand for an error result of any RuntimeResult type.
template <typename T>
RuntimeResult<T> fail(ErrorCode code, std::string message) {
    return RuntimeResult<T>::err(RuntimeError(code, std::move(message)));
}

}  // namespace cpr::foundation
