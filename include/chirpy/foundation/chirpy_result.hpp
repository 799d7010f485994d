#pragma once

/// @file chirpy_result.hpp
/// @brief ChirpyResult<T> alias used by every fallible operation.

#include "chirpy/core/result.hpp"
#include "chirpy/foundation/chirpy_error.hpp"

namespace chirpy::foundation {

/// Result type specialized with ChirpyError.
///
/// Example:
/// @code
///   ChirpyResult<std::string> requireEmail(const std::optional<std::string>& email) {
///       if (!email) {
///           return ChirpyResult<std::string>::err(
///               ChirpyError(ErrorCode::ValidationFailed, "missing email"));
///       }
///       return ChirpyResult<std::string>::ok(*email);
///   }
/// @endcode
template <typename T>
using ChirpyResult = chirpy::Result<T, ChirpyError>;

}  // namespace chirpy::foundation
