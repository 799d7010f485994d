#pragma once

/// @file chirpy_error.hpp
/// @brief Error type used with Result<T, ChirpyError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "chirpy/foundation/error_code.hpp"

namespace chirpy::foundation {

/// Error carrying a code, a caller-safe message, and optional type-erased
/// context for server-side diagnostics.
///
/// The message is what the caller may show. Anything that must not leak
/// (the precise reason an authentication check failed, for instance) goes
/// in the context, which only logging code reads.
class ChirpyError {
public:
    ChirpyError() = default;

    explicit ChirpyError(ErrorCode code)
        : code_(code) {}

    ChirpyError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ChirpyError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// The caller-facing kind (validation, authentication, ...).
    [[nodiscard]] ErrorKind kind() const noexcept { return errorKind(code_); }

    /// Access typed context data (returns nullptr if type mismatch or empty).
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

} // namespace chirpy::foundation
