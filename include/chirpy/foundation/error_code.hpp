#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes and the caller-facing error kinds.

#include <cstdint>
#include <string_view>

namespace chirpy::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    ValidationFailed = 0x0005,

    // Storage (0x0200 - 0x02FF)
    StorageError = 0x0200,

    // Auth (0x0500 - 0x05FF)
    AuthenticationFailed = 0x0500,
    Forbidden = 0x0501,
    HashingFailed = 0x0502,
    RandomSourceFailed = 0x0503,
    SigningFailed = 0x0504,

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
        case 0x0200: return "Storage";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Coarse error kinds handed to the transport layer.
///
/// The transport layer picks a status from the kind alone:
/// Validation=400, Authentication=401, Forbidden=403, NotFound=404,
/// Conflict=409, Internal=500.
enum class ErrorKind : uint8_t {
    None,
    Validation,
    Authentication,
    Forbidden,
    NotFound,
    Conflict,
    Internal
};

constexpr ErrorKind errorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return ErrorKind::None;
        case ErrorCode::InvalidArgument:
        case ErrorCode::ValidationFailed: return ErrorKind::Validation;
        case ErrorCode::AuthenticationFailed: return ErrorKind::Authentication;
        case ErrorCode::Forbidden: return ErrorKind::Forbidden;
        case ErrorCode::NotFound: return ErrorKind::NotFound;
        case ErrorCode::AlreadyExists: return ErrorKind::Conflict;
        default: return ErrorKind::Internal;
    }
}

constexpr std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::Authentication: return "Authentication";
        case ErrorKind::Forbidden: return "Forbidden";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Conflict: return "Conflict";
        case ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace chirpy::foundation
