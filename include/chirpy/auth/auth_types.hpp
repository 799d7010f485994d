#pragma once

/// @file auth_types.hpp
/// @brief Core type definitions for the session authentication core.
///
/// Defines user records, token structures, request inputs, policy
/// constants and configuration used throughout the auth layer.

#include "chirpy/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chirpy::auth {

using foundation::UserId;

// -- Policy constants ---------------------------------------------------------

/// Issuer claim written into every access token.
inline constexpr std::string_view kTokenIssuer = "chirpy";

/// Lifetime of access tokens at every issuing call site.
inline constexpr std::chrono::seconds kAccessTokenTtl{3600};

/// Lifetime of refresh tokens, measured from creation.
inline constexpr std::chrono::seconds kRefreshTokenTtl{60 * 24 * 60 * 60};  // 60 days

/// bcrypt work factor.
inline constexpr unsigned long kBcryptCost = 10;

/// Raw entropy of a refresh token; hex encoding doubles the length.
inline constexpr std::size_t kRefreshTokenBytes = 32;

// -- User model ---------------------------------------------------------------

/// Stored user record. The hash is a bcrypt-encoded string; the plaintext
/// password is never stored.
struct User {
    UserId id;
    std::string email;
    std::string passwordHash;
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point updatedAt{};
};

/// User as returned to callers: everything except the password hash.
struct PublicUser {
    UserId id;
    std::string email;
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point updatedAt{};
};

/// Strip the credential from a stored user.
[[nodiscard]] inline PublicUser toPublicUser(const User& user) {
    return {user.id, user.email, user.createdAt, user.updatedAt};
}

// -- Token structures ---------------------------------------------------------

/// Decoded access token claims.
struct AccessClaims {
    std::string issuer;                                 ///< "iss"
    UserId subject;                                     ///< "sub"
    std::chrono::system_clock::time_point issuedAt{};   ///< "iat"
    std::chrono::system_clock::time_point expiresAt{};  ///< "exp"
};

/// Persisted refresh token metadata, keyed by the token value.
struct RefreshTokenRecord {
    std::string token;
    UserId userId;
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point expiresAt{};
    std::optional<std::chrono::system_clock::time_point> revokedAt;

    /// Not revoked and not yet expired at @p now.
    [[nodiscard]] bool isLive(std::chrono::system_clock::time_point now) const noexcept {
        return !revokedAt.has_value() && expiresAt > now;
    }
};

/// Payload of a successful login.
struct LoginResult {
    PublicUser user;
    std::string accessToken;
    std::string refreshToken;
    std::chrono::seconds accessExpiresIn{};
};

/// Payload of a successful refresh.
struct AccessTokenGrant {
    std::string accessToken;
    std::chrono::seconds expiresIn{};
};

// -- Request inputs -----------------------------------------------------------
// Fields are optional because the transport layer may omit them; the
// authenticator validates presence once, at its boundary.

struct LoginRequest {
    std::optional<std::string> email;
    std::optional<std::string> password;
};

struct RegisterRequest {
    std::optional<std::string> email;
    std::optional<std::string> password;
};

struct UpdateCredentialsRequest {
    std::optional<std::string> email;
    std::optional<std::string> password;
};

// -- Failure diagnostics ------------------------------------------------------

/// Why an authentication check failed. Attached to AuthenticationFailed
/// errors as context for server-side logs only; never part of the message.
enum class AuthFailureReason : uint8_t {
    MissingOrInvalidCredential,
    MalformedToken,
    UnsupportedAlgorithm,
    BadSignature,
    TokenExpired,
    InvalidSubject,
    UnknownEmail,
    WrongPassword,
    RefreshTokenNotLive,
    UserNoLongerExists
};

constexpr std::string_view authFailureReasonName(AuthFailureReason reason) {
    switch (reason) {
        case AuthFailureReason::MissingOrInvalidCredential: return "MissingOrInvalidCredential";
        case AuthFailureReason::MalformedToken: return "MalformedToken";
        case AuthFailureReason::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case AuthFailureReason::BadSignature: return "BadSignature";
        case AuthFailureReason::TokenExpired: return "TokenExpired";
        case AuthFailureReason::InvalidSubject: return "InvalidSubject";
        case AuthFailureReason::UnknownEmail: return "UnknownEmail";
        case AuthFailureReason::WrongPassword: return "WrongPassword";
        case AuthFailureReason::RefreshTokenNotLive: return "RefreshTokenNotLive";
        case AuthFailureReason::UserNoLongerExists: return "UserNoLongerExists";
    }
    return "Unknown";
}

// -- Configuration ------------------------------------------------------------

/// Deployment platform. Only Dev permits destructive maintenance operations.
enum class Platform : uint8_t { Dev, Production };

/// Map a platform name to Platform; anything but "dev" is Production.
[[nodiscard]] constexpr Platform parsePlatform(std::string_view name) {
    return name == "dev" ? Platform::Dev : Platform::Production;
}

/// Configuration for the authentication core.
struct AuthConfig {
    /// HMAC-SHA256 signing secret. Must be non-empty; see buildAuthConfig().
    std::string secret;

    Platform platform = Platform::Production;

    /// Interval between expired refresh token pruning passes.
    std::chrono::seconds pruneInterval{3600};
};

}  // namespace chirpy::auth
