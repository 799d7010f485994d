#pragma once

/// @file token_provider.hpp
/// @brief HS256 JWT access token issuance and verification.
///
/// Access tokens are stateless: nothing is persisted, and validity is
/// re-derived from the signature and the "exp" claim on every use.

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/foundation/chirpy_result.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace chirpy::auth {

/// Issues and verifies HMAC-SHA256 signed access tokens for one secret.
///
/// Token format (RFC 7519):
///   base64url({"alg":"HS256","typ":"JWT"}) . base64url(claims) . base64url(mac)
/// Claims: {"iss":"chirpy","sub":"<user id>","iat":N,"exp":N}
///
/// Every verification failure is reported as AuthenticationFailed; the
/// specific AuthFailureReason rides along as error context for logging.
///
/// Example:
/// @code
///   TokenProvider provider(config.secret);
///   auto token = provider.issue(user.id, kAccessTokenTtl);
///   auto subject = provider.verify(token.value());
/// @endcode
class TokenProvider {
public:
    explicit TokenProvider(std::string secret);

    /// Sign a token for @p subject valid from @p now until now + @p ttl.
    /// Fails (SigningFailed) only if the MAC primitive fails.
    [[nodiscard]] foundation::ChirpyResult<std::string> issue(
        const UserId& subject,
        std::chrono::seconds ttl,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /// Verify a token and return its subject.
    [[nodiscard]] foundation::ChirpyResult<UserId> verify(
        std::string_view token,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /// Verify a token and return all decoded claims.
    [[nodiscard]] foundation::ChirpyResult<AccessClaims> verifyClaims(
        std::string_view token,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

private:
    std::string secret_;
};

}  // namespace chirpy::auth
