#pragma once

/// @file session_authenticator.hpp
/// @brief Session authentication: login, refresh, revoke, request auth.
///
/// Orchestrates IUserRepository, RefreshTokenManager, TokenProvider and
/// PasswordHasher into the operations the HTTP layer calls.

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/foundation/chirpy_result.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace chirpy::auth {

class ICredentialCarrier;
class IUserRepository;
class IRefreshTokenRepository;
class TokenProvider;
class PasswordHasher;
class RefreshTokenManager;

/// Session authenticator issuing short-lived access tokens and long-lived
/// opaque refresh tokens.
///
/// Every authentication failure surfaces as ErrorCode::AuthenticationFailed
/// with a generic message. The precise AuthFailureReason is attached as
/// error context and logged at debug level.
///
/// Thread-safe as long as the repositories are.
///
/// Example:
/// @code
///   auto users = std::make_shared<InMemoryUserRepository>();
///   auto tokens = std::make_shared<InMemoryRefreshTokenRepository>();
///   SessionAuthenticator auth(config, users, tokens);
///
///   auto session = auth.login({"a@example.com", "Secret123!"});
///   auto userId = auth.authenticateRequest(
///       HeaderCarrier("Bearer " + session.value().accessToken));
/// @endcode
class SessionAuthenticator {
public:
    /// Construct with configuration and storage backends.
    SessionAuthenticator(AuthConfig config,
                         std::shared_ptr<IUserRepository> users,
                         std::shared_ptr<IRefreshTokenRepository> refreshTokens);

    /// Construct with a caller-supplied password hasher.
    SessionAuthenticator(AuthConfig config,
                         std::shared_ptr<IUserRepository> users,
                         std::shared_ptr<IRefreshTokenRepository> refreshTokens,
                         std::unique_ptr<PasswordHasher> passwordHasher);

    ~SessionAuthenticator();

    SessionAuthenticator(const SessionAuthenticator&) = delete;
    SessionAuthenticator& operator=(const SessionAuthenticator&) = delete;
    SessionAuthenticator(SessionAuthenticator&&) noexcept;
    SessionAuthenticator& operator=(SessionAuthenticator&&) noexcept;

    // -- Accounts -------------------------------------------------------------

    /// Create an account. ValidationFailed on bad input, AlreadyExists when
    /// the email is taken.
    [[nodiscard]] foundation::ChirpyResult<PublicUser> registerUser(
        const RegisterRequest& request);

    /// Replace the caller's email and password. The caller is identified by
    /// the access token on @p carrier.
    [[nodiscard]] foundation::ChirpyResult<PublicUser> updateCredentials(
        const ICredentialCarrier& carrier,
        const UpdateCredentialsRequest& request,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// Delete every user. Forbidden unless the platform is Dev.
    [[nodiscard]] foundation::ChirpyResult<void> resetUsers();

    // -- Sessions -------------------------------------------------------------

    /// Check credentials and open a session.
    ///
    /// Missing fields are ValidationFailed. An unknown email and a wrong
    /// password fail identically, and both run one bcrypt verification so
    /// response time does not reveal whether the email exists.
    [[nodiscard]] foundation::ChirpyResult<LoginResult> login(
        const LoginRequest& request,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// Mint a new access token from the refresh token on @p carrier.
    /// The refresh token itself stays valid (no rotation).
    [[nodiscard]] foundation::ChirpyResult<AccessTokenGrant> refreshAccessToken(
        const ICredentialCarrier& carrier,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// Revoke the refresh token on @p carrier. Succeeds for unknown and
    /// already-revoked tokens; fails only when no bearer token is present.
    [[nodiscard]] foundation::ChirpyResult<void> revokeRefreshToken(
        const ICredentialCarrier& carrier,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// Resolve the caller of a request from its access token.
    [[nodiscard]] foundation::ChirpyResult<UserId> authenticateRequest(
        const ICredentialCarrier& carrier,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    // -- Pass-throughs --------------------------------------------------------

    [[nodiscard]] foundation::ChirpyResult<std::string> hashPassword(
        std::string_view password) const;

    [[nodiscard]] bool verifyPassword(std::string_view password,
                                      std::string_view storedHash) const;

    /// Drop expired refresh tokens from storage.
    std::size_t pruneExpiredRefreshTokens(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] Platform platform() const noexcept { return config_.platform; }

private:
    AuthConfig config_;
    std::shared_ptr<IUserRepository> users_;
    std::unique_ptr<TokenProvider> tokenProvider_;
    std::unique_ptr<PasswordHasher> passwordHasher_;
    std::unique_ptr<RefreshTokenManager> refreshTokens_;
};

}  // namespace chirpy::auth
