#pragma once

/// @file refresh_token_manager.hpp
/// @brief Opaque refresh token lifecycle: create, resolve, revoke, prune.

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/auth/token_store.hpp"
#include "chirpy/foundation/chirpy_result.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace chirpy::auth {

/// Manages server-side refresh tokens on top of an IRefreshTokenRepository.
///
/// A refresh token is 32 bytes from the system CSPRNG rendered as 64
/// lowercase hex characters. It is live from creation until
/// creation + kRefreshTokenTtl unless revoked first. Revocation is one-way.
class RefreshTokenManager {
public:
    explicit RefreshTokenManager(std::shared_ptr<IRefreshTokenRepository> repository);

    /// Draw a new token value. Fails with RandomSourceFailed when the
    /// CSPRNG cannot deliver; never falls back to a weaker source.
    [[nodiscard]] static foundation::ChirpyResult<std::string> generate();

    /// Generate and persist a token for @p userId. Returns the stored record.
    [[nodiscard]] foundation::ChirpyResult<RefreshTokenRecord> create(
        const UserId& userId,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// Owner of a live token, or nullopt for unknown, revoked or expired.
    [[nodiscard]] std::optional<UserId> resolveUser(
        std::string_view token,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /// Revoke a token. Idempotent; unknown tokens are ignored.
    void revoke(std::string_view token,
                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// Remove expired records from storage. Returns how many were dropped.
    std::size_t pruneExpired(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    std::shared_ptr<IRefreshTokenRepository> repository_;
};

}  // namespace chirpy::auth
