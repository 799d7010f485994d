#pragma once

/// @file token_store.hpp
/// @brief Refresh token persistence interface and in-memory implementation.
///
/// Abstracts refresh token storage so the SessionAuthenticator can work
/// with any backend (in-memory, SQL database, etc.).

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/foundation/chirpy_result.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chirpy::auth {

/// Abstract interface for refresh token persistence.
///
/// Implementations must be thread-safe when shared across threads, and
/// markRevoked() must be atomic with respect to findLiveByToken().
class IRefreshTokenRepository {
public:
    virtual ~IRefreshTokenRepository() = default;

    /// Store a new record. Fails with AlreadyExists if the token is taken.
    virtual foundation::ChirpyResult<void> insert(RefreshTokenRecord record) = 0;

    /// Find a record that is neither revoked nor expired at @p now.
    [[nodiscard]] virtual std::optional<RefreshTokenRecord> findLiveByToken(
        std::string_view token, std::chrono::system_clock::time_point now) const = 0;

    /// Stamp revokedAt on the record if it has none yet.
    /// Unknown and already-revoked tokens are left untouched.
    virtual void markRevoked(std::string_view token,
                             std::chrono::system_clock::time_point now) = 0;

    /// Find a record regardless of its state.
    [[nodiscard]] virtual std::optional<RefreshTokenRecord> find(std::string_view token) const = 0;

    /// Drop records whose expiry is at or before @p now. Returns the count.
    virtual std::size_t removeExpired(std::chrono::system_clock::time_point now) = 0;
};

/// Thread-safe in-memory refresh token store for testing and development.
class InMemoryRefreshTokenRepository : public IRefreshTokenRepository {
public:
    foundation::ChirpyResult<void> insert(RefreshTokenRecord record) override;

    [[nodiscard]] std::optional<RefreshTokenRecord> findLiveByToken(
        std::string_view token, std::chrono::system_clock::time_point now) const override;

    void markRevoked(std::string_view token,
                     std::chrono::system_clock::time_point now) override;

    [[nodiscard]] std::optional<RefreshTokenRecord> find(std::string_view token) const override;

    std::size_t removeExpired(std::chrono::system_clock::time_point now) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RefreshTokenRecord> tokens_;
};

}  // namespace chirpy::auth
