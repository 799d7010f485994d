#pragma once

/// @file user_repository.hpp
/// @brief User persistence interface and in-memory implementation.
///
/// Abstracts user storage so the SessionAuthenticator can work with any
/// backend (in-memory, SQL database, etc.).

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/foundation/chirpy_result.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chirpy::auth {

/// Abstract interface for user persistence.
///
/// Implementations must be thread-safe when shared across threads.
/// Email addresses are unique and compared case-sensitively.
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    /// Find a user by email.
    [[nodiscard]] virtual std::optional<User> findByEmail(std::string_view email) const = 0;

    /// Find a user by their unique ID.
    [[nodiscard]] virtual std::optional<User> findById(const UserId& id) const = 0;

    /// Create a user with a fresh id. Fails with AlreadyExists when the
    /// email is taken.
    virtual foundation::ChirpyResult<User> create(std::string email,
                                                  std::string passwordHash) = 0;

    /// Replace email and hash of an existing user. Fails with NotFound for
    /// an unknown id and AlreadyExists when another user owns the email.
    virtual foundation::ChirpyResult<User> update(const UserId& id,
                                                  std::string email,
                                                  std::string passwordHash) = 0;

    /// Delete every user.
    virtual void deleteAll() = 0;
};

/// Thread-safe in-memory user repository for testing and development.
class InMemoryUserRepository : public IUserRepository {
public:
    [[nodiscard]] std::optional<User> findByEmail(std::string_view email) const override;

    [[nodiscard]] std::optional<User> findById(const UserId& id) const override;

    foundation::ChirpyResult<User> create(std::string email, std::string passwordHash) override;

    foundation::ChirpyResult<User> update(const UserId& id,
                                          std::string email,
                                          std::string passwordHash) override;

    void deleteAll() override;

private:
    /// Caller must hold mutex_.
    [[nodiscard]] bool emailTakenByOther(std::string_view email, const UserId* self) const;

    mutable std::mutex mutex_;
    std::unordered_map<UserId, User> users_;
};

}  // namespace chirpy::auth
