#pragma once

/// @file password_hasher.hpp
/// @brief Password hashing and verification using bcrypt (libxcrypt).
///
/// Each hash uses a fresh salt drawn from the operating system, so hashing
/// the same password twice yields two different encoded strings. The salt
/// and cost travel inside the encoded hash ("$2b$10$<salt><digest>").

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/foundation/chirpy_result.hpp"

#include <string>
#include <string_view>

namespace chirpy::auth {

/// bcrypt-encoded password hash, 60 characters.
using HashedCredential = std::string;

/// Stateless bcrypt hasher. Thread-safe: all state is per call.
///
/// hash() and verify() are virtual so SessionAuthenticator can be handed
/// an instrumented hasher.
///
/// Example:
/// @code
///   PasswordHasher hasher;
///   auto hashed = hasher.hash("Secret123!");
///   if (hashed) {
///       bool ok = hasher.verify("Secret123!", hashed.value());
///   }
/// @endcode
class PasswordHasher {
public:
    virtual ~PasswordHasher() = default;

    /// Hash a plaintext password with a new random salt at kBcryptCost.
    ///
    /// Fails with HashingFailed only if the primitive itself fails
    /// (e.g. the system cannot supply salt randomness).
    [[nodiscard]] virtual foundation::ChirpyResult<HashedCredential> hash(
        std::string_view password) const;

    /// Verify a plaintext password against a stored hash.
    ///
    /// Returns false on mismatch and when @p storedHash is not a bcrypt
    /// hash at all. The final comparison is constant-time.
    [[nodiscard]] virtual bool verify(std::string_view password,
                                      std::string_view storedHash) const;

    /// True for a 60-character $2a$/$2b$/$2y$ encoded hash.
    [[nodiscard]] static bool isBcryptHash(std::string_view value);
};

}  // namespace chirpy::auth
