/// @file password_hasher.cpp
/// @brief PasswordHasher implementation on libxcrypt's bcrypt ($2b$).

#include "chirpy/auth/password_hasher.hpp"

#include "chirpy/foundation/error_code.hpp"
#include "chirpy/foundation/service_logger.hpp"

#include "crypto_utils.hpp"

#include <crypt.h>

#include <cerrno>
#include <cstring>
#include <memory>

namespace chirpy::auth {

using foundation::ChirpyError;
using foundation::ChirpyResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

constexpr std::string_view kBcryptPrefix = "$2b$";
constexpr std::size_t kBcryptHashLength = 60;

// crypt_data is ~32 KiB; keep it off the stack and wipe it afterwards.
struct CryptScratch {
    std::unique_ptr<crypt_data> data = std::make_unique<crypt_data>();

    ~CryptScratch() { OPENSSL_cleanse(data.get(), sizeof(crypt_data)); }
};

/// Run crypt_rn over (password, setting). nullopt when libxcrypt rejects
/// the setting or fails internally.
std::optional<std::string> runCrypt(std::string_view password, const std::string& setting) {
    CryptScratch scratch;
    std::string phrase(password);
    const char* out = crypt_rn(phrase.c_str(), setting.c_str(), scratch.data.get(),
                               static_cast<int>(sizeof(crypt_data)));
    OPENSSL_cleanse(phrase.data(), phrase.size());
    // libxcrypt signals failure with NULL or with a "*"-prefixed string.
    if (out == nullptr || out[0] == '*') {
        return std::nullopt;
    }
    return std::string(out);
}

}  // namespace

ChirpyResult<HashedCredential> PasswordHasher::hash(std::string_view password) const {
    char setting[CRYPT_GENSALT_OUTPUT_SIZE];
    // Null random buffer: libxcrypt draws the salt from the OS CSPRNG.
    if (crypt_gensalt_rn(kBcryptPrefix.data(), kBcryptCost, nullptr, 0,
                         setting, static_cast<int>(sizeof(setting))) == nullptr) {
        auto detail = std::string("crypt_gensalt_rn failed: ") + std::strerror(errno);
        CHIRPY_LOG_ERROR(LogCategory::Auth, detail);
        return ChirpyResult<HashedCredential>::err(
            ChirpyError(ErrorCode::HashingFailed, "internal error"));
    }

    auto hashed = runCrypt(password, setting);
    if (!hashed || hashed->size() != kBcryptHashLength) {
        CHIRPY_LOG_ERROR(LogCategory::Auth, "crypt_rn failed to produce a bcrypt hash");
        return ChirpyResult<HashedCredential>::err(
            ChirpyError(ErrorCode::HashingFailed, "internal error"));
    }
    return ChirpyResult<HashedCredential>::ok(std::move(*hashed));
}

bool PasswordHasher::verify(std::string_view password, std::string_view storedHash) const {
    if (!isBcryptHash(storedHash)) {
        return false;
    }
    // The stored hash doubles as the setting: prefix, cost and salt.
    auto computed = runCrypt(password, std::string(storedHash));
    if (!computed) {
        return false;
    }
    return detail::constantTimeEqual(*computed, storedHash);
}

bool PasswordHasher::isBcryptHash(std::string_view value) {
    if (value.size() != kBcryptHashLength) {
        return false;
    }
    auto prefix = value.substr(0, 4);
    return prefix == "$2a$" || prefix == "$2b$" || prefix == "$2y$";
}

}  // namespace chirpy::auth
