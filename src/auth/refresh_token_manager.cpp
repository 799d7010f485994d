/// @file refresh_token_manager.cpp
/// @brief RefreshTokenManager implementation.

#include "chirpy/auth/refresh_token_manager.hpp"

#include "chirpy/foundation/error_code.hpp"
#include "chirpy/foundation/service_logger.hpp"

#include "crypto_utils.hpp"

namespace chirpy::auth {

using foundation::ChirpyError;
using foundation::ChirpyResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

// A 256-bit collision is not expected; the retry only covers a store that
// already holds an identical value.
constexpr int kMaxInsertAttempts = 3;

} // namespace

RefreshTokenManager::RefreshTokenManager(std::shared_ptr<IRefreshTokenRepository> repository)
    : repository_(std::move(repository)) {}

ChirpyResult<std::string> RefreshTokenManager::generate() {
    auto token = detail::secureRandomHex(kRefreshTokenBytes);
    if (!token) {
        CHIRPY_LOG_ERROR(LogCategory::Auth, "RAND_bytes failed while generating refresh token");
        return ChirpyResult<std::string>::err(
            ChirpyError(ErrorCode::RandomSourceFailed, "internal error"));
    }
    return ChirpyResult<std::string>::ok(std::move(*token));
}

ChirpyResult<RefreshTokenRecord> RefreshTokenManager::create(
    const UserId& userId, std::chrono::system_clock::time_point now) {
    for (int attempt = 0; attempt < kMaxInsertAttempts; ++attempt) {
        auto token = generate();
        if (!token) {
            return ChirpyResult<RefreshTokenRecord>::err(token.error());
        }

        RefreshTokenRecord record;
        record.token = std::move(token).value();
        record.userId = userId;
        record.createdAt = now;
        record.expiresAt = now + kRefreshTokenTtl;

        auto stored = repository_->insert(record);
        if (stored) {
            return ChirpyResult<RefreshTokenRecord>::ok(std::move(record));
        }
        if (stored.error().code() != ErrorCode::AlreadyExists) {
            return ChirpyResult<RefreshTokenRecord>::err(stored.error());
        }
        CHIRPY_LOG_WARN(LogCategory::Storage, "refresh token collision, regenerating");
    }
    return ChirpyResult<RefreshTokenRecord>::err(
        ChirpyError(ErrorCode::StorageError, "internal error"));
}

std::optional<UserId> RefreshTokenManager::resolveUser(
    std::string_view token, std::chrono::system_clock::time_point now) const {
    auto record = repository_->findLiveByToken(token, now);
    if (!record) {
        return std::nullopt;
    }
    return record->userId;
}

void RefreshTokenManager::revoke(std::string_view token,
                                 std::chrono::system_clock::time_point now) {
    repository_->markRevoked(token, now);
}

std::size_t RefreshTokenManager::pruneExpired(std::chrono::system_clock::time_point now) {
    auto removed = repository_->removeExpired(now);
    if (removed > 0) {
        CHIRPY_LOG_INFO(LogCategory::Storage,
                        "pruned " + std::to_string(removed) + " expired refresh tokens");
    }
    return removed;
}

} // namespace chirpy::auth
