/// @file token_store.cpp
/// @brief InMemoryRefreshTokenRepository implementation.

#include "chirpy/auth/token_store.hpp"

#include "chirpy/foundation/error_code.hpp"

namespace chirpy::auth {

using foundation::ChirpyError;
using foundation::ChirpyResult;
using foundation::ErrorCode;

ChirpyResult<void> InMemoryRefreshTokenRepository::insert(RefreshTokenRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = record.token;
    auto [it, inserted] = tokens_.emplace(std::move(key), std::move(record));
    if (!inserted) {
        return ChirpyResult<void>::err(
            ChirpyError(ErrorCode::AlreadyExists, "refresh token already stored"));
    }
    return ChirpyResult<void>::ok();
}

std::optional<RefreshTokenRecord> InMemoryRefreshTokenRepository::findLiveByToken(
    std::string_view token, std::chrono::system_clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(token));
    if (it == tokens_.end() || !it->second.isLive(now)) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryRefreshTokenRepository::markRevoked(std::string_view token,
                                                 std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(token));
    if (it == tokens_.end() || it->second.revokedAt.has_value()) {
        return;
    }
    it->second.revokedAt = now;
}

std::optional<RefreshTokenRecord> InMemoryRefreshTokenRepository::find(
    std::string_view token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(token));
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t InMemoryRefreshTokenRepository::removeExpired(
    std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        if (it->second.expiresAt <= now) {
            it = tokens_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemoryRefreshTokenRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

} // namespace chirpy::auth
