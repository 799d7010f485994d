/// @file user_repository.cpp
/// @brief InMemoryUserRepository implementation.

#include "chirpy/auth/user_repository.hpp"

#include "chirpy/foundation/error_code.hpp"

#include <chrono>

namespace chirpy::auth {

using foundation::ChirpyError;
using foundation::ChirpyResult;
using foundation::ErrorCode;

std::optional<User> InMemoryUserRepository::findByEmail(std::string_view email) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, user] : users_) {
        if (user.email == email) {
            return user;
        }
    }
    return std::nullopt;
}

std::optional<User> InMemoryUserRepository::findById(const UserId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ChirpyResult<User> InMemoryUserRepository::create(std::string email, std::string passwordHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (emailTakenByOther(email, nullptr)) {
        return ChirpyResult<User>::err(
            ChirpyError(ErrorCode::AlreadyExists, "email already registered"));
    }

    User user;
    user.id = foundation::UserId::generate();
    while (users_.count(user.id) != 0) {
        user.id = foundation::UserId::generate();
    }
    user.email = std::move(email);
    user.passwordHash = std::move(passwordHash);
    auto now = std::chrono::system_clock::now();
    user.createdAt = now;
    user.updatedAt = now;

    users_.emplace(user.id, user);
    return ChirpyResult<User>::ok(std::move(user));
}

ChirpyResult<User> InMemoryUserRepository::update(const UserId& id,
                                                  std::string email,
                                                  std::string passwordHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return ChirpyResult<User>::err(ChirpyError(ErrorCode::NotFound, "user not found"));
    }
    if (emailTakenByOther(email, &id)) {
        return ChirpyResult<User>::err(
            ChirpyError(ErrorCode::AlreadyExists, "email already registered"));
    }

    it->second.email = std::move(email);
    it->second.passwordHash = std::move(passwordHash);
    it->second.updatedAt = std::chrono::system_clock::now();
    return ChirpyResult<User>::ok(it->second);
}

void InMemoryUserRepository::deleteAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    users_.clear();
}

bool InMemoryUserRepository::emailTakenByOther(std::string_view email,
                                               const UserId* self) const {
    for (const auto& [id, user] : users_) {
        if (user.email == email && (self == nullptr || id != *self)) {
            return true;
        }
    }
    return false;
}

} // namespace chirpy::auth
