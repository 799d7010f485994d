#include <gtest/gtest.h>

#include "chirpy/auth/bearer_token.hpp"
#include "chirpy/auth/refresh_token_manager.hpp"
#include "chirpy/auth/session_authenticator.hpp"
#include "chirpy/auth/token_store.hpp"
#include "chirpy/auth/user_repository.hpp"
#include "chirpy/foundation/error_code.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace chirpy::auth;
using chirpy::foundation::ErrorCode;

/// Full session lifecycle against shared in-memory storage, including
/// concurrent access from several request threads.
class SessionLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        users_ = std::make_shared<InMemoryUserRepository>();
        refreshTokens_ = std::make_shared<InMemoryRefreshTokenRepository>();

        AuthConfig config;
        config.secret = "integration-secret";
        config.platform = Platform::Dev;
        auth_ = std::make_unique<SessionAuthenticator>(std::move(config), users_, refreshTokens_);
    }

    static HeaderCarrier bearer(const std::string& token) {
        return HeaderCarrier("Bearer " + token);
    }

    std::shared_ptr<InMemoryUserRepository> users_;
    std::shared_ptr<InMemoryRefreshTokenRepository> refreshTokens_;
    std::unique_ptr<SessionAuthenticator> auth_;
};

TEST_F(SessionLifecycleTest, RegisterLoginRefreshRevoke) {
    auto user = auth_->registerUser({"walt@example.com", "Secret123!"});
    ASSERT_TRUE(user.hasValue());

    auto session = auth_->login({"walt@example.com", "Secret123!"});
    ASSERT_TRUE(session.hasValue());
    EXPECT_EQ(session.value().user.id, user.value().id);

    // Access token authenticates requests.
    auto caller = auth_->authenticateRequest(bearer(session.value().accessToken));
    ASSERT_TRUE(caller.hasValue());
    EXPECT_EQ(caller.value(), user.value().id);

    // Refresh mints a working access token.
    auto grant = auth_->refreshAccessToken(bearer(session.value().refreshToken));
    ASSERT_TRUE(grant.hasValue());
    auto refreshedCaller = auth_->authenticateRequest(bearer(grant.value().accessToken));
    ASSERT_TRUE(refreshedCaller.hasValue());
    EXPECT_EQ(refreshedCaller.value(), user.value().id);

    // Revoke ends the refresh token but not outstanding access tokens.
    ASSERT_TRUE(auth_->revokeRefreshToken(bearer(session.value().refreshToken)).hasValue());
    auto denied = auth_->refreshAccessToken(bearer(session.value().refreshToken));
    ASSERT_TRUE(denied.hasError());
    EXPECT_EQ(denied.error().code(), ErrorCode::AuthenticationFailed);
    EXPECT_TRUE(auth_->authenticateRequest(bearer(grant.value().accessToken)).hasValue());

    // A new login opens an independent session.
    auto again = auth_->login({"walt@example.com", "Secret123!"});
    ASSERT_TRUE(again.hasValue());
    EXPECT_TRUE(auth_->refreshAccessToken(bearer(again.value().refreshToken)).hasValue());
}

TEST_F(SessionLifecycleTest, SessionsOfDifferentUsersAreIsolated) {
    ASSERT_TRUE(auth_->registerUser({"a@example.com", "Secret123!"}).hasValue());
    ASSERT_TRUE(auth_->registerUser({"b@example.com", "Secret456!"}).hasValue());
    auto a = auth_->login({"a@example.com", "Secret123!"});
    auto b = auth_->login({"b@example.com", "Secret456!"});
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());

    ASSERT_TRUE(auth_->revokeRefreshToken(bearer(a.value().refreshToken)).hasValue());

    EXPECT_TRUE(auth_->refreshAccessToken(bearer(a.value().refreshToken)).hasError());
    auto grant = auth_->refreshAccessToken(bearer(b.value().refreshToken));
    ASSERT_TRUE(grant.hasValue());
    EXPECT_EQ(auth_->authenticateRequest(bearer(grant.value().accessToken)).value(),
              b.value().user.id);
}

TEST_F(SessionLifecycleTest, RevocationIsMonotonicUnderConcurrency) {
    ASSERT_TRUE(auth_->registerUser({"a@example.com", "Secret123!"}).hasValue());
    auto session = auth_->login({"a@example.com", "Secret123!"});
    ASSERT_TRUE(session.hasValue());
    const auto token = session.value().refreshToken;

    constexpr int kReaders = 4;
    constexpr int kIterations = 2000;
    std::atomic<bool> revoked{false};
    std::atomic<int> successAfterRevoke{0};

    std::vector<std::thread> readers;
    readers.reserve(kReaders);
    for (int r = 0; r < kReaders; ++r) {
        readers.emplace_back([&] {
            for (int i = 0; i < kIterations; ++i) {
                // Observe the flag before resolving: a success after a
                // committed revoke would break monotonicity.
                bool revokedBefore = revoked.load(std::memory_order_acquire);
                auto grant = auth_->refreshAccessToken(bearer(token));
                if (revokedBefore && grant.hasValue()) {
                    successAfterRevoke.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    std::thread revoker([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ASSERT_TRUE(auth_->revokeRefreshToken(bearer(token)).hasValue());
        revoked.store(true, std::memory_order_release);
        // Concurrent duplicate revokes keep the first timestamp.
        ASSERT_TRUE(auth_->revokeRefreshToken(bearer(token)).hasValue());
    });

    revoker.join();
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(successAfterRevoke.load(), 0);
    auto record = refreshTokens_->find(token);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->revokedAt.has_value());
    EXPECT_TRUE(auth_->refreshAccessToken(bearer(token)).hasError());
}

TEST_F(SessionLifecycleTest, ConcurrentLoginsProduceDistinctRefreshTokens) {
    ASSERT_TRUE(auth_->registerUser({"a@example.com", "Secret123!"}).hasValue());

    constexpr int kThreads = 4;
    constexpr int kLoginsPerThread = 3;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kLoginsPerThread; ++i) {
                if (!auth_->login({"a@example.com", "Secret123!"}).hasValue()) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(refreshTokens_->size(), static_cast<std::size_t>(kThreads * kLoginsPerThread));
}

TEST_F(SessionLifecycleTest, DevResetInvalidatesOutstandingRefreshTokens) {
    ASSERT_TRUE(auth_->registerUser({"a@example.com", "Secret123!"}).hasValue());
    auto session = auth_->login({"a@example.com", "Secret123!"});
    ASSERT_TRUE(session.hasValue());

    ASSERT_TRUE(auth_->resetUsers().hasValue());

    EXPECT_TRUE(auth_->refreshAccessToken(bearer(session.value().refreshToken)).hasError());
    EXPECT_TRUE(auth_->login({"a@example.com", "Secret123!"}).hasError());
    // The address is free again.
    EXPECT_TRUE(auth_->registerUser({"a@example.com", "Secret123!"}).hasValue());
}
