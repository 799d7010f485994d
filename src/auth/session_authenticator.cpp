/// @file session_authenticator.cpp
/// @brief SessionAuthenticator implementation orchestrating the auth workflow.

#include "chirpy/auth/session_authenticator.hpp"

#include "chirpy/auth/bearer_token.hpp"
#include "chirpy/auth/input_validator.hpp"
#include "chirpy/auth/password_hasher.hpp"
#include "chirpy/auth/refresh_token_manager.hpp"
#include "chirpy/auth/token_provider.hpp"
#include "chirpy/auth/token_store.hpp"
#include "chirpy/auth/user_repository.hpp"
#include "chirpy/foundation/error_code.hpp"
#include "chirpy/foundation/service_logger.hpp"

namespace chirpy::auth {

using foundation::ChirpyError;
using foundation::ChirpyResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceLogger;

namespace {

constexpr std::string_view kBadLogin = "incorrect email or password";
constexpr std::string_view kBadRefresh = "invalid, expired, or revoked refresh token";

// Well-formed cost-10 bcrypt hash. Unknown-email logins verify against it
// and discard the result, so both login failures cost one bcrypt.
constexpr std::string_view kDummyHash =
    "$2b$10$N9qo8uLOickgx2ZMRZoMyeIjZAgcfl7p92ldGxad68LJZdL17lhWy";

ChirpyError authFailure(std::string_view message, AuthFailureReason reason) {
    return ChirpyError(ErrorCode::AuthenticationFailed, std::string(message), reason);
}

ChirpyError invalidInput(std::string message) {
    return ChirpyError(ErrorCode::ValidationFailed, std::move(message));
}

/// Record why an operation was rejected. Reasons never leave the server.
void logRejection(std::string_view operation, const ChirpyError& error) {
    auto& logger = ServiceLogger::instance();
    if (!logger.isEnabled(LogLevel::Debug, LogCategory::Auth)) {
        return;
    }
    LogContext ctx;
    ctx.extra["op"] = std::string(operation);
    ctx.extra["code"] = std::string(foundation::errorKindName(error.kind()));
    if (const auto* reason = error.context<AuthFailureReason>()) {
        ctx.extra["reason"] = std::string(authFailureReasonName(*reason));
    }
    logger.logWithContext(LogLevel::Debug, LogCategory::Auth, "request rejected", ctx);
}

template <typename T>
ChirpyResult<T> reject(std::string_view operation, ChirpyError error) {
    logRejection(operation, error);
    return ChirpyResult<T>::err(std::move(error));
}

/// Presence, email format and password rules for register/update.
std::optional<ChirpyError> validateCredentials(const std::optional<std::string>& email,
                                               const std::optional<std::string>& password) {
    if (auto check = InputValidator::requireField(email, "email"); !check) {
        return invalidInput(std::move(check.message));
    }
    if (auto check = InputValidator::requireField(password, "password"); !check) {
        return invalidInput(std::move(check.message));
    }
    if (auto check = InputValidator::validateEmail(*email); !check) {
        return invalidInput(std::move(check.message));
    }
    if (auto check = InputValidator::validatePassword(*password); !check) {
        return invalidInput(std::move(check.message));
    }
    return std::nullopt;
}

} // namespace

// -- Construction / destruction -----------------------------------------------

SessionAuthenticator::SessionAuthenticator(AuthConfig config,
                                           std::shared_ptr<IUserRepository> users,
                                           std::shared_ptr<IRefreshTokenRepository> refreshTokens)
    : SessionAuthenticator(std::move(config), std::move(users), std::move(refreshTokens),
                           std::make_unique<PasswordHasher>()) {}

SessionAuthenticator::SessionAuthenticator(AuthConfig config,
                                           std::shared_ptr<IUserRepository> users,
                                           std::shared_ptr<IRefreshTokenRepository> refreshTokens,
                                           std::unique_ptr<PasswordHasher> passwordHasher)
    : config_(std::move(config)),
      users_(std::move(users)),
      tokenProvider_(std::make_unique<TokenProvider>(config_.secret)),
      passwordHasher_(std::move(passwordHasher)),
      refreshTokens_(std::make_unique<RefreshTokenManager>(std::move(refreshTokens))) {}

SessionAuthenticator::~SessionAuthenticator() = default;
SessionAuthenticator::SessionAuthenticator(SessionAuthenticator&&) noexcept = default;
SessionAuthenticator& SessionAuthenticator::operator=(SessionAuthenticator&&) noexcept = default;

// -- Accounts -----------------------------------------------------------------

ChirpyResult<PublicUser> SessionAuthenticator::registerUser(const RegisterRequest& request) {
    if (auto invalid = validateCredentials(request.email, request.password)) {
        return reject<PublicUser>("register", std::move(*invalid));
    }

    auto hashed = passwordHasher_->hash(*request.password);
    if (!hashed) {
        return ChirpyResult<PublicUser>::err(hashed.error());
    }

    auto created = users_->create(*request.email, std::move(hashed).value());
    if (!created) {
        return reject<PublicUser>("register", created.error());
    }

    LogContext ctx;
    ctx.userId = created.value().id;
    ServiceLogger::instance().logWithContext(LogLevel::Info, LogCategory::Auth,
                                             "user registered", ctx);
    return ChirpyResult<PublicUser>::ok(toPublicUser(created.value()));
}

ChirpyResult<PublicUser> SessionAuthenticator::updateCredentials(
    const ICredentialCarrier& carrier,
    const UpdateCredentialsRequest& request,
    std::chrono::system_clock::time_point now) {
    auto caller = authenticateRequest(carrier, now);
    if (!caller) {
        return ChirpyResult<PublicUser>::err(caller.error());
    }

    if (auto invalid = validateCredentials(request.email, request.password)) {
        return reject<PublicUser>("update", std::move(*invalid));
    }

    auto hashed = passwordHasher_->hash(*request.password);
    if (!hashed) {
        return ChirpyResult<PublicUser>::err(hashed.error());
    }

    auto updated = users_->update(caller.value(), *request.email, std::move(hashed).value());
    if (!updated) {
        if (updated.error().code() == ErrorCode::NotFound) {
            return reject<PublicUser>(
                "update", authFailure("invalid or expired token",
                                      AuthFailureReason::UserNoLongerExists));
        }
        return reject<PublicUser>("update", updated.error());
    }
    return ChirpyResult<PublicUser>::ok(toPublicUser(updated.value()));
}

ChirpyResult<void> SessionAuthenticator::resetUsers() {
    if (config_.platform != Platform::Dev) {
        return reject<void>("reset", ChirpyError(ErrorCode::Forbidden,
                                                 "reset is only allowed in dev environment"));
    }
    users_->deleteAll();
    CHIRPY_LOG_WARN(LogCategory::Auth, "all users deleted");
    return ChirpyResult<void>::ok();
}

// -- Sessions -----------------------------------------------------------------

ChirpyResult<LoginResult> SessionAuthenticator::login(const LoginRequest& request,
                                                      std::chrono::system_clock::time_point now) {
    if (auto check = InputValidator::requireField(request.email, "email"); !check) {
        return reject<LoginResult>("login", invalidInput(std::move(check.message)));
    }
    if (auto check = InputValidator::requireField(request.password, "password"); !check) {
        return reject<LoginResult>("login", invalidInput(std::move(check.message)));
    }

    auto user = users_->findByEmail(*request.email);
    if (!user) {
        (void)passwordHasher_->verify(*request.password, kDummyHash);
        return reject<LoginResult>("login",
                                   authFailure(kBadLogin, AuthFailureReason::UnknownEmail));
    }
    if (!passwordHasher_->verify(*request.password, user->passwordHash)) {
        return reject<LoginResult>("login",
                                   authFailure(kBadLogin, AuthFailureReason::WrongPassword));
    }

    auto accessToken = tokenProvider_->issue(user->id, kAccessTokenTtl, now);
    if (!accessToken) {
        return ChirpyResult<LoginResult>::err(accessToken.error());
    }
    auto refresh = refreshTokens_->create(user->id, now);
    if (!refresh) {
        return ChirpyResult<LoginResult>::err(refresh.error());
    }

    LoginResult result;
    result.user = toPublicUser(*user);
    result.accessToken = std::move(accessToken).value();
    result.refreshToken = std::move(refresh).value().token;
    result.accessExpiresIn = kAccessTokenTtl;

    LogContext ctx;
    ctx.userId = user->id;
    ServiceLogger::instance().logWithContext(LogLevel::Info, LogCategory::Auth,
                                             "session opened", ctx);
    return ChirpyResult<LoginResult>::ok(std::move(result));
}

ChirpyResult<AccessTokenGrant> SessionAuthenticator::refreshAccessToken(
    const ICredentialCarrier& carrier, std::chrono::system_clock::time_point now) {
    auto token = extractBearerToken(carrier);
    if (!token) {
        return reject<AccessTokenGrant>("refresh", token.error());
    }

    auto owner = refreshTokens_->resolveUser(token.value(), now);
    if (!owner) {
        return reject<AccessTokenGrant>(
            "refresh", authFailure(kBadRefresh, AuthFailureReason::RefreshTokenNotLive));
    }
    if (!users_->findById(*owner)) {
        return reject<AccessTokenGrant>(
            "refresh", authFailure(kBadRefresh, AuthFailureReason::UserNoLongerExists));
    }

    auto accessToken = tokenProvider_->issue(*owner, kAccessTokenTtl, now);
    if (!accessToken) {
        return ChirpyResult<AccessTokenGrant>::err(accessToken.error());
    }
    return ChirpyResult<AccessTokenGrant>::ok(
        AccessTokenGrant{std::move(accessToken).value(), kAccessTokenTtl});
}

ChirpyResult<void> SessionAuthenticator::revokeRefreshToken(
    const ICredentialCarrier& carrier, std::chrono::system_clock::time_point now) {
    auto token = extractBearerToken(carrier);
    if (!token) {
        return reject<void>("revoke", token.error());
    }
    refreshTokens_->revoke(token.value(), now);
    return ChirpyResult<void>::ok();
}

ChirpyResult<UserId> SessionAuthenticator::authenticateRequest(
    const ICredentialCarrier& carrier, std::chrono::system_clock::time_point now) const {
    auto token = extractBearerToken(carrier);
    if (!token) {
        return reject<UserId>("authenticate", token.error());
    }
    auto subject = tokenProvider_->verify(token.value(), now);
    if (!subject) {
        return reject<UserId>("authenticate", subject.error());
    }
    return subject;
}

// -- Pass-throughs ------------------------------------------------------------

ChirpyResult<std::string> SessionAuthenticator::hashPassword(std::string_view password) const {
    return passwordHasher_->hash(password);
}

bool SessionAuthenticator::verifyPassword(std::string_view password,
                                          std::string_view storedHash) const {
    return passwordHasher_->verify(password, storedHash);
}

std::size_t SessionAuthenticator::pruneExpiredRefreshTokens(
    std::chrono::system_clock::time_point now) {
    return refreshTokens_->pruneExpired(now);
}

} // namespace chirpy::auth
