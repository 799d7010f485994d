#include <gtest/gtest.h>

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/auth/bearer_token.hpp"
#include "chirpy/auth/input_validator.hpp"
#include "chirpy/auth/user_repository.hpp"
#include "chirpy/foundation/error_code.hpp"

#include <optional>
#include <string>

using namespace chirpy::auth;
using chirpy::foundation::ErrorCode;

// =============================================================================
// Bearer extraction tests
// =============================================================================

TEST(BearerTokenTest, ExtractsToken) {
    HeaderCarrier carrier("Bearer abc.def.ghi");
    auto token = extractBearerToken(carrier);
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(token.value(), "abc.def.ghi");
}

TEST(BearerTokenTest, MissingHeader) {
    HeaderCarrier carrier;
    auto token = extractBearerToken(carrier);
    ASSERT_TRUE(token.hasError());
    EXPECT_EQ(token.error().code(), ErrorCode::AuthenticationFailed);
    auto* reason = token.error().context<AuthFailureReason>();
    ASSERT_NE(reason, nullptr);
    EXPECT_EQ(*reason, AuthFailureReason::MissingOrInvalidCredential);
}

TEST(BearerTokenTest, WrongSchemeFailsLikeMissingHeader) {
    auto basic = extractBearerToken(std::optional<std::string>("Basic xyz"));
    auto missing = extractBearerToken(std::optional<std::string>());
    ASSERT_TRUE(basic.hasError());
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(basic.error().code(), missing.error().code());
    EXPECT_EQ(basic.error().message(), missing.error().message());
}

TEST(BearerTokenTest, RejectsMalformedValues) {
    for (const char* value : {"", "Bearer", "Bearer ", "bearer abc", "BEARER abc",
                              "Bearer  abc", "Bearer abc def", "Bearer abc\t",
                              "Bearerabc"}) {
        auto token = extractBearerToken(std::optional<std::string>(value));
        ASSERT_TRUE(token.hasError()) << '"' << value << '"';
        EXPECT_EQ(token.error().code(), ErrorCode::AuthenticationFailed);
    }
}

// =============================================================================
// InputValidator tests
// =============================================================================

TEST(InputValidatorTest, RequireField) {
    EXPECT_TRUE(InputValidator::requireField(std::string("x"), "email"));
    EXPECT_TRUE(InputValidator::requireField(std::string(), "email"));

    auto missing = InputValidator::requireField(std::nullopt, "password");
    EXPECT_FALSE(missing);
    EXPECT_EQ(missing.message, "password is required");
}

TEST(InputValidatorTest, ValidEmails) {
    EXPECT_TRUE(InputValidator::validateEmail("a@example.com"));
    EXPECT_TRUE(InputValidator::validateEmail("first.last+tag@sub.example.co"));
    EXPECT_TRUE(InputValidator::validateEmail("o'brien@my-host.org"));
}

TEST(InputValidatorTest, InvalidEmails) {
    EXPECT_FALSE(InputValidator::validateEmail(""));
    EXPECT_FALSE(InputValidator::validateEmail("plainaddress"));
    EXPECT_FALSE(InputValidator::validateEmail("@example.com"));
    EXPECT_FALSE(InputValidator::validateEmail("a@b@example.com"));
    EXPECT_FALSE(InputValidator::validateEmail("a@localhost"));
    EXPECT_FALSE(InputValidator::validateEmail(".a@example.com"));
    EXPECT_FALSE(InputValidator::validateEmail("a..b@example.com"));
    EXPECT_FALSE(InputValidator::validateEmail("a@-example.com"));
    EXPECT_FALSE(InputValidator::validateEmail("a@example..com"));
    EXPECT_FALSE(InputValidator::validateEmail("a b@example.com"));
}

TEST(InputValidatorTest, EmailLengthLimit) {
    std::string local(64, 'a');
    std::string domain = std::string(63, 'b') + "." + std::string(63, 'c') + "." +
                         std::string(63, 'd') + ".com";
    EXPECT_GT(local.size() + 1 + domain.size(), InputValidator::kMaxEmailLength);
    EXPECT_FALSE(InputValidator::validateEmail(local + "@" + domain));
}

TEST(InputValidatorTest, PasswordRules) {
    EXPECT_TRUE(InputValidator::validatePassword("Secret123!"));
    EXPECT_TRUE(InputValidator::validatePassword("x"));
    EXPECT_TRUE(InputValidator::validatePassword(std::string(72, 'p')));

    EXPECT_FALSE(InputValidator::validatePassword(""));
    EXPECT_FALSE(InputValidator::validatePassword(std::string(73, 'p')));
    EXPECT_FALSE(InputValidator::validatePassword(std::string("ab\0cd", 5)));
}

// =============================================================================
// InMemoryUserRepository tests
// =============================================================================

class UserRepositoryTest : public ::testing::Test {
protected:
    InMemoryUserRepository repo;
};

TEST_F(UserRepositoryTest, CreateAssignsIdAndTimestamps) {
    auto user = repo.create("a@example.com", "hash");
    ASSERT_TRUE(user.hasValue());
    EXPECT_TRUE(user.value().id.isValid());
    EXPECT_EQ(user.value().email, "a@example.com");
    EXPECT_EQ(user.value().createdAt, user.value().updatedAt);

    auto byId = repo.findById(user.value().id);
    ASSERT_TRUE(byId.has_value());
    EXPECT_EQ(byId->passwordHash, "hash");

    auto byEmail = repo.findByEmail("a@example.com");
    ASSERT_TRUE(byEmail.has_value());
    EXPECT_EQ(byEmail->id, user.value().id);
}

TEST_F(UserRepositoryTest, DuplicateEmailRejected) {
    ASSERT_TRUE(repo.create("a@example.com", "h1").hasValue());
    auto again = repo.create("a@example.com", "h2");
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
}

TEST_F(UserRepositoryTest, EmailLookupIsCaseSensitive) {
    ASSERT_TRUE(repo.create("a@example.com", "h").hasValue());
    EXPECT_FALSE(repo.findByEmail("A@example.com").has_value());
}

TEST_F(UserRepositoryTest, UpdateReplacesEmailAndHash) {
    auto user = repo.create("a@example.com", "h1");
    ASSERT_TRUE(user.hasValue());

    auto updated = repo.update(user.value().id, "b@example.com", "h2");
    ASSERT_TRUE(updated.hasValue());
    EXPECT_EQ(updated.value().email, "b@example.com");
    EXPECT_EQ(updated.value().passwordHash, "h2");
    EXPECT_GE(updated.value().updatedAt, user.value().updatedAt);
    EXPECT_FALSE(repo.findByEmail("a@example.com").has_value());
}

TEST_F(UserRepositoryTest, UpdateKeepingOwnEmailIsAllowed) {
    auto user = repo.create("a@example.com", "h1");
    ASSERT_TRUE(user.hasValue());
    EXPECT_TRUE(repo.update(user.value().id, "a@example.com", "h2").hasValue());
}

TEST_F(UserRepositoryTest, UpdateToTakenEmailRejected) {
    auto a = repo.create("a@example.com", "h");
    auto b = repo.create("b@example.com", "h");
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());

    auto result = repo.update(b.value().id, "a@example.com", "h");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AlreadyExists);
}

TEST_F(UserRepositoryTest, UpdateUnknownUser) {
    auto result = repo.update(UserId::generate(), "a@example.com", "h");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(UserRepositoryTest, DeleteAll) {
    auto user = repo.create("a@example.com", "h");
    ASSERT_TRUE(user.hasValue());
    repo.deleteAll();
    EXPECT_FALSE(repo.findById(user.value().id).has_value());
    EXPECT_FALSE(repo.findByEmail("a@example.com").has_value());
}
