#pragma once

/// @file input_validator.hpp
/// @brief Validation of user-supplied credentials before they are stored.
///
/// Login inputs are only checked for presence; register and update inputs
/// additionally go through validateEmail() and validatePassword().

#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace chirpy::auth {

/// Result of a validation check.
struct ValidationResult {
    bool valid;
    std::string message;

    explicit operator bool() const noexcept { return valid; }

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult fail(std::string msg) {
        return {false, std::move(msg)};
    }
};

/// Stateless input validation utilities. All functions are thread-safe.
class InputValidator {
public:
    // -- Limits ---------------------------------------------------------------

    static constexpr std::size_t kMaxEmailLength = 254;     // RFC 5321
    static constexpr std::size_t kMaxLocalPartLength = 64;  // RFC 5321
    static constexpr std::size_t kMaxDomainLabelLength = 63;

    /// bcrypt ignores everything past 72 bytes.
    static constexpr std::size_t kMaxPasswordBytes = 72;

    // -- Presence -------------------------------------------------------------

    /// Fail with "<field> is required" when @p value is absent.
    [[nodiscard]] static inline ValidationResult requireField(
        const std::optional<std::string>& value, std::string_view field) {
        if (!value.has_value()) {
            return ValidationResult::fail(std::string(field) + " is required");
        }
        return ValidationResult::ok();
    }

    // -- Email ----------------------------------------------------------------

    /// Validate email against an RFC 5322 subset: one '@', dot-atom local
    /// part, and a dotted domain of alphanumeric/hyphen labels.
    [[nodiscard]] static inline ValidationResult validateEmail(std::string_view email) {
        if (email.empty()) {
            return ValidationResult::fail("email must not be empty");
        }
        if (email.size() > kMaxEmailLength) {
            return ValidationResult::fail("email exceeds maximum length");
        }

        auto atPos = email.find('@');
        if (atPos == std::string_view::npos || atPos == 0 ||
            email.find('@', atPos + 1) != std::string_view::npos) {
            return ValidationResult::fail("email must contain exactly one '@'");
        }

        auto local = email.substr(0, atPos);
        auto domain = email.substr(atPos + 1);

        if (local.size() > kMaxLocalPartLength || !isDotAtom(local, isLocalChar)) {
            return ValidationResult::fail("email local part is invalid");
        }
        if (domain.find('.') == std::string_view::npos || !isDotAtom(domain, isDomainChar)) {
            return ValidationResult::fail("email domain is invalid");
        }

        std::size_t labelStart = 0;
        while (labelStart < domain.size()) {
            auto dotPos = domain.find('.', labelStart);
            auto labelEnd = (dotPos == std::string_view::npos) ? domain.size() : dotPos;
            auto label = domain.substr(labelStart, labelEnd - labelStart);
            if (label.size() > kMaxDomainLabelLength ||
                label.front() == '-' || label.back() == '-') {
                return ValidationResult::fail("email domain label is invalid");
            }
            labelStart = labelEnd + 1;
        }

        return ValidationResult::ok();
    }

    // -- Password -------------------------------------------------------------

    /// Non-empty, at most kMaxPasswordBytes, and free of NUL bytes (which
    /// would silently truncate the input to crypt).
    [[nodiscard]] static inline ValidationResult validatePassword(std::string_view password) {
        if (password.empty()) {
            return ValidationResult::fail("password must not be empty");
        }
        if (password.size() > kMaxPasswordBytes) {
            return ValidationResult::fail("password must not exceed " +
                                          std::to_string(kMaxPasswordBytes) + " bytes");
        }
        if (password.find('\0') != std::string_view::npos) {
            return ValidationResult::fail("password contains an invalid character");
        }
        return ValidationResult::ok();
    }

private:
    /// Non-empty dot-separated runs of @p allowed characters.
    template <typename Pred>
    static bool isDotAtom(std::string_view text, Pred allowed) {
        if (text.empty() || text.front() == '.' || text.back() == '.' ||
            text.find("..") != std::string_view::npos) {
            return false;
        }
        for (char c : text) {
            if (c != '.' && !allowed(c)) {
                return false;
            }
        }
        return true;
    }

    /// RFC 5322 atext: alphanumeric plus !#$%&'*+/=?^_`{|}~-
    static bool isLocalChar(char c) noexcept {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            return true;
        }
        switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'':
            case '*': case '+': case '/': case '=': case '?': case '^':
            case '_': case '`': case '{': case '|': case '}': case '~':
            case '-':
                return true;
            default:
                return false;
        }
    }

    static bool isDomainChar(char c) noexcept {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
    }
};

}  // namespace chirpy::auth
