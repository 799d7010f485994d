#pragma once

/// @file bearer_token.hpp
/// @brief Credential carriers and "Bearer <token>" extraction.

#include "chirpy/foundation/chirpy_result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace chirpy::auth {

/// Anything that may carry an Authorization value (an HTTP request, a
/// message envelope, a test double).
class ICredentialCarrier {
public:
    virtual ~ICredentialCarrier() = default;

    /// The raw Authorization value, or nullopt if the carrier has none.
    [[nodiscard]] virtual std::optional<std::string> authorization() const = 0;
};

/// Carrier holding an Authorization value directly.
class HeaderCarrier : public ICredentialCarrier {
public:
    HeaderCarrier() = default;
    explicit HeaderCarrier(std::string authorization)
        : authorization_(std::move(authorization)) {}

    [[nodiscard]] std::optional<std::string> authorization() const override {
        return authorization_;
    }

private:
    std::optional<std::string> authorization_;
};

/// Scheme prefix, case-sensitive, including the single separating space.
inline constexpr std::string_view kBearerPrefix = "Bearer ";

/// Pull the token out of "Bearer <token>".
///
/// A missing value, any other scheme, an empty token and a token with
/// whitespace all fail identically with AuthenticationFailed
/// (reason MissingOrInvalidCredential).
[[nodiscard]] foundation::ChirpyResult<std::string> extractBearerToken(
    const ICredentialCarrier& carrier);

/// Same as above for a raw header value.
[[nodiscard]] foundation::ChirpyResult<std::string> extractBearerToken(
    const std::optional<std::string>& authorization);

}  // namespace chirpy::auth
