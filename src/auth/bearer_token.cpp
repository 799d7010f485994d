/// @file bearer_token.cpp
/// @brief Bearer credential extraction.

#include "chirpy/auth/bearer_token.hpp"

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/foundation/error_code.hpp"

#include <algorithm>
#include <cctype>

namespace chirpy::auth {

using foundation::ChirpyError;
using foundation::ChirpyResult;
using foundation::ErrorCode;

ChirpyResult<std::string> extractBearerToken(const ICredentialCarrier& carrier) {
    return extractBearerToken(carrier.authorization());
}

ChirpyResult<std::string> extractBearerToken(const std::optional<std::string>& authorization) {
    auto invalid = [] {
        return ChirpyResult<std::string>::err(
            ChirpyError(ErrorCode::AuthenticationFailed,
                        "missing or malformed authorization header",
                        AuthFailureReason::MissingOrInvalidCredential));
    };

    if (!authorization) {
        return invalid();
    }
    std::string_view value = *authorization;
    if (value.substr(0, kBearerPrefix.size()) != kBearerPrefix) {
        return invalid();
    }

    auto token = value.substr(kBearerPrefix.size());
    if (token.empty()) {
        return invalid();
    }
    bool hasSpace = std::any_of(token.begin(), token.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    if (hasSpace) {
        return invalid();
    }
    return ChirpyResult<std::string>::ok(std::string(token));
}

} // namespace chirpy::auth
