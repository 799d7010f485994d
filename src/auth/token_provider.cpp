/// @file token_provider.cpp
/// @brief TokenProvider implementation (HS256 JWT).

#include "chirpy/auth/token_provider.hpp"

#include "chirpy/foundation/error_code.hpp"
#include "chirpy/foundation/service_logger.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <optional>
#include <sstream>

namespace chirpy::auth {

using foundation::ChirpyError;
using foundation::ChirpyResult;
using foundation::ErrorCode;
using foundation::LogCategory;

// ---------------------------------------------------------------------------
// Minimal JSON helpers for the flat objects this provider writes
// ---------------------------------------------------------------------------
namespace {

constexpr std::string_view kHeader = R"({"alg":"HS256","typ":"JWT"})";

std::string jsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    out.push_back('"');
    return out;
}

int64_t toEpoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpoch(int64_t epoch) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch));
}

/// Extract a string value by key; nullopt when absent or not a string.
std::optional<std::string> extractJsonString(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":\"";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    auto end = json.find('"', pos);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(json.substr(pos, end - pos));
}

/// Extract an integer value by key; nullopt when absent or not an integer.
std::optional<int64_t> extractJsonInt(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(json.data() + pos, json.data() + json.size(), result);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return result;
}

ChirpyError rejected(AuthFailureReason reason) {
    return ChirpyError(ErrorCode::AuthenticationFailed, "invalid or expired token", reason);
}

}  // namespace

// ---------------------------------------------------------------------------
// TokenProvider
// ---------------------------------------------------------------------------

TokenProvider::TokenProvider(std::string secret) : secret_(std::move(secret)) {}

ChirpyResult<std::string> TokenProvider::issue(const UserId& subject,
                                               std::chrono::seconds ttl,
                                               std::chrono::system_clock::time_point now) const {
    auto iat = toEpoch(now);
    auto exp = iat + ttl.count();

    std::ostringstream payload;
    payload << "{\"iss\":" << jsonEscape(kTokenIssuer)
            << ",\"sub\":" << jsonEscape(subject.value())
            << ",\"iat\":" << iat << ",\"exp\":" << exp << "}";

    std::string signingInput = detail::base64urlEncode(kHeader) + "." +
                               detail::base64urlEncode(payload.str());

    auto mac = detail::hmacSha256(secret_, signingInput);
    if (!mac) {
        CHIRPY_LOG_ERROR(LogCategory::Auth, "HMAC-SHA256 failed while signing access token");
        return ChirpyResult<std::string>::err(
            ChirpyError(ErrorCode::SigningFailed, "internal error"));
    }
    return ChirpyResult<std::string>::ok(signingInput + "." +
                                         detail::base64urlEncode(mac->data(), mac->size()));
}

ChirpyResult<UserId> TokenProvider::verify(std::string_view token,
                                           std::chrono::system_clock::time_point now) const {
    auto claims = verifyClaims(token, now);
    if (!claims) {
        return ChirpyResult<UserId>::err(claims.error());
    }
    return ChirpyResult<UserId>::ok(std::move(claims).value().subject);
}

ChirpyResult<AccessClaims> TokenProvider::verifyClaims(
    std::string_view token, std::chrono::system_clock::time_point now) const {
    using Out = ChirpyResult<AccessClaims>;

    // header.payload.signature, exactly three parts
    auto firstDot = token.find('.');
    if (firstDot == std::string_view::npos) {
        return Out::err(rejected(AuthFailureReason::MalformedToken));
    }
    auto secondDot = token.find('.', firstDot + 1);
    if (secondDot == std::string_view::npos ||
        token.find('.', secondDot + 1) != std::string_view::npos) {
        return Out::err(rejected(AuthFailureReason::MalformedToken));
    }
    auto headerPart = token.substr(0, firstDot);
    auto payloadPart = token.substr(firstDot + 1, secondDot - firstDot - 1);
    auto signaturePart = token.substr(secondDot + 1);

    auto headerJson = detail::base64urlDecode(headerPart);
    if (!headerJson) {
        return Out::err(rejected(AuthFailureReason::MalformedToken));
    }
    // Only HS256 is ever issued; "none" and friends are refused outright.
    if (extractJsonString(*headerJson, "alg") != std::optional<std::string>("HS256")) {
        return Out::err(rejected(AuthFailureReason::UnsupportedAlgorithm));
    }

    auto signingInput = token.substr(0, secondDot);
    auto mac = detail::hmacSha256(secret_, signingInput);
    if (!mac) {
        return Out::err(rejected(AuthFailureReason::BadSignature));
    }
    auto expectedSig = detail::base64urlEncode(mac->data(), mac->size());
    if (!detail::constantTimeEqual(expectedSig, signaturePart)) {
        return Out::err(rejected(AuthFailureReason::BadSignature));
    }

    auto payloadJson = detail::base64urlDecode(payloadPart);
    if (!payloadJson || payloadJson->empty()) {
        return Out::err(rejected(AuthFailureReason::MalformedToken));
    }

    auto exp = extractJsonInt(*payloadJson, "exp");
    if (!exp) {
        return Out::err(rejected(AuthFailureReason::MalformedToken));
    }
    AccessClaims claims;
    claims.expiresAt = fromEpoch(*exp);
    if (claims.expiresAt <= now) {
        return Out::err(rejected(AuthFailureReason::TokenExpired));
    }

    auto sub = extractJsonString(*payloadJson, "sub");
    auto subject = sub ? UserId::parse(*sub) : std::nullopt;
    if (!subject) {
        return Out::err(rejected(AuthFailureReason::InvalidSubject));
    }
    claims.subject = std::move(*subject);
    claims.issuer = extractJsonString(*payloadJson, "iss").value_or("");
    claims.issuedAt = fromEpoch(extractJsonInt(*payloadJson, "iat").value_or(0));

    return Out::ok(std::move(claims));
}

}  // namespace chirpy::auth
