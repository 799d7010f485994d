#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic helpers: HMAC-SHA256, CSPRNG, Base64URL, hex.
///
/// Digest, MAC and randomness come from OpenSSL; the encoders are local.
/// Used internally by TokenProvider, RefreshTokenManager and PasswordHasher.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace chirpy::auth::detail {

// =============================================================================
// HMAC-SHA256 (RFC 2104)
// =============================================================================

inline constexpr std::size_t kSha256Size = 32;

/// Compute HMAC-SHA256(key, message). Returns nullopt only if OpenSSL fails.
[[nodiscard]] inline std::optional<std::array<uint8_t, kSha256Size>> hmacSha256(
    std::string_view key, std::string_view message) {
    std::array<uint8_t, kSha256Size> mac{};
    unsigned int macLen = 0;
    auto* out = HMAC(EVP_sha256(),
                     key.data(), static_cast<int>(key.size()),
                     reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                     mac.data(), &macLen);
    if (out == nullptr || macLen != kSha256Size) {
        return std::nullopt;
    }
    return mac;
}

// =============================================================================
// Base64URL encoding/decoding (RFC 4648 §5, unpadded)
// =============================================================================

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Decode unpadded base64url. Returns nullopt on any character outside the
/// alphabet or on an impossible length.
[[nodiscard]] inline std::optional<std::string> base64urlDecode(std::string_view input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val = decodeChar(c);
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

// =============================================================================
// Hex encoding
// =============================================================================

[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

// =============================================================================
// Secure random generation
// =============================================================================

/// N bytes from OpenSSL's CSPRNG, hex-encoded. Returns nullopt if the
/// generator is not seeded or fails.
[[nodiscard]] inline std::optional<std::string> secureRandomHex(std::size_t numBytes) {
    std::vector<uint8_t> buf(numBytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return std::nullopt;
    }
    auto hex = toHex(buf.data(), buf.size());
    OPENSSL_cleanse(buf.data(), buf.size());
    return hex;
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Equal-length inputs are compared without data-dependent early exit.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace chirpy::auth::detail
