/// @file types.cpp
/// @brief UserId parsing and generation.

#include "chirpy/foundation/types.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <random>

namespace chirpy::foundation {

std::optional<UserId> UserId::parse(std::string_view text) {
    if (text.size() != kUserIdLength) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(kUserIdLength);
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') {
                return std::nullopt;
            }
            normalized.push_back(c);
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return UserId(std::move(normalized));
}

// Thread-local PRNG for zero contention. Ids are not secrets; tokens use
// OpenSSL's CSPRNG instead.
UserId UserId::generate() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(gen);
    uint64_t lo = dist(gen);

    // Set version 4 (bits 12-15 of time_hi_and_version)
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    // Set variant 1 (bits 6-7 of clock_seq_hi_and_reserved)
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[kUserIdLength + 1];
    std::snprintf(buf,
                  sizeof(buf),
                  "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(hi >> 32),
                  static_cast<uint16_t>((hi >> 16) & 0xFFFF),
                  static_cast<uint16_t>(hi & 0xFFFF),
                  static_cast<uint16_t>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0x0000FFFFFFFFFFFFULL));
    return UserId(std::string(buf));
}

} // namespace chirpy::foundation
