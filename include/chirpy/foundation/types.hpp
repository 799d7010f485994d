#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared across the auth core.

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace chirpy::foundation {

/// Identifier of a registered user: a canonical RFC 4122 UUID string.
///
/// A default-constructed UserId is invalid. Valid ids only come from
/// parse() (which normalizes to lowercase) or generate().
class UserId {
public:
    UserId() = default;

    /// Parse a UUID in 8-4-4-4-12 hex form. Returns nullopt when malformed.
    [[nodiscard]] static std::optional<UserId> parse(std::string_view text);

    /// Generate a fresh random (version 4) identifier.
    [[nodiscard]] static UserId generate();

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] bool isValid() const noexcept { return !value_.empty(); }

    auto operator<=>(const UserId&) const = default;

private:
    explicit UserId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

/// Length of the canonical textual UUID form.
inline constexpr std::size_t kUserIdLength = 36;

} // namespace chirpy::foundation

template <>
struct std::hash<chirpy::foundation::UserId> {
    std::size_t operator()(const chirpy::foundation::UserId& id) const noexcept {
        return std::hash<std::string>{}(id.value());
    }
};
