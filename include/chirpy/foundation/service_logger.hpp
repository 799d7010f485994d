#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon common_system logging for the auth core.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "chirpy/foundation/chirpy_result.hpp"
#include "chirpy/foundation/types.hpp"

namespace chirpy::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Process lifecycle
    Auth    = 1, ///< Login, token issuance and verification
    Storage = 2, ///< Repository access
    Config  = 3  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 4;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Auth", "Storage", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.userId = user.id;
///   ctx.extra["reason"] = "WrongPassword";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Auth,
///                         "Login rejected", ctx);
/// @endcode
struct LogContext {
    std::optional<UserId> userId;
    std::optional<std::string> requestId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger for the auth service wrapping kcenon's logging registry.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Each category logs through a named registry logger ("chirpy.<Category>")
/// and falls back to the registry default.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Auth     | Info          |
/// | Storage  | Warning       |
/// | Config   | Info          |
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry's default logger.
    ChirpyResult<void> flush();

    /// Process-wide instance used by the CHIRPY_LOG macros.
    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chirpy::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// CHIRPY_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef CHIRPY_MIN_LOG_LEVEL
    #define CHIRPY_MIN_LOG_LEVEL 0
#endif

#define CHIRPY_LOG(level, cat, msg)                                                   \
    do {                                                                              \
        _Pragma("GCC diagnostic push")                                                \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                           \
        if (static_cast<int>(level) >= CHIRPY_MIN_LOG_LEVEL &&                        \
            ::chirpy::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                             \
            ::chirpy::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                             \
        _Pragma("GCC diagnostic pop")                                                 \
    } while (0)

#define CHIRPY_LOG_DEBUG(cat, msg) \
    CHIRPY_LOG(::chirpy::foundation::LogLevel::Debug, (cat), (msg))

#define CHIRPY_LOG_INFO(cat, msg) \
    CHIRPY_LOG(::chirpy::foundation::LogLevel::Info, (cat), (msg))

#define CHIRPY_LOG_WARN(cat, msg) \
    CHIRPY_LOG(::chirpy::foundation::LogLevel::Warning, (cat), (msg))

#define CHIRPY_LOG_ERROR(cat, msg) \
    CHIRPY_LOG(::chirpy::foundation::LogLevel::Error, (cat), (msg))
