#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the service entry point.
///
/// Provides signal handling, configuration loading and CLI argument
/// parsing for chirpy_auth_service.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string_view>

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/foundation/chirpy_result.hpp"
#include "chirpy/foundation/config_manager.hpp"

namespace chirpy::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// On destruction the default handlers are restored so that a second
/// signal terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block until a shutdown signal arrives or @p timeout elapses.
    /// @return true if shutdown was requested.
    bool waitForShutdown(std::chrono::milliseconds timeout) const;

    /// Raise the shutdown flag without a signal (tests, fatal errors).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Default config file location when neither --config nor the
/// environment names one.
inline constexpr std::string_view kDefaultConfigPath = "/etc/chirpy/config.yaml";

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. @p cliPath (from --config), if non-empty
///   2. CHIRPY_CONFIG_PATH environment variable, if set
///   3. kDefaultConfigPath
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] foundation::ChirpyResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& cliPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Assemble the auth configuration.
///
/// Reads the signing secret from JWT_SECRET (missing or empty fails with
/// ConfigKeyNotFound), the platform from PLATFORM or "server.platform",
/// and "auth.prune_interval_seconds" (default 3600, must be positive).
[[nodiscard]] foundation::ChirpyResult<auth::AuthConfig>
buildAuthConfig(const foundation::ConfigManager& config);

} // namespace chirpy::service
