/// @file service_runner.cpp
/// @brief Implementation of service entry-point utilities.

#include "chirpy/service/service_runner.hpp"

#include "chirpy/foundation/error_code.hpp"
#include "chirpy/foundation/service_logger.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>

namespace chirpy::service {

using foundation::ChirpyError;
using foundation::ChirpyResult;
using foundation::ErrorCode;
using foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

bool SignalHandler::waitForShutdown(std::chrono::milliseconds timeout) const {
    using namespace std::chrono_literals;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            return false;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(remaining, 100ms));
    }
    return true;
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

ChirpyResult<void> loadConfig(foundation::ConfigManager& config,
                              const std::filesystem::path& cliPath) {
    std::filesystem::path configPath = cliPath;

    if (configPath.empty()) {
        const char* envPath = std::getenv("CHIRPY_CONFIG_PATH");
        configPath = envPath != nullptr ? std::filesystem::path(envPath)
                                        : std::filesystem::path(kDefaultConfigPath);
    }

    CHIRPY_LOG_INFO(LogCategory::Config, "loading config from " + configPath.string());
    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

// -- Auth configuration ------------------------------------------------------

ChirpyResult<auth::AuthConfig> buildAuthConfig(const foundation::ConfigManager& config) {
    auth::AuthConfig cfg;

    const char* secret = std::getenv("JWT_SECRET");
    if (secret == nullptr || *secret == '\0') {
        return ChirpyResult<auth::AuthConfig>::err(
            ChirpyError(ErrorCode::ConfigKeyNotFound, "JWT_SECRET must be set and non-empty"));
    }
    cfg.secret = secret;

    // PLATFORM in the environment wins over the config file.
    auto platform = config.getOverridable("server.platform", "PLATFORM", "production");
    if (!platform) {
        return ChirpyResult<auth::AuthConfig>::err(platform.error());
    }
    cfg.platform = auth::parsePlatform(platform.value());

    auto interval = config.getPositiveSeconds("auth.prune_interval_seconds", cfg.pruneInterval);
    if (!interval) {
        return ChirpyResult<auth::AuthConfig>::err(interval.error());
    }
    cfg.pruneInterval = interval.value();

    return ChirpyResult<auth::AuthConfig>::ok(std::move(cfg));
}

} // namespace chirpy::service
