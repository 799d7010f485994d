/// @file main.cpp
/// @brief Auth service entry point.
///
/// Standalone executable hosting the SessionAuthenticator with in-memory
/// storage backends suitable for development and testing. Runs the
/// refresh token pruning pass until SIGINT/SIGTERM.

#include "chirpy/auth/session_authenticator.hpp"
#include "chirpy/auth/token_store.hpp"
#include "chirpy/auth/user_repository.hpp"
#include "chirpy/foundation/config_manager.hpp"
#include "chirpy/foundation/service_logger.hpp"
#include "chirpy/service/service_runner.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    using chirpy::foundation::LogCategory;

    chirpy::service::SignalHandler signals;

    // Resolve config path: --config flag > CHIRPY_CONFIG_PATH env > default.
    auto configPath = chirpy::service::parseConfigArg(argc, argv);

    chirpy::foundation::ConfigManager config;
    auto loadResult = chirpy::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto authConfig = chirpy::service::buildAuthConfig(config);
    if (!authConfig) {
        std::cerr << "Invalid auth configuration: " << authConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto pruneInterval = authConfig.value().pruneInterval;
    bool devPlatform = authConfig.value().platform == chirpy::auth::Platform::Dev;

    // In-memory backends for standalone development mode.
    auto users = std::make_shared<chirpy::auth::InMemoryUserRepository>();
    auto refreshTokens = std::make_shared<chirpy::auth::InMemoryRefreshTokenRepository>();

    chirpy::auth::SessionAuthenticator authenticator(
        std::move(authConfig).value(), users, refreshTokens);

    CHIRPY_LOG_INFO(LogCategory::Core,
                    std::string("auth service started (platform: ") +
                        (devPlatform ? "dev" : "production") + ", prune interval: " +
                        std::to_string(pruneInterval.count()) + "s)");

    while (!signals.waitForShutdown(pruneInterval)) {
        authenticator.pruneExpiredRefreshTokens();
    }

    CHIRPY_LOG_INFO(LogCategory::Core, "auth service stopped");
    auto flushed = chirpy::foundation::ServiceLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
