#include <gtest/gtest.h>

#include "chirpy/auth/auth_types.hpp"
#include "chirpy/foundation/config_manager.hpp"
#include "chirpy/foundation/error_code.hpp"
#include "chirpy/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace chirpy::service;
using chirpy::auth::Platform;
using chirpy::foundation::ConfigManager;
using chirpy::foundation::ErrorCode;

// =============================================================================
// Environment-aware fixture
// =============================================================================

class ServiceRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("chirpy_runner_") + info->name());
        std::filesystem::create_directories(tmpDir_);
        clearEnv();
    }

    void TearDown() override {
        clearEnv();
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    static void clearEnv() {
        ::unsetenv("JWT_SECRET");
        ::unsetenv("PLATFORM");
        ::unsetenv("CHIRPY_CONFIG_PATH");
    }

    std::filesystem::path writeYaml(const std::string& filename, const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

// =============================================================================
// buildAuthConfig
// =============================================================================

TEST_F(ServiceRunnerTest, MissingSecretFailsStartup) {
    ConfigManager config;
    auto result = buildAuthConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ServiceRunnerTest, EmptySecretFailsStartup) {
    ::setenv("JWT_SECRET", "", 1);
    ConfigManager config;
    auto result = buildAuthConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ServiceRunnerTest, DefaultsWithSecretOnly) {
    ::setenv("JWT_SECRET", "s3cret", 1);
    ConfigManager config;
    auto result = buildAuthConfig(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().secret, "s3cret");
    EXPECT_EQ(result.value().platform, Platform::Production);
    EXPECT_EQ(result.value().pruneInterval, std::chrono::seconds{3600});
}

TEST_F(ServiceRunnerTest, ReadsPlatformAndIntervalFromConfig) {
    ::setenv("JWT_SECRET", "s3cret", 1);
    auto path = writeYaml("chirpy.yaml", R"(
server:
  platform: dev
auth:
  prune_interval_seconds: 60
)");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = buildAuthConfig(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().platform, Platform::Dev);
    EXPECT_EQ(result.value().pruneInterval, std::chrono::seconds{60});
}

TEST_F(ServiceRunnerTest, PlatformEnvironmentOverridesConfig) {
    ::setenv("JWT_SECRET", "s3cret", 1);
    ::setenv("PLATFORM", "production", 1);
    ConfigManager config;
    config.set<std::string>("server.platform", "dev");

    auto result = buildAuthConfig(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().platform, Platform::Production);
}

TEST_F(ServiceRunnerTest, NonPositivePruneIntervalRejected) {
    ::setenv("JWT_SECRET", "s3cret", 1);
    ConfigManager config;
    config.set<int>("auth.prune_interval_seconds", 0);

    auto result = buildAuthConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(ServiceRunnerTest, MistypedPruneIntervalRejected) {
    ::setenv("JWT_SECRET", "s3cret", 1);
    ConfigManager config;
    config.set<std::string>("auth.prune_interval_seconds", "hourly");

    auto result = buildAuthConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

// =============================================================================
// loadConfig / parseConfigArg
// =============================================================================

TEST_F(ServiceRunnerTest, LoadConfigPrefersCliPath) {
    auto cliPath = writeYaml("cli.yaml", "server:\n  platform: cli\n");
    auto envPath = writeYaml("env.yaml", "server:\n  platform: env\n");
    ::setenv("CHIRPY_CONFIG_PATH", envPath.c_str(), 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, cliPath).hasValue());
    EXPECT_EQ(config.get<std::string>("server.platform").value(), "cli");
}

TEST_F(ServiceRunnerTest, LoadConfigFallsBackToEnvironment) {
    auto envPath = writeYaml("env.yaml", "server:\n  platform: env\n");
    ::setenv("CHIRPY_CONFIG_PATH", envPath.c_str(), 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, {}).hasValue());
    EXPECT_EQ(config.get<std::string>("server.platform").value(), "env");
}

TEST_F(ServiceRunnerTest, LoadConfigMissingFile) {
    ConfigManager config;
    auto result = loadConfig(config, tmpDir_ / "absent.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ParseConfigArgTest, FindsConfigFlag) {
    char prog[] = "chirpy_auth_service";
    char flag[] = "--config";
    char path[] = "/tmp/chirpy.yaml";
    char* argv[] = {prog, flag, path};
    EXPECT_EQ(parseConfigArg(3, argv), std::filesystem::path("/tmp/chirpy.yaml"));
}

TEST(ParseConfigArgTest, FlagWithoutValueIgnored) {
    char prog[] = "chirpy_auth_service";
    char flag[] = "--config";
    char* argv[] = {prog, flag};
    EXPECT_TRUE(parseConfigArg(2, argv).empty());
}

// =============================================================================
// SignalHandler
// =============================================================================

TEST(SignalHandlerTest, WaitTimesOutWithoutSignal) {
    SignalHandler signals;
    EXPECT_FALSE(signals.shutdownRequested());
    EXPECT_FALSE(signals.waitForShutdown(std::chrono::milliseconds{20}));
}

TEST(SignalHandlerTest, SigtermRequestsShutdown) {
    SignalHandler signals;
    std::raise(SIGTERM);
    EXPECT_TRUE(signals.shutdownRequested());
    EXPECT_TRUE(signals.waitForShutdown(std::chrono::seconds{1}));
}

TEST(SignalHandlerTest, RequestShutdownWithoutSignal) {
    SignalHandler signals;
    SignalHandler::requestShutdown();
    EXPECT_TRUE(signals.waitForShutdown(std::chrono::milliseconds{0}));
}
