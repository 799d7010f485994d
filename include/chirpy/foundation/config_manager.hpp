#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "chirpy/foundation/chirpy_result.hpp"

namespace chirpy::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Nested mappings are addressed with dotted keys ("auth.prune_interval_seconds").
/// Lookups come in three strengths:
///   - get<T>()          the key must be present
///   - getOr<T>()        absent keys yield a fallback
///   - getOverridable()  an environment variable beats the file
///
/// A present key with the wrong type is always ConfigTypeMismatch, never
/// silently replaced by a fallback.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous entries.
    ///
    /// An empty file is a valid, empty configuration. Any other root that
    /// is not a mapping is rejected.
    /// @return Success or ConfigLoadFailed error.
    ChirpyResult<void> load(const std::filesystem::path& path);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    ChirpyResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is absent.
    template <typename T>
    ChirpyResult<T> getOr(std::string_view key, T fallback) const;

    /// String value where the environment variable @p envVar, when set,
    /// takes precedence over the file. Falls back to @p fallback when
    /// neither provides one.
    ChirpyResult<std::string> getOverridable(std::string_view key,
                                             const char* envVar,
                                             std::string fallback) const;

    /// Whole number of seconds, which must be strictly positive.
    /// @return InvalidArgument for zero or negative values.
    ChirpyResult<std::chrono::seconds> getPositiveSeconds(std::string_view key,
                                                          std::chrono::seconds fallback) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// File the current entries came from; empty when nothing was loaded.
    [[nodiscard]] std::filesystem::path source() const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::filesystem::path source_;
};

// --- Template implementations ---

template <typename T>
ChirpyResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ChirpyResult<T>::err(
            ChirpyError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ChirpyResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ChirpyResult<T>::err(
            ChirpyError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
ChirpyResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError() && result.error().code() == ErrorCode::ConfigKeyNotFound) {
        return ChirpyResult<T>::ok(std::move(fallback));
    }
    return result;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace chirpy::foundation
