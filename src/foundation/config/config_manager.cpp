#include "chirpy/foundation/config_manager.hpp"

#include <cstdint>
#include <cstdlib>

namespace chirpy::foundation {

ChirpyResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return ChirpyResult<void>::err(
            ChirpyError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ChirpyResult<void>::err(
            ChirpyError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }

    if (!root.IsNull() && !root.IsMap()) {
        return ChirpyResult<void>::err(ChirpyError(
            ErrorCode::ConfigLoadFailed, "config root must be a mapping: " + path.string()));
    }

    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    source_ = path;
    return ChirpyResult<void>::ok();
}

ChirpyResult<std::string> ConfigManager::getOverridable(std::string_view key,
                                                        const char* envVar,
                                                        std::string fallback) const {
    if (const char* value = std::getenv(envVar); value != nullptr) {
        return ChirpyResult<std::string>::ok(value);
    }
    return getOr<std::string>(key, std::move(fallback));
}

ChirpyResult<std::chrono::seconds> ConfigManager::getPositiveSeconds(
    std::string_view key, std::chrono::seconds fallback) const {
    auto value = getOr<int64_t>(key, static_cast<int64_t>(fallback.count()));
    if (!value) {
        return ChirpyResult<std::chrono::seconds>::err(value.error());
    }
    if (value.value() <= 0) {
        return ChirpyResult<std::chrono::seconds>::err(ChirpyError(
            ErrorCode::InvalidArgument, std::string(key) + " must be positive"));
    }
    return ChirpyResult<std::chrono::seconds>::ok(std::chrono::seconds(value.value()));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::filesystem::path ConfigManager::source() const {
    std::lock_guard lock(mutex_);
    return source_;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            flatten(prefix.empty() ? childKey : prefix + "." + childKey, it->second);
        }
        return;
    }
    if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace chirpy::foundation
