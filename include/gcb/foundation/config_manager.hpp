#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gcb/foundation/gateway_result.hpp"

namespace gcb::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration flattened into dotted keys ("gateway.listen_port").
///
/// Maps are flattened; scalars and sequences are stored as leaves, so
/// `servers.Survival.forward_targets` is a single leaf holding a sequence.
/// Nodes are cloned on load to avoid yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing the current entries.
    /// @return Success or ConfigLoadFailed.
    GatewayResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text (same semantics as load()).
    GatewayResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch.
    template <typename T>
    GatewayResult<T> get(std::string_view key) const;

    /// Retrieve a string list. Accepts a YAML sequence, a single scalar, or
    /// a multi-line string whose blank and `#` lines are skipped.
    GatewayResult<std::vector<std::string>> getList(std::string_view key) const;

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Distinct immediate child names below @p prefix, sorted.
    /// childKeys("servers") on `servers.A.token, servers.B.mode` -> {A, B}.
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    GatewayResult<void> loadRoot(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GatewayResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GatewayResult<T>::err(
            GatewayError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GatewayResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GatewayResult<T>::err(
            GatewayError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace gcb::foundation
