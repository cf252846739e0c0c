#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities for the gateway executable: signal handling,
///        config path resolution and configuration loading.

#include <atomic>
#include <filesystem>

#include "gcb/foundation/config_manager.hpp"
#include "gcb/foundation/gateway_result.hpp"

namespace gcb::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// The destructor restores the default handlers so that a second signal
/// during shutdown terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Default location of the gateway configuration file.
inline constexpr const char* kDefaultConfigPath = "/etc/gcb/config.yaml";

/// Environment variable consulted when no `--config` argument is given.
inline constexpr const char* kConfigPathEnv = "GCB_CONFIG_PATH";

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Resolve the config file path in order:
///   1. `--config <path>`
///   2. GCB_CONFIG_PATH environment variable (if set and non-empty)
///   3. /etc/gcb/config.yaml
[[nodiscard]] std::filesystem::path resolveConfigPath(int argc, char* argv[]);

/// Load the YAML file at @p path into @p config.
/// @return ConfigLoadFailed when the file is missing or not valid YAML.
[[nodiscard]] foundation::GatewayResult<void> loadConfig(foundation::ConfigManager& config,
                                                         const std::filesystem::path& path);

} // namespace gcb::service
