#pragma once

/// @file gateway_config.hpp
/// @brief Typed gateway configuration and its mapping from YAML keys.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gcb/foundation/config_manager.hpp"
#include "gcb/foundation/gateway_logger.hpp"
#include "gcb/foundation/gateway_result.hpp"
#include "gcb/service/binding_coordinator.hpp"
#include "gcb/service/command_dispatcher.hpp"
#include "gcb/service/forward_table.hpp"
#include "gcb/service/gateway_types.hpp"
#include "gcb/service/http_status_client.hpp"

namespace gcb::service {

/// One whitelisted game server.
struct ServerEntry {
    std::string serverId;
    std::string token;
    ConnectMode mode = ConnectMode::Listen;

    /// Dial mode only.
    std::string dialHost;
    uint16_t dialPort = 0;

    ForwardRule forward;
    std::optional<HttpEndpoint> http;
};

/// Everything GatewayServer needs, with working defaults.
struct GatewayConfig {
    // -- Listener -------------------------------------------------------------
    bool listenEnabled = true;
    std::string listenHost = "127.0.0.1";
    uint16_t listenPort = 58008;
    /// Informational: credentials travel in the AUTH frame, not the URL.
    std::string path = "/mc";

    // -- Sessions -------------------------------------------------------------
    DuplicatePolicy duplicatePolicy = DuplicatePolicy::Supersede;
    SessionPolicy session;
    bool removeOnGiveUp = false;

    /// Inbound frames per server: burst and sustained rate (0 = unlimited).
    uint32_t rateLimitCapacity = 100;
    uint32_t rateLimitRefillRate = 50;

    // -- Scheduling -----------------------------------------------------------
    std::chrono::milliseconds tickInterval{100};
    /// Maintenance pool size. Outbound dials run on a separate pool with
    /// one worker per dial-mode server.
    std::size_t workerThreads = 2;

    // -- Queries --------------------------------------------------------------
    std::chrono::milliseconds queryTimeout{5000};
    /// Zero disables background status polling.
    std::chrono::seconds statusPollInterval{0};
    std::chrono::milliseconds httpTimeout{5000};

    BindingConfig binding;
    AutoForwardConfig autoForward;

    std::optional<foundation::LogLevel> logLevel;

    /// Sorted by server id.
    std::vector<ServerEntry> servers;
};

/// Map configuration keys onto a GatewayConfig.
///
/// Missing keys keep their defaults. Recognized keys:
/// @code
///   gateway:
///     listen_host: 0.0.0.0
///     listen_port: 58008
///     duplicate_policy: supersede      # or reject
///     heartbeat_interval_ms: 30000     # <= 0 disables PING
///     server_ids: [Survival]           # legacy whitelist, paired with tokens
///     tokens: [secret]
///   binding:
///     code_length: 6
///     ttl_seconds: 300
///   commands:
///     auto_forward_prefix: "#"
///   servers:
///     Creative:
///       token: other-secret
///       mode: dial
///       dial_host: 10.0.0.5
///       dial_port: 8765
///       forward_targets: |
///         kook:GroupMessage:123
///         # comment lines are ignored
/// @endcode
///
/// @return ConfigTypeMismatch for a value of the wrong type, InvalidArgument
///         for an out-of-range or inconsistent value.
[[nodiscard]] foundation::GatewayResult<GatewayConfig> buildGatewayConfig(
    const foundation::ConfigManager& config);

} // namespace gcb::service
