#pragma once

/// @file gateway_server.hpp
/// @brief Top-level gateway context: owns every component and turns
///        transport events into session, routing and binding calls.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/foundation/transport.hpp"
#include "gcb/service/binding_coordinator.hpp"
#include "gcb/service/chat_platform.hpp"
#include "gcb/service/command_dispatcher.hpp"
#include "gcb/service/forward_table.hpp"
#include "gcb/service/gateway_config.hpp"
#include "gcb/service/gateway_types.hpp"
#include "gcb/service/router.hpp"
#include "gcb/service/session_registry.hpp"
#include "gcb/service/status_query.hpp"

namespace gcb::foundation {
class Dialer;
} // namespace gcb::foundation

namespace gcb::service {

// -- Statistics ---------------------------------------------------------------

/// Runtime statistics snapshot for the gateway.
struct GatewayStats {
    std::size_t knownServers = 0;
    std::size_t sessions = 0;
    std::size_t connectedSessions = 0;
    std::size_t unauthenticatedTransports = 0;
    uint64_t framesReceived = 0;
    uint64_t framesMalformed = 0;
    uint64_t framesRateLimited = 0;
    uint64_t framesIgnored = 0;
    uint64_t authSuccessCount = 0;
    uint64_t authFailureCount = 0;
    RouterStats routing;
    std::size_t pendingQueries = 0;
    std::size_t pendingBindings = 0;
};

// -- Gateway Server -----------------------------------------------------------

/// The gateway's top-level context.
///
/// Owns the registry, forward table, router, binding coordinator, correlation
/// table, status facade, command dispatcher, rate limiter, job scheduler and
/// (when enabled) the WebSocket listener. Nothing is process-global, so
/// several gateways can run side by side.
///
/// Usage:
/// @code
///   LoggingChatPlatformSink sink;
///   GatewayServer gateway(config, sink, std::make_shared<WebSocketDialer>());
///   auto r = gateway.start();
///
///   while (!signals.shutdownRequested()) {
///       std::this_thread::sleep_for(config.tickInterval);
///       gateway.pump(config.tickInterval);
///   }
///   gateway.stop();
/// @endcode
///
/// Tests skip the listener (`listenEnabled = false`) and feed fake transports
/// through handleTransportOpened() / handleFrame() / handleTransportClosed(),
/// driving time through tick().
class GatewayServer {
public:
    /// @param sink   Receiver of everything relayed to the chat side; must
    ///               outlive the gateway.
    /// @param dialer Opens transports for dial-mode servers (may be null when
    ///               none are configured).
    GatewayServer(GatewayConfig config, ChatPlatformSink& sink,
                  std::shared_ptr<foundation::Dialer> dialer = nullptr);

    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    // -- Lifecycle ------------------------------------------------------------

    /// Start listening (if enabled), begin dialing dial-mode servers and
    /// register the maintenance tick jobs.
    /// @return AlreadyExists when running, ListenFailed, JobScheduleFailed.
    [[nodiscard]] foundation::GatewayResult<void> start();

    /// Stop listening, detach every session and cancel maintenance jobs.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    /// Advance the scheduler's tick timers by @p elapsed (runs due jobs).
    void pump(std::chrono::milliseconds elapsed);

    // -- Transport events -----------------------------------------------------

    /// A listen-mode connection opened; it must send AUTH within the auth
    /// timeout.
    void handleTransportOpened(std::shared_ptr<foundation::Transport> transport);

    /// One text frame arrived on @p transportId.
    void handleFrame(const std::string& transportId, std::string_view frame);

    void handleTransportClosed(const std::string& transportId);

    // -- Maintenance ----------------------------------------------------------

    /// Heartbeats, auth timeouts, backoff/dials, correlation and binding sweeps.
    void tick(Clock::time_point now);

    // -- Components -----------------------------------------------------------

    [[nodiscard]] SessionRegistry& registry() noexcept;
    [[nodiscard]] ForwardTable& forwardTable() noexcept;
    [[nodiscard]] Router& router() noexcept;
    [[nodiscard]] BindingCoordinator& binding() noexcept;
    [[nodiscard]] StatusQueryFacade& status() noexcept;
    [[nodiscard]] CommandDispatcher& commands() noexcept;

    // -- Statistics -----------------------------------------------------------

    [[nodiscard]] GatewayStats stats() const;

    [[nodiscard]] const GatewayConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gcb::service
