#pragma once

/// @file gateway_types.hpp
/// @brief Core type definitions shared by the gateway service modules.
///
/// Session states, delivery modes, connect modes and the timing policy
/// that drives the per-server connection state machine.

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace gcb::service {

/// Monotonic clock for every gateway deadline. Tests pass explicit time
/// points instead of sleeping.
using Clock = std::chrono::steady_clock;

// -- Session state ------------------------------------------------------------

/// Connection lifecycle state of one game server.
enum class SessionState : uint8_t {
    /// Transport handshake in progress.
    Connecting,
    /// Transport up, credentials presented, waiting for the verdict.
    Authenticating,
    /// Bidirectional flow, heartbeats running.
    Connected,
    /// Transport lost unexpectedly; waiting out the backoff.
    Reconnecting,
    /// Terminal until an explicit reconnect request.
    Closed
};

/// Return the string name for a session state.
constexpr std::string_view sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Connecting:     return "CONNECTING";
        case SessionState::Authenticating: return "AUTHENTICATING";
        case SessionState::Connected:      return "CONNECTED";
        case SessionState::Reconnecting:   return "RECONNECTING";
        case SessionState::Closed:         return "CLOSED";
    }
    return "UNKNOWN";
}

// -- Delivery policy ----------------------------------------------------------

/// How an outbound message behaves when the session is not CONNECTED.
enum class DeliveryMode : uint8_t {
    /// Queue unless CLOSED (then fail with ServerNotConnected).
    Queued,
    /// Fail with ServerNotConnected unless CONNECTED.
    Immediate
};

/// Who opens the transport for a server.
enum class ConnectMode : uint8_t {
    /// The game server connects to the gateway listener.
    Listen,
    /// The gateway dials the game server.
    Dial
};

constexpr std::string_view connectModeName(ConnectMode mode) {
    return mode == ConnectMode::Dial ? "dial" : "listen";
}

/// What happens when a second connection authenticates for a server id
/// that is already CONNECTED.
enum class DuplicatePolicy : uint8_t {
    /// Close the old transport, adopt the new one.
    Supersede,
    /// Refuse the newcomer with DuplicateServerId.
    Reject
};

// -- Timing policy ------------------------------------------------------------

/// Heartbeat, authentication and reconnect timing for one session.
struct SessionPolicy {
    /// Interval between PINGs while CONNECTED; zero or negative disables.
    std::chrono::milliseconds heartbeatInterval{30000};

    /// Maximum wait for a PONG after a PING.
    std::chrono::milliseconds pongTimeout{10000};

    /// Maximum time in AUTHENTICATING before the attempt is abandoned.
    std::chrono::milliseconds authTimeout{10000};

    /// First reconnect delay.
    std::chrono::milliseconds backoffInitial{1000};

    /// Upper bound for the reconnect delay.
    std::chrono::milliseconds backoffMax{60000};

    /// Growth factor between consecutive reconnect delays.
    double backoffMultiplier = 2.0;

    /// Reconnect attempts before giving up (0 = unlimited).
    uint32_t maxReconnectAttempts = 0;

    /// Failed initial connect attempts before CONNECTING gives up.
    uint32_t maxConnectAttempts = 5;

    /// Outbound queue bound; oldest messages are evicted beyond it.
    std::size_t queueCapacity = 256;
};

/// Delay before reconnect attempt @p attempt (1-based):
/// min(max, initial * multiplier^(attempt-1)).
std::chrono::milliseconds backoffDelay(const SessionPolicy& policy, uint32_t attempt);

} // namespace gcb::service
