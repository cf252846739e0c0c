#pragma once

/// @file session.hpp
/// @brief Per-server connection state machine with a bounded FIFO outbox.
///
/// A Session never reads a clock: every transition takes the current time
/// point, so tests drive heartbeats, auth timeouts and backoff by passing
/// synthetic times to tick().

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/foundation/signal.hpp"
#include "gcb/foundation/transport.hpp"
#include "gcb/protocol/message.hpp"
#include "gcb/service/gateway_types.hpp"

namespace gcb::service {

/// What tick() asks the owner to do next.
enum class SessionTick : uint8_t {
    None,
    /// Backoff elapsed in dial mode: open a new transport and bindTransport().
    DialRequested,
    /// Retry budget exhausted; the session just entered CLOSED.
    GaveUp
};

/// Read-only view used by the registry listing and the `info` command.
struct SessionSummary {
    std::string serverId;
    SessionState state = SessionState::Connecting;
    ConnectMode mode = ConnectMode::Listen;
    std::optional<Clock::time_point> lastSeen;
    std::size_t queued = 0;
    uint64_t dropped = 0;
    uint32_t attempts = 0;
};

/// One logical connection to a single game server.
///
/// State machine:
/// @code
///   CONNECTING --bindTransport--> AUTHENTICATING --completeAuthentication--> CONNECTED
///        ^                            |   |                                    |
///        |          auth timeout /    |   +--failAuthentication--> CLOSED      |
///        |          transport lost    v                                        |
///        +--------------------- RECONNECTING <--transport lost / pong timeout--+
///                                      |
///                                      +--retry budget exhausted--> CLOSED
/// @endcode
///
/// Thread safety: all methods lock a per-session mutex. Outbound frames
/// are written to the transport under that mutex, which is what keeps the
/// per-server FIFO order. Transition signals and transport closes run
/// after the mutex is released.
class Session {
public:
    Session(std::string serverId, ConnectMode mode, SessionPolicy policy);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -- Identity -------------------------------------------------------------

    [[nodiscard]] const std::string& serverId() const noexcept;
    [[nodiscard]] ConnectMode connectMode() const noexcept;

    // -- Transitions ----------------------------------------------------------

    /// Start (or restart) the initial connect sequence. Dial mode asks for a
    /// dial on the next tick.
    void beginConnecting(Clock::time_point now);

    /// Adopt @p transport and enter AUTHENTICATING. A different transport
    /// already bound is closed with CloseCode::Replaced first.
    void bindTransport(std::shared_ptr<foundation::Transport> transport,
                       Clock::time_point now);

    /// AUTHENTICATING -> CONNECTED. Writes @p greeting (if any), then the
    /// queued frames in submission order.
    /// @return InvalidState when not AUTHENTICATING.
    foundation::GatewayResult<void> completeAuthentication(
        Clock::time_point now, std::optional<std::string> greeting = std::nullopt);

    /// bindTransport() and completeAuthentication() under one lock, for a
    /// peer whose credentials were already checked. Concurrent adopts for
    /// one session serialize: under Supersede the last one keeps the
    /// session, under Reject the first one does.
    /// @return DuplicateServerId under Reject while CONNECTED.
    foundation::GatewayResult<void> adopt(
        std::shared_ptr<foundation::Transport> transport, Clock::time_point now,
        std::optional<std::string> greeting = std::nullopt,
        DuplicatePolicy duplicates = DuplicatePolicy::Supersede);

    /// Credentials rejected: close the transport and enter CLOSED (no retry).
    void failAuthentication(std::string_view reason, Clock::time_point now);

    /// The transport with @p transportId went away.
    /// @return false when @p transportId is not the bound transport (stale).
    bool onTransportLost(std::string_view transportId, Clock::time_point now);

    /// A dial attempt failed before a transport existed.
    /// @return true when the retry budget is spent and the session is CLOSED.
    bool onDialFailed(Clock::time_point now);

    /// Graceful shutdown: close the transport and enter CLOSED.
    void detach(Clock::time_point now);

    /// Restart the attempt sequence immediately, bypassing remaining backoff.
    /// From CONNECTED the current transport is closed first.
    void requestReconnect(Clock::time_point now);

    // -- Traffic --------------------------------------------------------------

    /// Send or queue @p msg according to @p mode.
    /// @return ServerNotConnected (see DeliveryMode), EncodeFailed, or
    ///         SendFailed for an Immediate write that failed.
    foundation::GatewayResult<void> send(const protocol::Message& msg, DeliveryMode mode);

    /// Record liveness for any inbound frame.
    void onInbound(Clock::time_point now);

    /// A PONG arrived; clears the outstanding heartbeat deadline.
    void onPong(Clock::time_point now);

    /// Drive heartbeats, auth timeout and backoff.
    SessionTick tick(Clock::time_point now);

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] std::optional<std::string> transportId() const;
    [[nodiscard]] std::optional<Clock::time_point> lastSeen() const;
    [[nodiscard]] std::size_t queuedCount() const;
    [[nodiscard]] uint64_t droppedCount() const;
    [[nodiscard]] uint32_t attemptCount() const;
    [[nodiscard]] std::optional<Clock::time_point> nextAttemptAt() const;
    [[nodiscard]] SessionSummary summary() const;

    /// Fired on every state change as (from, to), outside the session lock.
    foundation::Signal<SessionState, SessionState> onTransition;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gcb::service
