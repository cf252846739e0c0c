#pragma once

/// @file websocket_listener.hpp
/// @brief WebSocketListener wrapping the kcenon network_system WebSocket server.
///
/// Accepts game-server connections and surfaces each one as a Transport.
/// Frames are delivered as text, one protocol message per frame.

#include <cstdint>
#include <memory>
#include <string>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/foundation/signal.hpp"
#include "gcb/foundation/transport.hpp"

namespace gcb::foundation {

/// Listening side of the gateway's WebSocket transport.
///
/// Signals fire on kcenon I/O threads:
/// - onOpened:  a new connection, wrapped as a Transport
/// - onFrame:   (transport id, frame text)
/// - onClosed:  transport id of a connection that went away
///
/// @code
///   WebSocketListener listener;
///   listener.onOpened.connect([&](std::shared_ptr<Transport> t) {
///       gateway.handleTransportOpened(std::move(t));
///   });
///   listener.onFrame.connect([&](const std::string& id, const std::string& frame) {
///       gateway.handleFrame(id, frame);
///   });
///   auto r = listener.listen(58008);
/// @endcode
class WebSocketListener {
public:
    WebSocketListener();
    ~WebSocketListener();

    WebSocketListener(const WebSocketListener&) = delete;
    WebSocketListener& operator=(const WebSocketListener&) = delete;

    // ── Server lifecycle ────────────────────────────────────────────────────

    /// Start accepting connections on @p port.
    /// @return AlreadyExists if already listening, ListenFailed on bind errors.
    [[nodiscard]] GatewayResult<void> listen(uint16_t port);

    /// Stop the server and close every open transport.
    void stop();

    [[nodiscard]] bool isListening() const noexcept;

    // ── Queries ─────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t connectionCount() const;

    // ── Signals ─────────────────────────────────────────────────────────────

    Signal<std::shared_ptr<Transport>> onOpened;
    Signal<const std::string&, const std::string&> onFrame;
    Signal<const std::string&> onClosed;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gcb::foundation
