#pragma once

/// @file websocket_dialer.hpp
/// @brief Outbound WebSocket connections for dial-mode game servers.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/foundation/signal.hpp"
#include "gcb/foundation/transport.hpp"

namespace gcb::foundation {

/// Opens outbound transports.
///
/// Frames and close events of every transport returned by dial() are
/// reported through the dialer's own signals, keyed by transport id.
class Dialer {
public:
    virtual ~Dialer() = default;

    /// Connect to @p host:@p port. Blocks until connected or failed.
    /// @return ConnectionFailed when the peer is unreachable.
    [[nodiscard]] virtual GatewayResult<std::shared_ptr<Transport>>
    dial(const std::string& host, uint16_t port) = 0;

    Signal<const std::string&, const std::string&> onFrame;
    Signal<const std::string&> onClosed;
};

/// Dialer backed by the kcenon network_system WebSocket client.
///
/// The dialer must outlive the transports it returns; destroying it stops
/// every client it still tracks.
class WebSocketDialer final : public Dialer {
public:
    explicit WebSocketDialer(
        std::chrono::milliseconds connectTimeout = std::chrono::seconds(10));
    ~WebSocketDialer() override;

    WebSocketDialer(const WebSocketDialer&) = delete;
    WebSocketDialer& operator=(const WebSocketDialer&) = delete;

    [[nodiscard]] GatewayResult<std::shared_ptr<Transport>>
    dial(const std::string& host, uint16_t port) override;

    /// Number of dialed transports that are still open.
    [[nodiscard]] std::size_t openCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gcb::foundation
