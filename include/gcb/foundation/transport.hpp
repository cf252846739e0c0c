#pragma once

/// @file transport.hpp
/// @brief Abstract text-frame transport carrying one protocol message per frame.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "gcb/foundation/gateway_result.hpp"

namespace gcb::foundation {

/// WebSocket close codes used by the gateway.
enum class CloseCode : uint16_t {
    Normal        = 1000,
    GoingAway     = 1001,
    ProtocolError = 1002,
    PolicyViolation = 1008,
    /// Credentials rejected; the peer must not retry with the same token.
    AuthFailed    = 4001,
    /// Connection superseded by a newer one for the same server id.
    Replaced      = 4002,
    /// No AUTH frame arrived in time.
    AuthTimeout   = 4003,
    /// Heartbeat (PONG) deadline missed.
    HeartbeatTimeout = 4004
};

constexpr std::string_view closeCodeName(CloseCode code) {
    switch (code) {
        case CloseCode::Normal:           return "normal";
        case CloseCode::GoingAway:        return "going_away";
        case CloseCode::ProtocolError:    return "protocol_error";
        case CloseCode::PolicyViolation:  return "policy_violation";
        case CloseCode::AuthFailed:       return "auth_failed";
        case CloseCode::Replaced:         return "replaced";
        case CloseCode::AuthTimeout:      return "auth_timeout";
        case CloseCode::HeartbeatTimeout: return "heartbeat_timeout";
    }
    return "unknown";
}

/// One live bidirectional connection to a game server.
///
/// Implementations must make sendText() and close() safe to call from any
/// thread. Frame order across sendText() calls from one thread is preserved.
class Transport {
public:
    virtual ~Transport() = default;

    /// Stable identifier, unique among live transports of this process.
    [[nodiscard]] virtual const std::string& id() const noexcept = 0;

    /// Send one text frame.
    /// @return SendFailed if the connection is closed or the write failed.
    [[nodiscard]] virtual GatewayResult<void> sendText(std::string frame) = 0;

    /// Close the connection. Idempotent.
    virtual void close(CloseCode code, std::string_view reason) = 0;

    [[nodiscard]] virtual bool isOpen() const noexcept = 0;
};

} // namespace gcb::foundation
