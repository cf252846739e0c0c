#pragma once

/// @file router.hpp
/// @brief Fans inbound game messages out to chat targets and routes
///        outbound messages to the owning Session.

#include <atomic>
#include <cstdint>
#include <string>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/protocol/message.hpp"
#include "gcb/service/chat_platform.hpp"
#include "gcb/service/forward_table.hpp"
#include "gcb/service/gateway_types.hpp"
#include "gcb/service/session_registry.hpp"

namespace gcb::service {

/// Counters exposed through GatewayServer::stats().
struct RouterStats {
    uint64_t deliveries = 0;
    uint64_t suppressed = 0;
    uint64_t outboundSent = 0;
    uint64_t outboundFailed = 0;
};

/// Stateless apart from counters; holds references only. The registry,
/// table and sink must outlive the router.
class Router {
public:
    Router(SessionRegistry& registry, ForwardTable& table, ChatPlatformSink& sink);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// Deliver @p msg to every forward target of its server.
    ///
    /// CHAT, PLAYER_EVENT and COMMAND_RESULT are forwarded when the
    /// matching rule flag is set; other types are never forwarded. An
    /// empty target set is a silent no-op.
    ///
    /// @return Number of delivery calls made.
    std::size_t forwardInbound(const protocol::Message& msg);

    /// Send @p msg to @p serverId (the envelope's serverId is overwritten).
    /// @return ServerNotFound, ServerNotConnected or the session's send error.
    foundation::GatewayResult<void> routeOutbound(const std::string& serverId,
                                                  protocol::Message msg,
                                                  DeliveryMode mode);

    /// Report a server online/offline transition to the sink, including the
    /// targets that opted into state announcements.
    void announceServerState(const std::string& serverId, bool online);

    [[nodiscard]] RouterStats stats() const;

private:
    SessionRegistry& registry_;
    ForwardTable& table_;
    ChatPlatformSink& sink_;

    std::atomic<uint64_t> deliveries_{0};
    std::atomic<uint64_t> suppressed_{0};
    std::atomic<uint64_t> outboundSent_{0};
    std::atomic<uint64_t> outboundFailed_{0};
};

} // namespace gcb::service
