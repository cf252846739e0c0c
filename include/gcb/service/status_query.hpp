#pragma once

/// @file status_query.hpp
/// @brief Request/response status and player queries over the session,
///        with an optional HTTP fallback.

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/protocol/message.hpp"
#include "gcb/service/gateway_types.hpp"
#include "gcb/service/pending_requests.hpp"
#include "gcb/service/router.hpp"
#include "gcb/service/session_registry.hpp"

namespace gcb::service {

/// Secondary read path used when a server's session is not CONNECTED.
class StatusFallback {
public:
    virtual ~StatusFallback() = default;

    /// True when an endpoint is configured for @p serverId.
    [[nodiscard]] virtual bool hasEndpoint(const std::string& serverId) const = 0;

    virtual foundation::GatewayResult<protocol::StatusSnapshot> fetchStatus(
        const std::string& serverId) = 0;

    virtual foundation::GatewayResult<protocol::PlayerList> fetchPlayers(
        const std::string& serverId) = 0;
};

/// Most recent status seen for a server, solicited or pushed.
struct CachedStatus {
    protocol::StatusSnapshot snapshot;
    std::chrono::system_clock::time_point receivedAt;
};

/// Blocking query facade used by the command path.
///
/// Each call registers its own correlation id, so concurrent queries for
/// the same server never receive each other's responses. A query that
/// times out removes its registration before returning.
class StatusQueryFacade {
public:
    StatusQueryFacade(SessionRegistry& registry, Router& router, PendingRequests& pending,
                      std::chrono::milliseconds timeout, StatusFallback* fallback = nullptr);

    StatusQueryFacade(const StatusQueryFacade&) = delete;
    StatusQueryFacade& operator=(const StatusQueryFacade&) = delete;

    /// @return ServerNotFound, ServerNotConnected, QueryTimeout, QueryRejected
    ///         (server answered with ERROR) or an HTTP fallback error.
    foundation::GatewayResult<protocol::StatusSnapshot> queryStatus(const std::string& serverId);

    foundation::GatewayResult<protocol::PlayerList> queryPlayers(const std::string& serverId);

    /// Feed an inbound STATUS_RESPONSE or ERROR frame.
    /// @return true when the frame completed a waiter or refreshed the cache.
    bool handleResponse(const protocol::Message& msg);

    [[nodiscard]] std::optional<CachedStatus> lastKnownStatus(const std::string& serverId) const;

    /// Send an uncorrelated STATUS_REQUEST to every CONNECTED server.
    /// @return Number of requests sent.
    std::size_t pollAll();

    [[nodiscard]] bool hasFallback(const std::string& serverId) const;

private:
    foundation::GatewayResult<protocol::StatusResponsePayload> roundTrip(
        const std::string& serverId, protocol::StatusScope scope);

    void remember(const std::string& serverId, const protocol::StatusSnapshot& snapshot);

    SessionRegistry& registry_;
    Router& router_;
    PendingRequests& pending_;
    std::chrono::milliseconds timeout_;
    StatusFallback* fallback_;

    mutable std::mutex cacheMutex_;
    std::unordered_map<std::string, CachedStatus> cache_;
};

} // namespace gcb::service
