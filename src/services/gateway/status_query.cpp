/// @file status_query.cpp
/// @brief StatusQueryFacade implementation.

#include "gcb/service/status_query.hpp"

#include "gcb/foundation/gateway_logger.hpp"

#include <future>

namespace gcb::service {

using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;
using gcb::foundation::LogCategory;
using gcb::foundation::LogContext;
using gcb::foundation::LogLevel;
using gcb::protocol::StatusScope;

namespace {

/// Ok when @p serverId has a CONNECTED session.
GatewayResult<void> requireConnected(const SessionRegistry& registry,
                                     const std::string& serverId) {
    auto session = registry.lookup(serverId);
    if (!session) {
        return GatewayResult<void>::err(std::move(session).error());
    }
    if (session.value()->state() != SessionState::Connected) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ServerNotConnected,
                         "server '" + serverId + "' is "
                             + std::string(sessionStateName(session.value()->state()))));
    }
    return GatewayResult<void>::ok();
}

} // namespace

StatusQueryFacade::StatusQueryFacade(SessionRegistry& registry, Router& router,
                                     PendingRequests& pending,
                                     std::chrono::milliseconds timeout,
                                     StatusFallback* fallback)
    : registry_(registry), router_(router), pending_(pending),
      timeout_(timeout), fallback_(fallback) {}

bool StatusQueryFacade::hasFallback(const std::string& serverId) const {
    return fallback_ != nullptr && fallback_->hasEndpoint(serverId);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

GatewayResult<protocol::StatusSnapshot> StatusQueryFacade::queryStatus(
    const std::string& serverId) {
    using R = GatewayResult<protocol::StatusSnapshot>;

    auto connected = requireConnected(registry_, serverId);
    if (!connected) {
        if (!hasFallback(serverId)) {
            return R::err(std::move(connected).error());
        }
        GCB_LOG_DEBUG(LogCategory::Query, "status via HTTP fallback for " + serverId);
        auto fetched = fallback_->fetchStatus(serverId);
        if (fetched) {
            remember(serverId, fetched.value());
        }
        return fetched;
    }

    auto response = roundTrip(serverId, StatusScope::Status);
    if (!response) {
        return R::err(std::move(response).error());
    }
    if (!response.value().status) {
        return R::err(GatewayError(ErrorCode::MalformedMessage,
                                   "status response carried no status"));
    }
    return R::ok(*response.value().status);
}

GatewayResult<protocol::PlayerList> StatusQueryFacade::queryPlayers(
    const std::string& serverId) {
    using R = GatewayResult<protocol::PlayerList>;

    auto connected = requireConnected(registry_, serverId);
    if (!connected) {
        if (!hasFallback(serverId)) {
            return R::err(std::move(connected).error());
        }
        GCB_LOG_DEBUG(LogCategory::Query, "players via HTTP fallback for " + serverId);
        return fallback_->fetchPlayers(serverId);
    }

    auto response = roundTrip(serverId, StatusScope::Players);
    if (!response) {
        return R::err(std::move(response).error());
    }
    if (!response.value().players) {
        return R::err(GatewayError(ErrorCode::MalformedMessage,
                                   "players response carried no player list"));
    }
    return R::ok(*response.value().players);
}

GatewayResult<protocol::StatusResponsePayload> StatusQueryFacade::roundTrip(
    const std::string& serverId, StatusScope scope) {
    using R = GatewayResult<protocol::StatusResponsePayload>;

    auto ticket = pending_.open(serverId, Clock::now() + timeout_);
    LogContext ctx;
    ctx.serverId = serverId;
    ctx.correlationId = ticket.correlationId;

    auto sent = router_.routeOutbound(
        serverId,
        protocol::Message::make(serverId, protocol::StatusRequestPayload{scope},
                                ticket.correlationId),
        DeliveryMode::Immediate);
    if (!sent) {
        pending_.cancel(ticket.correlationId);
        return R::err(std::move(sent).error());
    }
    GCB_LOG_CTX(LogLevel::Debug, LogCategory::Query, "status request sent", ctx);

    if (ticket.reply.wait_for(timeout_) != std::future_status::ready) {
        // Completes the waiter with QueryTimeout unless a response won the race.
        pending_.cancel(ticket.correlationId);
    }
    auto reply = ticket.reply.get();
    if (!reply) {
        GCB_LOG_CTX(LogLevel::Info, LogCategory::Query,
                    "status request failed: " + reply.error().describe(), ctx);
        return R::err(std::move(reply).error());
    }

    const auto& msg = reply.value();
    if (const auto* error = msg.as<protocol::ErrorPayload>()) {
        return R::err(GatewayError(ErrorCode::QueryRejected,
                                   error->code + ": " + error->message));
    }
    const auto* payload = msg.as<protocol::StatusResponsePayload>();
    if (payload == nullptr || payload->scope != scope) {
        return R::err(GatewayError(ErrorCode::UnexpectedMessage,
                                   "response does not match the request scope"));
    }
    return R::ok(*payload);
}

// ---------------------------------------------------------------------------
// Inbound responses and cache
// ---------------------------------------------------------------------------

bool StatusQueryFacade::handleResponse(const protocol::Message& msg) {
    if (msg.type() == protocol::MessageType::Error) {
        return msg.correlationId && pending_.fulfill(msg);
    }

    const auto* payload = msg.as<protocol::StatusResponsePayload>();
    if (payload == nullptr) {
        return false;
    }

    if (msg.correlationId) {
        if (!pending_.fulfill(msg)) {
            return false;
        }
        if (payload->status) {
            remember(msg.serverId, *payload->status);
        }
        return true;
    }

    // Uncorrelated: a push or the answer to a poll.
    if (!payload->status) {
        return false;
    }
    remember(msg.serverId, *payload->status);
    return true;
}

void StatusQueryFacade::remember(const std::string& serverId,
                                 const protocol::StatusSnapshot& snapshot) {
    std::lock_guard lock(cacheMutex_);
    cache_[serverId] = CachedStatus{snapshot, std::chrono::system_clock::now()};
}

std::optional<CachedStatus> StatusQueryFacade::lastKnownStatus(const std::string& serverId) const {
    std::lock_guard lock(cacheMutex_);
    auto it = cache_.find(serverId);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t StatusQueryFacade::pollAll() {
    std::size_t sent = 0;
    for (const auto& summary : registry_.list()) {
        if (summary.state != SessionState::Connected) {
            continue;
        }
        auto routed = router_.routeOutbound(
            summary.serverId,
            protocol::Message::make(summary.serverId,
                                    protocol::StatusRequestPayload{StatusScope::Status}),
            DeliveryMode::Immediate);
        if (routed) {
            ++sent;
        }
    }
    return sent;
}

} // namespace gcb::service
