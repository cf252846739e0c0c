/// @file router.cpp
/// @brief Router implementation.

#include "gcb/service/router.hpp"

#include "gcb/foundation/gateway_logger.hpp"

#include <vector>

namespace gcb::service {

using gcb::foundation::GatewayResult;
using gcb::foundation::LogCategory;
using gcb::foundation::LogContext;
using gcb::foundation::LogLevel;
using gcb::protocol::MessageType;

namespace {

bool ruleAllows(const ForwardRule& rule, MessageType type) {
    switch (type) {
        case MessageType::Chat:          return rule.forwardChat;
        case MessageType::PlayerEvent:   return rule.forwardPlayerEvents;
        case MessageType::CommandResult: return rule.forwardCommandResults;
        default:                         return false;
    }
}

} // namespace

Router::Router(SessionRegistry& registry, ForwardTable& table, ChatPlatformSink& sink)
    : registry_(registry), table_(table), sink_(sink) {}

std::size_t Router::forwardInbound(const protocol::Message& msg) {
    auto rule = table_.ruleFor(msg.serverId);
    if (rule.targets.empty() || !ruleAllows(rule, msg.type())) {
        suppressed_.fetch_add(1, std::memory_order_relaxed);
        return 0;
    }

    std::size_t count = 0;
    for (const auto& target : rule.targets) {
        sink_.deliver(target, msg);
        ++count;
    }
    deliveries_.fetch_add(count, std::memory_order_relaxed);

    if (foundation::GatewayLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Routing)) {
        LogContext ctx;
        ctx.serverId = msg.serverId;
        ctx.extra["type"] = std::string(protocol::messageTypeName(msg.type()));
        ctx.extra["targets"] = std::to_string(count);
        GCB_LOG_CTX(LogLevel::Debug, LogCategory::Routing, "forwarded inbound message", ctx);
    }
    return count;
}

GatewayResult<void> Router::routeOutbound(const std::string& serverId,
                                          protocol::Message msg,
                                          DeliveryMode mode) {
    auto session = registry_.lookup(serverId);
    if (!session) {
        outboundFailed_.fetch_add(1, std::memory_order_relaxed);
        return GatewayResult<void>::err(std::move(session).error());
    }

    msg.serverId = serverId;
    auto sent = session.value()->send(msg, mode);
    if (!sent) {
        outboundFailed_.fetch_add(1, std::memory_order_relaxed);
        LogContext ctx;
        ctx.serverId = serverId;
        ctx.correlationId = msg.correlationId;
        GCB_LOG_CTX(LogLevel::Debug, LogCategory::Routing,
                    "outbound routing failed: " + sent.error().describe(), ctx);
        return sent;
    }
    outboundSent_.fetch_add(1, std::memory_order_relaxed);
    return sent;
}

void Router::announceServerState(const std::string& serverId, bool online) {
    auto rule = table_.ruleFor(serverId);
    std::vector<ForwardTarget> targets;
    if (rule.forwardServerState) {
        targets.assign(rule.targets.begin(), rule.targets.end());
    }
    sink_.notifyServerState(serverId, online, targets);
}

RouterStats Router::stats() const {
    RouterStats s;
    s.deliveries = deliveries_.load(std::memory_order_relaxed);
    s.suppressed = suppressed_.load(std::memory_order_relaxed);
    s.outboundSent = outboundSent_.load(std::memory_order_relaxed);
    s.outboundFailed = outboundFailed_.load(std::memory_order_relaxed);
    return s;
}

} // namespace gcb::service
