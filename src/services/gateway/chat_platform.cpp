/// @file chat_platform.cpp
/// @brief LoggingChatPlatformSink implementation.

#include "gcb/service/chat_platform.hpp"

#include "gcb/foundation/gateway_logger.hpp"

namespace gcb::service {

using gcb::foundation::LogCategory;
using gcb::foundation::LogContext;
using gcb::foundation::LogLevel;

void LoggingChatPlatformSink::deliver(const ForwardTarget& target, const protocol::Message& msg) {
    LogContext ctx;
    ctx.serverId = msg.serverId;
    ctx.extra["target"] = target.toString();
    ctx.extra["type"] = std::string(protocol::messageTypeName(msg.type()));
    if (const auto* chat = msg.as<protocol::ChatPayload>()) {
        ctx.extra["content"] = chat->content;
    }
    GCB_LOG_CTX(LogLevel::Info, LogCategory::Routing, "deliver", ctx);
}

void LoggingChatPlatformSink::notifyBindingCode(const BindingNotification& notification) {
    // The code itself stays out of the log.
    LogContext ctx;
    ctx.serverId = notification.serverId;
    ctx.extra["player_uuid"] = notification.playerUuid;
    GCB_LOG_CTX(LogLevel::Info, LogCategory::Binding, "binding code issued", ctx);
}

void LoggingChatPlatformSink::notifyBindingOutcome(const BindingOutcome& outcome) {
    LogContext ctx;
    ctx.serverId = outcome.serverId;
    ctx.extra["player_uuid"] = outcome.playerUuid;
    ctx.extra["success"] = outcome.success ? "true" : "false";
    GCB_LOG_CTX(LogLevel::Info, LogCategory::Binding, "binding outcome", ctx);
}

void LoggingChatPlatformSink::notifyServerState(const std::string& serverId, bool online,
                                                const std::vector<ForwardTarget>& targets) {
    LogContext ctx;
    ctx.serverId = serverId;
    ctx.extra["targets"] = std::to_string(targets.size());
    GCB_LOG_CTX(LogLevel::Info, LogCategory::Routing,
                online ? "server online" : "server offline", ctx);
}

} // namespace gcb::service
