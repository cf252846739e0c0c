#pragma once

/// @file chat_platform.hpp
/// @brief Boundary to the chat platform: everything the gateway hands over.
///
/// The gateway never renders messages; it passes typed messages and events
/// to a ChatPlatformSink and the platform integration decides presentation.

#include <chrono>
#include <string>
#include <vector>

#include "gcb/protocol/message.hpp"
#include "gcb/service/forward_table.hpp"

namespace gcb::service {

/// Private notification for a freshly issued binding code.
struct BindingNotification {
    std::string serverId;
    std::string code;
    std::string playerUuid;
    std::string playerName;
    std::chrono::system_clock::time_point issuedAt;
    std::chrono::system_clock::time_point expiresAt;
    bool force = false;
};

/// Final result of a binding handshake, reported once per code.
struct BindingOutcome {
    std::string serverId;
    std::string code;
    std::string playerUuid;
    std::string platform;
    std::string accountId;
    bool success = false;
    std::string message;
};

/// Receiver of everything the gateway relays to the chat side.
///
/// Calls arrive on gateway worker and I/O threads; implementations must be
/// thread-safe and must not block for long.
class ChatPlatformSink {
public:
    virtual ~ChatPlatformSink() = default;

    /// Relay an inbound game message to one forward target.
    virtual void deliver(const ForwardTarget& target, const protocol::Message& msg) = 0;

    /// Hand a new binding code to the player's private channel.
    virtual void notifyBindingCode(const BindingNotification& notification) = 0;

    virtual void notifyBindingOutcome(const BindingOutcome& outcome) = 0;

    /// Server went online/offline. @p targets holds the forward targets
    /// that opted into state announcements (possibly none).
    virtual void notifyServerState(const std::string& serverId, bool online,
                                   const std::vector<ForwardTarget>& targets) = 0;
};

/// Sink that only writes log lines; used by the standalone executable,
/// where no chat platform is linked in.
class LoggingChatPlatformSink final : public ChatPlatformSink {
public:
    void deliver(const ForwardTarget& target, const protocol::Message& msg) override;
    void notifyBindingCode(const BindingNotification& notification) override;
    void notifyBindingOutcome(const BindingOutcome& outcome) override;
    void notifyServerState(const std::string& serverId, bool online,
                           const std::vector<ForwardTarget>& targets) override;
};

} // namespace gcb::service
