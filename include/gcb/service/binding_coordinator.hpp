#pragma once

/// @file binding_coordinator.hpp
/// @brief Account-binding handshake: short-lived codes confirmed at most once.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/protocol/message.hpp"
#include "gcb/service/chat_platform.hpp"
#include "gcb/service/router.hpp"

namespace gcb::service {

/// Lifecycle of one binding code.
enum class BindingStatus : uint8_t { Pending, Confirmed, Expired, Cancelled };

constexpr std::string_view bindingStatusName(BindingStatus status) {
    switch (status) {
        case BindingStatus::Pending:   return "PENDING";
        case BindingStatus::Confirmed: return "CONFIRMED";
        case BindingStatus::Expired:   return "EXPIRED";
        case BindingStatus::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

struct BindingConfig {
    /// Digits per generated code.
    std::size_t codeLength = 6;
    std::chrono::seconds ttl{300};
    /// How long settled requests linger before eviction.
    std::chrono::seconds settledRetention{60};
    /// BIND_CONFIRM messages kept per offline server.
    std::size_t outboxCapacity = 32;
};

/// Returned by a successful confirm().
struct BoundAck {
    std::string code;
    std::string serverId;
    std::string playerUuid;
    /// false when BIND_CONFIRM went to the offline outbox instead of a session.
    bool dispatched = false;
};

/// Owns every BindingRequest, independently of Session lifetime.
///
/// Each request's status is a std::atomic and every transition out of
/// PENDING is a compare-exchange, so concurrent confirm() calls for one
/// code produce exactly one winner without holding the table lock.
///
/// @code
///   BindingCoordinator binding(cfg, router, sink);
///   auto code = binding.issue("Survival", playerUuid, "Steve");
///   ...
///   auto ack = binding.confirm(code.value(), "kook", "U123");
///   if (!ack) reply(ack.error().describe());
/// @endcode
class BindingCoordinator {
public:
    using SystemClock = std::chrono::system_clock;
    using NowFn = std::function<SystemClock::time_point()>;

    BindingCoordinator(BindingConfig config, Router& router, ChatPlatformSink& sink,
                       NowFn now = &SystemClock::now);
    ~BindingCoordinator();

    BindingCoordinator(const BindingCoordinator&) = delete;
    BindingCoordinator& operator=(const BindingCoordinator&) = delete;

    /// Generate a fresh code unique among all retained codes and notify the
    /// sink privately.
    /// @return CodeSpaceExhausted or RandomSourceFailed.
    foundation::GatewayResult<std::string> issue(const std::string& serverId,
                                                 const std::string& playerUuid,
                                                 const std::string& playerName = {},
                                                 bool force = false);

    /// Adopt a code the game server generated itself. Redelivery for the
    /// same server and player is idempotent, including after the code was
    /// confirmed; only an EXPIRED request is ever replaced.
    /// @return InvalidArgument for an empty code, or CodeCollision.
    foundation::GatewayResult<std::string> registerIssued(
        const std::string& serverId, const std::string& code,
        const std::string& playerUuid, const std::string& playerName,
        std::optional<SystemClock::time_point> expiresAt, bool force);

    /// PENDING -> CONFIRMED, then BIND_CONFIRM to the originating server.
    /// @return CodeNotFound, CodeExpired or AlreadyConfirmed.
    foundation::GatewayResult<BoundAck> confirm(std::string_view code,
                                                const std::string& platform,
                                                const std::string& accountId);

    /// PENDING -> CANCELLED.
    foundation::GatewayResult<void> cancel(std::string_view code);

    /// BIND_RESULT from @p serverId: evict the request and report the outcome.
    /// @return false when no request from @p serverId matches.
    bool acknowledge(const std::string& serverId, const protocol::BindResultPayload& result);

    /// Flush BIND_CONFIRM messages held while @p serverId was offline.
    std::size_t onServerOnline(const std::string& serverId);

    /// Expire overdue PENDING requests and evict settled ones.
    /// @return Number of requests that expired in this pass.
    std::size_t sweep();

    [[nodiscard]] std::optional<BindingStatus> status(std::string_view code) const;
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] std::size_t outboxSize(const std::string& serverId) const;

private:
    struct Entry;

    void notifyIssued(const Entry& entry);
    void dispatchConfirm(const std::string& serverId, protocol::Message msg, BoundAck& ack);

    BindingConfig config_;
    Router& router_;
    ChatPlatformSink& sink_;
    NowFn now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> requests_;

    mutable std::mutex outboxMutex_;
    std::unordered_map<std::string, std::deque<protocol::Message>> outbox_;
};

} // namespace gcb::service
