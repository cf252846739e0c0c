#pragma once

/// @file pending_requests.hpp
/// @brief Correlation table pairing outstanding requests with their responses.

#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/protocol/message.hpp"
#include "gcb/service/gateway_types.hpp"

namespace gcb::service {

/// Waiters keyed by correlation id.
///
/// Every registration is completed exactly once: by fulfill(), by cancel()
/// or sweepExpired() with QueryTimeout, or by the destructor. A waiter's
/// future therefore never sees a broken promise.
class PendingRequests {
public:
    using Reply = foundation::GatewayResult<protocol::Message>;

    struct Ticket {
        std::string correlationId;
        std::future<Reply> reply;
    };

    PendingRequests() = default;
    ~PendingRequests();

    PendingRequests(const PendingRequests&) = delete;
    PendingRequests& operator=(const PendingRequests&) = delete;

    /// Register a waiter for a request to @p serverId with a fresh id.
    Ticket open(const std::string& serverId, Clock::time_point deadline);

    /// Complete the waiter matching @p msg's correlation id.
    /// @return false when the id is unknown or was registered for a
    ///         different server; the response is then discarded.
    bool fulfill(const protocol::Message& msg);

    /// Complete the waiter with @p error.
    bool fail(std::string_view correlationId, foundation::GatewayError error);

    /// Drop an abandoned waiter (completing it with QueryTimeout).
    /// @return false when the waiter was already completed.
    bool cancel(std::string_view correlationId);

    /// Complete every waiter whose deadline is at or before @p now.
    std::size_t sweepExpired(Clock::time_point now);

    [[nodiscard]] std::size_t size() const;

private:
    struct Waiter {
        std::string serverId;
        Clock::time_point deadline;
        std::promise<Reply> promise;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Waiter> waiters_;
};

} // namespace gcb::service
