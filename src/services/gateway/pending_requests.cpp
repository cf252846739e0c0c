/// @file pending_requests.cpp
/// @brief PendingRequests implementation.

#include "gcb/service/pending_requests.hpp"

#include "gcb/foundation/correlation_id.hpp"
#include "gcb/foundation/gateway_logger.hpp"

#include <vector>

namespace gcb::service {

using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::LogCategory;
using gcb::foundation::LogContext;
using gcb::foundation::LogLevel;

PendingRequests::~PendingRequests() {
    std::lock_guard lock(mutex_);
    for (auto& [id, waiter] : waiters_) {
        waiter.promise.set_value(Reply::err(
            GatewayError(ErrorCode::InvalidState, "gateway shutting down")));
    }
    waiters_.clear();
}

PendingRequests::Ticket PendingRequests::open(const std::string& serverId,
                                              Clock::time_point deadline) {
    Ticket ticket;
    std::lock_guard lock(mutex_);
    // Collisions are practically impossible, but a live id must never be reused.
    do {
        ticket.correlationId = foundation::generateCorrelationId();
    } while (waiters_.count(ticket.correlationId) != 0);

    Waiter waiter;
    waiter.serverId = serverId;
    waiter.deadline = deadline;
    ticket.reply = waiter.promise.get_future();
    waiters_.emplace(ticket.correlationId, std::move(waiter));
    return ticket;
}

bool PendingRequests::fulfill(const protocol::Message& msg) {
    if (!msg.correlationId) {
        return false;
    }

    std::unique_lock lock(mutex_);
    auto it = waiters_.find(*msg.correlationId);
    if (it == waiters_.end() || it->second.serverId != msg.serverId) {
        lock.unlock();
        LogContext ctx;
        ctx.serverId = msg.serverId;
        ctx.correlationId = msg.correlationId;
        GCB_LOG_CTX(LogLevel::Debug, LogCategory::Query,
                    "discarding unmatched response", ctx);
        return false;
    }
    auto promise = std::move(it->second.promise);
    waiters_.erase(it);
    lock.unlock();

    promise.set_value(Reply::ok(msg));
    return true;
}

bool PendingRequests::fail(std::string_view correlationId, GatewayError error) {
    std::unique_lock lock(mutex_);
    auto it = waiters_.find(std::string(correlationId));
    if (it == waiters_.end()) {
        return false;
    }
    auto promise = std::move(it->second.promise);
    waiters_.erase(it);
    lock.unlock();

    promise.set_value(Reply::err(std::move(error)));
    return true;
}

bool PendingRequests::cancel(std::string_view correlationId) {
    return fail(correlationId, GatewayError(ErrorCode::QueryTimeout, "request abandoned"));
}

std::size_t PendingRequests::sweepExpired(Clock::time_point now) {
    std::vector<std::promise<Reply>> expired;
    {
        std::lock_guard lock(mutex_);
        for (auto it = waiters_.begin(); it != waiters_.end();) {
            if (it->second.deadline <= now) {
                expired.push_back(std::move(it->second.promise));
                it = waiters_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& promise : expired) {
        promise.set_value(Reply::err(
            GatewayError(ErrorCode::QueryTimeout, "no response before deadline")));
    }
    return expired.size();
}

std::size_t PendingRequests::size() const {
    std::lock_guard lock(mutex_);
    return waiters_.size();
}

} // namespace gcb::service
