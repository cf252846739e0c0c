/// @file binding_coordinator.cpp
/// @brief BindingCoordinator implementation.

#include "gcb/service/binding_coordinator.hpp"

#include "gcb/foundation/correlation_id.hpp"
#include "gcb/foundation/gateway_logger.hpp"
#include "gcb/service/credentials.hpp"

#include <vector>

namespace gcb::service {

using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;
using gcb::foundation::LogCategory;
using gcb::foundation::LogContext;
using gcb::foundation::LogLevel;

namespace {

constexpr int kMaxCodeAttempts = 32;

} // namespace

struct BindingCoordinator::Entry {
    std::string code;
    std::string serverId;
    std::string playerUuid;
    std::string playerName;
    SystemClock::time_point issuedAt;
    SystemClock::time_point expiresAt;
    bool force = false;

    std::atomic<BindingStatus> status{BindingStatus::Pending};
    /// Epoch ticks of the transition out of PENDING; 0 while pending.
    std::atomic<SystemClock::rep> settledAt{0};

    // Written once by the confirm() winner.
    mutable std::mutex infoMutex;
    std::string platform;
    std::string accountId;

    void settle(SystemClock::time_point now) {
        settledAt.store(now.time_since_epoch().count(), std::memory_order_release);
    }
};

namespace {

/// Error for a request that already left PENDING with @p observed.
GatewayError settledError(BindingStatus observed) {
    switch (observed) {
        case BindingStatus::Confirmed:
            return GatewayError(ErrorCode::AlreadyConfirmed, "code was already confirmed");
        case BindingStatus::Expired:
            return GatewayError(ErrorCode::CodeExpired, "code has expired");
        case BindingStatus::Cancelled:
            return GatewayError(ErrorCode::CodeNotFound, "code was cancelled");
        case BindingStatus::Pending:
            break;
    }
    return GatewayError(ErrorCode::InvalidState, "code is still pending");
}

} // namespace

BindingCoordinator::BindingCoordinator(BindingConfig config, Router& router,
                                       ChatPlatformSink& sink, NowFn now)
    : config_(config), router_(router), sink_(sink), now_(std::move(now)) {}

BindingCoordinator::~BindingCoordinator() = default;

// ---------------------------------------------------------------------------
// Issue
// ---------------------------------------------------------------------------

GatewayResult<std::string> BindingCoordinator::issue(const std::string& serverId,
                                                     const std::string& playerUuid,
                                                     const std::string& playerName,
                                                     bool force) {
    if (playerUuid.empty()) {
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::InvalidArgument, "player uuid is required"));
    }

    std::shared_ptr<Entry> entry;
    for (int attempt = 0; attempt < kMaxCodeAttempts && !entry; ++attempt) {
        auto code = generateNumericCode(config_.codeLength);
        if (!code) {
            return GatewayResult<std::string>::err(std::move(code).error());
        }

        std::unique_lock lock(mutex_);
        if (requests_.count(code.value()) != 0) {
            // Retained until swept, whatever its status.
            continue;
        }

        auto now = now_();
        entry = std::make_shared<Entry>();
        entry->code = code.value();
        entry->serverId = serverId;
        entry->playerUuid = playerUuid;
        entry->playerName = playerName;
        entry->issuedAt = now;
        entry->expiresAt = now + config_.ttl;
        entry->force = force;
        requests_.emplace(entry->code, entry);
    }

    if (!entry) {
        GCB_LOG_WARN(LogCategory::Binding, "no free binding code after repeated attempts");
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::CodeSpaceExhausted, "no free binding code"));
    }

    notifyIssued(*entry);
    return GatewayResult<std::string>::ok(entry->code);
}

GatewayResult<std::string> BindingCoordinator::registerIssued(
    const std::string& serverId, const std::string& code,
    const std::string& playerUuid, const std::string& playerName,
    std::optional<SystemClock::time_point> expiresAt, bool force) {
    if (code.empty() || playerUuid.empty()) {
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::InvalidArgument, "code and player uuid are required"));
    }

    std::shared_ptr<Entry> entry;
    {
        std::unique_lock lock(mutex_);
        auto it = requests_.find(code);
        // Only an expired request may be replaced; a confirmed or cancelled
        // one keeps its code until the sweep evicts it.
        if (it != requests_.end() &&
            it->second->status.load(std::memory_order_acquire) != BindingStatus::Expired) {
            const auto& existing = *it->second;
            if (existing.serverId == serverId && existing.playerUuid == playerUuid) {
                return GatewayResult<std::string>::ok(code);
            }
            lock.unlock();
            LogContext ctx;
            ctx.serverId = serverId;
            ctx.extra["player_uuid"] = playerUuid;
            GCB_LOG_CTX(LogLevel::Warning, LogCategory::Binding,
                        "binding code collides with a retained request", ctx);
            return GatewayResult<std::string>::err(
                GatewayError(ErrorCode::CodeCollision, "binding code is already in use"));
        }

        auto now = now_();
        entry = std::make_shared<Entry>();
        entry->code = code;
        entry->serverId = serverId;
        entry->playerUuid = playerUuid;
        entry->playerName = playerName;
        entry->issuedAt = now;
        entry->expiresAt = expiresAt.value_or(now + config_.ttl);
        entry->force = force;
        requests_[code] = entry;
    }

    notifyIssued(*entry);
    return GatewayResult<std::string>::ok(code);
}

void BindingCoordinator::notifyIssued(const Entry& entry) {
    BindingNotification note;
    note.serverId = entry.serverId;
    note.code = entry.code;
    note.playerUuid = entry.playerUuid;
    note.playerName = entry.playerName;
    note.issuedAt = entry.issuedAt;
    note.expiresAt = entry.expiresAt;
    note.force = entry.force;
    sink_.notifyBindingCode(note);

    LogContext ctx;
    ctx.serverId = entry.serverId;
    ctx.extra["player_uuid"] = entry.playerUuid;
    GCB_LOG_CTX(LogLevel::Info, LogCategory::Binding, "binding code pending", ctx);
}

// ---------------------------------------------------------------------------
// Confirm / cancel / acknowledge
// ---------------------------------------------------------------------------

GatewayResult<BoundAck> BindingCoordinator::confirm(std::string_view code,
                                                    const std::string& platform,
                                                    const std::string& accountId) {
    std::shared_ptr<Entry> entry;
    {
        std::shared_lock lock(mutex_);
        auto it = requests_.find(std::string(code));
        if (it != requests_.end()) {
            entry = it->second;
        }
    }
    if (!entry) {
        return GatewayResult<BoundAck>::err(
            GatewayError(ErrorCode::CodeNotFound, "unknown binding code"));
    }

    auto now = now_();
    auto expected = BindingStatus::Pending;
    if (now >= entry->expiresAt) {
        if (entry->status.compare_exchange_strong(expected, BindingStatus::Expired,
                                                  std::memory_order_acq_rel)) {
            entry->settle(now);
            return GatewayResult<BoundAck>::err(
                GatewayError(ErrorCode::CodeExpired, "code has expired"));
        }
        return GatewayResult<BoundAck>::err(settledError(expected));
    }
    if (!entry->status.compare_exchange_strong(expected, BindingStatus::Confirmed,
                                               std::memory_order_acq_rel)) {
        return GatewayResult<BoundAck>::err(settledError(expected));
    }

    // Sole winner from here on.
    {
        std::lock_guard info(entry->infoMutex);
        entry->platform = platform;
        entry->accountId = accountId;
    }
    entry->settle(now);

    protocol::BindConfirmPayload payload;
    payload.code = entry->code;
    payload.platform = platform;
    payload.accountId = accountId;
    payload.playerUuid = entry->playerUuid;

    BoundAck ack;
    ack.code = entry->code;
    ack.serverId = entry->serverId;
    ack.playerUuid = entry->playerUuid;
    dispatchConfirm(entry->serverId,
                    protocol::Message::make(entry->serverId, std::move(payload),
                                            foundation::generateCorrelationId()),
                    ack);

    LogContext ctx;
    ctx.serverId = entry->serverId;
    ctx.extra["player_uuid"] = entry->playerUuid;
    ctx.extra["platform"] = platform;
    GCB_LOG_CTX(LogLevel::Info, LogCategory::Binding,
                ack.dispatched ? "binding confirmed" : "binding confirmed, server offline", ctx);
    return GatewayResult<BoundAck>::ok(std::move(ack));
}

void BindingCoordinator::dispatchConfirm(const std::string& serverId, protocol::Message msg,
                                         BoundAck& ack) {
    auto routed = router_.routeOutbound(serverId, msg, DeliveryMode::Queued);
    if (routed) {
        ack.dispatched = true;
        return;
    }

    auto code = routed.error().code();
    if (code != ErrorCode::ServerNotFound && code != ErrorCode::ServerNotConnected) {
        GCB_LOG_ERROR(LogCategory::Binding,
                      "BIND_CONFIRM could not be sent: " + routed.error().describe());
        return;
    }

    std::lock_guard lock(outboxMutex_);
    auto& box = outbox_[serverId];
    box.push_back(std::move(msg));
    if (box.size() > config_.outboxCapacity) {
        box.pop_front();
        GCB_LOG_WARN(LogCategory::Binding,
                     "binding outbox full for " + serverId + ", dropped oldest confirmation");
    }
}

GatewayResult<void> BindingCoordinator::cancel(std::string_view code) {
    std::shared_ptr<Entry> entry;
    {
        std::shared_lock lock(mutex_);
        auto it = requests_.find(std::string(code));
        if (it != requests_.end()) {
            entry = it->second;
        }
    }
    if (!entry) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::CodeNotFound, "unknown binding code"));
    }

    auto expected = BindingStatus::Pending;
    if (!entry->status.compare_exchange_strong(expected, BindingStatus::Cancelled,
                                               std::memory_order_acq_rel)) {
        return GatewayResult<void>::err(settledError(expected));
    }
    entry->settle(now_());
    return GatewayResult<void>::ok();
}

bool BindingCoordinator::acknowledge(const std::string& serverId,
                                     const protocol::BindResultPayload& result) {
    std::shared_ptr<Entry> entry;
    {
        std::unique_lock lock(mutex_);
        auto it = requests_.find(result.code);
        if (it == requests_.end() || it->second->serverId != serverId) {
            return false;
        }
        entry = std::move(it->second);
        requests_.erase(it);
    }

    BindingOutcome outcome;
    outcome.serverId = serverId;
    outcome.code = entry->code;
    outcome.playerUuid = entry->playerUuid;
    {
        std::lock_guard info(entry->infoMutex);
        outcome.platform = entry->platform;
        outcome.accountId = entry->accountId;
    }
    outcome.success = result.success;
    outcome.message = result.message.value_or(std::string{});
    sink_.notifyBindingOutcome(outcome);
    return true;
}

// ---------------------------------------------------------------------------
// Outbox / sweep
// ---------------------------------------------------------------------------

std::size_t BindingCoordinator::onServerOnline(const std::string& serverId) {
    std::deque<protocol::Message> pending;
    {
        std::lock_guard lock(outboxMutex_);
        auto it = outbox_.find(serverId);
        if (it == outbox_.end()) {
            return 0;
        }
        pending = std::move(it->second);
        outbox_.erase(it);
    }

    std::size_t sent = 0;
    while (!pending.empty()) {
        auto routed = router_.routeOutbound(serverId, pending.front(), DeliveryMode::Queued);
        if (!routed) {
            break;
        }
        pending.pop_front();
        ++sent;
    }

    if (!pending.empty()) {
        // Went offline again mid-flush; keep the rest ahead of anything newer.
        std::lock_guard lock(outboxMutex_);
        auto& box = outbox_[serverId];
        for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
            box.push_front(std::move(*it));
        }
        while (box.size() > config_.outboxCapacity) {
            box.pop_front();
        }
    }

    if (sent > 0) {
        GCB_LOG_INFO(LogCategory::Binding,
                     "flushed " + std::to_string(sent) + " held confirmation(s) to " + serverId);
    }
    return sent;
}

std::size_t BindingCoordinator::sweep() {
    auto now = now_();
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.reserve(requests_.size());
        for (const auto& [code, entry] : requests_) {
            snapshot.push_back(entry);
        }
    }

    std::size_t expired = 0;
    for (const auto& entry : snapshot) {
        if (now < entry->expiresAt) {
            continue;
        }
        auto expected = BindingStatus::Pending;
        if (entry->status.compare_exchange_strong(expected, BindingStatus::Expired,
                                                  std::memory_order_acq_rel)) {
            entry->settle(now);
            ++expired;
            LogContext ctx;
            ctx.serverId = entry->serverId;
            ctx.extra["player_uuid"] = entry->playerUuid;
            GCB_LOG_CTX(LogLevel::Debug, LogCategory::Binding, "binding code expired", ctx);
        }
    }

    auto cutoff = (now - config_.settledRetention).time_since_epoch().count();
    std::unique_lock lock(mutex_);
    for (auto it = requests_.begin(); it != requests_.end();) {
        auto settled = it->second->settledAt.load(std::memory_order_acquire);
        if (settled != 0 && settled <= cutoff) {
            it = requests_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<BindingStatus> BindingCoordinator::status(std::string_view code) const {
    std::shared_lock lock(mutex_);
    auto it = requests_.find(std::string(code));
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second->status.load(std::memory_order_acquire);
}

std::size_t BindingCoordinator::pendingCount() const {
    std::shared_lock lock(mutex_);
    std::size_t count = 0;
    for (const auto& [code, entry] : requests_) {
        if (entry->status.load(std::memory_order_acquire) == BindingStatus::Pending) {
            ++count;
        }
    }
    return count;
}

std::size_t BindingCoordinator::outboxSize(const std::string& serverId) const {
    std::lock_guard lock(outboxMutex_);
    auto it = outbox_.find(serverId);
    return it == outbox_.end() ? 0 : it->second.size();
}

} // namespace gcb::service
