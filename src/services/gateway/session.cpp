/// @file session.cpp
/// @brief Session state machine implementation.

#include "gcb/service/session.hpp"

#include "gcb/foundation/gateway_logger.hpp"
#include "gcb/protocol/codec.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <mutex>
#include <tuple>
#include <utility>
#include <vector>

namespace gcb::service {

using gcb::foundation::CloseCode;
using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;
using gcb::foundation::LogCategory;
using gcb::foundation::LogContext;
using gcb::foundation::LogLevel;
using gcb::foundation::Transport;

std::chrono::milliseconds backoffDelay(const SessionPolicy& policy, uint32_t attempt) {
    const auto initial = std::max<int64_t>(policy.backoffInitial.count(), 0);
    const auto maximum = std::max<int64_t>(policy.backoffMax.count(), initial);
    if (attempt <= 1) {
        return std::chrono::milliseconds(initial);
    }
    double delay = static_cast<double>(initial)
                   * std::pow(policy.backoffMultiplier, static_cast<double>(attempt - 1));
    if (!std::isfinite(delay) || delay >= static_cast<double>(maximum)) {
        return std::chrono::milliseconds(maximum);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct Session::Impl {
    /// Side effects collected under the lock and applied after it is released.
    struct Effects {
        std::vector<std::pair<SessionState, SessionState>> transitions;
        std::vector<std::tuple<std::shared_ptr<Transport>, CloseCode, std::string>> closes;
    };

    std::string serverId;
    ConnectMode mode;
    SessionPolicy policy;

    mutable std::mutex mutex;
    SessionState state = SessionState::Connecting;
    /// State a failed attempt falls back to (CONNECTING or RECONNECTING).
    SessionState retryState = SessionState::Connecting;

    std::shared_ptr<Transport> transport;
    std::deque<std::string> queue;
    uint64_t dropped = 0;

    uint32_t attempts = 0;
    std::optional<Clock::time_point> nextAttemptAt;
    bool dialInFlight = false;

    Clock::time_point authDeadline{};
    Clock::time_point lastPingAt{};
    std::optional<Clock::time_point> awaitingPongSince;
    std::optional<Clock::time_point> lastSeen;

    Impl(std::string id, ConnectMode m, SessionPolicy p)
        : serverId(std::move(id)), mode(m), policy(p) {}

    void transition(SessionState to, Effects& fx) {
        if (state == to) {
            return;
        }
        fx.transitions.emplace_back(state, to);
        state = to;
    }

    void dropTransport(CloseCode code, std::string reason, Effects& fx) {
        if (transport) {
            fx.closes.emplace_back(std::move(transport), code, std::move(reason));
            transport.reset();
        }
        awaitingPongSince.reset();
    }

    void enqueue(std::string frame) {
        if (policy.queueCapacity == 0) {
            ++dropped;
            warnDropped();
            return;
        }
        while (queue.size() >= policy.queueCapacity) {
            queue.pop_front();
            ++dropped;
            warnDropped();
        }
        queue.push_back(std::move(frame));
    }

    void warnDropped() const {
        LogContext ctx;
        ctx.serverId = serverId;
        ctx.extra["dropped_total"] = std::to_string(dropped);
        GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                    "outbound queue full, evicted oldest message", ctx);
    }

    /// Write queued frames in order. Stops at the first failure and keeps
    /// the failed frame at the head.
    bool flush() {
        while (!queue.empty() && transport) {
            auto sent = transport->sendText(queue.front());
            if (!sent) {
                LogContext ctx;
                ctx.serverId = serverId;
                ctx.transportId = transport->id();
                ctx.extra["pending"] = std::to_string(queue.size());
                GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                            "queue flush interrupted", ctx);
                return false;
            }
            queue.pop_front();
        }
        return true;
    }

    void enterReconnecting(Clock::time_point now, Effects& fx) {
        attempts = 0;
        retryState = SessionState::Reconnecting;
        dialInFlight = false;
        nextAttemptAt = now + backoffDelay(policy, 1);
        transition(SessionState::Reconnecting, fx);
    }

    /// A connect attempt failed. Returns true when the retry budget is spent
    /// and the session went to CLOSED.
    bool scheduleRetry(Clock::time_point now, Effects& fx) {
        dialInFlight = false;
        if (mode == ConnectMode::Listen) {
            // The peer owns retries in listen mode; wait for it.
            nextAttemptAt.reset();
            transition(retryState, fx);
            return false;
        }
        if (retryState == SessionState::Connecting) {
            if (policy.maxConnectAttempts != 0 && attempts >= policy.maxConnectAttempts) {
                nextAttemptAt.reset();
                transition(SessionState::Closed, fx);
                return true;
            }
            nextAttemptAt = now + backoffDelay(policy, attempts);
            transition(SessionState::Connecting, fx);
            return false;
        }
        nextAttemptAt = now + backoffDelay(policy, attempts + 1);
        transition(SessionState::Reconnecting, fx);
        return false;
    }

    void logContext(LogContext& ctx) const {
        ctx.serverId = serverId;
        if (transport) {
            ctx.transportId = transport->id();
        }
    }

    void bindLocked(std::shared_ptr<Transport> next, Clock::time_point now, Effects& fx) {
        if (transport && transport != next) {
            dropTransport(CloseCode::Replaced, "replaced by a newer connection", fx);
        }
        if (state == SessionState::Connecting) {
            retryState = SessionState::Connecting;
        } else if (state != SessionState::Authenticating) {
            retryState = SessionState::Reconnecting;
        }
        transport = std::move(next);
        dialInFlight = false;
        nextAttemptAt.reset();
        awaitingPongSince.reset();
        authDeadline = now + policy.authTimeout;
        transition(SessionState::Authenticating, fx);
    }

    /// Requires AUTHENTICATING with a bound transport.
    void completeLocked(Clock::time_point now, std::optional<std::string> greeting,
                        Effects& fx) {
        transition(SessionState::Connected, fx);
        attempts = 0;
        lastSeen = now;
        lastPingAt = now;
        awaitingPongSince.reset();
        if (greeting) {
            auto sent = transport->sendText(std::move(*greeting));
            if (!sent) {
                LogContext ctx;
                logContext(ctx);
                GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                            "failed to send greeting", ctx);
            }
        }
        if (!queue.empty()) {
            LogContext ctx;
            logContext(ctx);
            ctx.extra["queued"] = std::to_string(queue.size());
            GCB_LOG_CTX(LogLevel::Debug, LogCategory::Session, "flushing outbound queue", ctx);
        }
        flush();
    }
};

// ---------------------------------------------------------------------------
// Effect application (outside the lock)
// ---------------------------------------------------------------------------

namespace {

void applyEffects(Session& session, const std::string& serverId,
                  std::vector<std::pair<SessionState, SessionState>>& transitions,
                  std::vector<std::tuple<std::shared_ptr<Transport>, CloseCode, std::string>>& closes) {
    for (auto& [transport, code, reason] : closes) {
        transport->close(code, reason);
    }
    for (auto [from, to] : transitions) {
        LogContext ctx;
        ctx.serverId = serverId;
        ctx.extra["from"] = std::string(sessionStateName(from));
        ctx.extra["to"] = std::string(sessionStateName(to));
        GCB_LOG_CTX(LogLevel::Info, LogCategory::Session, "session state changed", ctx);
        session.onTransition.emit(from, to);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------

Session::Session(std::string serverId, ConnectMode mode, SessionPolicy policy)
    : impl_(std::make_unique<Impl>(std::move(serverId), mode, policy)) {}

Session::~Session() = default;

const std::string& Session::serverId() const noexcept { return impl_->serverId; }

ConnectMode Session::connectMode() const noexcept { return impl_->mode; }

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

void Session::beginConnecting(Clock::time_point now) {
    Impl::Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->attempts = 0;
        impl_->retryState = SessionState::Connecting;
        impl_->dialInFlight = false;
        impl_->nextAttemptAt = now;
        impl_->transition(SessionState::Connecting, fx);
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
}

void Session::bindTransport(std::shared_ptr<Transport> transport, Clock::time_point now) {
    Impl::Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->bindLocked(std::move(transport), now, fx);
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
}

GatewayResult<void> Session::completeAuthentication(Clock::time_point now,
                                                    std::optional<std::string> greeting) {
    Impl::Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->state != SessionState::Authenticating || !impl_->transport) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::InvalidState,
                             "session " + impl_->serverId + " is not authenticating"));
        }
        impl_->completeLocked(now, std::move(greeting), fx);
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
    return GatewayResult<void>::ok();
}

GatewayResult<void> Session::adopt(std::shared_ptr<Transport> transport, Clock::time_point now,
                                   std::optional<std::string> greeting,
                                   DuplicatePolicy duplicates) {
    Impl::Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        if (duplicates == DuplicatePolicy::Reject && impl_->state == SessionState::Connected) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::DuplicateServerId,
                             "server '" + impl_->serverId + "' is already connected"));
        }
        impl_->bindLocked(std::move(transport), now, fx);
        impl_->completeLocked(now, std::move(greeting), fx);
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
    return GatewayResult<void>::ok();
}

void Session::failAuthentication(std::string_view reason, Clock::time_point /*now*/) {
    Impl::Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->dropTransport(CloseCode::AuthFailed, std::string(reason), fx);
        impl_->nextAttemptAt.reset();
        impl_->dialInFlight = false;
        impl_->transition(SessionState::Closed, fx);
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
}

bool Session::onTransportLost(std::string_view transportId, Clock::time_point now) {
    Impl::Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->transport || impl_->transport->id() != transportId) {
            return false;
        }
        impl_->transport.reset();
        impl_->awaitingPongSince.reset();
        switch (impl_->state) {
            case SessionState::Connected:
                impl_->enterReconnecting(now, fx);
                break;
            case SessionState::Authenticating:
                (void)impl_->scheduleRetry(now, fx);
                break;
            default:
                break;
        }
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
    return true;
}

bool Session::onDialFailed(Clock::time_point now) {
    Impl::Effects fx;
    bool gaveUp = false;
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->dialInFlight) {
            return false;
        }
        gaveUp = impl_->scheduleRetry(now, fx);
        if (gaveUp) {
            LogContext ctx;
            ctx.serverId = impl_->serverId;
            ctx.extra["attempts"] = std::to_string(impl_->attempts);
            GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                        "connect attempts exhausted", ctx);
        }
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
    return gaveUp;
}

void Session::detach(Clock::time_point /*now*/) {
    Impl::Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        impl_->dropTransport(CloseCode::Normal, "detached", fx);
        impl_->nextAttemptAt.reset();
        impl_->dialInFlight = false;
        impl_->transition(SessionState::Closed, fx);
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
}

void Session::requestReconnect(Clock::time_point now) {
    Impl::Effects fx;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->state == SessionState::Connected ||
            impl_->state == SessionState::Authenticating) {
            impl_->dropTransport(CloseCode::Normal, "reconnect requested", fx);
        }
        impl_->attempts = 0;
        impl_->retryState = SessionState::Reconnecting;
        impl_->nextAttemptAt = now;
        impl_->transition(SessionState::Reconnecting, fx);
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
}

// ---------------------------------------------------------------------------
// Traffic
// ---------------------------------------------------------------------------

GatewayResult<void> Session::send(const protocol::Message& msg, DeliveryMode mode) {
    auto frame = protocol::encode(msg);
    if (!frame) {
        return GatewayResult<void>::err(std::move(frame).error());
    }

    std::lock_guard lock(impl_->mutex);
    const auto state = impl_->state;
    if (state == SessionState::Closed ||
        (mode == DeliveryMode::Immediate && state != SessionState::Connected)) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ServerNotConnected,
                         "server " + impl_->serverId + " is "
                             + std::string(sessionStateName(state))));
    }

    if (state == SessionState::Connected && impl_->transport) {
        // The backlog goes first; an Immediate frame never waits behind it.
        if (impl_->queue.empty() || impl_->flush()) {
            auto sent = impl_->transport->sendText(frame.value());
            if (sent) {
                return GatewayResult<void>::ok();
            }
            if (mode == DeliveryMode::Immediate) {
                return sent;
            }
        } else if (mode == DeliveryMode::Immediate) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::SendFailed,
                             "server " + impl_->serverId + " has an undelivered backlog"));
        }
    }
    if (mode == DeliveryMode::Immediate) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ServerNotConnected,
                         "server " + impl_->serverId + " has no transport"));
    }

    impl_->enqueue(std::move(frame).value());
    if (state == SessionState::Connected) {
        impl_->flush();
    }
    return GatewayResult<void>::ok();
}

void Session::onInbound(Clock::time_point now) {
    std::lock_guard lock(impl_->mutex);
    impl_->lastSeen = now;
}

void Session::onPong(Clock::time_point now) {
    std::lock_guard lock(impl_->mutex);
    impl_->lastSeen = now;
    impl_->awaitingPongSince.reset();
}

SessionTick Session::tick(Clock::time_point now) {
    Impl::Effects fx;
    SessionTick result = SessionTick::None;
    {
        std::lock_guard lock(impl_->mutex);
        auto& s = *impl_;
        switch (s.state) {
            case SessionState::Connected: {
                if (s.policy.heartbeatInterval.count() <= 0) {
                    break;
                }
                if (s.awaitingPongSince) {
                    if (now - *s.awaitingPongSince >= s.policy.pongTimeout) {
                        LogContext ctx;
                        s.logContext(ctx);
                        GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                                    "heartbeat timeout", ctx);
                        s.dropTransport(CloseCode::HeartbeatTimeout, "pong timeout", fx);
                        s.enterReconnecting(now, fx);
                    }
                    break;
                }
                if (now - s.lastPingAt >= s.policy.heartbeatInterval) {
                    auto ping = protocol::encode(
                        protocol::Message::make(s.serverId, protocol::PingPayload{}));
                    s.lastPingAt = now;
                    if (ping && s.transport) {
                        auto sent = s.transport->sendText(std::move(ping).value());
                        if (sent) {
                            s.awaitingPongSince = now;
                        }
                    }
                }
                if (!s.queue.empty()) {
                    s.flush();
                }
                break;
            }
            case SessionState::Authenticating:
                if (now >= s.authDeadline) {
                    LogContext ctx;
                    s.logContext(ctx);
                    GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                                "authentication timed out", ctx);
                    s.dropTransport(CloseCode::AuthTimeout, "authentication timed out", fx);
                    if (s.scheduleRetry(now, fx)) {
                        result = SessionTick::GaveUp;
                    }
                }
                break;
            case SessionState::Connecting:
            case SessionState::Reconnecting: {
                if (s.mode != ConnectMode::Dial || s.dialInFlight || !s.nextAttemptAt ||
                    now < *s.nextAttemptAt) {
                    break;
                }
                if (s.state == SessionState::Reconnecting &&
                    s.policy.maxReconnectAttempts != 0 &&
                    s.attempts >= s.policy.maxReconnectAttempts) {
                    LogContext ctx;
                    ctx.serverId = s.serverId;
                    ctx.extra["attempts"] = std::to_string(s.attempts);
                    GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                                "reconnect attempts exhausted", ctx);
                    s.nextAttemptAt.reset();
                    s.transition(SessionState::Closed, fx);
                    result = SessionTick::GaveUp;
                    break;
                }
                ++s.attempts;
                s.dialInFlight = true;
                s.nextAttemptAt.reset();
                result = SessionTick::DialRequested;
                break;
            }
            case SessionState::Closed:
                break;
        }
    }
    applyEffects(*this, impl_->serverId, fx.transitions, fx.closes);
    return result;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

SessionState Session::state() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->state;
}

std::optional<std::string> Session::transportId() const {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->transport) {
        return std::nullopt;
    }
    return impl_->transport->id();
}

std::optional<Clock::time_point> Session::lastSeen() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->lastSeen;
}

std::size_t Session::queuedCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->queue.size();
}

uint64_t Session::droppedCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->dropped;
}

uint32_t Session::attemptCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->attempts;
}

std::optional<Clock::time_point> Session::nextAttemptAt() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->nextAttemptAt;
}

SessionSummary Session::summary() const {
    std::lock_guard lock(impl_->mutex);
    SessionSummary out;
    out.serverId = impl_->serverId;
    out.state = impl_->state;
    out.mode = impl_->mode;
    out.lastSeen = impl_->lastSeen;
    out.queued = impl_->queue.size();
    out.dropped = impl_->dropped;
    out.attempts = impl_->attempts;
    return out;
}

} // namespace gcb::service
