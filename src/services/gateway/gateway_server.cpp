/// @file gateway_server.cpp
/// @brief GatewayServer implementation: transport entry points, the AUTH
///        handshake, inbound dispatch and the maintenance tick.

#include "gcb/service/gateway_server.hpp"

#include "gcb/foundation/error_code.hpp"
#include "gcb/foundation/gateway_error.hpp"
#include "gcb/foundation/gateway_logger.hpp"
#include "gcb/foundation/job_scheduler.hpp"
#include "gcb/foundation/websocket_dialer.hpp"
#include "gcb/foundation/websocket_listener.hpp"
#include "gcb/protocol/codec.hpp"
#include "gcb/service/http_status_client.hpp"
#include "gcb/service/pending_requests.hpp"
#include "gcb/service/token_bucket.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gcb::service {

using gcb::foundation::CloseCode;
using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;
using gcb::foundation::JobScheduler;
using gcb::foundation::LogCategory;
using gcb::foundation::LogContext;
using gcb::foundation::LogLevel;
using gcb::foundation::Transport;
using gcb::protocol::Message;
using gcb::protocol::MessageType;

// -- Helpers ------------------------------------------------------------------

namespace {

LogContext transportContext(const std::string& transportId,
                            const std::string& serverId = {}) {
    LogContext ctx;
    ctx.transportId = transportId;
    if (!serverId.empty()) {
        ctx.serverId = serverId;
    }
    return ctx;
}

/// Best-effort single frame on a transport that has no Session yet.
void sendRaw(Transport& transport, const Message& msg) {
    auto frame = protocol::encode(msg);
    if (!frame) {
        GCB_LOG_ERROR(LogCategory::Protocol,
                      "cannot encode " + std::string(protocol::messageTypeName(msg.type()))
                          + ": " + frame.error().describe());
        return;
    }
    auto sent = transport.sendText(std::move(frame).value());
    if (!sent) {
        GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network,
                    "raw send failed: " + sent.error().describe(),
                    transportContext(transport.id()));
    }
}

/// One dial worker per dial-mode server, so an unreachable host only ever
/// holds its own worker.
std::size_t dialWorkers(const GatewayConfig& config) {
    std::size_t count = 0;
    for (const auto& server : config.servers) {
        if (server.mode == ConnectMode::Dial) {
            ++count;
        }
    }
    return std::max<std::size_t>(count, 1);
}

CloseCode closeCodeFor(const GatewayError& error) {
    return error.code() == ErrorCode::DuplicateServerId ? CloseCode::PolicyViolation
                                                        : CloseCode::AuthFailed;
}

} // anonymous namespace

// -- Impl ---------------------------------------------------------------------

struct GatewayServer::Impl {
    struct PendingTransport {
        std::shared_ptr<Transport> transport;
        Clock::time_point openedAt;
    };

    struct DialTarget {
        std::string host;
        uint16_t port = 0;
    };

    GatewayConfig config;
    ChatPlatformSink& sink;
    std::shared_ptr<foundation::Dialer> dialer;

    SessionRegistry registry;
    ForwardTable forwardTable;
    Router router;
    PendingRequests pending;
    HttpStatusClient http;
    StatusQueryFacade status;
    BindingCoordinator binding;
    CommandDispatcher commands;
    TokenBucket rateLimiter;

    std::unordered_map<std::string, DialTarget> dialTargets;

    mutable std::mutex transportMutex;
    /// Opened listen-mode transports that have not sent AUTH yet.
    std::unordered_map<std::string, PendingTransport> unauthenticated;
    /// transport id -> server id for every transport bound to a Session.
    std::unordered_map<std::string, std::string> bound;
    /// Dial jobs in flight, by server id.
    std::unordered_set<std::string> dialing;

    std::atomic<bool> running{false};
    std::atomic<uint64_t> framesReceived{0};
    std::atomic<uint64_t> framesMalformed{0};
    std::atomic<uint64_t> framesRateLimited{0};
    std::atomic<uint64_t> framesIgnored{0};
    std::atomic<uint64_t> authSuccessCount{0};
    std::atomic<uint64_t> authFailureCount{0};

    std::vector<JobScheduler::JobId> tickJobs;
    std::vector<foundation::Signal<const std::string&, const std::string&>::SlotId> dialerFrameSlots;
    std::vector<foundation::Signal<const std::string&>::SlotId> dialerCloseSlots;

    // Declared last: destroyed first, so no worker outlives the components.
    std::unique_ptr<foundation::WebSocketListener> listener;
    /// Blocking outbound dials; kept off the maintenance pool.
    JobScheduler dialScheduler;
    /// Maintenance tick and status polling.
    JobScheduler scheduler;

    Impl(GatewayConfig cfg, ChatPlatformSink& chatSink,
         std::shared_ptr<foundation::Dialer> dial)
        : config(std::move(cfg)),
          sink(chatSink),
          dialer(std::move(dial)),
          registry(config.session, config.duplicatePolicy, config.removeOnGiveUp),
          router(registry, forwardTable, sink),
          http(config.httpTimeout),
          status(registry, router, pending, config.queryTimeout, &http),
          binding(config.binding, router, sink),
          commands(registry, router, status, forwardTable, config.autoForward),
          rateLimiter(config.rateLimitCapacity, config.rateLimitRefillRate),
          dialScheduler(dialWorkers(config)),
          scheduler(config.workerThreads) {
        std::unordered_map<std::string, ForwardRule> rules;
        for (const auto& server : config.servers) {
            registry.allow({server.serverId, server.token, server.mode});
            rules.emplace(server.serverId, server.forward);
            if (server.http) {
                http.setEndpoint(server.serverId, *server.http);
            }
            if (server.mode == ConnectMode::Dial) {
                dialTargets[server.serverId] = {server.dialHost, server.dialPort};
            }
        }
        forwardTable.reloadForwarding(std::move(rules));

        registry.onServerOnline.connect(
            [this](const std::string& serverId) {
                router.announceServerState(serverId, true);
                static_cast<void>(binding.onServerOnline(serverId));
            });
        registry.onServerOffline.connect(
            [this](const std::string& serverId) {
                router.announceServerState(serverId, false);
            });
    }

    ~Impl() {
        scheduler.shutdown();
        dialScheduler.shutdown();
        registry.onServerOnline.disconnectAll();
        registry.onServerOffline.disconnectAll();
    }

    // ── Outbound helpers ────────────────────────────────────────────────────

    void replyError(const Message& request, const GatewayError& error) {
        auto reply = Message::make(
            request.serverId,
            protocol::ErrorPayload{std::string(foundation::errorCodeName(error.code())),
                                   std::string(error.message())},
            request.correlationId);
        auto routed = router.routeOutbound(request.serverId, std::move(reply),
                                           DeliveryMode::Immediate);
        if (!routed) {
            GCB_LOG_WARN(LogCategory::Routing,
                         "cannot send ERROR to " + request.serverId + ": "
                             + routed.error().describe());
        }
    }

    // ── AUTH handshake (listen mode) ────────────────────────────────────────

    void handleAuthFrame(const std::shared_ptr<Transport>& transport,
                         std::string_view frame, Clock::time_point now) {
        const auto& transportId = transport->id();
        auto decoded = protocol::decode(frame);
        if (!decoded || decoded.value().type() != MessageType::Auth) {
            authFailureCount.fetch_add(1, std::memory_order_relaxed);
            GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                        "first frame was not AUTH; closing",
                        transportContext(transportId));
            transport->close(CloseCode::ProtocolError, "expected AUTH");
            return;
        }

        const auto& auth = *decoded.value().as<protocol::AuthPayload>();
        auto greeting = protocol::encode(
            Message::make(auth.serverId, protocol::AuthResultPayload{true, auth.serverId, {}}));
        if (!greeting) {
            authFailureCount.fetch_add(1, std::memory_order_relaxed);
            transport->close(CloseCode::ProtocolError, "invalid server id");
            return;
        }

        {
            std::lock_guard lock(transportMutex);
            bound[transportId] = auth.serverId;
        }
        auto attached = registry.attach(auth.serverId, transport, auth.token, now,
                                        std::move(greeting).value());
        if (!attached) {
            {
                std::lock_guard lock(transportMutex);
                bound.erase(transportId);
            }
            authFailureCount.fetch_add(1, std::memory_order_relaxed);
            const auto& error = attached.error();
            sendRaw(*transport,
                    Message::make(auth.serverId,
                                  protocol::AuthResultPayload{false, auth.serverId,
                                                              std::string(error.message())}));
            transport->close(closeCodeFor(error), foundation::errorCodeName(error.code()));
            return;
        }

        authSuccessCount.fetch_add(1, std::memory_order_relaxed);
        rateLimiter.reset(auth.serverId, now);
    }

    // ── AUTH_RESULT (dial mode) ─────────────────────────────────────────────

    void handleAuthResult(const std::shared_ptr<Session>& session, const Message& msg,
                          Clock::time_point now) {
        if (session->connectMode() != ConnectMode::Dial ||
            session->state() != SessionState::Authenticating) {
            framesIgnored.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        const auto& result = *msg.as<protocol::AuthResultPayload>();
        if (!result.success) {
            authFailureCount.fetch_add(1, std::memory_order_relaxed);
            GCB_LOG_WARN(LogCategory::Session,
                         "server " + session->serverId() + " refused our credentials: "
                             + result.reason.value_or("no reason"));
            session->failAuthentication(result.reason.value_or("rejected"), now);
            return;
        }
        auto completed = session->completeAuthentication(now);
        if (!completed) {
            GCB_LOG_WARN(LogCategory::Session, completed.error().describe());
            return;
        }
        authSuccessCount.fetch_add(1, std::memory_order_relaxed);
        rateLimiter.reset(session->serverId(), now);
    }

    // ── BIND_CODE_ISSUED ────────────────────────────────────────────────────

    void handleBindCodeIssued(const Message& msg) {
        const auto& issued = *msg.as<protocol::BindCodeIssuedPayload>();
        const auto& serverId = msg.serverId;
        auto playerName = issued.playerName.value_or("");

        if (issued.code) {
            std::optional<BindingCoordinator::SystemClock::time_point> expiresAt;
            if (issued.expiresAt) {
                expiresAt = BindingCoordinator::SystemClock::time_point(
                    std::chrono::milliseconds(*issued.expiresAt));
            }
            auto adopted = binding.registerIssued(serverId, *issued.code, issued.playerUuid,
                                                  playerName, expiresAt, issued.force);
            if (!adopted) {
                replyError(msg, adopted.error());
            }
            return;
        }

        auto code = binding.issue(serverId, issued.playerUuid, playerName, issued.force);
        if (!code) {
            replyError(msg, code.error());
            return;
        }
        // Hand the generated code back so the server can show it in-game.
        protocol::BindCodeIssuedPayload echo = issued;
        echo.code = code.value();
        echo.expiresAt = Message::nowMillis()
                         + std::chrono::duration_cast<std::chrono::milliseconds>(
                               config.binding.ttl).count();
        auto routed = router.routeOutbound(serverId,
                                           Message::make(serverId, std::move(echo),
                                                         msg.correlationId),
                                           DeliveryMode::Queued);
        if (!routed) {
            GCB_LOG_WARN(LogCategory::Binding,
                         "cannot echo generated code to " + serverId + ": "
                             + routed.error().describe());
        }
    }

    // ── Inbound dispatch ────────────────────────────────────────────────────

    void dispatch(const std::shared_ptr<Session>& session, Message msg,
                  Clock::time_point now) {
        switch (msg.type()) {
            case MessageType::Pong:
                session->onPong(now);
                break;

            case MessageType::Ping: {
                auto routed = router.routeOutbound(
                    msg.serverId, Message::make(msg.serverId, protocol::PongPayload{},
                                                msg.correlationId),
                    DeliveryMode::Immediate);
                if (!routed) {
                    GCB_LOG_DEBUG(LogCategory::Session, "PONG not sent: " + routed.error().describe());
                }
                break;
            }

            case MessageType::Chat:
            case MessageType::PlayerEvent:
            case MessageType::CommandResult:
                router.forwardInbound(msg);
                break;

            case MessageType::StatusResponse:
            case MessageType::Error:
                if (!status.handleResponse(msg)) {
                    framesIgnored.fetch_add(1, std::memory_order_relaxed);
                }
                break;

            case MessageType::BindCodeIssued:
                handleBindCodeIssued(msg);
                break;

            case MessageType::BindResult:
                if (!binding.acknowledge(msg.serverId,
                                         *msg.as<protocol::BindResultPayload>())) {
                    framesIgnored.fetch_add(1, std::memory_order_relaxed);
                }
                break;

            case MessageType::AuthResult:
                handleAuthResult(session, msg, now);
                break;

            case MessageType::Command:
            case MessageType::StatusRequest:
            case MessageType::BindConfirm:
            case MessageType::Auth: {
                framesIgnored.fetch_add(1, std::memory_order_relaxed);
                auto ctx = transportContext(session->transportId().value_or(""), msg.serverId);
                ctx.extra["type"] = std::string(protocol::messageTypeName(msg.type()));
                GCB_LOG_CTX(LogLevel::Debug, LogCategory::Protocol,
                            "ignoring gateway-bound message type from server", ctx);
                break;
            }
        }
    }

    // ── Dialing ─────────────────────────────────────────────────────────────

    void scheduleDial(const std::string& serverId) {
        {
            std::lock_guard lock(transportMutex);
            if (!dialing.insert(serverId).second) {
                return;
            }
        }
        auto job = dialScheduler.schedule([this, serverId] { dialServer(serverId); },
                                          foundation::JobPriority::High);
        if (!job) {
            {
                std::lock_guard lock(transportMutex);
                dialing.erase(serverId);
            }
            GCB_LOG_ERROR(LogCategory::Network,
                          "cannot schedule dial for " + serverId + ": " + job.error().describe());
            registry.onDialFailed(serverId, Clock::now());
        }
    }

    void dialServer(const std::string& serverId) {
        dialOnce(serverId);
        std::lock_guard lock(transportMutex);
        dialing.erase(serverId);
    }

    void dialOnce(const std::string& serverId) {
        auto target = dialTargets.find(serverId);
        auto credential = registry.credentialFor(serverId);
        if (!dialer || target == dialTargets.end() || !credential) {
            GCB_LOG_ERROR(LogCategory::Network, "no dial route for server " + serverId);
            registry.onDialFailed(serverId, Clock::now());
            return;
        }

        auto dialed = dialer->dial(target->second.host, target->second.port);
        if (!dialed) {
            GCB_LOG_WARN(LogCategory::Network,
                         "dial " + serverId + " at " + target->second.host + ":"
                             + std::to_string(target->second.port) + " failed: "
                             + dialed.error().describe());
            registry.onDialFailed(serverId, Clock::now());
            return;
        }

        auto transport = std::move(dialed).value();
        auto session = registry.lookup(serverId);
        if (!session || !running.load(std::memory_order_acquire)) {
            transport->close(CloseCode::GoingAway, "session gone");
            return;
        }

        {
            std::lock_guard lock(transportMutex);
            bound[transport->id()] = serverId;
        }
        session.value()->bindTransport(transport, Clock::now());
        sendRaw(*transport, Message::make(serverId,
                                          protocol::AuthPayload{serverId, credential->token}));
        GCB_LOG_CTX(LogLevel::Info, LogCategory::Network, "dialed server, AUTH sent",
                    transportContext(transport->id(), serverId));
    }
};

// -- Construction -------------------------------------------------------------

GatewayServer::GatewayServer(GatewayConfig config, ChatPlatformSink& sink,
                             std::shared_ptr<foundation::Dialer> dialer)
    : impl_(std::make_unique<Impl>(std::move(config), sink, std::move(dialer))) {}

GatewayServer::~GatewayServer() {
    if (impl_ && impl_->running.load(std::memory_order_acquire)) {
        stop();
    }
}

// -- Lifecycle ----------------------------------------------------------------

GatewayResult<void> GatewayServer::start() {
    if (impl_->running.exchange(true, std::memory_order_acq_rel)) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::AlreadyExists, "gateway is already running"));
    }

    if (impl_->config.listenEnabled) {
        auto listener = std::make_unique<foundation::WebSocketListener>();
        listener->onOpened.connect([this](std::shared_ptr<Transport> transport) {
            handleTransportOpened(std::move(transport));
        });
        listener->onFrame.connect([this](const std::string& id, const std::string& frame) {
            handleFrame(id, frame);
        });
        listener->onClosed.connect([this](const std::string& id) { handleTransportClosed(id); });

        auto listening = listener->listen(impl_->config.listenPort);
        if (!listening) {
            impl_->running.store(false, std::memory_order_release);
            return listening;
        }
        impl_->listener = std::move(listener);
    }

    if (impl_->dialer) {
        impl_->dialerFrameSlots.push_back(impl_->dialer->onFrame.connect(
            [this](const std::string& id, const std::string& frame) { handleFrame(id, frame); }));
        impl_->dialerCloseSlots.push_back(impl_->dialer->onClosed.connect(
            [this](const std::string& id) { handleTransportClosed(id); }));
    }

    auto now = Clock::now();
    for (const auto& [serverId, target] : impl_->dialTargets) {
        auto dialing = impl_->registry.startDialing(serverId, now);
        if (!dialing) {
            GCB_LOG_WARN(LogCategory::Session, dialing.error().describe());
        }
    }

    auto tickJob = impl_->scheduler.scheduleTick(impl_->config.tickInterval,
                                                 [this] { tick(Clock::now()); });
    if (!tickJob) {
        stop();
        return GatewayResult<void>::err(std::move(tickJob).error());
    }
    impl_->tickJobs.push_back(tickJob.value());

    if (impl_->config.statusPollInterval.count() > 0) {
        auto pollJob = impl_->scheduler.scheduleTick(
            std::chrono::duration_cast<std::chrono::milliseconds>(impl_->config.statusPollInterval),
            [this] { impl_->status.pollAll(); });
        if (pollJob) {
            impl_->tickJobs.push_back(pollJob.value());
        } else {
            GCB_LOG_WARN(LogCategory::Query,
                         "status polling disabled: " + pollJob.error().describe());
        }
    }

    GCB_LOG_INFO(LogCategory::Core,
                 "gateway started: " + std::to_string(impl_->config.servers.size())
                     + " server(s), listener "
                     + (impl_->listener ? "on port " + std::to_string(impl_->config.listenPort)
                                        : std::string("disabled")));
    return GatewayResult<void>::ok();
}

void GatewayServer::stop() {
    if (!impl_->running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    for (auto id : impl_->tickJobs) {
        auto cancelled = impl_->scheduler.cancel(id);
        if (!cancelled) {
            GCB_LOG_DEBUG(LogCategory::Core, cancelled.error().describe());
        }
    }
    impl_->tickJobs.clear();

    if (impl_->dialer) {
        for (auto id : impl_->dialerFrameSlots) {
            impl_->dialer->onFrame.disconnect(id);
        }
        for (auto id : impl_->dialerCloseSlots) {
            impl_->dialer->onClosed.disconnect(id);
        }
    }
    impl_->dialerFrameSlots.clear();
    impl_->dialerCloseSlots.clear();

    std::vector<std::shared_ptr<Transport>> orphans;
    {
        std::lock_guard lock(impl_->transportMutex);
        for (auto& [id, pendingTransport] : impl_->unauthenticated) {
            orphans.push_back(std::move(pendingTransport.transport));
        }
        impl_->unauthenticated.clear();
    }
    for (const auto& transport : orphans) {
        transport->close(CloseCode::GoingAway, "gateway shutting down");
    }

    auto now = Clock::now();
    for (const auto& summary : impl_->registry.list()) {
        auto detached = impl_->registry.detach(summary.serverId, now);
        if (!detached) {
            GCB_LOG_DEBUG(LogCategory::Session, detached.error().describe());
        }
    }

    if (impl_->listener) {
        impl_->listener->stop();
        impl_->listener.reset();
    }
    {
        std::lock_guard lock(impl_->transportMutex);
        impl_->bound.clear();
    }

    GCB_LOG_INFO(LogCategory::Core, "gateway stopped");
}

bool GatewayServer::isRunning() const noexcept {
    return impl_->running.load(std::memory_order_acquire);
}

void GatewayServer::pump(std::chrono::milliseconds elapsed) {
    impl_->scheduler.processTick(elapsed);
}

// -- Transport events ---------------------------------------------------------

void GatewayServer::handleTransportOpened(std::shared_ptr<Transport> transport) {
    auto id = transport->id();
    {
        std::lock_guard lock(impl_->transportMutex);
        impl_->unauthenticated[id] = {std::move(transport), Clock::now()};
    }
    GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network, "transport opened, awaiting AUTH",
                transportContext(id));
}

void GatewayServer::handleFrame(const std::string& transportId, std::string_view frame) {
    impl_->framesReceived.fetch_add(1, std::memory_order_relaxed);
    auto now = Clock::now();

    std::shared_ptr<Transport> unauthenticated;
    std::string serverId;
    {
        std::lock_guard lock(impl_->transportMutex);
        auto pendingIt = impl_->unauthenticated.find(transportId);
        if (pendingIt != impl_->unauthenticated.end()) {
            unauthenticated = std::move(pendingIt->second.transport);
            impl_->unauthenticated.erase(pendingIt);
        } else if (auto boundIt = impl_->bound.find(transportId); boundIt != impl_->bound.end()) {
            serverId = boundIt->second;
        }
    }

    if (unauthenticated) {
        impl_->handleAuthFrame(unauthenticated, frame, now);
        return;
    }
    if (serverId.empty()) {
        impl_->framesIgnored.fetch_add(1, std::memory_order_relaxed);
        GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network, "frame from unknown transport",
                    transportContext(transportId));
        return;
    }

    if (!impl_->rateLimiter.consume(serverId, now)) {
        impl_->framesRateLimited.fetch_add(1, std::memory_order_relaxed);
        GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network, "frame dropped by rate limit",
                    transportContext(transportId, serverId));
        return;
    }

    auto session = impl_->registry.lookup(serverId);
    if (!session || session.value()->transportId() != transportId) {
        // Superseded or detached transport.
        impl_->framesIgnored.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    auto decoded = protocol::decode(frame);
    if (!decoded) {
        impl_->framesMalformed.fetch_add(1, std::memory_order_relaxed);
        GCB_LOG_CTX(LogLevel::Warning, LogCategory::Protocol,
                    "dropping malformed frame: " + decoded.error().describe(),
                    transportContext(transportId, serverId));
        return;
    }

    auto msg = std::move(decoded).value();
    if (msg.serverId != serverId && !msg.serverId.empty()) {
        auto ctx = transportContext(transportId, serverId);
        ctx.extra["claimed"] = msg.serverId;
        GCB_LOG_CTX(LogLevel::Warning, LogCategory::Protocol,
                    "frame claimed a different server id; overriding", ctx);
    }
    msg.serverId = serverId;

    session.value()->onInbound(now);
    impl_->dispatch(session.value(), std::move(msg), now);
}

void GatewayServer::handleTransportClosed(const std::string& transportId) {
    bool known = false;
    {
        std::lock_guard lock(impl_->transportMutex);
        known = impl_->unauthenticated.erase(transportId) > 0;
        known = impl_->bound.erase(transportId) > 0 || known;
    }
    bool owned = impl_->registry.onTransportClosed(transportId, Clock::now());
    GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network,
                owned ? "session transport closed"
                      : (known ? "unbound transport closed" : "unknown transport closed"),
                transportContext(transportId));
}

// -- Maintenance --------------------------------------------------------------

void GatewayServer::tick(Clock::time_point now) {
    std::vector<std::shared_ptr<Transport>> expired;
    {
        std::lock_guard lock(impl_->transportMutex);
        for (auto it = impl_->unauthenticated.begin(); it != impl_->unauthenticated.end();) {
            if (now - it->second.openedAt >= impl_->config.session.authTimeout) {
                expired.push_back(std::move(it->second.transport));
                it = impl_->unauthenticated.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& transport : expired) {
        impl_->authFailureCount.fetch_add(1, std::memory_order_relaxed);
        GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session, "no AUTH within timeout; closing",
                    transportContext(transport->id()));
        transport->close(CloseCode::AuthTimeout, "authentication timeout");
    }

    if (impl_->running.load(std::memory_order_acquire)) {
        for (const auto& serverId : impl_->registry.tick(now)) {
            impl_->scheduleDial(serverId);
        }
    } else {
        static_cast<void>(impl_->registry.tick(now));
    }

    auto timedOut = impl_->pending.sweepExpired(now);
    if (timedOut > 0) {
        GCB_LOG_DEBUG(LogCategory::Query, std::to_string(timedOut) + " query waiter(s) timed out");
    }
    static_cast<void>(impl_->binding.sweep());
}

// -- Components ---------------------------------------------------------------

SessionRegistry& GatewayServer::registry() noexcept { return impl_->registry; }
ForwardTable& GatewayServer::forwardTable() noexcept { return impl_->forwardTable; }
Router& GatewayServer::router() noexcept { return impl_->router; }
BindingCoordinator& GatewayServer::binding() noexcept { return impl_->binding; }
StatusQueryFacade& GatewayServer::status() noexcept { return impl_->status; }
CommandDispatcher& GatewayServer::commands() noexcept { return impl_->commands; }

// -- Statistics ---------------------------------------------------------------

GatewayStats GatewayServer::stats() const {
    GatewayStats s;
    s.knownServers = impl_->registry.knownServers().size();
    auto sessions = impl_->registry.list();
    s.sessions = sessions.size();
    for (const auto& summary : sessions) {
        if (summary.state == SessionState::Connected) {
            ++s.connectedSessions;
        }
    }
    {
        std::lock_guard lock(impl_->transportMutex);
        s.unauthenticatedTransports = impl_->unauthenticated.size();
    }
    s.framesReceived = impl_->framesReceived.load(std::memory_order_relaxed);
    s.framesMalformed = impl_->framesMalformed.load(std::memory_order_relaxed);
    s.framesRateLimited = impl_->framesRateLimited.load(std::memory_order_relaxed);
    s.framesIgnored = impl_->framesIgnored.load(std::memory_order_relaxed);
    s.authSuccessCount = impl_->authSuccessCount.load(std::memory_order_relaxed);
    s.authFailureCount = impl_->authFailureCount.load(std::memory_order_relaxed);
    s.routing = impl_->router.stats();
    s.pendingQueries = impl_->pending.size();
    s.pendingBindings = impl_->binding.pendingCount();
    return s;
}

const GatewayConfig& GatewayServer::config() const noexcept {
    return impl_->config;
}

} // namespace gcb::service
