/// @file websocket_listener.cpp
/// @brief WebSocketListener implementation over the kcenon WebSocket facade.

#include "gcb/foundation/websocket_listener.hpp"

#include "gcb/foundation/gateway_logger.hpp"

// kcenon facade headers (hidden behind PIMPL)
#include <kcenon/network/facade/websocket_facade.h>
#include <kcenon/network/interfaces/i_protocol_server.h>
#include <kcenon/network/interfaces/i_session.h>

#include <atomic>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace gcb::foundation {

namespace {

// ---------------------------------------------------------------------------
// Transport over an accepted kcenon session
// ---------------------------------------------------------------------------

class ServerSessionTransport final : public Transport {
public:
    ServerSessionTransport(std::string id,
                           std::shared_ptr<kcenon::network::interfaces::i_session> session)
        : id_(std::move(id)), session_(std::move(session)) {}

    const std::string& id() const noexcept override { return id_; }

    GatewayResult<void> sendText(std::string frame) override {
        if (!open_.load(std::memory_order_acquire)) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::SendFailed, "transport " + id_ + " is closed"));
        }
        std::vector<uint8_t> bytes(frame.begin(), frame.end());
        auto result = session_->send(std::move(bytes));
        if (result.is_err()) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::SendFailed, "send failed on transport " + id_));
        }
        return GatewayResult<void>::ok();
    }

    void close(CloseCode code, std::string_view reason) override {
        if (!open_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        LogContext ctx;
        ctx.transportId = id_;
        ctx.extra["close_code"] = std::to_string(static_cast<uint16_t>(code));
        ctx.extra["reason"] = std::string(reason);
        GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network, "closing transport", ctx);
        session_->close();
    }

    bool isOpen() const noexcept override {
        return open_.load(std::memory_order_acquire);
    }

    void markClosed() noexcept { open_.store(false, std::memory_order_release); }

private:
    std::string id_;
    std::shared_ptr<kcenon::network::interfaces::i_session> session_;
    std::atomic<bool> open_{true};
};

} // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct WebSocketListener::Impl {
    std::shared_ptr<kcenon::network::interfaces::i_protocol_server> server;
    std::atomic<bool> listening{false};

    std::unordered_map<std::string, std::shared_ptr<ServerSessionTransport>> transports;
    mutable std::shared_mutex transportMutex;

    std::atomic<uint64_t> nextTransportId{1};

    // Back-pointer for signal emission (non-owning, valid for Impl lifetime)
    WebSocketListener* owner = nullptr;

    // kcenon session id -> our transport id
    std::unordered_map<std::string, std::string> byKcId;

    void setupCallbacks() {
        server->set_connection_callback(
            [this](std::shared_ptr<kcenon::network::interfaces::i_session> kcSession) {
                auto kcId = std::string(kcSession->id());
                auto id = "ws-" + std::to_string(
                    nextTransportId.fetch_add(1, std::memory_order_relaxed));
                auto transport = std::make_shared<ServerSessionTransport>(id, kcSession);
                {
                    std::unique_lock lock(transportMutex);
                    transports.emplace(id, transport);
                    byKcId.emplace(kcId, id);
                }
                LogContext ctx;
                ctx.transportId = id;
                ctx.extra["peer"] = kcId;
                GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network, "connection accepted", ctx);
                owner->onOpened.emit(transport);
            });

        server->set_receive_callback(
            [this](std::string_view kcId, const std::vector<uint8_t>& data) {
                std::string id;
                {
                    std::shared_lock lock(transportMutex);
                    auto it = byKcId.find(std::string(kcId));
                    if (it == byKcId.end()) {
                        return;
                    }
                    id = it->second;
                }
                owner->onFrame.emit(id, std::string(data.begin(), data.end()));
            });

        server->set_disconnection_callback(
            [this](std::string_view kcId) {
                std::string id;
                {
                    std::unique_lock lock(transportMutex);
                    auto it = byKcId.find(std::string(kcId));
                    if (it == byKcId.end()) {
                        return;
                    }
                    id = it->second;
                    byKcId.erase(it);
                    auto tit = transports.find(id);
                    if (tit != transports.end()) {
                        tit->second->markClosed();
                        transports.erase(tit);
                    }
                }
                owner->onClosed.emit(id);
            });

        server->set_error_callback(
            [](std::string_view kcId, std::error_code ec) {
                LogContext ctx;
                ctx.extra["peer"] = std::string(kcId);
                ctx.extra["error"] = ec.message();
                GCB_LOG_CTX(LogLevel::Warning, LogCategory::Network,
                            "websocket session error", ctx);
            });
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------

WebSocketListener::WebSocketListener()
    : impl_(std::make_unique<Impl>()) {
    impl_->owner = this;
}

WebSocketListener::~WebSocketListener() {
    if (impl_) {
        stop();
    }
}

// ---------------------------------------------------------------------------
// listen() / stop()
// ---------------------------------------------------------------------------

GatewayResult<void> WebSocketListener::listen(uint16_t port) {
    if (impl_->listening.load(std::memory_order_acquire)) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::AlreadyExists, "websocket listener already running"));
    }

    kcenon::network::facade::websocket_facade facade;
    impl_->server = facade.create_server({});
    if (!impl_->server) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed, "failed to create websocket server"));
    }
    impl_->setupCallbacks();

    auto result = impl_->server->start(port);
    if (result.is_err()) {
        impl_->server.reset();
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed,
                         "failed to start websocket server on port " + std::to_string(port)));
    }

    impl_->listening.store(true, std::memory_order_release);
    GCB_LOG_INFO(LogCategory::Network,
                 "websocket listener started on port " + std::to_string(port));
    return GatewayResult<void>::ok();
}

void WebSocketListener::stop() {
    if (!impl_->listening.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    std::vector<std::shared_ptr<ServerSessionTransport>> open;
    {
        std::unique_lock lock(impl_->transportMutex);
        for (auto& [id, transport] : impl_->transports) {
            open.push_back(transport);
        }
        impl_->transports.clear();
        impl_->byKcId.clear();
    }
    for (auto& transport : open) {
        transport->close(CloseCode::GoingAway, "gateway shutting down");
    }

    if (impl_->server) {
        (void)impl_->server->stop();
        impl_->server.reset();
    }
    GCB_LOG_INFO(LogCategory::Network, "websocket listener stopped");
}

bool WebSocketListener::isListening() const noexcept {
    return impl_->listening.load(std::memory_order_acquire);
}

std::size_t WebSocketListener::connectionCount() const {
    std::shared_lock lock(impl_->transportMutex);
    return impl_->transports.size();
}

} // namespace gcb::foundation
