/// @file websocket_dialer.cpp
/// @brief WebSocketDialer implementation over the kcenon WebSocket client.

#include "gcb/foundation/websocket_dialer.hpp"

#include "gcb/foundation/gateway_logger.hpp"

#include <kcenon/network/facade/websocket_facade.h>
#include <kcenon/network/interfaces/connection_observer.h>
#include <kcenon/network/interfaces/i_protocol_client.h>

#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace gcb::foundation {

namespace {

// ---------------------------------------------------------------------------
// Transport over a kcenon client connection
// ---------------------------------------------------------------------------

class ClientTransport final : public Transport {
public:
    ClientTransport(std::string id,
                    std::shared_ptr<kcenon::network::interfaces::i_protocol_client> client)
        : id_(std::move(id)), client_(std::move(client)) {}

    const std::string& id() const noexcept override { return id_; }

    GatewayResult<void> sendText(std::string frame) override {
        if (!open_.load(std::memory_order_acquire)) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::SendFailed, "transport " + id_ + " is closed"));
        }
        std::vector<uint8_t> bytes(frame.begin(), frame.end());
        auto result = client_->send(std::move(bytes));
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
        GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network, "closing dialed transport", ctx);
        (void)client_->stop();
    }

    bool isOpen() const noexcept override {
        return open_.load(std::memory_order_acquire);
    }

    /// Returns true only for the first caller.
    bool markClosed() noexcept {
        return !closedReported_.exchange(true, std::memory_order_acq_rel);
    }

    void markNotOpen() noexcept { open_.store(false, std::memory_order_release); }

private:
    std::string id_;
    std::shared_ptr<kcenon::network::interfaces::i_protocol_client> client_;
    std::atomic<bool> open_{true};
    std::atomic<bool> closedReported_{false};
};

// Per-dial handshake state shared with the observer callbacks.
struct ConnectWaiter {
    std::promise<bool> promise;
    std::once_flag once;

    void resolve(bool connected) {
        std::call_once(once, [&] { promise.set_value(connected); });
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct WebSocketDialer::Impl {
    std::chrono::milliseconds connectTimeout;
    std::atomic<uint64_t> nextId{1};

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<ClientTransport>> transports;

    void forget(const std::string& id) {
        std::lock_guard lock(mutex);
        transports.erase(id);
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------

WebSocketDialer::WebSocketDialer(std::chrono::milliseconds connectTimeout)
    : impl_(std::make_unique<Impl>()) {
    impl_->connectTimeout = connectTimeout;
}

WebSocketDialer::~WebSocketDialer() {
    std::unordered_map<std::string, std::shared_ptr<ClientTransport>> open;
    {
        std::lock_guard lock(impl_->mutex);
        open.swap(impl_->transports);
    }
    for (auto& [id, transport] : open) {
        transport->markClosed();
        transport->close(CloseCode::GoingAway, "dialer destroyed");
    }
}

// ---------------------------------------------------------------------------
// dial()
// ---------------------------------------------------------------------------

GatewayResult<std::shared_ptr<Transport>> WebSocketDialer::dial(
    const std::string& host, uint16_t port) {
    using namespace kcenon::network;

    auto id = "dial-" + std::to_string(
        impl_->nextId.fetch_add(1, std::memory_order_relaxed));

    facade::websocket_facade ws;
    auto client = ws.create_client({
        .client_id = id
    });
    if (!client) {
        return GatewayResult<std::shared_ptr<Transport>>::err(
            GatewayError(ErrorCode::ConnectionFailed, "failed to create websocket client"));
    }

    auto transport = std::make_shared<ClientTransport>(id, client);
    auto waiter = std::make_shared<ConnectWaiter>();
    auto connected = waiter->promise.get_future();

    // Observer callbacks hold a weak reference so a dropped transport does
    // not keep its client alive through the client's own observer.
    std::weak_ptr<ClientTransport> weak = transport;
    auto adapter = std::make_shared<interfaces::callback_adapter>();
    adapter->on_connected([waiter]() {
        waiter->resolve(true);
    }).on_receive([this, weak](std::span<const uint8_t> data) {
        auto t = weak.lock();
        if (!t) {
            return;
        }
        onFrame.emit(t->id(), std::string(data.begin(), data.end()));
    }).on_disconnected([this, weak, waiter](std::optional<std::string_view> /*reason*/) {
        waiter->resolve(false);
        auto t = weak.lock();
        if (!t || !t->markClosed()) {
            return;
        }
        t->markNotOpen();
        impl_->forget(t->id());
        onClosed.emit(t->id());
    }).on_error([waiter, id](std::error_code ec) {
        LogContext ctx;
        ctx.transportId = id;
        ctx.extra["error"] = ec.message();
        GCB_LOG_CTX(LogLevel::Warning, LogCategory::Network, "websocket client error", ctx);
        waiter->resolve(false);
    });
    client->set_observer(adapter);

    auto started = client->start(host, port);
    if (started.is_err()) {
        return GatewayResult<std::shared_ptr<Transport>>::err(
            GatewayError(ErrorCode::ConnectionFailed,
                         "failed to start connection to " + host + ":" + std::to_string(port)));
    }

    // The connected callback may have fired before the observer was attached.
    bool ok = client->is_connected();
    if (!ok) {
        if (connected.wait_for(impl_->connectTimeout) == std::future_status::ready) {
            ok = connected.get();
        }
    }
    if (!ok) {
        transport->markClosed();
        transport->close(CloseCode::GoingAway, "connect failed");
        return GatewayResult<std::shared_ptr<Transport>>::err(
            GatewayError(ErrorCode::ConnectionFailed,
                         "could not connect to " + host + ":" + std::to_string(port)));
    }

    {
        std::lock_guard lock(impl_->mutex);
        impl_->transports.emplace(id, transport);
    }

    LogContext ctx;
    ctx.transportId = id;
    ctx.extra["peer"] = host + ":" + std::to_string(port);
    GCB_LOG_CTX(LogLevel::Debug, LogCategory::Network, "outbound connection established", ctx);
    return GatewayResult<std::shared_ptr<Transport>>::ok(std::move(transport));
}

std::size_t WebSocketDialer::openCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->transports.size();
}

} // namespace gcb::foundation
