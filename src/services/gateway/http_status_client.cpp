/// @file http_status_client.cpp
/// @brief HttpStatusClient implementation.
///
/// One short-lived connection per request: non-blocking connect bounded by
/// poll(), then read until the server closes.

#include "gcb/service/http_status_client.hpp"

#include "gcb/foundation/gateway_logger.hpp"
#include "gcb/protocol/codec.hpp"

#include <array>
#include <mutex>
#include <optional>
#include <shared_mutex>

// POSIX socket headers
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace gcb::service {

using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;
using gcb::foundation::LogCategory;

namespace {

GatewayError requestFailed(const std::string& what) {
    return GatewayError(ErrorCode::HttpRequestFailed, what);
}

/// Closes the descriptor on scope exit.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    [[nodiscard]] int get() const { return fd_; }

private:
    int fd_;
};

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

GatewayResult<int> connectWithin(const HttpEndpoint& endpoint,
                                 std::chrono::steady_clock::time_point deadline) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* found = nullptr;
    auto port = std::to_string(endpoint.port);
    int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &found);
    if (rc != 0) {
        return GatewayResult<int>::err(
            requestFailed("cannot resolve " + endpoint.host + ": " + gai_strerror(rc)));
    }

    std::string lastError = "no address";
    for (auto* ai = found; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            ::freeaddrinfo(found);
            return GatewayResult<int>::ok(fd);
        }
        if (errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            if (::poll(&pfd, 1, remainingMs(deadline)) == 1) {
                int soError = 0;
                socklen_t len = sizeof(soError);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
                if (soError == 0) {
                    ::freeaddrinfo(found);
                    return GatewayResult<int>::ok(fd);
                }
                lastError = std::strerror(soError);
            } else {
                lastError = "connect timed out";
            }
        } else {
            lastError = std::strerror(errno);
        }
        ::close(fd);
    }
    ::freeaddrinfo(found);
    return GatewayResult<int>::err(
        requestFailed("connect to " + endpoint.host + ":" + port + " failed: " + lastError));
}

GatewayResult<void> sendAll(int fd, std::string_view data,
                            std::chrono::steady_clock::time_point deadline) {
    while (!data.empty()) {
        auto n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n > 0) {
            data.remove_prefix(static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            if (::poll(&pfd, 1, remainingMs(deadline)) == 1) {
                continue;
            }
            return GatewayResult<void>::err(requestFailed("write timed out"));
        }
        return GatewayResult<void>::err(requestFailed(std::string("write failed: ")
                                                      + std::strerror(errno)));
    }
    return GatewayResult<void>::ok();
}

GatewayResult<std::string> readAll(int fd, std::chrono::steady_clock::time_point deadline) {
    std::string raw;
    std::array<char, 4096> buf{};
    for (;;) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, remainingMs(deadline));
        if (ready <= 0) {
            return GatewayResult<std::string>::err(requestFailed("read timed out"));
        }
        auto n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n == 0) {
            return GatewayResult<std::string>::ok(std::move(raw));
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            return GatewayResult<std::string>::err(
                requestFailed(std::string("read failed: ") + std::strerror(errno)));
        }
        raw.append(buf.data(), static_cast<std::size_t>(n));
    }
}

} // anonymous namespace

GatewayResult<std::string> parseHttpResponse(std::string_view raw) {
    // "HTTP/1.1 200 OK\r\n..."
    auto lineEnd = raw.find("\r\n");
    auto statusLine = raw.substr(0, lineEnd);
    if (statusLine.substr(0, 5) != "HTTP/") {
        return GatewayResult<std::string>::err(requestFailed("not an HTTP response"));
    }
    auto sp = statusLine.find(' ');
    if (sp == std::string_view::npos || statusLine.size() < sp + 4) {
        return GatewayResult<std::string>::err(requestFailed("malformed status line"));
    }
    auto code = statusLine.substr(sp + 1, 3);
    if (code != "200") {
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::HttpStatusError,
                         "HTTP status " + std::string(statusLine.substr(sp + 1))));
    }

    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string_view::npos) {
        return GatewayResult<std::string>::err(requestFailed("response has no body separator"));
    }
    return GatewayResult<std::string>::ok(std::string(raw.substr(headerEnd + 4)));
}

// ── Impl ────────────────────────────────────────────────────────────────────

struct HttpStatusClient::Impl {
    std::chrono::milliseconds timeout;
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, HttpEndpoint> endpoints;

    explicit Impl(std::chrono::milliseconds t) : timeout(t) {}

    std::optional<HttpEndpoint> endpointFor(const std::string& serverId) const {
        std::shared_lock lock(mutex);
        auto it = endpoints.find(serverId);
        if (it == endpoints.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

HttpStatusClient::HttpStatusClient(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<Impl>(timeout)) {}

HttpStatusClient::~HttpStatusClient() = default;

void HttpStatusClient::setEndpoint(const std::string& serverId, HttpEndpoint endpoint) {
    std::unique_lock lock(impl_->mutex);
    impl_->endpoints[serverId] = std::move(endpoint);
}

bool HttpStatusClient::hasEndpoint(const std::string& serverId) const {
    std::shared_lock lock(impl_->mutex);
    return impl_->endpoints.count(serverId) != 0;
}

GatewayResult<std::string> HttpStatusClient::get(const std::string& serverId,
                                                 std::string_view path) {
    auto endpoint = impl_->endpointFor(serverId);
    if (!endpoint) {
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::ServerNotFound,
                         "no HTTP endpoint configured for '" + serverId + "'"));
    }

    auto deadline = std::chrono::steady_clock::now() + impl_->timeout;
    auto fd = connectWithin(*endpoint, deadline);
    if (!fd) {
        GCB_LOG_WARN(LogCategory::Query, fd.error().describe());
        return GatewayResult<std::string>::err(std::move(fd).error());
    }
    SocketGuard guard(fd.value());

    std::string request = "GET " + std::string(path) + " HTTP/1.0\r\n"
                          "Host: " + endpoint->host + ":" + std::to_string(endpoint->port) + "\r\n"
                          "Accept: application/json\r\n";
    if (!endpoint->token.empty()) {
        request += "Authorization: Bearer " + endpoint->token + "\r\n";
    }
    request += "Connection: close\r\n\r\n";

    auto sent = sendAll(guard.get(), request, deadline);
    if (!sent) {
        return GatewayResult<std::string>::err(std::move(sent).error());
    }
    auto raw = readAll(guard.get(), deadline);
    if (!raw) {
        return raw;
    }
    auto body = parseHttpResponse(raw.value());
    if (!body) {
        GCB_LOG_WARN(LogCategory::Query,
                     "HTTP " + std::string(path) + " for " + serverId + ": "
                         + body.error().describe());
    }
    return body;
}

GatewayResult<protocol::StatusSnapshot> HttpStatusClient::fetchStatus(const std::string& serverId) {
    auto body = get(serverId, "/api/status");
    if (!body) {
        return GatewayResult<protocol::StatusSnapshot>::err(std::move(body).error());
    }
    return protocol::decodeStatusBody(body.value());
}

GatewayResult<protocol::PlayerList> HttpStatusClient::fetchPlayers(const std::string& serverId) {
    auto body = get(serverId, "/api/players");
    if (!body) {
        return GatewayResult<protocol::PlayerList>::err(std::move(body).error());
    }
    return protocol::decodePlayersBody(body.value());
}

} // namespace gcb::service
