#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "gcb/foundation/error_code.hpp"
#include "gcb/service/http_status_client.hpp"

using namespace gcb::service;
using gcb::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace {

/// Accepts one connection on 127.0.0.1, records the request head and
/// answers with a canned response.
class OneShotHttpServer {
public:
    explicit OneShotHttpServer(std::string response) : response_(std::move(response)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int on = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bound_ = ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0
                 && ::listen(fd_, 1) == 0;

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serveOne(); });
    }

    ~OneShotHttpServer() {
        ::shutdown(fd_, SHUT_RDWR);
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(fd_);
    }

    [[nodiscard]] bool bound() const { return bound_; }
    [[nodiscard]] uint16_t port() const { return port_; }

    /// Request head as received; valid once the client call returned.
    std::string request() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return request_;
    }

private:
    void serveOne() {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        char buf[1024];
        while (request_.find("\r\n\r\n") == std::string::npos) {
            auto n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            request_.append(buf, static_cast<std::size_t>(n));
        }
        ::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
        ::close(client);
    }

    std::string response_;
    std::string request_;
    int fd_ = -1;
    bool bound_ = false;
    uint16_t port_ = 0;
    std::thread thread_;
};

std::string okResponse(const std::string& body) {
    return "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

} // namespace

// ---------------------------------------------------------------------------
// parseHttpResponse
// ---------------------------------------------------------------------------

TEST(ParseHttpResponseTest, OkResponseYieldsBody) {
    auto body = parseHttpResponse(okResponse(R"({"online":true})"));
    ASSERT_TRUE(body.hasValue());
    EXPECT_EQ(body.value(), R"({"online":true})");
}

TEST(ParseHttpResponseTest, NonOkStatusIsHttpStatusError) {
    auto body = parseHttpResponse("HTTP/1.1 401 Unauthorized\r\n\r\n");
    ASSERT_TRUE(body.hasError());
    EXPECT_EQ(body.error().code(), ErrorCode::HttpStatusError);
    EXPECT_NE(body.error().message().find("401"), std::string::npos);
}

TEST(ParseHttpResponseTest, GarbageIsHttpRequestFailed) {
    for (const char* raw : {"", "SSH-2.0-OpenSSH", "HTTP/1.1", "HTTP/1.1 200 OK\r\nNoBody"}) {
        auto body = parseHttpResponse(raw);
        ASSERT_TRUE(body.hasError()) << raw;
        EXPECT_EQ(body.error().code(), ErrorCode::HttpRequestFailed) << raw;
    }
}

// ---------------------------------------------------------------------------
// HttpStatusClient against a loopback server
// ---------------------------------------------------------------------------

TEST(HttpStatusClientTest, UnconfiguredServerIsServerNotFound) {
    HttpStatusClient client(500ms);
    EXPECT_FALSE(client.hasEndpoint("Survival"));
    auto status = client.fetchStatus("Survival");
    ASSERT_TRUE(status.hasError());
    EXPECT_EQ(status.error().code(), ErrorCode::ServerNotFound);
}

TEST(HttpStatusClientTest, FetchStatusSendsBearerTokenAndDecodes) {
    OneShotHttpServer server(okResponse(
        R"({"code":0,"data":{"online":true,"version":"1.20.4","onlinePlayers":3,"maxPlayers":20}})"));
    ASSERT_TRUE(server.bound());

    HttpStatusClient client(2s);
    client.setEndpoint("Survival", HttpEndpoint{"127.0.0.1", server.port(), "s3cret"});
    ASSERT_TRUE(client.hasEndpoint("Survival"));

    auto status = client.fetchStatus("Survival");
    ASSERT_TRUE(status.hasValue()) << status.error().describe();
    EXPECT_EQ(status.value().onlinePlayers, 3);
    EXPECT_EQ(status.value().version, "1.20.4");

    auto request = server.request();
    EXPECT_EQ(request.rfind("GET /api/status HTTP/1.0\r\n", 0), 0u);
    EXPECT_NE(request.find("Authorization: Bearer s3cret\r\n"), std::string::npos);
}

TEST(HttpStatusClientTest, FetchPlayersPropagatesStatusError) {
    OneShotHttpServer server("HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\n\r\n");
    ASSERT_TRUE(server.bound());

    HttpStatusClient client(2s);
    client.setEndpoint("Survival", HttpEndpoint{"127.0.0.1", server.port(), ""});

    auto players = client.fetchPlayers("Survival");
    ASSERT_TRUE(players.hasError());
    EXPECT_EQ(players.error().code(), ErrorCode::HttpStatusError);

    auto request = server.request();
    EXPECT_EQ(request.rfind("GET /api/players", 0), 0u);
    EXPECT_EQ(request.find("Authorization"), std::string::npos);
}

TEST(HttpStatusClientTest, RefusedConnectionIsHttpRequestFailed) {
    uint16_t port = 0;
    {
        // Grab a free port, then release it so nothing listens there.
        OneShotHttpServer probe("");
        port = probe.port();
    }
    HttpStatusClient client(500ms);
    client.setEndpoint("Survival", HttpEndpoint{"127.0.0.1", port, "t"});

    auto status = client.fetchStatus("Survival");
    ASSERT_TRUE(status.hasError());
    EXPECT_EQ(status.error().code(), ErrorCode::HttpRequestFailed);
}
