#pragma once

/// @file http_status_client.hpp
/// @brief HTTP fallback for status and player queries.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/service/status_query.hpp"

namespace gcb::service {

/// REST endpoint of one game server.
struct HttpEndpoint {
    std::string host;
    uint16_t port = 0;
    std::string token;
};

/// Extract the body of a raw HTTP/1.x response.
/// @return HttpRequestFailed for an unparsable response, HttpStatusError
///         for any status other than 200.
[[nodiscard]] foundation::GatewayResult<std::string> parseHttpResponse(std::string_view raw);

/// Blocking HTTP/1.0 client over POSIX sockets.
///
/// Issues `GET /api/status` and `GET /api/players` with
/// `Authorization: Bearer <token>`; both connect and read are bounded by
/// the configured timeout.
class HttpStatusClient final : public StatusFallback {
public:
    explicit HttpStatusClient(std::chrono::milliseconds timeout = std::chrono::seconds(5));
    ~HttpStatusClient() override;

    HttpStatusClient(const HttpStatusClient&) = delete;
    HttpStatusClient& operator=(const HttpStatusClient&) = delete;

    void setEndpoint(const std::string& serverId, HttpEndpoint endpoint);

    [[nodiscard]] bool hasEndpoint(const std::string& serverId) const override;

    foundation::GatewayResult<protocol::StatusSnapshot> fetchStatus(
        const std::string& serverId) override;

    foundation::GatewayResult<protocol::PlayerList> fetchPlayers(
        const std::string& serverId) override;

    /// GET @p path from the endpoint of @p serverId and return the body.
    foundation::GatewayResult<std::string> get(const std::string& serverId,
                                               std::string_view path);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gcb::service
