#pragma once

/// @file session_registry.hpp
/// @brief Owner of every Session, keyed by server id.
///
/// The registry is an ordinary object owned by GatewayServer; several
/// registries can coexist in one process (tests run gateways side by side).

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/foundation/signal.hpp"
#include "gcb/foundation/transport.hpp"
#include "gcb/service/gateway_types.hpp"
#include "gcb/service/session.hpp"

namespace gcb::service {

/// Whitelisted server identity.
struct ServerCredential {
    std::string serverId;
    std::string token;
    ConnectMode mode = ConnectMode::Listen;
};

/// Process-local table of `server_id -> Session`.
///
/// Usage:
/// @code
///   SessionRegistry registry(policy, DuplicatePolicy::Supersede);
///   registry.allow({"Survival", token, ConnectMode::Listen});
///   registry.onServerOnline.connect([&](const std::string& id) { ... });
///
///   // AUTH frame arrived on transport t:
///   auto session = registry.attach("Survival", t, presentedToken, Clock::now());
///   if (!session) { t->close(CloseCode::AuthFailed, "..."); }
/// @endcode
class SessionRegistry {
public:
    explicit SessionRegistry(SessionPolicy policy,
                             DuplicatePolicy duplicates = DuplicatePolicy::Supersede,
                             bool removeOnGiveUp = false);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // -- Whitelist ------------------------------------------------------------

    /// Add or replace a whitelisted identity.
    void allow(ServerCredential credential);

    [[nodiscard]] bool isKnown(std::string_view serverId) const;

    /// Whitelisted ids, sorted.
    [[nodiscard]] std::vector<std::string> knownServers() const;

    [[nodiscard]] std::optional<ServerCredential> credentialFor(std::string_view serverId) const;

    // -- Attach / detach ------------------------------------------------------

    /// Authenticate @p transport as @p serverId and make it the session's
    /// transport. On success the session is CONNECTED and @p greeting (if
    /// any) was written before the queued backlog.
    ///
    /// @return AuthenticationFailed (context: ErrorCode::UnknownServerId or
    ///         ErrorCode::InvalidToken), or DuplicateServerId under the
    ///         reject policy. The caller closes @p transport on failure.
    foundation::GatewayResult<std::shared_ptr<Session>> attach(
        const std::string& serverId,
        std::shared_ptr<foundation::Transport> transport,
        std::string_view token,
        Clock::time_point now,
        std::optional<std::string> greeting = std::nullopt);

    /// Create (if needed) the session for a dial-mode server and start its
    /// connect sequence.
    foundation::GatewayResult<std::shared_ptr<Session>> startDialing(
        const std::string& serverId, Clock::time_point now);

    /// Graceful detach: the session goes to CLOSED and is removed.
    /// @return ServerNotFound if no session exists.
    foundation::GatewayResult<void> detach(const std::string& serverId, Clock::time_point now);

    // -- Lookup ---------------------------------------------------------------

    /// @return ServerNotFound if no session exists for @p serverId.
    foundation::GatewayResult<std::shared_ptr<Session>> lookup(std::string_view serverId) const;

    /// (server_id, state, ...) for every session, sorted by id.
    [[nodiscard]] std::vector<SessionSummary> list() const;

    [[nodiscard]] std::size_t size() const;

    // -- Transport events and maintenance ---------------------------------------

    /// Route a transport close to the session currently bound to it.
    /// @return false when no session owns @p transportId (stale or unknown).
    bool onTransportClosed(std::string_view transportId, Clock::time_point now);

    /// A dial for @p serverId failed; counts as a connect attempt.
    void onDialFailed(const std::string& serverId, Clock::time_point now);

    /// Tick every session. Returns the ids whose backoff elapsed and that
    /// now need an outbound dial.
    std::vector<std::string> tick(Clock::time_point now);

    // -- Events ---------------------------------------------------------------

    /// A session entered CONNECTED.
    foundation::Signal<const std::string&> onServerOnline;

    /// A session left CONNECTED (for any state).
    foundation::Signal<const std::string&> onServerOffline;

private:
    std::shared_ptr<Session> createLocked(const std::string& serverId, ConnectMode mode);
    void release(const std::shared_ptr<Session>& session);
    void removeGivenUp(const std::vector<std::string>& serverIds);

    SessionPolicy policy_;
    DuplicatePolicy duplicates_;
    bool removeOnGiveUp_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ServerCredential> whitelist_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace gcb::service
