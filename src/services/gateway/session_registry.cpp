/// @file session_registry.cpp
/// @brief SessionRegistry implementation.

#include "gcb/service/session_registry.hpp"

#include "gcb/foundation/gateway_logger.hpp"
#include "gcb/service/credentials.hpp"

#include <algorithm>
#include <mutex>

namespace gcb::service {

using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;
using gcb::foundation::LogCategory;
using gcb::foundation::LogContext;
using gcb::foundation::LogLevel;
using gcb::foundation::Transport;

SessionRegistry::SessionRegistry(SessionPolicy policy, DuplicatePolicy duplicates,
                                 bool removeOnGiveUp)
    : policy_(policy), duplicates_(duplicates), removeOnGiveUp_(removeOnGiveUp) {}

SessionRegistry::~SessionRegistry() {
    std::unique_lock lock(mutex_);
    for (auto& [id, session] : sessions_) {
        session->onTransition.disconnectAll();
    }
    sessions_.clear();
}

// ---------------------------------------------------------------------------
// Whitelist
// ---------------------------------------------------------------------------

void SessionRegistry::allow(ServerCredential credential) {
    std::unique_lock lock(mutex_);
    auto id = credential.serverId;
    whitelist_[id] = std::move(credential);
}

bool SessionRegistry::isKnown(std::string_view serverId) const {
    std::shared_lock lock(mutex_);
    return whitelist_.count(std::string(serverId)) != 0;
}

std::vector<std::string> SessionRegistry::knownServers() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(whitelist_.size());
    for (const auto& [id, cred] : whitelist_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<ServerCredential> SessionRegistry::credentialFor(std::string_view serverId) const {
    std::shared_lock lock(mutex_);
    auto it = whitelist_.find(std::string(serverId));
    if (it == whitelist_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// Session creation
// ---------------------------------------------------------------------------

std::shared_ptr<Session> SessionRegistry::createLocked(const std::string& serverId,
                                                       ConnectMode mode) {
    auto session = std::make_shared<Session>(serverId, mode, policy_);
    session->onTransition.connect(
        [this, serverId](SessionState from, SessionState to) {
            if (to == SessionState::Connected) {
                onServerOnline.emit(serverId);
            } else if (from == SessionState::Connected) {
                onServerOffline.emit(serverId);
            }
        });
    sessions_.emplace(serverId, session);
    return session;
}

void SessionRegistry::release(const std::shared_ptr<Session>& session) {
    session->onTransition.disconnectAll();
}

// ---------------------------------------------------------------------------
// attach()
// ---------------------------------------------------------------------------

GatewayResult<std::shared_ptr<Session>> SessionRegistry::attach(
    const std::string& serverId,
    std::shared_ptr<Transport> transport,
    std::string_view token,
    Clock::time_point now,
    std::optional<std::string> greeting) {
    LogContext ctx;
    ctx.serverId = serverId;
    ctx.transportId = transport->id();
    ctx.extra["token_fp"] = tokenFingerprint(token);

    std::shared_ptr<Session> session;
    {
        std::unique_lock lock(mutex_);
        auto cred = whitelist_.find(serverId);
        if (cred == whitelist_.end()) {
            lock.unlock();
            GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                        "rejected connection for unknown server id", ctx);
            return GatewayResult<std::shared_ptr<Session>>::err(
                GatewayError(ErrorCode::AuthenticationFailed,
                             "unknown server id '" + serverId + "'",
                             ErrorCode::UnknownServerId));
        }

        if (!tokensEqual(token, cred->second.token)) {
            lock.unlock();
            // Only the presenting transport is refused; the session itself
            // belongs to whoever holds the token.
            GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                        "authentication failed: token mismatch", ctx);
            return GatewayResult<std::shared_ptr<Session>>::err(
                GatewayError(ErrorCode::AuthenticationFailed,
                             "invalid token for server '" + serverId + "'",
                             ErrorCode::InvalidToken));
        }

        auto existing = sessions_.find(serverId);
        if (existing != sessions_.end()) {
            session = existing->second;
            if (duplicates_ == DuplicatePolicy::Reject &&
                session->state() == SessionState::Connected) {
                lock.unlock();
                GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                            "duplicate connection rejected", ctx);
                return GatewayResult<std::shared_ptr<Session>>::err(
                    GatewayError(ErrorCode::DuplicateServerId,
                                 "server '" + serverId + "' is already connected"));
            }
        } else {
            session = createLocked(serverId, cred->second.mode);
        }
    }

    if (session->state() == SessionState::Connected) {
        GCB_LOG_CTX(LogLevel::Info, LogCategory::Session,
                    "superseding existing connection", ctx);
    }
    auto adopted = session->adopt(std::move(transport), now, std::move(greeting), duplicates_);
    if (!adopted) {
        GCB_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                    "duplicate connection rejected", ctx);
        return GatewayResult<std::shared_ptr<Session>>::err(std::move(adopted).error());
    }

    GCB_LOG_CTX(LogLevel::Info, LogCategory::Session, "server authenticated", ctx);
    return GatewayResult<std::shared_ptr<Session>>::ok(std::move(session));
}

GatewayResult<std::shared_ptr<Session>> SessionRegistry::startDialing(
    const std::string& serverId, Clock::time_point now) {
    std::shared_ptr<Session> session;
    {
        std::unique_lock lock(mutex_);
        auto cred = whitelist_.find(serverId);
        if (cred == whitelist_.end()) {
            return GatewayResult<std::shared_ptr<Session>>::err(
                GatewayError(ErrorCode::ServerNotFound,
                             "unknown server id '" + serverId + "'"));
        }
        auto existing = sessions_.find(serverId);
        session = existing != sessions_.end()
            ? existing->second
            : createLocked(serverId, ConnectMode::Dial);
    }
    session->beginConnecting(now);
    return GatewayResult<std::shared_ptr<Session>>::ok(std::move(session));
}

// ---------------------------------------------------------------------------
// detach() / lookup() / list()
// ---------------------------------------------------------------------------

GatewayResult<void> SessionRegistry::detach(const std::string& serverId, Clock::time_point now) {
    std::shared_ptr<Session> session;
    {
        std::unique_lock lock(mutex_);
        auto it = sessions_.find(serverId);
        if (it == sessions_.end()) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::ServerNotFound,
                             "no session for server '" + serverId + "'"));
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    // Detach still reports the offline transition before the slot goes away.
    session->detach(now);
    release(session);
    return GatewayResult<void>::ok();
}

GatewayResult<std::shared_ptr<Session>> SessionRegistry::lookup(std::string_view serverId) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(std::string(serverId));
    if (it == sessions_.end()) {
        return GatewayResult<std::shared_ptr<Session>>::err(
            GatewayError(ErrorCode::ServerNotFound,
                         "no session for server '" + std::string(serverId) + "'"));
    }
    return GatewayResult<std::shared_ptr<Session>>::ok(it->second);
}

std::vector<SessionSummary> SessionRegistry::list() const {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }
    std::vector<SessionSummary> out;
    out.reserve(snapshot.size());
    for (const auto& session : snapshot) {
        out.push_back(session->summary());
    }
    std::sort(out.begin(), out.end(),
              [](const SessionSummary& a, const SessionSummary& b) {
                  return a.serverId < b.serverId;
              });
    return out;
}

std::size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

// ---------------------------------------------------------------------------
// Transport events / tick
// ---------------------------------------------------------------------------

bool SessionRegistry::onTransportClosed(std::string_view transportId, Clock::time_point now) {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }
    for (const auto& session : snapshot) {
        if (session->onTransportLost(transportId, now)) {
            return true;
        }
    }
    return false;
}

void SessionRegistry::onDialFailed(const std::string& serverId, Clock::time_point now) {
    auto session = lookup(serverId);
    if (!session) {
        return;
    }
    if (session.value()->onDialFailed(now)) {
        removeGivenUp({serverId});
    }
}

void SessionRegistry::removeGivenUp(const std::vector<std::string>& serverIds) {
    if (!removeOnGiveUp_ || serverIds.empty()) {
        return;
    }
    std::unique_lock lock(mutex_);
    for (const auto& id : serverIds) {
        auto it = sessions_.find(id);
        if (it != sessions_.end() && it->second->state() == SessionState::Closed) {
            release(it->second);
            sessions_.erase(it);
            GCB_LOG_INFO(LogCategory::Session, "removed session after giving up: " + id);
        }
    }
}

std::vector<std::string> SessionRegistry::tick(Clock::time_point now) {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    std::vector<std::string> dials;
    std::vector<std::string> gaveUp;
    for (const auto& session : snapshot) {
        switch (session->tick(now)) {
            case SessionTick::DialRequested:
                dials.push_back(session->serverId());
                break;
            case SessionTick::GaveUp:
                gaveUp.push_back(session->serverId());
                break;
            case SessionTick::None:
                break;
        }
    }

    removeGivenUp(gaveUp);
    std::sort(dials.begin(), dials.end());
    return dials;
}

} // namespace gcb::service
