#pragma once

/// @file forward_table.hpp
/// @brief Per-server forwarding rules: where inbound game events are relayed.

#include <compare>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gcb/foundation/gateway_result.hpp"

namespace gcb::service {

/// One chat-platform destination, written `platform:message_type:session_id`.
struct ForwardTarget {
    std::string platform;
    std::string messageType;
    std::string sessionId;

    /// Split on the first two colons; the session id keeps any further colons.
    /// @return InvalidForwardTarget for fewer than three non-empty parts.
    static foundation::GatewayResult<ForwardTarget> parse(std::string_view text);

    [[nodiscard]] std::string toString() const;

    auto operator<=>(const ForwardTarget&) const = default;
};

/// Forwarding configuration of one server. An empty target set disables
/// forwarding entirely.
struct ForwardRule {
    std::set<ForwardTarget> targets;
    bool forwardChat = true;
    bool forwardPlayerEvents = true;
    bool forwardServerState = false;
    bool forwardCommandResults = true;
};

/// Read-mostly table of forward rules, keyed by server id.
///
/// Readers take a shared lock; reloadForwarding() swaps the whole table
/// under the writer lock.
class ForwardTable {
public:
    ForwardTable() = default;

    ForwardTable(const ForwardTable&) = delete;
    ForwardTable& operator=(const ForwardTable&) = delete;

    /// Rule for @p serverId; a default rule with no targets if none is set.
    [[nodiscard]] ForwardRule ruleFor(std::string_view serverId) const;

    void setRule(const std::string& serverId, ForwardRule rule);

    /// Replace every rule at once.
    void reloadForwarding(std::unordered_map<std::string, ForwardRule> rules);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ForwardRule> rules_;
};

/// Parse a list of target strings, skipping (and logging) malformed ones.
[[nodiscard]] std::set<ForwardTarget> parseForwardTargets(const std::vector<std::string>& lines);

} // namespace gcb::service
