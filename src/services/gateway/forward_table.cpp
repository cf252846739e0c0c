/// @file forward_table.cpp
/// @brief ForwardTarget parsing and ForwardTable implementation.

#include "gcb/service/forward_table.hpp"

#include "gcb/foundation/gateway_logger.hpp"

#include <mutex>

namespace gcb::service {

using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;
using gcb::foundation::LogCategory;

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

} // namespace

// -- ForwardTarget -------------------------------------------------------------

GatewayResult<ForwardTarget> ForwardTarget::parse(std::string_view text) {
    auto s = trim(text);
    auto first = s.find(':');
    auto second = first == std::string_view::npos ? first : s.find(':', first + 1);
    if (second == std::string_view::npos) {
        return GatewayResult<ForwardTarget>::err(
            GatewayError(ErrorCode::InvalidForwardTarget,
                         "expected platform:message_type:session_id, got '"
                             + std::string(text) + "'"));
    }

    ForwardTarget target;
    target.platform = std::string(trim(s.substr(0, first)));
    target.messageType = std::string(trim(s.substr(first + 1, second - first - 1)));
    target.sessionId = std::string(trim(s.substr(second + 1)));
    if (target.platform.empty() || target.messageType.empty() || target.sessionId.empty()) {
        return GatewayResult<ForwardTarget>::err(
            GatewayError(ErrorCode::InvalidForwardTarget,
                         "empty component in forward target '" + std::string(text) + "'"));
    }
    return GatewayResult<ForwardTarget>::ok(std::move(target));
}

std::string ForwardTarget::toString() const {
    return platform + ":" + messageType + ":" + sessionId;
}

std::set<ForwardTarget> parseForwardTargets(const std::vector<std::string>& lines) {
    std::set<ForwardTarget> targets;
    for (const auto& line : lines) {
        auto parsed = ForwardTarget::parse(line);
        if (!parsed) {
            GCB_LOG_WARN(LogCategory::Config,
                         "ignoring forward target: " + std::string(parsed.error().message()));
            continue;
        }
        targets.insert(std::move(parsed).value());
    }
    return targets;
}

// -- ForwardTable --------------------------------------------------------------

ForwardRule ForwardTable::ruleFor(std::string_view serverId) const {
    std::shared_lock lock(mutex_);
    auto it = rules_.find(std::string(serverId));
    if (it == rules_.end()) {
        return ForwardRule{};
    }
    return it->second;
}

void ForwardTable::setRule(const std::string& serverId, ForwardRule rule) {
    std::unique_lock lock(mutex_);
    rules_[serverId] = std::move(rule);
}

void ForwardTable::reloadForwarding(std::unordered_map<std::string, ForwardRule> rules) {
    std::unique_lock lock(mutex_);
    rules_ = std::move(rules);
}

std::size_t ForwardTable::size() const {
    std::shared_lock lock(mutex_);
    return rules_.size();
}

} // namespace gcb::service
