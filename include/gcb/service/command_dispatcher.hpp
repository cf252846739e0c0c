#pragma once

/// @file command_dispatcher.hpp
/// @brief `mc <verb> [@server] [args]` chat commands mapped onto gateway calls.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gcb/service/forward_table.hpp"
#include "gcb/service/router.hpp"
#include "gcb/service/session_registry.hpp"
#include "gcb/service/status_query.hpp"

namespace gcb::service {

/// One parsed chat command.
struct ParsedCommand {
    std::string verb;                    ///< lower-cased
    std::optional<std::string> serverId; ///< from `@server_id`
    std::string args;                    ///< remaining text, trimmed, inner spacing kept
};

/// Locate `mc` as a standalone word (case-insensitive, optionally after a
/// `/` prefix) followed by a verb. Returns nullopt for ordinary chat.
[[nodiscard]] std::optional<ParsedCommand> parseCommand(std::string_view text);

/// Who issued a command and from where.
struct CommandContext {
    std::string senderName;
    std::string originSession;
    /// `cmd` runs console commands and is refused without this.
    bool isAdmin = false;
};

/// Reply text handed back to the chat platform.
struct CommandReply {
    bool success = false;
    std::string text;
};

struct AutoForwardConfig {
    /// Empty disables auto-forwarding.
    std::string prefix;
    /// Origin sessions allowed to auto-forward; empty allows all.
    std::vector<std::string> sessions;
};

/// Maps each verb 1:1 onto a Router or StatusQueryFacade call. Failures are
/// returned as reply text; nothing throws.
class CommandDispatcher {
public:
    CommandDispatcher(SessionRegistry& registry, Router& router, StatusQueryFacade& status,
                      ForwardTable& table, AutoForwardConfig autoForward = {});

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    /// Parse and run @p text; nullopt when it is not an `mc` command.
    std::optional<CommandReply> handle(std::string_view text, const CommandContext& ctx);

    CommandReply execute(const ParsedCommand& command, const CommandContext& ctx);

    /// Relay a prefixed chat line as a `say`. nullopt when the line does
    /// not qualify (no prefix configured, wrong prefix, origin not allowed,
    /// or nothing left after the prefix).
    std::optional<CommandReply> autoForward(const std::string& originSession,
                                            std::string_view text,
                                            const std::string& senderName);

    [[nodiscard]] static std::string helpText();

private:
    struct Target {
        std::string serverId;
        std::optional<CommandReply> failure;
    };

    Target resolveServer(const std::optional<std::string>& requested) const;

    CommandReply doStatus(const std::string& serverId);
    CommandReply doPlayers(const std::string& serverId);
    CommandReply doSay(const std::string& serverId, const std::string& text,
                       const std::string& sender);
    CommandReply doCmd(const std::string& serverId, const std::string& command,
                       const CommandContext& ctx);
    CommandReply doInfo(const std::optional<std::string>& serverId);
    CommandReply doReconnect(const std::string& serverId);

    SessionRegistry& registry_;
    Router& router_;
    StatusQueryFacade& status_;
    ForwardTable& table_;
    AutoForwardConfig autoForward_;
};

} // namespace gcb::service
