/// @file command_dispatcher.cpp
/// @brief CommandDispatcher implementation and reply formatting.

#include "gcb/service/command_dispatcher.hpp"

#include "gcb/foundation/gateway_logger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace gcb::service {

using gcb::foundation::LogCategory;

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

struct Word {
    std::string text;
    std::size_t end = 0; ///< offset one past the word in the source text
};

std::vector<Word> splitWords(std::string_view text) {
    std::vector<Word> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        auto start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i > start) {
            words.push_back({std::string(text.substr(start, i - start)), i});
        }
    }
    return words;
}

bool isMcWord(const Word& word) {
    auto lower = toLower(word.text);
    if (lower == "mc") {
        return true;
    }
    return lower.size() == 3 && !std::isalnum(static_cast<unsigned char>(lower[0]))
        && lower.compare(1, 2, "mc") == 0;
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

CommandReply failed(std::string text) {
    return CommandReply{false, std::move(text)};
}

CommandReply failed(const foundation::GatewayError& error) {
    return CommandReply{false, "Failed: " + error.describe()};
}

// ── Formatting ──────────────────────────────────────────────────────────────

std::string formatStatus(const std::string& serverId, const protocol::StatusSnapshot& s) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "Server status: " << serverId << "\n";
    out << "Online: " << (s.online ? "yes" : "no");
    if (!s.online) {
        return out.str();
    }
    out << "\nVersion: " << (s.version.empty() ? "unknown" : s.version);
    out << "\nPlayers: " << s.onlinePlayers << "/" << s.maxPlayers;
    if (s.tps) {
        out << "\nTPS: " << (*s.tps)[0] << " / " << (*s.tps)[1] << " / " << (*s.tps)[2];
    }
    if (s.memoryUsedMb && s.memoryMaxMb) {
        out << "\nMemory: " << *s.memoryUsedMb << "MB / " << *s.memoryMaxMb << "MB";
        if (*s.memoryMaxMb > 0) {
            out << " (" << 100.0 * static_cast<double>(*s.memoryUsedMb)
                               / static_cast<double>(*s.memoryMaxMb) << "%)";
        }
    }
    if (!s.players.empty()) {
        out << "\nOnline players: ";
        for (std::size_t i = 0; i < s.players.size(); ++i) {
            out << (i == 0 ? "" : ", ") << s.players[i];
        }
    }
    return out.str();
}

std::string formatPlayers(const std::string& serverId, const protocol::PlayerList& p) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(0);
    out << "Players on " << serverId << ": " << p.online << "/" << p.max;
    if (p.list.empty()) {
        out << "\nNo players online";
        return out.str();
    }
    for (const auto& player : p.list) {
        out << "\n- " << player.name
            << " | HP " << player.health << "/" << player.maxHealth
            << " | Lv." << player.level
            << " | " << player.gameMode
            << " | " << player.world
            << " | " << player.pingMs << "ms";
    }
    return out.str();
}

std::string formatAge(std::optional<Clock::time_point> lastSeen) {
    if (!lastSeen) {
        return "never";
    }
    auto age = std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - *lastSeen);
    return std::to_string(std::max<int64_t>(age.count(), 0)) + "s ago";
}

const char* onOff(bool value) {
    return value ? "on" : "off";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

std::optional<ParsedCommand> parseCommand(std::string_view text) {
    auto words = splitWords(text);
    auto it = std::find_if(words.begin(), words.end(), isMcWord);
    if (it == words.end() || std::next(it) == words.end()) {
        return std::nullopt;
    }

    ParsedCommand cmd;
    ++it;
    cmd.verb = toLower(it->text);
    auto argsFrom = it->end;
    ++it;
    if (it != words.end() && it->text.size() > 1 && it->text.front() == '@') {
        cmd.serverId = it->text.substr(1);
        argsFrom = it->end;
    }
    // Inner spacing of the argument text is kept as typed.
    cmd.args = std::string(trimView(text.substr(argsFrom)));
    return cmd;
}

// ---------------------------------------------------------------------------
// CommandDispatcher
// ---------------------------------------------------------------------------

CommandDispatcher::CommandDispatcher(SessionRegistry& registry, Router& router,
                                     StatusQueryFacade& status, ForwardTable& table,
                                     AutoForwardConfig autoForward)
    : registry_(registry), router_(router), status_(status), table_(table),
      autoForward_(std::move(autoForward)) {}

std::string CommandDispatcher::helpText() {
    return "Commands:\n"
           "  mc status [@server]        - server status\n"
           "  mc players [@server]       - online players\n"
           "  mc info [@server]          - gateway connection state\n"
           "  mc say [@server] <text>    - send a chat message\n"
           "  mc cmd [@server] <command> - run a console command (admin)\n"
           "  mc reconnect [@server]     - reconnect now\n"
           "  mc help                    - this help";
}

std::optional<CommandReply> CommandDispatcher::handle(std::string_view text,
                                                      const CommandContext& ctx) {
    auto parsed = parseCommand(text);
    if (!parsed) {
        return std::nullopt;
    }
    return execute(*parsed, ctx);
}

CommandReply CommandDispatcher::execute(const ParsedCommand& command, const CommandContext& ctx) {
    if (command.verb == "help") {
        return CommandReply{true, helpText()};
    }
    if (command.verb == "info") {
        return doInfo(command.serverId);
    }

    static const std::vector<std::string> kServerVerbs = {
        "status", "players", "say", "cmd", "reconnect"};
    if (std::find(kServerVerbs.begin(), kServerVerbs.end(), command.verb) == kServerVerbs.end()) {
        return failed("Unknown command '" + command.verb + "'.\n" + helpText());
    }

    auto target = resolveServer(command.serverId);
    if (target.failure) {
        return *target.failure;
    }

    if (command.verb == "status") {
        return doStatus(target.serverId);
    }
    if (command.verb == "players") {
        return doPlayers(target.serverId);
    }
    if (command.verb == "say") {
        return doSay(target.serverId, command.args, ctx.senderName);
    }
    if (command.verb == "cmd") {
        return doCmd(target.serverId, command.args, ctx);
    }
    return doReconnect(target.serverId);
}

CommandDispatcher::Target CommandDispatcher::resolveServer(
    const std::optional<std::string>& requested) const {
    Target target;
    if (requested) {
        if (!registry_.isKnown(*requested)) {
            target.failure = failed("Unknown server '" + *requested + "'");
        } else {
            target.serverId = *requested;
        }
        return target;
    }

    auto known = registry_.knownServers();
    if (known.size() == 1) {
        target.serverId = known.front();
        return target;
    }
    if (known.empty()) {
        target.failure = failed("No servers are configured");
        return target;
    }
    std::string list;
    for (const auto& id : known) {
        list += (list.empty() ? "" : ", ") + id;
    }
    target.failure = failed("Specify a server with @<server_id>: " + list);
    return target;
}

// ── Verbs ───────────────────────────────────────────────────────────────────

CommandReply CommandDispatcher::doStatus(const std::string& serverId) {
    auto status = status_.queryStatus(serverId);
    if (!status) {
        return failed(status.error());
    }
    return CommandReply{true, formatStatus(serverId, status.value())};
}

CommandReply CommandDispatcher::doPlayers(const std::string& serverId) {
    auto players = status_.queryPlayers(serverId);
    if (!players) {
        return failed(players.error());
    }
    return CommandReply{true, formatPlayers(serverId, players.value())};
}

CommandReply CommandDispatcher::doSay(const std::string& serverId, const std::string& text,
                                      const std::string& sender) {
    if (text.empty()) {
        return failed("Usage: mc say [@server] <text>");
    }
    protocol::ChatPayload chat;
    chat.content = text;
    if (!sender.empty()) {
        chat.sender = sender;
    }
    auto routed = router_.routeOutbound(serverId, protocol::Message::make(serverId, chat),
                                        DeliveryMode::Queued);
    if (!routed) {
        return failed(routed.error());
    }
    auto session = registry_.lookup(serverId);
    if (session && session.value()->state() != SessionState::Connected) {
        return CommandReply{true, "Message queued for " + serverId + " (server is "
                                      + std::string(sessionStateName(session.value()->state()))
                                      + ")"};
    }
    return CommandReply{true, "Message sent to " + serverId};
}

CommandReply CommandDispatcher::doCmd(const std::string& serverId, const std::string& command,
                                      const CommandContext& ctx) {
    if (!ctx.isAdmin) {
        return failed("Permission denied: mc cmd requires an administrator");
    }
    if (command.empty()) {
        return failed("Usage: mc cmd [@server] <command>  e.g. mc cmd weather clear");
    }
    protocol::CommandPayload payload;
    payload.command = command;
    if (!ctx.senderName.empty()) {
        payload.sender = ctx.senderName;
    }
    auto routed = router_.routeOutbound(serverId, protocol::Message::make(serverId, payload),
                                        DeliveryMode::Queued);
    if (!routed) {
        return failed(routed.error());
    }
    GCB_LOG_INFO(LogCategory::Routing,
                 "console command for " + serverId + " from " + ctx.senderName);
    return CommandReply{true, "Command submitted to " + serverId + ": " + command};
}

CommandReply CommandDispatcher::doInfo(const std::optional<std::string>& serverId) {
    std::vector<std::string> ids;
    if (serverId) {
        if (!registry_.isKnown(*serverId)) {
            return failed("Unknown server '" + *serverId + "'");
        }
        ids.push_back(*serverId);
    } else {
        ids = registry_.knownServers();
    }
    if (ids.empty()) {
        return CommandReply{true, "No servers are configured"};
    }

    std::ostringstream out;
    out << "Gateway connections";
    for (const auto& id : ids) {
        auto credential = registry_.credentialFor(id);
        auto mode = credential ? credential->mode : ConnectMode::Listen;
        out << "\n\n" << id << " [" << connectModeName(mode) << "]";

        auto session = registry_.lookup(id);
        if (session) {
            auto summary = session.value()->summary();
            out << "\n  State: " << sessionStateName(summary.state)
                << "\n  Last seen: " << formatAge(summary.lastSeen)
                << "\n  Queued: " << summary.queued << ", dropped: " << summary.dropped;
            if (summary.state == SessionState::Reconnecting ||
                summary.state == SessionState::Connecting) {
                out << "\n  Attempts: " << summary.attempts;
            }
        } else {
            out << "\n  State: not connected";
        }

        auto rule = table_.ruleFor(id);
        out << "\n  Forward targets: " << rule.targets.size()
            << " (chat " << onOff(rule.forwardChat)
            << ", join/leave " << onOff(rule.forwardPlayerEvents)
            << ", state " << onOff(rule.forwardServerState)
            << ", command results " << onOff(rule.forwardCommandResults) << ")";
        out << "\n  HTTP fallback: " << (status_.hasFallback(id) ? "configured" : "none");
    }
    return CommandReply{true, out.str()};
}

CommandReply CommandDispatcher::doReconnect(const std::string& serverId) {
    auto now = Clock::now();
    auto session = registry_.lookup(serverId);
    if (!session) {
        auto credential = registry_.credentialFor(serverId);
        if (credential && credential->mode == ConnectMode::Dial) {
            auto started = registry_.startDialing(serverId, now);
            if (!started) {
                return failed(started.error());
            }
            return CommandReply{true, "Dialing " + serverId};
        }
        return failed("Server '" + serverId + "' has not connected yet; it must dial in");
    }

    session.value()->requestReconnect(now);
    GCB_LOG_INFO(LogCategory::Session, "reconnect requested for " + serverId);
    return CommandReply{true, "Reconnecting " + serverId};
}

// ---------------------------------------------------------------------------
// Auto-forward
// ---------------------------------------------------------------------------

std::optional<CommandReply> CommandDispatcher::autoForward(const std::string& originSession,
                                                           std::string_view text,
                                                           const std::string& senderName) {
    if (autoForward_.prefix.empty()) {
        return std::nullopt;
    }
    auto line = trimView(text);
    if (line.substr(0, autoForward_.prefix.size()) != autoForward_.prefix) {
        return std::nullopt;
    }
    if (!autoForward_.sessions.empty() &&
        std::find(autoForward_.sessions.begin(), autoForward_.sessions.end(), originSession)
            == autoForward_.sessions.end()) {
        return std::nullopt;
    }
    auto body = trimView(line.substr(autoForward_.prefix.size()));
    if (body.empty()) {
        return std::nullopt;
    }

    // "@server rest" picks a server explicitly.
    std::optional<std::string> requested;
    if (body.front() == '@') {
        auto space = body.find(' ');
        if (space != std::string_view::npos) {
            requested = std::string(body.substr(1, space - 1));
            body = trimView(body.substr(space + 1));
        }
    }

    if (requested || registry_.knownServers().size() == 1) {
        auto target = resolveServer(requested);
        if (target.failure) {
            return target.failure;
        }
        auto reply = doSay(target.serverId, std::string(body), senderName);
        if (reply.success) {
            reply.text = "Forwarded: [" + senderName + "] " + std::string(body);
        }
        return reply;
    }

    // Several servers and none named: relay to every live session.
    std::size_t relayed = 0;
    for (const auto& summary : registry_.list()) {
        if (summary.state == SessionState::Closed) {
            continue;
        }
        if (doSay(summary.serverId, std::string(body), senderName).success) {
            ++relayed;
        }
    }
    if (relayed == 0) {
        return failed("Forward failed: no server is connected");
    }
    return CommandReply{true, "Forwarded to " + std::to_string(relayed) + " server(s): ["
                                  + senderName + "] " + std::string(body)};
}

} // namespace gcb::service
