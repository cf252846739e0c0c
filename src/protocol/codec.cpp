/// @file codec.cpp
/// @brief nlohmann::json based encode/decode for protocol frames.

#include "gcb/protocol/codec.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace gcb::protocol {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using json = nlohmann::json;

namespace {

// ---------------------------------------------------------------------------
// Field access
//
// Decoding helpers throw FieldError; decode() catches it at the boundary and
// turns it into MalformedMessage. Nothing else in this file throws.
// ---------------------------------------------------------------------------

struct FieldError {
    std::string reason;
};

const json& require(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw FieldError{std::string("missing field '") + key + "'"};
    }
    return *it;
}

[[noreturn]] void wrongType(const char* key, const char* expected) {
    throw FieldError{std::string("field '") + key + "' must be " + expected};
}

std::string requireString(const json& obj, const char* key) {
    const auto& v = require(obj, key);
    if (!v.is_string()) {
        wrongType(key, "a string");
    }
    return v.get<std::string>();
}

bool requireBool(const json& obj, const char* key) {
    const auto& v = require(obj, key);
    if (!v.is_boolean()) {
        wrongType(key, "a boolean");
    }
    return v.get<bool>();
}

const json& requireObject(const json& obj, const char* key) {
    const auto& v = require(obj, key);
    if (!v.is_object()) {
        wrongType(key, "an object");
    }
    return v;
}

std::optional<std::string> optString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        wrongType(key, "a string");
    }
    return it->get<std::string>();
}

std::optional<bool> optBool(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        wrongType(key, "a boolean");
    }
    return it->get<bool>();
}

std::optional<int64_t> optInt(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        wrongType(key, "an integer");
    }
    return it->get<int64_t>();
}

std::optional<double> optNumber(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        wrongType(key, "a number");
    }
    return it->get<double>();
}

// -- Enumerations -----------------------------------------------------------

std::string_view scopeName(StatusScope scope) {
    return scope == StatusScope::Players ? "PLAYERS" : "STATUS";
}

StatusScope parseScope(const json& obj) {
    auto text = requireString(obj, "scope");
    if (text == "STATUS") return StatusScope::Status;
    if (text == "PLAYERS") return StatusScope::Players;
    throw FieldError{"unknown scope '" + text + "'"};
}

std::string_view eventKindName(PlayerEventKind kind) {
    return kind == PlayerEventKind::Leave ? "LEAVE" : "JOIN";
}

PlayerEventKind parseEventKind(const json& obj) {
    auto text = requireString(obj, "kind");
    if (text == "JOIN") return PlayerEventKind::Join;
    if (text == "LEAVE") return PlayerEventKind::Leave;
    throw FieldError{"unknown player event kind '" + text + "'"};
}

// ---------------------------------------------------------------------------
// Snapshot values
// ---------------------------------------------------------------------------

json toJson(const StatusSnapshot& s) {
    json j = {
        {"online", s.online},
        {"version", s.version},
        {"onlinePlayers", s.onlinePlayers},
        {"maxPlayers", s.maxPlayers},
        {"players", s.players},
    };
    if (s.tps) {
        j["tps"] = json::array({(*s.tps)[0], (*s.tps)[1], (*s.tps)[2]});
    }
    if (s.memoryUsedMb) j["memoryUsedMb"] = *s.memoryUsedMb;
    if (s.memoryMaxMb) j["memoryMaxMb"] = *s.memoryMaxMb;
    return j;
}

json toJson(const PlayerInfo& p) {
    return {
        {"name", p.name},
        {"uuid", p.uuid},
        {"health", p.health},
        {"maxHealth", p.maxHealth},
        {"level", p.level},
        {"gameMode", p.gameMode},
        {"world", p.world},
        {"pingMs", p.pingMs},
    };
}

json toJson(const PlayerList& l) {
    json list = json::array();
    for (const auto& p : l.list) {
        list.push_back(toJson(p));
    }
    return {{"online", l.online}, {"max", l.max}, {"list", std::move(list)}};
}

StatusSnapshot snapshotFromJson(const json& j) {
    if (!j.is_object()) {
        throw FieldError{"status must be an object"};
    }
    StatusSnapshot s;
    s.online = requireBool(j, "online");
    s.version = optString(j, "version").value_or("");
    s.onlinePlayers = static_cast<int32_t>(optInt(j, "onlinePlayers").value_or(0));
    s.maxPlayers = static_cast<int32_t>(optInt(j, "maxPlayers").value_or(0));
    s.memoryUsedMb = optInt(j, "memoryUsedMb");
    s.memoryMaxMb = optInt(j, "memoryMaxMb");

    if (auto it = j.find("tps"); it != j.end() && !it->is_null()) {
        if (!it->is_array() || it->size() != 3) {
            throw FieldError{"field 'tps' must be an array of three numbers"};
        }
        std::array<double, 3> tps{};
        for (std::size_t i = 0; i < 3; ++i) {
            if (!(*it)[i].is_number()) {
                throw FieldError{"field 'tps' must be an array of three numbers"};
            }
            tps[i] = (*it)[i].get<double>();
        }
        s.tps = tps;
    }

    if (auto it = j.find("players"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            wrongType("players", "an array");
        }
        for (const auto& name : *it) {
            if (!name.is_string()) {
                wrongType("players", "an array of strings");
            }
            s.players.push_back(name.get<std::string>());
        }
    }
    return s;
}

PlayerList playerListFromJson(const json& j) {
    if (!j.is_object()) {
        throw FieldError{"players must be an object"};
    }
    PlayerList l;
    if (auto it = j.find("list"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            wrongType("list", "an array");
        }
        for (const auto& entry : *it) {
            if (!entry.is_object()) {
                wrongType("list", "an array of objects");
            }
            PlayerInfo p;
            p.name = requireString(entry, "name");
            p.uuid = requireString(entry, "uuid");
            p.health = optNumber(entry, "health").value_or(0.0);
            p.maxHealth = optNumber(entry, "maxHealth").value_or(0.0);
            p.level = static_cast<int32_t>(optInt(entry, "level").value_or(0));
            p.gameMode = optString(entry, "gameMode").value_or("");
            p.world = optString(entry, "world").value_or("");
            p.pingMs = static_cast<int32_t>(optInt(entry, "pingMs").value_or(0));
            l.list.push_back(std::move(p));
        }
    }
    l.online = static_cast<int32_t>(
        optInt(j, "online").value_or(static_cast<int64_t>(l.list.size())));
    l.max = static_cast<int32_t>(optInt(j, "max").value_or(0));
    return l;
}

// ---------------------------------------------------------------------------
// Payload encoding
// ---------------------------------------------------------------------------

struct PayloadEncoder {
    json operator()(const ChatPayload& p) const {
        json j = {{"content", p.content}};
        if (p.sender) j["sender"] = *p.sender;
        if (p.target) {
            json t;
            if (p.target->kind == ChatTarget::Kind::Player) {
                t["kind"] = "PLAYER";
                t["playerUuid"] = p.target->playerUuid;
                if (p.target->playerName) t["playerName"] = *p.target->playerName;
            } else {
                t["kind"] = "BROADCAST";
            }
            j["target"] = std::move(t);
        }
        return j;
    }

    json operator()(const CommandPayload& p) const {
        json j = {{"command", p.command}};
        if (p.sender) j["sender"] = *p.sender;
        return j;
    }

    json operator()(const CommandResultPayload& p) const {
        return {{"command", p.command}, {"success", p.success}, {"output", p.output}};
    }

    json operator()(const StatusRequestPayload& p) const {
        return {{"scope", std::string(scopeName(p.scope))}};
    }

    json operator()(const StatusResponsePayload& p) const {
        json j = {{"scope", std::string(scopeName(p.scope))}};
        if (p.status) j["status"] = toJson(*p.status);
        if (p.players) j["players"] = toJson(*p.players);
        return j;
    }

    json operator()(const PlayerEventPayload& p) const {
        return {{"kind", std::string(eventKindName(p.kind))},
                {"playerName", p.playerName},
                {"playerUuid", p.playerUuid}};
    }

    json operator()(const BindCodeIssuedPayload& p) const {
        json j = {{"playerUuid", p.playerUuid}, {"force", p.force}};
        if (p.playerName) j["playerName"] = *p.playerName;
        if (p.code) j["code"] = *p.code;
        if (p.expiresAt) j["expiresAt"] = *p.expiresAt;
        return j;
    }

    json operator()(const BindConfirmPayload& p) const {
        return {{"code", p.code},
                {"platform", p.platform},
                {"accountId", p.accountId},
                {"playerUuid", p.playerUuid}};
    }

    json operator()(const BindResultPayload& p) const {
        json j = {{"code", p.code}, {"success", p.success}};
        if (p.message) j["message"] = *p.message;
        return j;
    }

    json operator()(const ErrorPayload& p) const {
        return {{"code", p.code}, {"message", p.message}};
    }

    json operator()(const PingPayload&) const { return json::object(); }
    json operator()(const PongPayload&) const { return json::object(); }

    json operator()(const AuthPayload& p) const {
        return {{"serverId", p.serverId}, {"token", p.token}};
    }

    json operator()(const AuthResultPayload& p) const {
        json j = {{"success", p.success}, {"serverId", p.serverId}};
        if (p.reason) j["reason"] = *p.reason;
        return j;
    }
};

// ---------------------------------------------------------------------------
// Payload decoding
// ---------------------------------------------------------------------------

Payload decodePayload(MessageType type, const json& j) {
    switch (type) {
        case MessageType::Chat: {
            ChatPayload p;
            p.content = requireString(j, "content");
            p.sender = optString(j, "sender");
            if (auto it = j.find("target"); it != j.end() && !it->is_null()) {
                if (!it->is_object()) {
                    wrongType("target", "an object");
                }
                ChatTarget t;
                auto kind = requireString(*it, "kind");
                if (kind == "PLAYER") {
                    t.kind = ChatTarget::Kind::Player;
                    t.playerUuid = requireString(*it, "playerUuid");
                    t.playerName = optString(*it, "playerName");
                } else if (kind != "BROADCAST") {
                    throw FieldError{"unknown chat target kind '" + kind + "'"};
                }
                p.target = std::move(t);
            }
            return p;
        }
        case MessageType::Command:
            return CommandPayload{requireString(j, "command"), optString(j, "sender")};
        case MessageType::CommandResult:
            return CommandResultPayload{requireString(j, "command"),
                                        requireBool(j, "success"),
                                        optString(j, "output").value_or("")};
        case MessageType::StatusRequest:
            return StatusRequestPayload{parseScope(j)};
        case MessageType::StatusResponse: {
            StatusResponsePayload p;
            p.scope = parseScope(j);
            if (p.scope == StatusScope::Status) {
                p.status = snapshotFromJson(requireObject(j, "status"));
            } else {
                p.players = playerListFromJson(requireObject(j, "players"));
            }
            return p;
        }
        case MessageType::PlayerEvent:
            return PlayerEventPayload{parseEventKind(j),
                                      requireString(j, "playerName"),
                                      requireString(j, "playerUuid")};
        case MessageType::BindCodeIssued: {
            BindCodeIssuedPayload p;
            p.playerUuid = requireString(j, "playerUuid");
            p.playerName = optString(j, "playerName");
            p.code = optString(j, "code");
            p.expiresAt = optInt(j, "expiresAt");
            p.force = optBool(j, "force").value_or(false);
            return p;
        }
        case MessageType::BindConfirm:
            return BindConfirmPayload{requireString(j, "code"),
                                      requireString(j, "platform"),
                                      requireString(j, "accountId"),
                                      requireString(j, "playerUuid")};
        case MessageType::BindResult:
            return BindResultPayload{requireString(j, "code"),
                                     requireBool(j, "success"),
                                     optString(j, "message")};
        case MessageType::Error:
            return ErrorPayload{requireString(j, "code"),
                                optString(j, "message").value_or("")};
        case MessageType::Ping:
            return PingPayload{};
        case MessageType::Pong:
            return PongPayload{};
        case MessageType::Auth:
            return AuthPayload{requireString(j, "serverId"), requireString(j, "token")};
        case MessageType::AuthResult:
            return AuthResultPayload{requireBool(j, "success"),
                                     optString(j, "serverId").value_or(""),
                                     optString(j, "reason")};
    }
    throw FieldError{"unhandled message type"};
}

GatewayError malformed(std::string reason) {
    return GatewayError(ErrorCode::MalformedMessage, std::move(reason));
}

/// Parse @p body and unwrap `{"data": {...}}` when present.
GatewayResult<json> parseHttpBody(std::string_view body) {
    auto root = json::parse(body.begin(), body.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return GatewayResult<json>::err(malformed("response body is not a JSON object"));
    }
    if (auto it = root.find("data"); it != root.end() && it->is_object()) {
        return GatewayResult<json>::ok(*it);
    }
    return GatewayResult<json>::ok(std::move(root));
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

GatewayResult<std::string> encode(const Message& msg) {
    json j;
    j["type"] = std::string(messageTypeName(msg.type()));
    j["serverId"] = msg.serverId;
    if (msg.correlationId) {
        j["correlationId"] = *msg.correlationId;
    }
    j["timestamp"] = msg.timestamp;
    j["payload"] = std::visit(PayloadEncoder{}, msg.payload);

    try {
        return GatewayResult<std::string>::ok(j.dump());
    } catch (const json::type_error& e) {
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::EncodeFailed, e.what()));
    }
}

GatewayResult<Message> decode(std::string_view frame) {
    auto root = json::parse(frame.begin(), frame.end(), nullptr, false);
    if (root.is_discarded()) {
        return GatewayResult<Message>::err(malformed("frame is not valid JSON"));
    }
    if (!root.is_object()) {
        return GatewayResult<Message>::err(malformed("frame root is not an object"));
    }

    try {
        auto typeName = requireString(root, "type");
        auto type = parseMessageType(typeName);
        if (!type) {
            return GatewayResult<Message>::err(
                malformed("unknown message type '" + typeName + "'"));
        }

        Message msg;
        msg.serverId = optString(root, "serverId").value_or("");
        msg.correlationId = optString(root, "correlationId");
        msg.timestamp = optInt(root, "timestamp").value_or(0);
        msg.payload = decodePayload(*type, requireObject(root, "payload"));
        return GatewayResult<Message>::ok(std::move(msg));
    } catch (const FieldError& e) {
        return GatewayResult<Message>::err(malformed(e.reason));
    }
}

GatewayResult<StatusSnapshot> decodeStatusBody(std::string_view body) {
    auto parsed = parseHttpBody(body);
    if (!parsed) {
        return GatewayResult<StatusSnapshot>::err(std::move(parsed).error());
    }
    try {
        return GatewayResult<StatusSnapshot>::ok(snapshotFromJson(parsed.value()));
    } catch (const FieldError& e) {
        return GatewayResult<StatusSnapshot>::err(malformed(e.reason));
    }
}

GatewayResult<PlayerList> decodePlayersBody(std::string_view body) {
    auto parsed = parseHttpBody(body);
    if (!parsed) {
        return GatewayResult<PlayerList>::err(std::move(parsed).error());
    }
    try {
        return GatewayResult<PlayerList>::ok(playerListFromJson(parsed.value()));
    } catch (const FieldError& e) {
        return GatewayResult<PlayerList>::err(malformed(e.reason));
    }
}

} // namespace gcb::protocol
