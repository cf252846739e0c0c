#pragma once

/// @file message.hpp
/// @brief Wire message envelope and the closed set of typed payloads.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gcb::protocol {

// ---------------------------------------------------------------------------
// Message type
// ---------------------------------------------------------------------------

/// Closed set of message types. The order matches the Payload alternatives.
enum class MessageType : uint8_t {
    Chat = 0,
    Command,
    CommandResult,
    StatusRequest,
    StatusResponse,
    PlayerEvent,
    BindCodeIssued,
    BindConfirm,
    BindResult,
    Error,
    Ping,
    Pong,
    Auth,
    AuthResult
};

/// Wire name ("CHAT", "STATUS_REQUEST", ...).
[[nodiscard]] std::string_view messageTypeName(MessageType type) noexcept;

/// Inverse of messageTypeName(); nullopt for names outside the closed set.
[[nodiscard]] std::optional<MessageType> parseMessageType(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// Snapshot value types
// ---------------------------------------------------------------------------

/// Point-in-time server status. Replaced wholesale on each read.
struct StatusSnapshot {
    bool online = false;
    std::string version;
    int32_t onlinePlayers = 0;
    int32_t maxPlayers = 0;
    std::optional<std::array<double, 3>> tps; ///< 1m / 5m / 15m averages
    std::optional<int64_t> memoryUsedMb;
    std::optional<int64_t> memoryMaxMb;
    std::vector<std::string> players;

    bool operator==(const StatusSnapshot&) const = default;
};

struct PlayerInfo {
    std::string name;
    std::string uuid;
    double health = 0.0;
    double maxHealth = 0.0;
    int32_t level = 0;
    std::string gameMode;
    std::string world;
    int32_t pingMs = 0;

    bool operator==(const PlayerInfo&) const = default;
};

struct PlayerList {
    int32_t online = 0;
    int32_t max = 0;
    std::vector<PlayerInfo> list;

    bool operator==(const PlayerList&) const = default;
};

// ---------------------------------------------------------------------------
// Payloads
// ---------------------------------------------------------------------------

/// Who a gateway-to-server chat line is addressed to.
struct ChatTarget {
    enum class Kind : uint8_t { Broadcast, Player };

    Kind kind = Kind::Broadcast;
    std::string playerUuid;
    std::optional<std::string> playerName;

    bool operator==(const ChatTarget&) const = default;
};

struct ChatPayload {
    std::string content;
    std::optional<std::string> sender;
    std::optional<ChatTarget> target;

    bool operator==(const ChatPayload&) const = default;
};

struct CommandPayload {
    std::string command;
    std::optional<std::string> sender;

    bool operator==(const CommandPayload&) const = default;
};

struct CommandResultPayload {
    std::string command;
    bool success = false;
    std::string output;

    bool operator==(const CommandResultPayload&) const = default;
};

enum class StatusScope : uint8_t { Status, Players };

struct StatusRequestPayload {
    StatusScope scope = StatusScope::Status;

    bool operator==(const StatusRequestPayload&) const = default;
};

/// Carries `status` when scope is Status and `players` when scope is Players.
struct StatusResponsePayload {
    StatusScope scope = StatusScope::Status;
    std::optional<StatusSnapshot> status;
    std::optional<PlayerList> players;

    bool operator==(const StatusResponsePayload&) const = default;
};

enum class PlayerEventKind : uint8_t { Join, Leave };

struct PlayerEventPayload {
    PlayerEventKind kind = PlayerEventKind::Join;
    std::string playerName;
    std::string playerUuid;

    bool operator==(const PlayerEventPayload&) const = default;
};

/// Sent by a game server when a player asks to bind. When `code` is absent
/// the gateway generates one.
struct BindCodeIssuedPayload {
    std::string playerUuid;
    std::optional<std::string> playerName;
    std::optional<std::string> code;
    std::optional<int64_t> expiresAt; ///< epoch milliseconds
    bool force = false;

    bool operator==(const BindCodeIssuedPayload&) const = default;
};

struct BindConfirmPayload {
    std::string code;
    std::string platform;
    std::string accountId;
    std::string playerUuid;

    bool operator==(const BindConfirmPayload&) const = default;
};

struct BindResultPayload {
    std::string code;
    bool success = false;
    std::optional<std::string> message;

    bool operator==(const BindResultPayload&) const = default;
};

struct ErrorPayload {
    std::string code;
    std::string message;

    bool operator==(const ErrorPayload&) const = default;
};

struct PingPayload {
    bool operator==(const PingPayload&) const = default;
};

struct PongPayload {
    bool operator==(const PongPayload&) const = default;
};

/// First frame of every connection: the server's credentials.
struct AuthPayload {
    std::string serverId;
    std::string token;

    bool operator==(const AuthPayload&) const = default;
};

struct AuthResultPayload {
    bool success = false;
    std::string serverId;
    std::optional<std::string> reason;

    bool operator==(const AuthResultPayload&) const = default;
};

/// Tagged payload; alternative index == static_cast<size_t>(MessageType).
using Payload = std::variant<
    ChatPayload,
    CommandPayload,
    CommandResultPayload,
    StatusRequestPayload,
    StatusResponsePayload,
    PlayerEventPayload,
    BindCodeIssuedPayload,
    BindConfirmPayload,
    BindResultPayload,
    ErrorPayload,
    PingPayload,
    PongPayload,
    AuthPayload,
    AuthResultPayload>;

// ---------------------------------------------------------------------------
// Envelope
// ---------------------------------------------------------------------------

/// One protocol message.
///
/// The type is derived from the payload alternative, so a Message can never
/// carry a payload that disagrees with its type.
///
/// @code
///   auto msg = Message::make("Survival", StatusRequestPayload{StatusScope::Players},
///                            generateCorrelationId());
///   auto frame = encode(msg);
/// @endcode
struct Message {
    std::string serverId;
    std::optional<std::string> correlationId;
    int64_t timestamp = 0; ///< epoch milliseconds
    Payload payload;

    [[nodiscard]] MessageType type() const noexcept {
        return static_cast<MessageType>(payload.index());
    }

    template <typename P>
    [[nodiscard]] const P* as() const noexcept {
        return std::get_if<P>(&payload);
    }

    template <typename P>
    [[nodiscard]] P* as() noexcept {
        return std::get_if<P>(&payload);
    }

    /// Build a message stamped with the current wall-clock time.
    template <typename P>
    static Message make(std::string serverId, P payload,
                        std::optional<std::string> correlationId = std::nullopt) {
        Message msg;
        msg.serverId = std::move(serverId);
        msg.correlationId = std::move(correlationId);
        msg.timestamp = nowMillis();
        msg.payload = std::move(payload);
        return msg;
    }

    static int64_t nowMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    bool operator==(const Message&) const = default;
};

} // namespace gcb::protocol
