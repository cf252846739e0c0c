/// @file message.cpp
/// @brief Message type name table.

#include "gcb/protocol/message.hpp"

#include <array>

namespace gcb::protocol {

namespace {

constexpr std::array<std::string_view, std::variant_size_v<Payload>> kTypeNames = {
    "CHAT",
    "COMMAND",
    "COMMAND_RESULT",
    "STATUS_REQUEST",
    "STATUS_RESPONSE",
    "PLAYER_EVENT",
    "BIND_CODE_ISSUED",
    "BIND_CONFIRM",
    "BIND_RESULT",
    "ERROR",
    "PING",
    "PONG",
    "AUTH",
    "AUTH_RESULT",
};

} // namespace

std::string_view messageTypeName(MessageType type) noexcept {
    auto idx = static_cast<std::size_t>(type);
    return idx < kTypeNames.size() ? kTypeNames[idx] : "UNKNOWN";
}

std::optional<MessageType> parseMessageType(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kTypeNames.size(); ++i) {
        if (kTypeNames[i] == name) {
            return static_cast<MessageType>(i);
        }
    }
    return std::nullopt;
}

} // namespace gcb::protocol
