#pragma once

/// @file codec.hpp
/// @brief JSON text codec for protocol messages, one message per frame.
///
/// Frame layout:
/// @code
///   {"correlationId":"...","payload":{...},"serverId":"Survival",
///    "timestamp":1718000000000,"type":"STATUS_REQUEST"}
/// @endcode
///
/// Keys are emitted in sorted order, so encoding the same Message always
/// yields the same bytes. Unknown fields are ignored on decode.

#include <string>
#include <string_view>

#include "gcb/foundation/gateway_result.hpp"
#include "gcb/protocol/message.hpp"

namespace gcb::protocol {

/// Serialize a message to a single JSON text frame.
/// @return EncodeFailed if a string field is not valid UTF-8.
[[nodiscard]] foundation::GatewayResult<std::string> encode(const Message& msg);

/// Parse one frame.
/// @return MalformedMessage when the frame is not a JSON object, the type is
///         missing or unknown, the payload is missing, or a required payload
///         field is missing or has the wrong JSON type.
[[nodiscard]] foundation::GatewayResult<Message> decode(std::string_view frame);

/// Decode an HTTP status body; a top-level `data` object is unwrapped first.
[[nodiscard]] foundation::GatewayResult<StatusSnapshot> decodeStatusBody(std::string_view body);

/// Decode an HTTP player-list body; a top-level `data` object is unwrapped first.
[[nodiscard]] foundation::GatewayResult<PlayerList> decodePlayersBody(std::string_view body);

} // namespace gcb::protocol
