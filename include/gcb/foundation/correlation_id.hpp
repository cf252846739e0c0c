#pragma once

/// @file correlation_id.hpp
/// @brief Correlation id generation for request/response pairing on a shared socket.

#include <string>

namespace gcb::foundation {

/// Generate a random UUID v4 string ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
///
/// Ids link STATUS_REQUEST/STATUS_RESPONSE and BIND_CONFIRM/BIND_RESULT pairs;
/// they only need to be unique, not unguessable.
[[nodiscard]] std::string generateCorrelationId();

} // namespace gcb::foundation
