#pragma once

/// @file gateway_result.hpp
/// @brief GatewayResult<T> alias for gateway operations.

#include "gcb/core/result.hpp"
#include "gcb/foundation/gateway_error.hpp"

namespace gcb::foundation {

/// Result type specialized with GatewayError.
///
/// Example:
/// @code
///   GatewayResult<ForwardTarget> parseTarget(std::string_view text) {
///       if (text.empty()) {
///           return GatewayResult<ForwardTarget>::err(
///               GatewayError(ErrorCode::InvalidForwardTarget, "empty target"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using GatewayResult = gcb::Result<T, GatewayError>;

}  // namespace gcb::foundation
