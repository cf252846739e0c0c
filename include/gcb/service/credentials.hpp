#pragma once

/// @file credentials.hpp
/// @brief OpenSSL-backed helpers for server tokens and binding codes.

#include <cstddef>
#include <string>
#include <string_view>

#include "gcb/foundation/gateway_result.hpp"

namespace gcb::service {

/// Constant-time token comparison (CRYPTO_memcmp). Length mismatch is
/// reported without comparing contents.
[[nodiscard]] bool tokensEqual(std::string_view presented, std::string_view expected);

/// First 8 hex chars of SHA-256(token); safe to log.
[[nodiscard]] std::string tokenFingerprint(std::string_view token);

/// @p digits decimal digits drawn from RAND_bytes (rejection-sampled, no
/// modulo bias).
/// @return RandomSourceFailed if the CSPRNG is unavailable, InvalidArgument
///         for zero or more than 18 digits.
[[nodiscard]] foundation::GatewayResult<std::string> generateNumericCode(std::size_t digits);

} // namespace gcb::service
