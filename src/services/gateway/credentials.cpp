/// @file credentials.cpp
/// @brief Token comparison, token fingerprints and binding code generation.

#include "gcb/service/credentials.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstdint>
#include <cstdio>
#include <limits>

namespace gcb::service {

using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;

bool tokensEqual(std::string_view presented, std::string_view expected) {
    if (presented.size() != expected.size()) {
        return false;
    }
    if (presented.empty()) {
        return true;
    }
    return CRYPTO_memcmp(presented.data(), expected.data(), presented.size()) == 0;
}

std::string tokenFingerprint(std::string_view token) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(token.data(), token.size(), digest, &digestLen,
                   EVP_sha256(), nullptr) != 1 || digestLen < 4) {
        return "????????";
    }

    char hex[9];
    std::snprintf(hex, sizeof(hex), "%02x%02x%02x%02x",
                  digest[0], digest[1], digest[2], digest[3]);
    return hex;
}

GatewayResult<std::string> generateNumericCode(std::size_t digits) {
    if (digits == 0 || digits > 18) {
        return GatewayResult<std::string>::err(
            GatewayError(ErrorCode::InvalidArgument, "code length must be 1..18 digits"));
    }

    uint64_t bound = 1;
    for (std::size_t i = 0; i < digits; ++i) {
        bound *= 10;
    }
    // Largest multiple of bound that fits; values at or above it are redrawn.
    const uint64_t limit = std::numeric_limits<uint64_t>::max()
                           - (std::numeric_limits<uint64_t>::max() % bound);

    uint64_t value = 0;
    do {
        if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
            return GatewayResult<std::string>::err(
                GatewayError(ErrorCode::RandomSourceFailed, "RAND_bytes failed"));
        }
    } while (value >= limit);

    auto text = std::to_string(value % bound);
    if (text.size() < digits) {
        text.insert(0, digits - text.size(), '0');
    }
    return GatewayResult<std::string>::ok(std::move(text));
}

} // namespace gcb::service
