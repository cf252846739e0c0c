#pragma once

/// @file token_bucket.hpp
/// @brief Token bucket limiting inbound frames per server id.

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "gcb/service/gateway_types.hpp"

namespace gcb::service {

/// Per-key token bucket with burst capacity and a steady refill rate.
///
/// Callers pass the current time, so the limiter is deterministic in tests.
///
/// @code
///   TokenBucket bucket(50, 20); // 50 burst, 20 frames/sec sustained
///   if (!bucket.consume(serverId, Clock::now())) {
///       ++droppedFrames;
///       return;
///   }
/// @endcode
class TokenBucket {
public:
    /// @p capacity of 0 disables limiting: every consume() succeeds.
    TokenBucket(uint32_t capacity, uint32_t refillRate);

    /// Try to take one token for @p key. A new key starts full.
    [[nodiscard]] bool consume(const std::string& key, Clock::time_point now);

    /// Whole tokens currently available for @p key.
    [[nodiscard]] uint32_t available(const std::string& key, Clock::time_point now) const;

    /// Frames refused for @p key since it was last reset or removed.
    [[nodiscard]] uint64_t rejected(const std::string& key) const;

    /// Forget @p key (e.g. on detach).
    void remove(const std::string& key);

    /// Refill @p key to capacity.
    void reset(const std::string& key, Clock::time_point now);

    [[nodiscard]] bool enabled() const noexcept { return capacity_ != 0; }

private:
    struct Bucket {
        double tokens;
        Clock::time_point lastRefill;
        uint64_t rejected = 0;
    };

    void refill(Bucket& bucket, Clock::time_point now) const;

    uint32_t capacity_;
    uint32_t refillRate_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, Bucket> buckets_;
};

} // namespace gcb::service
