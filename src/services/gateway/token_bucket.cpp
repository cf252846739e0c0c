/// @file token_bucket.cpp
/// @brief TokenBucket implementation.

#include "gcb/service/token_bucket.hpp"

#include <algorithm>

namespace gcb::service {

TokenBucket::TokenBucket(uint32_t capacity, uint32_t refillRate)
    : capacity_(capacity), refillRate_(refillRate) {}

bool TokenBucket::consume(const std::string& key, Clock::time_point now) {
    if (capacity_ == 0) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, Bucket{static_cast<double>(capacity_), now}).first;
    }

    refill(it->second, now);
    if (it->second.tokens < 1.0) {
        ++it->second.rejected;
        return false;
    }
    it->second.tokens -= 1.0;
    return true;
}

uint32_t TokenBucket::available(const std::string& key, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return capacity_;
    }
    refill(it->second, now);
    return static_cast<uint32_t>(it->second.tokens);
}

uint64_t TokenBucket::rejected(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(key);
    return it == buckets_.end() ? 0 : it->second.rejected;
}

void TokenBucket::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_.erase(key);
}

void TokenBucket::reset(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_[key] = Bucket{static_cast<double>(capacity_), now};
}

void TokenBucket::refill(Bucket& bucket, Clock::time_point now) const {
    if (now <= bucket.lastRefill) {
        return;
    }
    auto elapsed = std::chrono::duration<double>(now - bucket.lastRefill).count();
    bucket.tokens = std::min(bucket.tokens + elapsed * static_cast<double>(refillRate_),
                             static_cast<double>(capacity_));
    bucket.lastRefill = now;
}

} // namespace gcb::service
