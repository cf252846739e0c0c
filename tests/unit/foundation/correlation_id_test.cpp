#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "gcb/foundation/correlation_id.hpp"

using namespace gcb::foundation;

// ---------------------------------------------------------------------------
// Correlation ids
// ---------------------------------------------------------------------------

TEST(CorrelationIdTest, FormatIsUuidV4) {
    const std::regex uuid(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    for (int i = 0; i < 64; ++i) {
        auto id = generateCorrelationId();
        EXPECT_EQ(id.size(), 36u);
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
    }
}

TEST(CorrelationIdTest, ConsecutiveIdsDiffer) {
    EXPECT_NE(generateCorrelationId(), generateCorrelationId());
}

TEST(CorrelationIdTest, IdsAreDistinctAcrossThreads) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::vector<std::string>> generated(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            generated[t].reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                generated[t].push_back(generateCorrelationId());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<std::string> unique;
    for (const auto& batch : generated) {
        unique.insert(batch.begin(), batch.end());
    }
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
}
