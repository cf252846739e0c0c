#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gcb/foundation/error_code.hpp"
#include "gcb/protocol/message.hpp"
#include "gcb/service/binding_coordinator.hpp"
#include "gcb/service/forward_table.hpp"
#include "gcb/service/router.hpp"
#include "gcb/service/session_registry.hpp"
#include "test_doubles.hpp"

using namespace gcb::service;
using gcb::foundation::ErrorCode;
using gcb::protocol::BindConfirmPayload;
using gcb::protocol::BindResultPayload;
using gcb::protocol::MessageType;
using gcb::test::FakeTransport;
using gcb::test::RecordingSink;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Fixture: coordinator with a manual wall clock
// ---------------------------------------------------------------------------

class BindingCoordinatorTest : public ::testing::Test {
protected:
    using SystemClock = std::chrono::system_clock;

    void SetUp() override {
        registry_.allow({"Survival", "s3cret", ConnectMode::Listen});
        registry_.allow({"Creative", "other", ConnectMode::Listen});
    }

    static BindingConfig makeConfig() {
        BindingConfig cfg;
        cfg.ttl = 300s;
        cfg.settledRetention = 60s;
        cfg.outboxCapacity = 2;
        return cfg;
    }

    std::shared_ptr<FakeTransport> connect(const std::string& serverId, const std::string& token) {
        auto transport = std::make_shared<FakeTransport>("ws-" + serverId);
        EXPECT_TRUE(registry_.attach(serverId, transport, token, Clock::now()).hasValue());
        return transport;
    }

    std::vector<BindConfirmPayload> confirmsOn(const FakeTransport& transport) {
        std::vector<BindConfirmPayload> out;
        for (const auto& msg : transport.messagesOfType(MessageType::BindConfirm)) {
            out.push_back(*msg.as<BindConfirmPayload>());
        }
        return out;
    }

    SystemClock::time_point clock_ = SystemClock::now();
    SessionRegistry registry_{SessionPolicy{}};
    ForwardTable table_;
    RecordingSink sink_;
    Router router_{registry_, table_, sink_};
    BindingCoordinator binding_{makeConfig(), router_, sink_, [this] { return clock_; }};
};

// ---------------------------------------------------------------------------
// Issuing
// ---------------------------------------------------------------------------

TEST_F(BindingCoordinatorTest, IssueGeneratesSixDigitCodeAndNotifiesPrivately) {
    auto code = binding_.issue("Survival", "uuid-steve", "Steve");
    ASSERT_TRUE(code.hasValue());
    ASSERT_EQ(code.value().size(), 6u);
    for (char c : code.value()) {
        EXPECT_TRUE(c >= '0' && c <= '9');
    }

    auto codes = sink_.codes();
    ASSERT_EQ(codes.size(), 1u);
    EXPECT_EQ(codes[0].code, code.value());
    EXPECT_EQ(codes[0].playerName, "Steve");
    EXPECT_EQ(codes[0].expiresAt - codes[0].issuedAt, 300s);
    EXPECT_EQ(binding_.status(code.value()), BindingStatus::Pending);
}

TEST_F(BindingCoordinatorTest, IssueRequiresPlayerUuid) {
    auto code = binding_.issue("Survival", "");
    ASSERT_TRUE(code.hasError());
    EXPECT_EQ(code.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(BindingCoordinatorTest, ReissueForSamePlayerIsIndependent) {
    auto first = binding_.issue("Survival", "uuid-steve");
    auto second = binding_.issue("Survival", "uuid-steve");
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(binding_.pendingCount(), 2u);

    ASSERT_TRUE(binding_.confirm(second.value(), "kook", "U1").hasValue());
    EXPECT_EQ(binding_.status(first.value()), BindingStatus::Pending);
}

TEST_F(BindingCoordinatorTest, RegisterIssuedIsIdempotentForSamePlayer) {
    auto until = clock_ + 120s;
    ASSERT_TRUE(binding_.registerIssued("Survival", "777777", "uuid-1", "Steve", until, false)
                    .hasValue());
    ASSERT_TRUE(binding_.registerIssued("Survival", "777777", "uuid-1", "Steve", until, false)
                    .hasValue());
    EXPECT_EQ(sink_.codes().size(), 1u);
    EXPECT_EQ(sink_.codes()[0].expiresAt, until);

    auto clash = binding_.registerIssued("Creative", "777777", "uuid-2", "Alex", until, false);
    ASSERT_TRUE(clash.hasError());
    EXPECT_EQ(clash.error().code(), ErrorCode::CodeCollision);

    auto empty = binding_.registerIssued("Survival", "", "uuid-1", "Steve", until, false);
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code(), ErrorCode::InvalidArgument);
}

// ---------------------------------------------------------------------------
// Confirming
// ---------------------------------------------------------------------------

TEST_F(BindingCoordinatorTest, ConfirmSendsBindConfirmToOriginatingServer) {
    auto survival = connect("Survival", "s3cret");
    auto creative = connect("Creative", "other");

    auto code = binding_.issue("Survival", "uuid-steve", "Steve");
    ASSERT_TRUE(code.hasValue());

    auto ack = binding_.confirm(code.value(), "kook", "U123");
    ASSERT_TRUE(ack.hasValue());
    EXPECT_TRUE(ack.value().dispatched);
    EXPECT_EQ(ack.value().serverId, "Survival");

    auto confirms = confirmsOn(*survival);
    ASSERT_EQ(confirms.size(), 1u);
    EXPECT_EQ(confirms[0].code, code.value());
    EXPECT_EQ(confirms[0].platform, "kook");
    EXPECT_EQ(confirms[0].accountId, "U123");
    EXPECT_EQ(confirms[0].playerUuid, "uuid-steve");
    EXPECT_TRUE(confirmsOn(*creative).empty());

    auto again = binding_.confirm(code.value(), "kook", "U999");
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyConfirmed);
    EXPECT_EQ(confirmsOn(*survival).size(), 1u);
}

TEST_F(BindingCoordinatorTest, RedeliveredCodeIsNotRevivedAfterConfirm) {
    auto survival = connect("Survival", "s3cret");
    auto until = clock_ + 300s;
    ASSERT_TRUE(binding_.registerIssued("Survival", "482913", "uuid-steve", "Steve", until, false)
                    .hasValue());
    ASSERT_TRUE(binding_.confirm("482913", "kook", "U123").hasValue());

    // The server replays BIND_CODE_ISSUED after a reconnect.
    auto replay = binding_.registerIssued("Survival", "482913", "uuid-steve", "Steve", until,
                                          false);
    ASSERT_TRUE(replay.hasValue());
    EXPECT_EQ(binding_.status("482913"), BindingStatus::Confirmed);
    EXPECT_EQ(sink_.codes().size(), 1u);

    auto second = binding_.confirm("482913", "kook", "U999");
    ASSERT_TRUE(second.hasError());
    EXPECT_EQ(second.error().code(), ErrorCode::AlreadyConfirmed);
    EXPECT_EQ(confirmsOn(*survival).size(), 1u);

    auto other = binding_.registerIssued("Creative", "482913", "uuid-alex", "Alex", until, false);
    ASSERT_TRUE(other.hasError());
    EXPECT_EQ(other.error().code(), ErrorCode::CodeCollision);
}

TEST_F(BindingCoordinatorTest, CancelledCodeStaysCancelledOnRedelivery) {
    ASSERT_TRUE(binding_.registerIssued("Survival", "135790", "uuid-steve", "Steve",
                                        clock_ + 300s, false).hasValue());
    ASSERT_TRUE(binding_.cancel("135790").hasValue());

    ASSERT_TRUE(binding_.registerIssued("Survival", "135790", "uuid-steve", "Steve",
                                        clock_ + 300s, false).hasValue());
    EXPECT_EQ(binding_.status("135790"), BindingStatus::Cancelled);
    EXPECT_EQ(binding_.confirm("135790", "kook", "U1").error().code(), ErrorCode::CodeNotFound);
}

TEST_F(BindingCoordinatorTest, ExpiredCodeMayBeRegisteredAgain) {
    ASSERT_TRUE(binding_.registerIssued("Survival", "246801", "uuid-steve", "Steve",
                                        clock_ + 10s, false).hasValue());
    clock_ += 11s;
    binding_.sweep();
    ASSERT_EQ(binding_.status("246801"), BindingStatus::Expired);

    ASSERT_TRUE(binding_.registerIssued("Survival", "246801", "uuid-steve", "Steve",
                                        clock_ + 300s, false).hasValue());
    EXPECT_EQ(binding_.status("246801"), BindingStatus::Pending);
    EXPECT_EQ(sink_.codes().size(), 2u);
    EXPECT_TRUE(binding_.confirm("246801", "kook", "U1").hasValue());
}

TEST_F(BindingCoordinatorTest, UnknownCodeIsCodeNotFound) {
    auto ack = binding_.confirm("000000", "kook", "U1");
    ASSERT_TRUE(ack.hasError());
    EXPECT_EQ(ack.error().code(), ErrorCode::CodeNotFound);
}

TEST_F(BindingCoordinatorTest, ExpiredCodeIsRejectedWithoutBindConfirm) {
    auto survival = connect("Survival", "s3cret");
    ASSERT_TRUE(binding_.registerIssued("Survival", "482913", "uuid-steve", "Steve",
                                        clock_ + 300s, false).hasValue());

    clock_ += 301s;
    auto ack = binding_.confirm("482913", "kook", "U123");
    ASSERT_TRUE(ack.hasError());
    EXPECT_EQ(ack.error().code(), ErrorCode::CodeExpired);
    EXPECT_EQ(binding_.status("482913"), BindingStatus::Expired);
    EXPECT_TRUE(confirmsOn(*survival).empty());

    auto retry = binding_.confirm("482913", "kook", "U123");
    ASSERT_TRUE(retry.hasError());
    EXPECT_EQ(retry.error().code(), ErrorCode::CodeExpired);
}

TEST_F(BindingCoordinatorTest, ConcurrentConfirmsHaveExactlyOneWinner) {
    auto survival = connect("Survival", "s3cret");
    auto code = binding_.issue("Survival", "uuid-steve");
    ASSERT_TRUE(code.hasValue());

    constexpr int kThreads = 16;
    std::atomic<int> winners{0};
    std::atomic<int> alreadyConfirmed{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            auto ack = binding_.confirm(code.value(), "kook", "U" + std::to_string(i));
            if (ack) {
                winners.fetch_add(1);
            } else if (ack.error().code() == ErrorCode::AlreadyConfirmed) {
                alreadyConfirmed.fetch_add(1);
            }
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(alreadyConfirmed.load(), kThreads - 1);
    EXPECT_EQ(confirmsOn(*survival).size(), 1u);
}

// ---------------------------------------------------------------------------
// Cancel / acknowledge / sweep
// ---------------------------------------------------------------------------

TEST_F(BindingCoordinatorTest, CancelledCodeCannotBeConfirmed) {
    auto code = binding_.issue("Survival", "uuid-steve");
    ASSERT_TRUE(code.hasValue());
    ASSERT_TRUE(binding_.cancel(code.value()).hasValue());
    EXPECT_EQ(binding_.status(code.value()), BindingStatus::Cancelled);

    auto ack = binding_.confirm(code.value(), "kook", "U1");
    ASSERT_TRUE(ack.hasError());
    EXPECT_EQ(ack.error().code(), ErrorCode::CodeNotFound);

    auto twice = binding_.cancel(code.value());
    ASSERT_TRUE(twice.hasError());
    EXPECT_EQ(twice.error().code(), ErrorCode::CodeNotFound);
}

TEST_F(BindingCoordinatorTest, AcknowledgeReportsOutcomeOnce) {
    connect("Survival", "s3cret");
    auto code = binding_.issue("Survival", "uuid-steve");
    ASSERT_TRUE(code.hasValue());
    ASSERT_TRUE(binding_.confirm(code.value(), "kook", "U123").hasValue());

    BindResultPayload result{code.value(), true, std::string("bound to Steve")};
    EXPECT_FALSE(binding_.acknowledge("Creative", result));
    EXPECT_TRUE(binding_.acknowledge("Survival", result));
    EXPECT_FALSE(binding_.acknowledge("Survival", result));

    auto outcomes = sink_.outcomes();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_EQ(outcomes[0].platform, "kook");
    EXPECT_EQ(outcomes[0].accountId, "U123");
    EXPECT_EQ(outcomes[0].message, "bound to Steve");
    EXPECT_FALSE(binding_.status(code.value()).has_value());
}

TEST_F(BindingCoordinatorTest, SweepExpiresThenEvictsAfterRetention) {
    auto code = binding_.issue("Survival", "uuid-steve");
    ASSERT_TRUE(code.hasValue());

    EXPECT_EQ(binding_.sweep(), 0u);
    clock_ += 300s;
    EXPECT_EQ(binding_.sweep(), 1u);
    EXPECT_EQ(binding_.status(code.value()), BindingStatus::Expired);
    EXPECT_EQ(binding_.pendingCount(), 0u);

    clock_ += 59s;
    binding_.sweep();
    EXPECT_TRUE(binding_.status(code.value()).has_value());

    clock_ += 1s;
    binding_.sweep();
    EXPECT_FALSE(binding_.status(code.value()).has_value());
}

// ---------------------------------------------------------------------------
// Offline outbox
// ---------------------------------------------------------------------------

TEST_F(BindingCoordinatorTest, ConfirmForOfflineServerIsHeldUntilOnline) {
    auto code = binding_.issue("Survival", "uuid-steve");
    ASSERT_TRUE(code.hasValue());

    auto ack = binding_.confirm(code.value(), "kook", "U123");
    ASSERT_TRUE(ack.hasValue());
    EXPECT_FALSE(ack.value().dispatched);
    EXPECT_EQ(binding_.outboxSize("Survival"), 1u);

    auto survival = connect("Survival", "s3cret");
    EXPECT_EQ(binding_.onServerOnline("Survival"), 1u);
    EXPECT_EQ(binding_.outboxSize("Survival"), 0u);

    auto confirms = confirmsOn(*survival);
    ASSERT_EQ(confirms.size(), 1u);
    EXPECT_EQ(confirms[0].accountId, "U123");
}

TEST_F(BindingCoordinatorTest, OutboxKeepsNewestWithinCapacity) {
    for (int i = 0; i < 3; ++i) {
        auto code = binding_.issue("Survival", "uuid-" + std::to_string(i));
        ASSERT_TRUE(code.hasValue());
        ASSERT_TRUE(binding_.confirm(code.value(), "kook", "U" + std::to_string(i)).hasValue());
    }
    EXPECT_EQ(binding_.outboxSize("Survival"), 2u);

    auto survival = connect("Survival", "s3cret");
    EXPECT_EQ(binding_.onServerOnline("Survival"), 2u);

    auto confirms = confirmsOn(*survival);
    ASSERT_EQ(confirms.size(), 2u);
    EXPECT_EQ(confirms[0].accountId, "U1");
    EXPECT_EQ(confirms[1].accountId, "U2");
}
