#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "gcb/foundation/error_code.hpp"
#include "gcb/protocol/message.hpp"
#include "gcb/service/forward_table.hpp"
#include "gcb/service/router.hpp"
#include "gcb/service/session_registry.hpp"
#include "test_doubles.hpp"

using namespace gcb::service;
using gcb::foundation::ErrorCode;
using gcb::protocol::ChatPayload;
using gcb::protocol::CommandResultPayload;
using gcb::protocol::Message;
using gcb::protocol::MessageType;
using gcb::protocol::PlayerEventKind;
using gcb::protocol::PlayerEventPayload;
using gcb::protocol::StatusRequestPayload;
using gcb::test::FakeTransport;
using gcb::test::RecordingSink;

// ---------------------------------------------------------------------------
// ForwardTarget parsing
// ---------------------------------------------------------------------------

TEST(ForwardTargetTest, ParsesThreeParts) {
    auto target = ForwardTarget::parse("kook:GroupMessage:123");
    ASSERT_TRUE(target.hasValue());
    EXPECT_EQ(target.value().platform, "kook");
    EXPECT_EQ(target.value().messageType, "GroupMessage");
    EXPECT_EQ(target.value().sessionId, "123");
    EXPECT_EQ(target.value().toString(), "kook:GroupMessage:123");
}

TEST(ForwardTargetTest, SessionIdKeepsExtraColons) {
    auto target = ForwardTarget::parse("  qq:TempMessage:9:8:7 ");
    ASSERT_TRUE(target.hasValue());
    EXPECT_EQ(target.value().platform, "qq");
    EXPECT_EQ(target.value().sessionId, "9:8:7");
}

TEST(ForwardTargetTest, RejectsMalformedTargets) {
    for (const char* text : {"", "kook", "kook:GroupMessage", "kook::123", ":GroupMessage:1",
                             "kook:GroupMessage:"}) {
        auto target = ForwardTarget::parse(text);
        ASSERT_TRUE(target.hasError()) << text;
        EXPECT_EQ(target.error().code(), ErrorCode::InvalidForwardTarget);
    }
}

TEST(ForwardTargetTest, ParseListSkipsInvalidAndDeduplicates) {
    auto targets = parseForwardTargets(
        {"kook:GroupMessage:1", "broken", "kook:GroupMessage:1", "qq:FriendMessage:2"});
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets.begin()->platform, "kook");
}

TEST(ForwardTableTest, MissingRuleHasNoTargets) {
    ForwardTable table;
    EXPECT_TRUE(table.ruleFor("Survival").targets.empty());

    ForwardRule rule;
    rule.targets = parseForwardTargets({"kook:GroupMessage:1"});
    table.setRule("Survival", rule);
    EXPECT_EQ(table.ruleFor("Survival").targets.size(), 1u);

    table.reloadForwarding({});
    EXPECT_EQ(table.size(), 0u);
    EXPECT_TRUE(table.ruleFor("Survival").targets.empty());
}

// ---------------------------------------------------------------------------
// Router
// ---------------------------------------------------------------------------

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.allow({"Survival", "s3cret", ConnectMode::Listen});

        ForwardRule rule;
        rule.targets = parseForwardTargets({"kook:GroupMessage:1", "qq:GroupMessage:2"});
        table_.setRule("Survival", rule);
    }

    std::shared_ptr<FakeTransport> connectSurvival() {
        auto transport = std::make_shared<FakeTransport>("ws-1");
        EXPECT_TRUE(registry_.attach("Survival", transport, "s3cret", Clock::now()).hasValue());
        return transport;
    }

    static Message chat(const std::string& serverId, const std::string& text) {
        return Message::make(serverId, ChatPayload{text, std::string("Steve"), std::nullopt});
    }

    SessionRegistry registry_{SessionPolicy{}};
    ForwardTable table_;
    RecordingSink sink_;
    Router router_{registry_, table_, sink_};
};

TEST_F(RouterTest, ChatFansOutToEveryTarget) {
    EXPECT_EQ(router_.forwardInbound(chat("Survival", "hello")), 2u);

    auto deliveries = sink_.deliveries();
    ASSERT_EQ(deliveries.size(), 2u);
    std::set<std::string> seen;
    for (const auto& d : deliveries) {
        seen.insert(d.target.toString());
        EXPECT_EQ(d.message.as<ChatPayload>()->content, "hello");
    }
    EXPECT_EQ(seen, (std::set<std::string>{"kook:GroupMessage:1", "qq:GroupMessage:2"}));
    EXPECT_EQ(router_.stats().deliveries, 2u);
}

TEST_F(RouterTest, EmptyTargetSetIsSilentNoOp) {
    EXPECT_EQ(router_.forwardInbound(chat("Creative", "nobody listens")), 0u);
    EXPECT_TRUE(sink_.deliveries().empty());
    EXPECT_EQ(router_.stats().suppressed, 1u);
}

TEST_F(RouterTest, RuleFlagsGateMessageTypes) {
    auto rule = table_.ruleFor("Survival");
    rule.forwardPlayerEvents = false;
    table_.setRule("Survival", rule);

    auto join = Message::make("Survival",
                              PlayerEventPayload{PlayerEventKind::Join, "Steve", "u-1"});
    EXPECT_EQ(router_.forwardInbound(join), 0u);

    auto result = Message::make("Survival", CommandResultPayload{"list", true, "1 player"});
    EXPECT_EQ(router_.forwardInbound(result), 2u);

    auto request = Message::make("Survival", StatusRequestPayload{});
    EXPECT_EQ(router_.forwardInbound(request), 0u);
}

TEST_F(RouterTest, OutboundToUnknownServerIsServerNotFound) {
    auto sent = router_.routeOutbound("Creative", chat("", "hi"), DeliveryMode::Queued);
    ASSERT_TRUE(sent.hasError());
    EXPECT_EQ(sent.error().code(), ErrorCode::ServerNotFound);
    EXPECT_EQ(router_.stats().outboundFailed, 1u);
}

TEST_F(RouterTest, OutboundOverwritesEnvelopeServerId) {
    auto transport = connectSurvival();
    ASSERT_TRUE(router_.routeOutbound("Survival", chat("spoofed", "hi"),
                                      DeliveryMode::Immediate).hasValue());

    auto chats = transport->messagesOfType(MessageType::Chat);
    ASSERT_EQ(chats.size(), 1u);
    EXPECT_EQ(chats[0].serverId, "Survival");
    EXPECT_EQ(router_.stats().outboundSent, 1u);
}

TEST_F(RouterTest, ImmediateToDisconnectedServerIsServerNotConnected) {
    auto transport = connectSurvival();
    registry_.onTransportClosed("ws-1", Clock::now());

    auto sent = router_.routeOutbound("Survival", chat("", "hi"), DeliveryMode::Immediate);
    ASSERT_TRUE(sent.hasError());
    EXPECT_EQ(sent.error().code(), ErrorCode::ServerNotConnected);

    EXPECT_TRUE(router_.routeOutbound("Survival", chat("", "later"), DeliveryMode::Queued)
                    .hasValue());
    EXPECT_EQ(registry_.lookup("Survival").value()->queuedCount(), 1u);
}

TEST_F(RouterTest, ServerStateListsOnlyOptedInTargets) {
    router_.announceServerState("Survival", true);

    auto rule = table_.ruleFor("Survival");
    rule.forwardServerState = true;
    table_.setRule("Survival", rule);
    router_.announceServerState("Survival", false);

    auto states = sink_.states();
    ASSERT_EQ(states.size(), 2u);
    EXPECT_TRUE(states[0].online);
    EXPECT_TRUE(states[0].targets.empty());
    EXPECT_FALSE(states[1].online);
    EXPECT_EQ(states[1].targets.size(), 2u);
}
