/// @file websocket_loopback_test.cpp
/// @brief WebSocketListener and WebSocketDialer talking to each other over
///        127.0.0.1: open -> text frames both ways -> close.

#include <gtest/gtest.h>

#include "gcb/foundation/websocket_dialer.hpp"
#include "gcb/foundation/websocket_listener.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace gcb::foundation;

namespace {

constexpr uint16_t kPort = 19103;
constexpr auto kTimeout = std::chrono::seconds(5);

/// Collects listener/dialer events and lets the test wait on them.
class EventLog {
public:
    void openedTransport(std::shared_ptr<Transport> transport) {
        std::lock_guard lock(mutex_);
        accepted_.push_back(std::move(transport));
        cv_.notify_all();
    }

    void frame(const std::string& text) {
        std::lock_guard lock(mutex_);
        frames_.push_back(text);
        cv_.notify_all();
    }

    void closed(const std::string& id) {
        std::lock_guard lock(mutex_);
        closed_.push_back(id);
        cv_.notify_all();
    }

    std::shared_ptr<Transport> waitAccepted() {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, kTimeout, [&] { return !accepted_.empty(); })) {
            return nullptr;
        }
        return accepted_.front();
    }

    bool waitFrames(std::size_t count) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, kTimeout, [&] { return frames_.size() >= count; });
    }

    bool waitClosed() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, kTimeout, [&] { return !closed_.empty(); });
    }

    std::vector<std::string> frames() {
        std::lock_guard lock(mutex_);
        return frames_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::shared_ptr<Transport>> accepted_;
    std::vector<std::string> frames_;
    std::vector<std::string> closed_;
};

} // namespace

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------

class WebSocketLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        listener_.onOpened.connect([this](std::shared_ptr<Transport> t) {
            serverSide_.openedTransport(std::move(t));
        });
        listener_.onFrame.connect([this](const std::string&, const std::string& frame) {
            serverSide_.frame(frame);
        });
        listener_.onClosed.connect([this](const std::string& id) { serverSide_.closed(id); });

        dialer_.onFrame.connect([this](const std::string&, const std::string& frame) {
            clientSide_.frame(frame);
        });
        dialer_.onClosed.connect([this](const std::string& id) { clientSide_.closed(id); });

        auto listening = listener_.listen(kPort);
        ASSERT_TRUE(listening.hasValue()) << listening.error().describe();
    }

    void TearDown() override { listener_.stop(); }

    WebSocketListener listener_;
    WebSocketDialer dialer_{std::chrono::seconds(5)};
    EventLog serverSide_;
    EventLog clientSide_;
};

TEST_F(WebSocketLoopbackTest, ListenTwiceIsAlreadyExists) {
    auto again = listener_.listen(kPort);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
    EXPECT_TRUE(listener_.isListening());
}

TEST_F(WebSocketLoopbackTest, FramesFlowBothWays) {
    auto dialed = dialer_.dial("127.0.0.1", kPort);
    ASSERT_TRUE(dialed.hasValue()) << dialed.error().describe();
    auto client = dialed.value();
    EXPECT_TRUE(client->isOpen());

    auto server = serverSide_.waitAccepted();
    ASSERT_NE(server, nullptr);
    EXPECT_NE(server->id(), client->id());

    ASSERT_TRUE(client->sendText(R"({"type":"PING"})").hasValue());
    ASSERT_TRUE(serverSide_.waitFrames(1));
    EXPECT_EQ(serverSide_.frames().front(), R"({"type":"PING"})");

    ASSERT_TRUE(server->sendText(R"({"type":"PONG"})").hasValue());
    ASSERT_TRUE(clientSide_.waitFrames(1));
    EXPECT_EQ(clientSide_.frames().front(), R"({"type":"PONG"})");
    EXPECT_EQ(dialer_.openCount(), 1u);
}

TEST_F(WebSocketLoopbackTest, ClientCloseReachesListener) {
    auto dialed = dialer_.dial("127.0.0.1", kPort);
    ASSERT_TRUE(dialed.hasValue()) << dialed.error().describe();
    ASSERT_NE(serverSide_.waitAccepted(), nullptr);

    dialed.value()->close(CloseCode::Normal, "bye");
    EXPECT_FALSE(dialed.value()->isOpen());
    EXPECT_TRUE(serverSide_.waitClosed());

    auto sent = dialed.value()->sendText("late");
    ASSERT_TRUE(sent.hasError());
    EXPECT_EQ(sent.error().code(), ErrorCode::SendFailed);
}

TEST(WebSocketDialerTest, UnreachablePeerIsConnectionFailed) {
    WebSocketDialer dialer(std::chrono::seconds(2));
    auto dialed = dialer.dial("127.0.0.1", kPort + 1);
    ASSERT_TRUE(dialed.hasError());
    EXPECT_EQ(dialed.error().code(), ErrorCode::ConnectionFailed);
}
