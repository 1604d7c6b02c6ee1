#include <gtest/gtest.h>

#include "Connection.h"
#include "FakeServer.h"
#include "Logger.h"

#include <atomic>
#include <thread>

using namespace ChatStorage;
using ChatStorage::test_support::FakePeer;
using ChatStorage::test_support::FakeServer;

namespace {

class CollectingListener : public FrameListener {
public:
    void onFrame(const Frame& frame) override {
        std::lock_guard<std::mutex> lock(mutex);
        frames.push_back(frame);
    }
    void onConnectionClosed(const Error&) override { closedCount++; }

    std::size_t frameCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }

    std::mutex mutex;
    std::vector<Frame> frames;
    std::atomic<int> closedCount{0};
};

template <typename Pred>
bool eventually(Pred pred, int timeoutMs = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

ConnectionOptions fastOptions() {
    ConnectionOptions options;
    options.name = "test";
    options.heartbeatIntervalMs = 0;
    options.reconnectDelayMs = 20;
    options.maxReconnectAttempts = 5;
    options.connectTimeoutMs = 1000;
    options.sendTimeoutMs = 1000;
    return options;
}

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().setLevel(LogLevel::ERROR); }
    void TearDown() override { Logger::instance().setLevel(LogLevel::INFO); }
};

} // namespace

TEST_F(ConnectionTest, ConnectSendAndReceive) {
    FakeServer server([](FakePeer& peer) {
        auto frame = peer.expect(FrameType::UserLoginReq);
        if (frame) {
            peer.sendJson(FrameType::UserResponse, "{\"code\":200}");
        }
        peer.readFrame(std::chrono::milliseconds(1000));
    });

    Connection connection(fastOptions());
    CollectingListener listener;
    connection.setFrameListener(&listener);

    ASSERT_TRUE(connection.connect("127.0.0.1", server.port()).ok());
    EXPECT_EQ(connection.state(), ConnectionState::Connected);

    ASSERT_TRUE(connection.send(Frame::fromString(FrameType::UserLoginReq, "{}")).ok());
    ASSERT_TRUE(eventually([&]() { return listener.frameCount() == 1; }));
    EXPECT_EQ(listener.frames[0].type, FrameType::UserResponse);

    connection.disconnect();
    EXPECT_EQ(connection.state(), ConnectionState::Disconnected);
}

TEST_F(ConnectionTest, SendWhileDisconnectedFails) {
    Connection connection(fastOptions());
    auto sent = connection.send(Frame(FrameType::Heartbeat, {}));
    ASSERT_FALSE(sent.ok());
    EXPECT_EQ(sent.error().code, ErrorCode::NotConnected);
}

TEST_F(ConnectionTest, RefusedConnectWithoutRetriesFails) {
    ConnectionOptions options = fastOptions();
    options.maxReconnectAttempts = 0;
    Connection connection(options);

    auto connected = connection.connect("127.0.0.1", test_support::unusedPort());
    EXPECT_FALSE(connected.ok());
    EXPECT_TRUE(eventually([&]() { return connection.state() == ConnectionState::Failed; }));
}

TEST_F(ConnectionTest, HeartbeatIsSentPeriodically) {
    std::atomic<int> heartbeats{0};
    FakeServer server([&](FakePeer& peer) {
        while (auto frame = peer.readFrame(std::chrono::milliseconds(1500))) {
            if (frame->type == FrameType::Heartbeat && frame->payload.empty()) {
                heartbeats++;
            }
        }
    });

    ConnectionOptions options = fastOptions();
    options.heartbeatIntervalMs = 50;
    Connection connection(options);
    ASSERT_TRUE(connection.connect("127.0.0.1", server.port()).ok());

    EXPECT_TRUE(eventually([&]() { return heartbeats.load() >= 3; }));
    connection.disconnect();
}

TEST_F(ConnectionTest, ServerThatClosesImmediatelyExhaustsReconnects) {
    FakeServer server([](FakePeer& peer) { peer.close(); });

    Connection connection(fastOptions());
    std::mutex statesMutex;
    std::vector<ConnectionState> states;
    connection.addStateListener([&](ConnectionState state) {
        std::lock_guard<std::mutex> lock(statesMutex);
        states.push_back(state);
    });

    ASSERT_TRUE(connection.connect("127.0.0.1", server.port()).ok());
    ASSERT_TRUE(eventually([&]() { return connection.state() == ConnectionState::Failed; }, 5000));

    EXPECT_EQ(connection.reconnectAttempts(), 5);
    EXPECT_EQ(server.acceptedCount(), 6);

    std::lock_guard<std::mutex> lock(statesMutex);
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back(), ConnectionState::Failed);
    int reconnecting = 0;
    for (auto state : states) {
        if (state == ConnectionState::Reconnecting) reconnecting++;
    }
    EXPECT_EQ(reconnecting, 5);
}

TEST_F(ConnectionTest, ReconnectsAfterServerDrop) {
    std::atomic<int> sessions{0};
    FakeServer server([&](FakePeer& peer) {
        int session = ++sessions;
        peer.sendJson(FrameType::UserResponse, "{\"code\":200}");
        if (session == 1) {
            peer.close();
            return;
        }
        peer.readFrame(std::chrono::milliseconds(1000));
    });

    Connection connection(fastOptions());
    CollectingListener listener;
    connection.setFrameListener(&listener);
    ASSERT_TRUE(connection.connect("127.0.0.1", server.port()).ok());

    EXPECT_TRUE(eventually([&]() { return sessions.load() >= 2 && connection.isConnected(); }));
    EXPECT_TRUE(eventually([&]() { return listener.frameCount() >= 2; }));
    EXPECT_GE(listener.closedCount.load(), 1);
    EXPECT_EQ(connection.reconnectAttempts(), 0);
    connection.disconnect();
}

TEST_F(ConnectionTest, DisconnectStopsReconnecting) {
    FakeServer server([](FakePeer& peer) { peer.readFrame(std::chrono::milliseconds(500)); });

    Connection connection(fastOptions());
    ASSERT_TRUE(connection.connect("127.0.0.1", server.port()).ok());
    connection.disconnect();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_EQ(connection.state(), ConnectionState::Disconnected);
    EXPECT_EQ(server.acceptedCount(), 1);
}
