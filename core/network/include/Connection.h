#pragma once

#include "Frame.h"
#include "FrameExtractor.h"
#include "Result.h"
#include "SocketGuard.h"
#include "Constants.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ChatStorage {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Failed
};

const char* connectionStateName(ConnectionState state);

/**
 * @brief Receives every frame read from a Connection, in stream order.
 *
 * Both callbacks run on the connection's receive thread (onConnectionClosed
 * may also run on the thread that called disconnect() or send()).
 */
class FrameListener {
public:
    virtual ~FrameListener() = default;
    virtual void onFrame(const Frame& frame) = 0;
    virtual void onConnectionClosed(const Error& reason) = 0;
};

struct ConnectionOptions {
    std::string name{"control"};
    /// 0 disables the heartbeat
    int heartbeatIntervalMs{config::HEARTBEAT_INTERVAL_MS};
    int reconnectDelayMs{config::RECONNECT_DELAY_MS};
    /// 0 disables auto-reconnect: any loss goes straight to Failed
    int maxReconnectAttempts{config::MAX_RECONNECT_ATTEMPTS};
    int connectTimeoutMs{config::CONNECT_TIMEOUT_MS};
    /// Upper bound for one blocked write while the peer is not reading
    int sendTimeoutMs{config::REQUEST_TIMEOUT_MS};
};

/**
 * @brief One TCP connection to the server.
 *
 * Owns the socket, a receive thread that feeds a FrameExtractor and hands
 * complete frames to the FrameListener, and a timer thread that drives the
 * heartbeat and the bounded auto-reconnect.
 *
 * State transitions are reported to state listeners in order. Listeners
 * must not call connect()/disconnect() synchronously.
 *
 * The reconnect budget is restored by an explicit connect() and by the first
 * frame received on a connection, not by a bare TCP accept: a server that
 * accepts and immediately closes exhausts the budget and ends in Failed.
 */
class Connection {
public:
    using StateListener = std::function<void(ConnectionState)>;

    explicit Connection(ConnectionOptions options = ConnectionOptions{});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Connect to host:port, resetting the reconnect budget.
     *
     * Blocks for at most connectTimeoutMs. A failed attempt is returned to
     * the caller and, budget permitting, retried in the background.
     */
    VoidResult connect(const std::string& host, int port);

    /// Caller-initiated teardown; no reconnect follows.
    void disconnect();

    /**
     * @brief Write one whole frame.
     *
     * Waits for writability when the kernel buffer is full. Fails with
     * NotConnected when not connected, SendFailed on a socket error or a
     * zero-byte write; a socket error also starts the reconnect path.
     */
    VoidResult send(const Frame& frame);

    /// Non-blocking probe: can a write make progress right now?
    bool hasSpaceAvailable() const;

    /// Wait until the socket is writable or the timeout expires
    bool awaitWritable(std::chrono::milliseconds timeout) const;

    void setFrameListener(FrameListener* listener) { listener_.store(listener); }
    void addStateListener(StateListener listener);

    ConnectionState state() const;
    bool isConnected() const { return state() == ConnectionState::Connected; }
    int reconnectAttempts() const;
    const std::string& name() const { return options_.name; }

private:
    VoidResult attemptConnect();
    Result<int> openSocket(const std::string& host, int port);
    void releaseSocket();
    void handleLoss(uint64_t generation, const Error& reason);
    void scheduleReconnectOrFail();
    void setState(ConnectionState state);

    void receiveLoop(uint64_t generation, int fd);
    void timerLoop();
    void sendHeartbeat();
    void ensureTimerThread();

    std::string label() const;

    ConnectionOptions options_;
    std::string host_;
    int port_{0};

    // Serialises connect/reconnect/disconnect
    std::mutex lifecycleMutex_;

    mutable std::mutex stateMutex_;
    ConnectionState state_{ConnectionState::Disconnected};
    int reconnectAttempts_{0};
    bool userClosed_{false};
    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> receivedSinceConnect_{false};

    // Lock order: writeMutex_ before socketMutex_
    std::mutex writeMutex_;
    mutable std::mutex socketMutex_;
    SocketGuard socket_;

    std::thread receiveThread_;
    FrameExtractor extractor_;

    std::mutex timerMutex_;
    std::condition_variable timerCv_;
    std::thread timerThread_;
    bool stopTimer_{false};
    bool heartbeatActive_{false};
    bool reconnectPending_{false};
    std::chrono::steady_clock::time_point nextHeartbeat_;
    std::chrono::steady_clock::time_point reconnectAt_;

    std::mutex notifyMutex_;
    std::vector<StateListener> stateListeners_;

    std::atomic<FrameListener*> listener_{nullptr};
};

} // namespace ChatStorage
