#include "Connection.h"
#include "FrameCodec.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

#include <cerrno>
#include <cstring>
#include <optional>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ChatStorage {

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}

Connection::Connection(ConnectionOptions options)
    : options_(std::move(options)) {
}

Connection::~Connection() {
    disconnect();

    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        stopTimer_ = true;
    }
    timerCv_.notify_all();
    if (timerThread_.joinable()) {
        timerThread_.join();
    }
}

std::string Connection::label() const {
    return "[" + options_.name + " " + host_ + ":" + std::to_string(port_) + "] ";
}

VoidResult Connection::connect(const std::string& host, int port) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == ConnectionState::Connected && host == host_ && port == port_) {
            return Ok();
        }
        reconnectAttempts_ = 0;
        userClosed_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        reconnectPending_ = false;
    }

    host_ = host;
    port_ = port;
    ensureTimerThread();
    return attemptConnect();
}

void Connection::disconnect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    bool wasIdle = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        userClosed_ = true;
        wasIdle = state_ == ConnectionState::Disconnected;
        generation_++;
    }
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        reconnectPending_ = false;
        heartbeatActive_ = false;
    }

    releaseSocket();

    if (wasIdle) {
        return;
    }

    Logger::instance().log(LogLevel::INFO, label() + "Disconnected by client", "Connection");
    setState(ConnectionState::Disconnected);

    if (auto* listener = listener_.load()) {
        listener->onConnectionClosed(Error{ErrorCode::ConnectionClosed, "disconnected by client", "Connection"});
    }
}

// Caller holds lifecycleMutex_
VoidResult Connection::attemptConnect() {
    {
        // Stale receive threads must not report a loss for this attempt
        std::lock_guard<std::mutex> lock(stateMutex_);
        generation_++;
    }
    releaseSocket();
    setState(ConnectionState::Connecting);

    Logger::instance().log(LogLevel::INFO, label() + "Connecting", "Connection");

    auto fd = openSocket(host_, port_);
    if (!fd) {
        Logger::instance().log(LogLevel::ERROR, label() + fd.error().message, "Connection");
        scheduleReconnectOrFail();
        return fd.error();
    }

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        socket_.reset(*fd);
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        generation = ++generation_;
    }
    receivedSinceConnect_ = false;
    extractor_.clear();

    // Connected must be visible before the receive thread can report a loss
    setState(ConnectionState::Connected);
    MetricsCollector::instance().incrementConnectsSucceeded();
    Logger::instance().log(LogLevel::INFO, label() + "Connected", "Connection");

    receiveThread_ = std::thread(&Connection::receiveLoop, this, generation, *fd);

    if (options_.heartbeatIntervalMs > 0) {
        std::lock_guard<std::mutex> lock(timerMutex_);
        heartbeatActive_ = true;
        nextHeartbeat_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.heartbeatIntervalMs);
    }
    timerCv_.notify_all();
    return Ok();
}

Result<int> Connection::openSocket(const std::string& host, int port) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* resolved = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &resolved);
    if (rc != 0) {
        return Error{ErrorCode::NotConnected, "Cannot resolve " + host + ": " + gai_strerror(rc), "Connection"};
    }

    std::string lastError = "no usable address";
    for (auto* ai = resolved; ai != nullptr; ai = ai->ai_next) {
        SocketGuard sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock) {
            lastError = std::string("socket: ") + strerror(errno);
            continue;
        }

        int flags = fcntl(sock.get(), F_GETFL, 0);
        if (flags < 0 || fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
            lastError = std::string("fcntl: ") + strerror(errno);
            continue;
        }

        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                lastError = std::string("connect: ") + strerror(errno);
                continue;
            }

            struct pollfd pfd{sock.get(), POLLOUT, 0};
            int ready = ::poll(&pfd, 1, options_.connectTimeoutMs);
            if (ready <= 0) {
                lastError = ready == 0 ? "connect timed out" : std::string("poll: ") + strerror(errno);
                continue;
            }

            int soError = 0;
            socklen_t len = sizeof(soError);
            if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0) {
                lastError = std::string("connect: ") + strerror(soError != 0 ? soError : errno);
                continue;
            }
        }

        int noDelay = 1;
        if (setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) < 0) {
            Logger::instance().log(LogLevel::DEBUG, label() + "TCP_NODELAY not set: " + strerror(errno), "Connection");
        }

        freeaddrinfo(resolved);
        return sock.release();
    }

    freeaddrinfo(resolved);
    return Error{ErrorCode::NotConnected, "Connect to " + host + ":" + service + " failed: " + lastError, "Connection"};
}

// Caller holds lifecycleMutex_ (or is the destructor)
void Connection::releaseSocket() {
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        socket_.shutdownBoth();
    }

    if (receiveThread_.joinable()) {
        if (receiveThread_.get_id() == std::this_thread::get_id()) {
            receiveThread_.detach();
        } else {
            receiveThread_.join();
        }
    }

    std::lock_guard<std::mutex> writeLock(writeMutex_);
    std::lock_guard<std::mutex> lock(socketMutex_);
    socket_.reset();
}

void Connection::handleLoss(uint64_t generation, const Error& reason) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (generation != generation_.load() || state_ != ConnectionState::Connected || userClosed_) {
            return;
        }
        generation_++;
    }
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        heartbeatActive_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        socket_.shutdownBoth();
    }

    Logger::instance().log(LogLevel::WARN, label() + "Connection lost: " + reason.toString(), "Connection");

    if (auto* listener = listener_.load()) {
        listener->onConnectionClosed(reason);
    }

    scheduleReconnectOrFail();
}

void Connection::scheduleReconnectOrFail() {
    int attempt = 0;
    bool exhausted = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (userClosed_) {
            return;
        }
        if (reconnectAttempts_ >= options_.maxReconnectAttempts) {
            exhausted = true;
        } else {
            attempt = ++reconnectAttempts_;
        }
    }

    if (exhausted) {
        MetricsCollector::instance().incrementConnectionsFailed();
        Logger::instance().log(LogLevel::ERROR, label() + "Giving up after " +
                               std::to_string(options_.maxReconnectAttempts) + " reconnect attempts", "Connection");
        setState(ConnectionState::Failed);
        return;
    }

    MetricsCollector::instance().incrementReconnectAttempts();
    setState(ConnectionState::Reconnecting);
    Logger::instance().log(LogLevel::INFO, label() + "Reconnect attempt " + std::to_string(attempt) + "/" +
                           std::to_string(options_.maxReconnectAttempts) + " in " +
                           std::to_string(options_.reconnectDelayMs) + "ms", "Connection");

    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        reconnectPending_ = true;
        reconnectAt_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.reconnectDelayMs);
    }
    timerCv_.notify_all();
}

void Connection::setState(ConnectionState state) {
    std::lock_guard<std::mutex> notifyLock(notifyMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
    }

    LOG_DEBUG_COMP_IF(label() + "State -> " + connectionStateName(state), "Connection");

    for (const auto& listener : stateListeners_) {
        listener(state);
    }
}

void Connection::addStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(notifyMutex_);
    stateListeners_.push_back(std::move(listener));
}

ConnectionState Connection::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

int Connection::reconnectAttempts() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return reconnectAttempts_;
}

VoidResult Connection::send(const Frame& frame) {
    if (!isConnected()) {
        return Error{ErrorCode::NotConnected, label() + "send while " + connectionStateName(state()), "Connection"};
    }

    const std::vector<uint8_t> bytes = FrameCodec::encode(frame);

    std::optional<Error> failure;
    bool lost = false;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> writeLock(writeMutex_);
        int fd = -1;
        {
            std::lock_guard<std::mutex> lock(socketMutex_);
            fd = socket_.get();
            generation = generation_.load();
        }
        if (fd < 0) {
            return Error{ErrorCode::NotConnected, label() + "socket released", "Connection"};
        }

        std::size_t offset = 0;
        while (offset < bytes.size()) {
            ssize_t written = ::send(fd, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
            if (written > 0) {
                offset += static_cast<std::size_t>(written);
                continue;
            }
            if (written < 0 && errno == EINTR) {
                continue;
            }
            if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                struct pollfd pfd{fd, POLLOUT, 0};
                if (::poll(&pfd, 1, options_.sendTimeoutMs) > 0) {
                    continue;
                }
                failure = Error{ErrorCode::SendFailed, label() + "socket not writable within " +
                                std::to_string(options_.sendTimeoutMs) + "ms", "Connection"};
                break;
            }

            failure = Error{ErrorCode::SendFailed,
                            label() + (written == 0 ? std::string("zero-byte write") : std::string(strerror(errno))),
                            "Connection"};
            lost = true;
            break;
        }
    }

    if (failure) {
        Logger::instance().log(LogLevel::ERROR, "Send failed: " + failure->message, "Connection");
        if (lost) {
            handleLoss(generation, Error{ErrorCode::ConnectionLost, failure->message, "Connection"});
        }
        return *failure;
    }

    MetricsCollector::instance().recordFrameSent(bytes.size());
    LOG_DEBUG_COMP_IF(label() + "Sent " + FrameCodec::describe(frame), "Connection");
    return Ok();
}

bool Connection::hasSpaceAvailable() const {
    return awaitWritable(std::chrono::milliseconds(0));
}

bool Connection::awaitWritable(std::chrono::milliseconds timeout) const {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        fd = socket_.get();
    }
    if (fd < 0 || !isConnected()) {
        return false;
    }
    struct pollfd pfd{fd, POLLOUT, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    return ready > 0 && (pfd.revents & POLLOUT) != 0 && (pfd.revents & (POLLERR | POLLHUP)) == 0;
}

void Connection::receiveLoop(uint64_t generation, int fd) {
    std::vector<uint8_t> buffer(config::RECEIVE_BUFFER_SIZE);
    auto& metrics = MetricsCollector::instance();

    while (generation_.load() == generation) {
        struct pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, config::WAIT_SLICE_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            handleLoss(generation, Error{ErrorCode::ConnectionLost, std::string("poll: ") + strerror(errno), "Connection"});
            return;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t received = ::recv(fd, buffer.data(), buffer.size(), 0);
        if (received == 0) {
            handleLoss(generation, Error{ErrorCode::ConnectionClosed, "closed by server", "Connection"});
            return;
        }
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            handleLoss(generation, Error{ErrorCode::ConnectionLost, std::string("recv: ") + strerror(errno), "Connection"});
            return;
        }

        extractor_.append(buffer.data(), static_cast<std::size_t>(received));
        while (auto frame = extractor_.next()) {
            if (generation_.load() != generation) {
                return;
            }
            metrics.recordFrameReceived(config::FRAME_HEADER_SIZE + frame->payload.size());

            if (!receivedSinceConnect_.exchange(true)) {
                std::lock_guard<std::mutex> lock(stateMutex_);
                reconnectAttempts_ = 0;
            }

            if (frame->type == FrameType::Heartbeat) {
                LOG_DEBUG_COMP_IF(label() + "Heartbeat reply", "Connection");
                continue;
            }

            LOG_DEBUG_COMP_IF(label() + "Received " + FrameCodec::describe(*frame), "Connection");
            if (auto* listener = listener_.load()) {
                listener->onFrame(*frame);
            }
        }
    }
}

void Connection::ensureTimerThread() {
    std::lock_guard<std::mutex> lock(timerMutex_);
    if (!timerThread_.joinable()) {
        stopTimer_ = false;
        timerThread_ = std::thread(&Connection::timerLoop, this);
    }
}

void Connection::timerLoop() {
    std::unique_lock<std::mutex> lock(timerMutex_);
    while (!stopTimer_) {
        auto wakeAt = std::chrono::steady_clock::now() + std::chrono::hours(1);
        if (reconnectPending_ && reconnectAt_ < wakeAt) {
            wakeAt = reconnectAt_;
        }
        if (heartbeatActive_ && nextHeartbeat_ < wakeAt) {
            wakeAt = nextHeartbeat_;
        }

        timerCv_.wait_until(lock, wakeAt);
        if (stopTimer_) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (reconnectPending_ && now >= reconnectAt_) {
            reconnectPending_ = false;
            lock.unlock();
            {
                std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
                bool closed = false;
                {
                    std::lock_guard<std::mutex> stateLock(stateMutex_);
                    closed = userClosed_;
                }
                if (!closed) {
                    auto result = attemptConnect();
                    if (!result) {
                        LOG_DEBUG_COMP_IF(label() + "Reconnect attempt failed: " + result.error().toString(), "Connection");
                    }
                }
            }
            lock.lock();
            continue;
        }

        if (heartbeatActive_ && now >= nextHeartbeat_) {
            nextHeartbeat_ = now + std::chrono::milliseconds(options_.heartbeatIntervalMs);
            lock.unlock();
            sendHeartbeat();
            lock.lock();
        }
    }
}

void Connection::sendHeartbeat() {
    auto result = send(Frame(FrameType::Heartbeat, {}));
    if (!result) {
        Logger::instance().log(LogLevel::WARN, label() + "Heartbeat not sent: " + result.error().toString(), "Connection");
    }
}

} // namespace ChatStorage
