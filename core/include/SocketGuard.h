#pragma once

/**
 * @file SocketGuard.h
 * @brief Owning handle for a TCP socket descriptor
 *
 * Connection keeps its socket in one of these so every teardown path
 * (explicit disconnect, send failure, remote close) releases the fd.
 */

#include <sys/socket.h>
#include <unistd.h>

namespace ChatStorage {

class SocketGuard {
public:
    SocketGuard() noexcept = default;
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.release()) {}

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    ~SocketGuard() { reset(); }

    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ != kNoSocket; }

    /// Hand the descriptor to the caller; the guard no longer closes it
    int release() noexcept {
        const int fd = fd_;
        fd_ = kNoSocket;
        return fd;
    }

    void reset(int fd = kNoSocket) noexcept {
        if (fd_ != kNoSocket) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /// Unblocks a reader parked in recv() on another thread; the fd stays open
    void shutdownBoth() noexcept {
        if (fd_ != kNoSocket) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

private:
    static constexpr int kNoSocket = -1;
    int fd_{kNoSocket};
};

} // namespace ChatStorage
