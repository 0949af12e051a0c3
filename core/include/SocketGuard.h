#pragma once

/**
 * @file SocketGuard.h
 * @brief RAII owner for socket file descriptors
 *
 * The descriptor is held in an atomic so that another thread may call
 * shutdown() to unblock a pending accept/recv/send during cancellation.
 */

#include <sys/socket.h>
#include <unistd.h>
#include <atomic>

namespace Chunkwise {

class SocketGuard {
public:
    SocketGuard() noexcept : fd_(-1) {}

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

    ~SocketGuard() {
        reset();
    }

    int get() const noexcept { return fd_.load(); }

    explicit operator bool() const noexcept { return fd_.load() >= 0; }

    bool valid() const noexcept { return fd_.load() >= 0; }

    /// Give up ownership without closing
    int release() noexcept {
        return fd_.exchange(-1);
    }

    /// Close the owned descriptor (if any) and adopt a new one
    void reset(int fd = -1) noexcept {
        int old = fd_.exchange(fd);
        if (old >= 0) {
            ::close(old);
        }
    }

    /// Wake up any thread blocked on this socket; ownership is kept
    void shutdown() noexcept {
        int fd = fd_.load();
        if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

private:
    std::atomic<int> fd_;
};

} // namespace Chunkwise
