#pragma once

#include "Protocol.h"
#include "Result.h"
#include "SocketGuard.h"

#include <atomic>
#include <utility>
#include <cstdint>
#include <string>
#include <vector>

namespace Chunkwise {

/**
 * @brief Blocking TCP stream with line reads and timeouts
 *
 * Error mapping used by every read/write:
 * - peer closed, reset or broken pipe: ConnectionLost
 * - SO_RCVTIMEO / SO_SNDTIMEO expired: ConnectionTimeout
 *
 * shutdown() may be called from another thread to unblock a pending
 * read or write; the socket stays owned until close().
 */
class TcpConnection {
public:
    TcpConnection() = default;
    TcpConnection(int fd, std::string peer);

    TcpConnection(TcpConnection&&) = default;
    TcpConnection& operator=(TcpConnection&&) = default;

    static Result<TcpConnection> connect(const std::string& host, uint16_t port, int timeoutSeconds);

    /// 0 disables the timeout
    Result<void> setTimeout(int seconds);

    Result<void> sendAll(const uint8_t* data, size_t size);
    Result<void> sendString(const std::string& text);

    /// Next '\n'-terminated line, without the terminator. InvalidHeader past @p maxLength.
    Result<std::string> readLine(size_t maxLength = Protocol::MAX_LINE_LENGTH);

    /// Up to @p maxSize bytes, at least one
    Result<size_t> readSome(uint8_t* out, size_t maxSize);

    /// Read until the bytes form a complete (or garbled) acknowledgement
    Result<Protocol::AckMatch> readAck();

    void shutdown() noexcept { socket_.shutdown(); }
    void close() noexcept { socket_.reset(); }
    bool isOpen() const noexcept { return socket_.valid(); }

    const std::string& peer() const { return peer_; }

private:
    SocketGuard socket_;
    std::string peer_;
    std::vector<uint8_t> buffer_;   // received but not yet consumed
    size_t bufferPos_ = 0;

    Result<void> fill();
};

/**
 * @brief Listening socket for a single inbound session
 */
class TcpListener {
public:
    TcpListener() = default;

    Result<void> listen(const std::string& host, uint16_t port, int backlog = 1);

    /// Actual bound port (useful when listening on port 0)
    uint16_t port() const { return port_; }

    /**
     * @brief Wait for one connection
     *
     * Polls in short slices so a set @p stop flag is noticed; returns
     * Cancelled in that case.
     */
    Result<TcpConnection> accept(const std::atomic<bool>& stop, int pollMillis = 200);

    void shutdown() noexcept { socket_.shutdown(); }
    void close() noexcept { socket_.reset(); }
    bool isOpen() const noexcept { return socket_.valid(); }

private:
    SocketGuard socket_;
    uint16_t port_ = 0;
};

} // namespace Chunkwise
