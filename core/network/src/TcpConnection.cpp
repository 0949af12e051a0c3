#include "TcpConnection.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <memory>

namespace Chunkwise {

namespace {

constexpr size_t RECV_CHUNK = 64 * 1024;
constexpr size_t MAX_ACK_BYTES = 64;

Error ioError(const std::string& operation, int err) {
    if (err == EAGAIN || err == EWOULDBLOCK) {
        return Error{ErrorCode::ConnectionTimeout, operation + " timed out"};
    }
    return Error{ErrorCode::ConnectionLost, operation + " failed: " + std::string(strerror(err))};
}

std::string describeAddress(const struct sockaddr* addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (addr->sa_family == AF_INET) {
        auto* in = reinterpret_cast<const struct sockaddr_in*>(addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    }
    return std::string(host) + ":" + std::to_string(port);
}

struct AddrInfoDeleter {
    void operator()(struct addrinfo* info) const { freeaddrinfo(info); }
};

int pollRetry(struct pollfd* pfd, int timeoutMillis) {
    int rc;
    do {
        rc = ::poll(pfd, 1, timeoutMillis);
    } while (rc < 0 && errno == EINTR);
    return rc;
}

} // namespace

TcpConnection::TcpConnection(int fd, std::string peer)
    : socket_(fd), peer_(std::move(peer)) {}

Result<TcpConnection> TcpConnection::connect(const std::string& host, uint16_t port, int timeoutSeconds) {
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* raw = nullptr;
    std::string portStr = std::to_string(port);
    int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &raw);
    if (status != 0) {
        return Err<TcpConnection>(ErrorCode::ConnectionFailed,
                                  "Failed to resolve " + host + ": " + gai_strerror(status));
    }
    std::unique_ptr<struct addrinfo, AddrInfoDeleter> result(raw);
    const std::string target = host + ":" + portStr;

    SocketGuard sock(::socket(result->ai_family, result->ai_socktype, result->ai_protocol));
    if (!sock) {
        return Err<TcpConnection>(ErrorCode::ConnectionFailed,
                                  "Failed to create socket: " + std::string(strerror(errno)));
    }

    // Non-blocking connect so the timeout applies
    int flags = fcntl(sock.get(), F_GETFL, 0);
    fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

    int connectResult = ::connect(sock.get(), result->ai_addr, result->ai_addrlen);
    if (connectResult < 0 && errno != EINPROGRESS) {
        return Err<TcpConnection>(ErrorCode::ConnectionFailed,
                                  "Failed to connect to " + target + ": " + std::string(strerror(errno)));
    }

    if (connectResult < 0) {
        struct pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;
        int pollResult = pollRetry(&pfd, timeoutSeconds > 0 ? timeoutSeconds * 1000 : -1);
        if (pollResult == 0) {
            return Err<TcpConnection>(ErrorCode::ConnectionTimeout, "Connection to " + target + " timed out");
        }
        if (pollResult < 0) {
            return Err<TcpConnection>(ErrorCode::ConnectionFailed,
                                      "poll failed: " + std::string(strerror(errno)));
        }

        int error = 0;
        socklen_t len = sizeof(error);
        getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len);
        if (error != 0) {
            return Err<TcpConnection>(ErrorCode::ConnectionFailed,
                                      "Failed to connect to " + target + ": " + std::string(strerror(error)));
        }
    }

    // Back to blocking
    fcntl(sock.get(), F_SETFL, flags);

    int nodelay = 1;
    setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    TcpConnection conn(sock.release(), target);
    auto timeoutSet = conn.setTimeout(timeoutSeconds);
    if (!timeoutSet) {
        return timeoutSet.error();
    }
    return conn;
}

Result<void> TcpConnection::setTimeout(int seconds) {
    struct timeval tv{};
    tv.tv_sec = seconds > 0 ? seconds : 0;
    tv.tv_usec = 0;
    if (setsockopt(socket_.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(socket_.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return Err(ErrorCode::ConnectionFailed, "Failed to set socket timeout: " + std::string(strerror(errno)));
    }
    return Ok();
}

Result<void> TcpConnection::sendAll(const uint8_t* data, size_t size) {
    size_t sent = 0;
    while (sent < size) {
        ssize_t n = ::send(socket_.get(), data + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return ioError("send", errno);
        }
        sent += static_cast<size_t>(n);
    }
    return Ok();
}

Result<void> TcpConnection::sendString(const std::string& text) {
    return sendAll(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Result<void> TcpConnection::fill() {
    if (bufferPos_ >= buffer_.size()) {
        buffer_.clear();
        bufferPos_ = 0;
    }

    uint8_t chunk[RECV_CHUNK];
    for (;;) {
        ssize_t n = ::recv(socket_.get(), chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer_.insert(buffer_.end(), chunk, chunk + n);
            return Ok();
        }
        if (n == 0) {
            return Err(ErrorCode::ConnectionLost, "Connection closed by peer");
        }
        if (errno == EINTR) continue;
        return ioError("recv", errno);
    }
}

Result<std::string> TcpConnection::readLine(size_t maxLength) {
    size_t scanFrom = bufferPos_;
    for (;;) {
        auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(bufferPos_);
        auto newline = std::find(buffer_.begin() + static_cast<std::ptrdiff_t>(scanFrom), buffer_.end(), '\n');
        if (newline != buffer_.end()) {
            std::string line(begin, newline);
            bufferPos_ = static_cast<size_t>(newline - buffer_.begin()) + 1;
            if (line.size() > maxLength) {
                return Err<std::string>(ErrorCode::InvalidHeader,
                                        "Line exceeds " + std::to_string(maxLength) + " bytes");
            }
            return line;
        }
        if (buffer_.size() - bufferPos_ > maxLength) {
            return Err<std::string>(ErrorCode::InvalidHeader,
                                    "Line exceeds " + std::to_string(maxLength) + " bytes");
        }

        scanFrom = buffer_.size() - bufferPos_;
        auto filled = fill();
        if (!filled) {
            return filled.error();
        }
        // fill() may have compacted the buffer
        scanFrom += bufferPos_;
    }
}

Result<size_t> TcpConnection::readSome(uint8_t* out, size_t maxSize) {
    if (maxSize == 0) {
        return static_cast<size_t>(0);
    }
    if (bufferPos_ >= buffer_.size()) {
        auto filled = fill();
        if (!filled) {
            return filled.error();
        }
    }
    size_t available = buffer_.size() - bufferPos_;
    size_t n = std::min(available, maxSize);
    std::memcpy(out, buffer_.data() + bufferPos_, n);
    bufferPos_ += n;
    return n;
}

Result<Protocol::AckMatch> TcpConnection::readAck() {
    std::string received;
    for (;;) {
        if (bufferPos_ >= buffer_.size()) {
            auto filled = fill();
            if (!filled) {
                return filled.error();
            }
        }
        received.push_back(static_cast<char>(buffer_[bufferPos_++]));

        auto match = Protocol::matchAck(received);
        if (match != Protocol::AckMatch::Incomplete) {
            return match;
        }
        if (received.size() >= MAX_ACK_BYTES) {
            return Protocol::AckMatch::Garbled;
        }
    }
}

Result<void> TcpListener::listen(const std::string& host, uint16_t port, int backlog) {
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo* raw = nullptr;
    std::string portStr = std::to_string(port);
    int status = getaddrinfo(host.empty() ? nullptr : host.c_str(), portStr.c_str(), &hints, &raw);
    if (status != 0) {
        return Err(ErrorCode::ConnectionFailed, "Failed to resolve " + host + ": " + gai_strerror(status));
    }
    std::unique_ptr<struct addrinfo, AddrInfoDeleter> result(raw);

    SocketGuard sock(::socket(result->ai_family, result->ai_socktype, result->ai_protocol));
    if (!sock) {
        return Err(ErrorCode::ConnectionFailed, "Failed to create server socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return Err(ErrorCode::ConnectionFailed, "Failed to set socket options: " + std::string(strerror(errno)));
    }

    if (::bind(sock.get(), result->ai_addr, result->ai_addrlen) < 0) {
        return Err(ErrorCode::ConnectionFailed,
                   "Failed to bind to " + host + ":" + portStr + ": " + std::string(strerror(errno)));
    }

    if (::listen(sock.get(), backlog) < 0) {
        return Err(ErrorCode::ConnectionFailed, "Failed to listen: " + std::string(strerror(errno)));
    }

    struct sockaddr_storage bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&bound), &boundLen) == 0 &&
        bound.ss_family == AF_INET) {
        port_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&bound)->sin_port);
    } else {
        port_ = port;
    }

    socket_ = std::move(sock);
    return Ok();
}

Result<TcpConnection> TcpListener::accept(const std::atomic<bool>& stop, int pollMillis) {
    for (;;) {
        if (stop.load()) {
            return Err<TcpConnection>(ErrorCode::Cancelled, "Stopped while waiting for a connection");
        }
        if (!socket_.valid()) {
            return Err<TcpConnection>(ErrorCode::ConnectionFailed, "Listener is not open");
        }

        struct pollfd pfd{};
        pfd.fd = socket_.get();
        pfd.events = POLLIN;
        int rc = pollRetry(&pfd, pollMillis);
        if (rc == 0) {
            continue;
        }
        if (rc < 0) {
            return Err<TcpConnection>(ErrorCode::ConnectionFailed, "poll failed: " + std::string(strerror(errno)));
        }

        struct sockaddr_storage clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);
        int clientFd = ::accept(socket_.get(), reinterpret_cast<struct sockaddr*>(&clientAddr), &addrLen);
        if (clientFd < 0) {
            if (stop.load()) {
                return Err<TcpConnection>(ErrorCode::Cancelled, "Stopped while waiting for a connection");
            }
            if (errno == EINTR || errno == ECONNABORTED || errno == EAGAIN) {
                continue;
            }
            return Err<TcpConnection>(ErrorCode::ConnectionFailed, "accept failed: " + std::string(strerror(errno)));
        }

        int nodelay = 1;
        setsockopt(clientFd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
        return TcpConnection(clientFd, describeAddress(reinterpret_cast<struct sockaddr*>(&clientAddr)));
    }
}

} // namespace Chunkwise
