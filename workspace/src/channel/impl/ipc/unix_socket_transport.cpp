/**
 * @file unix_socket_transport.cpp
 * @brief Unix domain socket transport implementation
 */

#include "ipc/unix_socket_transport.h"
#include "core/channel_config.h"
#include "utils/log.h"
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <sstream>
#include <thread>

namespace vtctl {
namespace ipc {

UnixSocketConfig UnixSocketConfig::fromChannelConfig(const ChannelConfig& config) {
    UnixSocketConfig unix_config;
    unix_config.socket_path = config.socket_path;
    unix_config.send_buffer_size = config.socket_buffer_size;
    unix_config.recv_buffer_size = config.socket_buffer_size;
    unix_config.receive_chunk_size = config.receive_chunk_size;
    unix_config.connect_timeout = config.connect_timeout;
    unix_config.connect_poll_interval = config.connect_poll_interval;
    unix_config.send_retry_interval = config.send_retry_interval;
    return unix_config;
}

UnixSocketTransport::UnixSocketTransport(const UnixSocketConfig& config)
    : config_(config)
    , state_(TransportState::DISCONNECTED)
    , cancelled_(false)
    , socket_fd_(-1) {
    if (config_.receive_chunk_size == 0) {
        config_.receive_chunk_size = 64 * 1024;
    }
    recv_buffer_.resize(config_.receive_chunk_size);
}

UnixSocketTransport::~UnixSocketTransport() {
    close();
}

TransportResult<bool> UnixSocketTransport::connect() {
    if (state_ == TransportState::CONNECTED) {
        return {TransportError::ALREADY_CONNECTED, false, "Already connected"};
    }
    if (cancelled_) {
        return {TransportError::CANCELLED, false, "Transport shut down"};
    }

    LOGI_FMT("Connecting to socket: " << config_.socket_path);
    state_ = TransportState::CONNECTING;

    auto result = createSocket();
    if (!result) {
        state_ = TransportState::DISCONNECTED;
        return result;
    }

    int fd = socket_fd_;
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    memcpy(addr.sun_path, config_.socket_path.c_str(), config_.socket_path.size());

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        if (err != EINPROGRESS) {
            state_ = TransportState::DISCONNECTED;
            return fail(TransportError::CONNECTION_FAILED, "Failed to connect", err);
        }

        LOGD_FMT("Non-blocking connect in progress on fd=" << fd);
        result = waitForConnect(fd);
        if (!result) {
            state_ = TransportState::DISCONNECTED;
            return result;
        }
    }

    if (cancelled_) {
        state_ = TransportState::DISCONNECTED;
        return {TransportError::CANCELLED, false, "Transport shut down"};
    }

    state_ = TransportState::CONNECTED;
    LOGI_FMT("Connected successfully to " << config_.socket_path);
    return {TransportError::SUCCESS, true, ""};
}

TransportResult<bool> UnixSocketTransport::createSocket() {
    // sun_path must also hold the terminating NUL
    if (config_.socket_path.empty() ||
        config_.socket_path.size() >= sizeof(sockaddr_un::sun_path)) {
        LOGE_FMT("Socket path too long or empty: '" << config_.socket_path << "'");
        return fail(TransportError::INVALID_CONFIG, "Socket path too long", ENAMETOOLONG);
    }

    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (cancelled_) {
        return {TransportError::CANCELLED, false, "Transport shut down"};
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        int err = errno;
        return fail(TransportError::RESOURCE_EXHAUSTED, "Failed to create socket", err);
    }

    setSocketOptions(fd, config_);

    if (!setNonBlocking(fd)) {
        int err = errno;
        ::close(fd);
        return fail(TransportError::RESOURCE_EXHAUSTED, "Failed to set non-blocking mode", err);
    }

    socket_fd_ = fd;
    LOGD_FMT("Created socket fd=" << fd);
    return {TransportError::SUCCESS, true, ""};
}

TransportResult<bool> UnixSocketTransport::waitForConnect(int fd) {
    auto deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
    int poll_ms = static_cast<int>(config_.connect_poll_interval.count());
    if (poll_ms <= 0) {
        poll_ms = 1;
    }

    while (!cancelled_) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, poll_ms);
        if (ready < 0 && errno != EINTR) {
            int err = errno;
            return fail(TransportError::CONNECTION_FAILED, "poll() failed during connect", err);
        }

        if (ready > 0) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
                int err = errno;
                return fail(TransportError::CONNECTION_FAILED, "getsockopt(SO_ERROR) failed", err);
            }
            if (so_error == 0) {
                return {TransportError::SUCCESS, true, ""};
            }
            if (so_error != EINPROGRESS) {
                return fail(TransportError::CONNECTION_FAILED, "Failed to connect", so_error);
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return fail(TransportError::CONNECTION_TIMEOUT, "Connect timed out", ETIMEDOUT);
        }
    }

    return {TransportError::CANCELLED, false, "Transport shut down"};
}

TransportResult<bool> UnixSocketTransport::send(const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(send_mutex_);

    int fd = socket_fd_;
    if (fd < 0 || state_ != TransportState::CONNECTED) {
        updateStats(true, 0, false);
        return {TransportError::NOT_CONNECTED, false, "Not connected", ENOTCONN};
    }

    size_t total_sent = 0;
    while (total_sent < size) {
        ssize_t sent = ::send(fd, data + total_sent, size - total_sent, MSG_NOSIGNAL);
        if (sent > 0) {
            total_sent += static_cast<size_t>(sent);
            continue;
        }
        if (sent < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            if (err == EAGAIN || err == EWOULDBLOCK) {
                if (cancelled_) {
                    updateStats(true, total_sent, false);
                    return {TransportError::CONNECTION_CLOSED, false, "Transport shut down", ENOTCONN};
                }
                // Socket buffer full
                std::this_thread::sleep_for(config_.send_retry_interval);
                continue;
            }
            updateStats(true, total_sent, false);
            if (isConnectionLost(err)) {
                state_ = TransportState::DISCONNECTED;
                return fail(TransportError::CONNECTION_CLOSED, "Connection lost during send", err);
            }
            return fail(TransportError::SEND_FAILED, "Failed to send data", err);
        }
    }

    updateStats(true, size, true);
    return {TransportError::SUCCESS, true, ""};
}

TransportResult<std::vector<uint8_t>> UnixSocketTransport::receive() {
    int fd = socket_fd_;
    if (fd < 0 || state_ != TransportState::CONNECTED) {
        return {TransportError::NOT_CONNECTED, {}, "Not connected", ENOTCONN};
    }

    ssize_t received = ::recv(fd, recv_buffer_.data(), recv_buffer_.size(), 0);

    if (received == 0) {
        state_ = TransportState::DISCONNECTED;
        return {TransportError::CONNECTION_CLOSED, {}, "Connection closed by peer"};
    }

    if (received < 0) {
        int err = errno;
        if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
            return {TransportError::TIMEOUT, {}, "No data available"};
        }
        updateStats(false, 0, false);
        if (isConnectionLost(err)) {
            state_ = TransportState::DISCONNECTED;
            return {TransportError::CONNECTION_CLOSED, {},
                    std::string("Connection lost during receive: ") + strerror(err), err};
        }
        return {TransportError::RECV_FAILED, {},
                std::string("Failed to receive data: ") + strerror(err), err};
    }

    updateStats(false, static_cast<size_t>(received), true);
    return {TransportError::SUCCESS,
            std::vector<uint8_t>(recv_buffer_.begin(), recv_buffer_.begin() + received), ""};
}

void UnixSocketTransport::shutdown() {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (cancelled_.exchange(true)) {
        return;
    }

    int fd = socket_fd_;
    if (fd >= 0) {
        LOGD_FMT("Shutting down socket fd=" << fd);
        ::shutdown(fd, SHUT_RDWR);
    }
    state_ = TransportState::SHUT_DOWN;
}

void UnixSocketTransport::close() {
    shutdown();

    // Waits for an in-flight send, which the shutdown above makes fail fast
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    std::lock_guard<std::mutex> lock(fd_mutex_);
    int fd = socket_fd_.exchange(-1);
    if (fd >= 0) {
        LOGD_FMT("Closing socket fd=" << fd);
        ::close(fd);
    }
}

bool UnixSocketTransport::isConnected() const {
    return state_ == TransportState::CONNECTED;
}

TransportState UnixSocketTransport::getState() const {
    return state_;
}

TransportStats UnixSocketTransport::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

std::string UnixSocketTransport::getInfo() const {
    std::ostringstream oss;
    oss << "UnixSocketTransport[path=" << config_.socket_path
        << ", fd=" << socket_fd_
        << ", state=" << transportStateToString(state_) << "]";
    return oss.str();
}

TransportResult<bool> UnixSocketTransport::fail(TransportError error, const std::string& what, int err) {
    std::string message = what + ": " + strerror(err);
    LOGE_FMT(message << " (" << config_.socket_path << ")");
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (error == TransportError::CONNECTION_FAILED || error == TransportError::CONNECTION_TIMEOUT ||
            error == TransportError::INVALID_CONFIG || error == TransportError::RESOURCE_EXHAUSTED) {
            stats_.connection_errors++;
        }
        stats_.last_error = message;
        stats_.last_error_time = std::chrono::system_clock::now();
    }
    return {error, false, message, err};
}

void UnixSocketTransport::updateStats(bool is_send, size_t bytes, bool success) {
    std::lock_guard<std::mutex> lock(stats_mutex_);

    if (is_send) {
        if (success) {
            stats_.messages_sent++;
            stats_.bytes_sent += bytes;
        } else {
            stats_.send_errors++;
        }
    } else {
        if (success) {
            stats_.messages_received++;
            stats_.bytes_received += bytes;
        } else {
            stats_.recv_errors++;
        }
    }
}

bool UnixSocketTransport::setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        LOGE_FMT("Failed to get socket flags for fd=" << fd << ": " << strerror(errno));
        return false;
    }
    bool result = fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
    if (!result) {
        LOGE_FMT("Failed to set non-blocking for fd=" << fd << ": " << strerror(errno));
    }
    return result;
}

void UnixSocketTransport::setSocketOptions(int fd, const UnixSocketConfig& config) {
    if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF,
                   &config.send_buffer_size, sizeof(config.send_buffer_size)) < 0) {
        LOGW_FMT("Failed to set SO_SNDBUF on fd=" << fd << ": " << strerror(errno));
    }
    if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF,
                   &config.recv_buffer_size, sizeof(config.recv_buffer_size)) < 0) {
        LOGW_FMT("Failed to set SO_RCVBUF on fd=" << fd << ": " << strerror(errno));
    }
}

bool UnixSocketTransport::isConnectionLost(int err) {
    switch (err) {
        case EPIPE:
        case ECONNRESET:
        case ECONNREFUSED:
        case ENOTCONN:
        case ECONNABORTED:
            return true;
        default:
            return false;
    }
}

} // namespace ipc
} // namespace vtctl
