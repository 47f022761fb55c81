/**
 * @file unix_socket_transport.h
 * @brief Unix domain socket transport implementation
 *
 * Client side of a SOCK_STREAM Unix domain socket with non-blocking I/O.
 * connect() completes an in-progress connect by polling, send() retries on
 * a full socket buffer, receive() never blocks.
 */

#ifndef VTCTL_IPC_UNIX_SOCKET_TRANSPORT_H
#define VTCTL_IPC_UNIX_SOCKET_TRANSPORT_H

#include "transport.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace vtctl {

struct ChannelConfig;

namespace ipc {

/**
 * @brief Unix socket specific configuration
 */
struct UnixSocketConfig {
    /** Socket path of the listening peer */
    std::string socket_path;

    /** Send buffer size hint (SO_SNDBUF), best effort */
    int send_buffer_size = 1024 * 1024;

    /** Receive buffer size hint (SO_RCVBUF), best effort */
    int recv_buffer_size = 1024 * 1024;

    /** Maximum bytes read by one receive() */
    size_t receive_chunk_size = 64 * 1024;

    /** Give up on an in-progress connect after this long */
    std::chrono::milliseconds connect_timeout{5000};

    /** Completion check interval of an in-progress connect */
    std::chrono::milliseconds connect_poll_interval{100};

    /** Pause before retrying a send that would block */
    std::chrono::milliseconds send_retry_interval{1};

    UnixSocketConfig() = default;

    /**
     * @brief Socket settings of a channel configuration
     */
    static UnixSocketConfig fromChannelConfig(const ChannelConfig& config);
};

/**
 * @brief Unix domain socket transport implementation
 */
class UnixSocketTransport : public IStreamTransport {
public:
    /**
     * @brief Constructor
     * @param config Socket configuration
     */
    explicit UnixSocketTransport(const UnixSocketConfig& config);

    /**
     * @brief Destructor - closes the socket
     */
    ~UnixSocketTransport() override;

    UnixSocketTransport(const UnixSocketTransport&) = delete;
    UnixSocketTransport& operator=(const UnixSocketTransport&) = delete;

    // IStreamTransport interface implementation

    TransportResult<bool> connect() override;
    TransportResult<bool> send(const uint8_t* data, size_t size) override;
    TransportResult<std::vector<uint8_t>> receive() override;
    void shutdown() override;
    void close() override;

    bool isConnected() const override;
    TransportState getState() const override;
    TransportStats getStats() const override;
    std::string getInfo() const override;

    /**
     * @brief Get socket file descriptor (-1 if none)
     */
    int getSocketFd() const { return socket_fd_; }

private:
    UnixSocketConfig config_;

    std::atomic<TransportState> state_;
    std::atomic<bool> cancelled_;
    std::atomic<int> socket_fd_;

    // Guards descriptor creation, shutdown and close
    mutable std::mutex fd_mutex_;

    // Serializes concurrent sends so one logical message is written contiguously
    mutable std::mutex send_mutex_;

    mutable std::mutex stats_mutex_;
    TransportStats stats_;

    std::vector<uint8_t> recv_buffer_;

    TransportResult<bool> createSocket();
    TransportResult<bool> waitForConnect(int fd);
    TransportResult<bool> fail(TransportError error, const std::string& what, int err);

    void updateStats(bool is_send, size_t bytes, bool success);

    static bool setNonBlocking(int fd);
    static void setSocketOptions(int fd, const UnixSocketConfig& config);
    static bool isConnectionLost(int err);
};

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_UNIX_SOCKET_TRANSPORT_H
