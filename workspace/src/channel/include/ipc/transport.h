/**
 * @file transport.h
 * @brief Abstract duplex byte-stream transport for the control channel
 *
 * Defines the transport interface the connection manager drives, together
 * with the error codes, result type and statistics shared by every
 * transport implementation.
 */

#ifndef VTCTL_IPC_TRANSPORT_H
#define VTCTL_IPC_TRANSPORT_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vtctl {
namespace ipc {

/**
 * @brief Transport state enumeration
 */
enum class TransportState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    SHUT_DOWN
};

/**
 * @brief Transport statistics structure
 */
struct TransportStats {
    /** Total send() calls that wrote the whole buffer */
    uint64_t messages_sent = 0;

    /** Total receive() calls that returned data */
    uint64_t messages_received = 0;

    /** Total bytes sent */
    uint64_t bytes_sent = 0;

    /** Total bytes received */
    uint64_t bytes_received = 0;

    /** Send errors */
    uint64_t send_errors = 0;

    /** Receive errors */
    uint64_t recv_errors = 0;

    /** Connection errors */
    uint64_t connection_errors = 0;

    /** Last error timestamp */
    std::chrono::system_clock::time_point last_error_time;

    /** Last error message */
    std::string last_error;

    TransportStats() = default;
};

/**
 * @brief Transport error codes
 */
enum class TransportError {
    SUCCESS = 0,
    NOT_CONNECTED,
    ALREADY_CONNECTED,
    CONNECTION_FAILED,
    CONNECTION_CLOSED,
    CONNECTION_TIMEOUT,
    SEND_FAILED,
    RECV_FAILED,
    /** No data available yet on a non-blocking receive; not a failure */
    TIMEOUT,
    INVALID_CONFIG,
    RESOURCE_EXHAUSTED,
    CANCELLED,
    UNKNOWN_ERROR
};

/**
 * @brief Result type for transport operations
 *
 * sys_errno keeps the errno that caused the failure (0 if none) so callers
 * can classify it, error_message keeps the strerror text for logging.
 */
template<typename T>
struct TransportResult {
    TransportError error = TransportError::SUCCESS;
    T value = T{};
    std::string error_message;
    int sys_errno = 0;

    bool success() const { return error == TransportError::SUCCESS; }
    explicit operator bool() const { return success(); }
};

/**
 * @brief Duplex byte-stream transport
 *
 * One instance carries one connection attempt. Framing is done above this
 * layer; send() writes a complete caller buffer, receive() returns whatever
 * bytes are available.
 *
 * Threading contract: connect() and receive() are called from one I/O
 * thread, send() from one writer thread, shutdown() from any thread.
 */
class IStreamTransport {
public:
    virtual ~IStreamTransport() = default;

    /**
     * @brief Establish the connection
     *
     * Blocks the calling thread until connected, a definitive error, the
     * connect timeout, or shutdown() from another thread.
     *
     * @return Result with error code and message
     */
    virtual TransportResult<bool> connect() = 0;

    /**
     * @brief Write the whole buffer
     * @param data Bytes to write
     * @param size Number of bytes
     * @return Result with error code and message
     */
    virtual TransportResult<bool> send(const uint8_t* data, size_t size) = 0;

    /**
     * @brief Read the bytes currently available
     * @return Received bytes, TIMEOUT if none are available yet,
     *         CONNECTION_CLOSED if the peer closed the stream
     */
    virtual TransportResult<std::vector<uint8_t>> receive() = 0;

    /**
     * @brief Interrupt pending and future connect/send/receive calls
     *
     * Thread-safe and idempotent. The descriptor stays open until close().
     */
    virtual void shutdown() = 0;

    /**
     * @brief Release the underlying descriptor
     */
    virtual void close() = 0;

    /**
     * @brief Check if connected to the remote endpoint
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Get current transport state
     */
    virtual TransportState getState() const = 0;

    /**
     * @brief Get transport statistics
     */
    virtual TransportStats getStats() const = 0;

    /**
     * @brief Get transport-specific information as string (for logging)
     */
    virtual std::string getInfo() const = 0;
};

/**
 * @brief Shared pointer type for transport
 */
using TransportPtr = std::shared_ptr<IStreamTransport>;

/**
 * @brief Creates a fresh transport for each connection attempt
 */
using TransportFactory = std::function<TransportPtr()>;

/**
 * @brief Convert transport error to string
 */
const char* transportErrorToString(TransportError error);

/**
 * @brief Convert transport state to string
 */
const char* transportStateToString(TransportState state);

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_TRANSPORT_H
