/**
 * @file channel_types.h
 * @brief Connection state, error and statistics types of the control channel
 */

#ifndef VTCTL_IPC_CHANNEL_TYPES_H
#define VTCTL_IPC_CHANNEL_TYPES_H

#include "transport.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace vtctl {
namespace ipc {

/**
 * @brief Lifecycle stage of the control channel
 *
 * SETUP/CANCELLED/WAITING -> PREPARING -> READY, PREPARING -> FAILED,
 * READY -> FAILED, FAILED -> WAITING, any -> CANCELLED.
 */
enum class ConnectionState {
    /** Constructed, connect() not called yet */
    SETUP,

    /** Connection attempt in flight */
    PREPARING,

    /** Connected; keep-alive and receive loop running */
    READY,

    /** Attempt or live connection failed */
    FAILED,

    /** Explicitly disconnected; no automatic reconnection */
    CANCELLED,

    /** Waiting for the backoff delay before reconnecting */
    WAITING
};

/**
 * @brief Errors reported to channel users
 */
enum class ChannelError {
    NONE = 0,

    /** No connection and none will be made (after disconnect()) */
    NOT_CONNECTED,

    /** The peer closed the stream or the connection was lost */
    CONNECTION_CLOSED,

    /** Writing a message failed */
    SEND_FAILED,

    /** A connection attempt failed */
    CONNECTION_FAILED
};

/**
 * @brief Outcome of a channel operation
 */
struct ChannelStatus {
    ChannelError error = ChannelError::NONE;

    /** errno behind the error, 0 if none */
    int sys_errno = 0;

    /** Human readable detail for logs */
    std::string message;

    bool success() const { return error == ChannelError::NONE; }
    explicit operator bool() const { return success(); }

    static ChannelStatus ok() { return ChannelStatus(); }

    static ChannelStatus failure(ChannelError error, const std::string& message, int sys_errno = 0) {
        ChannelStatus status;
        status.error = error;
        status.message = message;
        status.sys_errno = sys_errno;
        return status;
    }
};

/**
 * @brief Channel statistics
 */
struct ChannelStats {
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t send_errors = 0;

    uint64_t pings_sent = 0;
    uint64_t pongs_received = 0;
    uint64_t keep_alive_timeouts = 0;

    /** Inbound messages dropped because no handler was installed */
    uint64_t unhandled_messages = 0;
    uint64_t corrupted_frames = 0;
    uint64_t buffer_overflows = 0;

    /** Pending messages evicted because the queue was full */
    uint64_t pending_dropped = 0;
    uint64_t pending_flushed = 0;

    uint64_t connection_attempts = 0;
    uint64_t connection_failures = 0;
    uint64_t reconnects_scheduled = 0;
    uint32_t consecutive_failures = 0;

    std::chrono::system_clock::time_point last_connected_time;
};

/** Delivery outcome of one outbound message */
using SendCompletion = std::function<void(const ChannelStatus&)>;

/** Receives every inbound payload that is not a keep-alive reply */
using MessageHandler = std::function<void(const std::string& payload)>;

/** Observes state transitions; status describes the error for FAILED and WAITING */
using StateChangeCallback = std::function<void(ConnectionState state, const ChannelStatus& status)>;

const char* connectionStateToString(ConnectionState state);
const char* channelErrorToString(ChannelError error);

/**
 * @brief Wrap a transport failure into a channel status
 * @param result Transport result (success maps to ok())
 * @param fallback Error used unless the transport reports a closed or missing connection
 */
template<typename T>
ChannelStatus toChannelStatus(const TransportResult<T>& result, ChannelError fallback) {
    switch (result.error) {
        case TransportError::SUCCESS:
            return ChannelStatus::ok();
        case TransportError::CONNECTION_CLOSED:
        case TransportError::CANCELLED:
            return ChannelStatus::failure(ChannelError::CONNECTION_CLOSED, result.error_message, result.sys_errno);
        case TransportError::NOT_CONNECTED:
            return ChannelStatus::failure(ChannelError::NOT_CONNECTED, result.error_message, result.sys_errno);
        default:
            return ChannelStatus::failure(fallback, result.error_message, result.sys_errno);
    }
}

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_CHANNEL_TYPES_H
