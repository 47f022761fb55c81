/**
 * @file keep_alive_monitor.h
 * @brief Application-level ping/pong liveness tracking
 *
 * The channel sends a system/ping request at a fixed interval and expects a
 * system/ping response. A connection that has not produced a reply within
 * interval * timeout_multiplier is considered dead even if the socket
 * still looks healthy.
 */

#ifndef VTCTL_IPC_KEEP_ALIVE_MONITOR_H
#define VTCTL_IPC_KEEP_ALIVE_MONITOR_H

#include <chrono>
#include <cstdint>
#include <string>

namespace vtctl {
namespace ipc {

/**
 * @brief Keep-alive configuration
 */
struct KeepAliveConfig {
    /** Interval between pings */
    std::chrono::milliseconds interval{30000};

    /** Missed intervals tolerated before the connection is declared dead */
    uint32_t timeout_multiplier = 2;

    KeepAliveConfig() = default;
};

/**
 * @brief Keep-alive statistics
 */
struct KeepAliveStats {
    uint64_t pings_sent = 0;
    uint64_t pongs_received = 0;
    uint64_t timeouts = 0;
};

/**
 * @brief Liveness state of one connection
 *
 * Not thread-safe; owned by the connection manager's control thread.
 */
class KeepAliveMonitor {
public:
    using Clock = std::chrono::steady_clock;

    explicit KeepAliveMonitor(const KeepAliveConfig& config = KeepAliveConfig());

    /**
     * @brief Start judging a fresh connection from now
     */
    void reset(Clock::time_point now);

    /**
     * @brief Record an inbound pong
     */
    void recordPong(Clock::time_point now);

    /** Count a ping handed to the writer */
    void recordPingSent() { stats_.pings_sent++; }

    /** Count a detected timeout */
    void recordTimeout() { stats_.timeouts++; }

    /**
     * @brief Check whether the silence since the last pong exceeds the timeout
     */
    bool isExpired(Clock::time_point now) const;

    std::chrono::milliseconds timeSinceLastPong(Clock::time_point now) const;

    std::chrono::milliseconds interval() const { return config_.interval; }

    /** interval * timeout_multiplier */
    std::chrono::milliseconds timeout() const;

    Clock::time_point lastPongTime() const { return last_pong_time_; }

    const KeepAliveStats& getStats() const { return stats_; }

    /**
     * @brief Recognize a keep-alive reply
     *
     * True only for a JSON object whose type, category and action are
     * exactly "response", "system" and "ping".
     */
    static bool isPong(const std::string& payload);

    /**
     * @brief Serialized system/ping request with a fresh id
     */
    static std::string makePing();

private:
    KeepAliveConfig config_;
    Clock::time_point last_pong_time_;
    KeepAliveStats stats_;
};

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_KEEP_ALIVE_MONITOR_H
