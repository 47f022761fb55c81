#ifndef VTCTL_IPC_RECONNECT_POLICY_H
#define VTCTL_IPC_RECONNECT_POLICY_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace vtctl {
namespace ipc {

/**
 * @brief Exponential backoff parameters for automatic reconnection
 */
struct ReconnectConfig {
    /** Delay before the first reconnect after a success */
    std::chrono::milliseconds initial_delay{1000};

    /** Upper bound of the delay */
    std::chrono::milliseconds max_delay{30000};

    /** Growth factor applied after every fired reconnect (must be >= 1.0) */
    double backoff_multiplier = 1.5;

    ReconnectConfig() = default;
};

/**
 * @brief Reconnection statistics
 */
struct ReconnectStats {
    /** Reconnects scheduled (beginReconnect() returned a delay) */
    uint64_t total_scheduled = 0;

    /** Scheduled reconnects whose delay elapsed while reconnection was still wanted */
    uint64_t total_attempts = 0;

    /** Scheduled reconnects dropped by cancel() or a disabled policy */
    uint64_t total_cancelled = 0;

    /** Successful connections recorded */
    uint64_t total_successes = 0;

    /** Failed connections recorded */
    uint64_t total_failures = 0;
};

/**
 * @brief Backoff state machine deciding when to reconnect
 *
 * The policy only computes; the caller owns the timer. A reconnect cycle is:
 *
 * @code
 * if (auto delay = policy.beginReconnect()) {
 *     timer.schedule(*delay, [&] {
 *         if (policy.completeReconnect()) {
 *             connect();
 *             policy.advanceDelay();
 *         }
 *     });
 * }
 * @endcode
 *
 * With the defaults the Nth consecutive delay is min(1.0 * 1.5^(N-1), 30.0)
 * seconds. A successful connection resets the delay to the initial value.
 *
 * The policy is thread-safe.
 */
class ReconnectPolicy {
public:
    /** Delay in fractional seconds; growth is computed without rounding */
    using Seconds = std::chrono::duration<double>;

    /**
     * @brief Construct reconnect policy with configuration
     * @throws std::invalid_argument if initial_delay > max_delay or backoff_multiplier < 1.0
     */
    explicit ReconnectPolicy(const ReconnectConfig& config = ReconnectConfig());

    ~ReconnectPolicy();

    ReconnectPolicy(const ReconnectPolicy&) = delete;
    ReconnectPolicy& operator=(const ReconnectPolicy&) = delete;
    ReconnectPolicy(ReconnectPolicy&&) noexcept;
    ReconnectPolicy& operator=(ReconnectPolicy&&) noexcept;

    /**
     * @brief Start a new session (explicit connect by the user)
     *
     * Enables reconnection, resets the delay and the failure count.
     */
    void resetForNewSession();

    /**
     * @brief Request a reconnect
     * @return Delay to wait, or std::nullopt if reconnection is disabled or
     *         one is already pending
     */
    std::optional<Seconds> beginReconnect();

    /**
     * @brief The pending delay elapsed
     * @return true if the caller should connect now
     */
    bool completeReconnect();

    /**
     * @brief Grow the delay for the next reconnect, capped at max_delay
     */
    void advanceDelay();

    /**
     * @brief Disable reconnection and forget a pending reconnect
     */
    void cancel();

    /** Connection established: failures = 0, delay = initial */
    void recordSuccess();

    /** Connection attempt or live connection failed */
    void recordFailure();

    bool shouldReconnect() const;
    bool isReconnecting() const;
    uint32_t consecutiveFailures() const;
    Seconds currentDelay() const;

    /**
     * @brief Delay of the Nth consecutive reconnect (1-indexed)
     * @return min(initial * multiplier^(N-1), max); zero for N == 0
     */
    Seconds calculateDelay(uint32_t attempt_number) const;

    /**
     * @brief Whether an errno value describes a condition a reconnect can fix
     */
    bool isRetryableError(int error_code) const;

    ReconnectStats getStatistics() const;

    const ReconnectConfig& getConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_RECONNECT_POLICY_H
