#include "ipc/reconnect_policy.h"
#include "utils/log.h"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <mutex>
#include <stdexcept>

namespace vtctl {
namespace ipc {

class ReconnectPolicy::Impl {
public:
    explicit Impl(const ReconnectConfig& config)
        : config_(config)
        , initial_(config.initial_delay)
        , max_(config.max_delay) {
        validateConfig();
        delay_ = initial_;
    }

    void resetForNewSession() {
        std::lock_guard<std::mutex> lock(mutex_);
        should_reconnect_ = true;
        delay_ = initial_;
        consecutive_failures_ = 0;
    }

    std::optional<Seconds> beginReconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!should_reconnect_) {
            LOGD_FMT("ReconnectPolicy: reconnection disabled, not scheduling");
            return std::nullopt;
        }
        if (is_reconnecting_) {
            LOGD_FMT("ReconnectPolicy: reconnect already pending");
            return std::nullopt;
        }
        is_reconnecting_ = true;
        stats_.total_scheduled++;
        return delay_;
    }

    bool completeReconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        is_reconnecting_ = false;
        if (!should_reconnect_) {
            stats_.total_cancelled++;
            return false;
        }
        stats_.total_attempts++;
        return true;
    }

    void advanceDelay() {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = std::min(delay_ * config_.backoff_multiplier, max_);
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_reconnecting_) {
            stats_.total_cancelled++;
        }
        should_reconnect_ = false;
        is_reconnecting_ = false;
    }

    void recordSuccess() {
        std::lock_guard<std::mutex> lock(mutex_);
        consecutive_failures_ = 0;
        delay_ = initial_;
        stats_.total_successes++;
    }

    void recordFailure() {
        std::lock_guard<std::mutex> lock(mutex_);
        consecutive_failures_++;
        stats_.total_failures++;
    }

    bool shouldReconnect() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return should_reconnect_;
    }

    bool isReconnecting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return is_reconnecting_;
    }

    uint32_t consecutiveFailures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return consecutive_failures_;
    }

    Seconds currentDelay() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delay_;
    }

    Seconds calculateDelay(uint32_t attempt_number) const {
        if (attempt_number == 0) {
            return Seconds(0);
        }
        double multiplier = std::pow(config_.backoff_multiplier, attempt_number - 1);
        return std::min(initial_ * multiplier, max_);
    }

    bool isRetryableError(int error_code) const {
        switch (error_code) {
            // Temporary errors (EAGAIN and EWOULDBLOCK are often the same value)
            case EAGAIN:
            #if EAGAIN != EWOULDBLOCK
            case EWOULDBLOCK:
            #endif
            case EINTR:
                return true;

            // Connection errors
            case EPIPE:
            case ECONNREFUSED:
            case ECONNRESET:
            case ECONNABORTED:
            case ENOTCONN:
            case ENOENT:
                return true;

            case ETIMEDOUT:
                return true;

            // Non-retryable errors
            case EACCES:
            case EPERM:
            case EINVAL:
            case EBADF:
                return false;

            default:
                return false;
        }
    }

    ReconnectStats getStatistics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    const ReconnectConfig& getConfig() const { return config_; }

private:
    void validateConfig() {
        if (config_.initial_delay > config_.max_delay) {
            throw std::invalid_argument("Initial delay cannot exceed max delay");
        }
        if (config_.initial_delay.count() < 0) {
            throw std::invalid_argument("Initial delay cannot be negative");
        }
        if (config_.backoff_multiplier < 1.0) {
            throw std::invalid_argument("Backoff multiplier must be >= 1.0");
        }
    }

    const ReconnectConfig config_;
    const Seconds initial_;
    const Seconds max_;

    mutable std::mutex mutex_;
    Seconds delay_;
    uint32_t consecutive_failures_ = 0;
    bool is_reconnecting_ = false;
    bool should_reconnect_ = true;
    ReconnectStats stats_;
};

ReconnectPolicy::ReconnectPolicy(const ReconnectConfig& config)
    : pImpl_(std::make_unique<Impl>(config)) {
}

ReconnectPolicy::~ReconnectPolicy() = default;

ReconnectPolicy::ReconnectPolicy(ReconnectPolicy&&) noexcept = default;
ReconnectPolicy& ReconnectPolicy::operator=(ReconnectPolicy&&) noexcept = default;

void ReconnectPolicy::resetForNewSession() {
    pImpl_->resetForNewSession();
}

std::optional<ReconnectPolicy::Seconds> ReconnectPolicy::beginReconnect() {
    return pImpl_->beginReconnect();
}

bool ReconnectPolicy::completeReconnect() {
    return pImpl_->completeReconnect();
}

void ReconnectPolicy::advanceDelay() {
    pImpl_->advanceDelay();
}

void ReconnectPolicy::cancel() {
    pImpl_->cancel();
}

void ReconnectPolicy::recordSuccess() {
    pImpl_->recordSuccess();
}

void ReconnectPolicy::recordFailure() {
    pImpl_->recordFailure();
}

bool ReconnectPolicy::shouldReconnect() const {
    return pImpl_->shouldReconnect();
}

bool ReconnectPolicy::isReconnecting() const {
    return pImpl_->isReconnecting();
}

uint32_t ReconnectPolicy::consecutiveFailures() const {
    return pImpl_->consecutiveFailures();
}

ReconnectPolicy::Seconds ReconnectPolicy::currentDelay() const {
    return pImpl_->currentDelay();
}

ReconnectPolicy::Seconds ReconnectPolicy::calculateDelay(uint32_t attempt_number) const {
    return pImpl_->calculateDelay(attempt_number);
}

bool ReconnectPolicy::isRetryableError(int error_code) const {
    return pImpl_->isRetryableError(error_code);
}

ReconnectStats ReconnectPolicy::getStatistics() const {
    return pImpl_->getStatistics();
}

const ReconnectConfig& ReconnectPolicy::getConfig() const {
    return pImpl_->getConfig();
}

} // namespace ipc
} // namespace vtctl
