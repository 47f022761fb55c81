/**
 * @file connection_manager.cpp
 * @brief Implementation of the control channel connection manager
 */

#include "ipc/connection_manager.h"
#include "ipc/frame_codec.h"
#include "ipc/keep_alive_monitor.h"
#include "ipc/pending_queue.h"
#include "ipc/reconnect_policy.h"
#include "ipc/unix_socket_transport.h"
#include "utils/serial_executor.h"
#include "utils/log.h"
#include <atomic>
#include <cerrno>
#include <iterator>
#include <mutex>
#include <thread>
#include <vector>

namespace vtctl {
namespace ipc {

namespace {

ReconnectConfig makeReconnectConfig(const ChannelConfig& config) {
    ReconnectConfig reconnect;
    reconnect.initial_delay = config.initial_reconnect_delay;
    reconnect.max_delay = config.max_reconnect_delay;
    reconnect.backoff_multiplier = config.reconnect_backoff_multiplier;
    return reconnect;
}

KeepAliveConfig makeKeepAliveConfig(const ChannelConfig& config) {
    KeepAliveConfig keep_alive;
    keep_alive.interval = config.keep_alive_interval;
    keep_alive.timeout_multiplier = config.keep_alive_timeout_multiplier;
    return keep_alive;
}

} // namespace

/**
 * @brief One connection attempt and, once connected, its live connection
 */
struct Connection {
    uint64_t generation = 0;
    TransportPtr transport;
    std::atomic<bool> stop{false};
    std::thread io_thread;
};

using ConnectionPtr = std::shared_ptr<Connection>;
using StatusPromise = std::shared_ptr<std::promise<ChannelStatus>>;
using PendingBatch = std::shared_ptr<std::vector<PendingMessage>>;

/**
 * @brief ConnectionManager implementation
 *
 * Every member below the executors is touched only from the control
 * executor, except the atomics and the statistics.
 */
class ConnectionManager::Impl {
public:
    Impl(const ChannelConfig& config,
         MessageHandler on_message,
         StateChangeCallback on_state_change,
         TransportFactory factory)
        : config_(config)
        , message_handler_(std::move(on_message))
        , state_callback_(std::move(on_state_change))
        , factory_(std::move(factory))
        , decoder_(config.max_frame_size, config.max_receive_buffer_size)
        , pending_(config.pending_queue_capacity)
        , reconnect_(makeReconnectConfig(config))
        , keep_alive_(makeKeepAliveConfig(config))
        , state_(ConnectionState::SETUP)
        , published_state_(ConnectionState::SETUP)
        , is_connecting_(false)
        , generation_(0)
        , session_(0)
        , keep_alive_timer_(0)
        , reconnect_timer_(0)
        , reconnect_token_(0)
        , pending_count_(0)
        , control_("control")
        , writer_("writer") {
        if (!factory_) {
            UnixSocketConfig unix_config = UnixSocketConfig::fromChannelConfig(config_);
            factory_ = [unix_config]() -> TransportPtr {
                return std::make_shared<UnixSocketTransport>(unix_config);
            };
        }
        LOGD_FMT("ConnectionManager::Impl constructed for " << config_.socket_path);
    }

    ~Impl() {
        LOGD_FMT("ConnectionManager::Impl destructor called");
        disconnect();
        writer_.shutdown();
        control_.shutdown();
    }

    // Public entry points (any thread)

    void connect() {
        control_.post([this]() { connectInternal(false); });
    }

    std::future<ChannelStatus> send(std::string payload, SendCompletion on_delivered) {
        auto promise = std::make_shared<std::promise<ChannelStatus>>();
        auto future = promise->get_future();

        bool posted = control_.post([this, payload = std::move(payload), promise, on_delivered]() {
            sendInternal(payload, promise, on_delivered);
        });
        if (!posted) {
            auto status = ChannelStatus::failure(ChannelError::NOT_CONNECTED, "Channel shut down");
            promise->set_value(status);
            if (on_delivered) {
                on_delivered(status);
            }
        }
        return future;
    }

    void disconnect() {
        if (control_.isCurrentThread()) {
            disconnectInternal();
            return;
        }

        auto done = std::make_shared<std::promise<void>>();
        auto finished = done->get_future();
        if (!control_.post([this, done]() {
                disconnectInternal();
                done->set_value();
            })) {
            return;
        }
        finished.wait();
    }

    ConnectionState getState() const {
        return published_state_;
    }

    ChannelStats getStats() const {
        ChannelStats stats;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats = stats_;
        }
        stats.consecutive_failures = reconnect_.consecutiveFailures();
        return stats;
    }

    size_t pendingCount() const {
        return pending_count_;
    }

    const ChannelConfig& getConfig() const {
        return config_;
    }

private:
    // Connection lifecycle (control thread)

    void connectInternal(bool from_reconnect) {
        if (is_connecting_) {
            LOGD_FMT("Connection attempt already in progress");
            return;
        }

        if (!from_reconnect) {
            reconnect_.resetForNewSession();
            cancelReconnectTimer();
            if (state_ == ConnectionState::READY && connection_) {
                LOGD_FMT("Already connected to " << config_.socket_path);
                return;
            }
        }

        teardownConnection();
        decoder_.clear();

        auto conn = std::make_shared<Connection>();
        conn->generation = ++generation_;
        conn->transport = factory_();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.connection_attempts++;
        }

        if (!conn->transport) {
            handleConnectionError(ChannelStatus::failure(ChannelError::CONNECTION_FAILED,
                                                         "Transport factory returned no transport"));
            return;
        }

        LOGI_FMT("Connecting control channel (attempt " << conn->generation << "): "
                 << conn->transport->getInfo());

        is_connecting_ = true;
        connection_ = conn;
        // Results are posted back to this thread, so they cannot overtake PREPARING
        conn->io_thread = std::thread(&Impl::ioLoop, this, conn);
        setState(ConnectionState::PREPARING, ChannelStatus::ok());
    }

    void onConnected(uint64_t generation) {
        if (!isCurrent(generation)) {
            LOGD_FMT("Ignoring connect result of superseded attempt " << generation);
            return;
        }

        is_connecting_ = false;
        reconnect_.recordSuccess();
        keep_alive_.reset(KeepAliveMonitor::Clock::now());
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.last_connected_time = std::chrono::system_clock::now();
        }

        setState(ConnectionState::READY, ChannelStatus::ok());
        if (!isCurrent(generation)) {
            return;
        }
        startKeepAlive();
        flushPending();
    }

    void onConnectFailed(uint64_t generation, const ChannelStatus& status) {
        if (!isCurrent(generation)) {
            LOGD_FMT("Ignoring connect failure of superseded attempt " << generation);
            return;
        }
        is_connecting_ = false;
        handleConnectionError(status);
    }

    void onTransportFailure(uint64_t generation, const ChannelStatus& status) {
        if (!isCurrent(generation) || state_ != ConnectionState::READY) {
            return;
        }
        handleConnectionError(status);
    }

    void handleConnectionError(const ChannelStatus& status) {
        LOGE_FMT("Control channel error: " << channelErrorToString(status.error)
                 << " - " << status.message);

        reconnect_.recordFailure();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.connection_failures++;
        }

        is_connecting_ = false;
        setState(ConnectionState::FAILED, status);
        stopKeepAlive();
        teardownConnection();
        decoder_.clear();
        scheduleReconnect(status);
    }

    void teardownConnection() {
        if (!connection_) {
            return;
        }

        ConnectionPtr conn = std::move(connection_);
        connection_.reset();

        conn->stop = true;
        conn->transport->shutdown();
        if (conn->io_thread.joinable()) {
            conn->io_thread.join();
        }
        conn->transport->close();
        LOGD_FMT("Connection attempt " << conn->generation << " torn down");
    }

    void disconnectInternal() {
        LOGI_FMT("Disconnecting control channel");

        reconnect_.cancel();
        cancelReconnectTimer();
        stopKeepAlive();
        teardownConnection();

        is_connecting_ = false;
        decoder_.clear();
        pending_.clear();
        syncPendingStats();
        session_++;

        setState(ConnectionState::CANCELLED, ChannelStatus::ok());
    }

    // Reconnection (control thread)

    void scheduleReconnect(const ChannelStatus& status) {
        auto delay = reconnect_.beginReconnect();
        if (!delay) {
            return;
        }

        auto delay_ms = std::chrono::duration_cast<std::chrono::milliseconds>(*delay);
        uint32_t failures = reconnect_.consecutiveFailures();
        LOGI_FMT("Scheduling reconnect in " << delay->count() << "s (consecutive failures: "
                 << failures << ", next backoff step: "
                 << reconnect_.calculateDelay(failures + 1).count() << "s)");
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.reconnects_scheduled++;
        }

        setState(ConnectionState::WAITING, status);
        uint64_t token = ++reconnect_token_;
        reconnect_timer_ = control_.postDelayed(delay_ms, [this, token]() { onReconnectTimer(token); });
    }

    void onReconnectTimer(uint64_t token) {
        if (token != reconnect_token_) {
            LOGD_FMT("Ignoring cancelled reconnect timer");
            return;
        }
        reconnect_timer_ = 0;
        if (!reconnect_.completeReconnect()) {
            LOGD_FMT("Reconnect cancelled");
            return;
        }
        reconnect_.advanceDelay();
        connectInternal(true);
    }

    void cancelReconnectTimer() {
        if (reconnect_timer_ == 0) {
            return;
        }
        if (!control_.cancel(reconnect_timer_)) {
            LOGD_FMT("Reconnect timer already due, discarding it");
        }
        reconnect_token_++;
        reconnect_timer_ = 0;
        // Clears the pending flag; the caller decides whether to connect
        reconnect_.completeReconnect();
    }

    // Keep-alive (control thread)

    void startKeepAlive() {
        stopKeepAlive();
        uint64_t generation = connection_->generation;
        keep_alive_timer_ = control_.postDelayed(keep_alive_.interval(),
            [this, generation]() { onKeepAliveTick(generation); });
    }

    void stopKeepAlive() {
        if (keep_alive_timer_ != 0) {
            control_.cancel(keep_alive_timer_);
            keep_alive_timer_ = 0;
        }
    }

    void onKeepAliveTick(uint64_t generation) {
        keep_alive_timer_ = 0;
        if (!isCurrent(generation) || state_ != ConnectionState::READY) {
            return;
        }

        auto now = KeepAliveMonitor::Clock::now();
        if (keep_alive_.isExpired(now)) {
            LOGW_FMT("No keep-alive reply for " << keep_alive_.timeSinceLastPong(now).count()
                     << "ms (timeout " << keep_alive_.timeout().count() << "ms), reconnecting");
            keep_alive_.recordTimeout();
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.keep_alive_timeouts++;
            }
            handleConnectionError(ChannelStatus::failure(ChannelError::CONNECTION_CLOSED,
                                                         "Keep-alive timeout", ETIMEDOUT));
            return;
        }

        keep_alive_.recordPingSent();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.pings_sent++;
        }
        writeFrame(KeepAliveMonitor::makePing(), nullptr,
                   [](const ChannelStatus& status) {
                       if (!status) {
                           LOGW_FMT("Failed to send keep-alive ping: " << status.message);
                       }
                   },
                   false);

        keep_alive_timer_ = control_.postDelayed(keep_alive_.interval(),
            [this, generation]() { onKeepAliveTick(generation); });
    }

    // Outbound path

    void sendInternal(const std::string& payload, const StatusPromise& promise, const SendCompletion& completion) {
        if (!reconnect_.shouldReconnect()) {
            auto status = ChannelStatus::failure(ChannelError::NOT_CONNECTED, "Channel is disconnected");
            LOGW_FMT("Send rejected: channel is disconnected");
            promise->set_value(status);
            if (completion) {
                invokeCompletion(completion, status);
            }
            return;
        }

        if (state_ != ConnectionState::READY || !connection_) {
            if (pending_.enqueue(payload, completion)) {
                LOGW_FMT("Pending queue full, oldest message dropped");
            }
            syncPendingStats();
            promise->set_value(ChannelStatus::ok());
            return;
        }

        writeFrame(payload, promise, completion, true);
    }

    /**
     * Hands one frame to the writer. route_failures decides whether a
     * reconnect-worthy write error tears the connection down.
     */
    void writeFrame(const std::string& payload, const StatusPromise& promise,
                    const SendCompletion& completion, bool route_failures) {
        ConnectionPtr conn = connection_;
        std::vector<uint8_t> frame = FrameCodec::encode(payload);

        bool posted = writer_.post([this, conn, frame = std::move(frame), promise, completion, route_failures]() {
            auto result = conn->transport->send(frame.data(), frame.size());
            ChannelStatus status = toChannelStatus(result, ChannelError::SEND_FAILED);
            if (promise) {
                promise->set_value(status);
            }
            uint64_t generation = conn->generation;
            size_t bytes = frame.size();
            control_.post([this, generation, status, completion, route_failures, bytes]() {
                onWriteComplete(generation, status, completion, route_failures, bytes);
            });
        });

        if (!posted) {
            auto status = ChannelStatus::failure(ChannelError::NOT_CONNECTED, "Channel shut down");
            if (promise) {
                promise->set_value(status);
            }
            if (completion) {
                invokeCompletion(completion, status);
            }
        }
    }

    void onWriteComplete(uint64_t generation, const ChannelStatus& status,
                         const SendCompletion& completion, bool route_failures, size_t bytes) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            if (status) {
                stats_.messages_sent++;
                stats_.bytes_sent += bytes;
            } else {
                stats_.send_errors++;
            }
        }

        if (completion) {
            invokeCompletion(completion, status);
        }

        if (!status) {
            LOGE_FMT("Send failed: " << channelErrorToString(status.error) << " - " << status.message);
            if (route_failures && isCurrent(generation) && state_ == ConnectionState::READY &&
                isReconnectWorthy(status)) {
                handleConnectionError(status);
            }
        }
    }

    bool isReconnectWorthy(const ChannelStatus& status) const {
        return status.error == ChannelError::CONNECTION_CLOSED ||
               status.error == ChannelError::NOT_CONNECTED ||
               reconnect_.isRetryableError(status.sys_errno);
    }

    void flushPending() {
        if (pending_.empty()) {
            return;
        }

        auto batch = std::make_shared<std::vector<PendingMessage>>(pending_.drain());
        syncPendingStats();
        LOGI_FMT("Flushing " << batch->size() << " pending messages");

        ConnectionPtr conn = connection_;
        uint64_t session = session_;
        if (!writer_.post([this, conn, batch, session]() { flushBatch(conn, batch, session); })) {
            pending_.requeueFront(std::move(*batch));
            syncPendingStats();
        }
    }

    // Writer thread
    void flushBatch(const ConnectionPtr& conn, const PendingBatch& batch, uint64_t session) {
        for (size_t i = 0; i < batch->size(); ++i) {
            if (conn->stop) {
                requeueRemaining(batch, i, session);
                return;
            }
            if (i > 0) {
                std::this_thread::sleep_for(config_.flush_interval);
            }

            PendingMessage& message = (*batch)[i];
            std::vector<uint8_t> frame = FrameCodec::encode(message.payload);
            auto result = conn->transport->send(frame.data(), frame.size());
            ChannelStatus status = toChannelStatus(result, ChannelError::SEND_FAILED);

            uint64_t generation = conn->generation;
            size_t bytes = frame.size();
            SendCompletion completion = std::move(message.completion);
            control_.post([this, generation, status, completion, bytes]() {
                if (status) {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.pending_flushed++;
                }
                onWriteComplete(generation, status, completion, true, bytes);
            });

            if (!status) {
                requeueRemaining(batch, i + 1, session);
                return;
            }
        }
    }

    // Writer thread
    void requeueRemaining(const PendingBatch& batch, size_t from, uint64_t session) {
        if (from >= batch->size()) {
            return;
        }
        control_.post([this, batch, from, session]() {
            if (session != session_) {
                LOGD_FMT("Dropping " << (batch->size() - from) << " unsent messages of a closed session");
                return;
            }
            std::vector<PendingMessage> remaining(std::make_move_iterator(batch->begin() + from),
                                                  std::make_move_iterator(batch->end()));
            LOGI_FMT("Flush interrupted, re-queueing " << remaining.size() << " messages");
            pending_.requeueFront(std::move(remaining));
            syncPendingStats();
            if (state_ == ConnectionState::READY && connection_) {
                flushPending();
            }
        });
    }

    // Inbound path

    // I/O thread
    void ioLoop(ConnectionPtr conn) {
        uint64_t generation = conn->generation;

        auto result = conn->transport->connect();
        if (conn->stop) {
            return;
        }
        if (!result) {
            auto status = ChannelStatus::failure(ChannelError::CONNECTION_FAILED,
                                                 result.error_message, result.sys_errno);
            control_.post([this, generation, status]() { onConnectFailed(generation, status); });
            return;
        }

        control_.post([this, generation]() { onConnected(generation); });

        while (!conn->stop) {
            auto received = conn->transport->receive();
            if (received.success()) {
                control_.post([this, generation, data = std::move(received.value)]() {
                    onData(generation, data);
                });
                continue;
            }

            if (received.error == TransportError::TIMEOUT) {
                std::this_thread::sleep_for(config_.receive_poll_interval);
                continue;
            }

            if (conn->stop) {
                break;
            }

            LOGW_FMT("Receive loop ended: " << transportErrorToString(received.error)
                     << " - " << received.error_message);
            auto status = toChannelStatus(received, ChannelError::CONNECTION_CLOSED);
            control_.post([this, generation, status]() { onTransportFailure(generation, status); });
            break;
        }
    }

    void onData(uint64_t generation, const std::vector<uint8_t>& data) {
        if (!isCurrent(generation)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.bytes_received += data.size();
        }

        auto result = decoder_.append(data.data(), data.size());
        if (result.corrupted || result.overflowed) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            if (result.corrupted) stats_.corrupted_frames++;
            if (result.overflowed) stats_.buffer_overflows++;
        }

        for (const auto& payload : result.frames) {
            // A handler may have disconnected
            if (!isCurrent(generation)) {
                return;
            }

            if (KeepAliveMonitor::isPong(payload)) {
                keep_alive_.recordPong(KeepAliveMonitor::Clock::now());
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.pongs_received++;
                continue;
            }

            dispatchMessage(payload);
        }
    }

    void dispatchMessage(const std::string& payload) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.messages_received++;
            if (!message_handler_) {
                stats_.unhandled_messages++;
            }
        }

        if (!message_handler_) {
            LOGW_FMT("No message handler installed, dropping " << payload.size() << " byte message");
            return;
        }

        try {
            message_handler_(payload);
        } catch (const std::exception& e) {
            LOGE_FMT("Message handler threw exception: " << e.what());
        }
    }

    // Helpers (control thread)

    bool isCurrent(uint64_t generation) const {
        return connection_ && connection_->generation == generation;
    }

    void setState(ConnectionState state, const ChannelStatus& status) {
        if (state == state_ && state != ConnectionState::FAILED) {
            return;
        }

        LOGI_FMT("Control channel state: " << connectionStateToString(state_)
                 << " -> " << connectionStateToString(state));
        state_ = state;
        published_state_ = state;

        if (state_callback_) {
            try {
                state_callback_(state, status);
            } catch (const std::exception& e) {
                LOGE_FMT("State change callback threw exception: " << e.what());
            }
        }
    }

    void invokeCompletion(const SendCompletion& completion, const ChannelStatus& status) {
        try {
            completion(status);
        } catch (const std::exception& e) {
            LOGE_FMT("Send completion threw exception: " << e.what());
        }
    }

    void syncPendingStats() {
        pending_count_ = pending_.size();
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.pending_dropped = pending_.droppedCount();
    }

    const ChannelConfig config_;
    MessageHandler message_handler_;
    StateChangeCallback state_callback_;
    TransportFactory factory_;

    FrameDecoder decoder_;
    PendingQueue pending_;
    ReconnectPolicy reconnect_;
    KeepAliveMonitor keep_alive_;

    ConnectionState state_;
    std::atomic<ConnectionState> published_state_;
    bool is_connecting_;
    uint64_t generation_;
    uint64_t session_;
    ConnectionPtr connection_;
    utils::SerialExecutor::TaskId keep_alive_timer_;
    utils::SerialExecutor::TaskId reconnect_timer_;
    // Bumped on cancel; a timer already moved to the ready queue carries the old value
    uint64_t reconnect_token_;
    std::atomic<size_t> pending_count_;

    mutable std::mutex stats_mutex_;
    ChannelStats stats_;

    // Declared last: the worker threads use every member above
    utils::SerialExecutor control_;
    utils::SerialExecutor writer_;
};

ConnectionManager::ConnectionManager(const ChannelConfig& config,
                                     MessageHandler on_message,
                                     StateChangeCallback on_state_change,
                                     TransportFactory factory)
    : pImpl_(std::make_unique<Impl>(config, std::move(on_message),
                                    std::move(on_state_change), std::move(factory))) {
}

ConnectionManager::~ConnectionManager() = default;

void ConnectionManager::connect() {
    pImpl_->connect();
}

std::future<ChannelStatus> ConnectionManager::send(std::string payload, SendCompletion on_delivered) {
    return pImpl_->send(std::move(payload), std::move(on_delivered));
}

std::future<ChannelStatus> ConnectionManager::sendJson(const nlohmann::json& message, SendCompletion on_delivered) {
    return pImpl_->send(message.dump(), std::move(on_delivered));
}

std::pair<std::string, std::future<ChannelStatus>> ConnectionManager::sendRequest(
    ControlCategory category,
    const std::string& action,
    nlohmann::json payload,
    const std::string& session_id) {
    ControlMessage request = ControlMessage::request(category, action, std::move(payload), session_id);
    std::string id = request.id;
    return {id, pImpl_->send(request.serialize(), nullptr)};
}

void ConnectionManager::disconnect() {
    pImpl_->disconnect();
}

ConnectionState ConnectionManager::getState() const {
    return pImpl_->getState();
}

bool ConnectionManager::isConnected() const {
    return pImpl_->getState() == ConnectionState::READY;
}

ChannelStats ConnectionManager::getStats() const {
    return pImpl_->getStats();
}

size_t ConnectionManager::pendingCount() const {
    return pImpl_->pendingCount();
}

const ChannelConfig& ConnectionManager::getConfig() const {
    return pImpl_->getConfig();
}

} // namespace ipc
} // namespace vtctl
