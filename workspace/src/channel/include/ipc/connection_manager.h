/**
 * @file connection_manager.h
 * @brief Reliable client side of the daemon control channel
 *
 * Composes the Unix socket transport, framing, keep-alive, reconnection
 * backoff and the pending queue into one connection state machine. Users
 * call connect(), send() and disconnect(); everything else (liveness
 * detection, reconnection, replay of queued messages) is automatic.
 */

#ifndef VTCTL_IPC_CONNECTION_MANAGER_H
#define VTCTL_IPC_CONNECTION_MANAGER_H

#include "channel_types.h"
#include "control_message.h"
#include "transport.h"
#include "core/channel_config.h"
#include <nlohmann/json.hpp>
#include <future>
#include <memory>
#include <string>
#include <utility>

namespace vtctl {
namespace ipc {

/**
 * @brief Control channel connection manager
 *
 * Threading model:
 * - all state lives on an internal control thread; public methods post to it
 *   and may be called from any thread
 * - frames are written by a single writer thread, in submission order
 * - each connection attempt runs connect and the receive loop on its own
 *   I/O thread; results of superseded attempts are discarded
 * - callbacks run on the control thread and must not block for long
 *
 * Example usage:
 * @code
 * ChannelConfig config = ChannelConfig::loadDefault();
 *
 * ConnectionManager manager(config,
 *     [](const std::string& payload) { handle(payload); },
 *     [](ConnectionState state, const ChannelStatus& status) { show(state); });
 *
 * manager.connect();
 * manager.sendRequest(ControlCategory::TERMINAL, "list");
 * ...
 * manager.disconnect();
 * @endcode
 */
class ConnectionManager {
public:
    /**
     * @brief Construct connection manager
     * @param config Channel configuration
     * @param on_message Handler of inbound payloads (may be empty; messages are then dropped and counted)
     * @param on_state_change Observer of state transitions (may be empty)
     * @param factory Transport factory; empty means a UnixSocketTransport on config.socket_path
     * @throws std::invalid_argument for an invalid reconnect or queue configuration
     */
    ConnectionManager(const ChannelConfig& config,
                      MessageHandler on_message,
                      StateChangeCallback on_state_change = nullptr,
                      TransportFactory factory = nullptr);

    /**
     * @brief Destructor - disconnects and stops the internal threads
     */
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Start connecting
     *
     * No-op while an attempt is already in flight. Enables automatic
     * reconnection and resets the backoff.
     */
    void connect();

    /**
     * @brief Send one payload (a serialized JSON document)
     *
     * While not READY the payload is queued and the future is satisfied
     * immediately; on_delivered runs once the queue is flushed. While READY
     * the future and on_delivered receive the write result. After
     * disconnect() both receive NOT_CONNECTED and nothing is queued.
     *
     * @param payload Frame body
     * @param on_delivered Optional delivery callback
     * @return Acceptance (queued) or write result
     */
    std::future<ChannelStatus> send(std::string payload, SendCompletion on_delivered = nullptr);

    /**
     * @brief Serialize and send a JSON document
     */
    std::future<ChannelStatus> sendJson(const nlohmann::json& message, SendCompletion on_delivered = nullptr);

    /**
     * @brief Send a request envelope
     * @return Generated request id and the send result
     */
    std::pair<std::string, std::future<ChannelStatus>> sendRequest(
        ControlCategory category,
        const std::string& action,
        nlohmann::json payload = nlohmann::json::object(),
        const std::string& session_id = "");

    /**
     * @brief Tear the connection down and stop reconnecting
     *
     * Cancels timers, stops the receive loop, closes the socket and drops
     * buffered and queued data. Returns once the state is CANCELLED. Safe
     * at any point, including from a callback.
     */
    void disconnect();

    ConnectionState getState() const;

    bool isConnected() const;

    ChannelStats getStats() const;

    /** Messages waiting in the pending queue */
    size_t pendingCount() const;

    const ChannelConfig& getConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_CONNECTION_MANAGER_H
