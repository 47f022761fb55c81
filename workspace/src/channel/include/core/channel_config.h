/**
 * @file channel_config.h
 * @brief Tunables of the control channel and their JSON file representation
 */

#ifndef VTCTL_CORE_CHANNEL_CONFIG_H
#define VTCTL_CORE_CHANNEL_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace vtctl {

/**
 * @brief Control channel configuration
 *
 * Defaults match the protocol the daemon expects. Every field can be
 * overridden from a JSON file:
 *
 * @code
 * {
 *   "socket_path": "/home/me/.vibetunnel/control.sock",
 *   "keep_alive":    { "interval_ms": 30000, "timeout_multiplier": 2 },
 *   "reconnect":     { "initial_delay_ms": 1000, "max_delay_ms": 30000, "multiplier": 1.5 },
 *   "pending_queue": { "capacity": 100, "flush_interval_ms": 10 },
 *   "framing":       { "max_frame_size": 10000000, "max_buffer_size": 10485760 },
 *   "socket":        { "buffer_size": 1048576, "receive_chunk_size": 65536,
 *                      "connect_timeout_ms": 5000, "connect_poll_interval_ms": 100,
 *                      "send_retry_interval_ms": 1, "receive_poll_interval_ms": 10 },
 *   "logging":       { "level": "INFO" }
 * }
 * @endcode
 */
struct ChannelConfig {
    /** Unix socket path of the daemon control channel */
    std::string socket_path = defaultSocketPath();

    // Keep-alive
    std::chrono::milliseconds keep_alive_interval{30000};
    uint32_t keep_alive_timeout_multiplier = 2;

    // Reconnection backoff
    std::chrono::milliseconds initial_reconnect_delay{1000};
    std::chrono::milliseconds max_reconnect_delay{30000};
    double reconnect_backoff_multiplier = 1.5;

    // Pending queue
    size_t pending_queue_capacity = 100;
    std::chrono::milliseconds flush_interval{10};

    // Framing
    uint32_t max_frame_size = 10000000;
    size_t max_receive_buffer_size = 10 * 1024 * 1024;

    // Socket
    int socket_buffer_size = 1024 * 1024;
    size_t receive_chunk_size = 64 * 1024;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds connect_poll_interval{100};
    std::chrono::milliseconds send_retry_interval{1};
    std::chrono::milliseconds receive_poll_interval{10};

    /** Log level name, applied by applyLogLevel() */
    std::string log_level = "INFO";

    /**
     * @brief Load configuration from a JSON file
     *
     * Keys absent from the file keep their defaults. A missing or malformed
     * file is logged and yields the defaults.
     *
     * @param path JSON file path
     * @return Loaded configuration
     */
    static ChannelConfig load(const std::string& path);

    /**
     * @brief Parse configuration from JSON text (same rules as load())
     */
    static ChannelConfig parse(const std::string& json_text);

    /**
     * @brief Load from $VTCTL_CONFIG, else defaultConfigPath()
     */
    static ChannelConfig loadDefault();

    /** $HOME/.vibetunnel/control.sock */
    static std::string defaultSocketPath();

    /** $HOME/.vibetunnel/vtctl.json */
    static std::string defaultConfigPath();

    /**
     * @brief Apply log_level to the global logger
     * @return false if the level name is not recognized (logger unchanged)
     */
    bool applyLogLevel() const;
};

} // namespace vtctl

#endif // VTCTL_CORE_CHANNEL_CONFIG_H
