/**
 * @file channel_config.cpp
 * @brief JSON loading of the control channel configuration
 */

#include "core/channel_config.h"
#include "utils/log.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <pwd.h>
#include <unistd.h>

namespace vtctl {

namespace {

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return ".";
}

std::chrono::milliseconds readMillis(const nlohmann::json& node, const char* key,
                                     std::chrono::milliseconds fallback) {
    if (!node.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds(node[key].get<int64_t>());
}

void applyJson(ChannelConfig& config, const nlohmann::json& json) {
    if (json.contains("socket_path")) config.socket_path = json["socket_path"].get<std::string>();

    if (json.contains("keep_alive")) {
        auto& ka = json["keep_alive"];
        config.keep_alive_interval = readMillis(ka, "interval_ms", config.keep_alive_interval);
        if (ka.contains("timeout_multiplier")) config.keep_alive_timeout_multiplier = ka["timeout_multiplier"].get<uint32_t>();
    }

    if (json.contains("reconnect")) {
        auto& rc = json["reconnect"];
        config.initial_reconnect_delay = readMillis(rc, "initial_delay_ms", config.initial_reconnect_delay);
        config.max_reconnect_delay = readMillis(rc, "max_delay_ms", config.max_reconnect_delay);
        if (rc.contains("multiplier")) config.reconnect_backoff_multiplier = rc["multiplier"].get<double>();
    }

    if (json.contains("pending_queue")) {
        auto& pq = json["pending_queue"];
        if (pq.contains("capacity")) config.pending_queue_capacity = pq["capacity"].get<size_t>();
        config.flush_interval = readMillis(pq, "flush_interval_ms", config.flush_interval);
    }

    if (json.contains("framing")) {
        auto& fr = json["framing"];
        if (fr.contains("max_frame_size")) config.max_frame_size = fr["max_frame_size"].get<uint32_t>();
        if (fr.contains("max_buffer_size")) config.max_receive_buffer_size = fr["max_buffer_size"].get<size_t>();
    }

    if (json.contains("socket")) {
        auto& so = json["socket"];
        if (so.contains("buffer_size")) config.socket_buffer_size = so["buffer_size"].get<int>();
        if (so.contains("receive_chunk_size")) config.receive_chunk_size = so["receive_chunk_size"].get<size_t>();
        config.connect_timeout = readMillis(so, "connect_timeout_ms", config.connect_timeout);
        config.connect_poll_interval = readMillis(so, "connect_poll_interval_ms", config.connect_poll_interval);
        config.send_retry_interval = readMillis(so, "send_retry_interval_ms", config.send_retry_interval);
        config.receive_poll_interval = readMillis(so, "receive_poll_interval_ms", config.receive_poll_interval);
    }

    if (json.contains("logging")) {
        auto& logging = json["logging"];
        if (logging.contains("level")) config.log_level = logging["level"].get<std::string>();
    }
}

} // namespace

ChannelConfig ChannelConfig::load(const std::string& path) {
    ChannelConfig config;

    std::ifstream file(path);
    if (!file.is_open()) {
        LOGW_FMT("Configuration file not found: " << path << ", using defaults");
        return config;
    }

    try {
        nlohmann::json json;
        file >> json;
        applyJson(config, json);
        LOGI_FMT("Loaded channel configuration from: " << path);
    } catch (const std::exception& e) {
        LOGE_FMT("Failed to load configuration file: " << e.what() << ", using defaults");
        return ChannelConfig();
    }

    return config;
}

ChannelConfig ChannelConfig::parse(const std::string& json_text) {
    ChannelConfig config;
    try {
        applyJson(config, nlohmann::json::parse(json_text));
    } catch (const std::exception& e) {
        LOGE_FMT("Failed to parse configuration: " << e.what() << ", using defaults");
        return ChannelConfig();
    }
    return config;
}

ChannelConfig ChannelConfig::loadDefault() {
    const char* env_path = std::getenv("VTCTL_CONFIG");
    std::string path = env_path ? env_path : defaultConfigPath();
    return load(path);
}

std::string ChannelConfig::defaultSocketPath() {
    return homeDirectory() + "/.vibetunnel/control.sock";
}

std::string ChannelConfig::defaultConfigPath() {
    return homeDirectory() + "/.vibetunnel/vtctl.json";
}

bool ChannelConfig::applyLogLevel() const {
    utils::LogLevel level;
    if (!utils::parseLogLevel(log_level, level)) {
        LOGW_FMT("Unknown log level '" << log_level << "', keeping "
                 << utils::logLevelToString(utils::getLogLevel()));
        return false;
    }
    utils::setLogLevel(level);
    return true;
}

} // namespace vtctl
