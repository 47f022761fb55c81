/**
 * @file keep_alive_monitor.cpp
 * @brief Keep-alive monitor implementation
 */

#include "ipc/keep_alive_monitor.h"
#include "ipc/control_message.h"
#include <nlohmann/json.hpp>

namespace vtctl {
namespace ipc {

namespace {

bool fieldEquals(const nlohmann::json& json, const char* key, const char* expected) {
    auto it = json.find(key);
    return it != json.end() && it->is_string() && it->get_ref<const std::string&>() == expected;
}

} // namespace

KeepAliveMonitor::KeepAliveMonitor(const KeepAliveConfig& config)
    : config_(config)
    , last_pong_time_(Clock::now()) {
    if (config_.timeout_multiplier == 0) {
        config_.timeout_multiplier = 1;
    }
}

void KeepAliveMonitor::reset(Clock::time_point now) {
    last_pong_time_ = now;
}

void KeepAliveMonitor::recordPong(Clock::time_point now) {
    last_pong_time_ = now;
    stats_.pongs_received++;
}

bool KeepAliveMonitor::isExpired(Clock::time_point now) const {
    return now - last_pong_time_ > timeout();
}

std::chrono::milliseconds KeepAliveMonitor::timeSinceLastPong(Clock::time_point now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - last_pong_time_);
}

std::chrono::milliseconds KeepAliveMonitor::timeout() const {
    return config_.interval * config_.timeout_multiplier;
}

bool KeepAliveMonitor::isPong(const std::string& payload) {
    nlohmann::json json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }
    return fieldEquals(json, "type", "response") &&
           fieldEquals(json, "category", "system") &&
           fieldEquals(json, "action", "ping");
}

std::string KeepAliveMonitor::makePing() {
    return ControlMessage::request(ControlCategory::SYSTEM, "ping").serialize();
}

} // namespace ipc
} // namespace vtctl
