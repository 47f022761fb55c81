#include "ipc/control_message.h"
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>

namespace vtctl {
namespace ipc {

ControlMessage ControlMessage::request(ControlCategory category, const std::string& action,
                                       nlohmann::json payload, const std::string& session_id) {
    ControlMessage message;
    message.id = generateId();
    message.type = ControlMessageType::REQUEST;
    message.category = category;
    message.action = action;
    message.payload = std::move(payload);
    message.session_id = session_id;
    return message;
}

nlohmann::json ControlMessage::toJson() const {
    nlohmann::json json;
    json["id"] = id;
    json["type"] = controlMessageTypeToString(type);
    json["category"] = controlCategoryToString(category);
    json["action"] = action;
    if (!payload.is_null()) {
        json["payload"] = payload;
    }
    if (!session_id.empty()) {
        json["sessionId"] = session_id;
    }
    if (!error.empty()) {
        json["error"] = error;
    }
    return json;
}

std::string ControlMessage::serialize() const {
    return toJson().dump();
}

std::optional<ControlMessage> ControlMessage::parse(const std::string& text) {
    nlohmann::json json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    auto string_field = [&json](const char* key) -> const std::string* {
        auto it = json.find(key);
        if (it == json.end() || !it->is_string()) {
            return nullptr;
        }
        return it->get_ptr<const std::string*>();
    };

    const std::string* id = string_field("id");
    const std::string* type = string_field("type");
    const std::string* category = string_field("category");
    const std::string* action = string_field("action");
    if (!id || !type || !category || !action) {
        return std::nullopt;
    }

    ControlMessage message;
    if (!parseControlMessageType(*type, message.type) ||
        !parseControlCategory(*category, message.category)) {
        return std::nullopt;
    }
    message.id = *id;
    message.action = *action;

    if (json.contains("payload")) {
        message.payload = json["payload"];
    }
    if (const std::string* session_id = string_field("sessionId")) {
        message.session_id = *session_id;
    }
    if (const std::string* error = string_field("error")) {
        message.error = *error;
    }
    return message;
}

std::string ControlMessage::generateId() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = dis(gen);
        lo = dis(gen);
    }

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

const char* controlMessageTypeToString(ControlMessageType type) {
    switch (type) {
        case ControlMessageType::REQUEST: return "request";
        case ControlMessageType::RESPONSE: return "response";
        case ControlMessageType::EVENT: return "event";
        default: return "unknown";
    }
}

const char* controlCategoryToString(ControlCategory category) {
    switch (category) {
        case ControlCategory::TERMINAL: return "terminal";
        case ControlCategory::GIT: return "git";
        case ControlCategory::SYSTEM: return "system";
        default: return "unknown";
    }
}

bool parseControlMessageType(const std::string& name, ControlMessageType& type) {
    if (name == "request") { type = ControlMessageType::REQUEST; return true; }
    if (name == "response") { type = ControlMessageType::RESPONSE; return true; }
    if (name == "event") { type = ControlMessageType::EVENT; return true; }
    return false;
}

bool parseControlCategory(const std::string& name, ControlCategory& category) {
    if (name == "terminal") { category = ControlCategory::TERMINAL; return true; }
    if (name == "git") { category = ControlCategory::GIT; return true; }
    if (name == "system") { category = ControlCategory::SYSTEM; return true; }
    return false;
}

} // namespace ipc
} // namespace vtctl
