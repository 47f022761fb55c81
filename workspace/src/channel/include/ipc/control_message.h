/**
 * @file control_message.h
 * @brief JSON envelope carried in control channel frames
 *
 * Every frame body is one envelope:
 *
 * @code
 * {
 *   "id":        "6f1c0a4e-...",          // correlates request and response
 *   "type":      "request" | "response" | "event",
 *   "category":  "terminal" | "git" | "system",
 *   "action":    "ping",
 *   "payload":   { ... },                 // optional
 *   "sessionId": "...",                   // optional
 *   "error":     "..."                    // optional, responses only
 * }
 * @endcode
 *
 * The channel itself only interprets system/ping; everything else is passed
 * through untouched.
 */

#ifndef VTCTL_IPC_CONTROL_MESSAGE_H
#define VTCTL_IPC_CONTROL_MESSAGE_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace vtctl {
namespace ipc {

/**
 * @brief Envelope "type" field
 */
enum class ControlMessageType {
    REQUEST,
    RESPONSE,
    EVENT
};

/**
 * @brief Envelope "category" field
 */
enum class ControlCategory {
    TERMINAL,
    GIT,
    SYSTEM
};

/**
 * @brief Decoded envelope fields
 */
struct ControlMessage {
    std::string id;
    ControlMessageType type = ControlMessageType::REQUEST;
    ControlCategory category = ControlCategory::SYSTEM;
    std::string action;
    nlohmann::json payload;
    std::string session_id;
    std::string error;

    /**
     * @brief Build a request with a fresh id
     */
    static ControlMessage request(ControlCategory category, const std::string& action,
                                  nlohmann::json payload = nlohmann::json::object(),
                                  const std::string& session_id = "");

    /**
     * @brief Serialize to the wire JSON document
     *
     * Empty optional fields are omitted.
     */
    nlohmann::json toJson() const;

    /** toJson().dump() */
    std::string serialize() const;

    /**
     * @brief Parse an envelope
     * @return std::nullopt if the text is not JSON or a required field is missing
     */
    static std::optional<ControlMessage> parse(const std::string& text);

    /** Random RFC 4122 version 4 UUID string */
    static std::string generateId();
};

const char* controlMessageTypeToString(ControlMessageType type);
const char* controlCategoryToString(ControlCategory category);

/**
 * @brief Parse the lowercase wire names
 * @return false for unknown names
 */
bool parseControlMessageType(const std::string& name, ControlMessageType& type);
bool parseControlCategory(const std::string& name, ControlCategory& category);

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_CONTROL_MESSAGE_H
