/**
 * @file transport.cpp
 * @brief Transport enum helpers
 */

#include "ipc/transport.h"

namespace vtctl {
namespace ipc {

const char* transportErrorToString(TransportError error) {
    switch (error) {
        case TransportError::SUCCESS: return "SUCCESS";
        case TransportError::NOT_CONNECTED: return "NOT_CONNECTED";
        case TransportError::ALREADY_CONNECTED: return "ALREADY_CONNECTED";
        case TransportError::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case TransportError::CONNECTION_CLOSED: return "CONNECTION_CLOSED";
        case TransportError::CONNECTION_TIMEOUT: return "CONNECTION_TIMEOUT";
        case TransportError::SEND_FAILED: return "SEND_FAILED";
        case TransportError::RECV_FAILED: return "RECV_FAILED";
        case TransportError::TIMEOUT: return "TIMEOUT";
        case TransportError::INVALID_CONFIG: return "INVALID_CONFIG";
        case TransportError::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case TransportError::CANCELLED: return "CANCELLED";
        case TransportError::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN";
    }
}

const char* transportStateToString(TransportState state) {
    switch (state) {
        case TransportState::DISCONNECTED: return "DISCONNECTED";
        case TransportState::CONNECTING: return "CONNECTING";
        case TransportState::CONNECTED: return "CONNECTED";
        case TransportState::SHUT_DOWN: return "SHUT_DOWN";
        default: return "UNKNOWN";
    }
}

} // namespace ipc
} // namespace vtctl
