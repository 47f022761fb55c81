#include "ipc/channel_types.h"

namespace vtctl {
namespace ipc {

const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::SETUP: return "SETUP";
        case ConnectionState::PREPARING: return "PREPARING";
        case ConnectionState::READY: return "READY";
        case ConnectionState::FAILED: return "FAILED";
        case ConnectionState::CANCELLED: return "CANCELLED";
        case ConnectionState::WAITING: return "WAITING";
        default: return "UNKNOWN";
    }
}

const char* channelErrorToString(ChannelError error) {
    switch (error) {
        case ChannelError::NONE: return "NONE";
        case ChannelError::NOT_CONNECTED: return "NOT_CONNECTED";
        case ChannelError::CONNECTION_CLOSED: return "CONNECTION_CLOSED";
        case ChannelError::SEND_FAILED: return "SEND_FAILED";
        case ChannelError::CONNECTION_FAILED: return "CONNECTION_FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace ipc
} // namespace vtctl
