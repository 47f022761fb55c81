#include "ipc/channel_types.h"
#include <gtest/gtest.h>
#include <cerrno>

using namespace vtctl::ipc;

TEST(ChannelTypesTest, StatusHelpers) {
    auto ok = ChannelStatus::ok();
    EXPECT_TRUE(ok.success());
    EXPECT_TRUE(static_cast<bool>(ok));

    auto failed = ChannelStatus::failure(ChannelError::SEND_FAILED, "disk full", ENOSPC);
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error, ChannelError::SEND_FAILED);
    EXPECT_EQ(failed.sys_errno, ENOSPC);
    EXPECT_EQ(failed.message, "disk full");
}

TEST(ChannelTypesTest, TransportErrorMapping) {
    TransportResult<bool> closed{TransportError::CONNECTION_CLOSED, false, "peer gone", EPIPE};
    auto status = toChannelStatus(closed, ChannelError::SEND_FAILED);
    EXPECT_EQ(status.error, ChannelError::CONNECTION_CLOSED);
    EXPECT_EQ(status.sys_errno, EPIPE);
    EXPECT_EQ(status.message, "peer gone");

    TransportResult<bool> cancelled{TransportError::CANCELLED, false, "shut down"};
    EXPECT_EQ(toChannelStatus(cancelled, ChannelError::SEND_FAILED).error, ChannelError::CONNECTION_CLOSED);

    TransportResult<bool> not_connected{TransportError::NOT_CONNECTED, false, "no socket", ENOTCONN};
    EXPECT_EQ(toChannelStatus(not_connected, ChannelError::SEND_FAILED).error, ChannelError::NOT_CONNECTED);

    TransportResult<bool> other{TransportError::SEND_FAILED, false, "EIO", EIO};
    EXPECT_EQ(toChannelStatus(other, ChannelError::SEND_FAILED).error, ChannelError::SEND_FAILED);

    TransportResult<bool> success{TransportError::SUCCESS, true, ""};
    EXPECT_TRUE(toChannelStatus(success, ChannelError::SEND_FAILED).success());
}

TEST(ChannelTypesTest, Names) {
    EXPECT_STREQ(connectionStateToString(ConnectionState::SETUP), "SETUP");
    EXPECT_STREQ(connectionStateToString(ConnectionState::PREPARING), "PREPARING");
    EXPECT_STREQ(connectionStateToString(ConnectionState::READY), "READY");
    EXPECT_STREQ(connectionStateToString(ConnectionState::FAILED), "FAILED");
    EXPECT_STREQ(connectionStateToString(ConnectionState::CANCELLED), "CANCELLED");
    EXPECT_STREQ(connectionStateToString(ConnectionState::WAITING), "WAITING");
    EXPECT_STREQ(channelErrorToString(ChannelError::CONNECTION_FAILED), "CONNECTION_FAILED");
}
