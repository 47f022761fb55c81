#include "core/channel_config.h"
#include "utils/log.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace vtctl;
using std::chrono::milliseconds;

class ChannelConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        file_path = "/tmp/vtctl_config_test_" + std::to_string(::getpid()) + ".json";
        const char* home = std::getenv("HOME");
        saved_home = home ? home : "";
        had_home = home != nullptr;
        ::unsetenv("VTCTL_CONFIG");
    }

    void TearDown() override {
        std::remove(file_path.c_str());
        if (had_home) {
            ::setenv("HOME", saved_home.c_str(), 1);
        }
        ::unsetenv("VTCTL_CONFIG");
    }

    void writeFile(const std::string& content) {
        std::ofstream out(file_path);
        out << content;
    }

    std::string file_path;
    std::string saved_home;
    bool had_home = false;
};

TEST_F(ChannelConfigTest, Defaults) {
    ChannelConfig config;

    EXPECT_EQ(config.keep_alive_interval, milliseconds(30000));
    EXPECT_EQ(config.keep_alive_timeout_multiplier, 2u);
    EXPECT_EQ(config.initial_reconnect_delay, milliseconds(1000));
    EXPECT_EQ(config.max_reconnect_delay, milliseconds(30000));
    EXPECT_DOUBLE_EQ(config.reconnect_backoff_multiplier, 1.5);
    EXPECT_EQ(config.pending_queue_capacity, 100u);
    EXPECT_EQ(config.max_frame_size, 10000000u);
    EXPECT_EQ(config.max_receive_buffer_size, 10u * 1024 * 1024);
    EXPECT_EQ(config.receive_chunk_size, 65536u);
    EXPECT_EQ(config.connect_timeout, milliseconds(5000));
    EXPECT_EQ(config.connect_poll_interval, milliseconds(100));
    EXPECT_EQ(config.send_retry_interval, milliseconds(1));
    EXPECT_EQ(config.receive_poll_interval, milliseconds(10));
    EXPECT_EQ(config.flush_interval, milliseconds(10));
    EXPECT_EQ(config.log_level, "INFO");
}

TEST_F(ChannelConfigTest, DefaultSocketPathUsesHome) {
    ::setenv("HOME", "/home/tester", 1);

    EXPECT_EQ(ChannelConfig::defaultSocketPath(), "/home/tester/.vibetunnel/control.sock");
    EXPECT_EQ(ChannelConfig::defaultConfigPath(), "/home/tester/.vibetunnel/vtctl.json");
    EXPECT_EQ(ChannelConfig().socket_path, "/home/tester/.vibetunnel/control.sock");
}

TEST_F(ChannelConfigTest, ParseOverridesOnlyPresentKeys) {
    auto config = ChannelConfig::parse(R"({
        "socket_path": "/run/daemon.sock",
        "keep_alive": { "interval_ms": 5000 },
        "reconnect": { "multiplier": 2.0, "max_delay_ms": 60000 },
        "pending_queue": { "capacity": 10 },
        "socket": { "receive_poll_interval_ms": 2 },
        "logging": { "level": "debug" }
    })");

    EXPECT_EQ(config.socket_path, "/run/daemon.sock");
    EXPECT_EQ(config.keep_alive_interval, milliseconds(5000));
    EXPECT_EQ(config.keep_alive_timeout_multiplier, 2u);
    EXPECT_DOUBLE_EQ(config.reconnect_backoff_multiplier, 2.0);
    EXPECT_EQ(config.max_reconnect_delay, milliseconds(60000));
    EXPECT_EQ(config.initial_reconnect_delay, milliseconds(1000));
    EXPECT_EQ(config.pending_queue_capacity, 10u);
    EXPECT_EQ(config.receive_poll_interval, milliseconds(2));
    EXPECT_EQ(config.connect_timeout, milliseconds(5000));
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ChannelConfigTest, MalformedJsonKeepsDefaults) {
    auto config = ChannelConfig::parse("{ \"socket_path\": ");
    EXPECT_EQ(config.pending_queue_capacity, 100u);

    // Wrong value type
    auto typed = ChannelConfig::parse(R"({ "keep_alive": { "interval_ms": "soon" } })");
    EXPECT_EQ(typed.keep_alive_interval, milliseconds(30000));
}

TEST_F(ChannelConfigTest, LoadFromFile) {
    writeFile(R"({ "socket_path": "/tmp/from_file.sock", "framing": { "max_frame_size": 4096 } })");

    auto config = ChannelConfig::load(file_path);

    EXPECT_EQ(config.socket_path, "/tmp/from_file.sock");
    EXPECT_EQ(config.max_frame_size, 4096u);
}

TEST_F(ChannelConfigTest, MissingFileKeepsDefaults) {
    auto config = ChannelConfig::load("/nonexistent/vtctl/config.json");

    EXPECT_EQ(config.keep_alive_interval, milliseconds(30000));
    EXPECT_EQ(config.pending_queue_capacity, 100u);
}

TEST_F(ChannelConfigTest, LoadDefaultHonoursEnvironment) {
    writeFile(R"({ "pending_queue": { "capacity": 7 } })");
    ::setenv("VTCTL_CONFIG", file_path.c_str(), 1);

    auto config = ChannelConfig::loadDefault();

    EXPECT_EQ(config.pending_queue_capacity, 7u);
}

TEST_F(ChannelConfigTest, ApplyLogLevel) {
    auto previous = utils::getLogLevel();
    ChannelConfig config;

    config.log_level = "warning";
    EXPECT_TRUE(config.applyLogLevel());
    EXPECT_EQ(utils::getLogLevel(), utils::LogLevel::WARNING);

    config.log_level = "warn";
    EXPECT_TRUE(config.applyLogLevel());

    config.log_level = "chatty";
    EXPECT_FALSE(config.applyLogLevel());
    EXPECT_EQ(utils::getLogLevel(), utils::LogLevel::WARNING);

    utils::setLogLevel(previous);
}
