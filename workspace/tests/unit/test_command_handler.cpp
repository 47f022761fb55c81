/**
 * @file test_command_handler.cpp
 * @brief Unit tests for the interactive command interface
 *
 * Tests include:
 * - Command parsing and unknown commands
 * - Argument and JSON validation
 * - Commands driving a connection manager (queueing, disconnect, status)
 * - Log level changes
 * - Shutdown signal routing
 */

#include "utils/command_handler.h"
#include "ipc/connection_manager.h"
#include "utils/log.h"
#include "unix_test_server.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <mutex>
#include <thread>

using namespace vtctl;

// ============================================================================
// Test Fixtures
// ============================================================================

class CommandHandlerTest : public ::testing::Test {
protected:
    std::unique_ptr<CommandHandler> handler;

    void SetUp() override {
        // Handler without a channel for parsing tests
        handler = std::make_unique<CommandHandler>(nullptr);
    }

    void TearDown() override {
        handler.reset();
    }
};

class CommandHandlerChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = test::testSocketPath("cli");
        ::unlink(path.c_str());
        config.socket_path = path;
        config.initial_reconnect_delay = std::chrono::milliseconds(20);
        config.max_reconnect_delay = std::chrono::milliseconds(100);
        config.receive_poll_interval = std::chrono::milliseconds(1);

        manager = std::make_unique<ipc::ConnectionManager>(config, nullptr);
        handler = std::make_unique<CommandHandler>(manager.get());
    }

    void TearDown() override {
        handler.reset();
        manager.reset();
        ::unlink(path.c_str());
    }

    std::string path;
    ChannelConfig config;
    std::unique_ptr<ipc::ConnectionManager> manager;
    std::unique_ptr<CommandHandler> handler;
};

// ============================================================================
// Command Parsing Tests
// ============================================================================

TEST_F(CommandHandlerTest, ParseEmptyCommand) {
    auto result = handler->processCommand("");

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.message.empty());
}

TEST_F(CommandHandlerTest, ParseWhitespaceOnlyCommand) {
    auto result = handler->processCommand("  \t ");

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.message.empty());
}

TEST_F(CommandHandlerTest, ParseUnknownCommand) {
    auto result = handler->processCommand("frobnicate now");

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("Unknown command: frobnicate"), std::string::npos);
}

TEST_F(CommandHandlerTest, CommandsCaseSensitive) {
    EXPECT_FALSE(handler->processCommand("HELP").success);
    EXPECT_TRUE(handler->processCommand("help").success);
}

// ============================================================================
// Help and Exit
// ============================================================================

TEST_F(CommandHandlerTest, HelpListsCommands) {
    auto result = handler->processCommand("  help  ");

    EXPECT_TRUE(result.success);
    for (const char* command : {"connect", "disconnect", "send", "request", "ping",
                                "status", "stats", "loglevel", "exit"}) {
        EXPECT_NE(result.message.find(command), std::string::npos) << command;
    }
    EXPECT_EQ(result.message, handler->getHelpText());
}

TEST_F(CommandHandlerTest, ExitCommand) {
    EXPECT_FALSE(handler->isExitRequested());

    auto result = handler->processCommand("exit");

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(handler->isExitRequested());
}

TEST_F(CommandHandlerTest, QuitIsExit) {
    handler->processCommand("quit");
    EXPECT_TRUE(handler->isExitRequested());
}

TEST_F(CommandHandlerTest, RequestExit) {
    handler->requestExit();
    EXPECT_TRUE(handler->isExitRequested());
}

// ============================================================================
// Argument Validation
// ============================================================================

TEST_F(CommandHandlerTest, SendRequiresJson) {
    auto missing = handler->processCommand("send");
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.message.find("Usage"), std::string::npos);

    auto invalid = handler->processCommand("send {not json");
    EXPECT_FALSE(invalid.success);
    EXPECT_NE(invalid.message.find("Invalid JSON"), std::string::npos);
}

TEST_F(CommandHandlerTest, RequestValidation) {
    EXPECT_FALSE(handler->processCommand("request").success);
    EXPECT_FALSE(handler->processCommand("request terminal").success);

    auto category = handler->processCommand("request video play");
    EXPECT_FALSE(category.success);
    EXPECT_NE(category.message.find("Unknown category"), std::string::npos);

    auto payload = handler->processCommand("request terminal spawn {broken");
    EXPECT_FALSE(payload.success);
    EXPECT_NE(payload.message.find("Invalid JSON"), std::string::npos);
}

TEST_F(CommandHandlerTest, ChannelCommandsWithoutChannel) {
    for (const char* command : {"connect", "disconnect", "ping", "status", "stats", "send {}"}) {
        auto result = handler->processCommand(command);
        EXPECT_FALSE(result.success) << command;
        EXPECT_NE(result.message.find("No control channel"), std::string::npos) << command;
    }
}

// ============================================================================
// Log Level
// ============================================================================

TEST_F(CommandHandlerTest, LogLevelCommand) {
    auto previous = utils::getLogLevel();

    auto result = handler->processCommand("loglevel debug");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(utils::getLogLevel(), utils::LogLevel::DEBUG);

    EXPECT_FALSE(handler->processCommand("loglevel loud").success);
    EXPECT_EQ(utils::getLogLevel(), utils::LogLevel::DEBUG);

    auto usage = handler->processCommand("loglevel");
    EXPECT_FALSE(usage.success);
    EXPECT_NE(usage.message.find("DEBUG"), std::string::npos);

    utils::setLogLevel(previous);
}

// ============================================================================
// Shutdown Signals
// ============================================================================

TEST_F(CommandHandlerTest, ShutdownSignalStopsSession) {
    std::atomic<bool> running{true};
    installShutdownSignalHandlers(&running, handler.get());

    std::raise(SIGTERM);

    EXPECT_FALSE(running);
    EXPECT_TRUE(handler->isExitRequested());
    EXPECT_EQ(shutdownSignal(), SIGTERM);

    installShutdownSignalHandlers(nullptr, nullptr);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

TEST_F(CommandHandlerTest, ShutdownSignalWhileLogging) {
    std::atomic<bool> running{true};
    std::atomic<bool> returned{false};
    installShutdownSignalHandlers(&running, handler.get());

    // The signal lands on a thread that is inside the logger
    std::thread signaller([&returned]() {
        std::lock_guard<std::mutex> lock(utils::logMutex());
        std::raise(SIGINT);
        returned = true;
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!returned && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (!returned) {
        signaller.detach();
        FAIL() << "signal handler blocked on the log mutex";
    }
    signaller.join();
    EXPECT_FALSE(running);
    EXPECT_TRUE(handler->isExitRequested());
    EXPECT_EQ(shutdownSignal(), SIGINT);

    installShutdownSignalHandlers(nullptr, nullptr);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

// ============================================================================
// Channel Commands
// ============================================================================

TEST_F(CommandHandlerChannelTest, StatusBeforeConnect) {
    auto result = handler->processCommand("status");

    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("SETUP"), std::string::npos);
    EXPECT_NE(result.message.find(path), std::string::npos);
}

TEST_F(CommandHandlerChannelTest, SendBeforeConnectIsQueued) {
    auto result = handler->processCommand("send {\"a\": 1}");

    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("Queued"), std::string::npos);
    EXPECT_EQ(manager->pendingCount(), 1u);
    EXPECT_NE(handler->processCommand("status").message.find("Pending: 1"), std::string::npos);
}

TEST_F(CommandHandlerChannelTest, SendAfterDisconnectFails) {
    EXPECT_TRUE(handler->processCommand("disconnect").success);
    EXPECT_EQ(manager->getState(), ipc::ConnectionState::CANCELLED);

    auto result = handler->processCommand("send {\"a\": 1}");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("NOT_CONNECTED"), std::string::npos);
}

TEST_F(CommandHandlerChannelTest, StatsCommand) {
    auto result = handler->processCommand("stats");

    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("Messages sent/received"), std::string::npos);
    EXPECT_NE(result.message.find("Reconnects scheduled"), std::string::npos);
}

TEST_F(CommandHandlerChannelTest, RequestReachesDaemon) {
    test::UnixTestServer server(path);
    ASSERT_TRUE(server.isListening());

    EXPECT_TRUE(handler->processCommand("connect").success);
    int client = server.acceptClient();
    ASSERT_GE(client, 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!manager->isConnected() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(manager->isConnected());

    auto result = handler->processCommand("request terminal spawn {\"cols\": 80, \"rows\": 24}");
    EXPECT_TRUE(result.success) << result.message;

    auto body = server.readFrame(client);
    ASSERT_TRUE(body.has_value());
    auto json = nlohmann::json::parse(*body);
    EXPECT_EQ(json["type"], "request");
    EXPECT_EQ(json["category"], "terminal");
    EXPECT_EQ(json["action"], "spawn");
    EXPECT_EQ(json["payload"]["cols"], 80);
    EXPECT_EQ(json["payload"]["rows"], 24);

    EXPECT_TRUE(handler->processCommand("ping").success);
    auto ping = server.readFrame(client);
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ(nlohmann::json::parse(*ping)["action"], "ping");

    EXPECT_NE(handler->processCommand("status").message.find("READY"), std::string::npos);
    handler->processCommand("disconnect");
}
