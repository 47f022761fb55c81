/**
 * @file main.cpp
 * @brief Entry point of vtctl, an interactive client for the daemon control socket
 *
 * Loads the channel configuration, connects to the control socket with
 * automatic keep-alive and reconnection, prints inbound messages and runs
 * the interactive command interface until 'exit', EOF or a signal.
 */

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "core/channel_config.h"
#include "ipc/connection_manager.h"
#include "utils/command_handler.h"
#include "utils/log.h"

std::atomic<bool> g_running{true};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <path>      Configuration file (default: $VTCTL_CONFIG or "
              << vtctl::ChannelConfig::defaultConfigPath() << ")\n"
              << "  --socket <path>      Control socket path (overrides the configuration)\n"
              << "  --log-level <level>  verbose|debug|info|warning|error|fatal\n"
              << "  --help               Show this message\n";
}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string socketPath;
    std::string logLevel;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if ((arg == "--config" || arg == "--socket" || arg == "--log-level") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") configPath = value;
            else if (arg == "--socket") socketPath = value;
            else logLevel = value;
            continue;
        }
        std::cerr << "Unknown or incomplete option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
    }

    vtctl::ChannelConfig config = configPath.empty()
        ? vtctl::ChannelConfig::loadDefault()
        : vtctl::ChannelConfig::load(configPath);

    if (!socketPath.empty()) {
        config.socket_path = socketPath;
    }
    if (!logLevel.empty()) {
        config.log_level = logLevel;
    }
    if (!config.applyLogLevel() && !logLevel.empty()) {
        std::cerr << "Unknown log level: " << logLevel << "\n";
        return 2;
    }

    LOGI("========================================");
    LOGI("vtctl - control channel client");
    LOGI_FMT("Socket: " << config.socket_path);
    LOGI("========================================");

    vtctl::installShutdownSignalHandlers(&g_running, nullptr);

    std::unique_ptr<vtctl::ipc::ConnectionManager> manager;
    try {
        manager = std::make_unique<vtctl::ipc::ConnectionManager>(
            config,
            [](const std::string& payload) {
                std::cout << "\n<< " << payload << std::endl;
            },
            [](vtctl::ipc::ConnectionState state, const vtctl::ipc::ChannelStatus& status) {
                if (status) {
                    LOGI_FMT("Channel state: " << vtctl::ipc::connectionStateToString(state));
                } else {
                    LOGW_FMT("Channel state: " << vtctl::ipc::connectionStateToString(state)
                             << " (" << vtctl::ipc::channelErrorToString(status.error)
                             << ": " << status.message << ")");
                }
            });
    } catch (const std::exception& e) {
        LOGE_FMT("Invalid channel configuration: " << e.what());
        return 1;
    }

    manager->connect();

    vtctl::CommandHandler commandHandler(manager.get());
    vtctl::installShutdownSignalHandlers(&g_running, &commandHandler);

    // Run in separate thread so signals can end the session
    std::atomic<bool> commandDone{false};
    std::thread commandThread([&commandHandler, &commandDone]() {
        commandHandler.runInteractive();
        commandDone = true;
        g_running = false;
    });

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (int signal = vtctl::shutdownSignal()) {
        std::cout << "\n";
        LOGW_FMT("Received signal " << signal << ", shutting down...");
    }

    auto start = std::chrono::steady_clock::now();
    while (!commandDone && std::chrono::steady_clock::now() - start < std::chrono::seconds(2)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    vtctl::installShutdownSignalHandlers(nullptr, nullptr);
    if (commandDone) {
        commandThread.join();
    } else {
        // readline stays blocked on stdin until a line arrives
        LOGW("Command thread did not exit cleanly, detaching...");
        commandThread.detach();
    }

    manager->disconnect();
    LOGI("vtctl stopped");

    if (!commandDone) {
        std::_Exit(0);
    }
    return 0;
}
