/**
 * @file command_handler.cpp
 * @brief Implementation of the interactive command interface
 */

#include "utils/command_handler.h"
#include "ipc/connection_manager.h"
#include "ipc/control_message.h"
#include "utils/log.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <sstream>

#include <readline/readline.h>
#include <readline/history.h>

namespace vtctl {

namespace {

constexpr std::chrono::seconds SEND_RESULT_WAIT{5};

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(begin, end - begin + 1);
}

std::atomic<std::atomic<bool>*> g_shutdownFlag{nullptr};
std::atomic<CommandHandler*> g_shutdownTarget{nullptr};
volatile std::sig_atomic_t g_shutdownSignal = 0;

void onShutdownSignal(int signal) {
    g_shutdownSignal = signal;
    if (std::atomic<bool>* running = g_shutdownFlag.load()) {
        running->store(false);
    }
    if (CommandHandler* handler = g_shutdownTarget.load()) {
        handler->requestExit();
    }
}

} // namespace

void installShutdownSignalHandlers(std::atomic<bool>* running, CommandHandler* handler) {
    g_shutdownFlag = running;
    g_shutdownTarget = handler;
    g_shutdownSignal = 0;
    std::signal(SIGINT, onShutdownSignal);
    std::signal(SIGTERM, onShutdownSignal);
}

int shutdownSignal() {
    return g_shutdownSignal;
}

CommandHandler::CommandHandler(ipc::ConnectionManager* manager)
    : manager_(manager)
    , exitRequested_(false) {
    registerCommands();
}

CommandHandler::~CommandHandler() {
}

void CommandHandler::requestExit() {
    exitRequested_ = true;
}

void CommandHandler::registerCommands() {
    commands_["connect"] = [this](const std::vector<std::string>& args) { return handleConnect(args); };
    commands_["disconnect"] = [this](const std::vector<std::string>& args) { return handleDisconnect(args); };
    commands_["send"] = [this](const std::vector<std::string>& args) { return handleSend(args); };
    commands_["request"] = [this](const std::vector<std::string>& args) { return handleRequest(args); };
    commands_["ping"] = [this](const std::vector<std::string>& args) { return handlePing(args); };
    commands_["status"] = [this](const std::vector<std::string>& args) { return handleStatus(args); };
    commands_["stats"] = [this](const std::vector<std::string>& args) { return handleStats(args); };
    commands_["loglevel"] = [this](const std::vector<std::string>& args) { return handleLogLevel(args); };
    commands_["help"] = [this](const std::vector<std::string>& args) { return handleHelp(args); };
    commands_["exit"] = [this](const std::vector<std::string>& args) { return handleExit(args); };
    commands_["quit"] = commands_["exit"];
}

std::vector<std::string> CommandHandler::parseCommandLine(const std::string& commandLine) {
    std::vector<std::string> tokens;
    std::istringstream iss(commandLine);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

CommandResult CommandHandler::processCommand(const std::string& commandLine) {
    auto tokens = parseCommandLine(commandLine);

    if (tokens.empty()) {
        return CommandResult(true, "");
    }

    std::string command = tokens[0];
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    std::string trimmed = trim(commandLine);
    argumentText_ = trim(trimmed.substr(command.size()));

    auto it = commands_.find(command);
    if (it != commands_.end()) {
        try {
            return it->second(args);
        } catch (const std::exception& e) {
            return CommandResult(false, std::string("Error executing command: ") + e.what());
        }
    } else {
        return CommandResult(false, "Unknown command: " + command + ". Type 'help' for available commands.");
    }
}

std::string CommandHandler::getHelpText() const {
    std::ostringstream oss;
    oss << "Available commands:\n";
    oss << "  connect                             - Connect to the daemon control socket\n";
    oss << "  disconnect                          - Disconnect and stop reconnecting\n";
    oss << "  send <json>                         - Send a raw JSON payload\n";
    oss << "  request <category> <action> [json]  - Send a request (category: terminal|git|system)\n";
    oss << "  ping                                - Send a keep-alive ping now\n";
    oss << "  status                              - Show connection state\n";
    oss << "  stats                               - Show channel statistics\n";
    oss << "  loglevel <level>                    - Set log level (verbose|debug|info|warning|error)\n";
    oss << "  help                                - Show this help message\n";
    oss << "  exit                                - Exit the command interface\n";
    return oss.str();
}

void CommandHandler::runInteractive() {
    std::cout << "vtctl Interactive Control Channel Shell\n";
    std::cout << "Type 'help' for available commands, 'exit' to quit.\n";
    std::cout << "Use UP/DOWN arrow keys to navigate command history.\n\n";

    exitRequested_ = false;

    while (!exitRequested_) {
        char* line = readline("vtctl> ");

        if (!line) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        std::string commandLine = trim(line);

        if (!commandLine.empty()) {
            add_history(line);

            CommandResult result = processCommand(commandLine);

            if (!result.message.empty()) {
                std::cout << result.message << "\n";
            }

            if (!result.success) {
                std::cout << "[ERROR] Command failed\n";
            }
        }

        free(line);
    }

    std::cout << "Exiting command interface.\n";
}

CommandResult CommandHandler::requireManager() const {
    if (!manager_) {
        return CommandResult(false, "No control channel available");
    }
    return CommandResult(true, "");
}

CommandResult CommandHandler::handleConnect(const std::vector<std::string>& /* args */) {
    auto check = requireManager();
    if (!check.success) return check;

    manager_->connect();
    return CommandResult(true, "Connecting to " + manager_->getConfig().socket_path);
}

CommandResult CommandHandler::handleDisconnect(const std::vector<std::string>& /* args */) {
    auto check = requireManager();
    if (!check.success) return check;

    manager_->disconnect();
    return CommandResult(true, "Disconnected");
}

CommandResult CommandHandler::handleSend(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult(false, "Usage: send <json>");
    }

    nlohmann::json payload = nlohmann::json::parse(argumentText_, nullptr, false);
    if (payload.is_discarded()) {
        return CommandResult(false, "Invalid JSON: " + argumentText_);
    }

    auto check = requireManager();
    if (!check.success) return check;

    bool queued = !manager_->isConnected();
    auto future = manager_->sendJson(payload);
    if (future.wait_for(SEND_RESULT_WAIT) != std::future_status::ready) {
        return CommandResult(true, "Send still in progress");
    }

    ipc::ChannelStatus status = future.get();
    if (!status) {
        return CommandResult(false, std::string("Send failed: ") + ipc::channelErrorToString(status.error) +
                                    (status.message.empty() ? "" : " (" + status.message + ")"));
    }
    return CommandResult(true, queued ? "Queued for delivery" : "Sent");
}

CommandResult CommandHandler::handleRequest(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult(false, "Usage: request <category> <action> [json-payload]");
    }

    ipc::ControlCategory category;
    if (!ipc::parseControlCategory(args[0], category)) {
        return CommandResult(false, "Unknown category: " + args[0] + " (expected terminal, git or system)");
    }

    nlohmann::json payload = nlohmann::json::object();
    if (args.size() > 2) {
        // Everything after "<category> <action>"
        std::string text = argumentText_;
        text = trim(text.substr(text.find(args[0]) + args[0].size()));
        text = trim(text.substr(text.find(args[1]) + args[1].size()));
        payload = nlohmann::json::parse(text, nullptr, false);
        if (payload.is_discarded()) {
            return CommandResult(false, "Invalid JSON payload: " + text);
        }
    }

    auto check = requireManager();
    if (!check.success) return check;

    auto request = manager_->sendRequest(category, args[1], payload);
    if (request.second.wait_for(SEND_RESULT_WAIT) != std::future_status::ready) {
        return CommandResult(true, "Request " + request.first + " still in progress");
    }

    ipc::ChannelStatus status = request.second.get();
    if (!status) {
        return CommandResult(false, std::string("Request failed: ") + ipc::channelErrorToString(status.error));
    }
    return CommandResult(true, "Request " + request.first + " submitted");
}

CommandResult CommandHandler::handlePing(const std::vector<std::string>& /* args */) {
    auto check = requireManager();
    if (!check.success) return check;

    auto request = manager_->sendRequest(ipc::ControlCategory::SYSTEM, "ping");
    if (request.second.wait_for(SEND_RESULT_WAIT) != std::future_status::ready) {
        return CommandResult(true, "Ping still in progress");
    }
    ipc::ChannelStatus status = request.second.get();
    if (!status) {
        return CommandResult(false, std::string("Ping failed: ") + ipc::channelErrorToString(status.error));
    }
    return CommandResult(true, "Ping " + request.first + " submitted");
}

CommandResult CommandHandler::handleStatus(const std::vector<std::string>& /* args */) {
    auto check = requireManager();
    if (!check.success) return check;

    std::ostringstream oss;
    oss << "Socket:  " << manager_->getConfig().socket_path << "\n";
    oss << "State:   " << ipc::connectionStateToString(manager_->getState()) << "\n";
    oss << "Pending: " << manager_->pendingCount();
    return CommandResult(true, oss.str());
}

CommandResult CommandHandler::handleStats(const std::vector<std::string>& /* args */) {
    auto check = requireManager();
    if (!check.success) return check;

    ipc::ChannelStats stats = manager_->getStats();
    std::ostringstream oss;
    oss << "Messages sent/received:  " << stats.messages_sent << " / " << stats.messages_received << "\n";
    oss << "Bytes sent/received:     " << stats.bytes_sent << " / " << stats.bytes_received << "\n";
    oss << "Send errors:             " << stats.send_errors << "\n";
    oss << "Pings/pongs:             " << stats.pings_sent << " / " << stats.pongs_received << "\n";
    oss << "Keep-alive timeouts:     " << stats.keep_alive_timeouts << "\n";
    oss << "Unhandled messages:      " << stats.unhandled_messages << "\n";
    oss << "Corrupt frames:          " << stats.corrupted_frames << "\n";
    oss << "Buffer overflows:        " << stats.buffer_overflows << "\n";
    oss << "Pending flushed/dropped: " << stats.pending_flushed << " / " << stats.pending_dropped << "\n";
    oss << "Connection attempts:     " << stats.connection_attempts << "\n";
    oss << "Connection failures:     " << stats.connection_failures
        << " (consecutive: " << stats.consecutive_failures << ")\n";
    oss << "Reconnects scheduled:    " << stats.reconnects_scheduled;
    return CommandResult(true, oss.str());
}

CommandResult CommandHandler::handleLogLevel(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return CommandResult(false, std::string("Usage: loglevel <level> (current: ") +
                                    utils::logLevelToString(utils::getLogLevel()) + ")");
    }

    utils::LogLevel level;
    if (!utils::parseLogLevel(args[0], level)) {
        return CommandResult(false, "Unknown log level: " + args[0]);
    }
    utils::setLogLevel(level);
    return CommandResult(true, std::string("Log level set to ") + utils::logLevelToString(level));
}

CommandResult CommandHandler::handleHelp(const std::vector<std::string>& /* args */) {
    return CommandResult(true, getHelpText());
}

CommandResult CommandHandler::handleExit(const std::vector<std::string>& /* args */) {
    exitRequested_ = true;
    return CommandResult(true, "Exiting...");
}

} // namespace vtctl
