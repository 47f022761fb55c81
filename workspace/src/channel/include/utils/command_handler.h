/**
 * @file command_handler.h
 * @brief Interactive command interface driving a control channel
 */

#ifndef VTCTL_COMMAND_HANDLER_H
#define VTCTL_COMMAND_HANDLER_H

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace vtctl {

namespace ipc {
class ConnectionManager;
}

/**
 * @brief Command result structure
 */
struct CommandResult {
    bool success;
    std::string message;

    CommandResult(bool s = true, const std::string& m = "")
        : success(s), message(m) {}
};

/**
 * @brief Command handler for processing terminal user input
 *
 * Commands:
 * - connect                                  - Connect (and keep reconnecting)
 * - disconnect                               - Disconnect and stop reconnecting
 * - send <json>                              - Send a raw JSON payload
 * - request <category> <action> [json]       - Send a request envelope
 * - ping                                     - Send a system/ping request
 * - status                                   - Show connection state
 * - stats                                    - Show channel statistics
 * - loglevel <level>                         - Change the log level
 * - help                                     - Show help text
 * - exit                                     - Exit the command interface
 */
class CommandHandler {
public:
    /**
     * @brief Constructor
     * @param manager Channel to control (may be null for parsing-only use)
     */
    explicit CommandHandler(ipc::ConnectionManager* manager);

    ~CommandHandler();

    /**
     * @brief Process a command line
     * @param commandLine Full command line string
     * @return Command result
     */
    CommandResult processCommand(const std::string& commandLine);

    /**
     * @brief Get help text for all commands
     */
    std::string getHelpText() const;

    /**
     * @brief Run interactive command loop until 'exit', EOF or requestExit()
     */
    void runInteractive();

    /**
     * @brief Request exit from interactive mode (signal handlers)
     */
    void requestExit();

    bool isExitRequested() const { return exitRequested_; }

private:
    using CommandFunc = std::function<CommandResult(const std::vector<std::string>&)>;

    ipc::ConnectionManager* manager_;
    std::map<std::string, CommandFunc> commands_;
    std::atomic<bool> exitRequested_;

    // Unsplit text after the command word, for commands taking JSON
    std::string argumentText_;

    void registerCommands();

    std::vector<std::string> parseCommandLine(const std::string& commandLine);

    CommandResult requireManager() const;

    CommandResult handleConnect(const std::vector<std::string>& args);
    CommandResult handleDisconnect(const std::vector<std::string>& args);
    CommandResult handleSend(const std::vector<std::string>& args);
    CommandResult handleRequest(const std::vector<std::string>& args);
    CommandResult handlePing(const std::vector<std::string>& args);
    CommandResult handleStatus(const std::vector<std::string>& args);
    CommandResult handleStats(const std::vector<std::string>& args);
    CommandResult handleLogLevel(const std::vector<std::string>& args);
    CommandResult handleHelp(const std::vector<std::string>& args);
    CommandResult handleExit(const std::vector<std::string>& args);
};

/**
 * @brief Route SIGINT and SIGTERM to a running flag and a command handler
 *
 * The installed handler only stores to atomics and never logs: the signal may
 * arrive on a thread that already holds the log mutex. Call again with a null
 * handler before the handler is destroyed.
 *
 * @param running Cleared when a signal arrives (may be null)
 * @param handler Asked to exit when a signal arrives (may be null)
 */
void installShutdownSignalHandlers(std::atomic<bool>* running, CommandHandler* handler);

/** Signal that requested shutdown since the last install, 0 if none */
int shutdownSignal();

} // namespace vtctl

#endif // VTCTL_COMMAND_HANDLER_H
