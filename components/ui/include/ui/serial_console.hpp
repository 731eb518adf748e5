/**
 * @file serial_console.hpp
 * @brief Serial console for the timer and task ledger
 *
 * Interactive command-line interface over a ConsoleTransport (USB-CDC on the
 * device, COM port "CDC1").
 *
 * Features:
 * - Command history (8 entries)
 * - TAB completion for commands and their arguments
 * - Line editing with arrow keys and backspace
 * - Non-ANSI plain text output for broad compatibility
 *
 * Threading model:
 * - Poll() runs in the console input task: it reads bytes, echoes and edits
 *   the line. A completed line goes to the line sink.
 * - Execute() runs wherever the line sink delivers it (the application main
 *   loop), so command handlers never race with the timer tick.
 * - Without a sink, Poll() executes completed lines itself (host tests).
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include <memory>

#include "ui/console_transport.hpp"

extern "C" {
#include "esp_err.h"
}

namespace ui {

/**
 * Maximum line length for console input buffer.
 * Value: 128 bytes - a task description (96 bytes) plus "task add -e 10 "
 */
constexpr size_t MAX_LINE = 128;

/**
 * Number of commands stored in command history.
 * Memory usage: 8 × 128 bytes = 1KB total history buffer
 */
constexpr size_t HISTORY_SIZE = 8;

/**
 * Maximum number of arguments per command.
 * Value: 32 - task text is split into words and joined again by the handler
 */
constexpr size_t MAX_ARGS = 32;

/**
 * Command handler function signature.
 * @param args Vector of command arguments (args[0] is the command verb)
 * @return ESP_OK on success, otherwise an error printed by name
 */
using CommandHandler = std::function<esp_err_t(const std::vector<std::string>&)>;

/**
 * Tab completion handler function signature.
 * @param partial_input Current input text (e.g., "task a")
 * @param cursor_pos Position of cursor in input
 * @return Vector of possible completions (empty if none)
 */
using TabCompleteHandler = std::function<std::vector<std::string>(const std::string&, size_t)>;

/**
 * Receives completed input lines (called from the input task).
 */
using LineSink = std::function<void(const std::string&)>;

/**
 * Command registration structure.
 * Associates a command verb with its handler and help text.
 */
struct Command {
    std::string verb;                      ///< Command name (e.g., "help", "task", "set")
    CommandHandler handler;                ///< Function to execute for this command
    std::string help;                      ///< Help text displayed by "help <command>"
    TabCompleteHandler tab_complete;       ///< Optional tab completion handler for arguments

    Command(const std::string& v, CommandHandler h, const std::string& desc, TabCompleteHandler tc = nullptr)
        : verb(v), handler(h), help(desc), tab_complete(tc) {}
};

/**
 * Serial Console Manager.
 *
 * - InputHandler: Processes keyboard input, line editing, history navigation
 * - CommandDispatcher: Routes commands to registered handlers
 */
class SerialConsole {
public:
    explicit SerialConsole(ConsoleTransport* transport);
    ~SerialConsole();

    SerialConsole(const SerialConsole&) = delete;
    SerialConsole& operator=(const SerialConsole&) = delete;

    /**
     * Print the welcome banner and the first prompt.
     */
    void Init(const std::string& banner);

    /**
     * Route completed lines to @p sink instead of executing them in Poll().
     */
    void SetLineSink(LineSink sink);

    /**
     * Register a command handler.
     * @param verb Command name (case-sensitive)
     * @param handler Function to call when command is executed
     * @param help Help text for this command
     * @param tab_complete Optional tab completion handler for arguments
     */
    void RegisterCommand(const std::string& verb, CommandHandler handler, const std::string& help, TabCompleteHandler tab_complete = nullptr);

    /**
     * Drain pending input bytes (input task).
     */
    void Poll();

    /**
     * Tokenize and dispatch one line, then print the prompt.
     */
    void Execute(const std::string& line);

    /**
     * Print string to console output.
     */
    void Print(const std::string& str);

    /**
     * Printf-style formatted output to console.
     */
    void Printf(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    /**
     * Registered commands in help order.
     */
    std::vector<Command>& GetCommands();

    std::string GetPrompt() const;

private:
    class InputHandler;         ///< Handles keyboard input and line editing
    class CommandDispatcher;    ///< Routes commands to handlers

    ConsoleTransport* transport_;
    std::unique_ptr<InputHandler> input_;
    std::unique_ptr<CommandDispatcher> dispatcher_;
    LineSink sink_;

    /**
     * Hand a completed line to the sink, or execute it directly.
     */
    void SubmitLine(const std::string& line);

    friend class InputHandler;  // SubmitLine() and TAB completion through dispatcher_
};

} // namespace ui
