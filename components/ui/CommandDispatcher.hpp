/**
 * @file CommandDispatcher.hpp
 * @brief Verb table of the serial console
 *
 * Nested class of SerialConsole. Owns the registered commands and answers
 * the two questions the console asks about them:
 * - dispatch(): run a tokenized line and report its esp_err_t by name
 * - matchVerbs() / completeArguments(): TAB completion, verb or argument
 *
 * Registration happens at boot before the input task starts; afterwards the
 * table is only read, from the input task (completion) and the main loop
 * (dispatch).
 */

#pragma once

#include "ui/serial_console.hpp"
#include <string>
#include <vector>

extern "C" {
#include "esp_err.h"
}

namespace ui {

class SerialConsole::CommandDispatcher {
public:
    explicit CommandDispatcher(SerialConsole& console);

    /**
     * Add @p command, or replace the entry with the same verb in place so
     * the help order stays stable.
     */
    void registerCommand(Command command);

    /**
     * Run args[0] with @p args.
     * @return Handler result, or ESP_ERR_NOT_FOUND for an unknown verb.
     *         Failures are already printed ("Error: ESP_ERR_...").
     */
    esp_err_t dispatch(const std::vector<std::string>& args);

    std::vector<std::string> matchVerbs(const std::string& prefix) const;

    /**
     * Ask the command named by the first word of @p line for completions.
     * @return Whole replacement lines; empty when the verb is unknown or has
     *         no completer
     */
    std::vector<std::string> completeArguments(const std::string& line, size_t cursor) const;

    std::vector<Command>& commands() { return commands_; }

private:
    SerialConsole& console_;
    std::vector<Command> commands_;

    esp_err_t helpHandler(const std::vector<std::string>& args);
    const Command* find(const std::string& verb) const;
};

} // namespace ui
