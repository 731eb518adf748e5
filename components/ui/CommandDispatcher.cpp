/**
 * @file CommandDispatcher.cpp
 * @brief Verb table, dispatch and completion for the serial console
 */

#include "CommandDispatcher.hpp"
#include <algorithm>
#include <utility>

namespace ui {

SerialConsole::CommandDispatcher::CommandDispatcher(SerialConsole& console)
    : console_(console) {
    registerCommand(Command("help",
        [this](const std::vector<std::string>& args) {
            return helpHandler(args);
        },
        "help [command] - Show available commands or help for specific command",
        [this](const std::string& line, size_t) {
            std::vector<std::string> lines;
            for (const auto& verb : matchVerbs(line.substr(line.find(' ') + 1))) {
                lines.push_back("help " + verb);
            }
            return lines;
        }));
}

void SerialConsole::CommandDispatcher::registerCommand(Command command) {
    auto it = std::find_if(commands_.begin(), commands_.end(),
        [&command](const Command& cmd) {
            return cmd.verb == command.verb;
        });
    if (it != commands_.end()) {
        *it = std::move(command);
        return;
    }
    commands_.push_back(std::move(command));
}

const Command* SerialConsole::CommandDispatcher::find(const std::string& verb) const {
    auto it = std::find_if(commands_.begin(), commands_.end(),
        [&verb](const Command& cmd) {
            return cmd.verb == verb;
        });
    return it != commands_.end() ? &(*it) : nullptr;
}

std::vector<std::string> SerialConsole::CommandDispatcher::matchVerbs(const std::string& prefix) const {
    std::vector<std::string> verbs;
    for (const auto& cmd : commands_) {
        if (cmd.verb.compare(0, prefix.length(), prefix) == 0) {
            verbs.push_back(cmd.verb);
        }
    }
    return verbs;
}

std::vector<std::string> SerialConsole::CommandDispatcher::completeArguments(const std::string& line,
                                                                             size_t cursor) const {
    const Command* cmd = find(line.substr(0, line.find(' ')));
    if (cmd == nullptr || !cmd->tab_complete) {
        return {};
    }
    return cmd->tab_complete(line, cursor);
}

esp_err_t SerialConsole::CommandDispatcher::helpHandler(const std::vector<std::string>& args) {
    if (args.size() >= 2) {
        const Command* cmd = find(args[1]);
        if (cmd == nullptr) {
            console_.Printf("Unknown command: %s\r\n", args[1].c_str());
            console_.Print("Type 'help' to see all available commands.\r\n");
            return ESP_ERR_NOT_FOUND;
        }
        console_.Printf("%s - %s\r\n", cmd->verb.c_str(), cmd->help.c_str());
        return ESP_OK;
    }

    console_.Print("Available commands:\r\n");
    for (const auto& cmd : commands_) {
        console_.Printf("  %-12s - %s\r\n", cmd.verb.c_str(), cmd.help.c_str());
    }
    console_.Print("\r\nType 'help <command>' for detailed information about a specific command.\r\n");
    return ESP_OK;
}

esp_err_t SerialConsole::CommandDispatcher::dispatch(const std::vector<std::string>& args) {
    if (args.empty()) {
        return ESP_OK;
    }

    const Command* cmd = find(args[0]);
    if (cmd == nullptr) {
        console_.Printf("Unknown command: %s\r\n", args[0].c_str());
        console_.Print("Type 'help' for available commands.\r\n");
        return ESP_ERR_NOT_FOUND;
    }

    const esp_err_t result = cmd->handler(args);
    if (result != ESP_OK) {
        console_.Printf("Error: %s\r\n", esp_err_to_name(result));
    }
    return result;
}

} // namespace ui
