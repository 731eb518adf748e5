/**
 * @file serial_console.cpp
 * @brief Serial Console implementation
 *
 * Main implementation of the SerialConsole class. All I/O goes through the
 * ConsoleTransport given at construction.
 */

#include "ui/serial_console.hpp"
#include "InputHandler.hpp"
#include "CommandDispatcher.hpp"
#include <sstream>
#include <cstdarg>
#include <cstdio>
#include <utility>

extern "C" {
#include "esp_log.h"
}

namespace ui {

static const char* TAG = "SerialConsole";

SerialConsole::SerialConsole(ConsoleTransport* transport)
    : transport_(transport),
      input_(std::make_unique<InputHandler>(*this)),
      dispatcher_(std::make_unique<CommandDispatcher>(*this)) {
}

SerialConsole::~SerialConsole() = default;

std::string SerialConsole::GetPrompt() const {
    return "pomotodo> ";
}

void SerialConsole::Init(const std::string& banner) {
    if (!banner.empty()) {
        Print("\r\n" + banner + "\r\n");
        Print("Type 'help' for available commands.\r\n");
    }
    input_->init();
    ESP_LOGI(TAG, "Console ready (%u commands)", static_cast<unsigned>(GetCommands().size()));
}

void SerialConsole::SetLineSink(LineSink sink) {
    sink_ = std::move(sink);
}

void SerialConsole::RegisterCommand(const std::string& verb,
                                    CommandHandler handler,
                                    const std::string& help,
                                    TabCompleteHandler tab_complete) {
    dispatcher_->registerCommand(Command(verb, std::move(handler), help, std::move(tab_complete)));
}

void SerialConsole::Poll() {
    input_->process();
}

void SerialConsole::SubmitLine(const std::string& line) {
    if (sink_) {
        sink_(line);
        return;
    }
    Execute(line);
}

void SerialConsole::Execute(const std::string& line) {
    std::vector<std::string> args;
    std::istringstream iss(line);
    std::string token;

    while (iss >> token) {
        args.push_back(token);
    }

    if (args.size() > MAX_ARGS) {
        Printf("Too many arguments (max %u)\r\n", static_cast<unsigned>(MAX_ARGS));
    } else if (!args.empty()) {
        const esp_err_t err = dispatcher_->dispatch(args);
        ESP_LOGD(TAG, "'%s' -> %s", args[0].c_str(), esp_err_to_name(err));
    }

    Print(GetPrompt());
}

void SerialConsole::Print(const std::string& str) {
    transport_->Write(str.data(), str.length());
}

void SerialConsole::Printf(const char* fmt, ...) {
    char buf[256];  // 256 bytes - sufficient for typical console messages
    va_list args;
    va_start(args, fmt);
    const int len = vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (len < 0) {
        ESP_LOGW(TAG, "Printf format error");
        return;
    }
    Print(buf);
}

std::vector<Command>& SerialConsole::GetCommands() {
    return dispatcher_->commands();
}

} // namespace ui
