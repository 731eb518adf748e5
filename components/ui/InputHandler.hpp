/**
 * @file InputHandler.hpp
 * @brief Input handler for serial console - processes keyboard input and line editing
 *
 * Nested class of SerialConsole. Handles:
 * - Character input from the console transport
 * - Line editing (backspace, Ctrl+C, insertion at cursor)
 * - Command history navigation (arrow keys)
 * - Echo and prompt display
 */

#pragma once

#include "ui/serial_console.hpp"
#include <string>
#include <array>

namespace ui {

class SerialConsole::InputHandler {
public:
    explicit InputHandler(SerialConsole& console);

    void init();
    void process();

private:
    static constexpr size_t READ_CHUNK = 32;  // Bytes drained per transport read

    SerialConsole& console_;
    std::string inputBuf_;
    std::array<std::string, HISTORY_SIZE> history_;
    uint8_t histIdx_ = 0;      // Next slot for storing a command
    int8_t histNav_ = -1;      // Slot shown while navigating history (-1 = not navigating)
    size_t histCount_ = 0;     // Valid entries in history_
    size_t cursorPos_ = 0;     // Cursor position in input buffer
    char lastChar_ = 0;        // Track last character to handle CRLF properly

    // ESC sequence state machine
    enum class EscState {
        NORMAL,       // Not in ESC sequence
        ESC_RECEIVED, // ESC received, waiting for '['
        CSI_RECEIVED  // CSI (ESC[) received, waiting for final byte
    };
    EscState escState_ = EscState::NORMAL;

    void handleChar(char c);
    void write(const std::string& str);
    void handleBackspace();
    void handleEnter();
    void handleCtrlC();
    void handleUpArrow();
    void handleDownArrow();
    void handleLeftArrow();
    void handleRightArrow();
    void handleTab();
    void showMatches(const char* title, const std::vector<std::string>& matches);
    void redrawLine(size_t previousLength);  // Redraw prompt + input, blank out leftovers
    void moveCursorLeft(size_t count);
};

} // namespace ui
