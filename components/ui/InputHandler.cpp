/**
 * @file InputHandler.cpp
 * @brief Input handler implementation for serial console
 */

#include "InputHandler.hpp"
#include "CommandDispatcher.hpp"

namespace ui {

SerialConsole::InputHandler::InputHandler(SerialConsole& console)
    : console_(console) {
}

void SerialConsole::InputHandler::init() {
    inputBuf_.reserve(MAX_LINE);
    write("\r\n" + console_.GetPrompt());
}

void SerialConsole::InputHandler::write(const std::string& str) {
    console_.transport_->Write(str.data(), str.length());
}

void SerialConsole::InputHandler::process() {
    char chunk[READ_CHUNK];
    size_t count = 0;
    while ((count = console_.transport_->Read(chunk, sizeof(chunk))) > 0) {
        for (size_t i = 0; i < count; i++) {
            handleChar(chunk[i]);
        }
    }
}

void SerialConsole::InputHandler::handleChar(char c) {
    // Skip \n if previous character was \r (CRLF handling)
    if (c == '\n' && lastChar_ == '\r') {
        lastChar_ = c;
        return;
    }
    lastChar_ = c;

    // ESC [ <letter> arrives as three separate bytes
    switch (escState_) {
        case EscState::NORMAL:
            if (c == 0x1B) {
                escState_ = EscState::ESC_RECEIVED;
                return;
            }
            break;

        case EscState::ESC_RECEIVED:
            escState_ = (c == '[') ? EscState::CSI_RECEIVED : EscState::NORMAL;
            return;

        case EscState::CSI_RECEIVED:
            escState_ = EscState::NORMAL;
            switch (c) {
                case 'A':
                    handleUpArrow();
                    return;
                case 'B':
                    handleDownArrow();
                    return;
                case 'C':
                    handleRightArrow();
                    return;
                case 'D':
                    handleLeftArrow();
                    return;
                default:
                    // Home, End, Page Up/Down: ignored
                    return;
            }
    }

    switch (c) {
        case '\r':
        case '\n':
            handleEnter();
            break;

        case '\b':
        case 0x7F:  // DEL key
            handleBackspace();
            break;

        case 0x03:  // Ctrl+C
            handleCtrlC();
            break;

        case '\t':
            handleTab();
            break;

        default:
            if (c >= 32 && c <= 126 && inputBuf_.length() < MAX_LINE - 1) {
                if (cursorPos_ < inputBuf_.length()) {
                    inputBuf_.insert(cursorPos_, 1, c);
                    cursorPos_++;
                    write(inputBuf_.substr(cursorPos_ - 1));
                    moveCursorLeft(inputBuf_.length() - cursorPos_);
                } else {
                    inputBuf_ += c;
                    cursorPos_++;
                    write(std::string(1, c));
                }
            }
            break;
    }
}

void SerialConsole::InputHandler::handleBackspace() {
    if (inputBuf_.empty() || cursorPos_ == 0) {
        return;
    }
    if (cursorPos_ == inputBuf_.length()) {
        inputBuf_.pop_back();
        cursorPos_--;
        write("\b \b");
    } else {
        inputBuf_.erase(cursorPos_ - 1, 1);
        cursorPos_--;
        // Redraw the tail plus a blank over the old last character
        write("\b" + inputBuf_.substr(cursorPos_) + " ");
        moveCursorLeft(inputBuf_.length() - cursorPos_ + 1);
    }
}

void SerialConsole::InputHandler::handleEnter() {
    write("\r\n");

    std::string line;
    line.swap(inputBuf_);
    histNav_ = -1;
    cursorPos_ = 0;

    if (line.find_first_not_of(' ') == std::string::npos) {
        write(console_.GetPrompt());
        return;
    }

    history_[histIdx_] = line;
    histIdx_ = (histIdx_ + 1) % HISTORY_SIZE;
    if (histCount_ < HISTORY_SIZE) {
        histCount_++;
    }

    // Execute() prints the prompt once the command has run
    console_.SubmitLine(line);
}

void SerialConsole::InputHandler::handleCtrlC() {
    inputBuf_.clear();
    histNav_ = -1;
    cursorPos_ = 0;
    write("^C\r\n" + console_.GetPrompt());
}

//=============================================================================
// Arrow Key Handlers (History Navigation & Cursor Movement)
//=============================================================================

void SerialConsole::InputHandler::handleUpArrow() {
    if (histCount_ == 0) {
        return;
    }

    const int8_t newest = static_cast<int8_t>((histIdx_ + HISTORY_SIZE - 1) % HISTORY_SIZE);
    const int8_t oldest = static_cast<int8_t>((histIdx_ + HISTORY_SIZE - histCount_) % HISTORY_SIZE);

    if (histNav_ == -1) {
        histNav_ = newest;
    } else if (histNav_ == oldest) {
        return;
    } else {
        histNav_ = static_cast<int8_t>((histNav_ + HISTORY_SIZE - 1) % HISTORY_SIZE);
    }

    const size_t previous = inputBuf_.length();
    inputBuf_ = history_[histNav_];
    cursorPos_ = inputBuf_.length();
    redrawLine(previous);
}

void SerialConsole::InputHandler::handleDownArrow() {
    if (histNav_ == -1) {
        return;
    }

    const size_t previous = inputBuf_.length();
    const int8_t next = static_cast<int8_t>((histNav_ + 1) % HISTORY_SIZE);
    if (next == histIdx_) {
        // Past the newest entry: back to an empty line
        histNav_ = -1;
        inputBuf_.clear();
    } else {
        histNav_ = next;
        inputBuf_ = history_[histNav_];
    }
    cursorPos_ = inputBuf_.length();
    redrawLine(previous);
}

void SerialConsole::InputHandler::handleLeftArrow() {
    if (cursorPos_ > 0) {
        cursorPos_--;
        write("\b");
    }
}

void SerialConsole::InputHandler::handleRightArrow() {
    if (cursorPos_ < inputBuf_.length()) {
        write(std::string(1, inputBuf_[cursorPos_]));
        cursorPos_++;
    }
}

//=============================================================================
// TAB Completion
//=============================================================================

void SerialConsole::InputHandler::handleTab() {
    if (inputBuf_.empty()) {
        return;
    }

    const size_t previous = inputBuf_.length();

    if (inputBuf_.find(' ') != std::string::npos) {
        // Argument completion: the command returns whole lines
        std::vector<std::string> matches = console_.dispatcher_->completeArguments(inputBuf_, cursorPos_);
        if (matches.size() == 1) {
            inputBuf_ = matches[0];
            cursorPos_ = inputBuf_.length();
            redrawLine(previous);
        } else if (!matches.empty()) {
            showMatches("Possible completions:", matches);
        }
        return;
    }

    std::vector<std::string> matches = console_.dispatcher_->matchVerbs(inputBuf_);
    if (matches.size() == 1) {
        inputBuf_ = matches[0] + " ";
        cursorPos_ = inputBuf_.length();
        redrawLine(previous);
    } else if (!matches.empty()) {
        showMatches("Possible commands:", matches);
    }
}

void SerialConsole::InputHandler::showMatches(const char* title, const std::vector<std::string>& matches) {
    std::string out = "\r\n";
    out += title;
    out += "\r\n";
    for (const auto& match : matches) {
        out += "  " + match + "\r\n";
    }
    out += console_.GetPrompt() + inputBuf_;
    write(out);
    cursorPos_ = inputBuf_.length();
}

//=============================================================================
// Helper Methods
//=============================================================================

void SerialConsole::InputHandler::redrawLine(size_t previousLength) {
    std::string out = "\r" + console_.GetPrompt() + inputBuf_;
    const size_t pad = previousLength > inputBuf_.length() ? previousLength - inputBuf_.length() : 0;
    out.append(pad, ' ');
    write(out);
    moveCursorLeft(pad + (inputBuf_.length() - cursorPos_));
}

void SerialConsole::InputHandler::moveCursorLeft(size_t count) {
    if (count > 0) {
        write(std::string(count, '\b'));
    }
}

} // namespace ui
