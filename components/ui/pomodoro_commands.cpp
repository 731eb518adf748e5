/**
 * @file pomodoro_commands.cpp
 * @brief Timer, task and settings commands for the serial console
 */

#include "ui/pomodoro_commands.hpp"
#include "ui/serial_console.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <sstream>
#include <utility>

extern "C" {
#include "esp_log.h"
}

namespace ui {

static const char* TAG = "pomodoro_cmds";

namespace {

using pomodoro::Phase;

const char* const TASK_SUBCOMMANDS[] = {"list", "add", "edit", "est", "del", "move", "use", "none", "done"};
const char* const MODE_NAMES[] = {"focus", "short", "long"};

std::vector<std::string> SplitWords(const std::string& input) {
    std::vector<std::string> words;
    std::istringstream iss(input);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

/**
 * Complete the word under construction at the end of @p input.
 * Each match is returned as the whole new input line.
 */
std::vector<std::string> CompleteLastWord(const std::string& input, const std::vector<std::string>& options) {
    const size_t split = input.find_last_of(' ');
    const std::string head = input.substr(0, split + 1);
    const std::string partial = input.substr(split + 1);

    std::vector<std::string> matches;
    for (const auto& option : options) {
        if (option.compare(0, partial.length(), partial) == 0) {
            matches.push_back(head + option + " ");
        }
    }
    return matches;
}

// Index of the word being completed (a trailing space starts a new word)
size_t CompletingWordIndex(const std::string& input) {
    const std::vector<std::string> words = SplitWords(input);
    if (words.empty()) {
        return 0;
    }
    return (input.back() == ' ') ? words.size() : words.size() - 1;
}

std::string JoinArgs(const std::vector<std::string>& args, size_t first) {
    std::string text;
    for (size_t i = first; i < args.size(); i++) {
        if (!text.empty()) {
            text += ' ';
        }
        text += args[i];
    }
    return text;
}

bool ParsePhase(const std::string& name, Phase* out) {
    if (name == "focus") {
        *out = Phase::kFocus;
    } else if (name == "short") {
        *out = Phase::kShortBreak;
    } else if (name == "long") {
        *out = Phase::kLongBreak;
    } else {
        return false;
    }
    return true;
}

bool ParseOnOff(const std::string& text, bool* out) {
    if (text == "on" || text == "true" || text == "1") {
        *out = true;
    } else if (text == "off" || text == "false" || text == "0") {
        *out = false;
    } else {
        return false;
    }
    return true;
}

/**
 * Command set bound to one console and one context.
 * Owned by the registered handlers through a shared_ptr.
 */
class PomodoroCommands : public std::enable_shared_from_this<PomodoroCommands> {
public:
    using Method = esp_err_t (PomodoroCommands::*)(const std::vector<std::string>&);

    PomodoroCommands(SerialConsole* console, app::PomodoroContext* context, CommandHooks hooks)
        : console_(console), context_(context), hooks_(std::move(hooks)) {}

    void registerAll();

private:
    SerialConsole* console_;
    app::PomodoroContext* context_;
    CommandHooks hooks_;

    CommandHandler bind(Method method);

    // Timer
    esp_err_t startCmd(const std::vector<std::string>& args);
    esp_err_t pauseCmd(const std::vector<std::string>& args);
    esp_err_t resumeCmd(const std::vector<std::string>& args);
    esp_err_t toggleCmd(const std::vector<std::string>& args);
    esp_err_t resetCmd(const std::vector<std::string>& args);
    esp_err_t skipCmd(const std::vector<std::string>& args);
    esp_err_t modeCmd(const std::vector<std::string>& args);
    esp_err_t statusCmd(const std::vector<std::string>& args);

    // Tasks
    esp_err_t taskCmd(const std::vector<std::string>& args);
    esp_err_t taskList();
    esp_err_t taskAdd(const std::vector<std::string>& args);
    esp_err_t taskEdit(const std::vector<std::string>& args);
    esp_err_t taskEstimate(const std::vector<std::string>& args);
    esp_err_t taskDelete(const std::vector<std::string>& args);
    esp_err_t taskMove(const std::vector<std::string>& args);
    esp_err_t taskUse(const std::vector<std::string>& args);
    esp_err_t taskDone(const std::vector<std::string>& args);
    std::vector<std::string> completeTask(const std::string& input) const;

    // Settings and system
    esp_err_t setCmd(const std::vector<std::string>& args);
    esp_err_t showCmd(const std::vector<std::string>& args);
    esp_err_t themeCmd(const std::vector<std::string>& args);
    esp_err_t saveCmd(const std::vector<std::string>& args);
    esp_err_t rebootCmd(const std::vector<std::string>& args);

    bool parseId(const std::vector<std::string>& args, size_t index, uint32_t* id);
    void printPhaseLine();
    void printNotice(const app::PhaseNotice& notice);
    void printTask(const tasks::Task& task);
    void printPersistenceWarning();
    esp_err_t usage(const char* text);
};

CommandHandler PomodoroCommands::bind(Method method) {
    std::shared_ptr<PomodoroCommands> self = shared_from_this();
    return [self, method](const std::vector<std::string>& args) {
        const esp_err_t result = ((*self).*method)(args);
        self->printPersistenceWarning();
        return result;
    };
}

void PomodoroCommands::registerAll() {
    std::shared_ptr<PomodoroCommands> self = shared_from_this();

    console_->RegisterCommand("start", bind(&PomodoroCommands::startCmd),
        "start - Start a focus session (or resume a paused phase)");
    console_->RegisterCommand("pause", bind(&PomodoroCommands::pauseCmd),
        "pause - Pause the countdown");
    console_->RegisterCommand("resume", bind(&PomodoroCommands::resumeCmd),
        "resume - Resume a paused countdown");
    console_->RegisterCommand("toggle", bind(&PomodoroCommands::toggleCmd),
        "toggle - Start, pause or resume depending on the timer state");
    console_->RegisterCommand("reset", bind(&PomodoroCommands::resetCmd),
        "reset - Stop the timer and return to idle (session count kept)");
    console_->RegisterCommand("skip", bind(&PomodoroCommands::skipCmd),
        "skip - End the current phase now");
    console_->RegisterCommand("mode", bind(&PomodoroCommands::modeCmd),
        "mode <focus|short|long> - Switch phase (paused, full duration)",
        [](const std::string& input, size_t) {
            if (CompletingWordIndex(input) != 1) {
                return std::vector<std::string>{};
            }
            return CompleteLastWord(input, std::vector<std::string>(std::begin(MODE_NAMES), std::end(MODE_NAMES)));
        });
    console_->RegisterCommand("status", bind(&PomodoroCommands::statusCmd),
        "status - Show phase, remaining time, session count and active task");

    console_->RegisterCommand("task", bind(&PomodoroCommands::taskCmd),
        "task <list|add [-e N] text|edit id text|est id n|del id|move id pos|use id|none|done id>",
        [self](const std::string& input, size_t) {
            return self->completeTask(input);
        });

    console_->RegisterCommand("set", bind(&PomodoroCommands::setCmd),
        "set <focus|short|long|interval|auto> <value> - Change a timer setting",
        [](const std::string& input, size_t) {
            const size_t index = CompletingWordIndex(input);
            if (index == 1) {
                std::vector<std::string> names;
                for (const auto& range : config::kSettingRanges) {
                    names.push_back(range.name);
                }
                names.push_back("auto");
                return CompleteLastWord(input, names);
            }
            const std::vector<std::string> words = SplitWords(input);
            if (index == 2 && words.size() >= 2 && words[1] == "auto") {
                return CompleteLastWord(input, {"on", "off"});
            }
            return std::vector<std::string>{};
        });
    console_->RegisterCommand("show", bind(&PomodoroCommands::showCmd),
        "show - List timer settings with their ranges");
    console_->RegisterCommand("theme", bind(&PomodoroCommands::themeCmd),
        "theme <dark|light> - Select the LED theme",
        [](const std::string& input, size_t) {
            if (CompletingWordIndex(input) != 1) {
                return std::vector<std::string>{};
            }
            return CompleteLastWord(input, {"dark", "light"});
        });
    console_->RegisterCommand("save", bind(&PomodoroCommands::saveCmd),
        "save - Write settings and tasks to flash now");
    console_->RegisterCommand("reboot", bind(&PomodoroCommands::rebootCmd),
        "reboot confirm - Save and restart the device",
        [](const std::string& input, size_t) {
            if (CompletingWordIndex(input) != 1) {
                return std::vector<std::string>{};
            }
            return CompleteLastWord(input, {"confirm"});
        });
}

//=============================================================================
// Output helpers
//=============================================================================

esp_err_t PomodoroCommands::usage(const char* text) {
    console_->Printf("Usage: %s\r\n", text);
    return ESP_ERR_INVALID_ARG;
}

void PomodoroCommands::printPersistenceWarning() {
    const esp_err_t warning = context_->TakePersistenceWarning();
    if (warning != ESP_OK) {
        console_->Printf("Warning: changes not saved to flash (%s)\r\n", esp_err_to_name(warning));
    }
}

void PomodoroCommands::printPhaseLine() {
    const pomodoro::TimerSnapshot timer = context_->Snapshot().timer;
    if (timer.phase == Phase::kIdle) {
        console_->Print("Timer idle\r\n");
        return;
    }
    console_->Printf("%s %s (%s)\r\n", pomodoro::PhaseName(timer.phase),
                     timer.running ? "running" : "paused", FormatClock(timer.remaining_ticks).c_str());
}

void PomodoroCommands::printNotice(const app::PhaseNotice& notice) {
    console_->Printf("%s ended -> %s (sessions: %lu)\r\n", pomodoro::PhaseName(notice.event.ended),
                     pomodoro::PhaseName(notice.event.next),
                     static_cast<unsigned long>(notice.event.sessions_completed));
    if (notice.credited_task) {
        const tasks::Task* task = context_->ledger().Find(*notice.credited_task);
        if (task != nullptr) {
            console_->Printf("Credited #%lu (%lu/%lu)%s\r\n", static_cast<unsigned long>(task->id),
                             static_cast<unsigned long>(task->completed_pomodoros),
                             static_cast<unsigned long>(task->estimated_pomodoros),
                             task->done ? " - done" : "");
        }
    }
}

void PomodoroCommands::printTask(const tasks::Task& task) {
    const bool active = context_->ledger().active_id() == task.id;
    console_->Printf("%c%2lu. [%c] #%-3lu %lu/%lu  %s\r\n", active ? '>' : ' ',
                     static_cast<unsigned long>(task.position + 1), task.done ? 'x' : ' ',
                     static_cast<unsigned long>(task.id), static_cast<unsigned long>(task.completed_pomodoros),
                     static_cast<unsigned long>(task.estimated_pomodoros), task.text.c_str());
}

bool PomodoroCommands::parseId(const std::vector<std::string>& args, size_t index, uint32_t* id) {
    if (index >= args.size() || !ParseUint(args[index], id)) {
        if (index < args.size()) {
            console_->Printf("Invalid task id: %s\r\n", args[index].c_str());
        }
        return false;
    }
    return true;
}

//=============================================================================
// Timer commands
//=============================================================================

esp_err_t PomodoroCommands::startCmd(const std::vector<std::string>&) {
    const esp_err_t err = context_->Start();
    if (err == ESP_ERR_INVALID_STATE) {
        console_->Print("Timer already running\r\n");
        return err;
    }
    if (err == ESP_OK) {
        printPhaseLine();
    }
    return err;
}

esp_err_t PomodoroCommands::pauseCmd(const std::vector<std::string>&) {
    const esp_err_t err = context_->Pause();
    if (err == ESP_ERR_INVALID_STATE) {
        console_->Print("Nothing to pause\r\n");
        return err;
    }
    if (err == ESP_OK) {
        printPhaseLine();
    }
    return err;
}

esp_err_t PomodoroCommands::resumeCmd(const std::vector<std::string>&) {
    const esp_err_t err = context_->Resume();
    if (err == ESP_ERR_INVALID_STATE) {
        console_->Print("Nothing to resume\r\n");
        return err;
    }
    if (err == ESP_OK) {
        printPhaseLine();
    }
    return err;
}

esp_err_t PomodoroCommands::toggleCmd(const std::vector<std::string>&) {
    const esp_err_t err = context_->TogglePause();
    if (err == ESP_OK) {
        printPhaseLine();
    }
    return err;
}

esp_err_t PomodoroCommands::resetCmd(const std::vector<std::string>&) {
    context_->Reset();
    printPhaseLine();
    return ESP_OK;
}

esp_err_t PomodoroCommands::skipCmd(const std::vector<std::string>&) {
    std::optional<app::PhaseNotice> notice = context_->Skip();
    if (!notice) {
        console_->Print("Timer is idle, nothing to skip\r\n");
        return ESP_ERR_INVALID_STATE;
    }
    printNotice(*notice);
    if (hooks_.on_phase_notice) {
        hooks_.on_phase_notice(*notice);
    }
    printPhaseLine();
    return ESP_OK;
}

esp_err_t PomodoroCommands::modeCmd(const std::vector<std::string>& args) {
    Phase phase = Phase::kIdle;
    if (args.size() != 2 || !ParsePhase(args[1], &phase)) {
        return usage("mode <focus|short|long>");
    }
    context_->SelectPhase(phase);
    printPhaseLine();
    return ESP_OK;
}

esp_err_t PomodoroCommands::statusCmd(const std::vector<std::string>&) {
    const app::ContextSnapshot snapshot = context_->Snapshot();
    const pomodoro::TimerSnapshot& timer = snapshot.timer;

    if (timer.phase == Phase::kIdle) {
        console_->Print("Phase:     idle\r\n");
    } else {
        console_->Printf("Phase:     %s (%s)\r\n", pomodoro::PhaseName(timer.phase),
                         timer.running ? "running" : "paused");
        console_->Printf("Remaining: %s / %s\r\n", FormatClock(timer.remaining_ticks).c_str(),
                         FormatClock(timer.phase_ticks).c_str());
    }
    console_->Printf("Sessions:  %lu of %lu before long break\r\n",
                     static_cast<unsigned long>(timer.sessions_completed),
                     static_cast<unsigned long>(context_->settings().long_break_interval));

    const tasks::Task* active = snapshot.active_task ? context_->ledger().Find(*snapshot.active_task) : nullptr;
    if (active == nullptr) {
        console_->Print("Task:      none\r\n");
    } else {
        console_->Printf("Task:      #%lu %s (%lu/%lu)\r\n", static_cast<unsigned long>(active->id),
                         active->text.c_str(), static_cast<unsigned long>(active->completed_pomodoros),
                         static_cast<unsigned long>(active->estimated_pomodoros));
    }
    return ESP_OK;
}

//=============================================================================
// Task commands
//=============================================================================

esp_err_t PomodoroCommands::taskCmd(const std::vector<std::string>& args) {
    if (args.size() < 2 || args[1] == "list") {
        return taskList();
    }

    const std::string& sub = args[1];
    if (sub == "add") {
        return taskAdd(args);
    }
    if (sub == "edit") {
        return taskEdit(args);
    }
    if (sub == "est") {
        return taskEstimate(args);
    }
    if (sub == "del") {
        return taskDelete(args);
    }
    if (sub == "move") {
        return taskMove(args);
    }
    if (sub == "use") {
        return taskUse(args);
    }
    if (sub == "none") {
        context_->ClearActiveTask();
        console_->Print("No active task\r\n");
        return ESP_OK;
    }
    if (sub == "done") {
        return taskDone(args);
    }

    console_->Printf("Unknown task command: %s\r\n", sub.c_str());
    return usage("task <list|add|edit|est|del|move|use|none|done> ...");
}

esp_err_t PomodoroCommands::taskList() {
    const tasks::TaskLedger& ledger = context_->ledger();
    if (ledger.empty()) {
        console_->Print("No tasks. Add one with 'task add <text>'\r\n");
        return ESP_OK;
    }
    console_->Printf("Tasks (%u/%u):\r\n", static_cast<unsigned>(ledger.size()),
                     static_cast<unsigned>(tasks::kMaxTasks));
    for (const auto& task : ledger.tasks()) {
        printTask(task);
    }
    return ESP_OK;
}

esp_err_t PomodoroCommands::taskAdd(const std::vector<std::string>& args) {
    uint32_t estimate = tasks::kMinEstimate;
    size_t text_start = 2;
    if (args.size() > 2 && args[2] == "-e") {
        if (args.size() < 4 || !ParseUint(args[3], &estimate)) {
            return usage("task add [-e N] <text>");
        }
        text_start = 4;
    }
    const std::string text = JoinArgs(args, text_start);
    if (text.empty()) {
        return usage("task add [-e N] <text>");
    }

    uint32_t id = 0;
    const esp_err_t err = context_->AddTask(text, estimate, &id);
    switch (err) {
        case ESP_OK:
            console_->Printf("Added #%lu\r\n", static_cast<unsigned long>(id));
            break;
        case ESP_ERR_NO_MEM:
            console_->Printf("Task list full (%u tasks)\r\n", static_cast<unsigned>(tasks::kMaxTasks));
            break;
        case ESP_ERR_INVALID_ARG:
            console_->Printf("Text must be 1..%u characters, estimate %lu..%lu\r\n",
                             static_cast<unsigned>(tasks::kMaxTextLength),
                             static_cast<unsigned long>(tasks::kMinEstimate),
                             static_cast<unsigned long>(tasks::kMaxEstimate));
            break;
        default:
            break;
    }
    return err;
}

esp_err_t PomodoroCommands::taskEdit(const std::vector<std::string>& args) {
    uint32_t id = 0;
    if (args.size() < 4 || !parseId(args, 2, &id)) {
        return usage("task edit <id> <text>");
    }
    const esp_err_t err = context_->EditTask(id, JoinArgs(args, 3));
    if (err == ESP_OK) {
        printTask(*context_->ledger().Find(id));
    }
    return err;
}

esp_err_t PomodoroCommands::taskEstimate(const std::vector<std::string>& args) {
    uint32_t id = 0;
    uint32_t estimate = 0;
    if (args.size() != 4 || !parseId(args, 2, &id) || !ParseUint(args[3], &estimate)) {
        return usage("task est <id> <1-10>");
    }
    const esp_err_t err = context_->SetTaskEstimate(id, estimate);
    if (err == ESP_OK) {
        printTask(*context_->ledger().Find(id));
    }
    return err;
}

esp_err_t PomodoroCommands::taskDelete(const std::vector<std::string>& args) {
    uint32_t id = 0;
    if (args.size() != 3 || !parseId(args, 2, &id)) {
        return usage("task del <id>");
    }
    const esp_err_t err = context_->DeleteTask(id);
    if (err == ESP_OK) {
        console_->Printf("Deleted #%lu\r\n", static_cast<unsigned long>(id));
    }
    return err;
}

esp_err_t PomodoroCommands::taskMove(const std::vector<std::string>& args) {
    uint32_t id = 0;
    uint32_t position = 0;
    if (args.size() != 4 || !parseId(args, 2, &id) || !ParseUint(args[3], &position) || position == 0) {
        return usage("task move <id> <position (1 = top)>");
    }
    const esp_err_t err = context_->ReorderTask(id, position - 1);
    if (err == ESP_OK) {
        return taskList();
    }
    if (err == ESP_ERR_INVALID_ARG) {
        console_->Printf("Position must be 1..%u\r\n", static_cast<unsigned>(context_->ledger().size()));
    }
    return err;
}

esp_err_t PomodoroCommands::taskUse(const std::vector<std::string>& args) {
    uint32_t id = 0;
    if (args.size() != 3 || !parseId(args, 2, &id)) {
        return usage("task use <id>");
    }
    const esp_err_t err = context_->SetActiveTask(id);
    if (err == ESP_OK) {
        console_->Printf("Active: #%lu %s\r\n", static_cast<unsigned long>(id),
                         context_->ledger().Find(id)->text.c_str());
    } else if (err == ESP_ERR_INVALID_STATE) {
        console_->Print("Task is done; reopen it with 'task done <id>' first\r\n");
    }
    return err;
}

esp_err_t PomodoroCommands::taskDone(const std::vector<std::string>& args) {
    uint32_t id = 0;
    if (args.size() != 3 || !parseId(args, 2, &id)) {
        return usage("task done <id>");
    }
    const esp_err_t err = context_->ToggleTaskComplete(id);
    if (err == ESP_OK) {
        printTask(*context_->ledger().Find(id));
    }
    return err;
}

std::vector<std::string> PomodoroCommands::completeTask(const std::string& input) const {
    const size_t index = CompletingWordIndex(input);
    if (index == 1) {
        return CompleteLastWord(input, std::vector<std::string>(std::begin(TASK_SUBCOMMANDS), std::end(TASK_SUBCOMMANDS)));
    }

    const std::vector<std::string> words = SplitWords(input);
    if (index != 2 || words.size() < 2) {
        return {};
    }
    const std::string& sub = words[1];
    if (sub != "edit" && sub != "est" && sub != "del" && sub != "move" && sub != "use" && sub != "done") {
        return {};
    }

    // Runs on the console input task: only the context's task index is safe to read here
    std::vector<std::string> ids;
    for (const auto& entry : context_->TaskIndex()) {
        if (sub == "use" && entry.done) {
            continue;
        }
        ids.push_back(std::to_string(entry.id));
    }
    return CompleteLastWord(input, ids);
}

//=============================================================================
// Settings and system commands
//=============================================================================

esp_err_t PomodoroCommands::setCmd(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return usage("set <focus|short|long|interval|auto> <value>");
    }

    config::TimerSettings settings = context_->settings();
    const std::string& name = args[1];

    if (name == "auto") {
        if (!ParseOnOff(args[2], &settings.auto_continue)) {
            return usage("set auto <on|off>");
        }
    } else {
        const config::SettingRange* range = config::FindSettingRange(name.c_str());
        uint32_t value = 0;
        if (range == nullptr) {
            console_->Printf("Unknown setting: %s\r\n", name.c_str());
            return usage("set <focus|short|long|interval|auto> <value>");
        }
        if (!ParseUint(args[2], &value)) {
            console_->Printf("%s expects a number (%lu..%lu %s)\r\n", range->name,
                             static_cast<unsigned long>(range->min_value),
                             static_cast<unsigned long>(range->max_value), range->unit);
            return ESP_ERR_INVALID_ARG;
        }
        config::SetSetting(settings, range->field, value);
    }

    std::string error;
    const esp_err_t err = context_->ApplyTimerSettings(settings, &error);
    if (err != ESP_OK) {
        if (!error.empty()) {
            console_->Printf("%s\r\n", error.c_str());
        }
        return err;
    }
    console_->Printf("%s = %s (timer reset)\r\n", name.c_str(), args[2].c_str());
    printPhaseLine();
    return ESP_OK;
}

esp_err_t PomodoroCommands::showCmd(const std::vector<std::string>&) {
    const config::TimerSettings& settings = context_->settings();
    console_->Print("Timer settings:\r\n");
    for (const auto& range : config::kSettingRanges) {
        console_->Printf("  %-10s %4lu %-9s (%lu..%lu, default %lu)\r\n", range.name,
                         static_cast<unsigned long>(config::GetSetting(settings, range.field)), range.unit,
                         static_cast<unsigned long>(range.min_value), static_cast<unsigned long>(range.max_value),
                         static_cast<unsigned long>(range.default_value));
    }
    console_->Printf("  %-10s %4s\r\n", "auto", settings.auto_continue ? "on" : "off");
    console_->Printf("  %-10s %4s\r\n", "theme", settings.dark_mode ? "dark" : "light");
    return ESP_OK;
}

esp_err_t PomodoroCommands::themeCmd(const std::vector<std::string>& args) {
    if (args.size() != 2 || (args[1] != "dark" && args[1] != "light")) {
        return usage("theme <dark|light>");
    }
    const esp_err_t err = context_->SetDarkMode(args[1] == "dark");
    if (err == ESP_OK) {
        console_->Printf("Theme: %s\r\n", args[1].c_str());
    }
    return err;
}

esp_err_t PomodoroCommands::saveCmd(const std::vector<std::string>&) {
    const esp_err_t err = context_->Flush();
    if (err == ESP_OK) {
        console_->Print("Saved\r\n");
    }
    return err;
}

esp_err_t PomodoroCommands::rebootCmd(const std::vector<std::string>& args) {
    if (args.size() != 2 || args[1] != "confirm") {
        console_->Print("Type 'reboot confirm' to save and restart\r\n");
        return ESP_OK;
    }
    if (!hooks_.on_reboot) {
        console_->Print("Reboot not available\r\n");
        return ESP_ERR_NOT_SUPPORTED;
    }
    console_->Print("Rebooting...\r\n");
    ESP_LOGI(TAG, "Reboot requested from console");
    hooks_.on_reboot();
    return ESP_OK;
}

}  // namespace

//=============================================================================
// Public API
//=============================================================================

void RegisterPomodoroCommands(SerialConsole* console, app::PomodoroContext* context, CommandHooks hooks) {
    auto commands = std::make_shared<PomodoroCommands>(console, context, std::move(hooks));
    commands->registerAll();
}

std::string FormatClock(uint32_t ticks) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%02lu:%02lu", static_cast<unsigned long>(ticks / 60),
             static_cast<unsigned long>(ticks % 60));
    return buf;
}

bool ParseUint(const std::string& text, uint32_t* out) {
    if (text.empty() || text.length() > 10 ||
        !std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return false;
    }
    errno = 0;
    const unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE || value > UINT32_MAX) {
        return false;
    }
    *out = static_cast<uint32_t>(value);
    return true;
}

} // namespace ui
