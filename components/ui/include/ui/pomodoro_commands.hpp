/**
 * @file pomodoro_commands.hpp
 * @brief Console commands for the timer, the task ledger and the settings
 *
 * Every command is a thin translation from console words to one
 * app::PomodoroContext call. Results and errors are printed on the console;
 * a failed NVS write is reported as a warning after the command output.
 *
 * Timer:    start, pause, resume, toggle, reset, skip, mode, status
 * Tasks:    task list|add|edit|est|del|move|use|none|done
 * Settings: set, show, theme, save
 * System:   reboot
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "app/pomodoro_context.hpp"

namespace ui {

class SerialConsole;

/**
 * Side effects the console cannot perform by itself.
 */
struct CommandHooks {
    std::function<void(const app::PhaseNotice&)> on_phase_notice;  ///< "skip" ended a phase
    std::function<void()> on_reboot;                                ///< "reboot confirm"
};

/**
 * @brief Register all timer/task/settings commands on @p console.
 *
 * @p console and @p context must outlive the registered handlers.
 */
void RegisterPomodoroCommands(SerialConsole* console, app::PomodoroContext* context, CommandHooks hooks);

/**
 * @brief Format a tick count (seconds) as "MM:SS".
 */
std::string FormatClock(uint32_t ticks);

/**
 * @brief Parse a decimal unsigned integer (no sign, no trailing characters).
 */
bool ParseUint(const std::string& text, uint32_t* out);

} // namespace ui
