#pragma once

/**
 * @file timer_state_machine.hpp
 * @brief Pomodoro phase state machine (Idle / Focus / ShortBreak / LongBreak)
 *
 * Pure logic, no hardware access. The owner drives it with Tick() once per
 * tick unit (one second on the device) and with the manual controls below.
 * Phase completions are returned to the caller as PhaseEvent values instead of
 * being pushed through callbacks, so the caller decides what to do with them
 * (credit the active task, play the chime, update the LED).
 *
 * STATE DIAGRAM:
 * ```
 *            Start()                 remaining == 0 / Skip()
 *   kIdle ───────────► kFocus ─────────────────────────────┐
 *     ▲                 ▲  │ sessions < interval          │ sessions == interval
 *     │ Reset()         │  ▼                              ▼
 *     └──── (any) ◄──── │ kShortBreak                kLongBreak (sessions := 0)
 *                       └──────── remaining == 0 / Skip() ─┘
 * ```
 *
 * INVARIANTS:
 * - remaining_ticks() is always within [0, PhaseDuration(phase())]
 * - the session counter is cleared when a long break begins
 * - ticks in kIdle or while paused are ignored
 */

#include <cstdint>
#include <optional>

extern "C" {
#include "esp_err.h"
}

namespace pomodoro {

enum class Phase : uint8_t {
  kIdle = 0,
  kFocus = 1,
  kShortBreak = 2,
  kLongBreak = 3,
};

struct TimerConfig {
  uint32_t focus_ticks = 25 * 60;
  uint32_t short_break_ticks = 5 * 60;
  uint32_t long_break_ticks = 15 * 60;
  uint32_t long_break_interval = 4;  // Focus sessions before a long break
  bool auto_continue = false;        // false: next phase waits for Start()
};

struct PhaseEvent {
  Phase ended = Phase::kIdle;
  Phase next = Phase::kIdle;
  uint32_t sessions_completed = 0;  // Session counter after the transition
  bool skipped = false;             // true when forced by Skip()
};

struct TimerSnapshot {
  Phase phase = Phase::kIdle;
  bool running = false;
  uint32_t remaining_ticks = 0;
  uint32_t phase_ticks = 0;
  uint32_t sessions_completed = 0;
};

const char* PhaseName(Phase phase);

/**
 * @brief Check a TimerConfig before it reaches the state machine.
 * @return ESP_OK or ESP_ERR_INVALID_ARG (zero duration or zero interval)
 */
esp_err_t ValidateTimerConfig(const TimerConfig& config);

class TimerStateMachine {
 public:
  TimerStateMachine() = default;

  /**
   * @brief Install a new configuration.
   *
   * Returns to kIdle and clears the session counter. An invalid configuration
   * is rejected and the current one stays active.
   */
  esp_err_t Configure(const TimerConfig& config);

  /**
   * @brief Start a Focus phase from kIdle, or resume a paused phase.
   * @return ESP_ERR_INVALID_STATE if already running
   */
  esp_err_t Start();

  esp_err_t Pause();
  esp_err_t Resume();

  /**
   * @brief Advance by one tick unit.
   * @return PhaseEvent when this tick completed the current phase
   */
  std::optional<PhaseEvent> Tick();

  /**
   * @brief Complete the current phase immediately.
   * @return PhaseEvent, or nullopt when idle
   */
  std::optional<PhaseEvent> Skip();

  // Back to kIdle with nothing remaining. The session counter is kept.
  void Reset();

  /**
   * @brief Switch to a phase explicitly (mode buttons).
   *
   * The phase is entered paused with its full duration. Selecting kFocus
   * starts a new cycle (session counter cleared); selecting kIdle is Reset().
   */
  void SelectPhase(Phase phase);

  Phase phase() const { return phase_; }
  bool running() const { return running_; }
  uint32_t remaining_ticks() const { return remaining_ticks_; }
  uint32_t sessions_completed() const { return sessions_completed_; }
  const TimerConfig& config() const { return config_; }

  uint32_t PhaseDuration(Phase phase) const;
  TimerSnapshot Snapshot() const;

 private:
  PhaseEvent CompletePhase(bool skipped);
  void EnterPhase(Phase phase, bool running);

  TimerConfig config_{};
  Phase phase_ = Phase::kIdle;
  bool running_ = false;
  uint32_t remaining_ticks_ = 0;
  uint32_t sessions_completed_ = 0;
};

}  // namespace pomodoro
