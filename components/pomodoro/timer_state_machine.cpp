#include "pomodoro/timer_state_machine.hpp"

extern "C" {
#include "esp_log.h"
}

namespace pomodoro {

namespace {
constexpr char kLogTag[] = "timer_fsm";
}  // namespace

const char* PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kIdle:
      return "idle";
    case Phase::kFocus:
      return "focus";
    case Phase::kShortBreak:
      return "short break";
    case Phase::kLongBreak:
      return "long break";
  }
  return "unknown";
}

esp_err_t ValidateTimerConfig(const TimerConfig& config) {
  if (config.focus_ticks == 0 || config.short_break_ticks == 0 ||
      config.long_break_ticks == 0) {
    ESP_LOGE(kLogTag, "Invalid config: phase durations must be > 0 (focus=%lu short=%lu long=%lu)",
             static_cast<unsigned long>(config.focus_ticks),
             static_cast<unsigned long>(config.short_break_ticks),
             static_cast<unsigned long>(config.long_break_ticks));
    return ESP_ERR_INVALID_ARG;
  }
  if (config.long_break_interval == 0) {
    ESP_LOGE(kLogTag, "Invalid config: long_break_interval must be > 0");
    return ESP_ERR_INVALID_ARG;
  }
  return ESP_OK;
}

esp_err_t TimerStateMachine::Configure(const TimerConfig& config) {
  const esp_err_t err = ValidateTimerConfig(config);
  if (err != ESP_OK) {
    return err;
  }
  config_ = config;
  sessions_completed_ = 0;
  EnterPhase(Phase::kIdle, false);
  ESP_LOGI(kLogTag, "Configured: focus=%lus short=%lus long=%lus interval=%lu auto=%d",
           static_cast<unsigned long>(config_.focus_ticks),
           static_cast<unsigned long>(config_.short_break_ticks),
           static_cast<unsigned long>(config_.long_break_ticks),
           static_cast<unsigned long>(config_.long_break_interval),
           config_.auto_continue);
  return ESP_OK;
}

esp_err_t TimerStateMachine::Start() {
  if (phase_ == Phase::kIdle) {
    EnterPhase(Phase::kFocus, true);
    ESP_LOGI(kLogTag, "Focus started (%lu ticks)", static_cast<unsigned long>(remaining_ticks_));
    return ESP_OK;
  }
  if (running_) {
    return ESP_ERR_INVALID_STATE;
  }
  return Resume();
}

esp_err_t TimerStateMachine::Pause() {
  if (phase_ == Phase::kIdle || !running_) {
    return ESP_ERR_INVALID_STATE;
  }
  running_ = false;
  ESP_LOGI(kLogTag, "Paused %s with %lu ticks left", PhaseName(phase_),
           static_cast<unsigned long>(remaining_ticks_));
  return ESP_OK;
}

esp_err_t TimerStateMachine::Resume() {
  if (phase_ == Phase::kIdle || running_) {
    return ESP_ERR_INVALID_STATE;
  }
  running_ = true;
  ESP_LOGI(kLogTag, "Resumed %s", PhaseName(phase_));
  return ESP_OK;
}

std::optional<PhaseEvent> TimerStateMachine::Tick() {
  if (phase_ == Phase::kIdle || !running_) {
    return std::nullopt;
  }
  if (remaining_ticks_ > 0) {
    --remaining_ticks_;
  }
  if (remaining_ticks_ == 0) {
    return CompletePhase(false);
  }
  return std::nullopt;
}

std::optional<PhaseEvent> TimerStateMachine::Skip() {
  if (phase_ == Phase::kIdle) {
    return std::nullopt;
  }
  return CompletePhase(true);
}

void TimerStateMachine::Reset() {
  EnterPhase(Phase::kIdle, false);
  ESP_LOGI(kLogTag, "Reset (sessions=%lu)", static_cast<unsigned long>(sessions_completed_));
}

void TimerStateMachine::SelectPhase(Phase phase) {
  if (phase == Phase::kIdle) {
    Reset();
    return;
  }
  if (phase == Phase::kFocus) {
    sessions_completed_ = 0;
  }
  EnterPhase(phase, false);
  ESP_LOGI(kLogTag, "Selected %s", PhaseName(phase));
}

uint32_t TimerStateMachine::PhaseDuration(Phase phase) const {
  switch (phase) {
    case Phase::kFocus:
      return config_.focus_ticks;
    case Phase::kShortBreak:
      return config_.short_break_ticks;
    case Phase::kLongBreak:
      return config_.long_break_ticks;
    case Phase::kIdle:
      break;
  }
  return 0;
}

TimerSnapshot TimerStateMachine::Snapshot() const {
  TimerSnapshot snapshot;
  snapshot.phase = phase_;
  snapshot.running = running_;
  snapshot.remaining_ticks = remaining_ticks_;
  snapshot.phase_ticks = PhaseDuration(phase_);
  snapshot.sessions_completed = sessions_completed_;
  return snapshot;
}

PhaseEvent TimerStateMachine::CompletePhase(bool skipped) {
  PhaseEvent event;
  event.ended = phase_;
  event.skipped = skipped;

  if (phase_ == Phase::kFocus) {
    ++sessions_completed_;
    if (sessions_completed_ >= config_.long_break_interval) {
      sessions_completed_ = 0;
      event.next = Phase::kLongBreak;
    } else {
      event.next = Phase::kShortBreak;
    }
  } else {
    event.next = Phase::kFocus;
  }
  event.sessions_completed = sessions_completed_;

  EnterPhase(event.next, config_.auto_continue);
  ESP_LOGI(kLogTag, "%s complete%s -> %s (sessions=%lu)", PhaseName(event.ended),
           skipped ? " (skipped)" : "", PhaseName(event.next),
           static_cast<unsigned long>(sessions_completed_));
  return event;
}

void TimerStateMachine::EnterPhase(Phase phase, bool running) {
  phase_ = phase;
  running_ = (phase != Phase::kIdle) && running;
  remaining_ticks_ = PhaseDuration(phase);
}

}  // namespace pomodoro
