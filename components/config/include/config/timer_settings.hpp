#pragma once

/**
 * @file timer_settings.hpp
 * @brief User-editable timer settings and the persisted record layout
 *
 * TimerSettings is the configuration boundary: values arrive from the console
 * or from NVS in minutes and are validated here before anything reaches the
 * pomodoro::TimerStateMachine. Range metadata lives in kSettingRanges so the
 * console help, the validator and the record codec agree on the limits.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pomodoro/timer_state_machine.hpp"
#include "tasks/task_ledger.hpp"

extern "C" {
#include "esp_err.h"
}

namespace config {

constexpr uint32_t kTicksPerMinute = 60;

struct TimerSettings {
  uint32_t focus_minutes = 25;
  uint32_t short_break_minutes = 5;
  uint32_t long_break_minutes = 15;
  uint32_t long_break_interval = 4;
  bool auto_continue = false;
  bool dark_mode = false;
};

enum class SettingField : uint8_t {
  kFocus = 0,
  kShortBreak,
  kLongBreak,
  kLongBreakInterval,
};

struct SettingRange {
  SettingField field;
  const char* name;       // Console / JSON-facing name
  const char* unit;
  uint32_t min_value;
  uint32_t max_value;
  uint32_t default_value;
};

inline constexpr SettingRange kSettingRanges[] = {
    {SettingField::kFocus, "focus", "min", 1, 180, 25},
    {SettingField::kShortBreak, "short", "min", 1, 60, 5},
    {SettingField::kLongBreak, "long", "min", 1, 120, 15},
    {SettingField::kLongBreakInterval, "interval", "sessions", 1, 12, 4},
};

const SettingRange& RangeFor(SettingField field);
const SettingRange* FindSettingRange(const char* name);

uint32_t GetSetting(const TimerSettings& settings, SettingField field);
void SetSetting(TimerSettings& settings, SettingField field, uint32_t value);

/**
 * @brief Validate all numeric fields against kSettingRanges.
 *
 * @param settings Candidate settings
 * @param error Optional human-readable reason (names the offending field)
 * @return ESP_OK or ESP_ERR_INVALID_ARG
 */
esp_err_t ValidateTimerSettings(const TimerSettings& settings, std::string* error = nullptr);

/**
 * @brief Convert minutes to state machine ticks (60 ticks per minute).
 */
pomodoro::TimerConfig ToTimerConfig(const TimerSettings& settings);

/**
 * @brief Everything that survives a reboot.
 *
 * Tasks are kept in display order. The active-task association is
 * session-only and is not part of the record.
 */
struct PersistedRecord {
  static constexpr uint32_t kCurrentVersion = 1;

  uint32_t version = kCurrentVersion;
  TimerSettings settings{};
  std::vector<tasks::Task> tasks;
  uint32_t next_task_id = tasks::kFirstTaskId;
};

}  // namespace config
