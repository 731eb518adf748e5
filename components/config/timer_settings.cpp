#include "config/timer_settings.hpp"

#include <cstdio>
#include <cstring>

extern "C" {
#include "esp_log.h"
}

namespace config {

namespace {
constexpr char kLogTag[] = "settings";
}  // namespace

const SettingRange& RangeFor(SettingField field) {
  for (const SettingRange& range : kSettingRanges) {
    if (range.field == field) {
      return range;
    }
  }
  return kSettingRanges[0];
}

const SettingRange* FindSettingRange(const char* name) {
  if (name == nullptr) {
    return nullptr;
  }
  for (const SettingRange& range : kSettingRanges) {
    if (std::strcmp(range.name, name) == 0) {
      return &range;
    }
  }
  return nullptr;
}

uint32_t GetSetting(const TimerSettings& settings, SettingField field) {
  switch (field) {
    case SettingField::kFocus:
      return settings.focus_minutes;
    case SettingField::kShortBreak:
      return settings.short_break_minutes;
    case SettingField::kLongBreak:
      return settings.long_break_minutes;
    case SettingField::kLongBreakInterval:
      return settings.long_break_interval;
  }
  return 0;
}

void SetSetting(TimerSettings& settings, SettingField field, uint32_t value) {
  switch (field) {
    case SettingField::kFocus:
      settings.focus_minutes = value;
      break;
    case SettingField::kShortBreak:
      settings.short_break_minutes = value;
      break;
    case SettingField::kLongBreak:
      settings.long_break_minutes = value;
      break;
    case SettingField::kLongBreakInterval:
      settings.long_break_interval = value;
      break;
  }
}

esp_err_t ValidateTimerSettings(const TimerSettings& settings, std::string* error) {
  for (const SettingRange& range : kSettingRanges) {
    const uint32_t value = GetSetting(settings, range.field);
    if (value < range.min_value || value > range.max_value) {
      char message[96];
      std::snprintf(message, sizeof(message), "%s must be %lu..%lu %s (got %lu)", range.name,
                    static_cast<unsigned long>(range.min_value),
                    static_cast<unsigned long>(range.max_value), range.unit,
                    static_cast<unsigned long>(value));
      ESP_LOGW(kLogTag, "Invalid settings: %s", message);
      if (error != nullptr) {
        *error = message;
      }
      return ESP_ERR_INVALID_ARG;
    }
  }
  return ESP_OK;
}

pomodoro::TimerConfig ToTimerConfig(const TimerSettings& settings) {
  pomodoro::TimerConfig timer_config;
  timer_config.focus_ticks = settings.focus_minutes * kTicksPerMinute;
  timer_config.short_break_ticks = settings.short_break_minutes * kTicksPerMinute;
  timer_config.long_break_ticks = settings.long_break_minutes * kTicksPerMinute;
  timer_config.long_break_interval = settings.long_break_interval;
  timer_config.auto_continue = settings.auto_continue;
  return timer_config;
}

}  // namespace config
