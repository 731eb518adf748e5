/**
 * @file timer_settings_test.cpp
 * @brief Unit tests for config::TimerSettings validation and conversion
 */

#include <string>

#include "config/timer_settings.hpp"
#include "gtest/gtest.h"

using config::SettingField;
using config::TimerSettings;

TEST(TimerSettingsTest, DefaultsAreValidAndMatchRangeTable) {
  const TimerSettings settings;
  EXPECT_EQ(ESP_OK, config::ValidateTimerSettings(settings));
  for (const config::SettingRange& range : config::kSettingRanges) {
    EXPECT_EQ(range.default_value, config::GetSetting(settings, range.field)) << range.name;
  }
  EXPECT_FALSE(settings.auto_continue);
  EXPECT_FALSE(settings.dark_mode);
}

TEST(TimerSettingsTest, FindSettingRangeByName) {
  const config::SettingRange* range = config::FindSettingRange("interval");
  ASSERT_NE(nullptr, range);
  EXPECT_EQ(SettingField::kLongBreakInterval, range->field);
  EXPECT_EQ(nullptr, config::FindSettingRange("volume"));
  EXPECT_EQ(nullptr, config::FindSettingRange(nullptr));
  EXPECT_STREQ("short", config::RangeFor(SettingField::kShortBreak).name);
}

TEST(TimerSettingsTest, SetAndGetRoundTripEveryField) {
  TimerSettings settings;
  uint32_t value = 2;
  for (const config::SettingRange& range : config::kSettingRanges) {
    config::SetSetting(settings, range.field, value);
    EXPECT_EQ(value, config::GetSetting(settings, range.field));
    ++value;
  }
  EXPECT_EQ(2u, settings.focus_minutes);
  EXPECT_EQ(5u, settings.long_break_interval);
}

TEST(TimerSettingsTest, ValidateRejectsZeroAndNamesField) {
  TimerSettings settings;
  settings.short_break_minutes = 0;
  std::string error;
  EXPECT_EQ(ESP_ERR_INVALID_ARG, config::ValidateTimerSettings(settings, &error));
  EXPECT_NE(std::string::npos, error.find("short"));
}

TEST(TimerSettingsTest, ValidateRejectsAboveMaximum) {
  TimerSettings settings;
  settings.long_break_interval = config::RangeFor(SettingField::kLongBreakInterval).max_value + 1;
  EXPECT_EQ(ESP_ERR_INVALID_ARG, config::ValidateTimerSettings(settings));

  settings.long_break_interval = config::RangeFor(SettingField::kLongBreakInterval).max_value;
  EXPECT_EQ(ESP_OK, config::ValidateTimerSettings(settings));
}

TEST(TimerSettingsTest, ToTimerConfigConvertsMinutesToTicks) {
  TimerSettings settings;
  settings.focus_minutes = 50;
  settings.short_break_minutes = 10;
  settings.long_break_minutes = 30;
  settings.long_break_interval = 3;
  settings.auto_continue = true;

  const pomodoro::TimerConfig timer_config = config::ToTimerConfig(settings);
  EXPECT_EQ(3000u, timer_config.focus_ticks);
  EXPECT_EQ(600u, timer_config.short_break_ticks);
  EXPECT_EQ(1800u, timer_config.long_break_ticks);
  EXPECT_EQ(3u, timer_config.long_break_interval);
  EXPECT_TRUE(timer_config.auto_continue);
}
