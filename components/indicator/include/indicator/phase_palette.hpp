#pragma once

#include <cstdint>

#include "pomodoro/timer_state_machine.hpp"

namespace indicator {

struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==(const Rgb& other) const { return r == other.r && g == other.g && b == other.b; }
  bool operator!=(const Rgb& other) const { return !(*this == other); }
};

// Phase colours (same hues as the desktop theme)
inline constexpr Rgb kFocusColor{0xD1, 0x5A, 0x51};
inline constexpr Rgb kShortBreakColor{0x51, 0xA4, 0x99};
inline constexpr Rgb kLongBreakColor{0x46, 0x82, 0xB4};
inline constexpr Rgb kOff{0, 0, 0};

constexpr uint8_t kDarkModeShift = 3;  // Dark mode: 1/8 brightness
constexpr uint8_t kPausedShift = 1;    // Paused: 1/2 brightness

/**
 * @brief LED colour for the current timer state.
 *
 * Idle is off. A paused phase is shown at half brightness and dark mode dims
 * everything to 1/8 (both apply together).
 */
Rgb PhaseColor(pomodoro::Phase phase, bool running, bool dark_mode);

}  // namespace indicator
