#include "indicator/phase_palette.hpp"

namespace indicator {

namespace {
Rgb Dim(Rgb color, uint8_t shift) {
  return Rgb{static_cast<uint8_t>(color.r >> shift), static_cast<uint8_t>(color.g >> shift),
             static_cast<uint8_t>(color.b >> shift)};
}
}  // namespace

Rgb PhaseColor(pomodoro::Phase phase, bool running, bool dark_mode) {
  Rgb color = kOff;
  switch (phase) {
    case pomodoro::Phase::kIdle:
      return kOff;
    case pomodoro::Phase::kFocus:
      color = kFocusColor;
      break;
    case pomodoro::Phase::kShortBreak:
      color = kShortBreakColor;
      break;
    case pomodoro::Phase::kLongBreak:
      color = kLongBreakColor;
      break;
  }
  if (!running) {
    color = Dim(color, kPausedShift);
  }
  if (dark_mode) {
    color = Dim(color, kDarkModeShift);
  }
  return color;
}

}  // namespace indicator
