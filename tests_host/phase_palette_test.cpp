#include "indicator/phase_palette.hpp"

#include "gtest/gtest.h"

namespace {

using indicator::PhaseColor;
using indicator::Rgb;
using pomodoro::Phase;

void ExpectColor(const Rgb& expected, const Rgb& actual) {
  EXPECT_EQ(expected.r, actual.r);
  EXPECT_EQ(expected.g, actual.g);
  EXPECT_EQ(expected.b, actual.b);
}

}  // namespace

TEST(PhasePaletteTest, IdleIsAlwaysOff) {
  ExpectColor(indicator::kOff, PhaseColor(Phase::kIdle, false, false));
  ExpectColor(indicator::kOff, PhaseColor(Phase::kIdle, true, true));
}

TEST(PhasePaletteTest, RunningPhasesUseFullColour) {
  ExpectColor(indicator::kFocusColor, PhaseColor(Phase::kFocus, true, false));
  ExpectColor(indicator::kShortBreakColor, PhaseColor(Phase::kShortBreak, true, false));
  ExpectColor(indicator::kLongBreakColor, PhaseColor(Phase::kLongBreak, true, false));
}

TEST(PhasePaletteTest, PhasesAreDistinguishable) {
  const Rgb focus = PhaseColor(Phase::kFocus, true, false);
  const Rgb short_break = PhaseColor(Phase::kShortBreak, true, false);
  const Rgb long_break = PhaseColor(Phase::kLongBreak, true, false);
  EXPECT_TRUE(focus != short_break);
  EXPECT_TRUE(focus != long_break);
  EXPECT_TRUE(short_break != long_break);
}

TEST(PhasePaletteTest, PausedIsHalfBrightness) {
  const Rgb paused = PhaseColor(Phase::kFocus, false, false);
  EXPECT_EQ(indicator::kFocusColor.r / 2, paused.r);
  EXPECT_EQ(indicator::kFocusColor.g / 2, paused.g);
  EXPECT_EQ(indicator::kFocusColor.b / 2, paused.b);
}

TEST(PhasePaletteTest, DarkModeDimsAndStacksWithPause) {
  const Rgb dark = PhaseColor(Phase::kLongBreak, true, true);
  EXPECT_EQ(indicator::kLongBreakColor.r >> 3, dark.r);
  EXPECT_EQ(indicator::kLongBreakColor.b >> 3, dark.b);

  const Rgb dark_paused = PhaseColor(Phase::kLongBreak, false, true);
  EXPECT_EQ(indicator::kLongBreakColor.b >> 4, dark_paused.b);
  EXPECT_GT(dark_paused.b, 0);
}
