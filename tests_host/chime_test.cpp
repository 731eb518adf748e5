/**
 * @file chime_test.cpp
 * @brief Unit tests for the chime tone generator and cue sequencer
 */

#include <algorithm>
#include <cstdlib>
#include <vector>

#include "chime/cue.hpp"
#include "chime/tone_generator.hpp"
#include "gtest/gtest.h"

namespace {

using chime::CueId;
using chime::CueSequencer;
using chime::ToneGenerator;
using chime::ToneSettings;

constexpr uint32_t kSampleRate = 16000;

ToneSettings TestSettings(uint8_t volume = 50) {
  ToneSettings settings;
  settings.sample_rate_hz = kSampleRate;
  settings.frequency_hz = 1000;
  settings.volume_percent = volume;
  settings.fade_in_ms = 2;
  settings.fade_out_ms = 4;
  return settings;
}

int PeakOf(const std::vector<int16_t>& buffer) {
  int peak = 0;
  for (int16_t sample : buffer) {
    peak = std::max(peak, std::abs(static_cast<int>(sample)));
  }
  return peak;
}

}  // namespace

TEST(ToneGeneratorTest, SilentUntilStarted) {
  ToneGenerator generator;
  generator.Configure(TestSettings());
  std::vector<int16_t> buffer(256 * 2, 123);
  generator.Fill(buffer.data(), 256);
  EXPECT_EQ(0, PeakOf(buffer));
  EXPECT_FALSE(generator.IsActive());
}

TEST(ToneGeneratorTest, PeakFollowsVolumeAndChannelsMatch) {
  ToneGenerator generator;
  generator.Configure(TestSettings(50));
  generator.Start();
  std::vector<int16_t> buffer(1600 * 2);
  generator.Fill(buffer.data(), 1600);

  const int peak = PeakOf(buffer);
  EXPECT_GT(peak, 15000);
  EXPECT_LE(peak, 16384);
  for (size_t i = 0; i < 1600; ++i) {
    ASSERT_EQ(buffer[i * 2], buffer[i * 2 + 1]) << "frame " << i;
  }
}

TEST(ToneGeneratorTest, FadeInStartsNearZero) {
  ToneGenerator generator;
  generator.Configure(TestSettings(100));
  generator.Start();
  std::vector<int16_t> buffer(4 * 2);
  generator.Fill(buffer.data(), 4);
  EXPECT_EQ(0, buffer[0]);
  EXPECT_LT(PeakOf(buffer), 3000);
}

TEST(ToneGeneratorTest, StopFadesOutToSilence) {
  ToneGenerator generator;
  generator.Configure(TestSettings());
  generator.Start();
  std::vector<int16_t> buffer(512 * 2);
  generator.Fill(buffer.data(), 512);
  generator.Stop();
  EXPECT_TRUE(generator.IsActive());

  // 4 ms fade-out at 16 kHz = 64 frames
  generator.Fill(buffer.data(), 128);
  EXPECT_FALSE(generator.IsActive());
  generator.Fill(buffer.data(), 256);
  EXPECT_EQ(0, PeakOf(buffer));
}

TEST(ToneGeneratorTest, VolumeIsClampedAndZeroFrequencyIgnored) {
  ToneGenerator generator;
  generator.Configure(TestSettings());
  generator.SetVolume(250);
  EXPECT_EQ(100, generator.Volume());
  generator.SetFrequency(0);
  EXPECT_EQ(1000, generator.Frequency());
  generator.SetFrequency(1319);
  EXPECT_EQ(1319, generator.Frequency());
}

TEST(CueTest, EachPhaseEndHasItsCue) {
  EXPECT_EQ(CueId::kFocusEnd, chime::CueForPhase(pomodoro::Phase::kFocus));
  EXPECT_EQ(CueId::kBreakEnd, chime::CueForPhase(pomodoro::Phase::kShortBreak));
  EXPECT_EQ(CueId::kBreakEnd, chime::CueForPhase(pomodoro::Phase::kLongBreak));
  EXPECT_STRNE(chime::CueName(CueId::kFocusEnd), chime::CueName(CueId::kBreakEnd));
}

TEST(CueTest, CuesAreShortAndAudible) {
  for (CueId id : {CueId::kFocusEnd, CueId::kBreakEnd}) {
    const chime::Cue& cue = chime::GetCue(id);
    ASSERT_GT(cue.note_count, 0u);
    ASSERT_LE(cue.note_count, chime::Cue::kMaxNotes);
    EXPECT_GT(chime::CueDurationMs(cue), 200u);
    EXPECT_LT(chime::CueDurationMs(cue), 2000u);
    for (size_t i = 0; i < cue.note_count; ++i) {
      EXPECT_GT(cue.notes[i].frequency_hz, 0);
    }
  }
}

TEST(CueSequencerTest, RendersExactCueLengthThenSilence) {
  ToneGenerator generator;
  ToneSettings settings = TestSettings();
  settings.fade_out_ms = 12;
  generator.Configure(settings);
  CueSequencer sequencer(&generator);

  const chime::Cue& cue = chime::GetCue(CueId::kFocusEnd);
  const size_t expected_frames = static_cast<size_t>(chime::CueDurationMs(cue)) * kSampleRate / 1000;

  sequencer.Begin(CueId::kFocusEnd);
  EXPECT_TRUE(sequencer.IsPlaying());

  std::vector<int16_t> buffer(256 * 2);
  size_t rendered = 0;
  int peak = 0;
  for (int chunk = 0; chunk < 1000 && sequencer.IsPlaying(); ++chunk) {
    rendered += sequencer.Render(buffer.data(), 256);
    peak = std::max(peak, PeakOf(buffer));
  }
  EXPECT_FALSE(sequencer.IsPlaying());
  EXPECT_EQ(expected_frames, rendered);
  EXPECT_GT(peak, 0);

  EXPECT_EQ(0u, sequencer.Render(buffer.data(), 256));
  EXPECT_EQ(0, PeakOf(buffer));
  EXPECT_FALSE(generator.IsActive());
}

TEST(CueSequencerTest, CancelStopsImmediately) {
  ToneGenerator generator;
  generator.Configure(TestSettings());
  CueSequencer sequencer(&generator);

  sequencer.Begin(CueId::kBreakEnd);
  std::vector<int16_t> buffer(256 * 2);
  EXPECT_EQ(256u, sequencer.Render(buffer.data(), 256));
  sequencer.Cancel();
  EXPECT_FALSE(sequencer.IsPlaying());
  EXPECT_EQ(0u, sequencer.Render(buffer.data(), 256));
}

TEST(CueSequencerTest, BeginRestartsFromFirstNote) {
  ToneGenerator generator;
  generator.Configure(TestSettings());
  CueSequencer sequencer(&generator);

  sequencer.Begin(CueId::kBreakEnd);
  std::vector<int16_t> buffer(256 * 2);
  sequencer.Render(buffer.data(), 256);
  sequencer.Begin(CueId::kFocusEnd);
  EXPECT_TRUE(sequencer.IsPlaying());
  EXPECT_EQ(chime::GetCue(CueId::kFocusEnd).notes[0].frequency_hz, generator.Frequency());
}
