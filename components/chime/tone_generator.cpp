#include "chime/tone_generator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace chime {

namespace {
constexpr float kTwoPi = 6.28318530717958647692f;
constexpr float kMaxSample = static_cast<float>(std::numeric_limits<int16_t>::max());

std::array<float, ToneGenerator::kLutSize> BuildSineLut() {
  std::array<float, ToneGenerator::kLutSize> table{};
  for (size_t i = 0; i < ToneGenerator::kLutSize; ++i) {
    table[i] = std::sin(kTwoPi * static_cast<float>(i) / static_cast<float>(ToneGenerator::kLutSize));
  }
  return table;
}

int16_t Saturate(float value) {
  const float clamped = std::clamp(value, -kMaxSample - 1.0f, kMaxSample);
  return static_cast<int16_t>(clamped);
}
}  // namespace

const std::array<float, ToneGenerator::kLutSize> ToneGenerator::kSineLut = BuildSineLut();

void ToneGenerator::Configure(const ToneSettings& settings) {
  settings_ = settings;
  if (settings_.sample_rate_hz == 0) {
    settings_.sample_rate_hz = 1;
  }
  state_ = State::kSilent;
  pending_stop_ = false;
  fade_position_ = 0;
  phase_ = 0.0f;
  fade_in_samples_ = MillisecondsToSamples(settings_.fade_in_ms);
  fade_out_samples_ = MillisecondsToSamples(settings_.fade_out_ms);
  SetVolume(settings_.volume_percent);
  UpdatePhaseStep();
}

void ToneGenerator::Start() {
  pending_stop_ = false;
  switch (state_) {
    case State::kSilent:
      phase_ = 0.0f;
      fade_position_ = 0;
      state_ = State::kFadeIn;
      break;
    case State::kFadeOut: {
      // Continue from the current gain instead of restarting at zero
      const float gain = 1.0f - static_cast<float>(fade_position_) / static_cast<float>(fade_out_samples_);
      fade_position_ = static_cast<size_t>(gain * static_cast<float>(fade_in_samples_));
      state_ = State::kFadeIn;
      break;
    }
    case State::kFadeIn:
    case State::kPlaying:
      break;
  }
}

void ToneGenerator::Stop() {
  if (state_ == State::kSilent || state_ == State::kFadeOut) {
    return;
  }
  pending_stop_ = true;
}

void ToneGenerator::SetFrequency(uint16_t frequency_hz) {
  if (frequency_hz == 0) {
    return;
  }
  settings_.frequency_hz = frequency_hz;
  UpdatePhaseStep();
}

void ToneGenerator::SetVolume(uint8_t percent) {
  settings_.volume_percent = std::min<uint8_t>(percent, 100);
  amplitude_ = kMaxSample * static_cast<float>(settings_.volume_percent) / 100.0f;
}

void ToneGenerator::Fill(int16_t* stereo_buffer, size_t frames) {
  if (stereo_buffer == nullptr) {
    return;
  }
  for (size_t idx = 0; idx < frames; ++idx) {
    const float gain = NextGain();
    int16_t value = 0;
    if (gain > 0.0f) {
      value = Saturate(SampleFromLut(phase_) * amplitude_ * gain);
      phase_ += phase_step_;
      if (phase_ >= static_cast<float>(kLutSize)) {
        phase_ -= static_cast<float>(kLutSize);
      }
    }
    stereo_buffer[idx * 2] = value;
    stereo_buffer[idx * 2 + 1] = value;
  }
}

float ToneGenerator::NextGain() {
  switch (state_) {
    case State::kSilent:
      return 0.0f;

    case State::kFadeIn:
      if (pending_stop_) {
        // Mirror the fade-in position onto the fade-out ramp
        const float gain = static_cast<float>(fade_position_) / static_cast<float>(fade_in_samples_);
        fade_position_ = static_cast<size_t>((1.0f - gain) * static_cast<float>(fade_out_samples_));
        pending_stop_ = false;
        state_ = State::kFadeOut;
        return NextGain();
      }
      if (fade_position_ >= fade_in_samples_) {
        state_ = State::kPlaying;
        fade_position_ = 0;
        return 1.0f;
      }
      return static_cast<float>(fade_position_++) / static_cast<float>(fade_in_samples_);

    case State::kPlaying:
      if (pending_stop_) {
        pending_stop_ = false;
        fade_position_ = 0;
        state_ = State::kFadeOut;
      }
      return 1.0f;

    case State::kFadeOut:
      if (fade_position_ >= fade_out_samples_) {
        state_ = State::kSilent;
        fade_position_ = 0;
        return 0.0f;
      }
      return 1.0f - static_cast<float>(fade_position_++) / static_cast<float>(fade_out_samples_);
  }
  return 0.0f;
}

void ToneGenerator::UpdatePhaseStep() {
  phase_step_ = static_cast<float>(settings_.frequency_hz) * static_cast<float>(kLutSize) /
                static_cast<float>(settings_.sample_rate_hz);
}

size_t ToneGenerator::MillisecondsToSamples(uint16_t duration_ms) const {
  const uint64_t samples = (static_cast<uint64_t>(settings_.sample_rate_hz) * duration_ms) / 1000ULL;
  return static_cast<size_t>(samples == 0ULL ? 1ULL : samples);
}

float ToneGenerator::SampleFromLut(float phase_index) const {
  const float wrapped = std::fmod(phase_index, static_cast<float>(kLutSize));
  const size_t index = static_cast<size_t>(wrapped) % kLutSize;
  const size_t next_index = (index + 1U) % kLutSize;
  const float frac = wrapped - static_cast<float>(index);
  return kSineLut[index] + (kSineLut[next_index] - kSineLut[index]) * frac;
}

}  // namespace chime
