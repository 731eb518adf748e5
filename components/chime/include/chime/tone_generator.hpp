#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace chime {

struct ToneSettings {
  uint32_t sample_rate_hz = 16000;
  uint16_t frequency_hz = 880;
  uint8_t volume_percent = 10;
  uint16_t fade_in_ms = 4;
  uint16_t fade_out_ms = 12;
};

/**
 * @brief Sine tone with linear fade-in / fade-out envelope.
 *
 * Output is interleaved stereo int16 (same sample on both channels). Start()
 * and Stop() never cut the waveform: Stop() schedules a fade-out that Fill()
 * runs to silence, which keeps note boundaries free of clicks.
 *
 * Not thread-safe; owned by the chime task.
 */
class ToneGenerator {
 public:
  static constexpr size_t kLutSize = 1024;

  ToneGenerator() = default;

  void Configure(const ToneSettings& settings);
  void Start();
  void Stop();
  bool IsActive() const { return state_ != State::kSilent; }

  void SetFrequency(uint16_t frequency_hz);
  uint16_t Frequency() const { return settings_.frequency_hz; }

  void SetVolume(uint8_t percent);
  uint8_t Volume() const { return settings_.volume_percent; }

  uint32_t SampleRate() const { return settings_.sample_rate_hz; }

  void Fill(int16_t* stereo_buffer, size_t frames);

 private:
  enum class State {
    kSilent = 0,
    kFadeIn,
    kPlaying,
    kFadeOut,
  };

  float NextGain();
  void UpdatePhaseStep();
  size_t MillisecondsToSamples(uint16_t duration_ms) const;
  float SampleFromLut(float phase_index) const;

  ToneSettings settings_{};
  State state_ = State::kSilent;
  bool pending_stop_ = false;

  size_t fade_in_samples_ = 1;
  size_t fade_out_samples_ = 1;
  size_t fade_position_ = 0;

  float phase_ = 0.0f;
  float phase_step_ = 0.0f;
  float amplitude_ = 0.0f;

  static const std::array<float, kLutSize> kSineLut;
};

}  // namespace chime
