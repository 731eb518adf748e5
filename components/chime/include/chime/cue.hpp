#pragma once

/**
 * @file cue.hpp
 * @brief Phase-transition chimes and the sequencer that renders them
 *
 * A Cue is a short list of notes. CueSequencer turns a cue into audio frames
 * by driving a ToneGenerator note by note; it is pure computation so the
 * timing can be checked on the host without I2S hardware.
 *
 * CUES:
 * - kFocusEnd: two rising notes ("time for a break")
 * - kBreakEnd: three short equal notes ("back to work")
 */

#include <array>
#include <cstddef>
#include <cstdint>

#include "chime/tone_generator.hpp"
#include "pomodoro/timer_state_machine.hpp"

namespace chime {

enum class CueId : uint8_t {
  kFocusEnd = 0,
  kBreakEnd = 1,
};

struct Note {
  uint16_t frequency_hz;
  uint16_t duration_ms;  // Tone on, fade-in included
  uint16_t gap_ms;       // Silence after the note (fade-out runs inside the gap)
};

struct Cue {
  static constexpr size_t kMaxNotes = 4;

  const char* name;
  std::array<Note, kMaxNotes> notes;
  size_t note_count;
};

const Cue& GetCue(CueId id);
const char* CueName(CueId id);

/**
 * @brief Map an ended phase to the cue that announces it.
 *
 * Focus end uses kFocusEnd; either break end uses kBreakEnd.
 */
CueId CueForPhase(pomodoro::Phase ended);

/**
 * @brief Total cue length in milliseconds (notes plus gaps).
 */
uint32_t CueDurationMs(const Cue& cue);

class CueSequencer {
 public:
  explicit CueSequencer(ToneGenerator* generator);

  // Restart with a new cue (a cue already playing is cut at its next sample)
  void Begin(CueId id);
  void Cancel();
  bool IsPlaying() const { return cue_ != nullptr; }

  /**
   * @brief Render the next frames of the cue.
   *
   * Always fills @p frames frames; silence after the cue has ended.
   *
   * @return Frames that belonged to the cue (0 once finished)
   */
  size_t Render(int16_t* stereo_buffer, size_t frames);

 private:
  void EnterNote(size_t index);
  size_t MsToFrames(uint16_t ms) const;

  ToneGenerator* generator_;
  const Cue* cue_ = nullptr;
  size_t note_index_ = 0;
  size_t tone_frames_left_ = 0;
  size_t gap_frames_left_ = 0;
};

}  // namespace chime
