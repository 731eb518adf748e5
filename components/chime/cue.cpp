#include "chime/cue.hpp"

#include <algorithm>

namespace chime {

namespace {

// C6 -> E6 rising pair
constexpr Cue kFocusEndCue = {
    "focus_end",
    {{{1047, 180, 60}, {1319, 260, 120}, {0, 0, 0}, {0, 0, 0}}},
    2,
};

// Three short A5 beeps
constexpr Cue kBreakEndCue = {
    "break_end",
    {{{880, 110, 90}, {880, 110, 90}, {880, 110, 120}, {0, 0, 0}}},
    3,
};

}  // namespace

const Cue& GetCue(CueId id) {
  switch (id) {
    case CueId::kFocusEnd:
      return kFocusEndCue;
    case CueId::kBreakEnd:
      return kBreakEndCue;
  }
  return kBreakEndCue;
}

const char* CueName(CueId id) {
  return GetCue(id).name;
}

CueId CueForPhase(pomodoro::Phase ended) {
  return ended == pomodoro::Phase::kFocus ? CueId::kFocusEnd : CueId::kBreakEnd;
}

uint32_t CueDurationMs(const Cue& cue) {
  uint32_t total = 0;
  for (size_t i = 0; i < cue.note_count; ++i) {
    total += cue.notes[i].duration_ms + cue.notes[i].gap_ms;
  }
  return total;
}

CueSequencer::CueSequencer(ToneGenerator* generator) : generator_(generator) {}

void CueSequencer::Begin(CueId id) {
  cue_ = &GetCue(id);
  EnterNote(0);
}

void CueSequencer::Cancel() {
  cue_ = nullptr;
  tone_frames_left_ = 0;
  gap_frames_left_ = 0;
  generator_->Stop();
}

size_t CueSequencer::Render(int16_t* stereo_buffer, size_t frames) {
  size_t cue_frames = 0;
  size_t offset = 0;
  while (offset < frames) {
    if (cue_ == nullptr) {
      // Let a trailing fade-out finish, then silence
      generator_->Fill(stereo_buffer + offset * 2, frames - offset);
      break;
    }

    size_t chunk = frames - offset;
    if (tone_frames_left_ > 0) {
      chunk = std::min(chunk, tone_frames_left_);
      generator_->Fill(stereo_buffer + offset * 2, chunk);
      tone_frames_left_ -= chunk;
      if (tone_frames_left_ == 0) {
        generator_->Stop();
      }
    } else if (gap_frames_left_ > 0) {
      chunk = std::min(chunk, gap_frames_left_);
      generator_->Fill(stereo_buffer + offset * 2, chunk);
      gap_frames_left_ -= chunk;
    } else {
      EnterNote(note_index_ + 1);
      continue;
    }

    offset += chunk;
    cue_frames += chunk;
  }
  return cue_frames;
}

void CueSequencer::EnterNote(size_t index) {
  if (cue_ == nullptr || index >= cue_->note_count) {
    cue_ = nullptr;
    return;
  }
  const Note& note = cue_->notes[index];
  note_index_ = index;
  tone_frames_left_ = MsToFrames(note.duration_ms);
  gap_frames_left_ = MsToFrames(note.gap_ms);
  generator_->SetFrequency(note.frequency_hz);
  generator_->Start();
}

size_t CueSequencer::MsToFrames(uint16_t ms) const {
  return static_cast<size_t>(static_cast<uint64_t>(generator_->SampleRate()) * ms / 1000ULL);
}

}  // namespace chime
