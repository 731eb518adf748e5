#pragma once

/**
 * @file chime_player.hpp
 * @brief Plays phase-transition cues on an I2S amplifier (MAX98357A class)
 *
 * AUDIO PIPELINE:
 * ```
 * Play(cue) ──xQueueSend(timeout 0)──► chime task
 *                                        │ CueSequencer::Render(256 frames)
 *                                        ▼
 *                               i2s_channel_write (16 kHz stereo int16)
 * ```
 *
 * The caller (main loop) never blocks: a full queue drops the request and
 * returns ESP_ERR_TIMEOUT. A newer cue replaces one that is still playing.
 * When no cue is playing the task sleeps on the queue and the I2S DMA
 * auto-clears to silence.
 */

#include <cstddef>
#include <cstdint>

#include "chime/cue.hpp"
#include "chime/i2s_channel.hpp"
#include "chime/tone_generator.hpp"

extern "C" {
#include "driver/gpio.h"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"
}

namespace chime {

struct ChimeConfig {
  int i2s_port = 0;
  gpio_num_t bclk = GPIO_NUM_NC;
  gpio_num_t ws = GPIO_NUM_NC;
  gpio_num_t dout = GPIO_NUM_NC;
  uint32_t sample_rate_hz = 16000;
  uint8_t volume_percent = 10;
};

class ChimePlayer {
 public:
  static constexpr size_t kFramesPerChunk = 256;
  static constexpr size_t kQueueDepth = 4;

  ChimePlayer();
  ~ChimePlayer();

  ChimePlayer(const ChimePlayer&) = delete;
  ChimePlayer& operator=(const ChimePlayer&) = delete;

  esp_err_t Initialize(const ChimeConfig& config);
  void Deinitialize();
  bool IsReady() const { return task_handle_ != nullptr; }

  /**
   * @brief Queue a cue for playback without blocking.
   * @return ESP_OK, ESP_ERR_INVALID_STATE (not initialized) or ESP_ERR_TIMEOUT (queue full)
   */
  esp_err_t Play(CueId cue);

 private:
  static void TaskThunk(void* arg);
  [[noreturn]] void Task();

  ChimeConfig config_{};
  ToneGenerator generator_;
  CueSequencer sequencer_;
  I2sChannel channel_;
  QueueHandle_t queue_ = nullptr;
  TaskHandle_t task_handle_ = nullptr;
  int16_t buffer_[kFramesPerChunk * 2] = {};
};

}  // namespace chime
