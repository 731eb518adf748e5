#include "chime/chime_player.hpp"

extern "C" {
#include "esp_log.h"
}

namespace chime {

namespace {
constexpr char kLogTag[] = "ChimePlayer";
constexpr uint32_t kWriteTimeoutMs = 100;
constexpr uint32_t kTaskStackBytes = 4096;
constexpr UBaseType_t kTaskPriority = 3;  // Below the main loop (5)
}  // namespace

ChimePlayer::ChimePlayer() : sequencer_(&generator_) {}

ChimePlayer::~ChimePlayer() {
  Deinitialize();
}

void ChimePlayer::Deinitialize() {
  if (task_handle_ != nullptr) {
    vTaskDelete(task_handle_);
    task_handle_ = nullptr;
  }
  if (queue_ != nullptr) {
    vQueueDelete(queue_);
    queue_ = nullptr;
  }
  channel_.Reset();
  sequencer_.Cancel();
}

esp_err_t ChimePlayer::Initialize(const ChimeConfig& config) {
  Deinitialize();
  config_ = config;

  ToneSettings tone{};
  tone.sample_rate_hz = config_.sample_rate_hz;
  tone.volume_percent = config_.volume_percent;
  generator_.Configure(tone);

  i2s_chan_config_t chan_cfg = I2S_CHANNEL_DEFAULT_CONFIG(static_cast<i2s_port_t>(config_.i2s_port),
                                                          I2S_ROLE_MASTER);
  chan_cfg.auto_clear = true;

  i2s_std_config_t std_cfg = {
      .clk_cfg = I2S_STD_CLK_DEFAULT_CONFIG(config_.sample_rate_hz),
      .slot_cfg = I2S_STD_PHILIPS_SLOT_DEFAULT_CONFIG(I2S_DATA_BIT_WIDTH_16BIT, I2S_SLOT_MODE_STEREO),
      .gpio_cfg = {.mclk = GPIO_NUM_NC,
                   .bclk = config_.bclk,
                   .ws = config_.ws,
                   .dout = config_.dout,
                   .din = GPIO_NUM_NC,
                   .invert_flags = {.mclk_inv = false, .bclk_inv = false, .ws_inv = false}},
  };

  esp_err_t err = channel_.Open(chan_cfg, std_cfg);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "I2S init failed: %s", esp_err_to_name(err));
    return err;
  }

  queue_ = xQueueCreate(kQueueDepth, sizeof(CueId));
  if (queue_ == nullptr) {
    Deinitialize();
    return ESP_ERR_NO_MEM;
  }

  BaseType_t created = xTaskCreatePinnedToCore(&ChimePlayer::TaskThunk, "chime", kTaskStackBytes, this,
                                               kTaskPriority, &task_handle_, tskNO_AFFINITY);
  if (created != pdPASS) {
    ESP_LOGE(kLogTag, "Failed to create chime task");
    task_handle_ = nullptr;
    Deinitialize();
    return ESP_ERR_NO_MEM;
  }

  ESP_LOGI(kLogTag, "Chime ready (I2S%d bclk=%d ws=%d dout=%d, %lu Hz, vol=%u%%)", config_.i2s_port,
           static_cast<int>(config_.bclk), static_cast<int>(config_.ws), static_cast<int>(config_.dout),
           static_cast<unsigned long>(config_.sample_rate_hz), static_cast<unsigned>(config_.volume_percent));
  return ESP_OK;
}

esp_err_t ChimePlayer::Play(CueId cue) {
  if (queue_ == nullptr) {
    return ESP_ERR_INVALID_STATE;
  }
  if (xQueueSend(queue_, &cue, 0) != pdTRUE) {
    ESP_LOGW(kLogTag, "Chime queue full, dropping %s", CueName(cue));
    return ESP_ERR_TIMEOUT;
  }
  return ESP_OK;
}

void ChimePlayer::TaskThunk(void* arg) {
  static_cast<ChimePlayer*>(arg)->Task();
}

void ChimePlayer::Task() {
  while (true) {
    CueId cue = CueId::kFocusEnd;
    // Idle: sleep until a cue arrives. Playing: poll between chunks.
    const TickType_t wait = sequencer_.IsPlaying() || generator_.IsActive() ? 0 : portMAX_DELAY;
    if (xQueueReceive(queue_, &cue, wait) == pdTRUE) {
      ESP_LOGD(kLogTag, "Playing %s", CueName(cue));
      sequencer_.Begin(cue);
    }

    if (!sequencer_.IsPlaying() && !generator_.IsActive()) {
      continue;
    }

    sequencer_.Render(buffer_, kFramesPerChunk);
    size_t written = 0;
    const esp_err_t err = channel_.Write(buffer_, sizeof(buffer_), &written, kWriteTimeoutMs);
    if (err != ESP_OK) {
      ESP_LOGW(kLogTag, "I2S write failed: %s", esp_err_to_name(err));
      vTaskDelay(pdMS_TO_TICKS(5));
    }
  }
}

}  // namespace chime
