#pragma once

/**
 * @file i2s_channel.hpp
 * @brief RAII owner for an I2S TX channel
 *
 * Guarantees i2s_channel_disable() / i2s_del_channel() on destruction so the
 * error paths in ChimePlayer::Initialize() need no manual cleanup.
 */

#include <utility>

extern "C" {
#include "driver/i2s_std.h"
#include "esp_err.h"
}

namespace chime {

class I2sChannel {
 public:
  I2sChannel() = default;
  ~I2sChannel() { Reset(); }

  I2sChannel(const I2sChannel&) = delete;
  I2sChannel& operator=(const I2sChannel&) = delete;

  I2sChannel(I2sChannel&& other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)), enabled_(std::exchange(other.enabled_, false)) {}

  I2sChannel& operator=(I2sChannel&& other) noexcept {
    if (this != &other) {
      Reset();
      handle_ = std::exchange(other.handle_, nullptr);
      enabled_ = std::exchange(other.enabled_, false);
    }
    return *this;
  }

  // TX-only channel in standard (Philips) mode, enabled on success
  esp_err_t Open(const i2s_chan_config_t& chan_cfg, const i2s_std_config_t& std_cfg) {
    Reset();
    esp_err_t err = i2s_new_channel(&chan_cfg, &handle_, nullptr);
    if (err != ESP_OK) {
      handle_ = nullptr;
      return err;
    }
    err = i2s_channel_init_std_mode(handle_, &std_cfg);
    if (err != ESP_OK) {
      Reset();
      return err;
    }
    err = i2s_channel_enable(handle_);
    if (err != ESP_OK) {
      Reset();
      return err;
    }
    enabled_ = true;
    return ESP_OK;
  }

  esp_err_t Write(const void* data, size_t bytes, size_t* written, uint32_t timeout_ms) {
    if (handle_ == nullptr) {
      return ESP_ERR_INVALID_STATE;
    }
    return i2s_channel_write(handle_, data, bytes, written, timeout_ms);
  }

  void Reset() {
    if (handle_ != nullptr) {
      if (enabled_) {
        i2s_channel_disable(handle_);
        enabled_ = false;
      }
      i2s_del_channel(handle_);
      handle_ = nullptr;
    }
  }

  bool IsValid() const { return handle_ != nullptr; }

 private:
  i2s_chan_handle_t handle_ = nullptr;
  bool enabled_ = false;
};

}  // namespace chime
