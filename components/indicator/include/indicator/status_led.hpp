#pragma once

/**
 * @file status_led.hpp
 * @brief Single WS2812 status pixel showing the timer phase
 *
 * Thin wrapper around the ESP-IDF led_strip component (RMT backend). The
 * colour comes from PhaseColor(); Show() skips the RMT transfer when the
 * colour did not change, so it can be called on every tick.
 *
 * USAGE:
 * ```
 * StatusLed led;
 * led.Initialize(GPIO_NUM_48);
 * led.Show(PhaseColor(Phase::kFocus, true, false));
 * ```
 */

#include <cstdint>

#include "indicator/phase_palette.hpp"

extern "C" {
#include "driver/gpio.h"
#include "esp_err.h"
#include "led_strip.h"
}

namespace indicator {

class StatusLed {
 public:
  StatusLed() = default;
  ~StatusLed();

  StatusLed(const StatusLed&) = delete;
  StatusLed& operator=(const StatusLed&) = delete;

  esp_err_t Initialize(gpio_num_t gpio);
  bool IsInitialized() const { return strip_ != nullptr; }

  /**
   * @brief Display a colour (no-op when unchanged).
   * @return ESP_OK, ESP_ERR_INVALID_STATE before Initialize(), or the led_strip error
   */
  esp_err_t Show(Rgb color);

  /**
   * @brief Short white flash used as a boot signal.
   */
  esp_err_t Flash(uint32_t duration_ms);

 private:
  esp_err_t Write(Rgb color);

  led_strip_handle_t strip_ = nullptr;
  Rgb current_{};
  bool has_current_ = false;
};

}  // namespace indicator
