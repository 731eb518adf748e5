#pragma once

/**
 * @file board_config.hpp
 * @brief Pin assignments and fixed hardware settings (ESP32-S3 DevKitC + MAX98357A)
 */

#include <cstdint>

extern "C" {
#include "hal/gpio_types.h"
}

namespace app {

struct BoardConfig {
  // WS2812 status pixel (DevKitC-1 on-board RGB LED)
  static constexpr gpio_num_t kStatusLedGpio = GPIO_NUM_48;

  // MAX98357A class-D amplifier, I2S0, no MCLK
  static constexpr int kI2sPort = 0;
  static constexpr gpio_num_t kI2sBclkGpio = GPIO_NUM_15;
  static constexpr gpio_num_t kI2sWsGpio = GPIO_NUM_16;
  static constexpr gpio_num_t kI2sDoutGpio = GPIO_NUM_17;
  static constexpr uint32_t kChimeSampleRateHz = 16000;
  static constexpr uint8_t kChimeVolumePercent = 10;

  // Timer tick period (one state machine tick)
  static constexpr uint64_t kTickPeriodUs = 1'000'000;

  // Main loop event queue (ticks + console lines)
  static constexpr uint32_t kEventQueueDepth = 16;

  static constexpr uint32_t kBootFlashMs = 150;
};

}  // namespace app
