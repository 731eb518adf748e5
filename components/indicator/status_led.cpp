#include "indicator/status_led.hpp"

extern "C" {
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
}

namespace indicator {

namespace {
constexpr char kLogTag[] = "StatusLed";
constexpr Rgb kFlashColor{0x40, 0x40, 0x40};
}  // namespace

StatusLed::~StatusLed() {
  if (strip_ != nullptr) {
    led_strip_del(strip_);
    strip_ = nullptr;
  }
}

esp_err_t StatusLed::Initialize(gpio_num_t gpio) {
  if (strip_ != nullptr) {
    ESP_LOGW(kLogTag, "Status LED already initialized");
    return ESP_ERR_INVALID_STATE;
  }
  if (gpio == GPIO_NUM_NC) {
    return ESP_ERR_INVALID_ARG;
  }

  led_strip_config_t strip_config{
      .strip_gpio_num = static_cast<int>(gpio),
      .max_leds = 1,
      .led_model = LED_MODEL_WS2812,
      .color_component_format = LED_STRIP_COLOR_COMPONENT_FMT_GRB,
      .flags = {
          .invert_out = false,
      },
  };

  led_strip_rmt_config_t rmt_config = {
      .clk_src = RMT_CLK_SRC_DEFAULT,
      .resolution_hz = 10'000'000,  // 10 MHz resolution
      .mem_block_symbols = 0,
      .flags = {
          .with_dma = false,
      },
  };

  esp_err_t err = led_strip_new_rmt_device(&strip_config, &rmt_config, &strip_);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Failed to create RMT LED strip: %s", esp_err_to_name(err));
    strip_ = nullptr;
    return err;
  }

  err = led_strip_clear(strip_);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Failed to clear LED strip: %s", esp_err_to_name(err));
    led_strip_del(strip_);
    strip_ = nullptr;
    return err;
  }

  current_ = kOff;
  has_current_ = true;
  ESP_LOGI(kLogTag, "Status LED on GPIO %d", static_cast<int>(gpio));
  return ESP_OK;
}

esp_err_t StatusLed::Show(Rgb color) {
  if (strip_ == nullptr) {
    return ESP_ERR_INVALID_STATE;
  }
  if (has_current_ && color == current_) {
    return ESP_OK;
  }
  return Write(color);
}

esp_err_t StatusLed::Flash(uint32_t duration_ms) {
  if (strip_ == nullptr) {
    return ESP_ERR_INVALID_STATE;
  }
  const Rgb previous = current_;
  esp_err_t err = Write(kFlashColor);
  if (err != ESP_OK) {
    return err;
  }
  vTaskDelay(pdMS_TO_TICKS(duration_ms));
  return Write(previous);
}

esp_err_t StatusLed::Write(Rgb color) {
  esp_err_t err = led_strip_set_pixel(strip_, 0, color.r, color.g, color.b);
  if (err == ESP_OK) {
    err = led_strip_refresh(strip_);
  }
  if (err != ESP_OK) {
    ESP_LOGW(kLogTag, "LED update failed: %s", esp_err_to_name(err));
    has_current_ = false;
    return err;
  }
  current_ = color;
  has_current_ = true;
  return ESP_OK;
}

}  // namespace indicator
