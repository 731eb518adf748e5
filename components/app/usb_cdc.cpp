/**
 * USB bring-up using the esp_tinyusb 2.x API.
 *
 * CDC0 carries ESP_LOG output, CDC1 the console. Line state callbacks track
 * whether a terminal is attached on each port.
 */

#include "app/usb_cdc.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>

extern "C" {
#include "esp_log.h"
#include "tinyusb.h"
#include "tinyusb_cdc_acm.h"
}

namespace app {

namespace {

constexpr char kLogTag[] = "usb_cdc";

constexpr tinyusb_cdcacm_itf_t kLogPort = TINYUSB_CDC_ACM_0;
constexpr tinyusb_cdcacm_itf_t kConsolePort = TINYUSB_CDC_ACM_1;

struct UsbState {
  bool cdc_ready[2];            // DTR+RTS seen per port
  vprintf_like_t prev_vprintf;  // Original vprintf for chaining
  bool log_hook_installed;
};

UsbState g_usb_state = {
    .cdc_ready = {false, false},
    .prev_vprintf = nullptr,
    .log_hook_installed = false,
};

void LineStateChanged(int itf, cdcacm_event_t* event) {
  if (event == nullptr || event->type != CDC_EVENT_LINE_STATE_CHANGED) {
    return;
  }
  if (itf >= 0 && itf < 2) {
    g_usb_state.cdc_ready[itf] =
        event->line_state_changed_data.dtr && event->line_state_changed_data.rts;
  }
}

// Mirrors ESP_LOG output to CDC0 with LF -> CRLF conversion
int LogVprintf(const char* fmt, va_list args) {
  int ret = 0;

  va_list args_for_prev;
  va_copy(args_for_prev, args);
  if (g_usb_state.prev_vprintf != nullptr) {
    ret = g_usb_state.prev_vprintf(fmt, args_for_prev);
  }
  va_end(args_for_prev);

  // TinyUSB buffers until the host opens the port, so no cdc_ready check here
  if (!tinyusb_cdcacm_initialized(kLogPort)) {
    return ret;
  }

  char buffer[256];
  va_list args_for_cdc;
  va_copy(args_for_cdc, args);
  const int len = vsnprintf(buffer, sizeof(buffer), fmt, args_for_cdc);
  va_end(args_for_cdc);
  if (len <= 0) {
    return ret;
  }

  size_t to_write = static_cast<size_t>(len);
  if (to_write >= sizeof(buffer)) {
    to_write = sizeof(buffer) - 1;
  }

  char crlf[512];
  size_t out = 0;
  for (size_t i = 0; i < to_write && out < sizeof(crlf) - 1; ++i) {
    if (buffer[i] == '\n') {
      crlf[out++] = '\r';
    }
    crlf[out++] = buffer[i];
  }

  if (tinyusb_cdcacm_write_queue(kLogPort, reinterpret_cast<const uint8_t*>(crlf), out) > 0) {
    tinyusb_cdcacm_write_flush(kLogPort, 0);
  }
  return ret;
}

}  // namespace

bool UsbCdcTerminalConnected(int port_num) {
  if (port_num < 0 || port_num >= 2) {
    return false;
  }
  return g_usb_state.cdc_ready[port_num];
}

esp_err_t UsbCdcInstall() {
  const tinyusb_config_t tusb_cfg = {
      .port = TINYUSB_PORT_FULL_SPEED_0,
      .phy =
          {
              .skip_setup = false,
              .self_powered = false,
              .vbus_monitor_io = -1,
          },
      .task =
          {
              .size = 4096,
              .priority = 5,
              .xCoreID = 0,  // Same core as the USB ISR
          },
      .descriptor =
          {
              .device = nullptr,  // Kconfig defaults (dual CDC)
              .qualifier = nullptr,
              .string = nullptr,
              .string_count = 0,
              .full_speed_config = nullptr,
              .high_speed_config = nullptr,
          },
      .event_cb = nullptr,
      .event_arg = nullptr,
  };

  esp_err_t err = tinyusb_driver_install(&tusb_cfg);
  if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
    ESP_LOGE(kLogTag, "TinyUSB driver install failed: %s", esp_err_to_name(err));
    return err;
  }

  tinyusb_config_cdcacm_t cdc_cfg = {
      .cdc_port = kLogPort,
      .callback_rx = nullptr,
      .callback_rx_wanted_char = nullptr,
      .callback_line_state_changed = &LineStateChanged,
      .callback_line_coding_changed = nullptr,
  };

  for (tinyusb_cdcacm_itf_t port : {kLogPort, kConsolePort}) {
    cdc_cfg.cdc_port = port;
    err = tinyusb_cdcacm_init(&cdc_cfg);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
      ESP_LOGE(kLogTag, "CDC%d init failed: %s", static_cast<int>(port), esp_err_to_name(err));
      return err;
    }
  }

  if (!g_usb_state.log_hook_installed) {
    g_usb_state.prev_vprintf = esp_log_set_vprintf(&LogVprintf);
    g_usb_state.log_hook_installed = true;
  }

  ESP_LOGI(kLogTag, "TinyUSB dual CDC ready (CDC0 logs, CDC1 console)");
  return ESP_OK;
}

}  // namespace app
