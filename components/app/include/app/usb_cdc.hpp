#pragma once

/**
 * @file usb_cdc.hpp
 * @brief TinyUSB dual CDC ACM bring-up
 *
 * - CDC0: ESP_LOG output (esp_log_set_vprintf hook, chained to UART)
 * - CDC1: interactive console (ui::UsbCdcTransport)
 */

extern "C" {
#include "esp_err.h"
}

namespace app {

/**
 * @brief Install the TinyUSB driver, both CDC ports and the log hook.
 *
 * Safe to call twice (already-installed parts are skipped).
 */
esp_err_t UsbCdcInstall();

/**
 * @brief true when a terminal has DTR+RTS asserted on @p port_num (0 or 1).
 */
bool UsbCdcTerminalConnected(int port_num);

}  // namespace app
