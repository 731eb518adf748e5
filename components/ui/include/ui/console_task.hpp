/**
 * @file console_task.hpp
 * @brief FreeRTOS task that polls the console input
 */

#pragma once

extern "C" {
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
}

namespace ui {

class SerialConsole;

/**
 * Create the "serial_console" task: Poll() every 20 ms.
 * @param console Must outlive the task
 * @param out_handle Optional task handle
 */
esp_err_t StartConsoleTask(SerialConsole* console, TaskHandle_t* out_handle = nullptr);

} // namespace ui
