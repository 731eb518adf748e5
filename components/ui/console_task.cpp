/**
 * @file console_task.cpp
 * @brief Console input task
 */

#include "ui/console_task.hpp"
#include "ui/serial_console.hpp"

extern "C" {
#include "esp_log.h"
}

namespace ui {

static const char* TAG = "console_task";

static void console_task_entry(void* pvParameters) {
    auto* console = static_cast<SerialConsole*>(pvParameters);
    ESP_LOGI(TAG, "Console task started");

    while (true) {
        console->Poll();
        vTaskDelay(pdMS_TO_TICKS(20));  // 20ms - responsive typing, negligible CPU
    }
}

esp_err_t StartConsoleTask(SerialConsole* console, TaskHandle_t* out_handle) {
    if (console == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    BaseType_t result = xTaskCreate(
        console_task_entry,
        "serial_console",
        4096,                   // Stack: line editing + TAB completion vectors
        console,
        4,                      // Priority: below the main loop
        out_handle
    );

    if (result != pdPASS) {
        ESP_LOGE(TAG, "Failed to create console task");
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

} // namespace ui
