#include <cstdlib>

#include "app/init_phase.hpp"

extern "C" {
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
}

namespace app {

namespace {
constexpr char kLogTag[] = "fatal";
}

[[noreturn]] void FatalInitError(const char* subsystem, esp_err_t error_code) {
  ESP_LOGE(kLogTag, "╔════════════════════════════════════════════════════════════════╗");
  ESP_LOGE(kLogTag, "║              FATAL INITIALIZATION FAILURE                      ║");
  ESP_LOGE(kLogTag, "╠════════════════════════════════════════════════════════════════╣");
  ESP_LOGE(kLogTag, "║ Phase:     %-50s ║", subsystem);
  ESP_LOGE(kLogTag, "║ Error:     %-50s ║", esp_err_to_name(error_code));
  ESP_LOGE(kLogTag, "║ Code:      0x%04x                                            ║", error_code);
  ESP_LOGE(kLogTag, "╠════════════════════════════════════════════════════════════════╣");
  ESP_LOGE(kLogTag, "║ Possible causes:                                               ║");
  ESP_LOGE(kLogTag, "║  - NVS partition missing or unreadable (idf.py erase-flash)    ║");
  ESP_LOGE(kLogTag, "║  - esp_timer service not available                             ║");
  ESP_LOGE(kLogTag, "╠════════════════════════════════════════════════════════════════╣");
  ESP_LOGE(kLogTag, "║ System will abort in 2 seconds to trigger coredump...          ║");
  ESP_LOGE(kLogTag, "╚════════════════════════════════════════════════════════════════╝");

  vTaskDelay(pdMS_TO_TICKS(2000));
  ESP_LOGE(kLogTag, "Aborting now. Check coredump for stack trace.");
  std::abort();
}

}  // namespace app
