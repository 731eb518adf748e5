// main.cpp - ESP-IDF firmware entry point for Pomotodo.
//
// Only the ESP-IDF bootstrap lives here. Boot order, the main loop and every
// subsystem are owned by app::ApplicationController (components/app/).

#include <cstdlib>

#include "app/application_controller.hpp"
#include "app/version.hpp"

extern "C" {
#include "esp_log.h"
}

namespace {
constexpr char kLogTag[] = "app_main";
}  // namespace

extern "C" void app_main(void) {
  ESP_LOGI(kLogTag, "%s", app::kFullVersionString);

  // Static: too large for the main task stack
  static app::ApplicationController controller;

  if (!controller.Initialize()) {
    ESP_LOGE(kLogTag, "Initialization failed - halting");
    std::abort();
  }

  controller.Run();
}
