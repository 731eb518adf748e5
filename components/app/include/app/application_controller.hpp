#pragma once

/**
 * @file application_controller.hpp
 * @brief Top-level owner of the firmware: boot pipeline and main loop
 *
 * ARCHITECTURE RATIONALE:
 * =======================
 * Every mutation of PomodoroContext happens on the main loop task. The tick
 * timer (esp_timer task) and the console input task only post MainEvent
 * items to one FreeRTOS queue; Run() drains it in order. Missed ticks stay
 * in the queue and are each applied once.
 *
 * OWNERSHIP:
 * - Owns: record store, context, status LED, chime player, console + transport,
 *   event queue, tick timer
 *
 * OUTPUTS:
 * - Phase notices → chime cue + console message
 * - Every processed event → status LED refresh (no-op when unchanged)
 */

#include <atomic>
#include <cstdint>
#include <string>

#include "app/pomodoro_context.hpp"
#include "chime/chime_player.hpp"
#include "config/nvs_record_store.hpp"
#include "indicator/status_led.hpp"
#include "ui/serial_console.hpp"
#include "ui/usb_cdc_transport.hpp"

extern "C" {
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"
}

namespace app {

/**
 * @brief Item of the main loop queue.
 */
struct MainEvent {
  enum class Kind : uint8_t { kTick, kConsoleLine };

  Kind kind = Kind::kTick;
  char line[ui::MAX_LINE] = {};  // NUL-terminated, kConsoleLine only
};

class ApplicationController {
 public:
  ApplicationController();
  ~ApplicationController();

  // Non-copyable, non-movable (owns hardware resources).
  ApplicationController(const ApplicationController&) = delete;
  ApplicationController& operator=(const ApplicationController&) = delete;

  /**
   * @brief Run the boot pipeline.
   * @return false if a critical phase failed
   */
  bool Initialize();

  /**
   * @brief Main loop: blocks on the event queue forever.
   */
  [[noreturn]] void Run();

  /**
   * @brief Stop the tick, flush the record and restart the chip.
   */
  [[noreturn]] void Shutdown();

 private:
  static void OnTickTimer(void* arg);
  void PostLine(const std::string& line);

  void HandleTick();
  void HandleLine(const char* line);
  void HandleNotice(const PhaseNotice& notice);
  void ReportPersistenceWarning();
  void RefreshIndicator();

  config::NvsRecordStore record_store_;
  PomodoroContext context_;

  indicator::StatusLed status_led_;
  chime::ChimePlayer chime_;

  ui::UsbCdcTransport console_transport_;
  ui::SerialConsole console_;
  TaskHandle_t console_task_ = nullptr;

  QueueHandle_t event_queue_ = nullptr;
  esp_timer_handle_t tick_timer_ = nullptr;
  std::atomic<uint32_t> dropped_ticks_{0};  // Written by the esp_timer task
};

}  // namespace app
