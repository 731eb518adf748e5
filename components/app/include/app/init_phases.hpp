#pragma once

/**
 * @file init_phases.hpp
 * @brief Concrete initialization phases used by ApplicationController
 *
 * PHASE OVERVIEW (execution order):
 * ==================================
 * 1. NvsFlashPhase      - NVS partition init, erase on version/page errors (CRITICAL)
 * 2. RecordStorePhase   - Open the "pomotodo" NVS namespace
 * 3. ContextLoadPhase   - Decode the persisted record into PomodoroContext (CRITICAL)
 * 4. EventQueuePhase    - Main loop queue for ticks and console lines (CRITICAL)
 * 5. StatusLedPhase     - WS2812 status pixel + boot flash
 * 6. ChimePhase         - I2S amplifier and chime task
 * 7. UsbConsolePhase    - TinyUSB CDC, console banner, console input task
 * 8. TickTimerPhase     - 1 s periodic esp_timer posting ticks (CRITICAL)
 *
 * DEPENDENCIES:
 * - NvsFlashPhase BEFORE RecordStorePhase (nvs_open needs the partition)
 * - RecordStorePhase BEFORE ContextLoadPhase. If the store failed to open,
 *   Load() falls back to defaults and raises a persistence warning.
 * - EventQueuePhase BEFORE UsbConsolePhase and TickTimerPhase (both post to it)
 * - TickTimerPhase LAST: the first tick must find everything ready
 */

#include <cstddef>
#include <cstdint>

#include "app/init_phase.hpp"
#include "app/pomodoro_context.hpp"
#include "chime/chime_player.hpp"
#include "config/nvs_record_store.hpp"
#include "indicator/status_led.hpp"
#include "ui/serial_console.hpp"

extern "C" {
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"
}

namespace app {

//=============================================================================
// Phase 1: NVS Flash (CRITICAL)
//=============================================================================
/**
 * @brief Initialize the default NVS partition.
 *
 * ESP_ERR_NVS_NO_FREE_PAGES / ESP_ERR_NVS_NEW_VERSION_FOUND: the partition is
 * erased and initialized again (stored tasks are lost).
 */
class NvsFlashPhase : public InitPhase {
 public:
  esp_err_t Execute() override;
  const char* GetName() const override { return "NVS Flash"; }
  bool IsCritical() const override { return true; }
};

//=============================================================================
// Phase 2: Record Store
//=============================================================================
class RecordStorePhase : public InitPhase {
 public:
  explicit RecordStorePhase(config::NvsRecordStore* store) : store_(store) {}

  esp_err_t Execute() override;
  const char* GetName() const override { return "Record Store"; }
  bool IsCritical() const override { return false; }

 private:
  config::NvsRecordStore* store_;
};

//=============================================================================
// Phase 3: Context Load (CRITICAL)
//=============================================================================
class ContextLoadPhase : public InitPhase {
 public:
  explicit ContextLoadPhase(PomodoroContext* context) : context_(context) {}

  esp_err_t Execute() override;
  const char* GetName() const override { return "Context Load"; }
  bool IsCritical() const override { return true; }

 private:
  PomodoroContext* context_;
};

//=============================================================================
// Phase 4: Event Queue (CRITICAL)
//=============================================================================
class EventQueuePhase : public InitPhase {
 public:
  EventQueuePhase(QueueHandle_t* queue, uint32_t depth, size_t item_size)
      : queue_(queue), depth_(depth), item_size_(item_size) {}

  esp_err_t Execute() override;
  const char* GetName() const override { return "Event Queue"; }
  bool IsCritical() const override { return true; }

 private:
  QueueHandle_t* queue_;
  uint32_t depth_;
  size_t item_size_;
};

//=============================================================================
// Phase 5: Status LED
//=============================================================================
class StatusLedPhase : public InitPhase {
 public:
  StatusLedPhase(indicator::StatusLed* led, gpio_num_t gpio) : led_(led), gpio_(gpio) {}

  esp_err_t Execute() override;
  const char* GetName() const override { return "Status LED"; }
  bool IsCritical() const override { return false; }

 private:
  indicator::StatusLed* led_;
  gpio_num_t gpio_;
};

//=============================================================================
// Phase 6: Chime
//=============================================================================
class ChimePhase : public InitPhase {
 public:
  ChimePhase(chime::ChimePlayer* player, const chime::ChimeConfig& config)
      : player_(player), config_(config) {}

  esp_err_t Execute() override;
  const char* GetName() const override { return "Chime"; }
  bool IsCritical() const override { return false; }

 private:
  chime::ChimePlayer* player_;
  chime::ChimeConfig config_;
};

//=============================================================================
// Phase 7: USB Console
//=============================================================================
/**
 * @brief Bring up TinyUSB, print the banner and start the console input task.
 *
 * Non-critical: without USB the timer still runs (LED + chime only).
 */
class UsbConsolePhase : public InitPhase {
 public:
  UsbConsolePhase(ui::SerialConsole* console, TaskHandle_t* task) : console_(console), task_(task) {}

  esp_err_t Execute() override;
  const char* GetName() const override { return "USB Console"; }
  bool IsCritical() const override { return false; }

 private:
  ui::SerialConsole* console_;
  TaskHandle_t* task_;
};

//=============================================================================
// Phase 8: Tick Timer (CRITICAL)
//=============================================================================
class TickTimerPhase : public InitPhase {
 public:
  TickTimerPhase(esp_timer_handle_t* timer, esp_timer_cb_t callback, void* arg, uint64_t period_us)
      : timer_(timer), callback_(callback), arg_(arg), period_us_(period_us) {}

  esp_err_t Execute() override;
  const char* GetName() const override { return "Tick Timer"; }
  bool IsCritical() const override { return true; }

 private:
  esp_timer_handle_t* timer_;
  esp_timer_cb_t callback_;
  void* arg_;
  uint64_t period_us_;
};

}  // namespace app
