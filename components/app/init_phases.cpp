/**
 * @file init_phases.cpp
 * @brief Concrete initialization phases
 *
 * See init_phases.hpp for the phase order and dependencies.
 */

#include "app/init_phases.hpp"

#include "app/board_config.hpp"
#include "app/usb_cdc.hpp"
#include "app/version.hpp"
#include "ui/console_task.hpp"

extern "C" {
#include "esp_log.h"
#include "nvs_flash.h"
}

namespace app {

namespace {
constexpr char kLogTag[] = "init_phases";
}  // namespace

//=============================================================================
// Phase 1: NVS Flash
//=============================================================================
esp_err_t NvsFlashPhase::Execute() {
  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_LOGW(kLogTag, "NVS partition unusable (%s), erasing...", esp_err_to_name(err));
    err = nvs_flash_erase();
    if (err != ESP_OK) {
      return err;
    }
    err = nvs_flash_init();
  }
  return err;
}

//=============================================================================
// Phase 2: Record Store
//=============================================================================
esp_err_t RecordStorePhase::Execute() {
  return store_->Initialize();
}

//=============================================================================
// Phase 3: Context Load
//=============================================================================
esp_err_t ContextLoadPhase::Execute() {
  const esp_err_t err = context_->Load();
  if (err != ESP_OK) {
    return err;
  }
  ESP_LOGI(kLogTag, "Loaded %u tasks, focus %lu min", static_cast<unsigned>(context_->ledger().size()),
           static_cast<unsigned long>(context_->settings().focus_minutes));
  return ESP_OK;
}

//=============================================================================
// Phase 4: Event Queue
//=============================================================================
esp_err_t EventQueuePhase::Execute() {
  *queue_ = xQueueCreate(depth_, item_size_);
  return *queue_ != nullptr ? ESP_OK : ESP_ERR_NO_MEM;
}

//=============================================================================
// Phase 5: Status LED
//=============================================================================
esp_err_t StatusLedPhase::Execute() {
  esp_err_t err = led_->Initialize(gpio_);
  if (err != ESP_OK) {
    return err;
  }
  // Boot signal: short white flash
  err = led_->Flash(BoardConfig::kBootFlashMs);
  if (err != ESP_OK) {
    ESP_LOGW(kLogTag, "Boot flash failed: %s", esp_err_to_name(err));
  }
  return ESP_OK;
}

//=============================================================================
// Phase 6: Chime
//=============================================================================
esp_err_t ChimePhase::Execute() {
  return player_->Initialize(config_);
}

//=============================================================================
// Phase 7: USB Console
//=============================================================================
esp_err_t UsbConsolePhase::Execute() {
  esp_err_t err = UsbCdcInstall();
  if (err != ESP_OK) {
    return err;
  }
  console_->Init(kFullVersionString);
  return ui::StartConsoleTask(console_, task_);
}

//=============================================================================
// Phase 8: Tick Timer
//=============================================================================
esp_err_t TickTimerPhase::Execute() {
  const esp_timer_create_args_t args = {
      .callback = callback_,
      .arg = arg_,
      .dispatch_method = ESP_TIMER_TASK,
      .name = "pomodoro_tick",
      .skip_unhandled_events = false,  // Every missed tick is still delivered
  };

  esp_err_t err = esp_timer_create(&args, timer_);
  if (err != ESP_OK) {
    return err;
  }
  err = esp_timer_start_periodic(*timer_, period_us_);
  if (err != ESP_OK) {
    const esp_err_t del = esp_timer_delete(*timer_);
    if (del != ESP_OK) {
      ESP_LOGW(kLogTag, "esp_timer_delete failed: %s", esp_err_to_name(del));
    }
    *timer_ = nullptr;
    return err;
  }
  ESP_LOGI(kLogTag, "Tick timer started (%llu us)", static_cast<unsigned long long>(period_us_));
  return ESP_OK;
}

}  // namespace app
