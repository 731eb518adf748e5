#include "app/application_controller.hpp"

#include <cstring>
#include <memory>

#include "app/board_config.hpp"
#include "app/init_phases.hpp"
#include "chime/cue.hpp"
#include "indicator/phase_palette.hpp"
#include "ui/pomodoro_commands.hpp"

extern "C" {
#include "esp_log.h"
#include "esp_system.h"
}

namespace app {

namespace {
constexpr char kLogTag[] = "app_controller";
constexpr TickType_t kLinePostTimeout = pdMS_TO_TICKS(100);
constexpr TickType_t kRebootDelay = pdMS_TO_TICKS(200);  // Let USB drain "Rebooting..."

chime::ChimeConfig BuildChimeConfig() {
  chime::ChimeConfig config;
  config.i2s_port = BoardConfig::kI2sPort;
  config.bclk = BoardConfig::kI2sBclkGpio;
  config.ws = BoardConfig::kI2sWsGpio;
  config.dout = BoardConfig::kI2sDoutGpio;
  config.sample_rate_hz = BoardConfig::kChimeSampleRateHz;
  config.volume_percent = BoardConfig::kChimeVolumePercent;
  return config;
}
}  // namespace

ApplicationController::ApplicationController()
    : context_(&record_store_), console_(&console_transport_) {
  // Hardware is touched only in Initialize()
}

ApplicationController::~ApplicationController() {
  if (tick_timer_ == nullptr) {
    return;
  }
  esp_err_t err = esp_timer_stop(tick_timer_);
  if (err == ESP_OK || err == ESP_ERR_INVALID_STATE) {
    err = esp_timer_delete(tick_timer_);
  }
  if (err != ESP_OK) {
    ESP_LOGW(kLogTag, "Tick timer teardown failed: %s", esp_err_to_name(err));
  }
}

bool ApplicationController::Initialize() {
  ui::CommandHooks hooks;
  hooks.on_phase_notice = [this](const PhaseNotice& notice) { HandleNotice(notice); };
  hooks.on_reboot = [this]() { Shutdown(); };
  ui::RegisterPomodoroCommands(&console_, &context_, hooks);
  console_.SetLineSink([this](const std::string& line) { PostLine(line); });

  InitializationPipeline pipeline(&FatalInitError);
  pipeline.AddPhase(std::make_unique<NvsFlashPhase>());
  pipeline.AddPhase(std::make_unique<RecordStorePhase>(&record_store_));
  pipeline.AddPhase(std::make_unique<ContextLoadPhase>(&context_));
  pipeline.AddPhase(std::make_unique<EventQueuePhase>(&event_queue_, BoardConfig::kEventQueueDepth,
                                                      sizeof(MainEvent)));
  pipeline.AddPhase(std::make_unique<StatusLedPhase>(&status_led_, BoardConfig::kStatusLedGpio));
  pipeline.AddPhase(std::make_unique<ChimePhase>(&chime_, BuildChimeConfig()));
  pipeline.AddPhase(std::make_unique<UsbConsolePhase>(&console_, &console_task_));
  pipeline.AddPhase(std::make_unique<TickTimerPhase>(&tick_timer_, &ApplicationController::OnTickTimer,
                                                     this, BoardConfig::kTickPeriodUs));

  if (!pipeline.Execute()) {
    return false;
  }

  ReportPersistenceWarning();
  RefreshIndicator();
  return true;
}

void ApplicationController::Run() {
  ESP_LOGI(kLogTag, "Entering main loop");

  while (true) {
    MainEvent event;
    if (xQueueReceive(event_queue_, &event, portMAX_DELAY) != pdTRUE) {
      continue;
    }

    switch (event.kind) {
      case MainEvent::Kind::kTick:
        HandleTick();
        break;
      case MainEvent::Kind::kConsoleLine:
        HandleLine(event.line);
        break;
    }
    RefreshIndicator();
  }
}

void ApplicationController::Shutdown() {
  ESP_LOGI(kLogTag, "Shutdown requested");
  if (tick_timer_ != nullptr) {
    const esp_err_t err = esp_timer_stop(tick_timer_);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
      ESP_LOGW(kLogTag, "esp_timer_stop failed: %s", esp_err_to_name(err));
    }
  }
  const esp_err_t err = context_.Flush();
  if (err != ESP_OK) {
    console_.Printf("Warning: final save failed (%s)\r\n", esp_err_to_name(err));
  }
  vTaskDelay(kRebootDelay);
  esp_restart();
}

// esp_timer task context: only posts
void ApplicationController::OnTickTimer(void* arg) {
  auto* self = static_cast<ApplicationController*>(arg);
  MainEvent event;
  event.kind = MainEvent::Kind::kTick;
  if (xQueueSend(self->event_queue_, &event, 0) != pdTRUE) {
    self->dropped_ticks_.fetch_add(1);
  }
}

// Console task context: only posts
void ApplicationController::PostLine(const std::string& line) {
  if (event_queue_ == nullptr) {
    return;
  }
  MainEvent event;
  event.kind = MainEvent::Kind::kConsoleLine;
  std::strncpy(event.line, line.c_str(), sizeof(event.line) - 1);
  if (xQueueSend(event_queue_, &event, kLinePostTimeout) != pdTRUE) {
    ESP_LOGW(kLogTag, "Event queue full, console line dropped");
    console_.Print("Busy, command dropped\r\n");
    console_.Print(console_.GetPrompt());
  }
}

void ApplicationController::HandleTick() {
  const uint32_t dropped = dropped_ticks_.exchange(0);
  if (dropped != 0) {
    ESP_LOGW(kLogTag, "%lu ticks dropped (queue full)", static_cast<unsigned long>(dropped));
  }

  std::optional<PhaseNotice> notice = context_.Tick();
  if (notice) {
    console_.Printf("\r\n%s finished, %s next\r\n", pomodoro::PhaseName(notice->event.ended),
                    pomodoro::PhaseName(notice->event.next));
    HandleNotice(*notice);
    ReportPersistenceWarning();
    console_.Print(console_.GetPrompt());
  }
}

void ApplicationController::HandleLine(const char* line) {
  console_.Execute(line);
}

void ApplicationController::HandleNotice(const PhaseNotice& notice) {
  ESP_LOGI(kLogTag, "Phase %s -> %s (sessions=%lu%s)", pomodoro::PhaseName(notice.event.ended),
           pomodoro::PhaseName(notice.event.next),
           static_cast<unsigned long>(notice.event.sessions_completed),
           notice.event.skipped ? ", skipped" : "");
  if (notice.credited_task) {
    ESP_LOGI(kLogTag, "Credited task #%lu", static_cast<unsigned long>(*notice.credited_task));
  }

  if (!chime_.IsReady()) {
    return;
  }
  const esp_err_t err = chime_.Play(chime::CueForPhase(notice.event.ended));
  if (err != ESP_OK) {
    ESP_LOGW(kLogTag, "Chime not played: %s", esp_err_to_name(err));
  }
}

void ApplicationController::ReportPersistenceWarning() {
  const esp_err_t warning = context_.TakePersistenceWarning();
  if (warning != ESP_OK) {
    ESP_LOGW(kLogTag, "Record not saved: %s", esp_err_to_name(warning));
    console_.Printf("Warning: changes not saved to flash (%s)\r\n", esp_err_to_name(warning));
  }
}

void ApplicationController::RefreshIndicator() {
  if (!status_led_.IsInitialized()) {
    return;
  }
  const ContextSnapshot snapshot = context_.Snapshot();
  const esp_err_t err = status_led_.Show(
      indicator::PhaseColor(snapshot.timer.phase, snapshot.timer.running, snapshot.dark_mode));
  if (err != ESP_OK) {
    ESP_LOGD(kLogTag, "LED refresh failed: %s", esp_err_to_name(err));
  }
}

}  // namespace app
