/**
 * @file init_pipeline.cpp
 * @brief Implementation of InitializationPipeline
 *
 * The concrete phases are in init_phases.cpp; FatalInitError() is in
 * fatal_init_error.cpp (device only).
 */

#include "app/init_phase.hpp"

#include <utility>

extern "C" {
#include "esp_log.h"
}

namespace app {

namespace {
constexpr const char* kLogTag = "init_pipeline";
}

InitializationPipeline::InitializationPipeline(FatalHandler fatal_handler)
    : fatal_handler_(std::move(fatal_handler)) {}

void InitializationPipeline::AddPhase(std::unique_ptr<InitPhase> phase) {
  phases_.push_back(std::move(phase));
}

bool InitializationPipeline::Execute() {
  ESP_LOGI(kLogTag, "Starting initialization pipeline (%zu phases registered)", phases_.size());

  for (size_t i = 0; i < phases_.size(); ++i) {
    const auto& phase = phases_[i];
    ESP_LOGI(kLogTag, "Executing phase %zu/%zu: %s", i + 1, phases_.size(), phase->GetName());

    const esp_err_t err = phase->Execute();
    if (err != ESP_OK && !HandlePhaseError(*phase, err)) {
      return false;
    }
  }

  ESP_LOGI(kLogTag, "Initialization pipeline completed");
  return true;
}

bool InitializationPipeline::HandlePhaseError(const InitPhase& phase, esp_err_t error) {
  const char* phase_name = phase.GetName();

  if (!phase.IsCritical()) {
    ESP_LOGE(kLogTag, "Non-critical phase '%s' failed: %s (continuing)", phase_name,
             esp_err_to_name(error));
    return true;
  }

  ESP_LOGE(kLogTag, "CRITICAL phase '%s' failed: %s (0x%x)", phase_name, esp_err_to_name(error),
           error);
  if (fatal_handler_) {
    fatal_handler_(phase_name, error);
  }
  return false;
}

}  // namespace app
