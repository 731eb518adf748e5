#pragma once

/**
 * @file init_phase.hpp
 * @brief Initialization pipeline infrastructure for the boot sequence
 *
 * ARCHITECTURE RATIONALE:
 * =======================
 * Boot is a list of small phases (NVS, record store, context load, status LED,
 * chime, USB console, tick timer) executed in registration order by
 * InitializationPipeline.
 *
 * PATTERN: Builder + Strategy
 * - InitPhase (Strategy): One initialization step
 * - InitializationPipeline (Builder): Composes and executes phases in sequence
 *
 * USAGE PATTERN:
 * ```cpp
 * InitializationPipeline pipeline(&FatalInitError);
 * pipeline.AddPhase(std::make_unique<NvsFlashPhase>());
 * pipeline.AddPhase(std::make_unique<RecordStorePhase>(&store));
 * bool success = pipeline.Execute();
 * ```
 *
 * CRITICAL vs NON-CRITICAL PHASES:
 * - Critical phases: NVS flash, context load, tick timer
 *   → Failure calls the fatal handler (FatalInitError on the device)
 * - Non-critical phases: Status LED, chime, USB console, record store
 *   → Failure logs ESP_LOGE and continues boot
 */

#include <functional>
#include <memory>
#include <vector>

extern "C" {
#include "esp_err.h"
}

namespace app {

/**
 * @brief Abstract base class for initialization phases.
 *
 * CONTRACT:
 * - Execute() called exactly once during boot
 * - GetName() used for logging and error messages
 * - IsCritical() selects the error handling strategy
 */
class InitPhase {
 public:
  virtual ~InitPhase() = default;

  /**
   * @brief Execute this initialization phase.
   * @return ESP_OK on success, error code on failure
   */
  virtual esp_err_t Execute() = 0;

  /**
   * @brief Human-readable phase name ("NVS Flash", "Chime", ...).
   */
  virtual const char* GetName() const = 0;

  /**
   * @brief true if failure must stop the boot.
   */
  virtual bool IsCritical() const = 0;
};

/**
 * @brief Called when a critical phase fails. FatalInitError() never returns.
 */
using FatalHandler = std::function<void(const char* phase_name, esp_err_t error)>;

/**
 * @brief Log a fatal boot failure banner, wait 2 s, then abort().
 */
[[noreturn]] void FatalInitError(const char* subsystem, esp_err_t error_code);

/**
 * @brief Executes phases sequentially.
 *
 * EXECUTION FLOW:
 * 1. For each registered phase:
 *    a. Log "Executing phase i/n: [name]"
 *    b. Call phase->Execute()
 *    c. On failure: critical → fatal handler, non-critical → ESP_LOGE, continue
 * 2. Return true if no critical phase failed
 *
 * OWNERSHIP:
 * - Pipeline owns all phases (std::unique_ptr)
 */
class InitializationPipeline {
 public:
  explicit InitializationPipeline(FatalHandler fatal_handler);
  ~InitializationPipeline() = default;

  InitializationPipeline(const InitializationPipeline&) = delete;
  InitializationPipeline& operator=(const InitializationPipeline&) = delete;

  /**
   * @brief Register a phase. Phases execute in registration order.
   */
  void AddPhase(std::unique_ptr<InitPhase> phase);

  /**
   * @brief Execute all registered phases.
   *
   * A critical failure stops the pipeline after the fatal handler returns
   * (only possible with a non-aborting handler, e.g. in tests).
   *
   * @return true if all critical phases succeeded
   */
  bool Execute();

  size_t phase_count() const { return phases_.size(); }

 private:
  /**
   * @return true if boot can continue
   */
  bool HandlePhaseError(const InitPhase& phase, esp_err_t error);

  FatalHandler fatal_handler_;
  std::vector<std::unique_ptr<InitPhase>> phases_;
};

}  // namespace app
