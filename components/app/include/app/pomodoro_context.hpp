#pragma once

/**
 * @file pomodoro_context.hpp
 * @brief Owned application state: settings, task ledger, timer state machine
 *
 * ARCHITECTURE RATIONALE:
 * =======================
 * PomodoroContext is the single object the rest of the firmware talks to. It
 * couples the timer to the ledger (a completed Focus phase credits the active
 * task) and keeps the persisted record in sync with every mutation.
 *
 * OWNERSHIP:
 * - Owns: TimerSettings, tasks::TaskLedger, pomodoro::TimerStateMachine
 * - Borrows: config::RecordStore (must outlive the context)
 *
 * PERSISTENCE:
 * - Load() once at boot, Flush() before a controlled reboot
 * - Every successful ledger/settings mutation is written through immediately
 * - A credited Focus completion is persisted too
 * - A failed write never rolls back in-memory state; the error is kept as a
 *   pending warning (TakePersistenceWarning) for the console to report
 *
 * THREAD SAFETY:
 * - All calls are made from the ApplicationController main loop, except
 *   TaskIndex(), which the console input task reads for TAB completion.
 *   The index is a copy refreshed after every ledger change and guarded by
 *   its own mutex; the ledger itself is never touched off the main loop.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/record_store.hpp"
#include "config/timer_settings.hpp"
#include "pomodoro/timer_state_machine.hpp"
#include "tasks/task_ledger.hpp"

extern "C" {
#include "esp_err.h"
}

namespace app {

/**
 * @brief Result of a control that may have completed a phase.
 */
struct PhaseNotice {
  pomodoro::PhaseEvent event{};
  std::optional<uint32_t> credited_task;  // Set when a Focus completion credited a task
};

struct TaskIndexEntry {
  uint32_t id = 0;
  bool done = false;
};

struct ContextSnapshot {
  pomodoro::TimerSnapshot timer{};
  std::optional<uint32_t> active_task;
  bool dark_mode = false;
};

class PomodoroContext {
 public:
  explicit PomodoroContext(config::RecordStore* store);

  PomodoroContext(const PomodoroContext&) = delete;
  PomodoroContext& operator=(const PomodoroContext&) = delete;

  /**
   * @brief Read the persisted record and configure the timer.
   *
   * - ESP_ERR_NOT_FOUND or malformed record: defaults, written back
   * - store read failure: defaults, persistence warning raised
   *
   * @return ESP_OK in all of the cases above (the context is always usable)
   */
  esp_err_t Load();

  /**
   * @brief Write the current record to the store.
   */
  esp_err_t Flush();

  // Timer controls
  esp_err_t Start();
  esp_err_t Pause();
  esp_err_t Resume();
  esp_err_t TogglePause();
  void Reset();
  std::optional<PhaseNotice> Skip();
  void SelectPhase(pomodoro::Phase phase);
  std::optional<PhaseNotice> Tick();

  // Ledger operations (write-through)
  esp_err_t AddTask(const std::string& text, uint32_t estimated = tasks::kMinEstimate,
                    uint32_t* out_id = nullptr);
  esp_err_t EditTask(uint32_t id, const std::string& text);
  esp_err_t SetTaskEstimate(uint32_t id, uint32_t estimated);
  esp_err_t DeleteTask(uint32_t id);
  esp_err_t ReorderTask(uint32_t id, uint32_t new_position);
  esp_err_t SetActiveTask(uint32_t id);
  void ClearActiveTask();
  esp_err_t ToggleTaskComplete(uint32_t id);

  /**
   * @brief Validate and apply new timer settings.
   *
   * Invalid settings are rejected with ESP_ERR_INVALID_ARG and nothing
   * changes. Valid settings leave the timer in a paused Focus phase with the
   * new duration (counter cleared) and are persisted. The theme flag in @p settings is ignored; use SetDarkMode().
   */
  esp_err_t ApplyTimerSettings(const config::TimerSettings& settings,
                               std::string* error = nullptr);
  esp_err_t SetDarkMode(bool enabled);

  /**
   * @brief Return and clear the last persistence error.
   * @return ESP_OK when no write has failed since the last call
   */
  esp_err_t TakePersistenceWarning();

  ContextSnapshot Snapshot() const;

  /**
   * @brief Ids and done flags of the tasks in display order.
   *
   * Thread-safe: Yes (copy taken under index_mutex_)
   */
  std::vector<TaskIndexEntry> TaskIndex() const;

  const config::TimerSettings& settings() const { return settings_; }
  const tasks::TaskLedger& ledger() const { return ledger_; }
  const pomodoro::TimerStateMachine& timer() const { return timer_; }

 private:
  std::optional<PhaseNotice> HandlePhaseEvent(const std::optional<pomodoro::PhaseEvent>& event);
  void Persist();  // Failure becomes the pending warning
  esp_err_t WriteRecord();
  esp_err_t CommitLedgerChange(esp_err_t result);
  void RefreshTaskIndex();
  config::PersistedRecord BuildRecord() const;

  config::RecordStore* store_;
  config::TimerSettings settings_{};
  tasks::TaskLedger ledger_;
  pomodoro::TimerStateMachine timer_;
  esp_err_t pending_warning_ = ESP_OK;

  mutable std::mutex index_mutex_;
  std::vector<TaskIndexEntry> task_index_;
};

}  // namespace app
