#pragma once

/**
 * @file task_ledger.hpp
 * @brief Ordered to-do list with per-task Pomodoro progress
 *
 * The ledger is the second half of the application core: it owns the task
 * list and the "active task" association, and is credited by the owner once
 * per completed Focus phase (see app::PomodoroContext).
 *
 * ORDERING:
 * - Tasks are stored in display order; Task::position always equals the index
 *   in that order (dense 0..n-1). Reorder() and Delete() keep it that way.
 *
 * ERRORS:
 * - ESP_ERR_NOT_FOUND     unknown id (no side effects)
 * - ESP_ERR_INVALID_ARG   empty/oversized text, estimate or position out of range
 * - ESP_ERR_INVALID_STATE done task cannot become active
 * - ESP_ERR_NO_MEM        ledger full
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

extern "C" {
#include "esp_err.h"
}

namespace tasks {

constexpr size_t kMaxTasks = 32;
constexpr size_t kMaxTextLength = 96;   // Bytes, after trimming
constexpr uint32_t kMinEstimate = 1;
constexpr uint32_t kMaxEstimate = 10;
constexpr uint32_t kFirstTaskId = 1;

struct Task {
  uint32_t id = 0;
  std::string text;
  uint32_t estimated_pomodoros = kMinEstimate;
  uint32_t completed_pomodoros = 0;
  uint32_t position = 0;
  bool done = false;
};

/**
 * @brief Strip leading/trailing whitespace and check the length limits.
 * @return ESP_OK with the trimmed text in *out, or ESP_ERR_INVALID_ARG
 */
esp_err_t NormalizeTaskText(const std::string& text, std::string* out);

class TaskLedger {
 public:
  TaskLedger() = default;

  /**
   * @brief Replace the whole ledger (used when loading the persisted record).
   *
   * Tasks must already be in display order; positions are re-densified.
   * next_id is raised above the largest id present. An active id that does
   * not name an open task is dropped.
   */
  void Restore(std::vector<Task> tasks, uint32_t next_id,
               std::optional<uint32_t> active_id = std::nullopt);

  esp_err_t Add(const std::string& text, uint32_t estimated = kMinEstimate,
                uint32_t* out_id = nullptr);
  esp_err_t Edit(uint32_t id, const std::string& text);
  esp_err_t SetEstimate(uint32_t id, uint32_t estimated);
  esp_err_t Delete(uint32_t id);
  esp_err_t Reorder(uint32_t id, uint32_t new_position);

  esp_err_t SetActive(uint32_t id);
  void ClearActive();

  esp_err_t ToggleComplete(uint32_t id);

  /**
   * @brief Add one completed Pomodoro to the active task.
   *
   * Called once per Focus phase-complete. When the count reaches the
   * estimate the task is marked done and the association is cleared.
   *
   * @return Credited task id, or nullopt when no task is active
   */
  std::optional<uint32_t> CreditActive();

  const Task* Find(uint32_t id) const;
  const std::vector<Task>& tasks() const { return tasks_; }
  std::optional<uint32_t> active_id() const { return active_id_; }
  uint32_t next_id() const { return next_id_; }
  size_t size() const { return tasks_.size(); }
  bool empty() const { return tasks_.empty(); }

 private:
  std::vector<Task>::iterator FindIt(uint32_t id);
  void Renumber();

  std::vector<Task> tasks_;
  std::optional<uint32_t> active_id_;
  uint32_t next_id_ = kFirstTaskId;
};

}  // namespace tasks
