#include "tasks/task_ledger.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

extern "C" {
#include "esp_log.h"
}

namespace tasks {

namespace {
constexpr char kLogTag[] = "task_ledger";

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool EstimateInRange(uint32_t estimated) {
  return estimated >= kMinEstimate && estimated <= kMaxEstimate;
}

}  // namespace

esp_err_t NormalizeTaskText(const std::string& text, std::string* out) {
  if (out == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }
  auto begin = std::find_if_not(text.begin(), text.end(), IsSpace);
  auto end = std::find_if_not(text.rbegin(), text.rend(), IsSpace).base();
  if (begin >= end) {
    ESP_LOGW(kLogTag, "Task text is empty");
    return ESP_ERR_INVALID_ARG;
  }
  std::string trimmed(begin, end);
  if (trimmed.size() > kMaxTextLength) {
    ESP_LOGW(kLogTag, "Task text too long (%zu > %zu bytes)", trimmed.size(), kMaxTextLength);
    return ESP_ERR_INVALID_ARG;
  }
  *out = std::move(trimmed);
  return ESP_OK;
}

void TaskLedger::Restore(std::vector<Task> tasks, uint32_t next_id,
                         std::optional<uint32_t> active_id) {
  tasks_ = std::move(tasks);
  if (tasks_.size() > kMaxTasks) {
    ESP_LOGW(kLogTag, "Restored ledger truncated from %zu to %zu tasks", tasks_.size(),
             kMaxTasks);
    tasks_.resize(kMaxTasks);
  }
  Renumber();

  next_id_ = std::max(next_id, kFirstTaskId);
  for (const Task& task : tasks_) {
    if (task.id >= next_id_) {
      next_id_ = task.id + 1;
    }
  }

  active_id_.reset();
  if (active_id.has_value()) {
    const Task* task = Find(*active_id);
    if (task != nullptr && !task->done) {
      active_id_ = active_id;
    }
  }
  ESP_LOGI(kLogTag, "Restored %zu tasks (next id %lu)", tasks_.size(),
           static_cast<unsigned long>(next_id_));
}

esp_err_t TaskLedger::Add(const std::string& text, uint32_t estimated, uint32_t* out_id) {
  if (tasks_.size() >= kMaxTasks) {
    ESP_LOGW(kLogTag, "Ledger full (%zu tasks)", kMaxTasks);
    return ESP_ERR_NO_MEM;
  }
  if (!EstimateInRange(estimated)) {
    return ESP_ERR_INVALID_ARG;
  }
  std::string normalized;
  const esp_err_t err = NormalizeTaskText(text, &normalized);
  if (err != ESP_OK) {
    return err;
  }

  Task task;
  task.id = next_id_++;
  task.text = std::move(normalized);
  task.estimated_pomodoros = estimated;
  task.position = static_cast<uint32_t>(tasks_.size());
  tasks_.push_back(std::move(task));

  if (out_id != nullptr) {
    *out_id = tasks_.back().id;
  }
  ESP_LOGI(kLogTag, "Added task %lu (est %lu)", static_cast<unsigned long>(tasks_.back().id),
           static_cast<unsigned long>(estimated));
  return ESP_OK;
}

esp_err_t TaskLedger::Edit(uint32_t id, const std::string& text) {
  auto it = FindIt(id);
  if (it == tasks_.end()) {
    return ESP_ERR_NOT_FOUND;
  }
  std::string normalized;
  const esp_err_t err = NormalizeTaskText(text, &normalized);
  if (err != ESP_OK) {
    return err;
  }
  it->text = std::move(normalized);
  return ESP_OK;
}

esp_err_t TaskLedger::SetEstimate(uint32_t id, uint32_t estimated) {
  auto it = FindIt(id);
  if (it == tasks_.end()) {
    return ESP_ERR_NOT_FOUND;
  }
  if (!EstimateInRange(estimated)) {
    return ESP_ERR_INVALID_ARG;
  }
  it->estimated_pomodoros = estimated;
  // Raising the estimate above the work already done reopens the task
  if (it->done && it->completed_pomodoros < estimated) {
    it->done = false;
    ESP_LOGI(kLogTag, "Task %lu reopened (%lu/%lu)", static_cast<unsigned long>(id),
             static_cast<unsigned long>(it->completed_pomodoros),
             static_cast<unsigned long>(estimated));
  }
  return ESP_OK;
}

esp_err_t TaskLedger::Delete(uint32_t id) {
  auto it = FindIt(id);
  if (it == tasks_.end()) {
    return ESP_ERR_NOT_FOUND;
  }
  tasks_.erase(it);
  if (active_id_ == id) {
    active_id_.reset();
  }
  Renumber();
  ESP_LOGI(kLogTag, "Deleted task %lu", static_cast<unsigned long>(id));
  return ESP_OK;
}

esp_err_t TaskLedger::Reorder(uint32_t id, uint32_t new_position) {
  auto it = FindIt(id);
  if (it == tasks_.end()) {
    return ESP_ERR_NOT_FOUND;
  }
  if (new_position >= tasks_.size()) {
    return ESP_ERR_INVALID_ARG;
  }
  const auto from = static_cast<size_t>(it - tasks_.begin());
  const auto to = static_cast<size_t>(new_position);
  if (from < to) {
    std::rotate(tasks_.begin() + from, tasks_.begin() + from + 1, tasks_.begin() + to + 1);
  } else if (from > to) {
    std::rotate(tasks_.begin() + to, tasks_.begin() + from, tasks_.begin() + from + 1);
  }
  Renumber();
  return ESP_OK;
}

esp_err_t TaskLedger::SetActive(uint32_t id) {
  const Task* task = Find(id);
  if (task == nullptr) {
    return ESP_ERR_NOT_FOUND;
  }
  if (task->done) {
    return ESP_ERR_INVALID_STATE;
  }
  active_id_ = id;
  return ESP_OK;
}

void TaskLedger::ClearActive() {
  active_id_.reset();
}

esp_err_t TaskLedger::ToggleComplete(uint32_t id) {
  auto it = FindIt(id);
  if (it == tasks_.end()) {
    return ESP_ERR_NOT_FOUND;
  }
  if (it->done) {
    it->done = false;
    return ESP_OK;
  }
  it->done = true;
  it->completed_pomodoros = std::max(it->completed_pomodoros, it->estimated_pomodoros);
  if (active_id_ == id) {
    active_id_.reset();
  }
  return ESP_OK;
}

std::optional<uint32_t> TaskLedger::CreditActive() {
  if (!active_id_.has_value()) {
    return std::nullopt;
  }
  auto it = FindIt(*active_id_);
  if (it == tasks_.end() || it->done) {
    active_id_.reset();
    return std::nullopt;
  }

  const uint32_t id = it->id;
  ++it->completed_pomodoros;
  if (it->completed_pomodoros >= it->estimated_pomodoros) {
    it->done = true;
    active_id_.reset();
    ESP_LOGI(kLogTag, "Task %lu reached its estimate (%lu)", static_cast<unsigned long>(id),
             static_cast<unsigned long>(it->estimated_pomodoros));
  }
  return id;
}

const Task* TaskLedger::Find(uint32_t id) const {
  auto it = std::find_if(tasks_.begin(), tasks_.end(),
                         [id](const Task& task) { return task.id == id; });
  return it == tasks_.end() ? nullptr : &*it;
}

std::vector<Task>::iterator TaskLedger::FindIt(uint32_t id) {
  return std::find_if(tasks_.begin(), tasks_.end(),
                      [id](const Task& task) { return task.id == id; });
}

void TaskLedger::Renumber() {
  for (size_t i = 0; i < tasks_.size(); ++i) {
    tasks_[i].position = static_cast<uint32_t>(i);
  }
}

}  // namespace tasks
