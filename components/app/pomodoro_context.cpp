#include "app/pomodoro_context.hpp"

#include <utility>

#include "config/record_codec.hpp"

extern "C" {
#include "esp_log.h"
}

namespace app {

namespace {
constexpr char kLogTag[] = "context";
}  // namespace

PomodoroContext::PomodoroContext(config::RecordStore* store) : store_(store) {
  if (timer_.Configure(config::ToTimerConfig(settings_)) != ESP_OK) {
    ESP_LOGE(kLogTag, "Default timer settings rejected");
  }
}

esp_err_t PomodoroContext::Load() {
  config::PersistedRecord record;
  bool write_back = false;

  std::string payload;
  const esp_err_t load_err = store_ != nullptr ? store_->Load(&payload) : ESP_ERR_INVALID_STATE;
  if (load_err == ESP_OK) {
    if (config::RecordCodec::Decode(payload, &record) != ESP_OK) {
      ESP_LOGW(kLogTag, "Stored record is corrupt, starting from defaults");
      record = config::PersistedRecord{};
      write_back = true;
    }
  } else if (load_err == ESP_ERR_NOT_FOUND) {
    ESP_LOGI(kLogTag, "No stored record, starting from defaults");
    write_back = true;
  } else {
    ESP_LOGW(kLogTag, "Record load failed: %s (using defaults)", esp_err_to_name(load_err));
    pending_warning_ = load_err;
  }

  std::string error;
  if (config::ValidateTimerSettings(record.settings, &error) != ESP_OK) {
    ESP_LOGW(kLogTag, "Stored settings rejected (%s), using defaults", error.c_str());
    const bool dark_mode = record.settings.dark_mode;
    record.settings = config::TimerSettings{};
    record.settings.dark_mode = dark_mode;
    write_back = true;
  }

  settings_ = record.settings;
  ledger_.Restore(std::move(record.tasks), record.next_task_id);
  RefreshTaskIndex();
  const esp_err_t err = timer_.Configure(config::ToTimerConfig(settings_));
  if (err != ESP_OK) {
    return err;
  }

  ESP_LOGI(kLogTag, "Loaded %zu tasks, focus=%lu short=%lu long=%lu interval=%lu",
           ledger_.size(), static_cast<unsigned long>(settings_.focus_minutes),
           static_cast<unsigned long>(settings_.short_break_minutes),
           static_cast<unsigned long>(settings_.long_break_minutes),
           static_cast<unsigned long>(settings_.long_break_interval));

  if (write_back) {
    Persist();
  }
  return ESP_OK;
}

esp_err_t PomodoroContext::Flush() {
  const esp_err_t err = WriteRecord();
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Flush failed: %s", esp_err_to_name(err));
  }
  return err;
}

esp_err_t PomodoroContext::Start() {
  return timer_.Start();
}

esp_err_t PomodoroContext::Pause() {
  return timer_.Pause();
}

esp_err_t PomodoroContext::Resume() {
  return timer_.Resume();
}

esp_err_t PomodoroContext::TogglePause() {
  if (timer_.phase() == pomodoro::Phase::kIdle) {
    return timer_.Start();
  }
  return timer_.running() ? timer_.Pause() : timer_.Resume();
}

void PomodoroContext::Reset() {
  timer_.Reset();
}

std::optional<PhaseNotice> PomodoroContext::Skip() {
  return HandlePhaseEvent(timer_.Skip());
}

void PomodoroContext::SelectPhase(pomodoro::Phase phase) {
  timer_.SelectPhase(phase);
}

std::optional<PhaseNotice> PomodoroContext::Tick() {
  return HandlePhaseEvent(timer_.Tick());
}

esp_err_t PomodoroContext::AddTask(const std::string& text, uint32_t estimated,
                                   uint32_t* out_id) {
  return CommitLedgerChange(ledger_.Add(text, estimated, out_id));
}

esp_err_t PomodoroContext::EditTask(uint32_t id, const std::string& text) {
  return CommitLedgerChange(ledger_.Edit(id, text));
}

esp_err_t PomodoroContext::SetTaskEstimate(uint32_t id, uint32_t estimated) {
  return CommitLedgerChange(ledger_.SetEstimate(id, estimated));
}

esp_err_t PomodoroContext::DeleteTask(uint32_t id) {
  return CommitLedgerChange(ledger_.Delete(id));
}

esp_err_t PomodoroContext::ReorderTask(uint32_t id, uint32_t new_position) {
  return CommitLedgerChange(ledger_.Reorder(id, new_position));
}

// The active association is session state and is not part of the record
esp_err_t PomodoroContext::SetActiveTask(uint32_t id) {
  return ledger_.SetActive(id);
}

void PomodoroContext::ClearActiveTask() {
  ledger_.ClearActive();
}

esp_err_t PomodoroContext::ToggleTaskComplete(uint32_t id) {
  return CommitLedgerChange(ledger_.ToggleComplete(id));
}

esp_err_t PomodoroContext::ApplyTimerSettings(const config::TimerSettings& settings,
                                              std::string* error) {
  esp_err_t err = config::ValidateTimerSettings(settings, error);
  if (err != ESP_OK) {
    return err;
  }

  config::TimerSettings next = settings;
  next.dark_mode = settings_.dark_mode;
  err = timer_.Configure(config::ToTimerConfig(next));
  if (err != ESP_OK) {
    return err;
  }
  settings_ = next;
  // New durations take effect from a fresh, paused Focus session
  timer_.SelectPhase(pomodoro::Phase::kFocus);
  Persist();
  return ESP_OK;
}

esp_err_t PomodoroContext::SetDarkMode(bool enabled) {
  settings_.dark_mode = enabled;
  Persist();
  return ESP_OK;
}

esp_err_t PomodoroContext::TakePersistenceWarning() {
  const esp_err_t warning = pending_warning_;
  pending_warning_ = ESP_OK;
  return warning;
}

ContextSnapshot PomodoroContext::Snapshot() const {
  ContextSnapshot snapshot;
  snapshot.timer = timer_.Snapshot();
  snapshot.active_task = ledger_.active_id();
  snapshot.dark_mode = settings_.dark_mode;
  return snapshot;
}

std::optional<PhaseNotice> PomodoroContext::HandlePhaseEvent(
    const std::optional<pomodoro::PhaseEvent>& event) {
  if (!event.has_value()) {
    return std::nullopt;
  }
  PhaseNotice notice;
  notice.event = *event;
  if (event->ended == pomodoro::Phase::kFocus) {
    notice.credited_task = ledger_.CreditActive();
    if (notice.credited_task.has_value()) {
      RefreshTaskIndex();
      Persist();
    }
  }
  return notice;
}

void PomodoroContext::Persist() {
  const esp_err_t err = WriteRecord();
  if (err != ESP_OK) {
    ESP_LOGW(kLogTag, "Persisting record failed: %s (in-memory state kept)",
             esp_err_to_name(err));
    pending_warning_ = err;
  }
}

esp_err_t PomodoroContext::WriteRecord() {
  if (store_ == nullptr) {
    return ESP_ERR_INVALID_STATE;
  }
  std::string payload;
  const esp_err_t err = config::RecordCodec::Encode(BuildRecord(), &payload);
  if (err != ESP_OK) {
    return err;
  }
  return store_->Save(payload);
}

esp_err_t PomodoroContext::CommitLedgerChange(esp_err_t result) {
  if (result == ESP_OK) {
    RefreshTaskIndex();
    Persist();
  }
  return result;
}

void PomodoroContext::RefreshTaskIndex() {
  std::vector<TaskIndexEntry> index;
  index.reserve(ledger_.size());
  for (const tasks::Task& task : ledger_.tasks()) {
    index.push_back(TaskIndexEntry{task.id, task.done});
  }
  std::lock_guard<std::mutex> lock(index_mutex_);
  task_index_.swap(index);
}

std::vector<TaskIndexEntry> PomodoroContext::TaskIndex() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  return task_index_;
}

config::PersistedRecord PomodoroContext::BuildRecord() const {
  config::PersistedRecord record;
  record.settings = settings_;
  record.tasks = ledger_.tasks();
  record.next_task_id = ledger_.next_id();
  return record;
}

}  // namespace app
