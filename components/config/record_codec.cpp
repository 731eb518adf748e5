#include "config/record_codec.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

extern "C" {
#include "cJSON.h"
#include "esp_log.h"
}

namespace config {

namespace {
constexpr char kLogTag[] = "record_codec";

constexpr const char* kKeyVersion = "version";
constexpr const char* kKeySettings = "settings";
constexpr const char* kKeyTasks = "tasks";
constexpr const char* kKeyNextId = "next_id";

// Settings keys use the desktop data file names
constexpr const char* kKeyFocus = "focus_time_min";
constexpr const char* kKeyShortBreak = "short_break_time_min";
constexpr const char* kKeyLongBreak = "long_break_time_min";
constexpr const char* kKeyInterval = "long_break_interval";
constexpr const char* kKeyAutoContinue = "auto_continue";
constexpr const char* kKeyDarkMode = "dark_mode_enabled";

constexpr const char* kKeyTaskId = "id";
constexpr const char* kKeyTaskText = "text";
constexpr const char* kKeyTaskEstimated = "estimated";
constexpr const char* kKeyTaskCompleted = "completed";
constexpr const char* kKeyTaskDone = "done";
constexpr const char* kKeyTaskPosition = "position";

const char* SettingKey(SettingField field) {
  switch (field) {
    case SettingField::kFocus:
      return kKeyFocus;
    case SettingField::kShortBreak:
      return kKeyShortBreak;
    case SettingField::kLongBreak:
      return kKeyLongBreak;
    case SettingField::kLongBreakInterval:
      return kKeyInterval;
  }
  return "";
}

// Non-negative integral JSON number, or nullopt
std::optional<uint32_t> ReadUint(const cJSON* object, const char* key) {
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
  if (!cJSON_IsNumber(item)) {
    return std::nullopt;
  }
  const double value = item->valuedouble;
  if (value < 0.0 || value > 4294967295.0 || std::floor(value) != value) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

bool ReadBool(const cJSON* object, const char* key, bool fallback) {
  const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
  if (!cJSON_IsBool(item)) {
    return fallback;
  }
  return cJSON_IsTrue(item);
}

void DecodeSettings(const cJSON* object, TimerSettings* settings) {
  if (!cJSON_IsObject(object)) {
    ESP_LOGW(kLogTag, "No settings object, using defaults");
    return;
  }
  for (const SettingRange& range : kSettingRanges) {
    const char* key = SettingKey(range.field);
    const std::optional<uint32_t> value = ReadUint(object, key);
    if (!value.has_value()) {
      continue;
    }
    if (*value < range.min_value || *value > range.max_value) {
      ESP_LOGW(kLogTag, "%s=%lu out of range, using default %lu", key,
               static_cast<unsigned long>(*value),
               static_cast<unsigned long>(range.default_value));
      continue;
    }
    SetSetting(*settings, range.field, *value);
  }
  settings->auto_continue = ReadBool(object, kKeyAutoContinue, settings->auto_continue);
  settings->dark_mode = ReadBool(object, kKeyDarkMode, settings->dark_mode);
}

bool DecodeTask(const cJSON* object, uint32_t fallback_position, tasks::Task* task) {
  if (!cJSON_IsObject(object)) {
    return false;
  }
  const cJSON* text = cJSON_GetObjectItemCaseSensitive(object, kKeyTaskText);
  if (!cJSON_IsString(text) || text->valuestring == nullptr) {
    return false;
  }
  if (tasks::NormalizeTaskText(text->valuestring, &task->text) != ESP_OK) {
    return false;
  }

  task->id = ReadUint(object, kKeyTaskId).value_or(0);
  const uint32_t estimated = ReadUint(object, kKeyTaskEstimated).value_or(tasks::kMinEstimate);
  task->estimated_pomodoros = std::clamp(estimated, tasks::kMinEstimate, tasks::kMaxEstimate);
  task->completed_pomodoros = ReadUint(object, kKeyTaskCompleted).value_or(0);
  task->done = ReadBool(object, kKeyTaskDone, false);
  task->position = ReadUint(object, kKeyTaskPosition).value_or(fallback_position);
  return true;
}

}  // namespace

esp_err_t RecordCodec::Encode(const PersistedRecord& record, std::string* out) {
  if (out == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  cJSON* root = cJSON_CreateObject();
  if (root == nullptr) {
    return ESP_ERR_NO_MEM;
  }

  bool ok = cJSON_AddNumberToObject(root, kKeyVersion, record.version) != nullptr;

  cJSON* settings = cJSON_AddObjectToObject(root, kKeySettings);
  ok = ok && settings != nullptr;
  if (ok) {
    for (const SettingRange& range : kSettingRanges) {
      ok = ok && cJSON_AddNumberToObject(settings, SettingKey(range.field),
                                         GetSetting(record.settings, range.field)) != nullptr;
    }
    ok = ok && cJSON_AddBoolToObject(settings, kKeyAutoContinue,
                                     record.settings.auto_continue) != nullptr;
    ok = ok && cJSON_AddBoolToObject(settings, kKeyDarkMode,
                                     record.settings.dark_mode) != nullptr;
  }

  cJSON* task_array = ok ? cJSON_AddArrayToObject(root, kKeyTasks) : nullptr;
  ok = ok && task_array != nullptr;
  for (size_t i = 0; ok && i < record.tasks.size(); ++i) {
    const tasks::Task& task = record.tasks[i];
    cJSON* item = cJSON_CreateObject();
    if (item == nullptr) {
      ok = false;
      break;
    }
    if (!cJSON_AddItemToArray(task_array, item)) {
      cJSON_Delete(item);
      ok = false;
      break;
    }
    ok = cJSON_AddNumberToObject(item, kKeyTaskId, task.id) != nullptr &&
         cJSON_AddStringToObject(item, kKeyTaskText, task.text.c_str()) != nullptr &&
         cJSON_AddNumberToObject(item, kKeyTaskEstimated, task.estimated_pomodoros) != nullptr &&
         cJSON_AddNumberToObject(item, kKeyTaskCompleted, task.completed_pomodoros) != nullptr &&
         cJSON_AddBoolToObject(item, kKeyTaskDone, task.done) != nullptr &&
         cJSON_AddNumberToObject(item, kKeyTaskPosition, static_cast<double>(i)) != nullptr;
  }

  ok = ok && cJSON_AddNumberToObject(root, kKeyNextId, record.next_task_id) != nullptr;

  char* payload = ok ? cJSON_PrintUnformatted(root) : nullptr;
  cJSON_Delete(root);
  if (payload == nullptr) {
    ESP_LOGE(kLogTag, "Failed to serialize record");
    return ESP_ERR_NO_MEM;
  }
  out->assign(payload);
  cJSON_free(payload);
  return ESP_OK;
}

esp_err_t RecordCodec::Decode(const std::string& payload, PersistedRecord* out) {
  if (out == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  cJSON* root = cJSON_ParseWithLength(payload.data(), payload.size());
  if (root == nullptr || !cJSON_IsObject(root)) {
    ESP_LOGW(kLogTag, "Record is not a JSON object (%zu bytes)", payload.size());
    cJSON_Delete(root);
    return ESP_ERR_INVALID_RESPONSE;
  }

  PersistedRecord record;
  record.version = ReadUint(root, kKeyVersion).value_or(PersistedRecord::kCurrentVersion);
  if (record.version > PersistedRecord::kCurrentVersion) {
    ESP_LOGW(kLogTag, "Record version %lu is newer than %lu, reading known fields only",
             static_cast<unsigned long>(record.version),
             static_cast<unsigned long>(PersistedRecord::kCurrentVersion));
  }
  record.version = PersistedRecord::kCurrentVersion;

  DecodeSettings(cJSON_GetObjectItemCaseSensitive(root, kKeySettings), &record.settings);

  const cJSON* task_array = cJSON_GetObjectItemCaseSensitive(root, kKeyTasks);
  if (cJSON_IsArray(task_array)) {
    uint32_t index = 0;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, task_array) {
      tasks::Task task;
      if (DecodeTask(item, index, &task)) {
        record.tasks.push_back(std::move(task));
      } else {
        ESP_LOGW(kLogTag, "Dropping malformed task entry %lu", static_cast<unsigned long>(index));
      }
      ++index;
    }
  }

  std::stable_sort(record.tasks.begin(), record.tasks.end(),
                   [](const tasks::Task& a, const tasks::Task& b) {
                     return a.position < b.position;
                   });

  // Assign ids to entries written before ids existed, and break duplicates
  uint32_t next_id = ReadUint(root, kKeyNextId).value_or(tasks::kFirstTaskId);
  for (const tasks::Task& task : record.tasks) {
    next_id = std::max(next_id, task.id + 1);
  }
  for (size_t i = 0; i < record.tasks.size(); ++i) {
    tasks::Task& task = record.tasks[i];
    const bool duplicate = std::any_of(record.tasks.begin(), record.tasks.begin() + i,
                                       [&task](const tasks::Task& other) {
                                         return other.id == task.id;
                                       });
    if (task.id == 0 || duplicate) {
      task.id = next_id++;
    }
    task.position = static_cast<uint32_t>(i);
  }
  record.next_task_id = std::max(next_id, tasks::kFirstTaskId);

  cJSON_Delete(root);
  *out = std::move(record);
  return ESP_OK;
}

}  // namespace config
