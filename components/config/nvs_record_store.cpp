#include "config/nvs_record_store.hpp"

#include <utility>

extern "C" {
#include "esp_log.h"
}

namespace config {

namespace {
constexpr char kLogTag[] = "RecordStore";
}  // namespace

NvsRecordStore::~NvsRecordStore() {
  if (opened_) {
    nvs_close(handle_);
    opened_ = false;
  }
}

esp_err_t NvsRecordStore::Initialize(const char* nvs_namespace) {
  if (opened_) {
    return ESP_ERR_INVALID_STATE;
  }
  const esp_err_t err = nvs_open(nvs_namespace, NVS_READWRITE, &handle_);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Failed to open NVS namespace '%s': %s", nvs_namespace,
             esp_err_to_name(err));
    return err;
  }
  opened_ = true;
  return ESP_OK;
}

esp_err_t NvsRecordStore::Load(std::string* payload) {
  if (payload == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }
  if (!opened_) {
    return ESP_ERR_INVALID_STATE;
  }

  // First call: get size
  size_t required_size = 0;
  esp_err_t err = nvs_get_blob(handle_, kRecordKey, nullptr, &required_size);
  if (err == ESP_ERR_NVS_NOT_FOUND) {
    return ESP_ERR_NOT_FOUND;
  }
  if (err != ESP_OK) {
    ESP_LOGW(kLogTag, "NVS error sizing '%s': %s", kRecordKey, esp_err_to_name(err));
    return err;
  }
  if (required_size == 0) {
    return ESP_ERR_NOT_FOUND;
  }

  // Second call: read blob
  std::string buffer(required_size, '\0');
  err = nvs_get_blob(handle_, kRecordKey, buffer.data(), &required_size);
  if (err != ESP_OK) {
    ESP_LOGW(kLogTag, "NVS error reading '%s': %s", kRecordKey, esp_err_to_name(err));
    return err;
  }
  buffer.resize(required_size);
  *payload = std::move(buffer);
  return ESP_OK;
}

esp_err_t NvsRecordStore::Save(const std::string& payload) {
  if (!opened_) {
    return ESP_ERR_INVALID_STATE;
  }
  esp_err_t err = nvs_set_blob(handle_, kRecordKey, payload.data(), payload.size());
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "Failed to write '%s' (%zu bytes): %s", kRecordKey, payload.size(),
             esp_err_to_name(err));
    return err;
  }
  err = nvs_commit(handle_);
  if (err != ESP_OK) {
    ESP_LOGE(kLogTag, "NVS commit failed: %s", esp_err_to_name(err));
    return err;
  }
  ESP_LOGD(kLogTag, "Saved record (%zu bytes)", payload.size());
  return ESP_OK;
}

}  // namespace config
