#pragma once

#include <string>

extern "C" {
#include "esp_err.h"
}

namespace config {

/**
 * @brief Byte-level storage for the serialized record.
 *
 * The application context only talks to this interface; the device uses
 * NvsRecordStore and host tests supply in-memory stores.
 */
class RecordStore {
 public:
  virtual ~RecordStore() = default;

  /**
   * @brief Read the last saved payload.
   * @return ESP_OK, ESP_ERR_NOT_FOUND when nothing was saved, or a storage error
   */
  virtual esp_err_t Load(std::string* payload) = 0;

  /**
   * @brief Replace the stored payload (durable when ESP_OK is returned).
   */
  virtual esp_err_t Save(const std::string& payload) = 0;
};

}  // namespace config
