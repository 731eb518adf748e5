#pragma once

#include "config/record_store.hpp"

extern "C" {
#include "nvs.h"
}

namespace config {

/**
 * @brief RecordStore backed by a single NVS blob.
 *
 * The record lives under key "record" in its own namespace and every Save()
 * is followed by nvs_commit(), so a power cut loses at most the write in
 * flight. nvs_flash_init() must have run before Initialize().
 */
class NvsRecordStore : public RecordStore {
 public:
  static constexpr const char* kDefaultNamespace = "pomotodo";
  static constexpr const char* kRecordKey = "record";

  NvsRecordStore() = default;
  ~NvsRecordStore() override;

  NvsRecordStore(const NvsRecordStore&) = delete;
  NvsRecordStore& operator=(const NvsRecordStore&) = delete;

  esp_err_t Initialize(const char* nvs_namespace = kDefaultNamespace);
  bool IsInitialized() const { return opened_; }

  esp_err_t Load(std::string* payload) override;
  esp_err_t Save(const std::string& payload) override;

 private:
  nvs_handle_t handle_{0};
  bool opened_ = false;
};

}  // namespace config
