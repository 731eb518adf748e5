#pragma once

#include <string>

#include "config/timer_settings.hpp"

extern "C" {
#include "esp_err.h"
}

namespace config {

/**
 * @brief JSON (cJSON) serialization of PersistedRecord.
 *
 * Document layout:
 * @code
 *   {
 *     "version": 1,
 *     "settings": {
 *       "focus_time_min": 25, "short_break_time_min": 5,
 *       "long_break_time_min": 15, "long_break_interval": 4,
 *       "auto_continue": false, "dark_mode_enabled": false
 *     },
 *     "tasks": [
 *       {"id": 1, "text": "...", "estimated": 2, "completed": 0,
 *        "done": false, "position": 0}
 *     ],
 *     "next_id": 2
 *   }
 * @endcode
 *
 * Decoding is lenient field by field: a missing or out-of-range setting falls
 * back to its default, a task with missing text is dropped, and tasks are put
 * in `position` order and renumbered. Only a document that is not a JSON
 * object at all is rejected.
 */
class RecordCodec {
 public:
  /**
   * @return ESP_OK, ESP_ERR_INVALID_ARG (null out) or ESP_ERR_NO_MEM (cJSON allocation)
   */
  static esp_err_t Encode(const PersistedRecord& record, std::string* out);

  /**
   * @return ESP_OK or ESP_ERR_INVALID_RESPONSE when the payload is not a JSON object
   */
  static esp_err_t Decode(const std::string& payload, PersistedRecord* out);
};

}  // namespace config
