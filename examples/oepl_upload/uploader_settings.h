/*
 * Uploader Settings (NVS-backed)
 *
 * Target tag address and retry budgets, persisted in the ESP32 NVS
 * namespace "oepl" so the same firmware can drive different tags.
 *
 * Storage: ESP32 NVS via Preferences
 */

#ifndef UPLOADER_SETTINGS_H
#define UPLOADER_SETTINGS_H

#include <stddef.h>
#include <stdint.h>

#include <oepl/config.hpp>

struct UploaderSettings {
  /**
   * Load settings from NVS into `config`, keeping defaults for missing keys
   * @return false if no valid target address is stored
   */
  static bool load(oepl::UploadConfig& config);

  /**
   * Persist the target address
   * @return false if the address is malformed or the write failed
   */
  static bool saveTarget(const char* address);

  /**
   * Persist connect retry budget and delay
   * @return false if the write failed
   */
  static bool saveRetries(uint32_t retries, uint32_t delay_ms);

  /**
   * Persist the image data type announced to the tag
   * @return false if the write failed
   */
  static bool saveDataType(uint8_t data_type);
};

#endif // UPLOADER_SETTINGS_H
