#include "uploader_settings.h"

#include <Preferences.h>
#include <oepl/log.h>

#include <cstring>

// NVS storage configuration
constexpr const char* NVS_NAMESPACE = "oepl";
constexpr const char* NVS_KEY_TARGET_ADDR = "target_addr";
constexpr const char* NVS_KEY_CONNECT_RETRIES = "conn_retries";
constexpr const char* NVS_KEY_RETRY_DELAY = "retry_delay";
constexpr const char* NVS_KEY_DATA_TYPE = "data_type";

bool UploaderSettings::load(oepl::UploadConfig& config) {
  Preferences prefs;
  if (!prefs.begin(NVS_NAMESPACE, true)) {
    OEPL_LOG_WARN("NVS namespace '%s' not found\n", NVS_NAMESPACE);
    return false;
  }

  char address[oepl::DeviceAddress::TEXT_LENGTH + 1] = {};
  const size_t length = prefs.getString(NVS_KEY_TARGET_ADDR, address, sizeof(address));

  config.connect_retries = prefs.getUInt(NVS_KEY_CONNECT_RETRIES, config.connect_retries);
  config.connect_retry_delay_ms = prefs.getUInt(NVS_KEY_RETRY_DELAY, config.connect_retry_delay_ms);
  config.data_type = prefs.getUChar(NVS_KEY_DATA_TYPE, config.data_type);
  prefs.end();

  if (length == 0) {
    OEPL_LOG_WARN("Target BLE address missing in NVS (%s:%s)\n", NVS_NAMESPACE, NVS_KEY_TARGET_ADDR);
    return false;
  }

  const auto parsed = oepl::DeviceAddress::parse(std::string_view(address, std::strlen(address)));
  if (!parsed) {
    OEPL_LOG_ERROR("Stored target address '%s' is malformed\n", address);
    return false;
  }

  config.target = *parsed;
  OEPL_LOG_INFO("Target %s, %u connect attempts, %u ms apart\n",
      config.target.c_str(),
      static_cast<unsigned>(config.connect_retries),
      static_cast<unsigned>(config.connect_retry_delay_ms));
  return true;
}

bool UploaderSettings::saveTarget(const char* address) {
  const auto parsed = oepl::DeviceAddress::parse(std::string_view(address, std::strlen(address)));
  if (!parsed) {
    OEPL_LOG_ERROR("Rejecting malformed address '%s'\n", address);
    return false;
  }

  Preferences prefs;
  if (!prefs.begin(NVS_NAMESPACE, false)) {
    OEPL_LOG_ERROR("Failed to open NVS namespace '%s'\n", NVS_NAMESPACE);
    return false;
  }
  const size_t written = prefs.putString(NVS_KEY_TARGET_ADDR, parsed->c_str());
  prefs.end();

  if (written != oepl::DeviceAddress::TEXT_LENGTH) {
    OEPL_LOG_ERROR("Failed to save target address to NVS\n");
    return false;
  }
  OEPL_LOG_INFO("Target address saved: %s\n", parsed->c_str());
  return true;
}

bool UploaderSettings::saveRetries(const uint32_t retries, const uint32_t delay_ms) {
  Preferences prefs;
  if (!prefs.begin(NVS_NAMESPACE, false)) {
    OEPL_LOG_ERROR("Failed to open NVS namespace '%s'\n", NVS_NAMESPACE);
    return false;
  }
  const bool ok = prefs.putUInt(NVS_KEY_CONNECT_RETRIES, retries) == sizeof(uint32_t)
               && prefs.putUInt(NVS_KEY_RETRY_DELAY, delay_ms) == sizeof(uint32_t);
  prefs.end();

  if (!ok) {
    OEPL_LOG_ERROR("Failed to save retry settings to NVS\n");
  }
  return ok;
}

bool UploaderSettings::saveDataType(const uint8_t data_type) {
  Preferences prefs;
  if (!prefs.begin(NVS_NAMESPACE, false)) {
    OEPL_LOG_ERROR("Failed to open NVS namespace '%s'\n", NVS_NAMESPACE);
    return false;
  }
  const bool ok = prefs.putUChar(NVS_KEY_DATA_TYPE, data_type) == sizeof(uint8_t);
  prefs.end();

  if (!ok) {
    OEPL_LOG_ERROR("Failed to save data type to NVS\n");
    return false;
  }
  OEPL_LOG_INFO("Data type saved: 0x%02X\n", data_type);
  return true;
}
