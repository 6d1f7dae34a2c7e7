#pragma once
#include <string>

namespace LogAnalyticsConstants {
  inline const std::string API_VERSION = "2016-04-01";
  // Public cloud. Sovereign clouds use e.g. ods.opinsights.azure.us
  inline const std::string DEFAULT_ENDPOINT_SUFFIX = "ods.opinsights.azure.com";
  inline const std::string LOGS_RESOURCE = "/api/logs";
  inline const std::string CONTENT_TYPE = "application/json";
  inline const std::string MESSAGE_FIELD = "message";
  inline const std::string TIMESTAMP_FIELD = "Timestamp";
  inline constexpr int REQUEST_TIMEOUT_MS = 30000;
  inline constexpr long STATUS_OK = 200;
  inline constexpr size_t MAX_LOG_TYPE_LENGTH = 100;
}
