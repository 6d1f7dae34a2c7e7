#include "ingest/log_record.hpp"
#include "constants/log_analytics.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

LogRecord BuildLogRecord(const Metadata& metadata, const std::string& message, const std::string& timestamp) {
  LogRecord record(metadata.begin(), metadata.end());
  record[LogAnalyticsConstants::MESSAGE_FIELD] = message;
  record[LogAnalyticsConstants::TIMESTAMP_FIELD] = timestamp;
  return record;
}

std::vector<LogRecord> BuildLogRecords(const Metadata& metadata,
                                       const std::vector<std::string>& messages,
                                       const std::string& timestamp) {
  std::vector<LogRecord> records;
  records.reserve(messages.size());
  for (const auto& m : messages) records.push_back(BuildLogRecord(metadata, m, timestamp));
  return records;
}

std::string SerializeLogRecords(const std::vector<LogRecord>& records) {
  json arr = json::array();
  for (const auto& r : records) {
    json obj = json::object();
    for (const auto& kv : r) obj[kv.first] = kv.second;
    arr.push_back(std::move(obj));
  }
  return arr.dump(-1, ' ', false, json::error_handler_t::replace);
}
