#pragma once
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

using Metadata = std::unordered_map<std::string, std::string>;
using LogRecord = std::map<std::string, std::string>;

// metadata + {"message": message, "Timestamp": timestamp}; the two fixed keys win
LogRecord BuildLogRecord(const Metadata& metadata, const std::string& message, const std::string& timestamp);

std::vector<LogRecord> BuildLogRecords(const Metadata& metadata,
                                       const std::vector<std::string>& messages,
                                       const std::string& timestamp);

// JSON array of flat objects in record order. Invalid UTF-8 is replaced, never thrown.
std::string SerializeLogRecords(const std::vector<LogRecord>& records);
