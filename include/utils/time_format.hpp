#pragma once
#include <string>
#include <chrono>

namespace TimeFormat {
  // 2006-01-02T15:04:05Z
  std::string Rfc3339Utc(const std::chrono::system_clock::time_point& tp);
  // Mon, 02 Jan 2006 15:04:05 GMT (English names, independent of the C locale)
  std::string Rfc1123Gmt(const std::chrono::system_clock::time_point& tp);
}
