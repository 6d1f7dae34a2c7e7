#include "utils/time_format.hpp"
#include <ctime>
#include <cstdio>
#include <stdexcept>

namespace TimeFormat {
  static std::tm ToUtc(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#if defined(_WIN32)
    if (gmtime_s(&tm_buf, &t) != 0) throw std::runtime_error("gmtime_s failed");
#else
    if (!gmtime_r(&t, &tm_buf)) throw std::runtime_error("gmtime_r failed");
#endif
    return tm_buf;
  }

  std::string Rfc3339Utc(const std::chrono::system_clock::time_point& tp) {
    std::tm tm = ToUtc(tp);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
  }

  std::string Rfc1123Gmt(const std::chrono::system_clock::time_point& tp) {
    static const char* const kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::tm tm = ToUtc(tp);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
  }
}
