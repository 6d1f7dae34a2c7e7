#include <gtest/gtest.h>
#include "utils/time_format.hpp"
#include <chrono>

using std::chrono::system_clock;

static system_clock::time_point FromUnix(long long seconds) {
  return system_clock::time_point(std::chrono::seconds(seconds));
}

TEST(TimeFormatTest, Rfc3339UsesUtcAndZSuffix) {
  EXPECT_EQ(TimeFormat::Rfc3339Utc(FromUnix(1136214245)), "2006-01-02T15:04:05Z");
  EXPECT_EQ(TimeFormat::Rfc3339Utc(FromUnix(0)), "1970-01-01T00:00:00Z");
}

TEST(TimeFormatTest, Rfc3339DropsSubSecondPart) {
  auto tp = FromUnix(1136214245) + std::chrono::milliseconds(999);
  EXPECT_EQ(TimeFormat::Rfc3339Utc(tp), "2006-01-02T15:04:05Z");
}

TEST(TimeFormatTest, Rfc1123UsesGmtAndEnglishNames) {
  EXPECT_EQ(TimeFormat::Rfc1123Gmt(FromUnix(1136214245)), "Mon, 02 Jan 2006 15:04:05 GMT");
  EXPECT_EQ(TimeFormat::Rfc1123Gmt(FromUnix(1709251199)), "Thu, 29 Feb 2024 23:59:59 GMT");
}
