#include <gtest/gtest.h>
#include "net/http_client.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <thread>
#include <vector>

TEST(HttpClientTuningTest, DefaultsAreValid) {
  EXPECT_NO_THROW(ValidateHttpClientTuning(HttpClientTuning()));
}

TEST(HttpClientTuningTest, RejectsNonPositiveKeepAliveTimings) {
  HttpClientTuning idle;
  idle.tcp_keepidle_s = 0;
  EXPECT_THROW(ValidateHttpClientTuning(idle), std::invalid_argument);
  EXPECT_THROW(std::unique_ptr<HttpClient>(CreateCurlHttpClient(idle)), std::invalid_argument);

  HttpClientTuning interval;
  interval.tcp_keepintvl_s = -5;
  EXPECT_THROW(ValidateHttpClientTuning(interval), std::invalid_argument);
}

TEST(HttpClientTuningTest, TimingsIgnoredWhenKeepAliveOff) {
  HttpClientTuning tuning;
  tuning.enable_tcp_keepalive = false;
  tuning.tcp_keepidle_s = 0;
  EXPECT_NO_THROW(ValidateHttpClientTuning(tuning));
}

TEST(CurlHttpClientTest, ClientsCanBeCreatedAndDestroyedConcurrently) {
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&failures]{
      for (int i = 0; i < 10; ++i) {
        try {
          std::unique_ptr<HttpClient> http(CreateCurlHttpClient());
          if (!http) ++failures;
        } catch (const std::exception&) {
          ++failures;
        }
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(failures.load(), 0);
}

TEST(CurlHttpClientTest, RefusedConnectionWithKeepAliveTuningIsTransportError) {
  HttpClientTuning tuning;
  tuning.tcp_keepidle_s = 10;
  tuning.tcp_keepintvl_s = 5;
  std::unique_ptr<HttpClient> http(CreateCurlHttpClient(tuning));
  std::unordered_map<std::string, std::string> headers{{"Content-Type", "application/json"}};
  // Port 1 on loopback has no listener
  EXPECT_THROW(http->Post("http://127.0.0.1:1/api/logs", "[]", headers, 2000), HttpTransportError);
}
