#pragma once
#include <string>
#include <stdexcept>
#include <unordered_map>

struct HttpResponse {
  long status = 0;
  std::string body;
};

// No response was obtained (DNS, connect, TLS, timeout, ...)
class HttpTransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Implementations must allow concurrent Post() calls.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  // Throws HttpTransportError when no response was received
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientTuning {
  bool verify_tls = true;
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  std::string user_agent = "loganalytics-client/1.0";
};

// Throws std::invalid_argument for non-positive keep-alive timings when keep-alive is on
void ValidateHttpClientTuning(const HttpClientTuning& tuning);

// libcurl-backed client; caller owns the result. Throws like ValidateHttpClientTuning.
HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning());
