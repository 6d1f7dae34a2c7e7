#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}

struct CurlEasyDeleter {
  void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

// curl_global_init/cleanup are not thread-safe; run them once per process
struct CurlGlobal {
  CURLcode rc;
  CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
  ~CurlGlobal() { if (rc == CURLE_OK) curl_global_cleanup(); }
};

void EnsureCurlGlobal() {
  static CurlGlobal global;
  if (global.rc != CURLE_OK) {
    throw HttpTransportError(std::string("curl_global_init failed: ") + curl_easy_strerror(global.rc));
  }
}
}

void ValidateHttpClientTuning(const HttpClientTuning& tuning) {
  if (tuning.enable_tcp_keepalive && (tuning.tcp_keepidle_s <= 0 || tuning.tcp_keepintvl_s <= 0)) {
    throw std::invalid_argument("tcp keep-alive idle and interval must be positive");
  }
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    EnsureCurlGlobal();
    // DNS and TLS sessions are shared between the per-request easy handles
    share_ = curl_share_init();
    if (share_) {
      curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlHttpClient::LockShare);
      curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlHttpClient::UnlockShare);
      curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
      curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
      curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    } else {
      Logger::Warning("curl_share_init failed; requests will not share DNS/TLS caches");
    }
  }
  ~CurlHttpClient() override {
    if (share_) curl_share_cleanup(share_);
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) throw HttpTransportError("curl_easy_init failed");
    curl_slist* raw_list = nullptr;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      curl_slist* next = curl_slist_append(raw_list, line.c_str());
      if (!next) {
        curl_slist_free_all(raw_list);
        throw HttpTransportError("curl_slist_append failed");
      }
      raw_list = next;
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_list);
    std::string response_string;
    char error_buf[CURL_ERROR_SIZE] = {0};
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buf);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, tuning_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    if (tuning_.enable_tcp_keepalive) {
      // CMake requires libcurl >= 7.25 for these two
      curl_easy_setopt(h, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
      curl_easy_setopt(h, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    }
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, tuning_.verify_tls ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, tuning_.verify_tls ? 2L : 0L);
    if (share_) curl_easy_setopt(h, CURLOPT_SHARE, share_);

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
      std::string detail = error_buf[0] ? std::string(error_buf) : std::string(curl_easy_strerror(rc));
      throw HttpTransportError("POST " + url + " failed: " + detail);
    }
    HttpResponse resp;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(response_string);
    return resp;
  }

private:
  static void LockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    static_cast<CurlHttpClient*>(userptr)->share_mutexes_[data].lock();
  }
  static void UnlockShare(CURL*, curl_lock_data data, void* userptr) {
    static_cast<CurlHttpClient*>(userptr)->share_mutexes_[data].unlock();
  }

  HttpClientTuning tuning_;
  CURLSH* share_ = nullptr;
  std::mutex share_mutexes_[CURL_LOCK_DATA_LAST];
};

HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning) {
  ValidateHttpClientTuning(tuning);
  return new CurlHttpClient(tuning);
}
