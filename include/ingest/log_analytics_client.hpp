#pragma once
#include "constants/log_analytics.hpp"
#include "ingest/log_record.hpp"
#include "scheduler/retry_policy.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class Clock;
class HttpClient;
class DelayedTaskQueue;

struct LogAnalyticsClientOptions {
  std::string endpoint_suffix = LogAnalyticsConstants::DEFAULT_ENDPOINT_SUFFIX;
  RetryPolicy retry_policy;
  size_t max_pending_retries = 1000; // 0 = unbounded
  const Clock* clock = nullptr;      // nullptr = SystemClock::Instance()
};

// Posts log messages to one Log Analytics workspace using SharedKey authorization.
// PostMessages() may be called concurrently; failed batches are retried on a
// single background worker owned by the client.
class LogAnalyticsClient {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  // Throws SigningKeyError for an unusable secret, std::invalid_argument for a bad id or log type.
  // `http` must outlive the client.
  LogAnalyticsClient(HttpClient& http,
                     const std::string& workspace_id,
                     const std::string& workspace_secret,
                     const std::string& log_type,
                     const Metadata& metadata = Metadata(),
                     const LogAnalyticsClientOptions& options = LogAnalyticsClientOptions());
  ~LogAnalyticsClient();
  LogAnalyticsClient(const LogAnalyticsClient&) = delete;
  LogAnalyticsClient& operator=(const LogAnalyticsClient&) = delete;

  // Throws TransportError or HttpStatusError. An unset timestamp means now.
  void PostMessage(const std::string& message, std::optional<TimePoint> timestamp = std::nullopt);
  void PostMessages(const std::vector<std::string>& messages, std::optional<TimePoint> timestamp = std::nullopt);

  size_t PendingRetries() const;
  bool WaitForRetries(std::chrono::milliseconds timeout);
  // Stops the retry worker. drain=true attempts every pending retry once, right away.
  // Returns the number of retries dropped.
  size_t Shutdown(bool drain = true);

  const std::string& WorkspaceId() const { return workspace_id_; }
  const std::string& LogType() const { return log_type_; }
  const std::string& LogsUrl() const { return logs_url_; }
  const Metadata& StaticMetadata() const { return metadata_; }

private:
  struct SignedRequest {
    std::string body;
    std::unordered_map<std::string, std::string> headers;
  };
  SignedRequest BuildRequest(const std::vector<std::string>& messages, TimePoint timestamp) const;
  void Deliver(const std::vector<std::string>& messages, TimePoint timestamp) const;
  bool ScheduleRetry(const std::vector<std::string>& messages, TimePoint timestamp, unsigned int retry);
  void RunRetry(const std::vector<std::string>& messages, TimePoint timestamp, unsigned int retry);

  HttpClient& http_;
  const Clock& clock_;
  const std::string workspace_id_;
  const std::string log_type_;
  const std::string logs_url_;
  const std::vector<unsigned char> signing_key_;
  const Metadata metadata_;
  const RetryPolicy retry_policy_;
  // Declared last: its worker calls back into this object
  std::unique_ptr<DelayedTaskQueue> retries_;
};
