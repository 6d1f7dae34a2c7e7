#include "ingest/log_analytics_client.hpp"
#include "ingest/delivery_error.hpp"
#include "auth/shared_key.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "crypto/base64.hpp"
#include "net/http_client.hpp"
#include "scheduler/delayed_task_queue.hpp"
#include "utils/time_format.hpp"
#include <cctype>
#include <stdexcept>

namespace {
std::vector<unsigned char> DecodeSigningKey(const std::string& workspace_secret) {
  std::vector<unsigned char> key;
  try {
    key = Crypto::Base64Decode(workspace_secret);
  } catch (const std::invalid_argument& ex) {
    throw SigningKeyError(std::string("workspace secret is not valid base64: ") + ex.what());
  }
  if (key.empty()) throw SigningKeyError("workspace secret decodes to an empty key");
  return key;
}

const std::string& ValidateWorkspaceId(const std::string& workspace_id) {
  if (workspace_id.empty()) throw std::invalid_argument("workspace id is empty");
  for (unsigned char c : workspace_id) {
    if (!std::isalnum(c) && c != '-') throw std::invalid_argument("workspace id is not a valid host label: " + workspace_id);
  }
  return workspace_id;
}

const std::string& ValidateLogType(const std::string& log_type) {
  if (log_type.empty() || log_type.size() > LogAnalyticsConstants::MAX_LOG_TYPE_LENGTH) {
    throw std::invalid_argument("log type must be 1-" + std::to_string(LogAnalyticsConstants::MAX_LOG_TYPE_LENGTH) + " characters");
  }
  for (unsigned char c : log_type) {
    if (!std::isalnum(c) && c != '_') throw std::invalid_argument("log type may only hold letters, digits and '_': " + log_type);
  }
  return log_type;
}

std::string BuildLogsUrl(const std::string& workspace_id, const std::string& endpoint_suffix) {
  return "https://" + workspace_id + "." + endpoint_suffix + LogAnalyticsConstants::LOGS_RESOURCE +
         "?api-version=" + LogAnalyticsConstants::API_VERSION;
}
}

LogAnalyticsClient::LogAnalyticsClient(HttpClient& http,
                                       const std::string& workspace_id,
                                       const std::string& workspace_secret,
                                       const std::string& log_type,
                                       const Metadata& metadata,
                                       const LogAnalyticsClientOptions& options)
  : http_(http),
    clock_(options.clock ? *options.clock : SystemClock::Instance()),
    workspace_id_(ValidateWorkspaceId(workspace_id)),
    log_type_(ValidateLogType(log_type)),
    logs_url_(BuildLogsUrl(workspace_id, options.endpoint_suffix.empty() ? LogAnalyticsConstants::DEFAULT_ENDPOINT_SUFFIX
                                                                        : options.endpoint_suffix)),
    signing_key_(DecodeSigningKey(workspace_secret)),
    metadata_(metadata),
    retry_policy_(options.retry_policy),
    retries_(new DelayedTaskQueue(options.max_pending_retries)) {}

LogAnalyticsClient::~LogAnalyticsClient() {
  size_t dropped = retries_->Shutdown(false);
  if (dropped > 0) Logger::Warning("Log Analytics client closed with " + std::to_string(dropped) + " retry batch(es) dropped");
}

void LogAnalyticsClient::PostMessage(const std::string& message, std::optional<TimePoint> timestamp) {
  PostMessages(std::vector<std::string>{message}, timestamp);
}

void LogAnalyticsClient::PostMessages(const std::vector<std::string>& messages, std::optional<TimePoint> timestamp) {
  if (messages.empty()) {
    Logger::Debug("PostMessages called with no messages; nothing sent");
    return;
  }
  TimePoint resolved = (timestamp && timestamp->time_since_epoch().count() != 0) ? *timestamp : clock_.Now();
  try {
    Deliver(messages, resolved);
  } catch (const HttpStatusError& ex) {
    bool scheduled = ScheduleRetry(messages, resolved, 1);
    throw HttpStatusError(ex.Status(), ex.Body(), scheduled);
  }
}

LogAnalyticsClient::SignedRequest LogAnalyticsClient::BuildRequest(const std::vector<std::string>& messages,
                                                                   TimePoint timestamp) const {
  SignedRequest req;
  req.body = SerializeLogRecords(BuildLogRecords(metadata_, messages, TimeFormat::Rfc3339Utc(timestamp)));
  // Same string goes into the signature and the x-ms-date header
  const std::string date = TimeFormat::Rfc1123Gmt(clock_.Now());
  const std::string string_to_sign = SharedKey::StringToSign("POST", req.body.size(), LogAnalyticsConstants::CONTENT_TYPE,
                                                             date, LogAnalyticsConstants::LOGS_RESOURCE);
  const std::string signature = SharedKey::Sign(string_to_sign, signing_key_);
  req.headers.reserve(5);
  req.headers["Authorization"] = SharedKey::AuthorizationHeader(workspace_id_, signature);
  req.headers["Content-Type"] = LogAnalyticsConstants::CONTENT_TYPE;
  req.headers["Log-Type"] = log_type_;
  req.headers["x-ms-date"] = date;
  req.headers["time-generated-field"] = LogAnalyticsConstants::TIMESTAMP_FIELD;
  return req;
}

void LogAnalyticsClient::Deliver(const std::vector<std::string>& messages, TimePoint timestamp) const {
  SignedRequest req = BuildRequest(messages, timestamp);
  HttpResponse resp;
  try {
    resp = http_.Post(logs_url_, req.body, req.headers, LogAnalyticsConstants::REQUEST_TIMEOUT_MS);
  } catch (const HttpTransportError& ex) {
    throw TransportError(std::string("Failed to post request: ") + ex.what());
  }
  if (resp.status != LogAnalyticsConstants::STATUS_OK) {
    if (Logger::IsEnabled(LogLevel::WARNING)) {
      Logger::Warning("Post log request failed with status: " + std::to_string(resp.status) + " " + resp.body);
    }
    throw HttpStatusError(resp.status, resp.body, false);
  }
  if (Logger::IsEnabled(LogLevel::INFO)) Logger::Info("Posted " + std::to_string(messages.size()) + " messages.");
}

bool LogAnalyticsClient::ScheduleRetry(const std::vector<std::string>& messages, TimePoint timestamp, unsigned int retry) {
  if (!retry_policy_.AllowsRetry(retry)) {
    Logger::Error("Giving up on batch of " + std::to_string(messages.size()) + " messages after " +
                  std::to_string(retry - 1) + " retries");
    return false;
  }
  auto delay = retry_policy_.DelayFor(retry);
  bool queued = retries_->Schedule(delay, [this, messages, timestamp, retry]{ RunRetry(messages, timestamp, retry); });
  if (!queued) {
    Logger::Error("Retry queue full or stopped; dropping batch of " + std::to_string(messages.size()) + " messages");
    return false;
  }
  if (Logger::IsEnabled(LogLevel::INFO)) {
    Logger::Info("Retry " + std::to_string(retry) + " scheduled in " + std::to_string(delay.count()) + " ms");
  }
  return true;
}

void LogAnalyticsClient::RunRetry(const std::vector<std::string>& messages, TimePoint timestamp, unsigned int retry) {
  try {
    Deliver(messages, timestamp);
  } catch (const HttpStatusError& ex) {
    Logger::Warning("Retry " + std::to_string(retry) + " failed with status " + std::to_string(ex.Status()));
    ScheduleRetry(messages, timestamp, retry + 1);
  } catch (const TransportError& ex) {
    Logger::Error("Retry " + std::to_string(retry) + " failed, batch dropped: " + ex.what());
  }
}

size_t LogAnalyticsClient::PendingRetries() const {
  return retries_->Pending();
}

bool LogAnalyticsClient::WaitForRetries(std::chrono::milliseconds timeout) {
  return retries_->WaitIdle(timeout);
}

size_t LogAnalyticsClient::Shutdown(bool drain) {
  return retries_->Shutdown(drain);
}
