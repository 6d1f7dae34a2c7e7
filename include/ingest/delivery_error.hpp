#pragma once
#include <stdexcept>
#include <string>

// Base for every failed send reported by LogAnalyticsClient
class DeliveryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Request never got a response. Not retried.
class TransportError : public DeliveryError {
public:
  using DeliveryError::DeliveryError;
};

// Response other than 200
class HttpStatusError : public DeliveryError {
public:
  HttpStatusError(long status, const std::string& body, bool retry_scheduled)
    : DeliveryError("Post log request failed with status: " + std::to_string(status) + " " + body),
      status_(status), body_(body), retry_scheduled_(retry_scheduled) {}
  long Status() const { return status_; }
  const std::string& Body() const { return body_; }
  bool RetryScheduled() const { return retry_scheduled_; }
private:
  long status_;
  std::string body_;
  bool retry_scheduled_;
};

// Workspace secret is not valid base64 or decodes to nothing
class SigningKeyError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};
