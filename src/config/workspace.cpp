#include "config/workspace.hpp"
#include "common/config_manager.hpp"
#include <cctype>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

static std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(start, end - start);
}

Metadata ParseMetadataList(const std::string& list) {
  Metadata out;
  std::istringstream iss(list);
  std::string item;
  while (std::getline(iss, item, ',')) {
    item = Trim(item);
    if (item.empty()) continue;
    auto pos = item.find('=');
    if (pos == std::string::npos) throw std::invalid_argument("metadata entry without '=': " + item);
    std::string key = Trim(item.substr(0, pos));
    if (key.empty()) throw std::invalid_argument("metadata entry without key: " + item);
    out[key] = Trim(item.substr(pos + 1));
  }
  return out;
}

WorkspaceConfig LoadWorkspaceConfig() {
  WorkspaceConfig cfg;
  cfg.workspace_id = ConfigManager::GetOrThrow("LOG_ANALYTICS_WORKSPACE_ID");
  cfg.workspace_key = ConfigManager::GetOrThrow("LOG_ANALYTICS_WORKSPACE_KEY");
  cfg.log_type = ConfigManager::GetOrThrow("LOG_ANALYTICS_LOG_TYPE");
  if (auto m = ConfigManager::Get("LOG_ANALYTICS_METADATA")) cfg.metadata = ParseMetadataList(*m);
  if (auto s = ConfigManager::Get("LOG_ANALYTICS_ENDPOINT_SUFFIX")) {
    if (!s->empty()) cfg.client_options.endpoint_suffix = *s;
  }

  int delay_s = ConfigManager::GetIntOr("LOG_ANALYTICS_RETRY_DELAY_S", 15);
  double backoff = ConfigManager::GetDoubleOr("LOG_ANALYTICS_RETRY_BACKOFF", 2.0);
  int max_retries = ConfigManager::GetIntOr("LOG_ANALYTICS_RETRY_MAX", 3);
  int max_pending = ConfigManager::GetIntOr("LOG_ANALYTICS_RETRY_MAX_PENDING", 1000);
  if (delay_s < 0 || max_retries < 0 || max_pending < 0) {
    throw std::runtime_error("LOG_ANALYTICS_RETRY_* values must not be negative");
  }
  if (!std::isfinite(backoff) || backoff < 1.0) {
    throw std::runtime_error("LOG_ANALYTICS_RETRY_BACKOFF must be a finite number >= 1");
  }
  cfg.client_options.retry_policy = RetryPolicy(std::chrono::seconds(delay_s), backoff,
                                                static_cast<unsigned int>(max_retries));
  cfg.client_options.max_pending_retries = static_cast<size_t>(max_pending);
  return cfg;
}
