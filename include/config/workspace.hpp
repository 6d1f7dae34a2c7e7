#pragma once
#include "ingest/log_analytics_client.hpp"
#include <string>

struct WorkspaceConfig {
  std::string workspace_id;
  std::string workspace_key;   // base64
  std::string log_type;
  Metadata metadata;
  LogAnalyticsClientOptions client_options;
};

// Parses "k1=v1,k2=v2". Throws std::invalid_argument on an entry without '=' or key.
Metadata ParseMetadataList(const std::string& list);

// Reads LOG_ANALYTICS_* keys through ConfigManager. Throws std::runtime_error when a
// required key is missing.
WorkspaceConfig LoadWorkspaceConfig();
