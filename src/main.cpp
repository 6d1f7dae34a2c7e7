#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/workspace.hpp"
#include "ingest/delivery_error.hpp"
#include "ingest/log_analytics_client.hpp"
#include "net/http_client.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [--env PATH] [--log-file PATH] [--verbose] [message ...]\n"
            << "Posts each message (or each stdin line when none are given) to the\n"
            << "Log Analytics workspace configured by LOG_ANALYTICS_* settings." << std::endl;
}

int main(int argc, char** argv) {
  std::string env_path = ".env";
  std::string log_path;
  bool verbose = false;
  std::vector<std::string> messages;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--env" || arg == "--log-file") && i + 1 < argc) {
      (arg == "--env" ? env_path : log_path) = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else if (arg == "--") {
      for (++i; i < argc; ++i) messages.emplace_back(argv[i]);
    } else {
      messages.push_back(arg);
    }
  }

  Logger::Initialize(log_path, verbose ? LogLevel::DEBUG : LogLevel::INFO, verbose || log_path.empty());
  ConfigManager::Initialize(env_path);
  if (auto lvl = ConfigManager::Get("LOG_LEVEL")) {
    LogLevel parsed;
    if (Logger::ParseLevel(*lvl, parsed) && !verbose) Logger::Initialize(log_path, parsed);
  }

  if (messages.empty()) {
    std::string line;
    while (std::getline(std::cin, line)) if (!line.empty()) messages.push_back(line);
  }
  if (messages.empty()) {
    std::cerr << "No messages to send" << std::endl;
    Logger::Shutdown();
    return 0;
  }

  WorkspaceConfig cfg;
  try {
    cfg = LoadWorkspaceConfig();
  } catch (const std::exception& ex) {
    std::cerr << "Configuration error: " << ex.what() << std::endl;
    Logger::Critical(std::string("Configuration error: ") + ex.what());
    Logger::Shutdown();
    return 2;
  }

  std::unique_ptr<HttpClient> http(CreateCurlHttpClient());
  int exit_code = 0;
  try {
    LogAnalyticsClient client(*http, cfg.workspace_id, cfg.workspace_key, cfg.log_type, cfg.metadata, cfg.client_options);
    try {
      client.PostMessages(messages);
      std::cout << "Posted " << messages.size() << " message(s) to " << client.LogsUrl() << std::endl;
    } catch (const HttpStatusError& ex) {
      std::cerr << ex.what() << std::endl;
      exit_code = 1;
      if (ex.RetryScheduled()) {
        int wait_s = ConfigManager::GetIntOr("LOG_ANALYTICS_RETRY_WAIT_S", 120);
        std::cerr << "Retry scheduled; waiting up to " << wait_s << "s" << std::endl;
        if (!client.WaitForRetries(std::chrono::seconds(wait_s))) {
          Logger::Warning("Retries still pending at exit");
        }
      }
    } catch (const DeliveryError& ex) {
      std::cerr << ex.what() << std::endl;
      exit_code = 1;
    }
    size_t dropped = client.Shutdown(false);
    if (dropped > 0) std::cerr << dropped << " retry batch(es) dropped" << std::endl;
  } catch (const std::invalid_argument& ex) {
    // SigningKeyError and bad workspace id / log type
    std::cerr << "Configuration error: " << ex.what() << std::endl;
    Logger::Critical(std::string("Configuration error: ") + ex.what());
    exit_code = 2;
  }
  Logger::Shutdown();
  return exit_code;
}
