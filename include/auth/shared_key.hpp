#pragma once
#include <string>
#include <vector>

// SharedKey authorization for the HTTP Data Collector API.
namespace SharedKey {
  // Canonical string, newline separated, in the order the service rebuilds it:
  //   {method}\n{content_length}\n{content_type}\nx-ms-date:{date}\n{resource}
  std::string StringToSign(const std::string& method,
                           size_t content_length,
                           const std::string& content_type,
                           const std::string& date,
                           const std::string& resource);

  // base64(HMAC-SHA256(key, string_to_sign))
  std::string Sign(const std::string& string_to_sign, const std::vector<unsigned char>& key);

  // "SharedKey {workspace_id}:{signature}"
  std::string AuthorizationHeader(const std::string& workspace_id, const std::string& signature);
}
