#include "auth/shared_key.hpp"
#include "crypto/base64.hpp"
#include "crypto/hmac_sha256.hpp"

namespace SharedKey {
  std::string StringToSign(const std::string& method,
                           size_t content_length,
                           const std::string& content_type,
                           const std::string& date,
                           const std::string& resource) {
    std::string out;
    out.reserve(method.size() + content_type.size() + date.size() + resource.size() + 32);
    out += method; out += '\n';
    out += std::to_string(content_length); out += '\n';
    out += content_type; out += '\n';
    out += "x-ms-date:"; out += date; out += '\n';
    out += resource;
    return out;
  }

  std::string Sign(const std::string& string_to_sign, const std::vector<unsigned char>& key) {
    return Crypto::Base64Encode(Crypto::HmacSha256(key, string_to_sign));
  }

  std::string AuthorizationHeader(const std::string& workspace_id, const std::string& signature) {
    return "SharedKey " + workspace_id + ":" + signature;
  }
}
