#pragma once
#include <string>
#include <vector>

namespace Crypto {
  // Standard alphabet, padded, single line
  std::string Base64Encode(const unsigned char* data, size_t len);
  std::string Base64Encode(const std::vector<unsigned char>& data);
  // Strict decode; throws std::invalid_argument on anything that is not canonical base64
  std::vector<unsigned char> Base64Decode(const std::string& encoded);
}
