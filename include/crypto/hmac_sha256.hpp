#pragma once
#include <string>
#include <vector>

namespace Crypto {
  inline constexpr size_t HMAC_SHA256_SIZE = 32;
  // Raw 32-byte HMAC-SHA256 of data under key
  std::vector<unsigned char> HmacSha256(const std::vector<unsigned char>& key, const std::string& data);
}
