#include "crypto/base64.hpp"
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <stdexcept>

namespace Crypto {
  static bool IsBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
  }

  // Crypto++ silently skips characters outside the alphabet, so validate first.
  static void ValidateBase64(const std::string& s) {
    if (s.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");
    size_t padding = 0;
    while (padding < s.size() && padding < 3 && s[s.size() - 1 - padding] == '=') ++padding;
    if (padding > 2) throw std::invalid_argument("base64 has too much padding");
    for (size_t i = 0; i < s.size() - padding; ++i) {
      if (!IsBase64Char(s[i])) {
        throw std::invalid_argument("invalid base64 character at offset " + std::to_string(i));
      }
    }
  }

  std::string Base64Encode(const unsigned char* data, size_t len) {
    std::string out;
    CryptoPP::StringSource source(data, len, true,
      new CryptoPP::Base64Encoder(new CryptoPP::StringSink(out), false));
    return out;
  }

  std::string Base64Encode(const std::vector<unsigned char>& data) {
    return Base64Encode(data.data(), data.size());
  }

  std::vector<unsigned char> Base64Decode(const std::string& encoded) {
    ValidateBase64(encoded);
    std::string raw;
    CryptoPP::StringSource source(encoded, true,
      new CryptoPP::Base64Decoder(new CryptoPP::StringSink(raw)));
    return std::vector<unsigned char>(raw.begin(), raw.end());
  }
}
