#include "crypto/hmac_sha256.hpp"
#include <cryptopp/hmac.h>
#include <cryptopp/sha.h>

namespace Crypto {
  std::vector<unsigned char> HmacSha256(const std::vector<unsigned char>& key, const std::string& data) {
    CryptoPP::HMAC<CryptoPP::SHA256> mac(key.data(), key.size());
    std::vector<unsigned char> digest(CryptoPP::HMAC<CryptoPP::SHA256>::DIGESTSIZE);
    mac.CalculateDigest(digest.data(), reinterpret_cast<const unsigned char*>(data.data()), data.size());
    return digest;
  }
}
