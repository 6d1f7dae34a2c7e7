#include <gtest/gtest.h>
#include "auth/shared_key.hpp"
#include "crypto/base64.hpp"
#include <string>
#include <vector>

namespace {
const std::string kDate = "Mon, 02 Jan 2006 15:04:05 GMT";

std::vector<unsigned char> TestKey() {
  return Crypto::Base64Decode("c2VjcmV0LWtleS1mb3ItdGVzdHM=");
}
}

TEST(SharedKeyTest, StringToSignHasFixedLayout) {
  EXPECT_EQ(SharedKey::StringToSign("POST", 42, "application/json", kDate, "/api/logs"),
            "POST\n42\napplication/json\nx-ms-date:Mon, 02 Jan 2006 15:04:05 GMT\n/api/logs");
}

TEST(SharedKeyTest, SignMatchesKnownSignature) {
  std::string s = SharedKey::StringToSign("POST", 42, "application/json", kDate, "/api/logs");
  EXPECT_EQ(SharedKey::Sign(s, TestKey()), "nBj7ZaI4Z5O0VJW7ezNAJgiWAHgG/GRRRar7ThaGW64=");
}

TEST(SharedKeyTest, SignIsDeterministic) {
  std::string s = SharedKey::StringToSign("POST", 1234, "application/json", kDate, "/api/logs");
  EXPECT_EQ(SharedKey::Sign(s, TestKey()), SharedKey::Sign(s, TestKey()));
}

TEST(SharedKeyTest, AnyChangeInStringOrKeyChangesSignature) {
  auto key = TestKey();
  std::string s = SharedKey::StringToSign("POST", 42, "application/json", kDate, "/api/logs");
  const std::string base = SharedKey::Sign(s, key);

  EXPECT_NE(SharedKey::Sign(SharedKey::StringToSign("POST", 43, "application/json", kDate, "/api/logs"), key), base);
  EXPECT_NE(SharedKey::Sign(SharedKey::StringToSign("POST", 42, "application/json",
                                                    "Mon, 02 Jan 2006 15:04:06 GMT", "/api/logs"), key), base);
  std::string flipped = s;
  flipped[0] = 'p';
  EXPECT_NE(SharedKey::Sign(flipped, key), base);

  auto other_key = key;
  other_key.back() ^= 0x01;
  EXPECT_NE(SharedKey::Sign(s, other_key), base);
}

TEST(SharedKeyTest, SignatureIsBase64OfSha256) {
  std::string sig = SharedKey::Sign("anything", TestKey());
  EXPECT_EQ(sig.size(), 44u);
  EXPECT_EQ(Crypto::Base64Decode(sig).size(), 32u);
}

TEST(SharedKeyTest, AuthorizationHeaderFormat) {
  EXPECT_EQ(SharedKey::AuthorizationHeader("ws-123", "abc="), "SharedKey ws-123:abc=");
}
