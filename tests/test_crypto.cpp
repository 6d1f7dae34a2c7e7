#include <gtest/gtest.h>
#include "crypto/base64.hpp"
#include "crypto/hmac_sha256.hpp"
#include <stdexcept>
#include <string>
#include <vector>

static std::vector<unsigned char> Bytes(const std::string& s) {
  return std::vector<unsigned char>(s.begin(), s.end());
}

TEST(Base64Test, EncodesWithPaddingAndNoLineBreaks) {
  EXPECT_EQ(Crypto::Base64Encode(Bytes("")), "");
  EXPECT_EQ(Crypto::Base64Encode(Bytes("f")), "Zg==");
  EXPECT_EQ(Crypto::Base64Encode(Bytes("fo")), "Zm8=");
  EXPECT_EQ(Crypto::Base64Encode(Bytes("foobar")), "Zm9vYmFy");
  std::string long_input(200, 'x');
  EXPECT_EQ(Crypto::Base64Encode(Bytes(long_input)).find('\n'), std::string::npos);
}

TEST(Base64Test, DecodesCanonicalInput) {
  EXPECT_EQ(Crypto::Base64Decode("c2VjcmV0LWtleS1mb3ItdGVzdHM="), Bytes("secret-key-for-tests"));
  EXPECT_EQ(Crypto::Base64Decode("Zg=="), Bytes("f"));
  EXPECT_TRUE(Crypto::Base64Decode("").empty());
}

TEST(Base64Test, RejectsMalformedInput) {
  EXPECT_THROW(Crypto::Base64Decode("Zg="), std::invalid_argument);        // bad length
  EXPECT_THROW(Crypto::Base64Decode("Zm9v!mFy"), std::invalid_argument);   // bad character
  EXPECT_THROW(Crypto::Base64Decode("Zg==Zg=="), std::invalid_argument);   // padding in the middle
  EXPECT_THROW(Crypto::Base64Decode("Z==="), std::invalid_argument);       // too much padding
  EXPECT_THROW(Crypto::Base64Decode("not base64 at all"), std::invalid_argument);
}

// RFC 4231 test case 2
TEST(HmacSha256Test, MatchesRfc4231Vector) {
  auto mac = Crypto::HmacSha256(Bytes("Jefe"), "what do ya want for nothing?");
  ASSERT_EQ(mac.size(), Crypto::HMAC_SHA256_SIZE);
  static const char* hex = "0123456789abcdef";
  std::string out;
  for (unsigned char b : mac) { out += hex[b >> 4]; out += hex[b & 0xF]; }
  EXPECT_EQ(out, "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}
