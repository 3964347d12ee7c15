#include <gtest/gtest.h>
#include <stdio.h>
#include <string.h>

#include "crypto/base64.h"
#include "crypto/buffer.h"
#include "crypto/encoder.h"
#include "crypto/hmac_sha256.h"

namespace dxfer {
namespace crypto {
namespace tests {

namespace {
std::string ToHex(const uint8_t *mac, size_t len) {
  std::string out;
  char byte[3];

  for (size_t i = 0; i < len; i++) {
    snprintf(byte, sizeof(byte), "%02x", mac[i]);
    out += byte;
  }

  return out;
}
}  // namespace

// RFC 4231, test case 2
TEST(HmacSha256, KnownAnswer) {
  const std::string key = "Jefe";
  uint8_t mac[HmacSha256::MAC_LEN];

  HmacSha256::Sign(std::vector<uint8_t>(key.begin(), key.end()),
                   "what do ya want for nothing?", mac);

  EXPECT_EQ("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
            ToHex(mac, sizeof(mac)));
}

TEST(HmacSha256, KeyFromBase64) {
  const std::string key = "Jefe";
  const auto decoded = Encoder::Decode<Base64>(
      Encoder::Encode<Base64>(key.c_str(), key.size()));
  uint8_t direct[HmacSha256::MAC_LEN], via_b64[HmacSha256::MAC_LEN];

  HmacSha256::Sign(std::vector<uint8_t>(key.begin(), key.end()), "abc", direct);
  HmacSha256::Sign(decoded, "abc", via_b64);

  EXPECT_EQ(ToHex(direct, sizeof(direct)), ToHex(via_b64, sizeof(via_b64)));
}

TEST(Buffer, GenerateTwiceDiffers) {
  const Buffer a = Buffer::Generate(4096), b = Buffer::Generate(4096);

  ASSERT_EQ(4096u, a.size());
  ASSERT_EQ(4096u, b.size());
  EXPECT_NE(0, memcmp(a.get(), b.get(), a.size()));
}

TEST(Buffer, GenerateEmptyThrows) {
  EXPECT_THROW(Buffer::Generate(0), std::runtime_error);
  EXPECT_FALSE(Buffer::Empty());
}

}  // namespace tests
}  // namespace crypto
}  // namespace dxfer
