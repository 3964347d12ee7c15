#include <stdexcept>

#include <gtest/gtest.h>

#include "base/url.h"

namespace dxfer {
namespace base {
namespace tests {

TEST(Url, EncodeKeepsPathSeparators) {
  EXPECT_EQ("container/dir/blob.bin", Url::Encode("container/dir/blob.bin"));
  EXPECT_EQ("a%20b/c%2Bd", Url::Encode("a b/c+d"));
}

TEST(Url, EncodeQueryValue) {
  EXPECT_EQ("AAAAAA%3D%3D", Url::EncodeQueryValue("AAAAAA=="));
  EXPECT_EQ("%2F%2B~x", Url::EncodeQueryValue("/+~x"));
}

TEST(Url, Decode) {
  EXPECT_EQ("AAAAAA==", Url::Decode("AAAAAA%3d%3D"));
  EXPECT_EQ("a b", Url::Decode("a+b"));
  EXPECT_THROW(Url::Decode("abc%2"), std::runtime_error);
  EXPECT_THROW(Url::Decode("%zz"), std::runtime_error);
}

TEST(Url, Split) {
  std::string host, path;

  Url::Split("https://acct.blob.core.windows.net/container/blob", &host,
             &path);
  EXPECT_EQ("https://acct.blob.core.windows.net", host);
  EXPECT_EQ("/container/blob", path);

  Url::Split("http://127.0.0.1:10000", &host, &path);
  EXPECT_EQ("http://127.0.0.1:10000", host);
  EXPECT_EQ("/", path);
}

TEST(Url, ParseQueryString) {
  auto q = Url::ParseQueryString(
      "comp=block&blockid=AQAAAA%3D%3D&&restype&timeout=10");

  ASSERT_EQ(4u, q.size());
  EXPECT_EQ("block", q["comp"]);
  EXPECT_EQ("AQAAAA==", q["blockid"]);
  EXPECT_EQ("", q["restype"]);
  EXPECT_EQ("10", q["timeout"]);

  EXPECT_TRUE(Url::ParseQueryString("").empty());
}

}  // namespace tests
}  // namespace base
}  // namespace dxfer
