#include <gtest/gtest.h>

#include <string>

#include "base/request.h"
#include "crypto/base64.h"
#include "crypto/encoder.h"
#include "crypto/hmac_sha256.h"
#include "services/azure/connection_string.h"
#include "services/azure/impl.h"

namespace dxfer {
namespace services {
namespace azure {
namespace tests {

namespace {
constexpr char ACCOUNT_KEY[] = "c2VjcmV0LWtleQ==";  // "secret-key"
constexpr char DATE[] = "Mon, 01 Jan 2024 00:00:00 GMT";

ConnectionString TestAccount() {
  return ConnectionString::Parse(
      std::string("DefaultEndpointsProtocol=https;AccountName=acct;"
                  "AccountKey=") +
      ACCOUNT_KEY + ";EndpointSuffix=core.windows.net");
}
}  // namespace

TEST(AzureSigning, PutBlockStringToSign) {
  Impl impl(TestAccount());
  auto req = base::RequestFactory::NewNoHook();

  req->Init(base::HttpMethod::PUT);
  req->SetUrl("https://acct.blob.core.windows.net/cont/my%20blob",
              "comp=block&blockid=AQAAAA%3D%3D&timeout=10");
  req->SetHeader("x-ms-version", Impl::API_VERSION);
  req->SetHeader("x-ms-date", DATE);
  req->SetInputBuffer("hello");

  const std::string expected = std::string("PUT\n") +
                               "\n"     // content-encoding
                               "\n"     // content-language
                               "5\n"    // content-length
                               "\n"     // content-md5
                               "\n"     // content-type
                               "\n"     // date
                               "\n"     // if-modified-since
                               "\n"     // if-match
                               "\n"     // if-none-match
                               "\n"     // if-unmodified-since
                               "\n"     // range
                               "x-ms-date:" + DATE + "\n" +
                               "x-ms-version:2019-12-12\n"
                               "/acct/cont/my%20blob\n"
                               "blockid:AQAAAA==\n"
                               "comp:block\n"
                               "timeout:10";

  EXPECT_EQ(expected, impl.GetStringToSign(req.get()));
}

TEST(AzureSigning, EmptyBodyHasNoContentLength) {
  Impl impl(TestAccount());
  auto req = base::RequestFactory::NewNoHook();

  req->Init(base::HttpMethod::GET);
  req->SetUrl("https://acct.queue.core.windows.net/jobqueue/messages",
              "numofmessages=1&visibilitytimeout=30");
  req->SetHeader("x-ms-date", DATE);

  const std::string to_sign = impl.GetStringToSign(req.get());

  EXPECT_EQ(0u, to_sign.find("GET\n\n\n\n"));
  EXPECT_NE(std::string::npos,
            to_sign.find("/acct/jobqueue/messages\nnumofmessages:1\n"
                         "visibilitytimeout:30"));
}

TEST(AzureSigning, ContentTypeIsSigned) {
  Impl impl(TestAccount());
  auto req = base::RequestFactory::NewNoHook();

  req->Init(base::HttpMethod::PUT);
  req->SetUrl("https://acct.blob.core.windows.net/cont/blob", "comp=blocklist");
  req->SetHeader("content-type", "application/xml");
  req->SetInputBuffer("<BlockList/>");

  EXPECT_EQ(0u, impl.GetStringToSign(req.get())
                    .find("PUT\n\n\n12\n\napplication/xml\n"));
}

TEST(AzureSigning, AuthorizationHeader) {
  Impl impl(TestAccount());
  auto req = base::RequestFactory::NewNoHook();

  req->Init(base::HttpMethod::DELETE);
  req->SetUrl("https://acct.blob.core.windows.net/cont/blob");

  impl.Sign(req.get());

  const auto &headers = req->headers();
  ASSERT_EQ(1u, headers.count("authorization"));
  ASSERT_EQ(1u, headers.count("x-ms-date"));
  EXPECT_EQ(Impl::API_VERSION, headers.at("x-ms-version"));

  uint8_t mac[crypto::HmacSha256::MAC_LEN];
  const std::string key = "secret-key";
  crypto::HmacSha256::Sign(std::vector<uint8_t>(key.begin(), key.end()),
                           impl.GetStringToSign(req.get()), mac);

  EXPECT_EQ("SharedKey acct:" + crypto::Encoder::Encode<crypto::Base64>(
                                    mac, sizeof(mac)),
            headers.at("authorization"));
}

TEST(AzureSigning, UrlsPassThrough) {
  Impl impl(TestAccount());

  EXPECT_EQ("https://acct.blob.core.windows.net/c/b",
            impl.AdjustUrl("https://acct.blob.core.windows.net/c/b"));
  EXPECT_EQ(&impl, impl.hook());
  EXPECT_EQ("azure", impl.name());
}

}  // namespace tests
}  // namespace azure
}  // namespace services
}  // namespace dxfer
