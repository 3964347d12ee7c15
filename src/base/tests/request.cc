#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "base/config.h"
#include "base/request.h"
#include "base/request_hook.h"

namespace dxfer {
namespace base {
namespace tests {

namespace {
constexpr int REQUEST_TIMEOUT = 2;

class RecordingHook : public RequestHook {
 public:
  std::string AdjustUrl(const std::string &url) override {
    adjusted++;
    return url;
  }

  void PreRun(Request *req, int) override {
    pre_runs++;
    req->SetHeader("x-ms-test", "1");
  }

  bool ShouldRetry(Request *, int) override { return false; }

  int adjusted = 0, pre_runs = 0;
};
}  // namespace

TEST(Request, BadUrl) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::GET);
  r->SetUrl("some:bad:url");

  try {
    r->Run(REQUEST_TIMEOUT);
    FAIL() << "expected an exception";
  } catch (const std::runtime_error &e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("Unrecoverable error"));
  }
}

TEST(Request, RunWithoutInit) {
  auto r = RequestFactory::NewNoHook();

  EXPECT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);

  r->Init(HttpMethod::GET);
  EXPECT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);
}

TEST(Request, InputOnlyForPutAndPost) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::GET);
  r->SetUrl("http://127.0.0.1/container");
  r->SetInputBuffer("body");

  EXPECT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);
}

TEST(Request, QueryStringKeptSeparately) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::PUT);
  r->SetUrl("https://acct.blob.core.windows.net/c/b", "comp=block");
  r->SetInputBuffer("abc");

  EXPECT_EQ("https://acct.blob.core.windows.net/c/b", r->url());
  EXPECT_EQ("comp=block", r->query_string());
  EXPECT_EQ(3u, r->input_size());

  // Init() clears per-request state
  r->Init(HttpMethod::GET);
  EXPECT_TRUE(r->url().empty());
  EXPECT_EQ(0u, r->input_size());
  EXPECT_TRUE(r->headers().empty());
}

TEST(Request, BorrowedInputIsNotCopied) {
  std::vector<char> payload(4096, 'x');
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::PUT);
  r->SetUrl("https://acct.blob.core.windows.net/c/b", "comp=block");
  r->SetInputBuffer(payload.data(), payload.size());

  EXPECT_EQ(payload.data(), r->input_data());
  EXPECT_EQ(payload.size(), r->input_size());

  r->Init(HttpMethod::GET);
  EXPECT_EQ(nullptr, r->input_data());
  EXPECT_EQ(0u, r->input_size());

  r->SetUrl("http://127.0.0.1/container");
  r->SetInputBuffer(payload.data(), payload.size());
  EXPECT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);
}

TEST(Request, HookSeesEveryRun) {
  RecordingHook hook;

  RequestFactory::SetHook(&hook);
  auto r = RequestFactory::New();
  RequestFactory::SetHook(nullptr);

  r->Init(HttpMethod::GET);
  r->SetUrl("some:bad:url");

  EXPECT_EQ(1, hook.adjusted);
  EXPECT_THROW(r->Run(REQUEST_TIMEOUT), std::runtime_error);
  EXPECT_EQ(1, hook.pre_runs);
  EXPECT_EQ("1", r->headers().at("x-ms-test"));
}

}  // namespace tests
}  // namespace base
}  // namespace dxfer
