/*
 * services/azure/impl.cc
 * -------------------------------------------------------------------------
 * Azure Storage service implementation (implementation).
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2014, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "services/azure/impl.h"

#include <boost/algorithm/string.hpp>
#include <string>

#include "base/logger.h"
#include "base/request.h"
#include "base/timer.h"
#include "base/url.h"
#include "crypto/base64.h"
#include "crypto/encoder.h"
#include "crypto/hmac_sha256.h"
#include "services/azure/blob_store.h"
#include "services/azure/queue.h"
#include "services/utils.h"

namespace dxfer {
namespace services {
namespace azure {

namespace {
const std::string HEADER_PREFIX = "x-ms-";
}  // namespace

constexpr char Impl::API_VERSION[];

Impl::Impl() : Impl(ConnectionString::Load()) {}

Impl::Impl(const ConnectionString &cs)
    : account_name_(cs.account_name),
      account_key_(crypto::Encoder::Decode<crypto::Base64>(cs.account_key)),
      blob_store_(new BlobStore(cs.blob_endpoint)),
      queue_(new Queue(cs.queue_endpoint)) {
  DXFER_LOG(LOG_DEBUG, "Impl::Impl", "account [%s], blob [%s], queue [%s].\n",
            account_name_.c_str(), cs.blob_endpoint.c_str(),
            cs.queue_endpoint.c_str());
}

Impl::~Impl() = default;

std::string Impl::name() const { return "azure"; }

base::RequestHook *Impl::hook() { return this; }

services::BlobStore *Impl::blob_store() { return blob_store_.get(); }

services::MessageQueue *Impl::message_queue() { return queue_.get(); }

// blob and queue calls build absolute urls against their own endpoints
std::string Impl::AdjustUrl(const std::string &url) { return url; }

void Impl::PreRun(base::Request *r, int iter) { Sign(r); }

bool Impl::ShouldRetry(base::Request *r, int iter) {
  return GenericShouldRetry(r, iter);
}

std::string Impl::GetStringToSign(base::Request *req) const {
  const auto &headers = req->headers();
  const std::string content_length =
      req->input_size() ? std::to_string(req->input_size()) : "";

  std::string to_sign =
      std::string(base::HttpMethodToString(req->method())) + "\n" +
      FindOrDefault(headers, "content-encoding") + "\n" +
      FindOrDefault(headers, "content-language") + "\n" + content_length +
      "\n" + FindOrDefault(headers, "content-md5") + "\n" +
      FindOrDefault(headers, "content-type") + "\n" +
      "\n" +  // Date, superseded by x-ms-date
      FindOrDefault(headers, "if-modified-since") + "\n" +
      FindOrDefault(headers, "if-match") + "\n" +
      FindOrDefault(headers, "if-none-match") + "\n" +
      FindOrDefault(headers, "if-unmodified-since") + "\n" +
      FindOrDefault(headers, "range") + "\n";

  // header map is sorted and keys are lower-case
  for (const auto &header : headers)
    if (header.first.compare(0, HEADER_PREFIX.size(), HEADER_PREFIX) == 0)
      to_sign += header.first + ":" + boost::algorithm::trim_copy(header.second) +
                 "\n";

  std::string host, path;
  base::Url::Split(req->url(), &host, &path);

  to_sign += "/" + account_name_ + path;

  for (const auto &param : base::Url::ParseQueryString(req->query_string()))
    to_sign += "\n" + boost::algorithm::to_lower_copy(param.first) + ":" +
               param.second;

  return to_sign;
}

void Impl::Sign(base::Request *req) {
  req->SetHeader("x-ms-date", base::Timer::GetHttpTime());
  req->SetHeader("x-ms-version", API_VERSION);

  uint8_t mac[crypto::HmacSha256::MAC_LEN];
  crypto::HmacSha256::Sign(account_key_, GetStringToSign(req), mac);
  req->SetHeader("authorization",
                 std::string("SharedKey ") + account_name_ + ":" +
                     crypto::Encoder::Encode<crypto::Base64>(
                         mac, crypto::HmacSha256::MAC_LEN));
}

}  // namespace azure
}  // namespace services
}  // namespace dxfer
