/*
 * services/azure/impl.h
 * -------------------------------------------------------------------------
 * Azure Storage service implementation.
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

#ifndef DXFER_SERVICES_AZURE_IMPL_H
#define DXFER_SERVICES_AZURE_IMPL_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "base/request_hook.h"
#include "services/azure/connection_string.h"
#include "services/impl.h"

namespace dxfer {
namespace services {
namespace azure {
class BlobStore;
class Queue;

class Impl : public services::Impl, public base::RequestHook {
 public:
  static constexpr char API_VERSION[] = "2019-12-12";

  Impl();
  explicit Impl(const ConnectionString &cs);

  ~Impl() override;

  // BEGIN services::Impl
  std::string name() const override;

  base::RequestHook *hook() override;
  services::BlobStore *blob_store() override;
  services::MessageQueue *message_queue() override;
  // END services::Impl

  // BEGIN base::RequestHook
  std::string AdjustUrl(const std::string &url) override;
  void PreRun(base::Request *r, int iter) override;
  bool ShouldRetry(base::Request *r, int iter) override;
  // END base::RequestHook

  // Shared Key string-to-sign for the request as it stands.
  std::string GetStringToSign(base::Request *req) const;

  void Sign(base::Request *req);

 private:
  std::string account_name_;
  std::vector<uint8_t> account_key_;
  std::unique_ptr<BlobStore> blob_store_;
  std::unique_ptr<Queue> queue_;
};
}  // namespace azure
}  // namespace services
}  // namespace dxfer

#endif
