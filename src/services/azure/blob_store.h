/*
 * services/azure/blob_store.h
 * -------------------------------------------------------------------------
 * Block blob operations against the Blob service.
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

#ifndef DXFER_SERVICES_AZURE_BLOB_STORE_H
#define DXFER_SERVICES_AZURE_BLOB_STORE_H

#include <string>
#include <vector>

#include "services/blob_store.h"

namespace dxfer {
namespace services {
namespace azure {
class BlobStore : public services::BlobStore {
 public:
  // Put Block List body naming |ids| as the latest version of each block.
  static std::string BuildBlockListXml(const std::vector<std::string> &ids);

  explicit BlobStore(const std::string &endpoint);

  ~BlobStore() override = default;

  int CreateContainerIfMissing(base::Request *req,
                               const std::string &container) override;

  int WriteUnit(base::Request *req, const std::string &container,
                const std::string &blob, const std::string &unit_id,
                const uint8_t *data, size_t size,
                int server_timeout_in_s) override;

  int ReadRange(base::Request *req, const std::string &container,
                const std::string &blob, uint64_t offset, size_t length,
                size_t *bytes_read) override;

  int ListPendingUnits(base::Request *req, const std::string &container,
                       const std::string &blob,
                       std::set<std::string> *units) override;

  int Commit(base::Request *req, const std::string &container,
             const std::string &blob,
             const std::vector<std::string> &ordered_unit_ids) override;

  int Stat(base::Request *req, const std::string &container,
           const std::string &blob, uint64_t *size) override;

  int Delete(base::Request *req, const std::string &container,
             const std::string &blob) override;

  int DeleteContainer(base::Request *req,
                      const std::string &container) override;

 private:
  std::string GetContainerUrl(const std::string &container) const;
  std::string GetBlobUrl(const std::string &container,
                         const std::string &blob) const;

  std::string endpoint_;
};
}  // namespace azure
}  // namespace services
}  // namespace dxfer

#endif
