/*
 * services/blob_store.h
 * -------------------------------------------------------------------------
 * Remote store holding the units of a transferred object.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
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

#ifndef DXFER_SERVICES_BLOB_STORE_H
#define DXFER_SERVICES_BLOB_STORE_H

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace dxfer {
namespace base {
class Request;
}

namespace services {
// All calls return 0 on success or a negated errno value. |req| is the request
// object owned by the calling pool thread.
class BlobStore {
 public:
  virtual ~BlobStore() = default;

  virtual int CreateContainerIfMissing(base::Request *req,
                                       const std::string &container) = 0;

  // Stages one unit. The unit stays pending until named in Commit().
  virtual int WriteUnit(base::Request *req, const std::string &container,
                        const std::string &blob, const std::string &unit_id,
                        const uint8_t *data, size_t size,
                        int server_timeout_in_s) = 0;

  // Reads [offset, offset + length). The bytes are left in the request's
  // output buffer and are overwritten by its next use; |bytes_read| receives
  // the count.
  virtual int ReadRange(base::Request *req, const std::string &container,
                        const std::string &blob, uint64_t offset,
                        size_t length, size_t *bytes_read) = 0;

  // A blob with no staged units yields an empty set, not an error.
  virtual int ListPendingUnits(base::Request *req,
                               const std::string &container,
                               const std::string &blob,
                               std::set<std::string> *units) = 0;

  virtual int Commit(base::Request *req, const std::string &container,
                     const std::string &blob,
                     const std::vector<std::string> &ordered_unit_ids) = 0;

  virtual int Stat(base::Request *req, const std::string &container,
                   const std::string &blob, uint64_t *size) = 0;

  virtual int Delete(base::Request *req, const std::string &container,
                     const std::string &blob) = 0;

  virtual int DeleteContainer(base::Request *req,
                              const std::string &container) = 0;
};
}  // namespace services
}  // namespace dxfer

#endif
