/*
 * transfer/upload_finalizer.h
 * -------------------------------------------------------------------------
 * Waits for every unit of an upload to be staged, then commits it.
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

#ifndef DXFER_TRANSFER_UPLOAD_FINALIZER_H
#define DXFER_TRANSFER_UPLOAD_FINALIZER_H

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace dxfer {
namespace services {
class BlobStore;
}

namespace transfer {
class UploadFinalizer {
 public:
  explicit UploadFinalizer(services::BlobStore *store);

  // Polls the pending-unit listing until all of units [0, total_units) are
  // present, then commits them in ascending order. Throws CommitFailed, or
  // FinalizeTimeout if finalize_timeout_in_s is set and runs out.
  void Finalize(const std::string &container, const std::string &blob,
                uint32_t total_units);

  // Number of |expected| ids that appear in |listing|.
  static size_t CountPresent(const std::set<std::string> &listing,
                             const std::vector<std::string> &expected);

  inline int polls() const { return polls_; }

 private:
  services::BlobStore *store_;
  int polls_ = 0;
};
}  // namespace transfer
}  // namespace dxfer

#endif
