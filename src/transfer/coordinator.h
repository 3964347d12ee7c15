/*
 * transfer/coordinator.h
 * -------------------------------------------------------------------------
 * Partitions a transfer, dispatches it to workers and collects the result.
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

#ifndef DXFER_TRANSFER_COORDINATOR_H
#define DXFER_TRANSFER_COORDINATOR_H

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "transfer/channel.h"
#include "transfer/operation.h"
#include "transfer/status_aggregator.h"

namespace dxfer {
namespace services {
class BlobStore;
}

namespace transfer {
struct UploadRequest {
  uint64_t unit_size = 0;
  uint32_t total_units = 0;
  uint32_t instances = 0;
  std::string object_name;
  std::string container_name;
  bool cleanup = false;  // delete object and container after the commit
};

struct DownloadRequest {
  uint64_t chunk_size = 0;
  uint32_t instances = 0;
  std::string object_name;
  std::string container_name;
};

class Coordinator {
 public:
  Coordinator(services::BlobStore *store, JobChannel *jobs,
              StatusChannel *status, const std::string &node_name);

  // Throws InvalidPartition for bad input, ChannelUnavailable if jobs can't be
  // published, and CommitFailed or FinalizeTimeout from the commit barrier.
  AggregateResult RunUpload(const UploadRequest &request);

  // Throws InvalidPartition for bad input or an object too small to split,
  // ChannelUnavailable if jobs can't be published, and std::runtime_error if
  // the object can't be found.
  AggregateResult RunDownload(const DownloadRequest &request);

  static void Validate(const UploadRequest &request);

  static std::vector<Operation> PlanUpload(const UploadRequest &request,
                                           const std::vector<std::string> &ids);
  static std::vector<Operation> PlanDownload(
      const DownloadRequest &request, uint64_t object_size,
      const std::vector<std::string> &ids);

  static void LogResult(const char *mode, const AggregateResult &result);

 private:
  std::vector<std::string> NewIds(size_t count);
  std::set<std::string> Dispatch(const std::vector<Operation> &ops);
  void Publish(const JobMessage &job);
  void Cleanup(const UploadRequest &request);

  services::BlobStore *store_;
  JobChannel *jobs_;
  StatusChannel *status_;
  std::string node_name_;
};
}  // namespace transfer
}  // namespace dxfer

#endif
