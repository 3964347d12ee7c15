/*
 * transfer/coordinator.cc
 * -------------------------------------------------------------------------
 * Partitions a transfer, dispatches it to workers and collects the result
 * (implementation).
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

#include "transfer/coordinator.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <functional>
#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "base/timer.h"
#include "services/blob_store.h"
#include "threads/pool.h"
#include "transfer/errors.h"
#include "transfer/partitioner.h"
#include "transfer/upload_finalizer.h"

namespace dxfer {
namespace transfer {

Coordinator::Coordinator(services::BlobStore *store, JobChannel *jobs,
                         StatusChannel *status, const std::string &node_name)
    : store_(store), jobs_(jobs), status_(status), node_name_(node_name) {}

void Coordinator::Validate(const UploadRequest &request) {
  const int max_units = base::Config::max_committable_units();

  if (request.instances == 0)
    throw InvalidPartition("need at least one instance");
  if (request.unit_size == 0)
    throw InvalidPartition("block size must be positive");
  if (request.total_units < request.instances)
    throw InvalidPartition("number of blocks (" +
                           std::to_string(request.total_units) +
                           ") must be at least the number of instances (" +
                           std::to_string(request.instances) + ")");
  if (request.total_units > static_cast<uint32_t>(max_units))
    throw InvalidPartition("number of blocks (" +
                           std::to_string(request.total_units) +
                           ") exceeds the commit limit of " +
                           std::to_string(max_units));
}

std::vector<Operation> Coordinator::PlanUpload(
    const UploadRequest &request, const std::vector<std::string> &ids) {
  const PartitionPlan plan =
      Partitioner::Partition(request.total_units, request.instances);
  std::vector<Operation> ops;

  if (ids.size() != plan.size())
    throw std::logic_error("one id needed per share.");

  for (size_t i = 0; i < plan.size(); i++) {
    PutRange op;

    op.id = ids[i];
    op.blob_name = request.object_name;
    op.container_name = request.container_name;
    op.starting_unit_index = static_cast<uint32_t>(plan[i].start);
    op.unit_size_bytes = request.unit_size;
    op.unit_count = static_cast<uint32_t>(plan[i].count);

    ops.push_back(op);
  }

  return ops;
}

std::vector<Operation> Coordinator::PlanDownload(
    const DownloadRequest &request, uint64_t object_size,
    const std::vector<std::string> &ids) {
  if (request.instances == 0)
    throw InvalidPartition("need at least one instance");
  if (request.chunk_size == 0)
    throw InvalidPartition("chunk size must be positive");
  if (object_size / request.chunk_size < request.instances)
    throw InvalidPartition("object of " + std::to_string(object_size) +
                           " bytes has fewer chunks than instances");

  const PartitionPlan plan = Partitioner::PartitionBytes(
      object_size, request.chunk_size, request.instances);
  std::vector<Operation> ops;

  if (ids.size() != plan.size())
    throw std::logic_error("one id needed per share.");

  for (size_t i = 0; i < plan.size(); i++) {
    GetRange op;

    op.id = ids[i];
    op.blob_name = request.object_name;
    op.container_name = request.container_name;
    op.start_byte_offset = plan[i].start;
    op.total_bytes = plan[i].count;
    op.chunk_size_bytes = request.chunk_size;

    ops.push_back(op);
  }

  return ops;
}

AggregateResult Coordinator::RunUpload(const UploadRequest &request) {
  Validate(request);

  int r = threads::Pool::Call(
      threads::PoolId::PR_REQ_0,
      std::bind(&services::BlobStore::CreateContainerIfMissing, store_,
                std::placeholders::_1, request.container_name));

  if (r)
    throw std::runtime_error("cannot create container [" +
                             request.container_name + "].");

  const auto ops = PlanUpload(request, NewIds(request.instances));

  DXFER_LOG(LOG_INFO, "Coordinator::RunUpload",
            "uploading %u blocks of %" PRIu64 " bytes to [%s/%s] across %u "
            "instances.\n",
            request.total_units, request.unit_size,
            request.container_name.c_str(), request.object_name.c_str(),
            request.instances);

  StatusAggregator aggregator(status_);
  AggregateResult result =
      aggregator.Await(Dispatch(ops), request.unit_size * request.total_units);

  if (!result.success())
    DXFER_LOG(LOG_WARNING, "Coordinator::RunUpload",
              "%zu of %zu workers failed. waiting for their blocks anyway.\n",
              result.failed(), result.reports.size());

  UploadFinalizer finalizer(store_);
  finalizer.Finalize(request.container_name, request.object_name,
                     request.total_units);

  DXFER_LOG(LOG_NOTICE, "Coordinator::RunUpload", "committed [%s/%s].\n",
            request.container_name.c_str(), request.object_name.c_str());

  if (request.cleanup) Cleanup(request);

  return result;
}

AggregateResult Coordinator::RunDownload(const DownloadRequest &request) {
  uint64_t object_size = 0;

  int r = threads::Pool::Call(
      threads::PoolId::PR_REQ_0,
      std::bind(&services::BlobStore::Stat, store_, std::placeholders::_1,
                request.container_name, request.object_name, &object_size));

  if (r)
    throw std::runtime_error("cannot read size of [" + request.container_name +
                             "/" + request.object_name + "].");

  const auto ops =
      PlanDownload(request, object_size, NewIds(request.instances));

  DXFER_LOG(LOG_INFO, "Coordinator::RunDownload",
            "downloading %" PRIu64 " bytes of [%s/%s] in chunks of %" PRIu64
            " across %u instances.\n",
            object_size, request.container_name.c_str(),
            request.object_name.c_str(), request.chunk_size,
            request.instances);

  StatusAggregator aggregator(status_);
  return aggregator.Await(Dispatch(ops), object_size);
}

std::vector<std::string> Coordinator::NewIds(size_t count) {
  boost::uuids::random_generator gen;
  std::vector<std::string> ids;

  for (size_t i = 0; i < count; i++)
    ids.push_back(boost::uuids::to_string(gen()));

  return ids;
}

std::set<std::string> Coordinator::Dispatch(const std::vector<Operation> &ops) {
  std::set<std::string> outstanding;

  for (const auto &op : ops) {
    JobMessage job;

    job.sender_node_name = node_name_;
    job.operation = op;

    Publish(job);
    outstanding.insert(GetOperationId(op));

    DXFER_LOG(LOG_DEBUG, "Coordinator::Dispatch", "published %s %s.\n",
              GetOperationKind(op), GetOperationId(op).c_str());
  }

  DXFER_LOG(LOG_INFO, "Coordinator::Dispatch", "published %zu jobs to [%s].\n",
            ops.size(), jobs_->name().c_str());

  return outstanding;
}

// A job that can't be published after all retries aborts the run. Jobs
// already on the queue are left for the workers; their reports will be strays.
void Coordinator::Publish(const JobMessage &job) {
  const int attempts = base::Config::max_transfer_retries() + 1;

  for (int i = 1;; i++) {
    try {
      jobs_->Publish(job);
      return;
    } catch (const ChannelUnavailable &e) {
      if (i >= attempts) throw;

      DXFER_LOG(LOG_WARNING, "Coordinator::Publish",
                "failed to publish %s (attempt %i of %i): %s\n",
                GetOperationId(job.operation).c_str(), i, attempts, e.what());
      base::Timer::Sleep(base::Config::queue_poll_interval_in_s());
    }
  }
}

void Coordinator::Cleanup(const UploadRequest &request) {
  int r = threads::Pool::Call(
      threads::PoolId::PR_REQ_0,
      std::bind(&services::BlobStore::Delete, store_, std::placeholders::_1,
                request.container_name, request.object_name));

  if (r)
    DXFER_LOG(LOG_WARNING, "Coordinator::Cleanup",
              "failed to delete [%s]: %i.\n", request.object_name.c_str(), r);

  r = threads::Pool::Call(
      threads::PoolId::PR_REQ_0,
      std::bind(&services::BlobStore::DeleteContainer, store_,
                std::placeholders::_1, request.container_name));

  if (r)
    DXFER_LOG(LOG_WARNING, "Coordinator::Cleanup",
              "failed to delete container [%s]: %i.\n",
              request.container_name.c_str(), r);
  else
    DXFER_LOG(LOG_INFO, "Coordinator::Cleanup", "removed [%s/%s].\n",
              request.container_name.c_str(), request.object_name.c_str());
}

void Coordinator::LogResult(const char *mode, const AggregateResult &result) {
  for (const auto &r : result.reports)
    DXFER_LOG(LOG_NOTICE, "Coordinator::LogResult",
              "  %s on %s: %s, %.3f s%s%s\n", r.id.c_str(),
              r.node_name.empty() ? "(unknown)" : r.node_name.c_str(),
              r.success ? "passed" : "FAILED", r.duration,
              r.detail.empty() ? "" : ", ", r.detail.c_str());

  DXFER_LOG(LOG_NOTICE, "Coordinator::LogResult",
            "%s of %" PRIu64 " bytes %s: %zu/%zu workers passed, %.3f s "
            "elapsed, %.2f Mbps.\n",
            mode, result.bytes, result.success() ? "succeeded" : "failed",
            result.reports.size() - result.failed(), result.reports.size(),
            result.total_elapsed, result.throughput_mbps());

  base::Statistics::Write(mode, "bytes", "%" PRIu64, result.bytes);
  base::Statistics::Write(mode, "elapsed_s", "%.3f", result.total_elapsed);
  base::Statistics::Write(mode, "throughput_mbps", "%.2f",
                          result.throughput_mbps());
  base::Statistics::Write(mode, "workers_failed", "%zu", result.failed());

  for (const auto &r : result.reports)
    base::Statistics::Write(mode, "worker." + r.id, "%s %.3f",
                            r.success ? "passed" : "failed", r.duration);
}

}  // namespace transfer
}  // namespace dxfer
