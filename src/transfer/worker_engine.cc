/*
 * transfer/worker_engine.cc
 * -------------------------------------------------------------------------
 * Worker loop: takes one job at a time, executes it and reports
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

#include "transfer/worker_engine.h"

#include <string.h>

#include <atomic>
#include <functional>
#include <stdexcept>
#include <vector>

#include "base/config.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "base/timer.h"
#include "services/blob_store.h"
#include "threads/parallel_work_queue.h"
#include "transfer/block_id.h"
#include "transfer/errors.h"

namespace dxfer {
namespace transfer {

namespace {
std::atomic_ullong s_units_written(0), s_units_read(0), s_units_failed(0);
std::atomic_ullong s_bytes_written(0), s_bytes_read(0);
std::atomic_int s_jobs_executed(0), s_jobs_failed(0), s_jobs_malformed(0);
std::atomic_int s_reports_lost(0);

void StatsWriter(std::ostream *o) {
  *o << "worker engine:\n"
        "  jobs executed: "
     << s_jobs_executed
     << "\n"
        "  jobs failed: "
     << s_jobs_failed
     << "\n"
        "  malformed jobs: "
     << s_jobs_malformed
     << "\n"
        "  reports lost: "
     << s_reports_lost
     << "\n"
        "  units written: "
     << s_units_written
     << "\n"
        "  units read: "
     << s_units_read
     << "\n"
        "  units failed: "
     << s_units_failed
     << "\n"
        "  bytes written: "
     << s_bytes_written
     << "\n"
        "  bytes read: "
     << s_bytes_read << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);

std::string DescribeUnitFailure(const char *what, uint64_t which, int r) {
  return std::string(what) + " " + std::to_string(which) + ": " +
         strerror(-r);
}
}  // namespace

class WorkerEngine::Executor : public boost::static_visitor<void> {
 public:
  explicit Executor(WorkerEngine *engine) : engine_(engine) {}

  void operator()(const PutRange &op) const { engine_->ExecutePutRange(op); }
  void operator()(const GetRange &op) const { engine_->ExecuteGetRange(op); }

 private:
  WorkerEngine *engine_;
};

WorkerEngine::WorkerEngine(services::BlobStore *store, JobChannel *jobs,
                           StatusChannel *status, int concurrency,
                           const std::string &node_name)
    : store_(store),
      jobs_(jobs),
      status_(status),
      concurrency_(concurrency),
      node_name_(node_name),
      state_(State::IDLE),
      payload_(crypto::Buffer::Empty()),
      rng_(std::random_device()()) {
  if (concurrency_ <= 0)
    throw std::invalid_argument("worker concurrency must be positive.");
}

int WorkerEngine::Run(int max_jobs) {
  int jobs = 0;

  DXFER_LOG(LOG_INFO, "WorkerEngine::Run",
            "%s waiting for jobs on [%s], concurrency %i.\n",
            node_name_.c_str(), jobs_->name().c_str(), concurrency_);

  while (max_jobs < 0 || jobs < max_jobs) {
    bool took_job = false;

    try {
      took_job = RunOnce();
    } catch (const ChannelUnavailable &e) {
      DXFER_LOG(LOG_WARNING, "WorkerEngine::Run", "%s. will retry.\n",
                e.what());
    }

    if (took_job)
      jobs++;
    else
      base::Timer::Sleep(base::Config::queue_poll_interval_in_s());
  }

  state_ = State::IDLE;
  return jobs;
}

bool WorkerEngine::RunOnce() {
  const bool ack_after_report = base::Config::ack_jobs_after_report();
  services::QueueMessage message;

  state_ = State::AWAITING_JOB;

  if (!jobs_->Receive(&message)) return false;

  DXFER_LOG(LOG_DEBUG, "WorkerEngine::RunOnce", "received job message %s.\n",
            message.id.c_str());

  if (!ack_after_report) {
    try {
      jobs_->Acknowledge(message);
    } catch (const ChannelUnavailable &e) {
      // we still own the job; at worst it's delivered again later
      DXFER_LOG(LOG_WARNING, "WorkerEngine::RunOnce",
                "failed to remove job %s: %s\n", message.id.c_str(), e.what());
    }
  }

  auto job = JobChannel::Decode(message);

  if (!job) {
    ++s_jobs_malformed;
    DXFER_LOG(LOG_WARNING, "WorkerEngine::RunOnce",
              "discarding malformed job message %s.\n", message.id.c_str());

    if (ack_after_report) jobs_->Acknowledge(message);

    state_ = State::IDLE;
    return true;
  }

  DXFER_LOG(LOG_INFO, "WorkerEngine::RunOnce",
            "starting %s %s from %s (%" PRIu64 " bytes).\n",
            GetOperationKind(job->operation),
            GetOperationId(job->operation).c_str(),
            job->sender_node_name.c_str(), GetOperationBytes(job->operation));

  state_ = State::EXECUTING;
  const CompletionReport report = Execute(job->operation);

  state_ = State::REPORTING;
  const bool reported = Report(report);

  if (ack_after_report) {
    if (reported)
      jobs_->Acknowledge(message);
    else
      DXFER_LOG(LOG_WARNING, "WorkerEngine::RunOnce",
                "leaving job %s on the queue for redelivery.\n",
                message.id.c_str());
  }

  state_ = State::IDLE;
  return true;
}

CompletionReport WorkerEngine::Execute(const Operation &op) {
  CompletionReport report;

  report.id = GetOperationId(op);
  report.node_name = node_name_;
  report.start_time = base::Timer::GetCurrentTime();

  try {
    boost::apply_visitor(Executor(this), op);

    report.success = true;
    ++s_jobs_executed;
  } catch (const std::exception &e) {
    report.success = false;
    report.detail = e.what();
    ++s_jobs_failed;

    DXFER_LOG(LOG_WARNING, "WorkerEngine::Execute", "%s %s failed: %s\n",
              GetOperationKind(op), report.id.c_str(), e.what());
  }

  report.duration = base::Timer::GetCurrentTime() - report.start_time;

  DXFER_LOG(LOG_INFO, "WorkerEngine::Execute", "%s %s %s in %.3f s.\n",
            GetOperationKind(op), report.id.c_str(),
            report.success ? "completed" : "failed", report.duration);

  return report;
}

void WorkerEngine::ExecutePutRange(const PutRange &op) {
  if (op.unit_size_bytes == 0)
    throw InvalidPartition("unit size must be positive");

  if (payload_.size() != op.unit_size_bytes)
    payload_ = crypto::Buffer::Generate(op.unit_size_bytes);

  std::vector<Unit> units(op.unit_count);

  for (uint32_t i = 0; i < op.unit_count; i++) {
    units[i].index = op.starting_unit_index + i;
    units[i].id = BlockId::FromIndex(units[i].index);
  }

  threads::ParallelWorkQueue<Unit> queue(
      units.begin(), units.end(),
      std::bind(&WorkerEngine::WriteUnit, this, std::placeholders::_1, &op,
                std::placeholders::_2),
      concurrency_);

  if (queue.Process() == 0) return;

  std::vector<std::string> causes;

  for (const auto &failure : queue.failures())
    causes.push_back(
        DescribeUnitFailure("unit", failure.first->index, failure.second));

  throw PartialUploadFailure(std::move(causes), units.size());
}

void WorkerEngine::ExecuteGetRange(const GetRange &op) {
  if (op.chunk_size_bytes == 0)
    throw InvalidPartition("chunk size must be positive");

  std::vector<Chunk> chunks;

  for (uint64_t done = 0; done < op.total_bytes; done += op.chunk_size_bytes) {
    Chunk c;

    c.offset = op.start_byte_offset + done;
    c.length = (op.total_bytes - done < op.chunk_size_bytes)
                   ? op.total_bytes - done
                   : op.chunk_size_bytes;
    chunks.push_back(c);
  }

  threads::ParallelWorkQueue<Chunk> queue(
      chunks.begin(), chunks.end(),
      std::bind(&WorkerEngine::ReadChunk, this, std::placeholders::_1, &op,
                std::placeholders::_2),
      concurrency_);

  if (queue.Process() == 0) return;

  std::vector<std::string> causes;

  for (const auto &failure : queue.failures())
    causes.push_back(DescribeUnitFailure("chunk at offset",
                                         failure.first->offset,
                                         failure.second));

  throw PartialDownloadFailure(std::move(causes), chunks.size());
}

int WorkerEngine::WriteUnit(base::Request *req, const PutRange *op,
                            Unit *unit) {
  int r = store_->WriteUnit(req, op->container_name, op->blob_name, unit->id,
                            payload_.get(), payload_.size(),
                            GetServerTimeout());

  if (r) {
    ++s_units_failed;
    return r;
  }

  ++s_units_written;
  s_bytes_written += payload_.size();
  return 0;
}

int WorkerEngine::ReadChunk(base::Request *req, const GetRange *op,
                            Chunk *chunk) {
  size_t bytes_read = 0;

  int r = store_->ReadRange(req, op->container_name, op->blob_name,
                            chunk->offset, chunk->length, &bytes_read);

  if (r) {
    ++s_units_failed;
    return r;
  }

  ++s_units_read;
  s_bytes_read += bytes_read;
  return 0;
}

bool WorkerEngine::Report(const CompletionReport &report) {
  const int attempts = base::Config::max_transfer_retries() + 1;

  for (int i = 0; i < attempts; i++) {
    try {
      status_->Publish(report);
      return true;
    } catch (const ChannelUnavailable &e) {
      DXFER_LOG(LOG_WARNING, "WorkerEngine::Report",
                "failed to report %s (attempt %i of %i): %s\n",
                report.id.c_str(), i + 1, attempts, e.what());
      base::Timer::Sleep(base::Config::queue_poll_interval_in_s());
    }
  }

  ++s_reports_lost;
  DXFER_LOG(LOG_ERR, "WorkerEngine::Report", "giving up on report for %s.\n",
            report.id.c_str());
  return false;
}

// spreads server-side deadlines so requests issued together don't all expire
// together
int WorkerEngine::GetServerTimeout() {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  std::uniform_int_distribution<int> dist(
      base::Config::server_timeout_min_in_s(),
      base::Config::server_timeout_max_in_s());

  return dist(rng_);
}

}  // namespace transfer
}  // namespace dxfer
