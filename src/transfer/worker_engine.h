/*
 * transfer/worker_engine.h
 * -------------------------------------------------------------------------
 * Worker loop: takes one job at a time, executes it and reports.
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

#ifndef DXFER_TRANSFER_WORKER_ENGINE_H
#define DXFER_TRANSFER_WORKER_ENGINE_H

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

#include "crypto/buffer.h"
#include "transfer/channel.h"
#include "transfer/completion_report.h"
#include "transfer/operation.h"

namespace dxfer {
namespace base {
class Request;
}

namespace services {
class BlobStore;
}

namespace transfer {
class WorkerEngine {
 public:
  enum class State { IDLE, AWAITING_JOB, EXECUTING, REPORTING };

  // |concurrency| bounds the unit requests in flight for one operation.
  WorkerEngine(services::BlobStore *store, JobChannel *jobs,
               StatusChannel *status, int concurrency,
               const std::string &node_name);

  // Processes jobs until |max_jobs| have been taken off the job channel, or
  // forever if |max_jobs| is negative. Returns the number of jobs taken.
  int Run(int max_jobs = -1);

  // Polls the job channel once. Returns true if a message was taken (whether
  // or not it decoded), false if the channel was empty.
  bool RunOnce();

  // Executes |op| and builds its report. Failures end up in the report;
  // nothing is thrown.
  CompletionReport Execute(const Operation &op);

  inline State state() const { return state_; }

 private:
  class Executor;

  struct Unit {
    uint32_t index = 0;
    std::string id;
  };

  struct Chunk {
    uint64_t offset = 0;
    size_t length = 0;
  };

  void ExecutePutRange(const PutRange &op);
  void ExecuteGetRange(const GetRange &op);

  int WriteUnit(base::Request *req, const PutRange *op, Unit *unit);
  int ReadChunk(base::Request *req, const GetRange *op, Chunk *chunk);

  // Publishes |report|, retrying on channel failures. Returns false if it
  // never got through.
  bool Report(const CompletionReport &report);

  int GetServerTimeout();

  services::BlobStore *store_;
  JobChannel *jobs_;
  StatusChannel *status_;
  int concurrency_;
  std::string node_name_;

  std::atomic<State> state_;

  // upload payload, regenerated only when the unit size changes
  crypto::Buffer payload_;

  std::mutex rng_mutex_;
  std::mt19937 rng_;
};
}  // namespace transfer
}  // namespace dxfer

#endif
