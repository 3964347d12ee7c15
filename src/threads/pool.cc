/*
 * threads/pool.cc
 * -------------------------------------------------------------------------
 * Thread pools for request-bound work items (implementation).
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

#include "threads/pool.h"

#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "base/config.h"
#include "base/logger.h"
#include "threads/request_worker.h"
#include "threads/work_item_queue.h"

namespace dxfer {
namespace threads {

namespace {
constexpr int NUM_CONTROL_THREADS = 8;

class _Pool {
 public:
  virtual ~_Pool() = default;

  virtual void Post(WorkItem::WorkerFunction fn,
                    WorkItem::CallbackFunction cb) = 0;
};

template <class WorkerType>
class _PoolImpl : public _Pool {
 public:
  _PoolImpl(const std::string &id, int num_threads) : id_(id) {
    DXFER_LOG(LOG_DEBUG, "_PoolImpl::_PoolImpl",
              "starting pool %s with %i threads.\n", id_.c_str(), num_threads);

    for (int i = 0; i < num_threads; i++)
      workers_.push_back(WorkerType::Create(&queue_));
  }

  ~_PoolImpl() {
    queue_.Abort();
    workers_.clear();
  }

  void Post(WorkItem::WorkerFunction fn,
            WorkItem::CallbackFunction cb) override {
    queue_.Post({fn, cb});
  }

 private:
  std::string id_;
  WorkItemQueue queue_;
  std::list<std::unique_ptr<WorkerType>> workers_;
};

std::mutex s_mutex;
std::map<PoolId, std::unique_ptr<_Pool>> s_pools;
}  // namespace

void Pool::Init() {
  std::lock_guard<std::mutex> lock(s_mutex);

  s_pools[PoolId::PR_REQ_0].reset(
      new _PoolImpl<RequestWorker>("PR_REQ_0", NUM_CONTROL_THREADS));
  s_pools[PoolId::PR_REQ_1].reset(new _PoolImpl<RequestWorker>(
      "PR_REQ_1", base::Config::transfer_concurrency()));
}

void Pool::Terminate() {
  std::map<PoolId, std::unique_ptr<_Pool>> pools;

  {
    std::lock_guard<std::mutex> lock(s_mutex);
    pools.swap(s_pools);
  }

  // joins worker threads outside the lock
  pools.clear();
}

void Pool::Post(PoolId p, WorkItem::WorkerFunction fn,
                WorkItem::CallbackFunction cb) {
  std::lock_guard<std::mutex> lock(s_mutex);
  auto iter = s_pools.find(p);

  if (iter == s_pools.end())
    throw std::runtime_error("thread pool not initialized.");

  iter->second->Post(fn, cb);
}

}  // namespace threads
}  // namespace dxfer
