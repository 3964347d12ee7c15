/*
 * threads/parallel_work_queue.h
 * -------------------------------------------------------------------------
 * Issues one pool work item per part, with a bounded number in flight.
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

#ifndef DXFER_THREADS_PARALLEL_WORK_QUEUE_H
#define DXFER_THREADS_PARALLEL_WORK_QUEUE_H

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "base/config.h"
#include "base/logger.h"
#include "threads/async_handle.h"
#include "threads/pool.h"
#include "threads/semaphore.h"

namespace dxfer {
namespace base {
class Request;
}

namespace threads {
// Every part is posted exactly once. A permit is taken before each post and
// returned when the part's work item completes, so at most
// |max_parts_in_progress| parts run at any time. Parts are not retried here;
// the request hook handles retries of individual HTTP calls.
template <class Part>
class ParallelWorkQueue {
 public:
  using ProcessPartCallback = std::function<int(base::Request *, Part *)>;
  using Failure = std::pair<const Part *, int>;

  template <class Iterator>
  inline ParallelWorkQueue(Iterator begin, Iterator end,
                           const ProcessPartCallback &on_process_part,
                           int max_parts_in_progress = -1,
                           PoolId pool = PoolId::PR_REQ_1)
      : on_process_part_(on_process_part), pool_(pool) {
    for (Iterator iter = begin; iter != end; ++iter) {
      PartInProgress p;
      p.part = &(*iter);
      p.id = static_cast<int>(parts_.size());
      parts_.push_back(std::move(p));
    }

    max_parts_in_progress_ = (max_parts_in_progress == -1)
                                 ? base::Config::transfer_concurrency()
                                 : max_parts_in_progress;
  }

  // Returns 0 if every part succeeded, otherwise the first failing part's
  // return code (in part order). All failures are kept in failures().
  int Process() {
    Semaphore permits(max_parts_in_progress_);

    failures_.clear();

    for (auto &part : parts_) {
      AsyncHandle *handle = new AsyncHandle();
      Semaphore *sem = &permits;

      part.handle.reset(handle);
      permits.Acquire();

      threads::Pool::Post(
          pool_, std::bind(on_process_part_, std::placeholders::_1, part.part),
          [sem, handle](int r) {
            sem->Release();
            handle->Complete(r);
          });
    }

    for (auto &part : parts_) {
      int part_r = part.handle->Wait();

      if (part_r) {
        DXFER_LOG(LOG_DEBUG, "ParallelWorkQueue::Process",
                  "part %i returned status %i.\n", part.id, part_r);
        failures_.push_back(Failure(part.part, part_r));
      }
    }

    return failures_.empty() ? 0 : failures_.front().second;
  }

  inline const std::vector<Failure> &failures() const { return failures_; }

 private:
  struct PartInProgress {
    Part *part = nullptr;
    int id = -1;
    std::unique_ptr<AsyncHandle> handle;
  };

  std::vector<PartInProgress> parts_;
  std::vector<Failure> failures_;

  ProcessPartCallback on_process_part_;
  PoolId pool_;
  int max_parts_in_progress_;
};
}  // namespace threads
}  // namespace dxfer

#endif
