/*
 * threads/work_item_queue.h
 * -------------------------------------------------------------------------
 * Blocking queue of pending work items.
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

#ifndef DXFER_THREADS_WORK_ITEM_QUEUE_H
#define DXFER_THREADS_WORK_ITEM_QUEUE_H

#include <condition_variable>
#include <deque>
#include <mutex>

#include "threads/work_item.h"

namespace dxfer {
namespace threads {
class WorkItemQueue {
 public:
  inline WorkItemQueue() = default;

  // Blocks until an item is available. Returns an invalid item once Abort()
  // has been called; items still queued at that point are dropped.
  inline WorkItem GetNext() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this]() { return done_ || !queue_.empty(); });
    if (done_) return {};
    WorkItem item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

  inline void Post(WorkItem item) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(item));
    condition_.notify_one();
  }

  inline void Abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
    condition_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<WorkItem> queue_;
  bool done_ = false;
};
}  // namespace threads
}  // namespace dxfer

#endif
