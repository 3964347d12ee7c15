/*
 * threads/semaphore.h
 * -------------------------------------------------------------------------
 * Counting permit set used to bound requests in flight.
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

#ifndef DXFER_THREADS_SEMAPHORE_H
#define DXFER_THREADS_SEMAPHORE_H

#include <condition_variable>
#include <mutex>
#include <stdexcept>

namespace dxfer {
namespace threads {
class Semaphore {
 public:
  inline explicit Semaphore(int permits) : available_(permits) {
    if (permits <= 0)
      throw std::invalid_argument("semaphore needs at least one permit.");
  }

  inline void Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this]() { return available_ > 0; });
    available_--;
  }

  inline void Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    available_++;
    condition_.notify_one();
  }

  inline int available() {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable condition_;
  int available_;
};
}  // namespace threads
}  // namespace dxfer

#endif
