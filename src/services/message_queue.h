/*
 * services/message_queue.h
 * -------------------------------------------------------------------------
 * Remote message queue carrying job and status messages.
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

#ifndef DXFER_SERVICES_MESSAGE_QUEUE_H
#define DXFER_SERVICES_MESSAGE_QUEUE_H

#include <string>

namespace dxfer {
namespace base {
class Request;
}

namespace services {
struct QueueMessage {
  std::string id;
  std::string receipt;
  std::string body;
};

class MessageQueue {
 public:
  virtual ~MessageQueue() = default;

  virtual int CreateIfMissing(base::Request *req,
                              const std::string &queue) = 0;

  virtual int Put(base::Request *req, const std::string &queue,
                  const std::string &body) = 0;

  // Non-blocking. Returns -ENOENT when the queue has nothing visible.
  virtual int GetOne(base::Request *req, const std::string &queue,
                     QueueMessage *message) = 0;

  virtual int Delete(base::Request *req, const std::string &queue,
                     const QueueMessage &message) = 0;
};
}  // namespace services
}  // namespace dxfer

#endif
