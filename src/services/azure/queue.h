/*
 * services/azure/queue.h
 * -------------------------------------------------------------------------
 * Message operations against the Queue service.
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

#ifndef DXFER_SERVICES_AZURE_QUEUE_H
#define DXFER_SERVICES_AZURE_QUEUE_H

#include <string>

#include "services/message_queue.h"

namespace dxfer {
namespace services {
namespace azure {
class Queue : public services::MessageQueue {
 public:
  // Put Message body; |body| is carried base64-encoded.
  static std::string BuildPutMessageXml(const std::string &body);

  // Decodes the first message of a Get Messages response. Returns -ENOENT if
  // the response holds no message.
  static int ParseGetMessagesXml(const std::string &xml,
                                 QueueMessage *message);

  explicit Queue(const std::string &endpoint);

  ~Queue() override = default;

  int CreateIfMissing(base::Request *req, const std::string &queue) override;

  int Put(base::Request *req, const std::string &queue,
          const std::string &body) override;

  int GetOne(base::Request *req, const std::string &queue,
             QueueMessage *message) override;

  int Delete(base::Request *req, const std::string &queue,
             const QueueMessage &message) override;

 private:
  std::string GetQueueUrl(const std::string &queue) const;

  std::string endpoint_;
};
}  // namespace azure
}  // namespace services
}  // namespace dxfer

#endif
