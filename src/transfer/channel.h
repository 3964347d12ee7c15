/*
 * transfer/channel.h
 * -------------------------------------------------------------------------
 * Typed publish/receive wrapper around a message queue.
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

#ifndef DXFER_TRANSFER_CHANNEL_H
#define DXFER_TRANSFER_CHANNEL_H

#include <errno.h>

#include <functional>
#include <memory>
#include <string>

#include "base/logger.h"
#include "services/message_queue.h"
#include "threads/pool.h"
#include "transfer/completion_report.h"
#include "transfer/errors.h"
#include "transfer/operation.h"

namespace dxfer {
namespace transfer {
// Delivery is at-least-once and unordered. A received message stays in the
// queue (though possibly hidden for the visibility timeout) until
// Acknowledge() removes it.
template <class Payload>
class Channel {
 public:
  inline Channel(services::MessageQueue *queue, const std::string &name)
      : queue_(queue), name_(name) {}

  inline const std::string &name() const { return name_; }

  inline void CreateIfMissing() {
    int r = threads::Pool::Call(
        threads::PoolId::PR_REQ_0,
        std::bind(&services::MessageQueue::CreateIfMissing, queue_,
                  std::placeholders::_1, name_));

    if (r) throw ChannelUnavailable(name_, r);
  }

  inline void Publish(const Payload &payload) {
    const std::string body = payload.Serialize();

    int r = threads::Pool::Call(
        threads::PoolId::PR_REQ_0,
        std::bind(&services::MessageQueue::Put, queue_, std::placeholders::_1,
                  name_, body));

    if (r) throw ChannelUnavailable(name_, r);
  }

  // Non-blocking. Returns false if nothing is available.
  inline bool Receive(services::QueueMessage *message) {
    int r = threads::Pool::Call(
        threads::PoolId::PR_REQ_0,
        std::bind(&services::MessageQueue::GetOne, queue_,
                  std::placeholders::_1, name_, message));

    if (r == -ENOENT) return false;
    if (r) throw ChannelUnavailable(name_, r);

    return true;
  }

  // A message some other consumer already removed is not an error.
  inline void Acknowledge(const services::QueueMessage &message) {
    int r = threads::Pool::Call(
        threads::PoolId::PR_REQ_0,
        std::bind(&services::MessageQueue::Delete, queue_,
                  std::placeholders::_1, name_, message));

    if (r == -ENOENT) {
      DXFER_LOG(LOG_DEBUG, "Channel::Acknowledge",
                "message %s already gone from [%s].\n", message.id.c_str(),
                name_.c_str());
      return;
    }

    if (r) throw ChannelUnavailable(name_, r);
  }

  // Returns nullptr if the message body isn't a valid payload.
  inline static std::unique_ptr<Payload> Decode(
      const services::QueueMessage &message) {
    return Payload::Parse(message.body);
  }

 private:
  services::MessageQueue *queue_;
  std::string name_;
};

using JobChannel = Channel<JobMessage>;
using StatusChannel = Channel<CompletionReport>;
}  // namespace transfer
}  // namespace dxfer

#endif
