/*
 * services/azure/queue.cc
 * -------------------------------------------------------------------------
 * Message operations against the Queue service (implementation).
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

#include "services/azure/queue.h"

#include <errno.h>

#include <list>
#include <map>
#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "base/request.h"
#include "base/url.h"
#include "base/xml.h"
#include "crypto/base64.h"
#include "crypto/encoder.h"
#include "services/utils.h"

namespace dxfer {
namespace services {
namespace azure {

namespace {
constexpr char MESSAGE_XPATH[] = "/QueueMessagesList/QueueMessage";
}  // namespace

std::string Queue::BuildPutMessageXml(const std::string &body) {
  return "<QueueMessage><MessageText>" +
         crypto::Encoder::Encode<crypto::Base64>(body.c_str(), body.size()) +
         "</MessageText></QueueMessage>";
}

int Queue::ParseGetMessagesXml(const std::string &xml,
                               QueueMessage *message) {
  std::list<std::map<std::string, std::string>> messages;

  auto doc = base::XmlDocument::Parse(xml);
  if (!doc) {
    DXFER_LOG(LOG_WARNING, "Queue::ParseGetMessagesXml",
              "failed to parse response.\n");
    return -EIO;
  }

  int r = doc->Find(MESSAGE_XPATH, &messages);
  if (r) return r;

  if (messages.empty()) return -ENOENT;

  auto &m = messages.front();

  message->id = m["MessageId"];
  message->receipt = m["PopReceipt"];

  if (message->id.empty() || message->receipt.empty()) {
    DXFER_LOG(LOG_WARNING, "Queue::ParseGetMessagesXml",
              "message without id or pop receipt.\n");
    return -EIO;
  }

  try {
    const auto text = crypto::Encoder::Decode<crypto::Base64>(m["MessageText"]);
    message->body.assign(text.begin(), text.end());
  } catch (const std::exception &e) {
    // hand the raw text on; the payload decoder will reject it
    DXFER_LOG(LOG_DEBUG, "Queue::ParseGetMessagesXml",
              "message %s is not base64: %s\n", message->id.c_str(), e.what());
    message->body = m["MessageText"];
  }

  return 0;
}

Queue::Queue(const std::string &endpoint) : endpoint_(endpoint) {}

std::string Queue::GetQueueUrl(const std::string &queue) const {
  return endpoint_ + "/" + base::Url::Encode(queue);
}

int Queue::CreateIfMissing(base::Request *req, const std::string &queue) {
  req->Init(base::HttpMethod::PUT);
  req->SetUrl(GetQueueUrl(queue));

  req->Run();

  // 201 if created, 204 if it already existed
  if (req->response_code() != base::HTTP_SC_CREATED &&
      req->response_code() != base::HTTP_SC_NO_CONTENT) {
    DXFER_LOG(LOG_WARNING, "Queue::CreateIfMissing",
              "failed to create queue [%s] with status %i (%s).\n",
              queue.c_str(), req->response_code(), GetErrorCode(req).c_str());
    return -EIO;
  }

  return 0;
}

int Queue::Put(base::Request *req, const std::string &queue,
               const std::string &body) {
  req->Init(base::HttpMethod::POST);
  req->SetUrl(GetQueueUrl(queue) + "/messages");
  req->SetHeader("content-type", "application/xml");
  req->SetInputBuffer(BuildPutMessageXml(body));

  req->Run();

  if (req->response_code() != base::HTTP_SC_CREATED) {
    DXFER_LOG(LOG_WARNING, "Queue::Put",
              "failed to put message on [%s] with status %i (%s).\n",
              queue.c_str(), req->response_code(), GetErrorCode(req).c_str());
    return -EIO;
  }

  return 0;
}

int Queue::GetOne(base::Request *req, const std::string &queue,
                  QueueMessage *message) {
  req->Init(base::HttpMethod::GET);
  req->SetUrl(GetQueueUrl(queue) + "/messages",
              "numofmessages=1&visibilitytimeout=" +
                  std::to_string(base::Config::queue_visibility_timeout_in_s()));

  req->Run();

  if (req->response_code() == base::HTTP_SC_NOT_FOUND) {
    DXFER_LOG(LOG_WARNING, "Queue::GetOne", "queue [%s] does not exist.\n",
              queue.c_str());
    return -EIO;
  }

  if (req->response_code() != base::HTTP_SC_OK) {
    DXFER_LOG(LOG_WARNING, "Queue::GetOne",
              "failed to get message from [%s] with status %i (%s).\n",
              queue.c_str(), req->response_code(), GetErrorCode(req).c_str());
    return -EIO;
  }

  return ParseGetMessagesXml(req->GetOutputAsString(), message);
}

int Queue::Delete(base::Request *req, const std::string &queue,
                  const QueueMessage &message) {
  req->Init(base::HttpMethod::DELETE);
  req->SetUrl(GetQueueUrl(queue) + "/messages/" + base::Url::Encode(message.id),
              "popreceipt=" + base::Url::EncodeQueryValue(message.receipt));

  req->Run();

  // already gone: another consumer deleted it or the receipt expired
  if (req->response_code() == base::HTTP_SC_NOT_FOUND) return -ENOENT;

  if (req->response_code() != base::HTTP_SC_NO_CONTENT) {
    DXFER_LOG(LOG_WARNING, "Queue::Delete",
              "failed to delete message %s from [%s] with status %i.\n",
              message.id.c_str(), queue.c_str(), req->response_code());
    return -EIO;
  }

  return 0;
}

}  // namespace azure
}  // namespace services
}  // namespace dxfer
