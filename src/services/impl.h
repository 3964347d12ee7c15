/*
 * services/impl.h
 * -------------------------------------------------------------------------
 * Interface for storage service implementations.
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

#ifndef DXFER_SERVICES_IMPL_H
#define DXFER_SERVICES_IMPL_H

#include <string>

namespace dxfer {
namespace base {
class RequestHook;
}

namespace services {
class BlobStore;
class MessageQueue;

class Impl {
 public:
  virtual ~Impl() = default;

  virtual std::string name() const = 0;

  // May return nullptr if requests need no signing.
  virtual base::RequestHook *hook() = 0;

  virtual BlobStore *blob_store() = 0;
  virtual MessageQueue *message_queue() = 0;
};
}  // namespace services
}  // namespace dxfer

#endif
