/*
 * services/service.h
 * -------------------------------------------------------------------------
 * Service selection and access to the active implementation.
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

#ifndef DXFER_SERVICES_SERVICE_H
#define DXFER_SERVICES_SERVICE_H

#include <memory>
#include <string>

#include "services/impl.h"

namespace dxfer {
namespace services {
class Service {
 public:
  // Must run before threads::Pool::Init(), since pool threads pick up the
  // request hook when they are created.
  static void Init(std::unique_ptr<Impl> impl);

  // Uses whatever service is defined in the config file.
  static void Init();

  static void Terminate();

  static std::string GetEnabledServices();

  inline static std::string name() { return s_impl->name(); }
  inline static BlobStore *blob_store() { return s_impl->blob_store(); }
  inline static MessageQueue *message_queue() {
    return s_impl->message_queue();
  }

 private:
  static std::unique_ptr<Impl> s_impl;
};
}  // namespace services
}  // namespace dxfer

#endif
