/*
 * services/service.cc
 * -------------------------------------------------------------------------
 * Service selection and access to the active implementation
 * (implementation).
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

#include "services/service.h"

#include <memory>
#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "base/request.h"
#include "base/request_hook.h"
#include "services/azure/impl.h"

namespace dxfer {
namespace services {
std::unique_ptr<Impl> Service::s_impl;

void Service::Init() {
#define TEST_SVC(str, ns)                                    \
  do {                                                       \
    if (base::Config::service() == str) {                    \
      Init(std::unique_ptr<Impl>(new services::ns::Impl())); \
      return;                                                \
    }                                                        \
  } while (0)

  TEST_SVC("azure", azure);
#undef TEST_SVC

  DXFER_LOG(LOG_ERR, "Service::Init", "unknown service [%s]. valid: %s\n",
            base::Config::service().c_str(), GetEnabledServices().c_str());
  throw std::runtime_error("invalid service specified.");
}

void Service::Init(std::unique_ptr<Impl> impl) {
  s_impl = std::move(impl);
  base::RequestFactory::SetHook(s_impl->hook());
}

void Service::Terminate() {
  base::RequestFactory::SetHook(nullptr);
  s_impl.reset();
}

std::string Service::GetEnabledServices() { return "azure"; }
}  // namespace services
}  // namespace dxfer
