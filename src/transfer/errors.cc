/*
 * transfer/errors.cc
 * -------------------------------------------------------------------------
 * Failures raised by the transfer core (implementation).
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

#include "transfer/errors.h"

namespace dxfer {
namespace transfer {

namespace {
// causes listed in a report detail
constexpr size_t MAX_CAUSES_IN_MESSAGE = 5;
}  // namespace

std::string PartialFailure::Describe(const std::string &kind,
                                     const std::vector<std::string> &causes,
                                     size_t total) {
  std::string what = "partial " + kind + " failure: " +
                     std::to_string(causes.size()) + " of " +
                     std::to_string(total) + " units failed";

  for (size_t i = 0; i < causes.size() && i < MAX_CAUSES_IN_MESSAGE; i++)
    what += (i == 0 ? " [" : "; ") + causes[i];

  if (!causes.empty())
    what += (causes.size() > MAX_CAUSES_IN_MESSAGE) ? "; ...]" : "]";

  return what;
}

}  // namespace transfer
}  // namespace dxfer
