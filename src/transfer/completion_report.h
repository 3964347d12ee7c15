/*
 * transfer/completion_report.h
 * -------------------------------------------------------------------------
 * Result of executing one transfer operation.
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

#ifndef DXFER_TRANSFER_COMPLETION_REPORT_H
#define DXFER_TRANSFER_COMPLETION_REPORT_H

#include <memory>
#include <string>

namespace dxfer {
namespace transfer {
struct CompletionReport {
  std::string id;  // correlation id of the operation reported on
  std::string node_name;
  bool success = false;
  std::string detail;
  double start_time = 0.0;  // seconds since the epoch
  double duration = 0.0;    // seconds

  inline double end_time() const { return start_time + duration; }

  // Returns nullptr if |body| isn't a well-formed status message.
  static std::unique_ptr<CompletionReport> Parse(const std::string &body);

  std::string Serialize() const;
};
}  // namespace transfer
}  // namespace dxfer

#endif
