/*
 * transfer/status_aggregator.h
 * -------------------------------------------------------------------------
 * Collects completion reports for a set of dispatched operations.
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

#ifndef DXFER_TRANSFER_STATUS_AGGREGATOR_H
#define DXFER_TRANSFER_STATUS_AGGREGATOR_H

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "transfer/channel.h"
#include "transfer/completion_report.h"

namespace dxfer {
namespace transfer {
struct AggregateResult {
  std::vector<CompletionReport> reports;  // in arrival order
  uint64_t bytes = 0;
  double total_elapsed = 0.0;  // latest end minus earliest start, seconds
  double throughput = 0.0;     // bits per second

  size_t failed() const;
  inline bool success() const { return failed() == 0; }

  inline double throughput_mbps() const {
    return throughput / 1024.0 / 1024.0;
  }
};

class StatusAggregator {
 public:
  explicit StatusAggregator(StatusChannel *status);

  // Blocks until every id in |outstanding| has been reported. Reports for
  // other ids and undecodable messages are acknowledged and dropped.
  AggregateResult Await(std::set<std::string> outstanding,
                        uint64_t expected_bytes);

  // Elapsed time and throughput over |reports|, independent of their order.
  static AggregateResult Summarize(std::vector<CompletionReport> reports,
                                   uint64_t expected_bytes);

  inline size_t strays() const { return strays_; }
  inline size_t malformed() const { return malformed_; }

 private:
  StatusChannel *status_;
  size_t strays_ = 0, malformed_ = 0;
};
}  // namespace transfer
}  // namespace dxfer

#endif
