/*
 * transfer/status_aggregator.cc
 * -------------------------------------------------------------------------
 * Collects completion reports for a set of dispatched operations
 * (implementation).
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

#include "transfer/status_aggregator.h"

#include <algorithm>
#include <atomic>

#include "base/config.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "base/timer.h"
#include "transfer/errors.h"

namespace dxfer {
namespace transfer {

namespace {
std::atomic_int s_reports(0), s_failed_reports(0);
std::atomic_int s_strays(0), s_malformed(0);

void StatsWriter(std::ostream *o) {
  *o << "status aggregator:\n"
        "  reports: "
     << s_reports
     << "\n"
        "  failed reports: "
     << s_failed_reports
     << "\n"
        "  stray reports: "
     << s_strays
     << "\n"
        "  malformed reports: "
     << s_malformed << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);
}  // namespace

size_t AggregateResult::failed() const {
  return std::count_if(
      reports.begin(), reports.end(),
      [](const CompletionReport &r) { return !r.success; });
}

StatusAggregator::StatusAggregator(StatusChannel *status) : status_(status) {}

AggregateResult StatusAggregator::Await(std::set<std::string> outstanding,
                                        uint64_t expected_bytes) {
  const size_t expected = outstanding.size();
  std::vector<CompletionReport> reports;

  DXFER_LOG(LOG_INFO, "StatusAggregator::Await",
            "waiting for %zu reports on [%s].\n", expected,
            status_->name().c_str());

  while (!outstanding.empty()) {
    services::QueueMessage message;
    bool received = false;

    try {
      received = status_->Receive(&message);
    } catch (const ChannelUnavailable &e) {
      DXFER_LOG(LOG_WARNING, "StatusAggregator::Await", "%s. will retry.\n",
                e.what());
    }

    if (!received) {
      base::Timer::Sleep(base::Config::queue_poll_interval_in_s());
      continue;
    }

    try {
      status_->Acknowledge(message);
    } catch (const ChannelUnavailable &e) {
      // it'll show up again and be dropped as a stray
      DXFER_LOG(LOG_WARNING, "StatusAggregator::Await",
                "failed to remove status %s: %s\n", message.id.c_str(),
                e.what());
    }

    auto report = StatusChannel::Decode(message);

    if (!report) {
      ++malformed_;
      ++s_malformed;
      DXFER_LOG(LOG_WARNING, "StatusAggregator::Await",
                "dropping malformed status message %s.\n", message.id.c_str());
      continue;
    }

    if (outstanding.erase(report->id) == 0) {
      ++strays_;
      ++s_strays;
      DXFER_LOG(LOG_DEBUG, "StatusAggregator::Await",
                "dropping stray report for %s.\n", report->id.c_str());
      continue;
    }

    ++s_reports;

    if (!report->success) {
      ++s_failed_reports;
      DXFER_LOG(LOG_WARNING, "StatusAggregator::Await",
                "operation %s on %s failed: %s\n", report->id.c_str(),
                report->node_name.c_str(), report->detail.c_str());
    }

    reports.push_back(std::move(*report));

    DXFER_LOG(LOG_NOTICE, "StatusAggregator::Await",
              "%zu/%zu jobs have completed.\n", expected - outstanding.size(),
              expected);
  }

  return Summarize(std::move(reports), expected_bytes);
}

AggregateResult StatusAggregator::Summarize(
    std::vector<CompletionReport> reports, uint64_t expected_bytes) {
  AggregateResult result;

  result.reports = std::move(reports);
  result.bytes = expected_bytes;

  if (result.reports.empty()) return result;

  double first_start = result.reports.front().start_time;
  double last_end = result.reports.front().end_time();

  for (const auto &r : result.reports) {
    first_start = std::min(first_start, r.start_time);
    last_end = std::max(last_end, r.end_time());
  }

  result.total_elapsed = last_end - first_start;

  if (result.total_elapsed > 0.0)
    result.throughput =
        static_cast<double>(expected_bytes) * 8.0 / result.total_elapsed;

  return result;
}

}  // namespace transfer
}  // namespace dxfer
