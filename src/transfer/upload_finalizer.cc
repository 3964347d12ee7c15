/*
 * transfer/upload_finalizer.cc
 * -------------------------------------------------------------------------
 * Waits for every unit of an upload to be staged, then commits it
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

#include "transfer/upload_finalizer.h"

#include <atomic>
#include <functional>

#include "base/config.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "base/timer.h"
#include "services/blob_store.h"
#include "threads/pool.h"
#include "transfer/block_id.h"
#include "transfer/errors.h"

namespace dxfer {
namespace transfer {

namespace {
std::atomic_int s_polls(0), s_listing_failures(0), s_commits(0);

void StatsWriter(std::ostream *o) {
  *o << "upload finalizer:\n"
        "  polls: "
     << s_polls
     << "\n"
        "  listing failures: "
     << s_listing_failures
     << "\n"
        "  commits: "
     << s_commits << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);
}  // namespace

UploadFinalizer::UploadFinalizer(services::BlobStore *store) : store_(store) {}

size_t UploadFinalizer::CountPresent(const std::set<std::string> &listing,
                                     const std::vector<std::string> &expected) {
  size_t present = 0;

  for (const auto &id : expected)
    if (listing.count(id)) present++;

  return present;
}

void UploadFinalizer::Finalize(const std::string &container,
                               const std::string &blob, uint32_t total_units) {
  const std::vector<std::string> expected = BlockId::Sequence(total_units);
  const int timeout = base::Config::finalize_timeout_in_s();
  const double deadline = base::Timer::GetCurrentTime() + timeout;
  size_t present = 0;

  polls_ = 0;

  while (true) {
    std::set<std::string> listing;

    polls_++;
    ++s_polls;

    int r = threads::Pool::Call(
        threads::PoolId::PR_REQ_0,
        std::bind(&services::BlobStore::ListPendingUnits, store_,
                  std::placeholders::_1, container, blob, &listing));

    if (r) {
      ++s_listing_failures;
      DXFER_LOG(LOG_WARNING, "UploadFinalizer::Finalize",
                "listing pending units of [%s] failed with %i.\n",
                blob.c_str(), r);
    } else {
      present = CountPresent(listing, expected);

      if (present == expected.size()) break;

      DXFER_LOG(LOG_NOTICE, "UploadFinalizer::Finalize",
                "%zu/%zu blocks of [%s] uploaded.\n", present, expected.size(),
                blob.c_str());
    }

    if (timeout > 0 && base::Timer::GetCurrentTime() >= deadline)
      throw FinalizeTimeout(blob, present, expected.size());

    base::Timer::Sleep(base::Config::finalize_poll_interval_in_s());
  }

  DXFER_LOG(LOG_INFO, "UploadFinalizer::Finalize",
            "all %zu blocks of [%s] present after %i polls. committing.\n",
            expected.size(), blob.c_str(), polls_);

  int r = threads::Pool::Call(
      threads::PoolId::PR_REQ_0,
      std::bind(&services::BlobStore::Commit, store_, std::placeholders::_1,
                container, blob, expected));

  if (r) throw CommitFailed(blob, r);

  ++s_commits;
}

}  // namespace transfer
}  // namespace dxfer
