/*
 * transfer/partitioner.cc
 * -------------------------------------------------------------------------
 * Splits a transfer into near-equal contiguous shares
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

#include "transfer/partitioner.h"

#include "transfer/errors.h"

namespace dxfer {
namespace transfer {

PartitionPlan Partitioner::Partition(uint64_t total_units, uint32_t workers) {
  if (workers == 0) throw InvalidPartition("no workers to partition across");

  const uint64_t base = total_units / workers;
  const uint64_t remainder = total_units % workers;

  PartitionPlan plan(workers);
  uint64_t start = 0;

  for (uint32_t i = 0; i < workers; i++) {
    plan[i].start = start;
    plan[i].count = base + ((i < remainder) ? 1 : 0);
    start += plan[i].count;
  }

  return plan;
}

PartitionPlan Partitioner::PartitionBytes(uint64_t total_bytes,
                                          uint64_t chunk_size,
                                          uint32_t workers) {
  if (chunk_size == 0) throw InvalidPartition("chunk size must be positive");

  PartitionPlan plan = Partition(total_bytes / chunk_size, workers);

  for (auto &share : plan) {
    share.start *= chunk_size;
    share.count *= chunk_size;
  }

  plan.back().count += total_bytes % chunk_size;

  return plan;
}

}  // namespace transfer
}  // namespace dxfer
