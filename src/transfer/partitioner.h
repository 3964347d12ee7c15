/*
 * transfer/partitioner.h
 * -------------------------------------------------------------------------
 * Splits a transfer into near-equal contiguous shares.
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

#ifndef DXFER_TRANSFER_PARTITIONER_H
#define DXFER_TRANSFER_PARTITIONER_H

#include <cstdint>
#include <vector>

namespace dxfer {
namespace transfer {
struct Share {
  uint64_t start = 0;
  uint64_t count = 0;
};

using PartitionPlan = std::vector<Share>;

class Partitioner {
 public:
  // Splits [0, total_units) into |workers| contiguous shares. The first
  // (total_units % workers) shares get one extra unit. Throws
  // InvalidPartition if |workers| is zero.
  static PartitionPlan Partition(uint64_t total_units, uint32_t workers);

  // Partitions the whole chunks of a byte range as above, in bytes; the last
  // share also takes the (total_bytes % chunk_size) trailing bytes. Throws
  // InvalidPartition if |workers| or |chunk_size| is zero.
  static PartitionPlan PartitionBytes(uint64_t total_bytes, uint64_t chunk_size,
                                      uint32_t workers);
};
}  // namespace transfer
}  // namespace dxfer

#endif
