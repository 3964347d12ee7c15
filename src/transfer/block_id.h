/*
 * transfer/block_id.h
 * -------------------------------------------------------------------------
 * Remote identifiers of upload units.
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

#ifndef DXFER_TRANSFER_BLOCK_ID_H
#define DXFER_TRANSFER_BLOCK_ID_H

#include <cstdint>
#include <string>
#include <vector>

namespace dxfer {
namespace transfer {
class BlockId {
 public:
  // Base64 of the index as four little-endian bytes. Every id has the same
  // length, as the block list requires.
  static std::string FromIndex(uint32_t index);

  // Ids of units [0, count), in ascending index order.
  static std::vector<std::string> Sequence(uint32_t count);
};
}  // namespace transfer
}  // namespace dxfer

#endif
